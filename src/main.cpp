/*  This file is part of FPRV.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation, either version 3 of the License, or
 *  (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with this program. If not, see <http://www.gnu.org/licenses>.
 */

#include "config.hpp"
#include "parser/rulefile.hpp"
#include "rule/corpus.hpp"
#include "util/proof.hpp"
#include "util/timeout.hpp"
#include "value/floattype.hpp"
#include "verify/report.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <boost/algorithm/string.hpp>

using namespace std;

// Variables for command line flags
string filename;
int timeout = 0; // no timeout
int proofLevel = static_cast<int>(Proof::defaultProofLevel);
int smtTimeout = static_cast<int>(Config::Smt::RuleTimeout);
vector<string> ruleNames;
vector<FloatType::Type> types;
bool printConfig = false;

void printHelp(char *arg0) {
    cout << "Usage: " << arg0 << " [options] <file>" << endl;
    cout << "Options:" << endl;
    cout << "  --timeout <sec>             Global timeout (in seconds), rules not checked in time are UNKNOWN" << endl;
    cout << "  --smt-timeout <ms>          Timeout for each solver query (default " << smtTimeout << ")" << endl;
    cout << "  --proof-level <n>           Detail level for proof output (0-" << Proof::maxProofLevel << ", default " << proofLevel << ")" << endl;
    cout << "  --jobs <n>                  Number of rules checked concurrently (default " << Config::Verify::Jobs << ")" << endl;
    cout << endl;
    cout << "  --plain                     Disable colored output" << endl;
    cout << "  --print-config              Print the configuration before checking" << endl;
    cout << endl;
    cout << "  --rule <name>               Only check the named rule (may be repeated)" << endl;
    cout << "  --type <half|float|double>  Only check the given type (may be repeated)" << endl;
    cout << "  --check-disabled            Check disabled rules as well" << endl;
    cout << "  --no-undef-inputs           Inputs are never undef" << endl;
    cout << "  --no-poison-inputs          Inputs are never poison" << endl;
    cout << "  --no-flag-minimality        Do not report flags that are not needed" << endl;
    cout << "  --fast-math <encoding>      Meaning of violated flags: poison (default), undef, old-nsz or broken-nsz" << endl;
}


void parseFlags(int argc, char *argv[]) {
    int arg=0;

    auto getNext = [&]() {
        if (arg < argc-1) {
            return argv[++arg];
        } else {
            cerr << "Error: Argument missing for " << argv[arg] << endl;
            exit(2);
        }
    };

    while (++arg < argc) {
        if (strcmp("--help",argv[arg]) == 0) {
            printHelp(argv[0]);
            exit(0);
        } else if (strcmp("--timeout",argv[arg]) == 0) {
            timeout = atoi(getNext());
        } else if (strcmp("--smt-timeout",argv[arg]) == 0) {
            smtTimeout = atoi(getNext());
        } else if (strcmp("--proof-level",argv[arg]) == 0) {
            proofLevel = atoi(getNext());
        } else if (strcmp("--jobs",argv[arg]) == 0) {
            int jobs = atoi(getNext());
            if (jobs < 1) {
                cerr << "Error: at least one job is needed" << endl;
                exit(2);
            }
            Config::Verify::Jobs = static_cast<unsigned int>(jobs);
        } else if (strcmp("--plain",argv[arg]) == 0) {
            Config::Output::Colors = false;
        } else if (strcmp("--print-config",argv[arg]) == 0) {
            printConfig = true;
        } else if (strcmp("--rule",argv[arg]) == 0) {
            ruleNames.push_back(getNext());
        } else if (strcmp("--type",argv[arg]) == 0) {
            std::string str = getNext();
            boost::algorithm::to_lower(str);
            option<FloatType::Type> type = FloatType::parse(str);
            if (!type) {
                cerr << "Error: unknown type " << str << endl;
                exit(2);
            }
            types.push_back(type.get());
        } else if (strcmp("--check-disabled",argv[arg]) == 0) {
            Config::Verify::CheckDisabled = true;
        } else if (strcmp("--no-undef-inputs",argv[arg]) == 0) {
            Config::Verify::UndefInputs = false;
        } else if (strcmp("--no-poison-inputs",argv[arg]) == 0) {
            Config::Verify::PoisonInputs = false;
        } else if (strcmp("--no-flag-minimality",argv[arg]) == 0) {
            Config::Verify::FlagMinimality = false;
        } else if (strcmp("--fast-math",argv[arg]) == 0) {
            std::string str = getNext();
            boost::algorithm::to_lower(str);
            option<Config::FastMath::Encoding> encoding = Config::FastMath::parse(str);
            if (!encoding) {
                cerr << "Error: unknown fast-math encoding " << str << endl;
                exit(2);
            }
            Config::FastMath::Semantics = encoding.get();
        } else {
            if (!filename.empty()) {
                cerr << "Error: additional argument " << argv[arg] << " (already got filename: " << filename << ")" << endl;
                exit(2);
            }
            filename = argv[arg];
        }
    }
}

int main(int argc, char *argv[]) {
    if (argc < 2) {
        printHelp(argv[0]);
        return 2;
    }

    // Parse and interpret command line flags
    parseFlags(argc, argv);

    if (!types.empty()) {
        Config::Verify::Types = types;
    }
    if (smtTimeout <= 0) {
        cerr << "Error: the solver timeout must be positive" << endl;
        return 2;
    }
    Config::Smt::RuleTimeout = static_cast<unsigned int>(smtTimeout);

    // Timeout
    if (timeout < 0 || (timeout > 0 && timeout < 2)) {
        cerr << "Error: timeout must be at least 2 seconds" << endl;
        return 2;
    }
    Timeout::setTimeouts(static_cast<unsigned int>(timeout));

    if (proofLevel < 0 || proofLevel > static_cast<int>(Proof::maxProofLevel)) {
        cerr << "Error: proof level must be between 0 and " << Proof::maxProofLevel << endl;
        return 2;
    }
    Proof::setProofLevel(static_cast<unsigned int>(proofLevel));

    if (printConfig) {
        Config::printConfig(cout);
    }

    // Start parsing
    if (filename.empty()) {
        cerr << "Error: missing filename" << endl;
        return 2;
    }

    Corpus corpus;
    try {
        corpus = rulefile::RuleFileParser::loadFromFile(filename);
    } catch (const rulefile::RuleFileError &err) {
        cerr << "Error loading file " << filename << ": " << err.what() << endl;
        return 2;
    }

    if (Config::Verify::CheckDisabled) {
        corpus = corpus.enableAll();
    }
    if (!ruleNames.empty()) {
        for (const string &name: ruleNames) {
            if (!corpus.find(name)) {
                cerr << "Error: no rule named " << name << endl;
                return 2;
            }
        }
        corpus = corpus.restrict(ruleNames);
    }

    Report report = Report::run(corpus, Config::Verify::Jobs);
    if (Proof::getProofLevel() > 0) {
        Proof proof;
        report.print(proof);
        proof.print(cout);
    } else {
        cout << report << endl;
    }

    return report.success() ? 0 : 1;
}
