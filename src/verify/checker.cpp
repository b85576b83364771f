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

#include "checker.hpp"
#include "interpreter.hpp"
#include "../config.hpp"
#include "../debug.hpp"
#include "../smt/z3/z3.hpp"
#include "../util/timeout.hpp"

#include <sstream>

using namespace std;


static std::string reasonOf(const Z3 &solver) {
    std::string reason = solver.reasonUnknown();
    if (Timeout::hard() || reason.find("timeout") != std::string::npos || reason.find("canceled") != std::string::npos) {
        return "timeout";
    }
    return reason;
}

static std::string typeSuffix(FloatType::Type type, bool converse) {
    return " (" + FloatType::name(type) + (converse ? ", converse" : "") + ")";
}


Checker::Checker(const Rule &rule, Proof &proof): rule(rule), proof(proof) {}

VerificationResult Checker::verify(const Rule &rule) {
    Proof proof;
    return verify(rule, proof);
}

VerificationResult Checker::verify(const Rule &rule, Proof &proof) {
    Checker checker(rule, proof);
    VerificationResult res = checker.run();
    debugChecker(rule.getName() << ": " << res);
    return res;
}

std::vector<FloatType::Type> Checker::types() const {
    option<FloatType::Type> pinned = rule.pinnedType();
    if (pinned) {
        return {pinned.get()};
    }
    return Config::Verify::Types;
}

VerificationResult Checker::run() {
    proof.headline("Checking " + rule.getName());
    try {
        rule.validate();

        bool vacuous = false;
        VerificationResult res = check(rule, false, vacuous);
        if (res.isProved() && rule.isBidirectional()) {
            bool vacuousConverse = false;
            VerificationResult converse = check(rule.reversed(), true, vacuousConverse);
            if (!converse.isProved()) {
                return converse;
            }
        }

        if (res.isProved() && vacuous) {
            res.addWarning("the precondition of " + rule.getName() + " is unsatisfiable, the rule never applies");
        } else if (res.isProved() && Config::Verify::FlagMinimality) {
            checkFlags(res);
        }
        return res;

    } catch (const MalformedRule &e) {
        proof.warning(std::string("malformed: ") + e.what());
        return VerificationResult::malformed(e.what());
    } catch (const UnboundName &e) {
        proof.warning(e.what());
        return VerificationResult::unknown(e.what());
    } catch (const z3::exception &e) {
        debugProblem("z3 failed on " << rule.getName() << ": " << e.msg());
        return VerificationResult::unknown(std::string("z3 error: ") + e.msg());
    } catch (const std::exception &e) {
        debugProblem("checking " << rule.getName() << " failed: " << e.what());
        proof.warning(std::string("internal error: ") + e.what());
        return VerificationResult::unknown(std::string("internal error: ") + e.what());
    }
}

VerificationResult Checker::check(const Rule &rule, bool converse, bool &vacuous) {
    vacuous = true;
    for (FloatType::Type type: types()) {
        if (Timeout::hard()) {
            return VerificationResult::unknown("timeout");
        }
        bool vacuousForType = false;
        VerificationResult res = check(rule, type, converse, vacuousForType);
        if (!res.isProved()) {
            return res;
        }
        vacuous = vacuous && vacuousForType;
    }
    return VerificationResult::proved();
}

VerificationResult Checker::check(const Rule &rule, FloatType::Type type, bool converse, bool &vacuous) {
    z3::context z3Ctx;
    Z3Context ctx(z3Ctx);
    Translator tr(ctx, rule, type);
    proof.section("Refinement" + typeSuffix(type, converse));

    Z3 pre(z3Ctx, Config::Smt::RuleTimeout);
    pre.add(tr.precondition());
    for (const z3::expr &c: tr.constraints()) {
        pre.add(c);
    }
    Smt::Result applicable = pre.check();
    if (applicable == Smt::Unsat) {
        proof.append("precondition is unsatisfiable");
        vacuous = true;
        return VerificationResult::proved();
    } else if (applicable == Smt::Unknown) {
        return VerificationResult::unknown(reasonOf(pre));
    }

    Z3 solver(z3Ctx, Config::Smt::RuleTimeout);
    solver.enableModels();

    // counterexamples without undef and poison inputs are easier to read and to find
    if (tr.hasMarkers()) {
        solver.push();
        solver.add(tr.refinementQuery(true));
        solver.add(tr.definedInputs());
        if (solver.check() == Smt::Sat) {
            return VerificationResult::disproved(counterexample(ctx, tr, solver.model(), converse));
        }
        solver.pop();
    }

    solver.add(tr.refinementQuery(false));
    switch (solver.check()) {
    case Smt::Sat:
        return VerificationResult::disproved(counterexample(ctx, tr, solver.model(), converse));
    case Smt::Unknown:
        proof.warning("z3 returned unknown" + typeSuffix(type, converse));
        return VerificationResult::unknown(reasonOf(solver));
    case Smt::Unsat:
        break;
    }
    proof.append("no counterexample");
    return VerificationResult::proved();
}

Counterexample Checker::counterexample(Z3Context &ctx, const Translator &tr, const z3::model &model, bool converse) const {
    const Rule &checked = converse ? rule.reversed() : rule;
    Counterexample cex(tr.getType());
    cex.converse = converse;
    Interpreter interpreter(tr.getType());

    auto holds = [&](const z3::expr &e) {
        return model.eval(e, true).is_true();
    };

    for (const Translator::Input &in: tr.getInputs()) {
        SymbolicFloat value = SymbolicFloat::poison();
        if (!in.poison || !holds(in.poison.get())) {
            if (in.undef && holds(in.undef.get())) {
                value = SymbolicFloat::undefined();
            } else {
                value = ctx.toSymbolicFloat(model.eval(in.value, true).simplify());
            }
        }
        cex.values.emplace_back(in.operand.getName(), value);
        interpreter.assign(in.operand.getName(), value);
    }
    for (const Translator::MatchedFlag &m: tr.getMatchedFlags()) {
        bool set = holds(m.value);
        cex.flags.emplace_back(FlagSet::name(m.flag) + "(" + m.binding + ")", set);
        if (set) {
            interpreter.addFlag(m.binding, m.flag);
        }
    }
    for (const auto &p: tr.getAnalyses()) {
        cex.analyses.emplace_back("CannotBeNegativeZero(" + p.first.getName() + ")", holds(p.second));
    }

    try {
        bool boolean = checked.isBoolean(checked.getLhs(), checked.lhsRoot().getResult());
        cex.source = interpreter.run(checked.getLhs(), true, boolean);
        cex.target = interpreter.run(checked.getRhs(), false, boolean);
        if (refines(cex.source.get(), cex.target.get())) {
            debugWarn("the counterexample for " << rule.getName() << " does not reproduce concretely");
        }
    } catch (const SolverUnknown &e) {
        debugWarn("cannot recompute the counterexample for " << rule.getName() << ": " << e.what());
    }

    std::stringstream s;
    s << cex;
    proof.result("counterexample" + typeSuffix(tr.getType(), converse));
    proof.append(s.str());
    return cex;
}

void Checker::checkFlags(VerificationResult &res) {
    const std::vector<Instruction> &lhs = rule.getLhs();
    for (size_t i = 0; i < lhs.size(); ++i) {
        for (FlagSet::Flag f: lhs[i].getFlags().effective()) {
            Rule weaker = rule.withoutFlag(i, f);
            Proof ignored;
            Checker sub(weaker, ignored);
            bool vacuous = false;
            try {
                VerificationResult weakerRes = sub.check(weaker, false, vacuous);
                if (weakerRes.isProved() && weaker.isBidirectional()) {
                    weakerRes = sub.check(weaker.reversed(), true, vacuous);
                }
                if (weakerRes.isProved()) {
                    std::string warning = "flag " + FlagSet::name(f) + " of " + lhs[i].getResult() + " is not needed";
                    proof.warning(warning);
                    res.addWarning(warning);
                }
            } catch (const z3::exception &e) {
                debugWarn("flag check of " << rule.getName() << " failed: " << e.msg());
            } catch (const std::exception &e) {
                debugWarn("flag check of " << rule.getName() << " failed: " << e.what());
            }
        }
    }
}
