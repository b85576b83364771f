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

#ifndef FPRV_DEBUG_HPP
#define FPRV_DEBUG_HPP


/* ### Debugging related includes ### */

#include <iostream>
#include <ostream>
#include <mutex>


/* ### Global debugging output flag ### */

#define DEBUG_DISABLE_ALL


/* ### Colored debugging output */

#define COLORS_DEBUG

#ifdef COLORS_DEBUG
    #include "config.hpp"
    #define COLOR_WARN (Config::Color::DebugWarning)
    #define COLOR_PROBLEM (Config::Color::DebugProblem)
    #define COLOR_DEBUG (Config::Color::Debug)
    #define COLOR_HIGHLIGHT (Config::Color::DebugHighlight)
    #define COLOR_NONE (Config::Color::None)
#else
    #define COLOR_WARN ""
    #define COLOR_PROBLEM ""
    #define COLOR_DEBUG ""
    #define COLOR_HIGHLIGHT ""
    #define COLOR_NONE ""
#endif


/* ### Individual debugging flags ### */

#ifndef DEBUG_DISABLE_ALL

//print problematic results that (might) have a strong impact on the result
#define DEBUG_PROBLEMS

//print warnings which might indicate bugs
#define DEBUG_WARN

//debugging for the z3 interface
#define DEBUG_SMT

//debugging for the rule file and precondition parsers
#define DEBUG_PARSER

//debugging for the instruction semantics and the checker
#define DEBUG_SEMANTICS
#define DEBUG_CHECKER

#endif


/* ### Debugging macros ### */

// rules are checked by several workers, keep their lines apart
namespace Debug {
    std::mutex& outputMutex();
}

#define debugLine(prefix, color, output) do { \
    std::lock_guard<std::mutex> debugLock(Debug::outputMutex()); \
    std::cout << color << prefix << output << COLOR_NONE << std::endl; \
} while(0)

//useful for short fixes/debugging tests:
#define debugTest(output) debugLine("[test] ", COLOR_HIGHLIGHT, output)

#ifdef DEBUG_SMT
#define debugSmt(output) debugLine("[z3] ", COLOR_DEBUG, output)
#else
#define debugSmt(output) (void(0))
#endif

#ifdef DEBUG_PARSER
#define debugParser(output) debugLine("[parser] ", COLOR_DEBUG, output)
#else
#define debugParser(output) (void(0))
#endif

#ifdef DEBUG_SEMANTICS
#define debugSemantics(output) debugLine("[semantics] ", COLOR_DEBUG, output)
#else
#define debugSemantics(output) (void(0))
#endif

#ifdef DEBUG_CHECKER
#define debugChecker(output) debugLine("[checker] ", COLOR_DEBUG, output)
#else
#define debugChecker(output) (void(0))
#endif

#ifdef DEBUG_WARN
#define debugWarn(output) debugLine("[WARNING] ", COLOR_WARN, output)
#else
#define debugWarn(output) (void(0))
#endif

#ifdef DEBUG_PROBLEMS
#define debugProblem(output) debugLine("[PROBLEM] ", COLOR_PROBLEM, output)
#else
#define debugProblem(output) (void(0))
#endif

#endif // FPRV_DEBUG_HPP
