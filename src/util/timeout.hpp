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

#ifndef FPRV_TIMEOUT_HPP
#define FPRV_TIMEOUT_HPP

#include <chrono>

typedef std::chrono::time_point<std::chrono::steady_clock> TimePoint;


/**
 * Methods to allow aborting early for some given timeout value.
 * Two deadlines are derived from the given value:
 *  - soft: rules that have not been started yet are reported as UNKNOWN(timeout)
 *  - hard: running solver queries are cut off, so that the report can still be printed in time
 *
 * Note that there is absolutely no guarantee that the program will stop in time,
 * but every solver query is bounded by the remaining time, so this should work in most cases.
 */
namespace Timeout {
    //calculates all relevant timeout points from this global timeout
    //call with 0 to disable timeouts
    void setTimeouts(unsigned int seconds);

    //return true if the timeout has already occurred
    bool hard();
    bool soft();
    bool enabled();

    std::chrono::milliseconds remainingSoft();
    std::chrono::milliseconds remainingHard();

    // the given solver timeout (in milliseconds), shortened to what is left until the hard timeout
    unsigned int clamp(unsigned int millis);
}

#endif // FPRV_TIMEOUT_HPP
