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

#include "timeout.hpp"

#include <algorithm>
#include <atomic>
#include <stdexcept>

using namespace std;

static std::atomic<bool> timeout_enable(false);
static TimePoint timeout_start;
static TimePoint timeout_soft;
static TimePoint timeout_hard;

void Timeout::setTimeouts(unsigned int seconds) {
    if (seconds > 0 && seconds < 2) {
        throw std::invalid_argument("timeout must be at least 2 seconds");
    }
    timeout_start = chrono::steady_clock::now();

    if (seconds > 0) {
        unsigned long slack = max(1u, min(30u, seconds * 10 / 100));
        timeout_soft = timeout_start + static_cast<std::chrono::seconds>(seconds - slack);
        timeout_hard = timeout_start + static_cast<std::chrono::seconds>(seconds - 1);
        timeout_enable = true;
    } else {
        timeout_enable = false;
    }
}

bool Timeout::hard() {
    if (!timeout_enable) return false;
    return remainingHard().count() <= 0;
}

bool Timeout::soft() {
    if (!timeout_enable) return false;
    return remainingSoft().count() <= 0;
}

bool Timeout::enabled() {
    return timeout_enable;
}

std::chrono::milliseconds Timeout::remainingSoft() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(timeout_soft - chrono::steady_clock::now());
}

std::chrono::milliseconds Timeout::remainingHard() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(timeout_hard - chrono::steady_clock::now());
}

unsigned int Timeout::clamp(unsigned int millis) {
    if (!timeout_enable) {
        return millis;
    }
    long remaining = remainingHard().count();
    if (remaining <= 0) {
        // z3 treats 0 as "no timeout"
        return 1;
    }
    return static_cast<unsigned int>(min(static_cast<long>(millis), remaining));
}
