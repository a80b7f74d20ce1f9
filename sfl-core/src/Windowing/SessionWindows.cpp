/*
    Licensed under the Apache License, Version 2.0 (the "License");
    you may not use this file except in compliance with the License.
    You may obtain a copy of the License at

        https://www.apache.org/licenses/LICENSE-2.0

    Unless required by applicable law or agreed to in writing, software
    distributed under the License is distributed on an "AS IS" BASIS,
    WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
    See the License for the specific language governing permissions and
    limitations under the License.
*/

#include <Configurations/SessionWindowConfiguration.hpp>
#include <Util/Logger/Logger.hpp>
#include <Windowing/SessionWindows.hpp>
#include <limits>
#include <sstream>

namespace SFL::Windowing {

namespace {
// timestamps close to the value range limits saturate instead of wrapping around
Timestamp saturatingSub(Timestamp left, Timestamp right) {
    Timestamp result;
    if (__builtin_sub_overflow(left, right, &result)) {
        return right > 0 ? std::numeric_limits<Timestamp>::min() : std::numeric_limits<Timestamp>::max();
    }
    return result;
}

Timestamp saturatingAdd(Timestamp left, Timestamp right) {
    Timestamp result;
    if (__builtin_add_overflow(left, right, &result)) {
        return right > 0 ? std::numeric_limits<Timestamp>::max() : std::numeric_limits<Timestamp>::min();
    }
    return result;
}
}// namespace

SessionWindows::SessionWindows(Timestamp inactivityGapMs, Timestamp gracePeriodMs)
    : inactivityGapMs(inactivityGapMs), gracePeriodMs(gracePeriodMs) {
    SFL_ASSERT(inactivityGapMs >= 0, "the inactivity gap must not be negative but was " << inactivityGapMs);
    SFL_ASSERT(gracePeriodMs >= 0, "the grace period must not be negative but was " << gracePeriodMs);
}

SessionWindows SessionWindows::with(Timestamp inactivityGapMs) { return {inactivityGapMs, 0}; }

SessionWindows SessionWindows::create(const Configurations::SessionWindowConfiguration& configuration) {
    return SessionWindows::with(static_cast<Timestamp>(configuration.inactivityGap.getValue()))
        .grace(static_cast<Timestamp>(configuration.gracePeriod.getValue()));
}

SessionWindows SessionWindows::grace(Timestamp gracePeriodMs) const { return {inactivityGapMs, gracePeriodMs}; }

Timestamp SessionWindows::closeTime(Timestamp streamTime) const {
    return saturatingSub(saturatingSub(streamTime, gracePeriodMs), inactivityGapMs);
}

Timestamp SessionWindows::earliestSessionEndTime(Timestamp timestamp) const { return saturatingSub(timestamp, inactivityGapMs); }

Timestamp SessionWindows::latestSessionStartTime(Timestamp timestamp) const { return saturatingAdd(timestamp, inactivityGapMs); }

std::string SessionWindows::toString() const {
    std::stringstream ss;
    ss << "SessionWindows(inactivityGap=" << inactivityGapMs << "ms, gracePeriod=" << gracePeriodMs << "ms)";
    return ss.str();
}

}// namespace SFL::Windowing
