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

#ifndef SFL_CORE_INCLUDE_WINDOWING_SESSIONWINDOWS_HPP_
#define SFL_CORE_INCLUDE_WINDOWING_SESSIONWINDOWS_HPP_

#include <Common/Identifiers.hpp>
#include <string>

namespace SFL::Configurations {
class SessionWindowConfiguration;
}// namespace SFL::Configurations

namespace SFL::Windowing {

/**
 * @brief Definition of session windows: the inactivity gap that separates two sessions of the same key
 * and the grace period, in which out-of-order records are still admitted after a session was closed.
 * Both durations are in ms and constant for the lifetime of an aggregation.
 */
class SessionWindows {
  public:
    /**
     * @brief Creates session windows with the given inactivity gap and no grace period
     * @param inactivityGapMs
     * @return SessionWindows
     */
    static SessionWindows with(Timestamp inactivityGapMs);

    /**
     * @brief Creates session windows from the inactivity gap and grace period of the configuration
     * @param configuration
     * @return SessionWindows
     */
    static SessionWindows create(const Configurations::SessionWindowConfiguration& configuration);

    /**
     * @brief Returns a copy of these session windows with the given grace period
     * @param gracePeriodMs
     * @return SessionWindows
     */
    [[nodiscard]] SessionWindows grace(Timestamp gracePeriodMs) const;

    [[nodiscard]] Timestamp inactivityGap() const { return inactivityGapMs; }

    [[nodiscard]] Timestamp gracePeriod() const { return gracePeriodMs; }

    /**
     * @brief Computes the close time for the given stream time. Sessions that end before the close time are closed.
     * @param streamTime the maximal observed event time
     * @return streamTime - gracePeriod - inactivityGap
     */
    [[nodiscard]] Timestamp closeTime(Timestamp streamTime) const;

    /**
     * @return the earliest session end that a record at timestamp can be merged with
     */
    [[nodiscard]] Timestamp earliestSessionEndTime(Timestamp timestamp) const;

    /**
     * @return the latest session start that a record at timestamp can be merged with
     */
    [[nodiscard]] Timestamp latestSessionStartTime(Timestamp timestamp) const;

    [[nodiscard]] std::string toString() const;

  private:
    SessionWindows(Timestamp inactivityGapMs, Timestamp gracePeriodMs);

    Timestamp inactivityGapMs;
    Timestamp gracePeriodMs;
};

}// namespace SFL::Windowing

#endif// SFL_CORE_INCLUDE_WINDOWING_SESSIONWINDOWS_HPP_
