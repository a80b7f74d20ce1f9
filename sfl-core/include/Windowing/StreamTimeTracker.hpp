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

#ifndef SFL_CORE_INCLUDE_WINDOWING_STREAMTIMETRACKER_HPP_
#define SFL_CORE_INCLUDE_WINDOWING_STREAMTIMETRACKER_HPP_

#include <Common/Identifiers.hpp>
#include <limits>

namespace SFL::Windowing {

/**
 * @brief Tracks the stream time of a partition, i.e., the maximal event time observed so far.
 * The stream time never decreases. Each partition owns its own tracker, so no synchronization is required.
 */
class StreamTimeTracker {
  public:
    // stream time before the first record, compares lower than every event time
    static constexpr Timestamp UNSET = std::numeric_limits<Timestamp>::min();

    /**
     * @brief Advances the stream time to the given timestamp if the timestamp is larger than the current stream time
     * @param timestamp event time of a record
     * @return the current stream time, i.e., max(previous stream time, timestamp)
     */
    Timestamp advance(Timestamp timestamp);

    [[nodiscard]] Timestamp currentStreamTime() const { return observedStreamTime; }

    /**
     * @return true if at least one timestamp was observed
     */
    [[nodiscard]] bool isSet() const { return observedStreamTime != UNSET; }

  private:
    Timestamp observedStreamTime = UNSET;
};

}// namespace SFL::Windowing

#endif// SFL_CORE_INCLUDE_WINDOWING_STREAMTIMETRACKER_HPP_
