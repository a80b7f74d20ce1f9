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

#ifndef SFL_CORE_INCLUDE_WINDOWING_SESSIONWINDOW_HPP_
#define SFL_CORE_INCLUDE_WINDOWING_SESSIONWINDOW_HPP_

#include <Common/Identifiers.hpp>
#include <ostream>
#include <string>

namespace SFL::Windowing {

/**
 * @brief A session window covers the time between the first and the last record of a session.
 * Both bounds are inclusive and a window that contains a single record has start == end.
 */
class SessionWindow {
  public:
    /**
     * @brief Creates a new session window
     * @param start timestamp of the first record of the session
     * @param end timestamp of the last record of the session
     * @throws InvalidSessionWindowException if end < start
     */
    SessionWindow(Timestamp start, Timestamp end);

    [[nodiscard]] Timestamp start() const { return startTs; }

    [[nodiscard]] Timestamp end() const { return endTs; }

    /**
     * @brief Checks if both windows share at least one timestamp
     * @param other window
     * @return true if the windows overlap
     */
    [[nodiscard]] bool overlaps(const SessionWindow& other) const;

    /**
     * @brief Creates the smallest window that covers this and the other window
     * @param other window
     * @return merged window
     */
    [[nodiscard]] SessionWindow merge(const SessionWindow& other) const;

    bool operator==(const SessionWindow& other) const = default;

    [[nodiscard]] std::string toString() const;

  private:
    Timestamp startTs;
    Timestamp endTs;
};

std::ostream& operator<<(std::ostream& os, const SessionWindow& window);

}// namespace SFL::Windowing

#endif// SFL_CORE_INCLUDE_WINDOWING_SESSIONWINDOW_HPP_
