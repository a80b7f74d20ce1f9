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

#ifndef SFL_CORE_INCLUDE_WINDOWING_PROCESSOUTCOME_HPP_
#define SFL_CORE_INCLUDE_WINDOWING_PROCESSOUTCOME_HPP_

#include <Util/Logger/Logger.hpp>
#include <Windowing/Windowed.hpp>
#include <magic_enum.hpp>
#include <sstream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace SFL::Windowing {

enum class DropReason : uint8_t { NULL_KEY, WINDOW_EXPIRED };

/**
 * @brief Result of processing a single record: the record was either dropped or applied to the session store.
 */
template<typename Key, typename Agg>
class ProcessOutcome {
  public:
    struct Dropped {
        DropReason reason;
    };

    struct Applied {
        Windowed<Key> sessionKey;
        Agg aggregate;
        std::vector<Windowed<Key>> replacedSessions;
    };

    static ProcessOutcome dropped(DropReason reason) { return ProcessOutcome(Dropped{reason}); }

    static ProcessOutcome applied(Windowed<Key> sessionKey, Agg aggregate, std::vector<Windowed<Key>> replacedSessions) {
        return ProcessOutcome(Applied{std::move(sessionKey), std::move(aggregate), std::move(replacedSessions)});
    }

    [[nodiscard]] bool isDropped() const { return std::holds_alternative<Dropped>(outcome); }

    [[nodiscard]] bool isApplied() const { return std::holds_alternative<Applied>(outcome); }

    [[nodiscard]] DropReason getDropReason() const {
        SFL_ASSERT(isDropped(), "ProcessOutcome: the record was not dropped");
        return std::get<Dropped>(outcome).reason;
    }

    /**
     * @return the session the record was merged into
     */
    [[nodiscard]] const Windowed<Key>& getSessionKey() const { return getApplied().sessionKey; }

    /**
     * @return the aggregate of the session after the record was added
     */
    [[nodiscard]] const Agg& getAggregate() const { return getApplied().aggregate; }

    /**
     * @return the sessions that were removed because they were merged into the new session
     */
    [[nodiscard]] const std::vector<Windowed<Key>>& getReplacedSessions() const { return getApplied().replacedSessions; }

    [[nodiscard]] std::string toString() const {
        if (isDropped()) {
            return "Dropped(" + std::string(magic_enum::enum_name(getDropReason())) + ")";
        }
        std::stringstream ss;
        ss << "Applied(" << getSessionKey() << ", replaced=" << getReplacedSessions().size() << ")";
        return ss.str();
    }

  private:
    explicit ProcessOutcome(std::variant<Dropped, Applied> outcome) : outcome(std::move(outcome)) {}

    const Applied& getApplied() const {
        SFL_ASSERT(isApplied(), "ProcessOutcome: the record was not applied");
        return std::get<Applied>(outcome);
    }

    std::variant<Dropped, Applied> outcome;
};

}// namespace SFL::Windowing

#endif// SFL_CORE_INCLUDE_WINDOWING_PROCESSOUTCOME_HPP_
