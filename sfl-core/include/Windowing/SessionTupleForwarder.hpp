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

#ifndef SFL_CORE_INCLUDE_WINDOWING_SESSIONTUPLEFORWARDER_HPP_
#define SFL_CORE_INCLUDE_WINDOWING_SESSIONTUPLEFORWARDER_HPP_

#include <Util/Logger/Logger.hpp>
#include <Windowing/SessionChangeListener.hpp>
#include <optional>
#include <utility>

namespace SFL::Windowing {

/**
 * @brief Forwards inserted and deleted sessions to the downstream listener.
 * Old values are only forwarded if old-value propagation is enabled.
 * A change without a new and without an old value carries no information and is not forwarded.
 * The change is emitted with the end of the session window as its timestamp.
 */
template<typename Key, typename Agg>
class SessionTupleForwarder {
  public:
    SessionTupleForwarder(SessionChangeListenerPtr<Key, Agg> listener, bool sendOldValues)
        : listener(std::move(listener)), sendOldValues(sendOldValues) {
        SFL_ASSERT(this->listener, "SessionTupleForwarder requires a change listener");
    }

    /**
     * @brief Forwards the change of a session if it is not empty
     * @param sessionKey the session
     * @param newValue the new aggregate or std::nullopt if the session was deleted
     * @param oldValue the previous aggregate or std::nullopt
     */
    void maybeForward(const Windowed<Key>& sessionKey, const std::optional<Agg>& newValue, const std::optional<Agg>& oldValue) {
        auto change = Change<Agg>{newValue, sendOldValues ? oldValue : std::nullopt};
        if (!change.newValue.has_value() && !change.oldValue.has_value()) {
            SFL_TRACE("SessionTupleForwarder: suppress empty change of " << sessionKey);
            return;
        }
        SFL_TRACE("SessionTupleForwarder: forward " << sessionKey << " " << change);
        listener->onChange(sessionKey, change, sessionKey.window().end());
    }

    [[nodiscard]] bool isSendingOldValues() const { return sendOldValues; }

  private:
    SessionChangeListenerPtr<Key, Agg> listener;
    const bool sendOldValues;
};

}// namespace SFL::Windowing

#endif// SFL_CORE_INCLUDE_WINDOWING_SESSIONTUPLEFORWARDER_HPP_
