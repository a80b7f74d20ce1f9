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

#ifndef SFL_CORE_INCLUDE_WINDOWING_SESSIONCHANGELISTENER_HPP_
#define SFL_CORE_INCLUDE_WINDOWING_SESSIONCHANGELISTENER_HPP_

#include <Common/Identifiers.hpp>
#include <Util/Logger/LogValue.hpp>
#include <Windowing/Windowed.hpp>
#include <memory>
#include <optional>
#include <ostream>

namespace SFL::Windowing {

/**
 * @brief A change of a session aggregate. A missing new value marks the deletion of the session.
 */
template<typename Agg>
struct Change {
    std::optional<Agg> newValue;
    std::optional<Agg> oldValue;

    bool operator==(const Change<Agg>& other) const = default;
};

template<typename Agg>
std::ostream& operator<<(std::ostream& os, const Change<Agg>& change) {
    return os << "new=" << Util::toLogString(change.newValue) << " old=" << Util::toLogString(change.oldValue);
}

/**
 * @brief Downstream consumer of session changes, e.g., the next operator or the changelog of a materialized table.
 */
template<typename Key, typename Agg>
class SessionChangeListener {
  public:
    virtual ~SessionChangeListener() = default;

    /**
     * @brief Is called for every forwarded change of a session
     * @param sessionKey the session
     * @param change the new and the old aggregate
     * @param timestamp the timestamp of the change
     */
    virtual void onChange(const Windowed<Key>& sessionKey, const Change<Agg>& change, Timestamp timestamp) = 0;
};

template<typename Key, typename Agg>
using SessionChangeListenerPtr = std::shared_ptr<SessionChangeListener<Key, Agg>>;

}// namespace SFL::Windowing

#endif// SFL_CORE_INCLUDE_WINDOWING_SESSIONCHANGELISTENER_HPP_
