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

#ifndef SFL_CORE_INCLUDE_STATE_SESSIONSTORE_HPP_
#define SFL_CORE_INCLUDE_STATE_SESSIONSTORE_HPP_

#include <Common/Identifiers.hpp>
#include <State/KeyValueIterator.hpp>
#include <Windowing/Windowed.hpp>
#include <memory>
#include <optional>
#include <string>

namespace SFL::State {

/**
 * @brief Interface of a store that holds aggregated sessions per key.
 * Sessions are addressed by their windowed key, i.e., the record key and the session window.
 * Implementations may fail with a StoreUnavailableException or a StoreOperationFailedException.
 * @tparam Key type of the record key
 * @tparam Agg type of the session aggregate
 */
template<typename Key, typename Agg>
class SessionStore {
  public:
    virtual ~SessionStore() = default;

    /**
     * @return the name of this store
     */
    [[nodiscard]] virtual std::string name() const = 0;

    /**
     * @brief Finds all sessions of key that overlap the range [earliestSessionEndTime, latestSessionStartTime],
     * i.e., session.end >= earliestSessionEndTime and session.start <= latestSessionStartTime.
     * The order of the sessions is defined by the store, each session is returned exactly once.
     * @param key the record key
     * @param earliestSessionEndTime the earliest end of a matching session
     * @param latestSessionStartTime the latest start of a matching session
     * @return iterator over the matching sessions, which is closed when the handle is released
     */
    virtual KeyValueIteratorPtr<Windowing::Windowed<Key>, Agg>
    findSessions(const Key& key, Timestamp earliestSessionEndTime, Timestamp latestSessionStartTime) = 0;

    /**
     * @brief Writes the aggregate of a session and replaces any existing aggregate of exactly this session.
     * @param sessionKey the windowed key
     * @param aggregate the aggregate
     */
    virtual void put(const Windowing::Windowed<Key>& sessionKey, const Agg& aggregate) = 0;

    /**
     * @brief Removes a session. Removing an unknown session has no effect.
     * @param sessionKey the windowed key
     */
    virtual void remove(const Windowing::Windowed<Key>& sessionKey) = 0;

    /**
     * @brief Point lookup of a session with exactly the given bounds
     * @param key the record key
     * @param startTime the session start
     * @param endTime the session end
     * @return the aggregate or std::nullopt if the session does not exist
     */
    virtual std::optional<Agg> fetchSession(const Key& key, Timestamp startTime, Timestamp endTime) = 0;
};

template<typename Key, typename Agg>
using SessionStorePtr = std::shared_ptr<SessionStore<Key, Agg>>;

}// namespace SFL::State

#endif// SFL_CORE_INCLUDE_STATE_SESSIONSTORE_HPP_
