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

#ifndef SFL_CORE_INCLUDE_STATE_INMEMORYSESSIONSTORE_HPP_
#define SFL_CORE_INCLUDE_STATE_INMEMORYSESSIONSTORE_HPP_

#include <Exceptions/StoreException.hpp>
#include <State/SessionStore.hpp>
#include <State/SnapshotKeyValueIterator.hpp>
#include <Util/Logger/Logger.hpp>
#include <atomic>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace SFL::State {

/**
 * @brief A session store that keeps all sessions in memory.
 * Sessions of a key are ordered by their end and start timestamp.
 * Range queries return a snapshot of the matching sessions, thus the store can be modified while an iterator is open.
 * All operations are guarded by a mutex, so that the read path may query the store from another thread.
 * @tparam Key type of the record key, has to be ordered by std::less
 * @tparam Agg type of the session aggregate
 */
template<typename Key, typename Agg>
class InMemorySessionStore : public SessionStore<Key, Agg> {
    using SessionBounds = std::pair<Timestamp, Timestamp>;// (end, start)
    using SessionsOfKey = std::map<SessionBounds, Agg>;
    using SessionKeyValue = KeyValue<Windowing::Windowed<Key>, Agg>;

  public:
    explicit InMemorySessionStore(std::string storeName)
        : storeName(std::move(storeName)), openIterators(std::make_shared<std::atomic<uint64_t>>(0)) {}

    ~InMemorySessionStore() override { SFL_TRACE("~InMemorySessionStore(" << storeName << ")"); }

    [[nodiscard]] std::string name() const override { return storeName; }

    KeyValueIteratorPtr<Windowing::Windowed<Key>, Agg>
    findSessions(const Key& key, Timestamp earliestSessionEndTime, Timestamp latestSessionStartTime) override {
        const std::lock_guard<std::mutex> lock(storeMutex);
        checkOpen("findSessions");
        std::vector<SessionKeyValue> matches;
        auto sessionsOfKey = sessions.find(key);
        if (sessionsOfKey != sessions.end()) {
            // sessions are ordered by their end, so we can skip all sessions that end before the range
            auto sessionIter = sessionsOfKey->second.lower_bound({earliestSessionEndTime, std::numeric_limits<Timestamp>::min()});
            for (; sessionIter != sessionsOfKey->second.end(); ++sessionIter) {
                auto [end, start] = sessionIter->first;
                if (start <= latestSessionStartTime) {
                    matches.emplace_back(SessionKeyValue::pair({key, Windowing::SessionWindow(start, end)}, sessionIter->second));
                }
            }
        }
        SFL_TRACE("InMemorySessionStore: findSessions in [" << earliestSessionEndTime << "," << latestSessionStartTime
                                                            << "] returned " << matches.size() << " sessions");
        auto counter = openIterators;
        auto iterator = makeKeyValueIterator<SnapshotKeyValueIterator<Windowing::Windowed<Key>, Agg>>(std::move(matches), [counter]() {
            counter->fetch_sub(1);
        });
        openIterators->fetch_add(1);
        return iterator;
    }

    void put(const Windowing::Windowed<Key>& sessionKey, const Agg& aggregate) override {
        const std::lock_guard<std::mutex> lock(storeMutex);
        checkOpen("put");
        sessions[sessionKey.key()].insert_or_assign(toBounds(sessionKey.window()), aggregate);
    }

    void remove(const Windowing::Windowed<Key>& sessionKey) override {
        const std::lock_guard<std::mutex> lock(storeMutex);
        checkOpen("remove");
        auto sessionsOfKey = sessions.find(sessionKey.key());
        if (sessionsOfKey == sessions.end()) {
            return;
        }
        sessionsOfKey->second.erase(toBounds(sessionKey.window()));
        if (sessionsOfKey->second.empty()) {
            sessions.erase(sessionsOfKey);
        }
    }

    std::optional<Agg> fetchSession(const Key& key, Timestamp startTime, Timestamp endTime) override {
        const std::lock_guard<std::mutex> lock(storeMutex);
        checkOpen("fetchSession");
        auto sessionsOfKey = sessions.find(key);
        if (sessionsOfKey == sessions.end()) {
            return std::nullopt;
        }
        auto session = sessionsOfKey->second.find({endTime, startTime});
        if (session == sessionsOfKey->second.end()) {
            return std::nullopt;
        }
        return session->second;
    }

    /**
     * @brief Closes the store. Every further operation fails with a StoreUnavailableException.
     */
    void close() {
        const std::lock_guard<std::mutex> lock(storeMutex);
        isOpen = false;
    }

    /**
     * @return all sessions of the store ordered by key, session end and session start
     */
    std::vector<SessionKeyValue> all() const {
        const std::lock_guard<std::mutex> lock(storeMutex);
        std::vector<SessionKeyValue> result;
        for (const auto& [key, sessionsOfKey] : sessions) {
            for (const auto& [bounds, aggregate] : sessionsOfKey) {
                result.emplace_back(SessionKeyValue::pair({key, Windowing::SessionWindow(bounds.second, bounds.first)}, aggregate));
            }
        }
        return result;
    }

    /**
     * @return the number of sessions in the store
     */
    uint64_t size() const {
        const std::lock_guard<std::mutex> lock(storeMutex);
        uint64_t numberOfSessions = 0;
        for (const auto& entry : sessions) {
            numberOfSessions += entry.second.size();
        }
        return numberOfSessions;
    }

    /**
     * @return the number of iterators that were handed out by findSessions and are not closed yet
     */
    uint64_t numberOfOpenIterators() const { return openIterators->load(); }

  private:
    static SessionBounds toBounds(const Windowing::SessionWindow& window) { return {window.end(), window.start()}; }

    void checkOpen(const std::string& operation) const {
        if (!isOpen) {
            throw Exceptions::StoreUnavailableException(storeName, operation + " on a closed store");
        }
    }

    std::string storeName;
    mutable std::mutex storeMutex;
    std::map<Key, SessionsOfKey> sessions;
    std::shared_ptr<std::atomic<uint64_t>> openIterators;
    bool isOpen = true;
};

}// namespace SFL::State

#endif// SFL_CORE_INCLUDE_STATE_INMEMORYSESSIONSTORE_HPP_
