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

#ifndef SFL_CORE_INCLUDE_WINDOWING_SESSIONWINDOWVALUEGETTER_HPP_
#define SFL_CORE_INCLUDE_WINDOWING_SESSIONWINDOWVALUEGETTER_HPP_

#include <State/SessionStore.hpp>
#include <Util/Logger/Logger.hpp>
#include <Windowing/Windowed.hpp>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace SFL::Windowing {

/**
 * @brief An aggregate together with the timestamp it is valid for.
 */
template<typename Agg>
struct ValueAndTimestamp {
    Agg value;
    Timestamp timestamp;

    bool operator==(const ValueAndTimestamp<Agg>& other) const = default;
};

/**
 * @brief Read-only point view on the session store of an aggregation.
 * Downstream operators use it to look up the current aggregate of a session.
 */
template<typename Key, typename Agg>
class SessionWindowValueGetter {
  public:
    explicit SessionWindowValueGetter(State::SessionStorePtr<Key, Agg> store) : store(std::move(store)) {}

    /**
     * @brief Looks up the aggregate of exactly the given session
     * @param sessionKey the session
     * @return the aggregate with the session end as timestamp or std::nullopt if the session is not stored
     */
    std::optional<ValueAndTimestamp<Agg>> get(const Windowed<Key>& sessionKey) const {
        auto aggregate = store->fetchSession(sessionKey.key(), sessionKey.window().start(), sessionKey.window().end());
        if (!aggregate.has_value()) {
            return std::nullopt;
        }
        return ValueAndTimestamp<Agg>{std::move(aggregate.value()), sessionKey.window().end()};
    }

  private:
    State::SessionStorePtr<Key, Agg> store;
};

/**
 * @brief Creates value getters on the session store of an aggregation.
 */
template<typename Key, typename Agg>
class SessionWindowValueGetterSupplier {
  public:
    explicit SessionWindowValueGetterSupplier(std::string storeName) : storeName(std::move(storeName)) {}

    /**
     * @brief Creates a value getter on the given store
     * @param store the session store of the aggregation
     * @throws RuntimeException if the store is not the store of the aggregation
     */
    std::unique_ptr<SessionWindowValueGetter<Key, Agg>> get(State::SessionStorePtr<Key, Agg> store) const {
        SFL_ASSERT(store, "SessionWindowValueGetterSupplier: store must not be null");
        if (store->name() != storeName) {
            SFL_THROW_RUNTIME_ERROR("SessionWindowValueGetterSupplier: expected store " << storeName << " but got "
                                                                                        << store->name());
        }
        return std::make_unique<SessionWindowValueGetter<Key, Agg>>(std::move(store));
    }

    /**
     * @return the names of the stores the value getters read from
     */
    [[nodiscard]] std::vector<std::string> storeNames() const { return {storeName}; }

  private:
    std::string storeName;
};

}// namespace SFL::Windowing

#endif// SFL_CORE_INCLUDE_WINDOWING_SESSIONWINDOWVALUEGETTER_HPP_
