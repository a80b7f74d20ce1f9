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

#ifndef SFL_CORE_INCLUDE_WINDOWING_SESSIONWINDOWAGGREGATION_HPP_
#define SFL_CORE_INCLUDE_WINDOWING_SESSIONWINDOWAGGREGATION_HPP_

#include <Windowing/SessionWindowAggregationProcessor.hpp>
#include <Windowing/SessionWindowValueGetter.hpp>
#include <memory>
#include <string>
#include <utility>

namespace SFL::Windowing {

/**
 * @brief Definition of a session window aggregation.
 * The definition is shared by all partitions, each partition creates its own processor on its own store.
 */
template<typename Key, typename Value, typename Agg>
class SessionWindowAggregation {
  public:
    SessionWindowAggregation(SessionWindows windows, std::string storeName, SessionAggregationFunctions<Key, Value, Agg> functions)
        : sessionWindows(windows), sessionStoreName(std::move(storeName)), functions(std::move(functions)) {
        SFL_ASSERT(this->functions.initializer && this->functions.aggregator && this->functions.merger,
                   "SessionWindowAggregation requires an initializer, an aggregator and a merger");
    }

    /**
     * @brief Creates the processor of a partition
     * @param store the session store of the partition, has to be the store of this aggregation
     * @param listener receives the changes of the sessions
     * @param droppedRecordsSensor records every dropped record
     * @return processor
     */
    std::unique_ptr<SessionWindowAggregationProcessor<Key, Value, Agg>> createProcessor(State::SessionStorePtr<Key, Agg> store,
                                                                                        SessionChangeListenerPtr<Key, Agg> listener,
                                                                                        Metrics::SensorPtr droppedRecordsSensor) const {
        SFL_ASSERT(store, "SessionWindowAggregation: store must not be null");
        if (store->name() != sessionStoreName) {
            SFL_THROW_RUNTIME_ERROR("SessionWindowAggregation: expected store " << sessionStoreName << " but got " << store->name());
        }
        return std::make_unique<SessionWindowAggregationProcessor<Key, Value, Agg>>(sessionWindows,
                                                                                    functions,
                                                                                    std::move(store),
                                                                                    std::move(listener),
                                                                                    sendOldValues,
                                                                                    std::move(droppedRecordsSensor));
    }

    /**
     * @brief Creates the supplier of read-only views on the sessions of this aggregation
     */
    SessionWindowValueGetterSupplier<Key, Agg> view() const { return SessionWindowValueGetterSupplier<Key, Agg>(sessionStoreName); }

    /**
     * @brief Enables forwarding of old values. Affects only processors that are created afterwards.
     */
    void enableSendingOldValues() { sendOldValues = true; }

    [[nodiscard]] bool isSendingOldValues() const { return sendOldValues; }

    [[nodiscard]] const SessionWindows& windows() const { return sessionWindows; }

    [[nodiscard]] const std::string& storeName() const { return sessionStoreName; }

  private:
    SessionWindows sessionWindows;
    std::string sessionStoreName;
    SessionAggregationFunctions<Key, Value, Agg> functions;
    bool sendOldValues = false;
};

}// namespace SFL::Windowing

#endif// SFL_CORE_INCLUDE_WINDOWING_SESSIONWINDOWAGGREGATION_HPP_
