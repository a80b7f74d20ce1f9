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

#ifndef SFL_CORE_INCLUDE_WINDOWING_SESSIONWINDOWAGGREGATIONPROCESSOR_HPP_
#define SFL_CORE_INCLUDE_WINDOWING_SESSIONWINDOWAGGREGATIONPROCESSOR_HPP_

#include <Metrics/Sensor.hpp>
#include <State/SessionStore.hpp>
#include <Util/Logger/LogValue.hpp>
#include <Util/Logger/Logger.hpp>
#include <Windowing/ProcessOutcome.hpp>
#include <Windowing/RecordContext.hpp>
#include <Windowing/SessionAggregationFunctions.hpp>
#include <Windowing/SessionTupleForwarder.hpp>
#include <Windowing/SessionWindowMerger.hpp>
#include <Windowing/SessionWindows.hpp>
#include <Windowing/StreamTimeTracker.hpp>
#include <optional>
#include <utility>
#include <vector>

namespace SFL::Windowing {

/**
 * @brief Applies the records of one partition to the session store of a session window aggregation.
 * For every record, all sessions of the record key that are at most one inactivity gap away are merged with the
 * record into a single session. Merged sessions are removed from the store and the new session is written back.
 * Every change is forwarded downstream.
 * Records without a key and records that fall into an already closed session are dropped.
 *
 * A processor is owned by exactly one partition and is not thread-safe.
 */
template<typename Key, typename Value, typename Agg>
class SessionWindowAggregationProcessor {
  public:
    SessionWindowAggregationProcessor(SessionWindows windows,
                                      SessionAggregationFunctions<Key, Value, Agg> functions,
                                      State::SessionStorePtr<Key, Agg> store,
                                      SessionChangeListenerPtr<Key, Agg> listener,
                                      bool sendOldValues,
                                      Metrics::SensorPtr droppedRecordsSensor)
        : windows(windows), aggregator(std::move(functions.aggregator)),
          merger(std::move(functions.initializer), std::move(functions.merger)), store(std::move(store)),
          forwarder(std::move(listener), sendOldValues), droppedRecordsSensor(std::move(droppedRecordsSensor)) {
        SFL_ASSERT(this->store, "SessionWindowAggregationProcessor requires a session store");
        SFL_ASSERT(this->droppedRecordsSensor, "SessionWindowAggregationProcessor requires a dropped records sensor");
        SFL_DEBUG("SessionWindowAggregationProcessor: created for store " << this->store->name() << " with "
                                                                          << windows.toString());
    }

    /**
     * @brief Processes a single record
     * @param key the record key or std::nullopt if the record has no key
     * @param value the record value
     * @param context the event time and the position of the record
     * @return ProcessOutcome
     * @throws StoreException if the session store fails, the record is then only partially applied
     */
    ProcessOutcome<Key, Agg> process(const std::optional<Key>& key, const Value& value, const RecordContext& context) {
        if (!key.has_value()) {
            SFL_WARNING2("Skipping record due to null key. value=[{}] topic=[{}] partition=[{}] offset=[{}]",
                         Util::toLogString(value),
                         context.topic,
                         context.partition,
                         context.offset);
            droppedRecordsSensor->record();
            return ProcessOutcome<Key, Agg>::dropped(DropReason::NULL_KEY);
        }

        const auto timestamp = context.timestamp;
        const auto streamTime = streamTimeTracker.advance(timestamp);
        const auto closeTime = windows.closeTime(streamTime);

        auto mergeResult = findAndMergeSessions(key.value(), SessionWindow(timestamp, timestamp));

        if (mergeResult.mergedWindow.end() < closeTime) {
            SFL_WARNING2("Skipping record for expired window. key=[{}] topic=[{}] partition=[{}] offset=[{}] timestamp=[{}] "
                         "window=[{},{}] expiration=[{}] streamTime=[{}]",
                         Util::toLogString(key.value()),
                         context.topic,
                         context.partition,
                         context.offset,
                         timestamp,
                         mergeResult.mergedWindow.start(),
                         mergeResult.mergedWindow.end(),
                         closeTime,
                         streamTime);
            droppedRecordsSensor->record();
            return ProcessOutcome<Key, Agg>::dropped(DropReason::WINDOW_EXPIRED);
        }

        // a throwing aggregator leaves the store as it was
        auto aggregate = aggregator(key.value(), value, mergeResult.aggregate);

        std::vector<Windowed<Key>> replacedSessions;
        if (mergeResult.absorbedExistingSessions()) {
            replacedSessions.reserve(mergeResult.consumedSessions.size());
            for (auto& session : mergeResult.consumedSessions) {
                store->remove(session.key);
                forwarder.maybeForward(session.key, std::nullopt, session.value);
                replacedSessions.emplace_back(std::move(session.key));
            }
        }

        auto sessionKey = Windowed<Key>(key.value(), mergeResult.mergedWindow);
        store->put(sessionKey, aggregate);
        forwarder.maybeForward(sessionKey, aggregate, std::nullopt);
        return ProcessOutcome<Key, Agg>::applied(std::move(sessionKey), std::move(aggregate), std::move(replacedSessions));
    }

    /**
     * @return the maximal event time this processor has observed
     */
    [[nodiscard]] Timestamp observedStreamTime() const { return streamTimeTracker.currentStreamTime(); }

    [[nodiscard]] const SessionWindows& getWindows() const { return windows; }

  private:
    MergeResult<Key, Agg> findAndMergeSessions(const Key& key, const SessionWindow& candidateWindow) {
        // the iterator handle closes the store iterator when it goes out of scope, also if the merge throws
        auto existingSessions = store->findSessions(key,
                                                    windows.earliestSessionEndTime(candidateWindow.start()),
                                                    windows.latestSessionStartTime(candidateWindow.end()));
        SFL_ASSERT(existingSessions, "SessionWindowAggregationProcessor: store " << store->name() << " returned no iterator");
        return merger.merge(key, candidateWindow, *existingSessions);
    }

    const SessionWindows windows;
    Aggregator<Key, Value, Agg> aggregator;
    SessionWindowMerger<Key, Agg> merger;
    State::SessionStorePtr<Key, Agg> store;
    SessionTupleForwarder<Key, Agg> forwarder;
    Metrics::SensorPtr droppedRecordsSensor;
    StreamTimeTracker streamTimeTracker;
};

}// namespace SFL::Windowing

#endif// SFL_CORE_INCLUDE_WINDOWING_SESSIONWINDOWAGGREGATIONPROCESSOR_HPP_
