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

#ifndef SFL_CORE_INCLUDE_WINDOWING_SESSIONWINDOWMERGER_HPP_
#define SFL_CORE_INCLUDE_WINDOWING_SESSIONWINDOWMERGER_HPP_

#include <State/KeyValueIterator.hpp>
#include <Util/Logger/Logger.hpp>
#include <Windowing/SessionAggregationFunctions.hpp>
#include <Windowing/SessionWindow.hpp>
#include <Windowing/Windowed.hpp>
#include <utility>
#include <vector>

namespace SFL::Windowing {

/**
 * @brief Result of merging a candidate window with the existing sessions it overlaps.
 */
template<typename Key, typename Agg>
struct MergeResult {
    SessionWindow candidateWindow;
    SessionWindow mergedWindow;
    Agg aggregate;
    std::vector<State::KeyValue<Windowed<Key>, Agg>> consumedSessions;

    /**
     * @return true if at least one existing session widened the candidate window,
     * i.e., the consumed sessions have to be removed before the merged session is written.
     */
    [[nodiscard]] bool absorbedExistingSessions() const { return mergedWindow != candidateWindow; }
};

/**
 * @brief Merges the window of a new record with all existing sessions of its key that overlap the record.
 * The merge is a single pass over the sessions in store order. As the merger is associative and commutative,
 * the result does not depend on this order.
 */
template<typename Key, typename Agg>
class SessionWindowMerger {
  public:
    SessionWindowMerger(Initializer<Agg> initializer, Merger<Key, Agg> merger)
        : initializer(std::move(initializer)), merger(std::move(merger)) {}

    /**
     * @brief Folds all sessions of the iterator into the candidate window
     * @param key the record key
     * @param candidateWindow the window of the new record
     * @param existingSessions the overlapping sessions of key
     * @return MergeResult with the merged window, the combined aggregate and all consumed sessions
     */
    MergeResult<Key, Agg>
    merge(const Key& key, const SessionWindow& candidateWindow, State::KeyValueIterator<Windowed<Key>, Agg>& existingSessions) const {
        auto result = MergeResult<Key, Agg>{candidateWindow, candidateWindow, initializer(), {}};
        while (existingSessions.hasNext()) {
            auto session = existingSessions.next();
            result.aggregate = merger(key, result.aggregate, session.value);
            result.mergedWindow = result.mergedWindow.merge(session.key.window());
            result.consumedSessions.emplace_back(std::move(session));
        }
        SFL_TRACE("SessionWindowMerger: merged " << candidateWindow << " with " << result.consumedSessions.size()
                                                 << " sessions into " << result.mergedWindow);
        return result;
    }

  private:
    Initializer<Agg> initializer;
    Merger<Key, Agg> merger;
};

}// namespace SFL::Windowing

#endif// SFL_CORE_INCLUDE_WINDOWING_SESSIONWINDOWMERGER_HPP_
