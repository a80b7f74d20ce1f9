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

#ifndef SFL_CORE_INCLUDE_WINDOWING_SESSIONAGGREGATIONFUNCTIONS_HPP_
#define SFL_CORE_INCLUDE_WINDOWING_SESSIONAGGREGATIONFUNCTIONS_HPP_

#include <functional>

namespace SFL::Windowing {

// creates the aggregate of an empty session
template<typename Agg>
using Initializer = std::function<Agg()>;

// adds a record to the aggregate of a session
template<typename Key, typename Value, typename Agg>
using Aggregator = std::function<Agg(const Key& key, const Value& value, const Agg& aggregate)>;

// combines the aggregates of two sessions, has to be associative and commutative
template<typename Key, typename Agg>
using Merger = std::function<Agg(const Key& key, const Agg& left, const Agg& right)>;

/**
 * @brief The functions that define a session aggregation.
 */
template<typename Key, typename Value, typename Agg>
struct SessionAggregationFunctions {
    Initializer<Agg> initializer;
    Aggregator<Key, Value, Agg> aggregator;
    Merger<Key, Agg> merger;
};

}// namespace SFL::Windowing

#endif// SFL_CORE_INCLUDE_WINDOWING_SESSIONAGGREGATIONFUNCTIONS_HPP_
