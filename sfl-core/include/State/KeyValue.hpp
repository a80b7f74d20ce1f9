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

#ifndef SFL_CORE_INCLUDE_STATE_KEYVALUE_HPP_
#define SFL_CORE_INCLUDE_STATE_KEYVALUE_HPP_

#include <utility>

namespace SFL::State {

/**
 * @brief A key-value pair as returned by the iterators of a state store.
 */
template<typename K, typename V>
struct KeyValue {
    K key;
    V value;

    static KeyValue<K, V> pair(K key, V value) { return {std::move(key), std::move(value)}; }

    bool operator==(const KeyValue<K, V>& other) const = default;
};

}// namespace SFL::State

#endif// SFL_CORE_INCLUDE_STATE_KEYVALUE_HPP_
