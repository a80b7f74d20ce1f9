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

#ifndef SFL_CORE_INCLUDE_STATE_KEYVALUEITERATOR_HPP_
#define SFL_CORE_INCLUDE_STATE_KEYVALUEITERATOR_HPP_

#include <State/KeyValue.hpp>
#include <memory>
#include <utility>

namespace SFL::State {

/**
 * @brief Iterator over the key-value pairs of a store range.
 * An open iterator may hold resources of the store, e.g., a snapshot or a lock.
 * Thus, every iterator has to be closed as soon as it is not needed any more.
 */
template<typename K, typename V>
class KeyValueIterator {
  public:
    using KeyType = K;
    using ValueType = V;

    virtual ~KeyValueIterator() = default;

    /**
     * @return true if the iterator has more elements
     */
    virtual bool hasNext() = 0;

    /**
     * @brief Returns the next element of the range
     * @throws RuntimeException if the iterator is exhausted or closed
     */
    virtual KeyValue<K, V> next() = 0;

    /**
     * @brief Releases all store resources of this iterator. Closing a closed iterator has no effect.
     */
    virtual void close() noexcept = 0;
};

/**
 * @brief Deleter that closes an iterator before it is destroyed.
 */
struct CloseKeyValueIterator {
    template<typename K, typename V>
    void operator()(KeyValueIterator<K, V>* iterator) const noexcept {
        if (iterator != nullptr) {
            iterator->close();
            std::default_delete<KeyValueIterator<K, V>>()(iterator);
        }
    }
};

/**
 * @brief An owning iterator handle, which closes the iterator on every path that leaves its scope.
 */
template<typename K, typename V>
using KeyValueIteratorPtr = std::unique_ptr<KeyValueIterator<K, V>, CloseKeyValueIterator>;

/**
 * @brief Creates an iterator of type IteratorType and hands its ownership to a closing handle.
 */
template<typename IteratorType, typename... Arguments>
auto makeKeyValueIterator(Arguments&&... arguments) {
    using BaseIterator = KeyValueIterator<typename IteratorType::KeyType, typename IteratorType::ValueType>;
    auto iterator = std::make_unique<IteratorType>(std::forward<Arguments>(arguments)...);
    return KeyValueIteratorPtr<typename IteratorType::KeyType, typename IteratorType::ValueType>(
        static_cast<BaseIterator*>(iterator.release()));
}

}// namespace SFL::State

#endif// SFL_CORE_INCLUDE_STATE_KEYVALUEITERATOR_HPP_
