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

#ifndef SFL_CORE_INCLUDE_STATE_SNAPSHOTKEYVALUEITERATOR_HPP_
#define SFL_CORE_INCLUDE_STATE_SNAPSHOTKEYVALUEITERATOR_HPP_

#include <State/KeyValueIterator.hpp>
#include <Util/Logger/Logger.hpp>
#include <functional>
#include <utility>
#include <vector>

namespace SFL::State {

/**
 * @brief Iterator over a copy of a store range.
 * The onClose callback is invoked exactly once, either on close or on destruction.
 */
template<typename K, typename V>
class SnapshotKeyValueIterator : public KeyValueIterator<K, V> {
  public:
    explicit SnapshotKeyValueIterator(std::vector<KeyValue<K, V>> snapshot, std::function<void()> onClose = nullptr)
        : snapshot(std::move(snapshot)), onClose(std::move(onClose)) {}

    ~SnapshotKeyValueIterator() override { close(); }

    bool hasNext() override { return !closed && position < snapshot.size(); }

    KeyValue<K, V> next() override {
        if (closed) {
            SFL_THROW_RUNTIME_ERROR("SnapshotKeyValueIterator: next() called on a closed iterator");
        }
        if (position >= snapshot.size()) {
            SFL_THROW_RUNTIME_ERROR("SnapshotKeyValueIterator: next() called on an exhausted iterator");
        }
        return snapshot[position++];
    }

    void close() noexcept override {
        if (closed) {
            return;
        }
        closed = true;
        snapshot.clear();
        if (onClose) {
            onClose();
        }
    }

  private:
    std::vector<KeyValue<K, V>> snapshot;
    std::function<void()> onClose;
    size_t position = 0;
    bool closed = false;
};

}// namespace SFL::State

#endif// SFL_CORE_INCLUDE_STATE_SNAPSHOTKEYVALUEITERATOR_HPP_
