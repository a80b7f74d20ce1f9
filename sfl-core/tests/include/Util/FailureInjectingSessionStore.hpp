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

#ifndef SFL_CORE_TESTS_INCLUDE_UTIL_FAILUREINJECTINGSESSIONSTORE_HPP_
#define SFL_CORE_TESTS_INCLUDE_UTIL_FAILUREINJECTINGSESSIONSTORE_HPP_

#include <Exceptions/StoreException.hpp>
#include <State/InMemorySessionStore.hpp>
#include <optional>
#include <utility>

namespace SFL::Testing {

enum class StoreOperation : uint8_t { FIND_SESSIONS, PUT, REMOVE, FETCH_SESSION, ITERATE };

/**
 * @brief Session store on top of an in-memory store that fails a chosen operation.
 * It counts every call, so tests can check that a record did not touch the store at all.
 */
template<typename Key, typename Agg>
class FailureInjectingSessionStore : public State::SessionStore<Key, Agg> {
    using SessionKeyValueIterator = State::KeyValueIterator<Windowing::Windowed<Key>, Agg>;

    // forwards to the store iterator but fails when an element is requested
    class FailingIterator : public SessionKeyValueIterator {
      public:
        FailingIterator(State::KeyValueIteratorPtr<Windowing::Windowed<Key>, Agg> delegate, std::string storeName)
            : delegate(std::move(delegate)), storeName(std::move(storeName)) {}

        bool hasNext() override { return delegate && delegate->hasNext(); }

        State::KeyValue<Windowing::Windowed<Key>, Agg> next() override {
            throw Exceptions::StoreOperationFailedException(storeName, "next", "injected iterator failure");
        }

        void close() noexcept override { delegate.reset(); }

      private:
        State::KeyValueIteratorPtr<Windowing::Windowed<Key>, Agg> delegate;
        std::string storeName;
    };

  public:
    explicit FailureInjectingSessionStore(std::string storeName) : delegate(storeName) {}

    /**
     * @brief Lets every further call of the operation fail
     * @param operation the failing operation
     * @param unavailable fail with a StoreUnavailableException instead of a StoreOperationFailedException
     */
    void failOn(StoreOperation operation, bool unavailable = false) {
        failingOperation = operation;
        failAsUnavailable = unavailable;
    }

    [[nodiscard]] std::string name() const override { return delegate.name(); }

    State::KeyValueIteratorPtr<Windowing::Windowed<Key>, Agg>
    findSessions(const Key& key, Timestamp earliestSessionEndTime, Timestamp latestSessionStartTime) override {
        intercept(StoreOperation::FIND_SESSIONS, "findSessions");
        auto iterator = delegate.findSessions(key, earliestSessionEndTime, latestSessionStartTime);
        if (failingOperation == StoreOperation::ITERATE) {
            return State::makeKeyValueIterator<FailingIterator>(std::move(iterator), name());
        }
        return iterator;
    }

    void put(const Windowing::Windowed<Key>& sessionKey, const Agg& aggregate) override {
        intercept(StoreOperation::PUT, "put");
        delegate.put(sessionKey, aggregate);
    }

    void remove(const Windowing::Windowed<Key>& sessionKey) override {
        intercept(StoreOperation::REMOVE, "remove");
        delegate.remove(sessionKey);
    }

    std::optional<Agg> fetchSession(const Key& key, Timestamp startTime, Timestamp endTime) override {
        intercept(StoreOperation::FETCH_SESSION, "fetchSession");
        return delegate.fetchSession(key, startTime, endTime);
    }

    State::InMemorySessionStore<Key, Agg>& getDelegate() { return delegate; }

    [[nodiscard]] uint64_t getNumberOfCalls() const { return numberOfCalls; }

  private:
    void intercept(StoreOperation operation, const std::string& operationName) {
        ++numberOfCalls;
        if (failingOperation != operation) {
            return;
        }
        if (failAsUnavailable) {
            throw Exceptions::StoreUnavailableException(name(), "injected failure of " + operationName);
        }
        throw Exceptions::StoreOperationFailedException(name(), operationName, "injected failure");
    }

    State::InMemorySessionStore<Key, Agg> delegate;
    std::optional<StoreOperation> failingOperation;
    bool failAsUnavailable = false;
    uint64_t numberOfCalls = 0;
};

}// namespace SFL::Testing

#endif// SFL_CORE_TESTS_INCLUDE_UTIL_FAILUREINJECTINGSESSIONSTORE_HPP_
