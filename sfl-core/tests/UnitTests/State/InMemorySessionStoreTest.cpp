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

#include <BaseUnitTest.hpp>
#include <Exceptions/StoreException.hpp>
#include <State/InMemorySessionStore.hpp>
#include <Util/Logger/Logger.hpp>
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

namespace SFL::State {

using Windowing::SessionWindow;
using Windowing::Windowed;
using KV = KeyValue<Windowed<std::string>, int64_t>;

class InMemorySessionStoreTest : public Testing::BaseUnitTest {
  public:
    static void SetUpTestCase() {
        SFL::Logger::setupLogging("InMemorySessionStoreTest.log", SFL::LogLevel::LOG_DEBUG);
        SFL_INFO("Setup InMemorySessionStoreTest test class.");
    }

    static std::vector<KV> drain(KeyValueIterator<Windowed<std::string>, int64_t>& iterator) {
        std::vector<KV> result;
        while (iterator.hasNext()) {
            result.emplace_back(iterator.next());
        }
        return result;
    }

    InMemorySessionStore<std::string, int64_t> store{"sessions"};
};

TEST_F(InMemorySessionStoreTest, findSessionsReturnsOverlappingSessionsOfKey) {
    store.put({"k", SessionWindow(0, 2)}, 1);
    store.put({"k", SessionWindow(5, 7)}, 2);
    store.put({"k", SessionWindow(20, 25)}, 3);
    store.put({"j", SessionWindow(5, 7)}, 4);

    auto iterator = store.findSessions("k", 2, 10);
    auto expected = std::vector<KV>{KV::pair({"k", SessionWindow(0, 2)}, 1), KV::pair({"k", SessionWindow(5, 7)}, 2)};
    EXPECT_EQ(drain(*iterator), expected);
}

TEST_F(InMemorySessionStoreTest, findSessionsBoundsAreInclusive) {
    store.put({"k", SessionWindow(0, 4)}, 1);
    EXPECT_EQ(drain(*store.findSessions("k", 4, 100)).size(), 1u);
    EXPECT_EQ(drain(*store.findSessions("k", 5, 100)).size(), 0u);
    EXPECT_EQ(drain(*store.findSessions("k", -100, 0)).size(), 1u);
    EXPECT_EQ(drain(*store.findSessions("k", -100, -1)).size(), 0u);
    EXPECT_EQ(drain(*store.findSessions("unknown", -100, 100)).size(), 0u);
}

TEST_F(InMemorySessionStoreTest, putOverwritesSameSession) {
    store.put({"k", SessionWindow(0, 4)}, 1);
    store.put({"k", SessionWindow(0, 4)}, 2);
    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(store.fetchSession("k", 0, 4), 2);
}

TEST_F(InMemorySessionStoreTest, removeUnknownSessionHasNoEffect) {
    store.put({"k", SessionWindow(0, 4)}, 1);
    store.remove({"k", SessionWindow(0, 5)});
    store.remove({"j", SessionWindow(0, 4)});
    EXPECT_EQ(store.size(), 1u);
    store.remove({"k", SessionWindow(0, 4)});
    EXPECT_EQ(store.size(), 0u);
    EXPECT_FALSE(store.fetchSession("k", 0, 4).has_value());
}

TEST_F(InMemorySessionStoreTest, iteratorIsDetachedFromLaterWrites) {
    store.put({"k", SessionWindow(0, 4)}, 1);
    auto iterator = store.findSessions("k", 0, 10);
    store.remove({"k", SessionWindow(0, 4)});
    EXPECT_EQ(drain(*iterator).size(), 1u);
}

TEST_F(InMemorySessionStoreTest, releasingIteratorClosesIt) {
    {
        auto iterator = store.findSessions("k", 0, 10);
        EXPECT_EQ(store.numberOfOpenIterators(), 1u);
        iterator->close();
        iterator->close();
        EXPECT_EQ(store.numberOfOpenIterators(), 0u);
        EXPECT_FALSE(iterator->hasNext());
        EXPECT_THROW(iterator->next(), Exceptions::RuntimeException);
    }
    {
        auto iterator = store.findSessions("k", 0, 10);
        EXPECT_EQ(store.numberOfOpenIterators(), 1u);
    }
    EXPECT_EQ(store.numberOfOpenIterators(), 0u);
}

TEST_F(InMemorySessionStoreTest, iteratorHandleClosesOnceOnRelease) {
    auto closeCalls = 0;
    {
        auto iterator = makeKeyValueIterator<SnapshotKeyValueIterator<Windowed<std::string>, int64_t>>(
            std::vector<KV>{KV::pair({"k", SessionWindow(0, 0)}, 1)},
            [&closeCalls]() {
                ++closeCalls;
            });
        ASSERT_TRUE(iterator->hasNext());
        EXPECT_EQ(iterator->next().value, 1);
    }
    EXPECT_EQ(closeCalls, 1);

    auto iterator = store.findSessions("k", 0, 10);
    EXPECT_EQ(store.numberOfOpenIterators(), 1u);
    iterator.reset();
    EXPECT_EQ(store.numberOfOpenIterators(), 0u);
}

TEST_F(InMemorySessionStoreTest, closedStoreIsUnavailable) {
    store.close();
    EXPECT_THROW(store.findSessions("k", 0, 10), Exceptions::StoreUnavailableException);
    EXPECT_THROW(store.put({"k", SessionWindow(0, 4)}, 1), Exceptions::StoreUnavailableException);
    EXPECT_THROW(store.remove({"k", SessionWindow(0, 4)}), Exceptions::StoreUnavailableException);
    EXPECT_THROW(store.fetchSession("k", 0, 4), Exceptions::StoreUnavailableException);
}

TEST_F(InMemorySessionStoreTest, concurrentWritersOfDisjointKeys) {
    std::vector<std::thread> writers;
    for (int writer = 0; writer < 4; ++writer) {
        writers.emplace_back([this, writer]() {
            for (Timestamp ts = 0; ts < 100; ++ts) {
                store.put({std::to_string(writer), SessionWindow(ts * 10, ts * 10 + 1)}, ts);
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }
    EXPECT_EQ(store.size(), 400u);
}

}// namespace SFL::State
