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
#include <State/InMemorySessionStore.hpp>
#include <Util/CollectingChangeListener.hpp>
#include <Util/Logger/Logger.hpp>
#include <Windowing/SessionWindowAggregation.hpp>
#include <gtest/gtest.h>
#include <string>

namespace SFL::Windowing {

class SessionWindowValueGetterTest : public Testing::BaseUnitTest {
  public:
    static void SetUpTestCase() {
        SFL::Logger::setupLogging("SessionWindowValueGetterTest.log", SFL::LogLevel::LOG_DEBUG);
        SFL_INFO("Setup SessionWindowValueGetterTest test class.");
    }

    void SetUp() override {
        Testing::BaseUnitTest::SetUp();
        store = std::make_shared<State::InMemorySessionStore<std::string, int64_t>>("sessions");
    }

    SessionWindowAggregation<std::string, int64_t, int64_t> aggregation{SessionWindows::with(5),
                                                                        "sessions",
                                                                        {[]() {
                                                                             return int64_t{0};
                                                                         },
                                                                         [](const std::string&, const int64_t& v, const int64_t& a) {
                                                                             return a + v;
                                                                         },
                                                                         [](const std::string&, const int64_t& l, const int64_t& r) {
                                                                             return l + r;
                                                                         }}};
    std::shared_ptr<State::InMemorySessionStore<std::string, int64_t>> store;
};

TEST_F(SessionWindowValueGetterTest, returnsAggregateWithSessionEnd) {
    store->put({"k", SessionWindow(2, 6)}, 11);
    auto getter = aggregation.view().get(store);

    auto result = getter->get({"k", SessionWindow(2, 6)});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->value, 11);
    EXPECT_EQ(result->timestamp, 6);
}

TEST_F(SessionWindowValueGetterTest, requiresExactBounds) {
    store->put({"k", SessionWindow(2, 6)}, 11);
    auto getter = aggregation.view().get(store);

    EXPECT_FALSE(getter->get({"k", SessionWindow(2, 5)}).has_value());
    EXPECT_FALSE(getter->get({"j", SessionWindow(2, 6)}).has_value());
}

TEST_F(SessionWindowValueGetterTest, readsSessionsWrittenByProcessor) {
    auto processor = aggregation.createProcessor(store,
                                                 std::make_shared<Testing::CollectingChangeListener<std::string, int64_t>>(),
                                                 std::make_shared<Metrics::CountingSensor>("dropped"));
    processor->process("k", 3, {"input", 0, 0, 1});
    processor->process("k", 4, {"input", 0, 1, 4});
    auto getter = aggregation.view().get(store);

    EXPECT_EQ(getter->get({"k", SessionWindow(1, 4)}), (ValueAndTimestamp<int64_t>{7, 4}));
    EXPECT_FALSE(getter->get({"k", SessionWindow(1, 1)}).has_value());
}

TEST_F(SessionWindowValueGetterTest, supplierNamesStoreOfAggregation) {
    auto supplier = aggregation.view();
    EXPECT_EQ(supplier.storeNames(), std::vector<std::string>{"sessions"});
    auto otherStore = std::make_shared<State::InMemorySessionStore<std::string, int64_t>>("other");
    EXPECT_THROW(supplier.get(otherStore), Exceptions::RuntimeException);
}

}// namespace SFL::Windowing
