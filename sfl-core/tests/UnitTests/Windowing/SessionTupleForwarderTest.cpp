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
#include <Util/CollectingChangeListener.hpp>
#include <Util/Logger/Logger.hpp>
#include <Windowing/SessionTupleForwarder.hpp>
#include <gtest/gtest.h>
#include <string>

namespace SFL::Windowing {

class SessionTupleForwarderTest : public Testing::BaseUnitTest {
  public:
    static void SetUpTestCase() {
        SFL::Logger::setupLogging("SessionTupleForwarderTest.log", SFL::LogLevel::LOG_DEBUG);
        SFL_INFO("Setup SessionTupleForwarderTest test class.");
    }

    void SetUp() override {
        Testing::BaseUnitTest::SetUp();
        listener = std::make_shared<Testing::CollectingChangeListener<std::string, int64_t>>();
    }

    std::shared_ptr<Testing::CollectingChangeListener<std::string, int64_t>> listener;
    Windowed<std::string> sessionKey{"k", SessionWindow(3, 8)};
};

TEST_F(SessionTupleForwarderTest, forwardsWithSessionEndAsTimestamp) {
    SessionTupleForwarder<std::string, int64_t> forwarder(listener, false);
    forwarder.maybeForward(sessionKey, 5, std::nullopt);

    ASSERT_EQ(listener->changes.size(), 1u);
    EXPECT_EQ(listener->changes[0].sessionKey, sessionKey);
    EXPECT_EQ(listener->changes[0].change, (Change<int64_t>{5, std::nullopt}));
    EXPECT_EQ(listener->changes[0].timestamp, 8);
}

TEST_F(SessionTupleForwarderTest, dropsOldValueIfNotEnabled) {
    SessionTupleForwarder<std::string, int64_t> forwarder(listener, false);
    forwarder.maybeForward(sessionKey, 5, 4);

    ASSERT_EQ(listener->changes.size(), 1u);
    EXPECT_FALSE(listener->changes[0].change.oldValue.has_value());
}

TEST_F(SessionTupleForwarderTest, forwardsOldValueIfEnabled) {
    SessionTupleForwarder<std::string, int64_t> forwarder(listener, true);
    forwarder.maybeForward(sessionKey, std::nullopt, 4);

    ASSERT_EQ(listener->changes.size(), 1u);
    EXPECT_EQ(listener->changes[0].change, (Change<int64_t>{std::nullopt, 4}));
}

TEST_F(SessionTupleForwarderTest, suppressesEmptyChange) {
    SessionTupleForwarder<std::string, int64_t> forwarder(listener, false);
    forwarder.maybeForward(sessionKey, std::nullopt, 4);
    forwarder.maybeForward(sessionKey, std::nullopt, std::nullopt);
    EXPECT_TRUE(listener->changes.empty());
}

TEST_F(SessionTupleForwarderTest, requiresListener) {
    EXPECT_THROW((SessionTupleForwarder<std::string, int64_t>(nullptr, false)), Exceptions::RuntimeException);
}

}// namespace SFL::Windowing
