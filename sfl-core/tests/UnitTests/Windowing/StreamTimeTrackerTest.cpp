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
#include <Util/Logger/Logger.hpp>
#include <Windowing/StreamTimeTracker.hpp>
#include <gtest/gtest.h>

namespace SFL::Windowing {

class StreamTimeTrackerTest : public Testing::BaseUnitTest {
  public:
    static void SetUpTestCase() {
        SFL::Logger::setupLogging("StreamTimeTrackerTest.log", SFL::LogLevel::LOG_DEBUG);
        SFL_INFO("Setup StreamTimeTrackerTest test class.");
    }
};

TEST_F(StreamTimeTrackerTest, startsUnset) {
    StreamTimeTracker tracker;
    EXPECT_FALSE(tracker.isSet());
    EXPECT_EQ(tracker.currentStreamTime(), StreamTimeTracker::UNSET);
}

TEST_F(StreamTimeTrackerTest, advanceReturnsMaximum) {
    StreamTimeTracker tracker;
    EXPECT_EQ(tracker.advance(10), 10);
    EXPECT_TRUE(tracker.isSet());
    EXPECT_EQ(tracker.advance(5), 10);
    EXPECT_EQ(tracker.advance(10), 10);
    EXPECT_EQ(tracker.advance(11), 11);
    EXPECT_EQ(tracker.currentStreamTime(), 11);
}

TEST_F(StreamTimeTrackerTest, acceptsNegativeTimestamps) {
    StreamTimeTracker tracker;
    EXPECT_EQ(tracker.advance(-100), -100);
    EXPECT_EQ(tracker.advance(-200), -100);
}

}// namespace SFL::Windowing
