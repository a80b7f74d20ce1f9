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
#include <Metrics/Sensor.hpp>
#include <Util/Logger/Logger.hpp>
#include <gtest/gtest.h>
#include <thread>
#include <vector>

namespace SFL::Metrics {

class SensorTest : public Testing::BaseUnitTest {
  public:
    static void SetUpTestCase() {
        SFL::Logger::setupLogging("SensorTest.log", SFL::LogLevel::LOG_DEBUG);
        SFL_INFO("Setup SensorTest test class.");
    }
};

TEST_F(SensorTest, droppedRecordsSensorName) {
    auto sensor = CountingSensor::createDroppedRecordsSensor("thread-1", "0_1");
    EXPECT_EQ(sensor->getName(), "thread-1.0_1.dropped-records");
    EXPECT_EQ(sensor->getCount(), 0u);
}

TEST_F(SensorTest, countsConcurrentRecordings) {
    auto sensor = std::make_shared<CountingSensor>("shared");
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([sensor]() {
            for (int j = 0; j < 1000; ++j) {
                sensor->record();
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(sensor->getCount(), 4000u);
}

}// namespace SFL::Metrics
