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
#include <random>
#include <sstream>

namespace SFL::Testing {

namespace detail {

TestWaitingHelper::TestWaitingHelper() { testCompletion = std::make_shared<std::promise<bool>>(); }

void TestWaitingHelper::failTest() {
    auto expected = false;
    if (testCompletionSet.compare_exchange_strong(expected, true)) {
        testCompletion->set_value(false);
        waitThread->join();
        waitThread.reset();
    }
}

void TestWaitingHelper::completeTest() {
    auto expected = false;
    if (testCompletionSet.compare_exchange_strong(expected, true)) {
        testCompletion->set_value(true);
        waitThread->join();
        waitThread.reset();
    }
}

void TestWaitingHelper::startWaitingThread(std::string testName) {
    waitThread = std::make_unique<std::thread>([this, testName = std::move(testName)]() mutable {
        auto future = testCompletion->get_future();
        switch (future.wait_for(std::chrono::minutes(WAIT_TIME_SETUP))) {
            case std::future_status::ready: {
                try {
                    auto res = future.get();
                    if (!res) {
                        SFL_FATAL_ERROR2("Got error in test [{}]", testName);
                        std::exit(-127);
                    }
                } catch (std::exception const& exception) {
                    SFL_FATAL_ERROR2("Got exception in test [{}]: {}", testName, exception.what());
                    std::exit(-1);
                }
                break;
            }
            case std::future_status::timeout:
            case std::future_status::deferred: {
                SFL_ERROR2("Cannot terminate test [{}] within deadline", testName);
                std::exit(-127);
                break;
            }
        }
    });
}

namespace uuid {
static std::random_device rd;
static std::mt19937 gen(rd());
static std::uniform_int_distribution<> dis(0, 15);

std::string generateUUID() {
    std::stringstream ss;
    ss << std::hex;
    for (int i = 0; i < 32; i++) {
        if (i == 8 || i == 12 || i == 16 || i == 20) {
            ss << "-";
        }
        ss << dis(gen);
    }
    return ss.str();
}
}// namespace uuid
}// namespace detail

BaseUnitTest::BaseUnitTest() : testResourcePath(std::filesystem::current_path() / detail::uuid::generateUUID()) {}

void BaseUnitTest::SetUp() {
    testing::Test::SetUp();
    startWaitingThread(testing::UnitTest::GetInstance()->current_test_info()->name());
    if (std::filesystem::exists(testResourcePath)) {
        std::filesystem::remove_all(testResourcePath);
    }
    std::filesystem::create_directories(testResourcePath);
}

std::filesystem::path BaseUnitTest::getTestResourceFolder() const { return testResourcePath; }

void BaseUnitTest::TearDown() {
    std::filesystem::remove_all(testResourcePath);
    testing::Test::TearDown();
    completeTest();
}

}// namespace SFL::Testing
