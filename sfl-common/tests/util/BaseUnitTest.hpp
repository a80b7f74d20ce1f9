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

#ifndef SFL_TESTS_UTIL_BASEUNITTEST_HPP_
#define SFL_TESTS_UTIL_BASEUNITTEST_HPP_

#include <Util/Logger/Logger.hpp>
#include <atomic>
#include <filesystem>
#include <future>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <thread>

namespace SFL::Testing {
namespace detail {
/**
 * @brief Watches the running test and terminates the test binary if the test does not finish within its deadline.
 */
class TestWaitingHelper {
  public:
    TestWaitingHelper();
    void startWaitingThread(std::string testName);
    void completeTest();
    void failTest();

  private:
    std::unique_ptr<std::thread> waitThread;
    std::shared_ptr<std::promise<bool>> testCompletion;
    std::atomic<bool> testCompletionSet{false};
    static constexpr uint64_t WAIT_TIME_SETUP = 5;
};
}// namespace detail

/**
 * @brief Base class of all unit tests. Every test gets its own resource folder, which is removed after the test.
 */
class BaseUnitTest : public testing::Test, public detail::TestWaitingHelper {
  public:
    /**
     * @brief the base test class ctor that creates the internal test resources
     */
    explicit BaseUnitTest();

    void SetUp() override;

    void TearDown() override;

  protected:
    /**
     * @brief returns the test resource folder to write files
     * @return the test folder
     */
    std::filesystem::path getTestResourceFolder() const;

  private:
    std::filesystem::path testResourcePath;
};
}// namespace SFL::Testing

#endif// SFL_TESTS_UTIL_BASEUNITTEST_HPP_
