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
#include <Configurations/ConfigurationException.hpp>
#include <Configurations/SessionWindowConfiguration.hpp>
#include <Util/Logger/Logger.hpp>
#include <gtest/gtest.h>
#include <map>
#include <string>

namespace SFL::Configurations {

class SessionWindowConfigurationTest : public Testing::BaseUnitTest {
  public:
    static void SetUpTestCase() {
        SFL::Logger::setupLogging("SessionWindowConfigurationTest.log", SFL::LogLevel::LOG_DEBUG);
        SFL_INFO("Setup SessionWindowConfigurationTest test class.");
    }
};

TEST_F(SessionWindowConfigurationTest, defaultValues) {
    auto configuration = SessionWindowConfiguration::create();
    EXPECT_EQ(configuration->inactivityGap.getValue(), 5000u);
    EXPECT_EQ(configuration->gracePeriod.getValue(), 0u);
    EXPECT_FALSE(configuration->sendOldValues.getValue());
    EXPECT_EQ(configuration->storeName.getValue(), "session-aggregation-store");
    EXPECT_EQ(configuration->numberOfPartitions.getValue(), 1u);
    EXPECT_EQ(configuration->logLevel.getValue(), LogLevel::LOG_INFO);
    EXPECT_EQ(configuration->inputFile.getValue(), "");
}

TEST_F(SessionWindowConfigurationTest, overwriteWithCommandLineInput) {
    std::map<std::string, std::string> commandLineParams = {{"--" + INACTIVITY_GAP_CONFIG, "300"},
                                                            {"--" + GRACE_PERIOD_CONFIG, "20"},
                                                            {"--" + SEND_OLD_VALUES_CONFIG, "true"},
                                                            {"--" + NUMBER_OF_PARTITIONS_CONFIG, "4"},
                                                            {"--" + LOG_LEVEL_CONFIG, "LOG_DEBUG"},
                                                            {"--" + INPUT_FILE_CONFIG, "records.csv"}};
    auto configuration = SessionWindowConfiguration::create();
    configuration->overwriteConfigWithCommandLineInput(commandLineParams);

    EXPECT_EQ(configuration->inactivityGap.getValue(), 300u);
    EXPECT_EQ(configuration->gracePeriod.getValue(), 20u);
    EXPECT_TRUE(configuration->sendOldValues.getValue());
    EXPECT_EQ(configuration->numberOfPartitions.getValue(), 4u);
    EXPECT_EQ(configuration->logLevel.getValue(), LogLevel::LOG_DEBUG);
    EXPECT_EQ(configuration->inputFile.getValue(), "records.csv");
}

TEST_F(SessionWindowConfigurationTest, rejectsUnknownOption) {
    auto configuration = SessionWindowConfiguration::create();
    std::map<std::string, std::string> commandLineParams = {{"--windowSize", "10"}};
    EXPECT_THROW(configuration->overwriteConfigWithCommandLineInput(commandLineParams), ConfigurationException);
}

TEST_F(SessionWindowConfigurationTest, rejectsInvalidValues) {
    auto configuration = SessionWindowConfiguration::create();
    EXPECT_THROW(configuration->overwriteConfigWithCommandLineInput({{"--" + INACTIVITY_GAP_CONFIG, "-5"}}), ConfigurationException);
    EXPECT_THROW(configuration->overwriteConfigWithCommandLineInput({{"--" + SEND_OLD_VALUES_CONFIG, "yes"}}), ConfigurationException);
    EXPECT_THROW(configuration->overwriteConfigWithCommandLineInput({{"--" + LOG_LEVEL_CONFIG, "LOG_VERBOSE"}}), ConfigurationException);
}

TEST_F(SessionWindowConfigurationTest, clearRestoresDefaults) {
    auto configuration = SessionWindowConfiguration::create();
    configuration->overwriteConfigWithCommandLineInput({{"--" + GRACE_PERIOD_CONFIG, "20"}});
    configuration->clear();
    EXPECT_EQ(configuration->gracePeriod.getValue(), 0u);
}

}// namespace SFL::Configurations
