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

#ifndef SFL_CORE_INCLUDE_CONFIGURATIONS_SESSIONWINDOWCONFIGURATION_HPP_
#define SFL_CORE_INCLUDE_CONFIGURATIONS_SESSIONWINDOWCONFIGURATION_HPP_

#include <Configurations/BaseConfiguration.hpp>
#include <Util/Logger/LogLevel.hpp>
#include <memory>
#include <string>
#include <vector>

namespace SFL::Configurations {

const std::string INACTIVITY_GAP_CONFIG = "inactivityGap";
const std::string GRACE_PERIOD_CONFIG = "gracePeriod";
const std::string SEND_OLD_VALUES_CONFIG = "sendOldValues";
const std::string STORE_NAME_CONFIG = "storeName";
const std::string NUMBER_OF_PARTITIONS_CONFIG = "numberOfPartitions";
const std::string LOG_LEVEL_CONFIG = "logLevel";
const std::string INPUT_FILE_CONFIG = "inputFile";

class SessionWindowConfiguration;
using SessionWindowConfigurationPtr = std::shared_ptr<SessionWindowConfiguration>;

/**
 * @brief Configuration of a session window aggregation and of the runner that executes it.
 */
class SessionWindowConfiguration : public BaseConfiguration {
  public:
    SessionWindowConfiguration() : BaseConfiguration(){};
    SessionWindowConfiguration(std::string name, std::string description) : BaseConfiguration(name, description){};

    /**
     * @brief Factory function for a session window config
     */
    static SessionWindowConfigurationPtr create() { return std::make_shared<SessionWindowConfiguration>(); }

    /**
     * @brief Maximal time in ms between two records of the same session.
     */
    UIntOption inactivityGap = {INACTIVITY_GAP_CONFIG, 5000, "Inactivity gap of a session in ms."};

    /**
     * @brief Time in ms after the close of a session, in which out-of-order records are still admitted.
     */
    UIntOption gracePeriod = {GRACE_PERIOD_CONFIG, 0, "Grace period for late records in ms."};

    /**
     * @brief Forward the previous aggregate of a session when it is replaced.
     */
    BoolOption sendOldValues = {SEND_OLD_VALUES_CONFIG, false, "Forward old values of replaced sessions."};

    StringOption storeName = {STORE_NAME_CONFIG, "session-aggregation-store", "Name of the session store."};

    UIntOption numberOfPartitions = {NUMBER_OF_PARTITIONS_CONFIG, 1, "Number of partitions the input is split into."};

    EnumOption<LogLevel> logLevel = {LOG_LEVEL_CONFIG,
                                     LogLevel::LOG_INFO,
                                     "The log level (LOG_NONE, LOG_WARNING, LOG_DEBUG, LOG_INFO, LOG_TRACE)"};

    StringOption inputFile = {INPUT_FILE_CONFIG, "", "CSV file with one key,value,timestamp record per line."};

  private:
    std::vector<Configurations::BaseOption*> getOptions() override {
        return {&inactivityGap, &gracePeriod, &sendOldValues, &storeName, &numberOfPartitions, &logLevel, &inputFile};
    }
};

}// namespace SFL::Configurations

#endif// SFL_CORE_INCLUDE_CONFIGURATIONS_SESSIONWINDOWCONFIGURATION_HPP_
