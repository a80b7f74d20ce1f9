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

#ifndef SFL_COMMON_INCLUDE_CONFIGURATIONS_BASECONFIGURATION_HPP_
#define SFL_COMMON_INCLUDE_CONFIGURATIONS_BASECONFIGURATION_HPP_

#include <Configurations/BaseOption.hpp>
#include <Configurations/ConfigurationException.hpp>
#include <Configurations/EnumOption.hpp>
#include <Configurations/ScalarOption.hpp>
#include <map>
#include <string>
#include <vector>

namespace SFL::Configurations {

/**
 * @brief This class is the bases for all configuration.
 * A configuration contains a set of config option as member fields.
 * An individual option could ether be defined as an root class, e.g., see SessionWindowConfiguration, in this case it would correspond to a dedicated file
 * or as a member field of a high level configuration.
 */
class BaseConfiguration : public BaseOption {
  public:
    BaseConfiguration();

    /**
     * @brief Constructor to create a new configuration.
     * @param name of the configuration.
     * @param description of the configuration.
     */
    BaseConfiguration(const std::string& name, const std::string& description);

    ~BaseConfiguration() override = default;

    /**
     * @brief Overwrite the default and the current configuration with the values of the command line.
     * Each parameter has the form --name=value, the leading dashes are optional.
     * @param inputParams map with key=command line parameter and value = value
     * @throws ConfigurationException if an identifier is unknown or a value can not be parsed
     */
    void overwriteConfigWithCommandLineInput(const std::map<std::string, std::string>& inputParams);

    /**
     * @brief clears all options and set the default values
     */
    void clear() override;

    std::string toString() override;

  protected:
    void parseFromString(std::string identifier, std::map<std::string, std::string>& inputParams) override;

    /**
     * @return the options of this configuration
     */
    virtual std::vector<BaseOption*> getOptions() = 0;

    std::map<std::string, BaseOption*> getOptionMap();
};

}// namespace SFL::Configurations

#endif// SFL_COMMON_INCLUDE_CONFIGURATIONS_BASECONFIGURATION_HPP_
