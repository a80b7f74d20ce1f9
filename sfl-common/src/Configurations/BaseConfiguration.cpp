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

#include <Configurations/BaseConfiguration.hpp>
#include <Util/Logger/Logger.hpp>
#include <sstream>

namespace SFL::Configurations {

BaseConfiguration::BaseConfiguration() : BaseOption() {}

BaseConfiguration::BaseConfiguration(const std::string& name, const std::string& description) : BaseOption(name, description) {}

void BaseConfiguration::parseFromString(std::string identifier, std::map<std::string, std::string>& inputParams) {
    auto optionMap = getOptionMap();
    auto option = optionMap.find(identifier);
    if (option == optionMap.end()) {
        throw ConfigurationException("Identifier " + identifier + " is not known.");
    }
    option->second->parseFromString(identifier, inputParams);
}

void BaseConfiguration::overwriteConfigWithCommandLineInput(const std::map<std::string, std::string>& inputParams) {
    std::map<std::string, std::string> params;
    for (const auto& [key, value] : inputParams) {
        auto firstNameCharacter = key.find_first_not_of('-');
        if (firstNameCharacter == std::string::npos) {
            throw ConfigurationException("Command line parameter " + key + " has no name.");
        }
        params[key.substr(firstNameCharacter)] = value;
    }
    for (const auto& param : params) {
        SFL_DEBUG("BaseConfiguration: set " << param.first << " to " << param.second);
        parseFromString(param.first, params);
    }
}

void BaseConfiguration::clear() {
    for (auto* option : getOptions()) {
        option->clear();
    }
}

std::map<std::string, BaseOption*> BaseConfiguration::getOptionMap() {
    std::map<std::string, BaseOption*> optionMap;
    for (auto* option : getOptions()) {
        optionMap[option->getName()] = option;
    }
    return optionMap;
}

std::string BaseConfiguration::toString() {
    std::stringstream ss;
    for (auto* option : getOptions()) {
        ss << option->toString() << "\n";
    }
    return ss.str();
}

}// namespace SFL::Configurations
