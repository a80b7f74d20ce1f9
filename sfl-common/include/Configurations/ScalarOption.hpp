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

#ifndef SFL_COMMON_INCLUDE_CONFIGURATIONS_SCALAROPTION_HPP_
#define SFL_COMMON_INCLUDE_CONFIGURATIONS_SCALAROPTION_HPP_

#include <Configurations/ConfigurationException.hpp>
#include <Configurations/TypedBaseOption.hpp>
#include <cstdint>
#include <sstream>
#include <string>
#include <type_traits>

namespace SFL::Configurations {

namespace detail {
/**
 * @brief Converts the string representation of a scalar option value to T.
 * @throws ConfigurationException if the string is not a valid T
 */
template<class T>
T convertScalarValue(const std::string& identifier, const std::string& input) {
    if constexpr (std::is_same_v<T, std::string>) {
        return input;
    } else if constexpr (std::is_same_v<T, bool>) {
        if (input == "true" || input == "TRUE" || input == "1") {
            return true;
        }
        if (input == "false" || input == "FALSE" || input == "0") {
            return false;
        }
        throw ConfigurationException("Value " + input + " of " + identifier + " is not a boolean.");
    } else {
        static_assert(std::is_arithmetic_v<T>, "ScalarOption only supports strings, booleans and numbers");
        if constexpr (std::is_unsigned_v<T>) {
            if (!input.empty() && input.front() == '-') {
                throw ConfigurationException("Value " + input + " of " + identifier + " must not be negative.");
            }
        }
        std::istringstream stream(input);
        T result{};
        stream >> result;
        if (stream.fail() || !stream.eof()) {
            throw ConfigurationException("Value " + input + " of " + identifier + " is not a valid number.");
        }
        return result;
    }
}
}// namespace detail

/**
 * @brief This class defines an option that holds a single scalar value, e.g., a number, a boolean or a string.
 * @tparam T type of the scalar value.
 */
template<class T>
class ScalarOption : public TypedBaseOption<T> {
  public:
    /**
     * @brief Constructor to define a ScalarOption with a specific default value.
     * @param name of the ScalarOption.
     * @param defaultValue of the ScalarOption.
     * @param description of the ScalarOption.
     */
    ScalarOption(const std::string& name, T defaultValue, const std::string& description)
        : TypedBaseOption<T>(name, defaultValue, description) {}

    /**
     * @brief Operator to assign a new value as a value of this option.
     * @param value that will be assigned
     * @return Reference to this option.
     */
    ScalarOption<T>& operator=(const T& newValue) {
        this->value = newValue;
        return *this;
    }

    bool operator==(const BaseOption& other) override {
        auto* that = dynamic_cast<const ScalarOption<T>*>(&other);
        return that != nullptr && BaseOption::operator==(other) && this->value == that->value;
    }

    std::string toString() override {
        std::stringstream ss;
        ss << "Name: " << this->name << "\n";
        ss << "Description: " << this->description << "\n";
        ss << "Value: " << std::boolalpha << this->value << "\n";
        ss << "Default Value: " << std::boolalpha << this->defaultValue << "\n";
        return ss.str();
    }

  protected:
    void parseFromString(std::string identifier, std::map<std::string, std::string>& inputParams) override {
        this->value = detail::convertScalarValue<T>(identifier, inputParams[identifier]);
    }
};

using StringOption = ScalarOption<std::string>;
using UIntOption = ScalarOption<uint64_t>;
using BoolOption = ScalarOption<bool>;
using FloatOption = ScalarOption<float>;

}// namespace SFL::Configurations

#endif// SFL_COMMON_INCLUDE_CONFIGURATIONS_SCALAROPTION_HPP_
