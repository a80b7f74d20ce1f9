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

#ifndef SFL_COMMON_INCLUDE_CONFIGURATIONS_TYPEDBASEOPTION_HPP_
#define SFL_COMMON_INCLUDE_CONFIGURATIONS_TYPEDBASEOPTION_HPP_

#include <Configurations/BaseOption.hpp>

namespace SFL::Configurations {

/**
 * @brief This class is the basis of options that hold a value of a specific type T.
 * @tparam T the type of the value
 */
template<class T>
class TypedBaseOption : public BaseOption {
  public:
    TypedBaseOption(const std::string& name, const std::string& description);

    /**
     * @brief Constructor to create a new option with a default value.
     * @param name of the option.
     * @param defaultValue of the option.
     * @param description of the option.
     */
    TypedBaseOption(const std::string& name, T defaultValue, const std::string& description);

    /**
     * @brief Operator to directly access the value of this option.
     * @return Returns an object of the option type T.
     */
    operator T() const { return this->value; }

    /**
     * @brief Clears the option and sets the value to the default value.
     */
    void clear() override;

    [[nodiscard]] T getValue() const;

    [[nodiscard]] T getDefaultValue() const;

    void setValue(T newValue);

  protected:
    T value;
    T defaultValue;
};

template<class T>
TypedBaseOption<T>::TypedBaseOption(const std::string& name, const std::string& description)
    : BaseOption(name, description), value(), defaultValue() {}

template<class T>
TypedBaseOption<T>::TypedBaseOption(const std::string& name, T defaultValue, const std::string& description)
    : BaseOption(name, description), value(defaultValue), defaultValue(defaultValue) {}

template<class T>
void TypedBaseOption<T>::clear() {
    this->value = defaultValue;
}

template<class T>
T TypedBaseOption<T>::getValue() const {
    return value;
}

template<class T>
T TypedBaseOption<T>::getDefaultValue() const {
    return defaultValue;
}

template<class T>
void TypedBaseOption<T>::setValue(T newValue) {
    this->value = newValue;
}

}// namespace SFL::Configurations

#endif// SFL_COMMON_INCLUDE_CONFIGURATIONS_TYPEDBASEOPTION_HPP_
