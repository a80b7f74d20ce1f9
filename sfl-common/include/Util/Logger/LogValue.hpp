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

#ifndef SFL_COMMON_INCLUDE_UTIL_LOGGER_LOGVALUE_HPP_
#define SFL_COMMON_INCLUDE_UTIL_LOGGER_LOGVALUE_HPP_

#include <concepts>
#include <optional>
#include <ostream>
#include <spdlog/fmt/fmt.h>
#include <sstream>
#include <string>

namespace SFL::Util {

template<typename T>
concept OutputStreamable = requires(std::ostream& os, const T& value) {
    { os << value } -> std::convertible_to<std::ostream&>;
};

/**
 * @brief Renders keys and values of arbitrary user types for log messages.
 * Uses fmt if the type is formattable, operator<< if it is streamable and a placeholder otherwise.
 * @tparam T the type of the value
 * @param value
 * @return string representation of value
 */
template<typename T>
std::string toLogString(const T& value) {
    if constexpr (fmt::is_formattable<T>::value) {
        return fmt::format("{}", value);
    } else if constexpr (OutputStreamable<T>) {
        std::stringstream ss;
        ss << value;
        return ss.str();
    } else {
        return "<unprintable>";
    }
}

template<typename T>
std::string toLogString(const std::optional<T>& value) {
    return value.has_value() ? toLogString(value.value()) : "null";
}

}// namespace SFL::Util

#endif// SFL_COMMON_INCLUDE_UTIL_LOGGER_LOGVALUE_HPP_
