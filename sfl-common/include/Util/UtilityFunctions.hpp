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

#ifndef SFL_COMMON_INCLUDE_UTIL_UTILITYFUNCTIONS_HPP_
#define SFL_COMMON_INCLUDE_UTIL_UTILITYFUNCTIONS_HPP_

#include <string>
#include <vector>

namespace SFL::Util {

/**
 * @brief removes leading and trailing whitespaces
 */
std::string trim(std::string s);

/**
 * @brief Checks if a string starts with a given string.
 * @param fullString
 * @param start
 * @return true if it starts with the given string, else false
 */
bool startsWith(const std::string& fullString, const std::string& start);

/**
* @brief splits a string given a delimiter into multiple substrings.
* The delimiter is allowed to be a string rather than a char only. Empty fields are kept, i.e., "a,,b," has four fields.
* @param inputString - the string that is to be split
* @param delim - the string that is to be split upon e.g. / or -
* @return the fields of inputString
*/
std::vector<std::string> splitWithStringDelimiter(const std::string& inputString, const std::string& delim);

}// namespace SFL::Util

#endif// SFL_COMMON_INCLUDE_UTIL_UTILITYFUNCTIONS_HPP_
