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

#include <Util/UtilityFunctions.hpp>
#include <algorithm>
#include <cctype>

namespace SFL {

std::string Util::trim(std::string str) {
    auto not_space = [](char c) {
        return isspace(static_cast<unsigned char>(c)) == 0;
    };
    // trim left
    str.erase(str.begin(), std::find_if(str.begin(), str.end(), not_space));
    // trim right
    str.erase(std::find_if(str.rbegin(), str.rend(), not_space).base(), str.end());
    return str;
}

bool Util::startsWith(const std::string& fullString, const std::string& start) { return fullString.rfind(start, 0) == 0; }

std::vector<std::string> Util::splitWithStringDelimiter(const std::string& inputString, const std::string& delim) {
    std::vector<std::string> elems;
    if (delim.empty()) {
        elems.push_back(inputString);
        return elems;
    }
    size_t begin = 0;
    size_t pos = 0;
    while ((pos = inputString.find(delim, begin)) != std::string::npos) {
        elems.push_back(inputString.substr(begin, pos - begin));
        begin = pos + delim.length();
    }
    elems.push_back(inputString.substr(begin));
    return elems;
}

}// namespace SFL
