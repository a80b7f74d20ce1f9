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

#include <Exceptions/InvalidSessionWindowException.hpp>
#include <Windowing/SessionWindow.hpp>
#include <algorithm>
#include <sstream>

namespace SFL::Windowing {

SessionWindow::SessionWindow(Timestamp start, Timestamp end) : startTs(start), endTs(end) {
    if (end < start) {
        throw Exceptions::InvalidSessionWindowException(start, end);
    }
}

bool SessionWindow::overlaps(const SessionWindow& other) const { return startTs <= other.endTs && other.startTs <= endTs; }

SessionWindow SessionWindow::merge(const SessionWindow& other) const {
    return {std::min(startTs, other.startTs), std::max(endTs, other.endTs)};
}

std::string SessionWindow::toString() const {
    std::stringstream ss;
    ss << "[" << startTs << "," << endTs << "]";
    return ss.str();
}

std::ostream& operator<<(std::ostream& os, const SessionWindow& window) { return os << window.toString(); }

}// namespace SFL::Windowing
