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

#ifndef SFL_CORE_INCLUDE_WINDOWING_WINDOWED_HPP_
#define SFL_CORE_INCLUDE_WINDOWING_WINDOWED_HPP_

#include <Util/Logger/LogValue.hpp>
#include <Windowing/SessionWindow.hpp>
#include <ostream>
#include <utility>

namespace SFL::Windowing {

/**
 * @brief The key of a session in the session store, i.e., the record key together with the session window.
 * @tparam Key type of the record key
 */
template<typename Key>
class Windowed {
  public:
    Windowed(Key key, SessionWindow window) : recordKey(std::move(key)), sessionWindow(window) {}

    [[nodiscard]] const Key& key() const { return recordKey; }

    [[nodiscard]] const SessionWindow& window() const { return sessionWindow; }

    bool operator==(const Windowed<Key>& other) const = default;

  private:
    Key recordKey;
    SessionWindow sessionWindow;
};

template<typename Key>
std::ostream& operator<<(std::ostream& os, const Windowed<Key>& windowed) {
    return os << Util::toLogString(windowed.key()) << "@" << windowed.window();
}

}// namespace SFL::Windowing

#endif// SFL_CORE_INCLUDE_WINDOWING_WINDOWED_HPP_
