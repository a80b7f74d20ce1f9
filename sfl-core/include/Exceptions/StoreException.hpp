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

#ifndef SFL_CORE_INCLUDE_EXCEPTIONS_STOREEXCEPTION_HPP_
#define SFL_CORE_INCLUDE_EXCEPTIONS_STOREEXCEPTION_HPP_

#include <Exceptions/RuntimeException.hpp>
#include <string>

namespace SFL::Exceptions {

/**
 * @brief Base class of all failures raised by a session store.
 * Store failures are fatal for the record that is currently processed and are never handled by the aggregation itself.
 */
class StoreException : public RuntimeException {
  public:
    StoreException(const std::string& storeName, const std::string& message);

    [[nodiscard]] const std::string& getStoreName() const;

  private:
    std::string storeName;
};

/**
 * @brief Exception is raised when the store can not be reached, e.g., it is closed or not yet initialized.
 */
class StoreUnavailableException : public StoreException {
  public:
    StoreUnavailableException(const std::string& storeName, const std::string& message);
};

/**
 * @brief Exception is raised when a read or write operation on an available store failed.
 */
class StoreOperationFailedException : public StoreException {
  public:
    StoreOperationFailedException(const std::string& storeName, const std::string& operation, const std::string& message);

    [[nodiscard]] const std::string& getOperation() const;

  private:
    std::string operation;
};

}// namespace SFL::Exceptions

#endif// SFL_CORE_INCLUDE_EXCEPTIONS_STOREEXCEPTION_HPP_
