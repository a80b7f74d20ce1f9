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

#include <Exceptions/StoreException.hpp>

namespace SFL::Exceptions {

StoreException::StoreException(const std::string& storeName, const std::string& message)
    : RuntimeException("Store [" + storeName + "]: " + message), storeName(storeName) {}

const std::string& StoreException::getStoreName() const { return storeName; }

StoreUnavailableException::StoreUnavailableException(const std::string& storeName, const std::string& message)
    : StoreException(storeName, "StoreUnavailableException: " + message) {}

StoreOperationFailedException::StoreOperationFailedException(const std::string& storeName,
                                                             const std::string& operation,
                                                             const std::string& message)
    : StoreException(storeName, "StoreOperationFailedException during " + operation + ": " + message), operation(operation) {}

const std::string& StoreOperationFailedException::getOperation() const { return operation; }

}// namespace SFL::Exceptions
