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

#ifndef SFL_RUNNER_INCLUDE_RUNNER_CSVRECORDREADER_HPP_
#define SFL_RUNNER_INCLUDE_RUNNER_CSVRECORDREADER_HPP_

#include <Common/Identifiers.hpp>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace SFL::Runner {

/**
 * @brief A single input record of the runner.
 */
struct InputRecord {
    std::optional<std::string> key;
    int64_t value;
    Timestamp timestamp;
    RecordOffset offset;

    bool operator==(const InputRecord& other) const = default;
};

/**
 * @brief Reads records in the format key,value,timestamp, one record per line.
 * An empty key denotes a record without key. Empty lines and lines starting with # are skipped.
 * The offset of a record is its position among all records of the input.
 */
class CsvRecordReader {
  public:
    /**
     * @brief Reads all records of a file
     * @param path the csv file
     * @return the records in file order
     * @throws RuntimeException if the file can not be opened or a line is malformed
     */
    static std::vector<InputRecord> readFile(const std::filesystem::path& path);

    /**
     * @brief Reads all records of a stream
     * @param input
     * @return the records in stream order
     * @throws RuntimeException if a line is malformed
     */
    static std::vector<InputRecord> read(std::istream& input);

    /**
     * @brief Parses a single line
     * @param line the line without line break
     * @param offset the offset of the record
     * @param lineNumber the line number for error messages
     * @return the record
     */
    static InputRecord parseLine(const std::string& line, RecordOffset offset, uint64_t lineNumber);
};

}// namespace SFL::Runner

#endif// SFL_RUNNER_INCLUDE_RUNNER_CSVRECORDREADER_HPP_
