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

#include <Runner/CsvRecordReader.hpp>
#include <Util/Logger/LogValue.hpp>
#include <Util/Logger/Logger.hpp>
#include <Util/UtilityFunctions.hpp>
#include <charconv>
#include <fstream>

namespace SFL::Runner {

namespace {
int64_t parseNumber(const std::string& field, const std::string& fieldName, uint64_t lineNumber) {
    int64_t result = 0;
    auto [ptr, errorCode] = std::from_chars(field.data(), field.data() + field.size(), result);
    if (field.empty() || errorCode != std::errc() || ptr != field.data() + field.size()) {
        SFL_THROW_RUNTIME_ERROR("CsvRecordReader: invalid " << fieldName << " [" << field << "] in line " << lineNumber);
    }
    return result;
}
}// namespace

std::vector<InputRecord> CsvRecordReader::readFile(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        SFL_THROW_RUNTIME_ERROR("CsvRecordReader: cannot open input file " << path);
    }
    auto records = read(input);
    SFL_INFO("CsvRecordReader: read " << records.size() << " records from " << path);
    return records;
}

std::vector<InputRecord> CsvRecordReader::read(std::istream& input) {
    std::vector<InputRecord> records;
    std::string line;
    uint64_t lineNumber = 0;
    while (std::getline(input, line)) {
        ++lineNumber;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (Util::trim(line).empty() || Util::startsWith(Util::trim(line), "#")) {
            continue;
        }
        records.emplace_back(parseLine(line, static_cast<RecordOffset>(records.size()), lineNumber));
    }
    return records;
}

InputRecord CsvRecordReader::parseLine(const std::string& line, RecordOffset offset, uint64_t lineNumber) {
    auto fields = Util::splitWithStringDelimiter(line, ",");
    if (fields.size() != 3) {
        SFL_THROW_RUNTIME_ERROR("CsvRecordReader: expected key,value,timestamp but got [" << line << "] in line " << lineNumber);
    }
    auto key = Util::trim(fields[0]);
    InputRecord record{key.empty() ? std::nullopt : std::optional<std::string>(key),
                       parseNumber(Util::trim(fields[1]), "value", lineNumber),
                       parseNumber(Util::trim(fields[2]), "timestamp", lineNumber),
                       offset};
    SFL_TRACE("CsvRecordReader: parsed line " << lineNumber << " key=" << Util::toLogString(record.key)
                                              << " value=" << record.value << " timestamp=" << record.timestamp);
    return record;
}

}// namespace SFL::Runner
