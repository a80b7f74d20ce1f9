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

#include <Configurations/SessionWindowConfiguration.hpp>
#include <Runner/CsvRecordReader.hpp>
#include <Runner/PartitionedSessionRunner.hpp>
#include <Util/Logger/Logger.hpp>
#include <filesystem>
#include <iostream>
#include <map>
#include <string>

const std::string usage = "Usage: sfl-session-runner --inputFile=<records.csv> [--inactivityGap=<ms>] [--gracePeriod=<ms>]\n"
                          "       [--sendOldValues=<true|false>] [--numberOfPartitions=<n>] [--storeName=<name>]\n"
                          "       [--logLevel=<LOG_NONE|LOG_ERROR|LOG_WARNING|LOG_INFO|LOG_DEBUG|LOG_TRACE>]";

int main(int argc, const char* argv[]) {
    // Iterating through the arguments
    std::map<std::string, std::string> commandLineParams;
    for (int i = 1; i < argc; ++i) {
        auto argument = std::string(argv[i]);
        if (argument == "--help" || argument == "-h") {
            std::cout << usage << std::endl;
            return 0;
        }
        auto separator = argument.find('=');
        if (separator == std::string::npos) {
            std::cerr << "Error: argument " << argument << " is not of the form --name=value\n" << usage << std::endl;
            return -1;
        }
        commandLineParams.insert_or_assign(argument.substr(0, separator), argument.substr(separator + 1));
    }

    auto configuration = SFL::Configurations::SessionWindowConfiguration::create();
    try {
        configuration->overwriteConfigWithCommandLineInput(commandLineParams);
    } catch (std::exception& exception) {
        std::cerr << "Error: " << exception.what() << "\n" << usage << std::endl;
        return -1;
    }

    SFL::Logger::setupLogging("sfl-session-runner.log", configuration->logLevel.getValue());
    SFL_INFO("SessionWindowRunner: started with configuration\n" << configuration->toString());

    auto inputFile = std::filesystem::path(configuration->inputFile.getValue());
    if (inputFile.empty() || !std::filesystem::exists(inputFile)) {
        std::cerr << "Error: no input file provided or the file does not exist!\n" << usage << std::endl;
        SFL::Logger::getInstance().shutdown();
        return -1;
    }

    int exitCode = 0;
    try {
        auto records = SFL::Runner::CsvRecordReader::readFile(inputFile);
        SFL::Runner::PartitionedSessionRunner runner(configuration);
        auto result = runner.run(records, inputFile.stem().string());
        for (const auto& changes : result.changesPerPartition) {
            for (const auto& change : changes) {
                std::cout << change << "\n";
            }
        }
        std::cout << "dropped records: " << result.numberOfDroppedRecords << std::endl;
    } catch (std::exception& exception) {
        SFL_ERROR("SessionWindowRunner: run failed: " << exception.what());
        std::cerr << "Error: " << exception.what() << std::endl;
        exitCode = -1;
    }
    SFL::Logger::getInstance().shutdown();
    return exitCode;
}
