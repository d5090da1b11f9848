// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

// MDG command line tool
// Finds, extracts and patches createMachine configurations in a source file

#include "common/JsonUtils.h"
#include "common/Logger.h"
#include "model/Patch.h"
#include "project/InMemoryProgram.h"
#include "project/MachineProject.h"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

void printUsage(const char *programName) {
    std::cout << "Usage: " << programName << " [options] find <file>\n";
    std::cout << "       " << programName << " [options] extract <file> [index]\n";
    std::cout << "       " << programName << " [options] patch <file> <index> <patches.json>\n\n";
    std::cout << "Commands:\n";
    std::cout << "  find      Print the source ranges of all createMachine calls\n";
    std::cout << "  extract   Print the digraph and extraction errors of each machine\n";
    std::cout << "  patch     Print the text edits for a JSON array of digraph patches\n\n";
    std::cout << "Options:\n";
    std::cout << "  --log-level <level>  trace, debug, info, warn, error or off\n"
              << "                       (default: $MDG_LOG_LEVEL, else warn)\n";
    std::cout << "  --log-dir <dir>      Also write logs to <dir>\n";
}

std::string readFile(const fs::path &filePath) {
    if (!fs::exists(filePath)) {
        throw std::runtime_error("File does not exist: " + filePath.string());
    }

    std::ifstream file(filePath, std::ios::in | std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open file: " + filePath.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

size_t parseIndex(const std::string &value) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("Invalid machine index: " + value);
    }
    return std::stoul(value);
}

std::vector<MDG::Patch> readPatches(const fs::path &filePath) {
    std::string error;
    auto document = MDG::JsonUtils::parseJson(readFile(filePath), &error);
    if (!document) {
        throw std::invalid_argument("Invalid patch file: " + error);
    }
    if (!document->is_array()) {
        throw std::invalid_argument("Patch file must contain a JSON array");
    }
    return document->get<std::vector<MDG::Patch>>();
}

int main(int argc, char **argv) {
    std::vector<std::string> args;
    std::string logLevel;
    std::string logDir;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--log-level" || arg == "--log-dir") && i + 1 < argc) {
            (arg == "--log-level" ? logLevel : logDir) = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            args.push_back(arg);
        }
    }

    if (args.size() < 2) {
        printUsage(argv[0]);
        return 1;
    }

    try {
        if (logDir.empty()) {
            MDG::Logger::initialize();
        } else {
            MDG::Logger::initialize(logDir, true);
        }
        if (!logLevel.empty()) {
            auto level = MDG::parseLogLevel(logLevel);
            if (!level) {
                throw std::invalid_argument("Unknown log level: " + logLevel);
            }
            MDG::Logger::setLevel(*level);
        }

        const std::string &command = args[0];
        const std::string &fileName = args[1];

        auto program = std::make_shared<MDG::InMemoryProgram>();
        program->setFile(fileName, readFile(fileName));
        MDG::MachineProject project(program);

        nlohmann::json output;
        if (command == "find" && args.size() == 2) {
            output = nlohmann::json::array();
            for (const auto &range : project.findMachines(fileName)) {
                output.push_back({{"range", range}, {"location", project.getLinesAndCharactersRange(fileName, range)}});
            }
        } else if (command == "extract" && args.size() <= 3) {
            auto machines = project.getMachinesInFile(fileName);
            if (args.size() == 3) {
                size_t index = parseIndex(args[2]);
                if (index >= machines.size()) {
                    throw std::runtime_error("Machine not found");
                }
                output = machines[index];
            } else {
                output = machines;
            }
        } else if (command == "patch" && args.size() == 4) {
            size_t index = parseIndex(args[2]);
            auto patches = readPatches(args[3]);
            project.getMachinesInFile(fileName);
            output = project.applyPatches(fileName, index, patches);
        } else {
            printUsage(argv[0]);
            return 1;
        }

        std::cout << MDG::JsonUtils::toPrettyString(output) << "\n";
        MDG::Logger::flush();
        return 0;

    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << "\n";
        MDG::Logger::flush();
        return 1;
    }
}
