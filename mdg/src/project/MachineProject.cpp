// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#include "project/MachineProject.h"
#include "common/Logger.h"
#include "extraction/MachineExtractor.h"

#include <stdexcept>

namespace MDG {

MachineProject::MachineProject(std::shared_ptr<IProgram> program)
    : host_(std::make_shared<ProjectHost>(ProjectHost{std::move(program)})) {}

std::vector<Range> MachineProject::findMachines(const std::string &fileName) const {
    auto sourceFile = host_->program ? host_->program->getSourceFile(fileName) : nullptr;
    if (!sourceFile) {
        return {};
    }

    std::vector<Range> ranges;
    for (const auto &call : MachineExtractor::findCreateMachineCalls(*sourceFile)) {
        ranges.push_back(Range{call->getStart(), call->getEnd()});
    }
    return ranges;
}

std::vector<MachineResult> MachineProject::getMachinesInFile(const std::string &fileName) {
    auto sourceFile = host_->program ? host_->program->getSourceFile(fileName) : nullptr;
    if (!sourceFile) {
        LOG_DEBUG("MachineProject: {} is not part of the program", fileName);
        return {};
    }

    size_t count = MachineExtractor::findCreateMachineCalls(*sourceFile).size();
    auto &machines = projectMachines_[fileName];

    // Ordinals past the current call count are gone; extracted state of the rest is kept
    if (machines.size() > count) {
        machines.erase(machines.begin() + static_cast<std::ptrdiff_t>(count), machines.end());
    }
    for (size_t i = machines.size(); i < count; ++i) {
        machines.emplace_back(host_, fileName, i);
    }

    std::vector<MachineResult> results;
    results.reserve(machines.size());
    for (auto &machine : machines) {
        results.push_back(machine.getDigraph());
    }
    LOG_DEBUG("MachineProject: {} machines in {}", results.size(), fileName);
    return results;
}

std::vector<TextEdit> MachineProject::applyPatches(const std::string &fileName, size_t machineIndex,
                                                   const std::vector<Patch> &patches) {
    auto it = projectMachines_.find(fileName);
    if (it == projectMachines_.end() || machineIndex >= it->second.size()) {
        LOG_ERROR("MachineProject: No extracted machine #{} in {}", machineIndex, fileName);
        throw std::runtime_error("Machine not found");
    }
    return it->second[machineIndex].applyPatches(patches);
}

void MachineProject::updateProgram(std::shared_ptr<IProgram> program) {
    host_->program = std::move(program);
    LOG_DEBUG("MachineProject: Program updated (version {})", host_->program ? host_->program->getVersion() : 0);
}

LineAndCharacter MachineProject::getLineAndCharacterOfPosition(const std::string &fileName, size_t position) const {
    return requireSourceFile(fileName)->getLineAndCharacterOfPosition(position);
}

LinesAndCharactersRange MachineProject::getLinesAndCharactersRange(const std::string &fileName,
                                                                   const Range &range) const {
    auto sourceFile = requireSourceFile(fileName);
    return LinesAndCharactersRange{sourceFile->getLineAndCharacterOfPosition(range.start),
                                   sourceFile->getLineAndCharacterOfPosition(range.end)};
}

std::shared_ptr<ISourceFile> MachineProject::requireSourceFile(const std::string &fileName) const {
    auto sourceFile = host_->program ? host_->program->getSourceFile(fileName) : nullptr;
    if (!sourceFile) {
        LOG_ERROR("MachineProject: File {} not found", fileName);
        throw std::runtime_error("File not found");
    }
    return sourceFile;
}

}  // namespace MDG
