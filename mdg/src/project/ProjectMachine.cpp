// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#include "project/ProjectMachine.h"
#include "common/Logger.h"
#include "extraction/MachineExtractor.h"
#include "patching/PatchEngine.h"

#include <stdexcept>

namespace MDG {

void to_json(nlohmann::json &j, const MachineResult &result) {
    j = nlohmann::json{{"digraph", result.digraph ? nlohmann::json(*result.digraph) : nlohmann::json(nullptr)},
                       {"errors", result.errors}};
}

ProjectMachine::ProjectMachine(std::shared_ptr<ProjectHost> host, const std::string &fileName, size_t machineIndex)
    : host_(std::move(host)), fileName_(fileName), machineIndex_(machineIndex) {}

MachineResult ProjectMachine::getDigraph() {
    auto [sourceFile, call] = findOwnCreateMachineCall();
    state_ = MachineExtractor::extractProjectMachine(sourceFile, call);
    return MachineResult{state_->digraph, state_->errors};
}

std::vector<TextEdit> ProjectMachine::applyPatches(const std::vector<Patch> &patches) {
    if (!state_) {
        LOG_ERROR("ProjectMachine: {}#{} was never extracted", fileName_, machineIndex_);
        throw std::runtime_error("Machine not found");
    }
    auto [sourceFile, call] = findOwnCreateMachineCall();
    PatchEngine engine(sourceFile, call, *state_);
    return engine.applyPatches(patches);
}

std::pair<std::shared_ptr<ISourceFile>, SyntaxNodePtr> ProjectMachine::findOwnCreateMachineCall() const {
    auto sourceFile = host_->program ? host_->program->getSourceFile(fileName_) : nullptr;
    if (!sourceFile) {
        LOG_ERROR("ProjectMachine: File {} not found", fileName_);
        throw std::runtime_error("File not found");
    }
    auto calls = MachineExtractor::findCreateMachineCalls(*sourceFile);
    if (machineIndex_ >= calls.size()) {
        LOG_ERROR("ProjectMachine: {} has no machine #{}", fileName_, machineIndex_);
        throw std::runtime_error("Machine not found");
    }
    return {sourceFile, calls[machineIndex_]};
}

}  // namespace MDG
