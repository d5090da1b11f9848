// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#pragma once

#include "model/DigraphTypes.h"
#include "model/ExtractionError.h"
#include "model/Patch.h"
#include "model/ProjectMachineState.h"
#include "model/TextEdit.h"
#include "parsing/ISourceFile.h"
#include "project/IProgram.h"
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace MDG {

/**
 * @brief Extraction result of one machine
 */
struct MachineResult {
    std::optional<Digraph> digraph;
    std::vector<ExtractionError> errors;
};

void to_json(nlohmann::json &j, const MachineResult &result);

/**
 * @brief Program shared by a project and its machines
 */
struct ProjectHost {
    std::shared_ptr<IProgram> program;
};

/**
 * @brief One `createMachine` call, identified by file and ordinal
 *
 * The call site is re-resolved against the host's current program on every
 * request, so the instance survives program updates.
 */
class ProjectMachine {
public:
    ProjectMachine(std::shared_ptr<ProjectHost> host, const std::string &fileName, size_t machineIndex);

    /**
     * @brief Re-extract the machine from the current program
     * @throws std::runtime_error "File not found" / "Machine not found"
     */
    MachineResult getDigraph();

    /**
     * @brief Apply patches to the last extracted state
     * @throws std::runtime_error "Machine not found" without a prior extraction
     */
    std::vector<TextEdit> applyPatches(const std::vector<Patch> &patches);

    const std::string &getFileName() const { return fileName_; }
    size_t getMachineIndex() const { return machineIndex_; }
    const std::optional<ProjectMachineState> &getState() const { return state_; }

private:
    std::pair<std::shared_ptr<ISourceFile>, SyntaxNodePtr> findOwnCreateMachineCall() const;

    std::shared_ptr<ProjectHost> host_;
    std::string fileName_;
    size_t machineIndex_;
    std::optional<ProjectMachineState> state_;
};

}  // namespace MDG
