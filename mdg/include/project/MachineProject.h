// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#pragma once

#include "model/Patch.h"
#include "model/SourceRange.h"
#include "model/TextEdit.h"
#include "project/IProgram.h"
#include "project/ProjectMachine.h"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace MDG {

/**
 * @brief Entry point for editor hosts: discovers machines, extracts their
 *        digraphs and turns digraph patches into source edits
 *
 * Machines are cached per file in call order. A cached machine keeps its last
 * extraction so that patches can be applied against it; the call site itself
 * is re-resolved in the current program on every access.
 *
 * Usage:
 * @code
 * auto program = std::make_shared<InMemoryProgram>();
 * program->setFile("machine.ts", text);
 * MachineProject project(program);
 * auto machines = project.getMachinesInFile("machine.ts");
 * auto edits = project.applyPatches("machine.ts", 0, patches);
 * @endcode
 */
class MachineProject {
public:
    explicit MachineProject(std::shared_ptr<IProgram> program);

    /**
     * @brief Ranges of the `createMachine` calls of a file, empty for unknown files
     */
    std::vector<Range> findMachines(const std::string &fileName) const;

    /**
     * @brief Extract every machine of a file, empty for unknown files
     */
    std::vector<MachineResult> getMachinesInFile(const std::string &fileName);

    /**
     * @brief Apply patches to a machine extracted by getMachinesInFile
     * @throws std::runtime_error "Machine not found" if the machine was never extracted
     */
    std::vector<TextEdit> applyPatches(const std::string &fileName, size_t machineIndex,
                                       const std::vector<Patch> &patches);

    /**
     * @brief Switch to a new program snapshot
     */
    void updateProgram(std::shared_ptr<IProgram> program);

    /**
     * @throws std::runtime_error "File not found" for unknown files
     */
    LineAndCharacter getLineAndCharacterOfPosition(const std::string &fileName, size_t position) const;

    /**
     * @throws std::runtime_error "File not found" for unknown files
     */
    LinesAndCharactersRange getLinesAndCharactersRange(const std::string &fileName, const Range &range) const;

private:
    std::shared_ptr<ISourceFile> requireSourceFile(const std::string &fileName) const;

    std::shared_ptr<ProjectHost> host_;
    std::map<std::string, std::vector<ProjectMachine>> projectMachines_;
};

}  // namespace MDG
