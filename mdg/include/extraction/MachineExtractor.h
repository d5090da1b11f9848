// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#pragma once

#include "model/ProjectMachineState.h"
#include "parsing/ISourceFile.h"
#include "parsing/ISyntaxNode.h"
#include <memory>
#include <vector>

namespace MDG {

/**
 * @brief Locates `createMachine` calls and runs a full extraction pass
 */
class MachineExtractor {
public:
    /**
     * @brief Calls named `createMachine` (bare or as a member), in source order
     */
    static std::vector<SyntaxNodePtr> findCreateMachineCalls(const ISourceFile &sourceFile);

    /**
     * @brief Configuration literal of a call (its first argument), nullptr when absent
     */
    static SyntaxNodePtr getConfigRoot(const SyntaxNodePtr &call);

    /**
     * @brief Extract the machine of one call and resolve its targets
     */
    static ProjectMachineState extractProjectMachine(const std::shared_ptr<ISourceFile> &sourceFile,
                                                     const SyntaxNodePtr &call);
};

}  // namespace MDG
