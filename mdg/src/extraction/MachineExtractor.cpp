// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#include "extraction/MachineExtractor.h"
#include "common/Logger.h"
#include "extraction/ExtractionContext.h"
#include "extraction/StateExtractor.h"
#include "extraction/TargetResolver.h"

namespace MDG {

std::vector<SyntaxNodePtr> MachineExtractor::findCreateMachineCalls(const ISourceFile &sourceFile) {
    return sourceFile.findCallExpressions("createMachine");
}

SyntaxNodePtr MachineExtractor::getConfigRoot(const SyntaxNodePtr &call) {
    if (!call || call->getElements().empty()) {
        return nullptr;
    }
    return call->getElements().front();
}

ProjectMachineState MachineExtractor::extractProjectMachine(const std::shared_ptr<ISourceFile> &sourceFile,
                                                            const SyntaxNodePtr &call) {
    ExtractionContext ctx;
    ctx.sourceFile = sourceFile;

    ctx.digraph.root = StateExtractor::extractState(ctx, getConfigRoot(call), std::nullopt, DEFAULT_ROOT_ID);
    TargetResolver::resolveTargets(ctx);

    LOG_DEBUG("MachineExtractor: Extracted {} nodes, {} edges, {} blocks with {} errors from {}",
              ctx.digraph.nodes.size(), ctx.digraph.edges.size(), ctx.digraph.blocks.size(), ctx.errors.size(),
              sourceFile->getFileName());

    ProjectMachineState state;
    state.digraph = std::move(ctx.digraph);
    state.errors = std::move(ctx.errors);
    state.astPaths = std::move(ctx.astPaths);
    for (const auto &[declaredId, nodeId] : ctx.idToNodeIdMap) {
        state.idMap[nodeId] = declaredId;
    }
    state.sourceFingerprint = fingerprintSource(sourceFile->getText());
    return state;
}

}  // namespace MDG
