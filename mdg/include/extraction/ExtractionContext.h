// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#pragma once

#include "model/AstPath.h"
#include "model/DigraphTypes.h"
#include "model/ExtractionError.h"
#include "parsing/ISourceFile.h"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace MDG {

/**
 * @brief Extraction-time mirror of a Node with key-addressable children
 */
struct TreeNode {
    std::string uniqueId;
    std::optional<std::string> parentId;
    std::map<std::string, std::string> children;  // child key -> child node id
};

/**
 * @brief State of one extraction pass
 *
 * Created fresh per extraction and passed by reference through the
 * recursive descent; everything it accumulates is owned here.
 */
struct ExtractionContext {
    std::shared_ptr<ISourceFile> sourceFile;
    Digraph digraph;
    std::vector<ExtractionError> errors;
    std::map<std::string, TreeNode> treeNodes;
    std::map<std::string, std::string> idToNodeIdMap;  // declared `id` -> node id

    // Raw target strings per edge, in extraction order
    std::vector<std::pair<std::string, std::vector<std::string>>> originalTargets;

    AstPath currentAstPath;
    AstPaths astPaths;

    void addError(ExtractionErrorType type) {
        errors.push_back(ExtractionError{type, std::nullopt});
    }
};

/**
 * @brief Scoped push of one locator step onto ExtractionContext::currentAstPath
 */
class AstPathSegmentGuard {
public:
    AstPathSegmentGuard(ExtractionContext &ctx, AstPathStep step) : ctx_(ctx) {
        ctx_.currentAstPath.push_back(step);
    }

    ~AstPathSegmentGuard() {
        ctx_.currentAstPath.pop_back();
    }

    AstPathSegmentGuard(const AstPathSegmentGuard &) = delete;
    AstPathSegmentGuard &operator=(const AstPathSegmentGuard &) = delete;

private:
    ExtractionContext &ctx_;
};

}  // namespace MDG
