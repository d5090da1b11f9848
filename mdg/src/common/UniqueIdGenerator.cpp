// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#include "common/UniqueIdGenerator.h"
#include "common/Logger.h"

namespace MDG {

std::atomic<uint64_t> UniqueIdGenerator::globalCounter_{0};

std::string UniqueIdGenerator::generateNodeId() {
    return generateBaseId("node");
}

std::string UniqueIdGenerator::generateEdgeId() {
    return generateBaseId("edge");
}

std::string UniqueIdGenerator::generateBlockId() {
    return generateBaseId("block");
}

std::string UniqueIdGenerator::generateInlineToken() {
    return generateBaseId("impl");
}

std::string UniqueIdGenerator::generateUniqueId(const std::string &prefix) {
    return generateBaseId(prefix);
}

void UniqueIdGenerator::resetForTesting() {
    LOG_DEBUG("UniqueIdGenerator: Resetting counter for testing");
    globalCounter_.store(0);
}

uint64_t UniqueIdGenerator::getGeneratedCount() {
    return globalCounter_.load();
}

std::string UniqueIdGenerator::generateBaseId(const std::string &prefix) {
    uint64_t count = globalCounter_.fetch_add(1) + 1;
    std::string id = prefix + "_" + std::to_string(count);
    LOG_TRACE("UniqueIdGenerator: Generated ID: {}", id);
    return id;
}

}  // namespace MDG
