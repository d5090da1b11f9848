// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#include "project/InMemoryProgram.h"
#include "common/Logger.h"

#include <stdexcept>

namespace MDG {

InMemoryProgram::InMemoryProgram(std::shared_ptr<ISourceParser> parser) : parser_(std::move(parser)) {
    if (!parser_) {
        throw std::invalid_argument("InMemoryProgram requires a parser");
    }
}

void InMemoryProgram::setFile(const std::string &fileName, const std::string &text) {
    files_[fileName] = parser_->parseContent(fileName, text);
    ++version_;
    LOG_DEBUG("InMemoryProgram: Updated {} (version {})", fileName, version_);
}

bool InMemoryProgram::loadFile(const std::string &path) {
    auto sourceFile = parser_->parseFile(path);
    if (!sourceFile) {
        LOG_ERROR("InMemoryProgram: Failed to load {}: {}", path, parser_->getLastError());
        return false;
    }
    files_[path] = sourceFile;
    ++version_;
    return true;
}

void InMemoryProgram::removeFile(const std::string &fileName) {
    if (files_.erase(fileName) > 0) {
        ++version_;
    }
}

std::shared_ptr<ISourceFile> InMemoryProgram::getSourceFile(const std::string &fileName) const {
    auto it = files_.find(fileName);
    return it == files_.end() ? nullptr : it->second;
}

}  // namespace MDG
