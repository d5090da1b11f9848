// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#pragma once

#include "parsing/ISourceParser.h"
#include "project/IProgram.h"
#include <map>
#include <memory>
#include <string>

namespace MDG {

/**
 * @brief IProgram backed by texts held in memory, parsed on every update
 */
class InMemoryProgram : public IProgram {
public:
    explicit InMemoryProgram(std::shared_ptr<ISourceParser> parser = ISourceParser::create());

    /**
     * @brief Add or replace a file
     */
    void setFile(const std::string &fileName, const std::string &text);

    /**
     * @brief Read a file from disk and add it under its path
     * @return false if the file can't be read
     */
    bool loadFile(const std::string &path);

    void removeFile(const std::string &fileName);

    std::shared_ptr<ISourceFile> getSourceFile(const std::string &fileName) const override;
    uint64_t getVersion() const override { return version_; }

private:
    std::shared_ptr<ISourceParser> parser_;
    std::map<std::string, std::shared_ptr<ISourceFile>> files_;
    uint64_t version_ = 0;
};

}  // namespace MDG
