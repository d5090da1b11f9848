// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#pragma once

#include "parsing/ISourceFile.h"
#include <cstdint>
#include <memory>
#include <string>

namespace MDG {

/**
 * @brief Snapshot of the host's source files
 *
 * Editor hosts swap in a new program after each edit; MachineProject
 * re-resolves cached machines against whichever program is current.
 */
class IProgram {
public:
    virtual ~IProgram() = default;

    /**
     * @brief Parsed file by name
     * @return nullptr if the program does not contain the file
     */
    virtual std::shared_ptr<ISourceFile> getSourceFile(const std::string &fileName) const = 0;

    /**
     * @brief Monotonic version, bumped whenever the file set or any text changes
     */
    virtual uint64_t getVersion() const = 0;
};

}  // namespace MDG
