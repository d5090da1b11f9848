// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace MDG {

using json = nlohmann::json;

/**
 * @brief JSON helpers shared by the model serializers and the CLI
 *
 * Readers treat a missing key and an explicit null alike. A present value of
 * the wrong type is a malformed document and raises nlohmann::json::type_error.
 */
class JsonUtils {
public:
    /**
     * @brief Parse JSON string into json object with error handling
     * @param jsonString Input JSON string
     * @param errorOut Optional error message output
     * @return Parsed json object or nullopt on failure
     */
    static std::optional<json> parseJson(const std::string &jsonString, std::string *errorOut = nullptr);

    /**
     * @brief Serialize json object to pretty-formatted JSON string
     */
    static std::string toPrettyString(const json &value);

    /**
     * @brief Check if JSON object has key and it's not null
     */
    static bool hasKey(const json &object, const std::string &key);

    static std::optional<std::string> getOptionalString(const json &object, const std::string &key);

    /**
     * @brief String array at key, empty when missing or null
     */
    static std::vector<std::string> getStrings(const json &object, const std::string &key);

    /**
     * @brief Optional string to json (nullopt becomes null)
     */
    static json fromOptional(const std::optional<std::string> &value);
};

}  // namespace MDG
