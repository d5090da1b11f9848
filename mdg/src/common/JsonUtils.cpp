// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#include "common/JsonUtils.h"
#include "common/Logger.h"

namespace MDG {

std::optional<json> JsonUtils::parseJson(const std::string &jsonString, std::string *errorOut) {
    try {
        return json::parse(jsonString);
    } catch (const json::parse_error &e) {
        if (errorOut) {
            *errorOut = e.what();
        }
        LOG_DEBUG("JsonUtils: Failed to parse JSON: {}", e.what());
        return std::nullopt;
    }
}

std::string JsonUtils::toPrettyString(const json &value) {
    return value.dump(2);
}

bool JsonUtils::hasKey(const json &object, const std::string &key) {
    return object.is_object() && object.contains(key) && !object.at(key).is_null();
}

std::optional<std::string> JsonUtils::getOptionalString(const json &object, const std::string &key) {
    if (!hasKey(object, key)) {
        return std::nullopt;
    }
    return object.at(key).get<std::string>();
}

std::vector<std::string> JsonUtils::getStrings(const json &object, const std::string &key) {
    if (!hasKey(object, key)) {
        return {};
    }
    return object.at(key).get<std::vector<std::string>>();
}

json JsonUtils::fromOptional(const std::optional<std::string> &value) {
    if (!value) {
        return nullptr;
    }
    return *value;
}

}  // namespace MDG
