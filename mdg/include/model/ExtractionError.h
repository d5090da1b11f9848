// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace MDG {

/**
 * @brief Soft error codes accumulated during extraction
 */
enum class ExtractionErrorType {
    STATE_UNHANDLED,
    STATE_PROPERTY_UNHANDLED,
    STATE_PROPERTY_INVALID,
    STATE_TYPE_INVALID,
    STATE_HISTORY_INVALID,
    TRANSITION_PROPERTY_UNHANDLED,
    TRANSITION_TARGET_UNRESOLVED,
    ACTION_UNHANDLED,
    PROPERTY_KEY_UNHANDLED,
    PROPERTY_KEY_NO_ROUNDTRIP,
    PROPERTY_UNHANDLED
};

enum class PropertyKind { COMPUTED, PRIVATE };

struct ExtractionError {
    ExtractionErrorType type;
    std::optional<PropertyKind> propertyKind;  // PROPERTY_KEY_UNHANDLED only

    bool operator==(const ExtractionError &other) const {
        return type == other.type && propertyKind == other.propertyKind;
    }
};

inline const char *toString(ExtractionErrorType type) {
    switch (type) {
    case ExtractionErrorType::STATE_UNHANDLED:
        return "state_unhandled";
    case ExtractionErrorType::STATE_PROPERTY_UNHANDLED:
        return "state_property_unhandled";
    case ExtractionErrorType::STATE_PROPERTY_INVALID:
        return "state_property_invalid";
    case ExtractionErrorType::STATE_TYPE_INVALID:
        return "state_type_invalid";
    case ExtractionErrorType::STATE_HISTORY_INVALID:
        return "state_history_invalid";
    case ExtractionErrorType::TRANSITION_PROPERTY_UNHANDLED:
        return "transition_property_unhandled";
    case ExtractionErrorType::TRANSITION_TARGET_UNRESOLVED:
        return "transition_target_unresolved";
    case ExtractionErrorType::ACTION_UNHANDLED:
        return "action_unhandled";
    case ExtractionErrorType::PROPERTY_KEY_UNHANDLED:
        return "property_key_unhandled";
    case ExtractionErrorType::PROPERTY_KEY_NO_ROUNDTRIP:
        return "property_key_no_roundtrip";
    case ExtractionErrorType::PROPERTY_UNHANDLED:
        return "property_unhandled";
    }
    return "unknown";
}

inline const char *toString(PropertyKind kind) {
    return kind == PropertyKind::COMPUTED ? "computed" : "private";
}

inline void to_json(nlohmann::json &j, const ExtractionError &error) {
    j = nlohmann::json{{"type", toString(error.type)}};
    if (error.propertyKind) {
        j["propertyKind"] = toString(*error.propertyKind);
    }
}

}  // namespace MDG
