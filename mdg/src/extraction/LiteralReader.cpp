// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#include "extraction/LiteralReader.h"
#include "common/Logger.h"

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>

namespace MDG {

std::optional<std::string> LiteralReader::getLiteralText(std::vector<ExtractionError> *errors,
                                                         const SyntaxNodePtr &node) {
    if (!node) {
        return std::nullopt;
    }
    if (isStringLiteralLike(node)) {
        return node->getLiteralText();
    }
    if (node->getKind() == SyntaxKind::NumericLiteral) {
        // Source text is the key; the printed value may differ (`0x10`, `1e3`, huge integers)
        std::string text = node->getText();
        if (text != node->getLiteralText() && errors) {
            errors->push_back(ExtractionError{ExtractionErrorType::PROPERTY_KEY_NO_ROUNDTRIP, std::nullopt});
        }
        return text;
    }
    return std::nullopt;
}

std::optional<std::string> LiteralReader::getPropertyKey(std::vector<ExtractionError> *errors,
                                                         const ISyntaxNode &property) {
    SyntaxNodePtr name = property.getName();
    if (!name) {
        return std::nullopt;
    }

    switch (name->getKind()) {
    case SyntaxKind::Identifier:
        return name->getLiteralText();
    case SyntaxKind::ComputedPropertyName: {
        auto text = getLiteralText(errors, name->getInitializer());
        if (text) {
            return text;
        }
        if (errors) {
            errors->push_back(ExtractionError{ExtractionErrorType::PROPERTY_KEY_UNHANDLED, PropertyKind::COMPUTED});
        }
        return std::nullopt;
    }
    case SyntaxKind::PrivateIdentifier:
        if (errors) {
            errors->push_back(ExtractionError{ExtractionErrorType::PROPERTY_KEY_UNHANDLED, PropertyKind::PRIVATE});
        }
        return std::nullopt;
    default:
        return getLiteralText(errors, name);
    }
}

bool LiteralReader::isUndefined(const SyntaxNodePtr &node) {
    return node && node->getKind() == SyntaxKind::Identifier && node->getLiteralText() == "undefined";
}

bool LiteralReader::isStringLiteralLike(const SyntaxNodePtr &node) {
    return node &&
           (node->getKind() == SyntaxKind::StringLiteral || node->getKind() == SyntaxKind::NoSubstitutionTemplate);
}

bool LiteralReader::isObjectLiteral(const SyntaxNodePtr &node) {
    return node && node->getKind() == SyntaxKind::ObjectLiteral;
}

bool LiteralReader::isArrayLiteral(const SyntaxNodePtr &node) {
    return node && node->getKind() == SyntaxKind::ArrayLiteral;
}

bool LiteralReader::isPropertyAssignment(const SyntaxNodePtr &node) {
    return node && node->getKind() == SyntaxKind::PropertyAssignment;
}

std::optional<nlohmann::json> LiteralReader::getJsonValue(std::vector<ExtractionError> *errors,
                                                          const SyntaxNodePtr &node) {
    if (!node) {
        return std::nullopt;
    }

    switch (node->getKind()) {
    case SyntaxKind::StringLiteral:
    case SyntaxKind::NoSubstitutionTemplate:
        return nlohmann::json(node->getLiteralText());
    case SyntaxKind::NumericLiteral: {
        double value = std::strtod(node->getLiteralText().c_str(), nullptr);
        if (std::trunc(value) == value && std::fabs(value) < 9007199254740992.0) {
            return nlohmann::json(static_cast<int64_t>(value));
        }
        return nlohmann::json(value);
    }
    case SyntaxKind::TrueKeyword:
        return nlohmann::json(true);
    case SyntaxKind::FalseKeyword:
        return nlohmann::json(false);
    case SyntaxKind::NullKeyword:
        return nlohmann::json(nullptr);
    case SyntaxKind::ArrayLiteral: {
        nlohmann::json array = nlohmann::json::array();
        for (const auto &element : node->getElements()) {
            auto value = getJsonValue(errors, element);
            if (!value) {
                return std::nullopt;
            }
            array.push_back(*value);
        }
        return array;
    }
    case SyntaxKind::ObjectLiteral:
        return getJsonObject(errors, node);
    default:
        return std::nullopt;
    }
}

std::optional<nlohmann::json> LiteralReader::getJsonObject(std::vector<ExtractionError> *errors,
                                                           const SyntaxNodePtr &object) {
    nlohmann::json result = nlohmann::json::object();
    for (const auto &property : object->getProperties()) {
        if (!isPropertyAssignment(property)) {
            continue;
        }
        auto key = getPropertyKey(errors, *property);
        if (!key) {
            continue;
        }
        auto value = getJsonValue(errors, property->getInitializer());
        if (!value) {
            return std::nullopt;
        }
        result[*key] = *value;
    }
    return result;
}

SyntaxNodePtr LiteralReader::findProperty(std::vector<ExtractionError> *errors, const SyntaxNodePtr &object,
                                          const std::string &key) {
    if (!isObjectLiteral(object)) {
        return nullptr;
    }
    const auto &properties = object->getProperties();
    for (size_t i = properties.size(); i-- > 0;) {
        const auto &property = properties[i];
        if (isPropertyAssignment(property) && getPropertyKey(errors, *property) == key) {
            return property;
        }
    }
    return nullptr;
}

SyntaxNodePtr LiteralReader::findFirstProperty(const SyntaxNodePtr &object, const std::string &key) {
    if (!isObjectLiteral(object)) {
        return nullptr;
    }
    for (const auto &property : object->getProperties()) {
        if (isPropertyAssignment(property) && getPropertyKey(nullptr, *property) == key) {
            return property;
        }
    }
    return nullptr;
}

std::map<std::string, size_t> LiteralReader::getFirstDeclarations(const SyntaxNodePtr &object) {
    std::map<std::string, size_t> first;
    const auto &properties = object->getProperties();
    for (size_t i = 0; i < properties.size(); ++i) {
        if (!isPropertyAssignment(properties[i])) {
            continue;
        }
        if (auto key = getPropertyKey(nullptr, *properties[i])) {
            first.emplace(*key, i);
        }
    }
    return first;
}

void LiteralReader::forEachStaticProperty(
    ExtractionContext &ctx, const SyntaxNodePtr &object,
    const std::function<void(const SyntaxNodePtr &, const std::string &)> &callback) {
    const auto first = getFirstDeclarations(object);
    const auto &properties = object->getProperties();

    for (size_t i = properties.size(); i-- > 0;) {
        const auto &property = properties[i];
        if (!isPropertyAssignment(property)) {
            ctx.addError(ExtractionErrorType::PROPERTY_UNHANDLED);
            continue;
        }

        // Key errors are recorded by getPropertyKey
        auto key = getPropertyKey(&ctx.errors, *property);
        if (!key || first.at(*key) != i) {
            continue;
        }

        AstPathSegmentGuard guard(ctx, AstPathStep::property(i));
        callback(property, *key);
    }
}

SyntaxNodePtr LiteralReader::findNodeByAstPath(const SyntaxNodePtr &root, const AstPath &path) {
    SyntaxNodePtr current = root;
    for (const auto &step : path) {
        if (step.kind == AstPathStep::Kind::PROPERTY) {
            if (!isObjectLiteral(current) || step.index >= current->getProperties().size()) {
                LOG_ERROR("LiteralReader: Invalid locator {}", toString(path));
                throw std::runtime_error("Invalid node");
            }
            const auto &property = current->getProperties()[step.index];
            if (!isPropertyAssignment(property)) {
                LOG_ERROR("LiteralReader: Locator {} crosses a non-assignment member", toString(path));
                throw std::runtime_error("Invalid node");
            }
            current = property->getInitializer();
        } else {
            if (!isArrayLiteral(current) || step.index >= current->getElements().size()) {
                LOG_ERROR("LiteralReader: Invalid locator {}", toString(path));
                throw std::runtime_error("Invalid node");
            }
            current = current->getElements()[step.index];
        }
    }

    if (!current) {
        throw std::runtime_error("Invalid node");
    }
    return current;
}

}  // namespace MDG
