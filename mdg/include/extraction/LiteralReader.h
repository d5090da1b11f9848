// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#pragma once

#include "extraction/ExtractionContext.h"
#include "model/AstPath.h"
#include "model/ExtractionError.h"
#include "parsing/ISyntaxNode.h"
#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace MDG {

/**
 * @brief Decoding of literal syntax and object-literal property lookup
 *
 * Functions taking an error list pointer record key errors there; pass
 * nullptr to look properties up without reporting.
 */
class LiteralReader {
public:
    /**
     * @brief Read the key of a property assignment
     *
     * Identifiers, string and template literals yield their text; numeric
     * keys yield their source text (PROPERTY_KEY_NO_ROUNDTRIP when it differs
     * from the printed value); computed keys yield the literal they wrap.
     *
     * @return Key, or nullopt for computed non-literal, private and other names
     */
    static std::optional<std::string> getPropertyKey(std::vector<ExtractionError> *errors, const ISyntaxNode &property);

    static bool isUndefined(const SyntaxNodePtr &node);
    static bool isStringLiteralLike(const SyntaxNodePtr &node);
    static bool isObjectLiteral(const SyntaxNodePtr &node);
    static bool isArrayLiteral(const SyntaxNodePtr &node);
    static bool isPropertyAssignment(const SyntaxNodePtr &node);

    /**
     * @brief Decode a fully literal expression to JSON
     * @return Value, nullopt when any part is not a literal
     */
    static std::optional<nlohmann::json> getJsonValue(std::vector<ExtractionError> *errors, const SyntaxNodePtr &node);

    /**
     * @brief Decode an object literal to a JSON object
     *
     * Members that are not property assignments and keys that can't be read
     * are skipped.
     */
    static std::optional<nlohmann::json> getJsonObject(std::vector<ExtractionError> *errors,
                                                       const SyntaxNodePtr &object);

    /**
     * @brief Find the last property assignment with the given key
     */
    static SyntaxNodePtr findProperty(std::vector<ExtractionError> *errors, const SyntaxNodePtr &object,
                                      const std::string &key);

    /**
     * @brief Find the first property assignment with the given key
     *
     * Matches the occurrence state literal extraction reads under duplicate keys.
     */
    static SyntaxNodePtr findFirstProperty(const SyntaxNodePtr &object, const std::string &key);

    /**
     * @brief Index of the first property assignment declaring each readable key
     */
    static std::map<std::string, size_t> getFirstDeclarations(const SyntaxNodePtr &object);

    /**
     * @brief Visit property assignments in reverse order, first-declared key wins
     *
     * Other member shapes record PROPERTY_UNHANDLED. The callback runs with a
     * property(i) step pushed onto the current locator.
     */
    static void forEachStaticProperty(ExtractionContext &ctx, const SyntaxNodePtr &object,
                                      const std::function<void(const SyntaxNodePtr &, const std::string &)> &callback);

    /**
     * @brief Map the elements of an array literal, or the single value otherwise
     *
     * Array elements are visited with an element(i) step pushed onto the
     * current locator.
     */
    template <typename T>
    static std::vector<T> mapMaybeArrayElements(ExtractionContext &ctx, const SyntaxNodePtr &expression,
                                                const std::function<T(const SyntaxNodePtr &, size_t)> &callback) {
        std::vector<T> results;
        if (isArrayLiteral(expression)) {
            const auto &elements = expression->getElements();
            for (size_t i = 0; i < elements.size(); ++i) {
                AstPathSegmentGuard guard(ctx, AstPathStep::element(i));
                results.push_back(callback(elements[i], i));
            }
            return results;
        }
        results.push_back(callback(expression, 0));
        return results;
    }

    /**
     * @brief Resolve a locator starting at the configuration root literal
     * @throws std::runtime_error("Invalid node") when a step doesn't match the tree
     */
    static SyntaxNodePtr findNodeByAstPath(const SyntaxNodePtr &root, const AstPath &path);

private:
    static std::optional<std::string> getLiteralText(std::vector<ExtractionError> *errors, const SyntaxNodePtr &node);
};

}  // namespace MDG
