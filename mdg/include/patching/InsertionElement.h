// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace MDG {

/**
 * @brief Literal to be synthesized into the configuration source
 *
 * Nested objects and arrays always render on a single line; the enclosing
 * container decides whether the property itself goes on its own line.
 */
class InsertionElement {
public:
    enum class Kind { STRING, BOOLEAN, UNDEFINED, OBJECT, ARRAY, RAW };

    static InsertionElement string(const std::string &value, bool allowMultiline = false);
    static InsertionElement boolean(bool value);
    static InsertionElement undefined();
    static InsertionElement object(std::vector<std::pair<std::string, InsertionElement>> properties = {});
    static InsertionElement array(std::vector<InsertionElement> elements);

    /**
     * @brief Existing source text carried over verbatim
     */
    static InsertionElement raw(const std::string &text);

    Kind getKind() const { return kind_; }

    const std::vector<std::pair<std::string, InsertionElement>> &getProperties() const { return properties_; }
    const std::vector<InsertionElement> &getElements() const { return elements_; }

    /**
     * @throws std::out_of_range if index is past the last element
     */
    InsertionElement &getElement(size_t index) { return elements_.at(index); }

    /**
     * @brief Property of an OBJECT element, last wins; nullptr when absent
     */
    InsertionElement *findProperty(const std::string &name);

    void addProperty(const std::string &name, InsertionElement value);
    void removeProperty(const std::string &name);
    void addElement(InsertionElement element);

    /**
     * @brief Render as ECMAScript source
     * @param quote Preferred string quote character
     */
    std::string render(char quote) const;

private:
    Kind kind_ = Kind::UNDEFINED;
    std::string text_;
    bool flag_ = false;
    std::vector<std::pair<std::string, InsertionElement>> properties_;
    std::vector<InsertionElement> elements_;
};

}  // namespace MDG
