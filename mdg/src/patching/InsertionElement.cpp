// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#include "patching/InsertionElement.h"
#include "common/StringUtils.h"

#include <algorithm>
#include <stdexcept>

namespace MDG {

InsertionElement InsertionElement::string(const std::string &value, bool allowMultiline) {
    InsertionElement element;
    element.kind_ = Kind::STRING;
    element.text_ = value;
    element.flag_ = allowMultiline;
    return element;
}

InsertionElement InsertionElement::boolean(bool value) {
    InsertionElement element;
    element.kind_ = Kind::BOOLEAN;
    element.flag_ = value;
    return element;
}

InsertionElement InsertionElement::undefined() {
    return InsertionElement();
}

InsertionElement InsertionElement::object(std::vector<std::pair<std::string, InsertionElement>> properties) {
    InsertionElement element;
    element.kind_ = Kind::OBJECT;
    element.properties_ = std::move(properties);
    return element;
}

InsertionElement InsertionElement::array(std::vector<InsertionElement> elements) {
    InsertionElement element;
    element.kind_ = Kind::ARRAY;
    element.elements_ = std::move(elements);
    return element;
}

InsertionElement InsertionElement::raw(const std::string &text) {
    InsertionElement element;
    element.kind_ = Kind::RAW;
    element.text_ = text;
    return element;
}

InsertionElement *InsertionElement::findProperty(const std::string &name) {
    for (auto it = properties_.rbegin(); it != properties_.rend(); ++it) {
        if (it->first == name) {
            return &it->second;
        }
    }
    return nullptr;
}

void InsertionElement::addProperty(const std::string &name, InsertionElement value) {
    if (kind_ != Kind::OBJECT) {
        throw std::logic_error("addProperty on a non-object insertion element");
    }
    properties_.emplace_back(name, std::move(value));
}

void InsertionElement::removeProperty(const std::string &name) {
    properties_.erase(std::remove_if(properties_.begin(), properties_.end(),
                                     [&name](const auto &property) { return property.first == name; }),
                      properties_.end());
}

void InsertionElement::addElement(InsertionElement element) {
    if (kind_ != Kind::ARRAY) {
        throw std::logic_error("addElement on a non-array insertion element");
    }
    elements_.push_back(std::move(element));
}

std::string InsertionElement::render(char quote) const {
    switch (kind_) {
    case Kind::STRING:
        return safeStringLiteral(text_, quote, flag_);
    case Kind::BOOLEAN:
        return flag_ ? "true" : "false";
    case Kind::UNDEFINED:
        return "undefined";
    case Kind::RAW:
        return text_;
    case Kind::OBJECT: {
        if (properties_.empty()) {
            return "{}";
        }
        std::vector<std::string> parts;
        parts.reserve(properties_.size());
        for (const auto &[name, value] : properties_) {
            parts.push_back(safePropertyName(name, quote) + ": " + value.render(quote));
        }
        return "{ " + join(parts, ", ") + " }";
    }
    case Kind::ARRAY: {
        std::vector<std::string> parts;
        parts.reserve(elements_.size());
        for (const auto &element : elements_) {
            parts.push_back(element.render(quote));
        }
        return "[" + join(parts, ", ") + "]";
    }
    }
    return "undefined";
}

}  // namespace MDG
