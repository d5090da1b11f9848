// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#include "patching/CodeChanges.h"
#include "common/LogUtils.h"
#include "common/Logger.h"
#include "common/StringUtils.h"
#include "extraction/LiteralReader.h"

#include <algorithm>
#include <stdexcept>

namespace MDG {

namespace {

const std::map<std::string, InsertionPriority> &priorityTable() {
    static const std::map<std::string, InsertionPriority> table = {
        {"id", InsertionPriority::ID},
        {"type", InsertionPriority::STATE_TYPE},
        {"history", InsertionPriority::HISTORY},
        {"initial", InsertionPriority::INITIAL},
        {"context", InsertionPriority::CONTEXT},
        {"description", InsertionPriority::DESCRIPTION},
        {"tags", InsertionPriority::TAGS},
        {"meta", InsertionPriority::META},
        {"entry", InsertionPriority::ENTRY},
        {"exit", InsertionPriority::EXIT},
        {"invoke", InsertionPriority::INVOKE},
        {"on", InsertionPriority::ON},
        {"always", InsertionPriority::ALWAYS},
        {"after", InsertionPriority::AFTER},
        {"onDone", InsertionPriority::ON_DONE},
        {"states", InsertionPriority::STATES},
    };
    return table;
}

std::optional<InsertionPriority> getMemberPriority(const SyntaxNodePtr &member) {
    if (!member || !member->getName()) {
        return std::nullopt;
    }
    auto key = LiteralReader::getPropertyKey(nullptr, *member);
    return key ? getInsertionPriority(*key) : std::nullopt;
}

// Unknown priorities sort last
int priorityRank(const std::string &name) {
    auto priority = getInsertionPriority(name);
    return priority ? static_cast<int>(*priority) : static_cast<int>(InsertionPriority::STATES) + 1;
}

bool contains(const Range &outer, const Range &inner) {
    return outer.start <= inner.start && inner.end <= outer.end;
}

}  // namespace

std::optional<InsertionPriority> getInsertionPriority(const std::string &key) {
    const auto &table = priorityTable();
    auto it = table.find(key);
    if (it == table.end()) {
        return std::nullopt;
    }
    return it->second;
}

PathSegment PathSegment::property(const std::string &key) {
    return PathSegment{key, std::nullopt};
}

PathSegment PathSegment::element(size_t index) {
    return PathSegment{"", index};
}

CodeChanges::CodeChanges(std::shared_ptr<ISourceFile> sourceFile)
    : sourceFile_(std::move(sourceFile)), quote_(getPreferredQuoteChar(*sourceFile_)) {}

char CodeChanges::getPreferredQuoteChar(const ISourceFile &sourceFile) {
    const auto &specifiers = sourceFile.getModuleSpecifiers();
    if (!specifiers.empty()) {
        std::string text = specifiers.front()->getText();
        if (!text.empty() && (text[0] == '\'' || text[0] == '"')) {
            return text[0];
        }
    }
    return '"';
}

// ============================================================================
// Recording
// ============================================================================

void CodeChanges::insertAtOptionalObjectPath(const SyntaxNodePtr &object, const ObjectPath &path,
                                             const InsertionElement &element, Mode mode) {
    if (path.empty()) {
        throw std::invalid_argument("Insertion path must not be empty");
    }

    SyntaxNodePtr current = object;
    for (size_t i = 0; i < path.size(); ++i) {
        const PathSegment &segment = path[i];
        bool last = i + 1 == path.size();

        if (segment.index) {
            if (LiteralReader::isArrayLiteral(current) && *segment.index < current->getElements().size()) {
                current = current->getElements()[*segment.index];
            } else if (!LiteralReader::isArrayLiteral(current) && *segment.index == 0) {
                // Single value stands for a one-element array
            } else {
                LOG_ERROR("CodeChanges: Index {} out of range", *segment.index);
                throw std::runtime_error("Invalid insertion path");
            }
            if (last) {
                throw std::invalid_argument("Insertion path must end with a property key");
            }
            continue;
        }

        if (!LiteralReader::isObjectLiteral(current)) {
            LOG_ERROR("CodeChanges: Cannot insert '{}' into a non-object value", Log::sanitize(segment.key));
            throw std::runtime_error("Unsupported insertion: '" + segment.key + "' parent is not an object literal");
        }

        SyntaxNodePtr property = LiteralReader::findFirstProperty(current, segment.key);
        if (property && !isRemoved(current, property)) {
            if (!last) {
                current = property->getInitializer();
                continue;
            }
            if (mode == Mode::SET) {
                replaceNode(property->getInitializer(), element);
            } else {
                appendToValue(property->getInitializer(), element);
            }
            return;
        }

        if (PendingProperty *pending = findPendingProperty(current, segment.key)) {
            mergeIntoPending(pending->value, path, i + 1, element, mode);
            return;
        }

        addPendingProperty(current, segment.key, buildNested(path, i + 1, element));
        return;
    }
}

void CodeChanges::removeAtOptionalObjectPath(const SyntaxNodePtr &object, const ObjectPath &path) {
    SyntaxNodePtr current = object;
    for (size_t i = 0; i < path.size(); ++i) {
        const PathSegment &segment = path[i];
        bool last = i + 1 == path.size();

        if (segment.index) {
            if (LiteralReader::isArrayLiteral(current) && *segment.index < current->getElements().size()) {
                current = current->getElements()[*segment.index];
            } else if (LiteralReader::isArrayLiteral(current) || *segment.index != 0) {
                return;
            }
            continue;
        }

        if (!LiteralReader::isObjectLiteral(current)) {
            return;
        }

        if (PendingProperty *pending = findPendingProperty(current, segment.key)) {
            if (last) {
                auto &insertions = getObjectChanges(current).insertions;
                insertions.erase(std::remove_if(insertions.begin(), insertions.end(),
                                                [&segment](const PendingProperty &p) { return p.name == segment.key; }),
                                 insertions.end());
            } else {
                removeFromPending(pending->value, path, i + 1);
            }
        }

        SyntaxNodePtr property = LiteralReader::findFirstProperty(current, segment.key);
        if (!property) {
            return;
        }
        if (last) {
            removeProperty(current, property);
            return;
        }
        current = property->getInitializer();
    }
}

void CodeChanges::insertPropertyBeforeProperty(const SyntaxNodePtr &object, const SyntaxNodePtr &anchor,
                                               const std::string &name, const InsertionElement &element) {
    if (PendingProperty *pending = findPendingProperty(object, name)) {
        pending->value = element;
        pending->before = anchor;
        return;
    }
    addPendingProperty(object, name, element, anchor);
}

void CodeChanges::removeProperty(const SyntaxNodePtr &object, const SyntaxNodePtr &property) {
    Range range{property->getStart(), property->getEnd()};
    for (auto it = replacements_.begin(); it != replacements_.end();) {
        if (contains(range, Range{it->first.first, it->first.second})) {
            it = replacements_.erase(it);
        } else {
            ++it;
        }
    }
    getObjectChanges(object).removals.insert(property.get());
}

void CodeChanges::removeArrayElement(const SyntaxNodePtr &array, const SyntaxNodePtr &element) {
    getArrayChanges(array).removals.insert(element.get());
}

void CodeChanges::replaceNode(const SyntaxNodePtr &node, const InsertionElement &element) {
    Range range{node->getStart(), node->getEnd()};

    // A replaced value revives its property
    for (auto &changes : objects_) {
        for (const auto &member : changes.object->getProperties()) {
            if (changes.removals.count(member.get()) && member->getInitializer() == node) {
                changes.removals.erase(member.get());
            }
        }
    }

    replacements_[{range.start, range.end}] = element.render(quote_);
}

void CodeChanges::replacePropertyName(const SyntaxNodePtr &property, const std::string &name) {
    SyntaxNodePtr nameNode = property->getName();
    if (!nameNode) {
        throw std::runtime_error("Invalid node");
    }
    replacements_[{nameNode->getStart(), nameNode->getEnd()}] = safePropertyName(name, quote_);
}

bool CodeChanges::empty() const {
    return objects_.empty() && arrays_.empty() && wraps_.empty() && replacements_.empty();
}

CodeChanges::ObjectChanges &CodeChanges::getObjectChanges(const SyntaxNodePtr &object) {
    for (auto &changes : objects_) {
        if (changes.object == object) {
            return changes;
        }
    }
    objects_.push_back(ObjectChanges{object, {}, {}});
    return objects_.back();
}

CodeChanges::ArrayChanges &CodeChanges::getArrayChanges(const SyntaxNodePtr &array) {
    for (auto &changes : arrays_) {
        if (changes.array == array) {
            return changes;
        }
    }
    arrays_.push_back(ArrayChanges{array, {}, {}});
    return arrays_.back();
}

CodeChanges::PendingProperty *CodeChanges::findPendingProperty(const SyntaxNodePtr &object, const std::string &name) {
    for (auto &changes : objects_) {
        if (changes.object != object) {
            continue;
        }
        for (auto it = changes.insertions.rbegin(); it != changes.insertions.rend(); ++it) {
            if (it->name == name) {
                return &*it;
            }
        }
    }
    return nullptr;
}

bool CodeChanges::isRemoved(const SyntaxNodePtr &object, const SyntaxNodePtr &property) const {
    for (const auto &changes : objects_) {
        if (changes.object == object) {
            return changes.removals.count(property.get()) > 0;
        }
    }
    return false;
}

void CodeChanges::addPendingProperty(const SyntaxNodePtr &object, const std::string &name, InsertionElement value,
                                     const SyntaxNodePtr &before) {
    getObjectChanges(object).insertions.push_back(PendingProperty{name, std::move(value), before});
}

void CodeChanges::appendToValue(const SyntaxNodePtr &value, const InsertionElement &element) {
    if (LiteralReader::isUndefined(value)) {
        replaceNode(value, element);
        return;
    }
    if (LiteralReader::isArrayLiteral(value)) {
        getArrayChanges(value).appends.push_back(element);
        return;
    }
    for (auto &wrap : wraps_) {
        if (wrap.node == value) {
            wrap.appended.push_back(element);
            return;
        }
    }
    wraps_.push_back(ValueWrap{value, {element}});
}

InsertionElement CodeChanges::buildNested(const ObjectPath &path, size_t from, const InsertionElement &element) {
    if (from == path.size()) {
        return element;
    }
    const PathSegment &segment = path[from];
    if (segment.index) {
        if (*segment.index != 0) {
            throw std::runtime_error("Invalid insertion path");
        }
        return buildNested(path, from + 1, element);
    }
    return InsertionElement::object({{segment.key, buildNested(path, from + 1, element)}});
}

void CodeChanges::mergeIntoPending(InsertionElement &target, const ObjectPath &path, size_t from,
                                   const InsertionElement &element, Mode mode) {
    if (from == path.size()) {
        if (mode == Mode::SET || target.getKind() == InsertionElement::Kind::UNDEFINED) {
            target = element;
        } else if (target.getKind() == InsertionElement::Kind::ARRAY) {
            target.addElement(element);
        } else {
            target = InsertionElement::array({target, element});
        }
        return;
    }

    const PathSegment &segment = path[from];
    if (segment.index) {
        if (target.getKind() == InsertionElement::Kind::ARRAY) {
            if (*segment.index >= target.getElements().size()) {
                throw std::runtime_error("Invalid insertion path");
            }
            mergeIntoPending(target.getElement(*segment.index), path, from + 1, element, mode);
        } else if (*segment.index == 0) {
            mergeIntoPending(target, path, from + 1, element, mode);
        } else {
            throw std::runtime_error("Invalid insertion path");
        }
        return;
    }

    if (target.getKind() != InsertionElement::Kind::OBJECT) {
        throw std::runtime_error("Unsupported insertion: '" + segment.key + "' parent is not an object literal");
    }
    if (InsertionElement *child = target.findProperty(segment.key)) {
        mergeIntoPending(*child, path, from + 1, element, mode);
    } else {
        target.addProperty(segment.key, buildNested(path, from + 1, element));
    }
}

void CodeChanges::removeFromPending(InsertionElement &target, const ObjectPath &path, size_t from) {
    if (from >= path.size() || target.getKind() != InsertionElement::Kind::OBJECT) {
        return;
    }
    const PathSegment &segment = path[from];
    if (segment.index) {
        if (*segment.index == 0) {
            removeFromPending(target, path, from + 1);
        }
        return;
    }
    if (from + 1 == path.size()) {
        target.removeProperty(segment.key);
    } else if (InsertionElement *child = target.findProperty(segment.key)) {
        removeFromPending(*child, path, from + 1);
    }
}

// ============================================================================
// Rendering
// ============================================================================

std::vector<TextEdit> CodeChanges::getTextEdits() const {
    std::vector<TextEdit> edits;

    for (const auto &changes : objects_) {
        renderObjectChanges(changes, edits);
    }
    for (const auto &changes : arrays_) {
        renderArrayChanges(changes, edits);
    }
    const std::string &fileName = sourceFile_->getFileName();
    for (const auto &wrap : wraps_) {
        std::string text = "[" + wrap.node->getText();
        for (const auto &element : wrap.appended) {
            text += ", " + element.render(quote_);
        }
        text += "]";
        edits.push_back(TextEdit::replace(fileName, Range{wrap.node->getStart(), wrap.node->getEnd()}, text));
    }
    for (const auto &[range, text] : replacements_) {
        edits.push_back(TextEdit::replace(fileName, Range{range.first, range.second}, text));
    }

    // Drop edits swallowed by a deletion or replacement
    std::vector<TextEdit> result;
    for (size_t i = 0; i < edits.size(); ++i) {
        const TextEdit &edit = edits[i];
        bool enclosed = false;
        for (size_t j = 0; j < edits.size() && !enclosed; ++j) {
            const TextEdit &other = edits[j];
            if (i == j || other.type == TextEdit::Type::INSERT) {
                continue;
            }
            if (edit.type == TextEdit::Type::INSERT) {
                enclosed = other.range.start < edit.range.start && edit.range.start < other.range.end;
            } else {
                enclosed = contains(other.range, edit.range) && !(other.range == edit.range);
            }
        }
        if (!enclosed) {
            result.push_back(edit);
        }
    }

    std::stable_sort(result.begin(), result.end(), [](const TextEdit &a, const TextEdit &b) {
        if (a.range.start != b.range.start) {
            return a.range.start < b.range.start;
        }
        return a.type == TextEdit::Type::INSERT && b.type != TextEdit::Type::INSERT;
    });

    LOG_DEBUG("CodeChanges: {} edits for {}", result.size(), fileName);
    return result;
}

void CodeChanges::renderObjectChanges(const ObjectChanges &changes, std::vector<TextEdit> &edits) const {
    const std::string &fileName = sourceFile_->getFileName();
    const SyntaxNodePtr &object = changes.object;
    const auto &members = object->getProperties();

    std::vector<SyntaxNodePtr> live;
    for (const auto &member : members) {
        if (!changes.removals.count(member.get())) {
            live.push_back(member);
        }
    }

    std::vector<const PendingProperty *> insertions;
    for (const auto &pending : changes.insertions) {
        insertions.push_back(&pending);
    }
    std::stable_sort(insertions.begin(), insertions.end(), [](const PendingProperty *a, const PendingProperty *b) {
        return priorityRank(a->name) < priorityRank(b->name);
    });

    if (live.empty()) {
        if (insertions.empty() && changes.removals.empty()) {
            return;
        }
        std::string text = "{}";
        if (!insertions.empty()) {
            std::vector<std::string> parts;
            for (const auto *pending : insertions) {
                parts.push_back(renderProperty(pending->name, pending->value));
            }
            if (isMultiline(object)) {
                std::string indent = lineIndentAt(object->getStart());
                std::string inner = indent + "  ";
                text = "{\n" + inner + join(parts, ",\n" + inner) + "\n" + indent + "}";
            } else {
                text = "{ " + join(parts, ", ") + " }";
            }
        }
        edits.push_back(TextEdit::replace(fileName, Range{object->getStart(), object->getEnd()}, text));
        return;
    }

    renderRemovals(members, changes.removals, edits);

    if (insertions.empty()) {
        return;
    }

    // Group insertions by anchor; true = after the anchor
    std::vector<std::pair<std::pair<const ISyntaxNode *, bool>, std::vector<const PendingProperty *>>> groups;
    auto addToGroup = [&groups](const ISyntaxNode *anchor, bool after, const PendingProperty *pending) {
        for (auto &group : groups) {
            if (group.first.first == anchor && group.first.second == after) {
                group.second.push_back(pending);
                return;
            }
        }
        groups.push_back({{anchor, after}, {pending}});
    };

    for (const auto *pending : insertions) {
        if (pending->before && std::find(live.begin(), live.end(), pending->before) != live.end()) {
            addToGroup(pending->before.get(), false, pending);
            continue;
        }

        auto priority = getInsertionPriority(pending->name);
        if (priority) {
            SyntaxNodePtr lastLowerOrEqual;
            SyntaxNodePtr firstHigher;
            for (const auto &member : live) {
                auto memberPriority = getMemberPriority(member);
                if (!memberPriority) {
                    continue;
                }
                if (*memberPriority <= *priority) {
                    lastLowerOrEqual = member;
                } else if (!firstHigher) {
                    firstHigher = member;
                }
            }
            if (lastLowerOrEqual) {
                addToGroup(lastLowerOrEqual.get(), true, pending);
                continue;
            }
            if (firstHigher) {
                addToGroup(firstHigher.get(), false, pending);
                continue;
            }
        }
        addToGroup(live.back().get(), true, pending);
    }

    bool multiline = isMultiline(object);
    std::string separator = multiline ? ",\n" + memberIndent(object, live) : ", ";
    for (const auto &[anchor, group] : groups) {
        std::string text;
        if (anchor.second) {
            for (const auto *pending : group) {
                text += separator + renderProperty(pending->name, pending->value);
            }
            edits.push_back(TextEdit::insert(fileName, anchor.first->getEnd(), text));
        } else {
            for (const auto *pending : group) {
                text += renderProperty(pending->name, pending->value) + separator;
            }
            edits.push_back(TextEdit::insert(fileName, anchor.first->getStart(), text));
        }
    }
}

void CodeChanges::renderArrayChanges(const ArrayChanges &changes, std::vector<TextEdit> &edits) const {
    const std::string &fileName = sourceFile_->getFileName();
    const SyntaxNodePtr &array = changes.array;
    const auto &elements = array->getElements();

    std::vector<SyntaxNodePtr> live;
    for (const auto &element : elements) {
        if (!changes.removals.count(element.get())) {
            live.push_back(element);
        }
    }

    if (live.empty()) {
        std::vector<std::string> parts;
        for (const auto &element : changes.appends) {
            parts.push_back(element.render(quote_));
        }
        edits.push_back(
            TextEdit::replace(fileName, Range{array->getStart(), array->getEnd()}, "[" + join(parts, ", ") + "]"));
        return;
    }

    renderRemovals(elements, changes.removals, edits);

    if (changes.appends.empty()) {
        return;
    }
    std::string separator = isMultiline(array) ? ",\n" + memberIndent(array, live) : ", ";
    std::string text;
    for (const auto &element : changes.appends) {
        text += separator + element.render(quote_);
    }
    edits.push_back(TextEdit::insert(fileName, live.back()->getEnd(), text));
}

void CodeChanges::renderRemovals(const std::vector<SyntaxNodePtr> &items,
                                 const std::set<const ISyntaxNode *> &removals, std::vector<TextEdit> &edits) const {
    const std::string &fileName = sourceFile_->getFileName();

    for (size_t i = 0; i < items.size(); ++i) {
        if (!removals.count(items[i].get())) {
            continue;
        }
        size_t j = i;
        while (j + 1 < items.size() && removals.count(items[j + 1].get())) {
            ++j;
        }

        if (j + 1 < items.size()) {
            // Run followed by a live item: take the separators with it
            edits.push_back(TextEdit::remove(fileName, Range{items[i]->getStart(), items[j + 1]->getStart()}));
        } else if (i > 0) {
            // Trailing run: drop the separator before it, keep any trailing comma
            edits.push_back(TextEdit::remove(fileName, Range{commaAfter(items[i - 1]->getEnd()), items[j]->getEnd()}));
        }
        i = j;
    }
}

std::string CodeChanges::renderProperty(const std::string &name, const InsertionElement &value) const {
    return safePropertyName(name, quote_) + ": " + value.render(quote_);
}

std::string CodeChanges::lineIndentAt(size_t position) const {
    const std::string &text = sourceFile_->getText();
    size_t lineStart = text.rfind('\n', position == 0 ? 0 : position - 1);
    lineStart = (lineStart == std::string::npos || position == 0) ? 0 : lineStart + 1;
    size_t end = lineStart;
    while (end < text.size() && (text[end] == ' ' || text[end] == '\t')) {
        ++end;
    }
    return text.substr(lineStart, end - lineStart);
}

bool CodeChanges::isFirstOnLine(size_t position) const {
    const std::string &text = sourceFile_->getText();
    for (size_t i = position; i > 0; --i) {
        char c = text[i - 1];
        if (c == '\n') {
            return true;
        }
        if (c != ' ' && c != '\t' && c != '\r') {
            return false;
        }
    }
    return true;
}

bool CodeChanges::isMultiline(const SyntaxNodePtr &node) const {
    const std::string &text = sourceFile_->getText();
    size_t newline = text.find('\n', node->getStart());
    return newline != std::string::npos && newline < node->getEnd();
}

std::string CodeChanges::memberIndent(const SyntaxNodePtr &container, const std::vector<SyntaxNodePtr> &liveItems) const {
    if (!liveItems.empty() && isFirstOnLine(liveItems.front()->getStart())) {
        return lineIndentAt(liveItems.front()->getStart());
    }
    return lineIndentAt(container->getStart()) + "  ";
}

size_t CodeChanges::commaAfter(size_t position) const {
    const std::string &text = sourceFile_->getText();
    size_t i = position;
    while (i < text.size() && (text[i] == ' ' || text[i] == '\t' || text[i] == '\n' || text[i] == '\r')) {
        ++i;
    }
    return i < text.size() && text[i] == ',' ? i : position;
}

}  // namespace MDG
