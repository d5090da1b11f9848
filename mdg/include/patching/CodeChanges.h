// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#pragma once

#include "model/TextEdit.h"
#include "parsing/ISourceFile.h"
#include "parsing/ISyntaxNode.h"
#include "patching/InsertionElement.h"
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace MDG {

/**
 * @brief Canonical order of state-level properties
 *
 * A property inserted into a state literal goes after the last existing
 * property of lower or equal priority, else before the first one of higher
 * priority. Properties outside this table never serve as anchors.
 */
enum class InsertionPriority {
    ID,
    STATE_TYPE,
    HISTORY,
    INITIAL,
    CONTEXT,
    DESCRIPTION,
    TAGS,
    META,
    ENTRY,
    EXIT,
    INVOKE,
    ON,
    ALWAYS,
    AFTER,
    ON_DONE,
    STATES
};

std::optional<InsertionPriority> getInsertionPriority(const std::string &key);

/**
 * @brief One step of a literal path: an object key or an array index
 *
 * An index step applied to a non-array value selects the value itself when
 * the index is 0 (`invoke: {...}` is `invoke: [{...}]`).
 */
struct PathSegment {
    std::string key;
    std::optional<size_t> index;

    static PathSegment property(const std::string &key);
    static PathSegment element(size_t index);
};

using ObjectPath = std::vector<PathSegment>;

/**
 * @brief Accumulates structural edits of one source file and renders them as TextEdits
 *
 * All node arguments belong to the file the instance was created for. Edits
 * are computed against the unmodified text; several insertions into the same
 * container are merged, and an edit enclosed by a deleted or replaced range
 * is dropped.
 */
class CodeChanges {
public:
    enum class Mode {
        APPEND,  // Existing value becomes (or grows) an array
        SET      // Existing value is replaced
    };

    explicit CodeChanges(std::shared_ptr<ISourceFile> sourceFile);

    /**
     * @brief Quote character of the file's first module specifier, '"' by default
     */
    static char getPreferredQuoteChar(const ISourceFile &sourceFile);

    char getQuote() const { return quote_; }

    /**
     * @brief Put element at path below object, creating missing intermediate objects
     *
     * @throws std::runtime_error if an existing value along the path is not a literal
     *         of the required shape
     */
    void insertAtOptionalObjectPath(const SyntaxNodePtr &object, const ObjectPath &path,
                                    const InsertionElement &element, Mode mode = Mode::APPEND);

    /**
     * @brief Remove the property at path, whether it exists in source or is pending
     */
    void removeAtOptionalObjectPath(const SyntaxNodePtr &object, const ObjectPath &path);

    void insertPropertyBeforeProperty(const SyntaxNodePtr &object, const SyntaxNodePtr &anchor,
                                      const std::string &name, const InsertionElement &element);

    void removeProperty(const SyntaxNodePtr &object, const SyntaxNodePtr &property);
    void removeArrayElement(const SyntaxNodePtr &array, const SyntaxNodePtr &element);
    void replaceNode(const SyntaxNodePtr &node, const InsertionElement &element);
    void replacePropertyName(const SyntaxNodePtr &property, const std::string &name);

    bool empty() const;

    /**
     * @brief Render the accumulated changes, sorted by position
     */
    std::vector<TextEdit> getTextEdits() const;

private:
    struct PendingProperty {
        std::string name;
        InsertionElement value;
        SyntaxNodePtr before;  // Explicit anchor, nullptr for priority placement
    };

    struct ObjectChanges {
        SyntaxNodePtr object;
        std::vector<PendingProperty> insertions;
        std::set<const ISyntaxNode *> removals;
    };

    struct ArrayChanges {
        SyntaxNodePtr array;
        std::vector<InsertionElement> appends;
        std::set<const ISyntaxNode *> removals;
    };

    struct ValueWrap {
        SyntaxNodePtr node;
        std::vector<InsertionElement> appended;
    };

    ObjectChanges &getObjectChanges(const SyntaxNodePtr &object);
    ArrayChanges &getArrayChanges(const SyntaxNodePtr &array);
    PendingProperty *findPendingProperty(const SyntaxNodePtr &object, const std::string &name);
    bool isRemoved(const SyntaxNodePtr &object, const SyntaxNodePtr &property) const;

    void addPendingProperty(const SyntaxNodePtr &object, const std::string &name, InsertionElement value,
                            const SyntaxNodePtr &before = nullptr);
    void appendToValue(const SyntaxNodePtr &value, const InsertionElement &element);

    static InsertionElement buildNested(const ObjectPath &path, size_t from, const InsertionElement &element);
    static void mergeIntoPending(InsertionElement &target, const ObjectPath &path, size_t from,
                                 const InsertionElement &element, Mode mode);
    static void removeFromPending(InsertionElement &target, const ObjectPath &path, size_t from);

    // Rendering
    void renderObjectChanges(const ObjectChanges &changes, std::vector<TextEdit> &edits) const;
    void renderArrayChanges(const ArrayChanges &changes, std::vector<TextEdit> &edits) const;
    void renderRemovals(const std::vector<SyntaxNodePtr> &items, const std::set<const ISyntaxNode *> &removals,
                        std::vector<TextEdit> &edits) const;

    std::string renderProperty(const std::string &name, const InsertionElement &value) const;
    std::string lineIndentAt(size_t position) const;
    bool isFirstOnLine(size_t position) const;
    bool isMultiline(const SyntaxNodePtr &node) const;
    std::string memberIndent(const SyntaxNodePtr &container, const std::vector<SyntaxNodePtr> &liveItems) const;
    size_t commaAfter(size_t position) const;

    std::shared_ptr<ISourceFile> sourceFile_;
    char quote_;
    std::vector<ObjectChanges> objects_;
    std::vector<ArrayChanges> arrays_;
    std::vector<ValueWrap> wraps_;
    std::map<std::pair<size_t, size_t>, std::string> replacements_;
};

}  // namespace MDG
