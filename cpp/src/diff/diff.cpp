// ==============================================================================
// diff.cpp - Типы изменений и набор правил
// ==============================================================================

#include <jsondiff/diff.hpp>

namespace jsondiff::diff {

// ============================================================================
// DiffType
// ============================================================================

const char* symbol(DiffType type) {
    switch (type) {
    case DiffType::Added:
        return "+";
    case DiffType::Removed:
        return "-";
    case DiffType::Modified:
        return "~";
    case DiffType::ArrayItemChanged:
        return "!";
    case DiffType::ArrayReordered:
        return "*";
    case DiffType::Ignored:
        return "?";
    }
    return "?";
}

const char* readable_text(DiffType type) {
    switch (type) {
    case DiffType::Added:
        return "ADDED";
    case DiffType::Removed:
        return "REMOVED";
    case DiffType::Modified:
        return "MODIFIED";
    case DiffType::ArrayItemChanged:
        return "ARRAY_ITEM_CHANGED";
    case DiffType::ArrayReordered:
        return "ARRAY_REORDERED";
    case DiffType::Ignored:
        return "IGNORED";
    }
    return "UNKNOWN";
}

const char* description(DiffType type) {
    switch (type) {
    case DiffType::Added:
        return "Value is present in the right document only";
    case DiffType::Removed:
        return "Value is present in the left document only";
    case DiffType::Modified:
        return "Value is present in both documents but differs";
    case DiffType::ArrayItemChanged:
        return "Element of an unordered array has changed";
    case DiffType::ArrayReordered:
        return "Elements of an unordered array are in a different order";
    case DiffType::Ignored:
        return "Path is excluded by an ignore rule";
    }
    return "";
}

// ============================================================================
// RuleSet
// ============================================================================

namespace {

bool compile_all(const std::vector<std::string>& texts, std::vector<path::PathPattern>& out,
                 path::PatternError& error) {
    out.reserve(texts.size());
    for (const auto& text : texts) {
        auto compiled = path::compile(text);
        if (!compiled) {
            error = compiled.error;
            return false;
        }
        out.push_back(std::move(compiled.pattern));
    }
    return true;
}

}  // namespace

RuleSetResult RuleSet::from(const std::vector<std::string>& ignore,
                            const std::vector<std::string>& unordered,
                            bool show_nested_differences, bool identify_array_item_changes) {
    RuleSetResult result;

    RuleSet rules;
    if (!compile_all(ignore, rules.ignore_, result.error)) {
        return result;
    }
    if (!compile_all(unordered, rules.unordered_, result.error)) {
        return result;
    }
    rules.show_nested_differences_ = show_nested_differences;
    rules.identify_array_item_changes_ = identify_array_item_changes;

    result.ok = true;
    result.rules = std::move(rules);
    return result;
}

bool RuleSet::is_ignored(const path::JsonPath& p) const {
    return path::any_matches(ignore_, p);
}

bool RuleSet::is_unordered(const path::JsonPath& p) const {
    return path::any_matches(unordered_, p);
}

}  // namespace jsondiff::diff
