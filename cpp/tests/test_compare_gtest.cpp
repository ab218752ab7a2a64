// ==============================================================================
// test_compare_gtest.cpp - Тесты движка структурного сравнения (GoogleTest)
// ==============================================================================
//
// Покрываются:
// - классификация Added / Removed / Modified
// - приоритет ignore, политика Ignored (на каждом совпавшем пути)
// - неупорядоченные массивы: перестановки, остатки, пары, вложенные отличия
// - identify_array_item_changes = false
// - номера строк в записях
// - свойства: тождественность, симметрия, инвариантность к перестановке
//
// ==============================================================================

#include "jsondiff/diff.hpp"

#include <algorithm>
#include <cstdint>
#include <gtest/gtest.h>
#include <map>
#include <string>
#include <vector>

namespace jsondiff::diff::test {

namespace {

RuleSet make_rules(const std::vector<std::string>& ignore = {},
                   const std::vector<std::string>& unordered = {}, bool show_nested = false,
                   bool identify = true) {
    auto result = RuleSet::from(ignore, unordered, show_nested, identify);
    EXPECT_TRUE(result.ok) << result.error.format();
    return result.rules;
}

std::vector<DiffEntry> run(const std::string& left, const std::string& right,
                           const RuleSet& rules = RuleSet()) {
    auto result = compare_text(left, right, rules);
    EXPECT_TRUE(result.ok) << result.error.format();
    return result.result.entries;
}

Value json(const std::string& text) {
    auto result = parser::parse(text);
    EXPECT_TRUE(result.ok) << result.error.format();
    return result.document.value;
}

std::vector<DiffEntry> non_ignored(const std::vector<DiffEntry>& entries) {
    std::vector<DiffEntry> out;
    for (const auto& e : entries) {
        if (e.type != DiffType::Ignored) {
            out.push_back(e);
        }
    }
    return out;
}

}  // namespace

// ==============================================================================
// DiffType
// ==============================================================================

TEST(DiffTypeTest, SymbolsAndTags) {
    EXPECT_STREQ(symbol(DiffType::Added), "+");
    EXPECT_STREQ(symbol(DiffType::Removed), "-");
    EXPECT_STREQ(symbol(DiffType::Modified), "~");
    EXPECT_STREQ(symbol(DiffType::ArrayItemChanged), "!");
    EXPECT_STREQ(symbol(DiffType::ArrayReordered), "*");
    EXPECT_STREQ(symbol(DiffType::Ignored), "?");

    EXPECT_STREQ(readable_text(DiffType::ArrayItemChanged), "ARRAY_ITEM_CHANGED");
    EXPECT_STREQ(readable_text(DiffType::ArrayReordered), "ARRAY_REORDERED");
    EXPECT_STRNE(description(DiffType::Ignored), "");
}

// ==============================================================================
// RuleSet
// ==============================================================================

TEST(RuleSetTest, Default_Toggles) {
    RuleSet rules;
    EXPECT_FALSE(rules.show_nested_differences());
    EXPECT_TRUE(rules.identify_array_item_changes());
    EXPECT_TRUE(rules.ignore().empty());
}

TEST(RuleSetTest, From_InvalidPattern_ReturnsFirstError) {
    auto result = RuleSet::from({"$.ok"}, {"$.tags", "tags", "$["});
    ASSERT_FALSE(result.ok);
    EXPECT_EQ(result.error.pattern, "tags");
    EXPECT_EQ(result.error.position, 0u);
}

TEST(RuleSetTest, From_ValidPatterns_Match) {
    RuleSet rules = make_rules({"$.meta.*"}, {"$..tags"}, true, false);
    EXPECT_TRUE(rules.is_ignored(path::JsonPath().child("meta").child("x")));
    EXPECT_FALSE(rules.is_ignored(path::JsonPath().child("meta")));
    EXPECT_TRUE(rules.is_unordered(path::JsonPath().child("a").child("tags")));
    EXPECT_TRUE(rules.show_nested_differences());
    EXPECT_FALSE(rules.identify_array_item_changes());
}

// ==============================================================================
// Базовая классификация
// ==============================================================================

TEST(CompareTest, Scenario_RemovedSubtreeIsOneEntry) {
    auto entries = run(R"({"x":{"y":1}})", "{}");

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].type, DiffType::Removed);
    EXPECT_EQ(entries[0].path.to_string(), "$.x");
    ASSERT_TRUE(entries[0].left_value.has_value());
    EXPECT_EQ(*entries[0].left_value, json(R"({"y":1})"));
    EXPECT_FALSE(entries[0].right_value.has_value());
    EXPECT_FALSE(entries[0].right_line.has_value());
}

TEST(CompareTest, AddedProperty) {
    auto entries = run(R"({"a":1})", R"({"a":1,"b":[1,2]})");

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].type, DiffType::Added);
    EXPECT_EQ(entries[0].path.to_string(), "$.b");
    EXPECT_FALSE(entries[0].left_value.has_value());
    EXPECT_FALSE(entries[0].left_line.has_value());
    EXPECT_EQ(*entries[0].right_value, json("[1,2]"));
}

TEST(CompareTest, ModifiedScalarsAndTypeChanges) {
    auto entries = run(R"({"s":"a","n":1,"f":1,"t":null,"o":{},"arr":[]})",
                       R"({"s":"b","n":1,"f":1.0,"t":0,"o":[],"arr":{}})");

    ASSERT_EQ(entries.size(), 5u);
    std::vector<std::string> paths;
    for (const auto& e : entries) {
        EXPECT_EQ(e.type, DiffType::Modified);
        paths.push_back(e.path.to_string());
    }
    EXPECT_EQ(paths, (std::vector<std::string>{"$.s", "$.f", "$.t", "$.o", "$.arr"}));
}

TEST(CompareTest, RootScalarsDiffer) {
    auto entries = run("1", "2");
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].type, DiffType::Modified);
    EXPECT_TRUE(entries[0].path.is_root());
}

TEST(CompareTest, ObjectKeyOrder_LeftKeysThenRightOnlyKeys) {
    auto entries = run(R"({"b":1,"a":1})", R"({"c":1,"a":2,"d":1})");

    ASSERT_EQ(entries.size(), 4u);
    EXPECT_EQ(entries[0].path.to_string(), "$.b");
    EXPECT_EQ(entries[0].type, DiffType::Removed);
    EXPECT_EQ(entries[1].path.to_string(), "$.a");
    EXPECT_EQ(entries[1].type, DiffType::Modified);
    EXPECT_EQ(entries[2].path.to_string(), "$.c");
    EXPECT_EQ(entries[2].type, DiffType::Added);
    EXPECT_EQ(entries[3].path.to_string(), "$.d");
}

TEST(CompareTest, ObjectKeyReorder_IsNotADifference) {
    EXPECT_TRUE(run(R"({"a":1,"b":2})", R"({"b":2,"a":1})").empty());
}

TEST(CompareTest, OrderedArray_Positional) {
    auto entries = run(R"({"a":[1,2,3]})", R"({"a":[1,5]})");

    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].type, DiffType::Modified);
    EXPECT_EQ(entries[0].path.to_string(), "$.a[1]");
    EXPECT_EQ(entries[1].type, DiffType::Removed);
    EXPECT_EQ(entries[1].path.to_string(), "$.a[2]");
}

TEST(CompareTest, OrderedArray_IdentifyOff_WholeArrayModified) {
    RuleSet rules = make_rules({}, {}, false, false);
    auto entries = run(R"({"a":[1,2],"b":[1]})", R"({"a":[1,3],"b":[1]})", rules);

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].type, DiffType::Modified);
    EXPECT_EQ(entries[0].path.to_string(), "$.a");
    EXPECT_EQ(*entries[0].left_value, json("[1,2]"));
    EXPECT_EQ(*entries[0].right_value, json("[1,3]"));
}

// ==============================================================================
// Ignore
// ==============================================================================

TEST(CompareTest, Scenario_IgnoreWildcard_PerLeafEntries) {
    RuleSet rules = make_rules({"$.meta.*"});
    auto entries =
        run(R"({"meta":{"ts":1,"id":2},"v":1})", R"({"meta":{"ts":9,"id":9},"v":2})", rules);

    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].type, DiffType::Ignored);
    EXPECT_EQ(entries[0].path.to_string(), "$.meta.ts");
    EXPECT_EQ(entries[1].type, DiffType::Ignored);
    EXPECT_EQ(entries[1].path.to_string(), "$.meta.id");
    EXPECT_EQ(entries[2].type, DiffType::Modified);
    EXPECT_EQ(entries[2].path.to_string(), "$.v");
}

TEST(CompareTest, Scenario_IgnoreContainer_SingleEntry) {
    RuleSet rules = make_rules({"$.meta"});
    auto entries =
        run(R"({"meta":{"ts":1,"id":2},"v":1})", R"({"meta":{"ts":9,"id":9},"v":2})", rules);

    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].type, DiffType::Ignored);
    EXPECT_EQ(entries[0].path.to_string(), "$.meta");
    EXPECT_EQ(entries[1].type, DiffType::Modified);
    EXPECT_EQ(entries[1].path.to_string(), "$.v");
}

TEST(CompareTest, Ignore_EmittedEvenWhenValuesEqual) {
    RuleSet rules = make_rules({"$.ts"});
    auto entries = run(R"({"ts":1})", R"({"ts":1})", rules);

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].type, DiffType::Ignored);
}

TEST(CompareTest, Ignore_OneSidedPath_CarriesOnlyExistingSide) {
    RuleSet rules = make_rules({"$.gone"});
    auto entries = run(R"({"gone":5})", "{}", rules);

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].type, DiffType::Ignored);
    EXPECT_TRUE(entries[0].left_value.has_value());
    EXPECT_FALSE(entries[0].right_value.has_value());
    EXPECT_TRUE(entries[0].left_line.has_value());
    EXPECT_FALSE(entries[0].right_line.has_value());
}

TEST(CompareTest, Ignore_Precedence_NoDescendantEntries) {
    RuleSet rules = make_rules({"$.a"}, {"$.a.list"});
    auto entries = run(R"({"a":{"x":1,"list":[1,2],"deep":{"k":1}},"b":1})",
                       R"({"a":{"x":2,"list":[2,3],"deep":{}},"b":1})", rules);

    path::JsonPath a = path::JsonPath().child("a");
    for (const auto& e : entries) {
        EXPECT_FALSE(a.is_ancestor_of(e.path)) << e.path.to_string();
    }
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].type, DiffType::Ignored);
}

TEST(CompareTest, Ignore_WinsOverUnordered) {
    RuleSet rules = make_rules({"$.tags"}, {"$.tags"});
    auto entries = run(R"({"tags":[1,2]})", R"({"tags":[2,1]})", rules);

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].type, DiffType::Ignored);
}

// ==============================================================================
// Неупорядоченные массивы
// ==============================================================================

TEST(CompareTest, Scenario_UnorderedReorderOnly) {
    RuleSet rules = make_rules({}, {"$.b"});
    auto entries = run(R"({"a":1,"b":[1,2,3]})", R"({"a":2,"b":[3,2,1]})", rules);

    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].type, DiffType::Modified);
    EXPECT_EQ(entries[0].path.to_string(), "$.a");
    EXPECT_EQ(*entries[0].left_value, Value::make_int(1));
    EXPECT_EQ(*entries[0].right_value, Value::make_int(2));
    EXPECT_EQ(entries[1].type, DiffType::ArrayReordered);
    EXPECT_EQ(entries[1].path.to_string(), "$.b");
}

TEST(CompareTest, Unordered_SameOrder_NoEntries) {
    RuleSet rules = make_rules({}, {"$"});
    EXPECT_TRUE(run("[1,2,2,3]", "[1,2,2,3]", rules).empty());
}

TEST(CompareTest, Unordered_PermutationInvariance) {
    RuleSet rules = make_rules({}, {"$.v"});
    const std::string left = R"({"v":[1,2,2,{"k":[3]}]})";

    for (const char* right :
         {R"({"v":[{"k":[3]},2,1,2]})", R"({"v":[2,1,{"k":[3]},2]})", R"({"v":[2,2,1,{"k":[3]}]})"}) {
        auto entries = run(left, right, rules);
        ASSERT_EQ(entries.size(), 1u) << right;
        EXPECT_EQ(entries[0].type, DiffType::ArrayReordered) << right;
        EXPECT_EQ(entries[0].path.to_string(), "$.v");
    }
}

TEST(CompareTest, Unordered_ResiduePairedAsItemChange) {
    std::string left =
        "{\n"
        "  \"items\": [\n"
        "    {\"id\": 1, \"v\": \"a\"},\n"
        "    {\"id\": 2, \"v\": \"b\"}\n"
        "  ]\n"
        "}";
    std::string right =
        "{\n"
        "  \"items\": [\n"
        "    {\"id\": 2, \"v\": \"b\"},\n"
        "    {\"id\": 1, \"v\": \"c\"}\n"
        "  ]\n"
        "}";

    auto entries = run(left, right, make_rules({}, {"$.items"}));

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].type, DiffType::ArrayItemChanged);
    EXPECT_EQ(entries[0].path.to_string(), "$.items[0]");
    EXPECT_EQ(*entries[0].left_value, json(R"({"id":1,"v":"a"})"));
    EXPECT_EQ(*entries[0].right_value, json(R"({"id":1,"v":"c"})"));
    // Левая строка по левому индексу, правая - по собственному пути правого элемента
    EXPECT_EQ(entries[0].left_line, 3u);
    EXPECT_EQ(entries[0].right_line, 4u);
}

TEST(CompareTest, Unordered_ShowNested_ReportsInnerDifferences) {
    auto entries = run(R"({"items":[{"id":1,"v":"a"},{"id":2,"v":"b"}]})",
                       R"({"items":[{"id":2,"v":"b"},{"id":1,"v":"c"}]})",
                       make_rules({}, {"$.items"}, true));

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].type, DiffType::Modified);
    EXPECT_EQ(entries[0].path.to_string(), "$.items[0].v");
    EXPECT_EQ(*entries[0].left_value, Value::make_string("a"));
    EXPECT_EQ(*entries[0].right_value, Value::make_string("c"));
}

TEST(CompareTest, Unordered_ShowNested_ScalarPairRelabeled) {
    auto entries = run("[1,2]", "[1,3]", make_rules({}, {"$"}, true));

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].type, DiffType::ArrayItemChanged);
    EXPECT_EQ(entries[0].path.to_string(), "$[1]");
}

TEST(CompareTest, Unordered_LeftoverResidues) {
    RuleSet rules = make_rules({}, {"$.a"});

    auto removed = run(R"({"a":[1,2,3]})", R"({"a":[4]})", rules);
    ASSERT_EQ(removed.size(), 3u);
    EXPECT_EQ(removed[0].type, DiffType::ArrayItemChanged);
    EXPECT_EQ(removed[0].path.to_string(), "$.a[0]");
    EXPECT_EQ(removed[1].type, DiffType::Removed);
    EXPECT_EQ(removed[1].path.to_string(), "$.a[1]");
    EXPECT_EQ(removed[2].type, DiffType::Removed);
    EXPECT_EQ(removed[2].path.to_string(), "$.a[2]");

    auto added = run(R"({"a":[1]})", R"({"a":[1,5,6]})", rules);
    ASSERT_EQ(added.size(), 2u);
    EXPECT_EQ(added[0].type, DiffType::Added);
    EXPECT_EQ(added[0].path.to_string(), "$.a[1]");
    EXPECT_EQ(*added[0].right_value, Value::make_int(5));
    EXPECT_EQ(added[1].path.to_string(), "$.a[2]");
}

TEST(CompareTest, Unordered_ReorderedWithResidues) {
    auto entries = run("[1,2,3]", "[4,3,1]", make_rules({}, {"$"}));

    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].type, DiffType::ArrayReordered);
    EXPECT_EQ(entries[1].type, DiffType::ArrayItemChanged);
    EXPECT_EQ(entries[1].path.to_string(), "$[1]");
    EXPECT_EQ(*entries[1].left_value, Value::make_int(2));
    EXPECT_EQ(*entries[1].right_value, Value::make_int(4));
}

TEST(CompareTest, Unordered_IdentifyOff_WholeArrayItemChange) {
    RuleSet rules = make_rules({}, {"$"}, false, false);

    auto plain = run("[1,2]", "[3,1]", rules);
    ASSERT_EQ(plain.size(), 1u);
    EXPECT_EQ(plain[0].type, DiffType::ArrayItemChanged);
    EXPECT_TRUE(plain[0].path.is_root());
    EXPECT_EQ(*plain[0].left_value, json("[1,2]"));
    EXPECT_EQ(*plain[0].right_value, json("[3,1]"));

    auto reordered = run("[1,2,3]", "[4,3,1]", rules);
    ASSERT_EQ(reordered.size(), 2u);
    EXPECT_EQ(reordered[0].type, DiffType::ArrayReordered);
    EXPECT_EQ(reordered[1].type, DiffType::ArrayItemChanged);
    EXPECT_TRUE(reordered[1].path.is_root());
}

TEST(CompareTest, Unordered_IgnoredPairPath) {
    auto entries = run(R"({"a":[1,2]})", R"({"a":[1,3]})", make_rules({"$.a[1]"}, {"$.a"}));

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].type, DiffType::Ignored);
    EXPECT_EQ(entries[0].path.to_string(), "$.a[1]");
}

TEST(CompareTest, Unordered_DuplicatesMatchedAsMultiset) {
    auto entries = run("[1,1,2]", "[1,2,2]", make_rules({}, {"$"}));

    // 1<->1, 2<->2; остатки: левая 1 (индекс 1) и правая 2 (индекс 2)
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].type, DiffType::ArrayItemChanged);
    EXPECT_EQ(entries[0].path.to_string(), "$[1]");
    EXPECT_EQ(*entries[0].left_value, Value::make_int(1));
    EXPECT_EQ(*entries[0].right_value, Value::make_int(2));
}

TEST(CompareTest, Unordered_DroppedDuplicate_KeepsOrder) {
    auto entries = run(R"(["a","b","a"])", R"(["b","a"])", make_rules({}, {"$"}));

    // Правая сторона - левая без первой "a": порядок сохранён
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].type, DiffType::Removed);
    EXPECT_EQ(entries[0].path.to_string(), "$[0]");
    EXPECT_EQ(*entries[0].left_value, Value::make_string("a"));
}

TEST(CompareTest, Unordered_AddedDuplicate_KeepsOrder) {
    auto entries = run(R"(["b","a"])", R"(["a","b","a"])", make_rules({}, {"$"}));

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].type, DiffType::Added);
    EXPECT_EQ(entries[0].path.to_string(), "$[0]");
    EXPECT_EQ(*entries[0].right_value, Value::make_string("a"));
}

TEST(CompareTest, Unordered_DuplicatesCannotKeepOrder_Reordered) {
    auto entries = run(R"(["x","y","y"])", R"(["y","x"])", make_rules({}, {"$"}));

    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].type, DiffType::ArrayReordered);
    EXPECT_EQ(entries[1].type, DiffType::Removed);
    EXPECT_EQ(entries[1].path.to_string(), "$[2]");
}

TEST(CompareTest, Unordered_BalancedDuplicatesSwapped_Reordered) {
    auto entries = run("[1,2,1]", "[2,1,1]", make_rules({}, {"$"}));

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].type, DiffType::ArrayReordered);
}

// ==============================================================================
// Широкие объекты
// ==============================================================================

TEST(CompareTest, WideObjects_OneChangedKey) {
    constexpr std::size_t KEYS = 50000;
    ValueObject left_members;
    ValueObject right_members;
    left_members.reserve(KEYS);
    right_members.reserve(KEYS);
    for (std::size_t i = 0; i < KEYS; ++i) {
        std::string key = "k" + std::to_string(i);
        left_members.emplace_back(key, Value::make_int(0));
        right_members.emplace_back(key, Value::make_int(i == 31337 ? 1 : 0));
    }
    // Обратный порядок ключей справа не является различием
    std::reverse(right_members.begin(), right_members.end());

    Value left(std::move(left_members));
    Value right(std::move(right_members));
    EXPECT_NE(left, right);

    auto result = compare(left, right, make_rules(), parser::PathLineMap(), parser::PathLineMap());
    ASSERT_EQ(result.entries.size(), 1u);
    EXPECT_EQ(result.entries[0].type, DiffType::Modified);
    EXPECT_EQ(result.entries[0].path.to_string(), "$.k31337");
    EXPECT_EQ(*result.entries[0].right_value, Value::make_int(1));
}

TEST(CompareTest, WideObjectsInsideUnorderedArray_Matched) {
    constexpr std::size_t KEYS = 20000;
    ValueObject members;
    members.reserve(KEYS);
    for (std::size_t i = 0; i < KEYS; ++i) {
        members.emplace_back("k" + std::to_string(i), Value::make_int(static_cast<std::int64_t>(i)));
    }
    ValueObject reversed = members;
    std::reverse(reversed.begin(), reversed.end());

    ValueArray left_items;
    left_items.push_back(Value::make_int(1));
    left_items.push_back(Value(std::move(members)));
    ValueArray right_items;
    right_items.push_back(Value(std::move(reversed)));
    right_items.push_back(Value::make_int(1));

    auto result = compare(Value(std::move(left_items)), Value(std::move(right_items)),
                          make_rules({}, {"$"}), parser::PathLineMap(), parser::PathLineMap());
    ASSERT_EQ(result.entries.size(), 1u);
    EXPECT_EQ(result.entries[0].type, DiffType::ArrayReordered);
}

// ==============================================================================
// Свойства
// ==============================================================================

TEST(ComparePropertyTest, Identity_NoNonIgnoredEntries) {
    std::vector<std::string> docs = {
        "null", "0", "-1.5", "\"s\"", "[]", "{}", R"({"a":[1,{"b":[2,2,3]}],"c":{"d":null}})",
        R"([[1,2],[2,1],{"x":[true,false]}])",
    };
    std::vector<RuleSet> rule_sets = {
        RuleSet(),
        make_rules({"$..b"}),
        make_rules({}, {"$..*", "$"}),
        make_rules({}, {"$..*", "$"}, true, false),
        make_rules({}, {}, false, false),
    };

    for (const auto& doc : docs) {
        for (const auto& rules : rule_sets) {
            EXPECT_TRUE(non_ignored(run(doc, doc, rules)).empty()) << doc;
        }
    }
}

TEST(ComparePropertyTest, Symmetry_SwappingSidesSwapsClassification) {
    const std::string a = R"({"a":1,"b":{"c":2},"d":[1,2],"t":[1,2,3],"m":{"x":1}})";
    const std::string b = R"({"a":2,"e":3,"d":[1],"t":[3,2,1],"m":{"x":5}})";
    RuleSet rules = make_rules({"$.m.x"}, {"$.t"});

    auto forward = run(a, b, rules);
    auto backward = run(b, a, rules);
    ASSERT_EQ(forward.size(), backward.size());

    std::map<std::string, const DiffEntry*> by_path;
    for (const auto& e : backward) {
        by_path[e.path.to_string()] = &e;
    }

    for (const auto& e : forward) {
        auto it = by_path.find(e.path.to_string());
        ASSERT_NE(it, by_path.end()) << e.path.to_string();
        const DiffEntry& other = *it->second;

        switch (e.type) {
        case DiffType::Added:
            EXPECT_EQ(other.type, DiffType::Removed);
            EXPECT_EQ(*other.left_value, *e.right_value);
            break;
        case DiffType::Removed:
            EXPECT_EQ(other.type, DiffType::Added);
            EXPECT_EQ(*other.right_value, *e.left_value);
            break;
        case DiffType::Modified:
            EXPECT_EQ(other.type, DiffType::Modified);
            EXPECT_EQ(*other.left_value, *e.right_value);
            EXPECT_EQ(*other.right_value, *e.left_value);
            break;
        default:
            EXPECT_EQ(other.type, e.type);
            break;
        }
    }
}

// ==============================================================================
// compare() / compare_text() / compare_files()
// ==============================================================================

TEST(CompareTest, Compare_UsesProvidedLineMaps) {
    auto left = parser::parse("{\n\"a\": 1\n}");
    auto right = parser::parse("{\n\n\n\"a\": 2}");
    ASSERT_TRUE(left && right);

    DiffResult result = compare(left.document.value, right.document.value, RuleSet(),
                                left.document.lines, right.document.lines);

    ASSERT_EQ(result.entries.size(), 1u);
    EXPECT_EQ(result.entries[0].left_line, 2u);
    EXPECT_EQ(result.entries[0].right_line, 4u);
    EXPECT_FALSE(result.left_file.has_value());
}

TEST(CompareTest, CompareText_ParseErrorMarksSide) {
    auto bad_right = compare_text("{}", "{", RuleSet());
    ASSERT_FALSE(bad_right.ok);
    EXPECT_EQ(bad_right.error.source, "right");

    auto bad_left = compare_text("[1,]", "{", RuleSet());
    ASSERT_FALSE(bad_left.ok);
    EXPECT_EQ(bad_left.error.source, "left");
}

TEST(CompareTest, CompareText_EntriesAreSequencedByLine) {
    std::string left = "{\n\"z\": 1,\n\"a\": 1\n}";
    std::string right = "{\n\"a\": 2,\n\"z\": 2\n}";

    auto result = compare_text(left, right, RuleSet());
    ASSERT_TRUE(result.ok);
    ASSERT_EQ(result.result.entries.size(), 2u);
    // $.z: min(2, 3) = 2; $.a: min(3, 2) = 2 -> порядок обхода сохраняется
    EXPECT_EQ(result.result.entries[0].path.to_string(), "$.z");
    EXPECT_EQ(result.result.entries[1].path.to_string(), "$.a");
}

}  // namespace jsondiff::diff::test
