// ==============================================================================
// compare.cpp - Движок структурного сравнения
// ==============================================================================
//
// Обход двух деревьев Value параллельно. Каждый узел посещается с:
// - path  : путь записи (совпадает с путём в левом дереве, если левая
//           сторона есть; для правых остатков неупорядоченного массива -
//           путь по правому индексу)
// - rpath : путь того же узла в правом дереве (для номера правой строки)
//
// Различие path/rpath возникает только внутри неупорядоченных массивов,
// где сопоставленные элементы могут стоять на разных индексах.
//
// ==============================================================================

#include <jsondiff/diff.hpp>
#include <jsondiff/platform.hpp>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <utility>
#include <vector>

namespace jsondiff::diff {

namespace {

constexpr std::size_t NO_MATCH = static_cast<std::size_t>(-1);

// ============================================================================
// Сопоставление элементов неупорядоченного массива (по id классов равенства)
// ============================================================================

/// Каждый левый элемент берёт первую свободную правую копию своего класса.
/// @return правый индекс для каждого левого элемента или NO_MATCH
std::vector<std::size_t> greedy_matching(const std::vector<std::size_t>& left_class,
                                         const std::vector<std::size_t>& right_class,
                                         std::size_t class_count) {
    std::vector<std::vector<std::size_t>> right_by_class(class_count);
    for (std::size_t j = 0; j < right_class.size(); ++j) {
        right_by_class[right_class[j]].push_back(j);
    }
    std::vector<std::size_t> cursor(class_count, 0);

    std::vector<std::size_t> match(left_class.size(), NO_MATCH);
    for (std::size_t i = 0; i < left_class.size(); ++i) {
        std::size_t c = left_class[i];
        if (cursor[c] < right_by_class[c].size()) {
            match[i] = right_by_class[c][cursor[c]++];
        }
    }
    return match;
}

/// Есть ли класс с разным числом копий слева и справа
bool has_unbalanced_class(const std::vector<std::size_t>& left_class,
                          const std::vector<std::size_t>& right_class, std::size_t class_count) {
    std::vector<long long> balance(class_count, 0);
    for (std::size_t c : left_class) {
        ++balance[c];
    }
    for (std::size_t c : right_class) {
        --balance[c];
    }
    for (long long b : balance) {
        if (b != 0) {
            return true;
        }
    }
    return false;
}

/// Наибольшая общая подпоследовательность по id классов.
/// @return (длина, правый индекс для каждого левого элемента или NO_MATCH)
std::pair<std::size_t, std::vector<std::size_t>> ordered_matching(
    const std::vector<std::size_t>& left_class, const std::vector<std::size_t>& right_class) {
    std::size_t n = left_class.size();
    std::size_t m = right_class.size();
    std::vector<std::size_t> table((n + 1) * (m + 1), 0);
    auto cell = [&table, m](std::size_t i, std::size_t j) -> std::size_t& {
        return table[i * (m + 1) + j];
    };

    for (std::size_t i = 1; i <= n; ++i) {
        for (std::size_t j = 1; j <= m; ++j) {
            if (left_class[i - 1] == right_class[j - 1]) {
                cell(i, j) = cell(i - 1, j - 1) + 1;
            } else {
                cell(i, j) = std::max(cell(i - 1, j), cell(i, j - 1));
            }
        }
    }

    // Обратный проход с конца: при равенстве предпочитаем пару
    std::vector<std::size_t> match(n, NO_MATCH);
    std::size_t i = n;
    std::size_t j = m;
    while (i > 0 && j > 0) {
        if (left_class[i - 1] == right_class[j - 1] && cell(i, j) == cell(i - 1, j - 1) + 1) {
            match[i - 1] = j - 1;
            --i;
            --j;
        } else if (cell(i - 1, j) >= cell(i, j - 1)) {
            --i;
        } else {
            --j;
        }
    }
    return {cell(n, m), std::move(match)};
}

// ============================================================================
// Comparer
// ============================================================================

class Comparer {
public:
    Comparer(const RuleSet& rules, const parser::PathLineMap& left_lines,
             const parser::PathLineMap& right_lines)
        : rules_(rules), left_lines_(left_lines), right_lines_(right_lines) {}

    void run(const Value& left, const Value& right) {
        path::JsonPath root;
        visit(&left, &right, root, root);
    }

    std::vector<DiffEntry> take_entries() { return std::move(entries_); }

private:
    // ------------------------------------------------------------------------
    // Рекурсивный обход
    // ------------------------------------------------------------------------

    void visit(const Value* left, const Value* right, const path::JsonPath& p,
               const path::JsonPath& rp) {
        if (rules_.is_ignored(p)) {
            emit(DiffType::Ignored, p, rp, left, right);
            return;
        }

        if (left == nullptr && right == nullptr) {
            return;
        }
        if (left == nullptr) {
            emit(DiffType::Added, p, rp, nullptr, right);
            return;
        }
        if (right == nullptr) {
            emit(DiffType::Removed, p, rp, left, nullptr);
            return;
        }

        if (left->is_object() && right->is_object()) {
            compare_objects(left->as_object(), right->as_object(), p, rp);
            return;
        }
        if (left->is_array() && right->is_array()) {
            compare_arrays(*left, *right, p, rp);
            return;
        }

        // Разные варианты или разные примитивы
        if (*left != *right) {
            emit(DiffType::Modified, p, rp, left, right);
        }
    }

    // ------------------------------------------------------------------------
    // Объекты: ключи левой стороны, затем ключи только правой стороны
    // ------------------------------------------------------------------------

    void compare_objects(const ValueObject& left, const ValueObject& right,
                         const path::JsonPath& p, const path::JsonPath& rp) {
        MemberIndex left_index = index_members(left);
        MemberIndex right_index = index_members(right);

        for (const auto& [key, lvalue] : left) {
            auto it = right_index.find(key);
            const Value* rvalue = it != right_index.end() ? it->second : nullptr;
            visit(&lvalue, rvalue, p.child(key), rp.child(key));
        }
        for (const auto& [key, rvalue] : right) {
            if (left_index.find(key) == left_index.end()) {
                visit(nullptr, &rvalue, p.child(key), rp.child(key));
            }
        }
    }

    // ------------------------------------------------------------------------
    // Массивы
    // ------------------------------------------------------------------------

    void compare_arrays(const Value& left, const Value& right, const path::JsonPath& p,
                        const path::JsonPath& rp) {
        if (rules_.is_unordered(p)) {
            compare_unordered(left, right, p, rp);
            return;
        }

        if (!rules_.identify_array_item_changes()) {
            if (left != right) {
                emit(DiffType::Modified, p, rp, &left, &right);
            }
            return;
        }

        const ValueArray& l = left.as_array();
        const ValueArray& r = right.as_array();
        std::size_t count = l.size() > r.size() ? l.size() : r.size();
        for (std::size_t i = 0; i < count; ++i) {
            const Value* lv = i < l.size() ? &l[i] : nullptr;
            const Value* rv = i < r.size() ? &r[i] : nullptr;
            visit(lv, rv, p.child(i), rp.child(i));
        }
    }

    void compare_unordered(const Value& left, const Value& right, const path::JsonPath& p,
                           const path::JsonPath& rp) {
        const ValueArray& l = left.as_array();
        const ValueArray& r = right.as_array();

        // Классы равенства: равные элементы обеих сторон получают один id
        std::vector<const Value*> reps;
        auto class_of = [&reps](const Value& v) {
            for (std::size_t k = 0; k < reps.size(); ++k) {
                if (*reps[k] == v) {
                    return k;
                }
            }
            reps.push_back(&v);
            return reps.size() - 1;
        };
        std::vector<std::size_t> left_class(l.size());
        std::vector<std::size_t> right_class(r.size());
        for (std::size_t i = 0; i < l.size(); ++i) {
            left_class[i] = class_of(l[i]);
        }
        for (std::size_t j = 0; j < r.size(); ++j) {
            right_class[j] = class_of(r[j]);
        }

        std::vector<std::size_t> left_match = greedy_matching(left_class, right_class, reps.size());
        std::size_t matched = 0;
        bool reordered = false;
        bool have_prev = false;
        std::size_t prev = 0;
        for (std::size_t j : left_match) {
            if (j == NO_MATCH) {
                continue;
            }
            ++matched;
            if (have_prev && j <= prev) {
                reordered = true;
            }
            have_prev = true;
            prev = j;
        }

        // Лишние копии на одной стороне: выбрать несопоставленные копии так,
        // чтобы порядок сохранился, если это возможно
        if (reordered && has_unbalanced_class(left_class, right_class, reps.size())) {
            auto ordered = ordered_matching(left_class, right_class);
            if (ordered.first == matched) {
                left_match = std::move(ordered.second);
                reordered = false;
            }
        }

        std::vector<bool> right_used(r.size(), false);
        std::vector<std::size_t> left_residue;
        for (std::size_t i = 0; i < l.size(); ++i) {
            if (left_match[i] == NO_MATCH) {
                left_residue.push_back(i);
            } else {
                right_used[left_match[i]] = true;
            }
        }

        std::vector<std::size_t> right_residue;
        for (std::size_t j = 0; j < r.size(); ++j) {
            if (!right_used[j]) {
                right_residue.push_back(j);
            }
        }

        if (reordered) {
            emit(DiffType::ArrayReordered, p, rp, &left, &right);
        }
        if (left_residue.empty() && right_residue.empty()) {
            return;
        }

        if (!rules_.identify_array_item_changes()) {
            emit(DiffType::ArrayItemChanged, p, rp, &left, &right);
            return;
        }

        std::size_t pairs =
            left_residue.size() < right_residue.size() ? left_residue.size() : right_residue.size();

        for (std::size_t k = 0; k < pairs; ++k) {
            std::size_t li = left_residue[k];
            std::size_t rj = right_residue[k];
            visit_pair(l[li], r[rj], p.child(li), rp.child(rj));
        }
        for (std::size_t k = pairs; k < left_residue.size(); ++k) {
            std::size_t li = left_residue[k];
            visit(&l[li], nullptr, p.child(li), rp.child(li));
        }
        for (std::size_t k = pairs; k < right_residue.size(); ++k) {
            std::size_t rj = right_residue[k];
            visit(nullptr, &r[rj], p.child(rj), rp.child(rj));
        }
    }

    // Пара остатков: элемент неупорядоченного массива изменился
    void visit_pair(const Value& left, const Value& right, const path::JsonPath& p,
                    const path::JsonPath& rp) {
        if (!rules_.show_nested_differences()) {
            if (rules_.is_ignored(p)) {
                emit(DiffType::Ignored, p, rp, &left, &right);
            } else {
                emit(DiffType::ArrayItemChanged, p, rp, &left, &right);
            }
            return;
        }

        std::size_t first = entries_.size();
        visit(&left, &right, p, rp);
        for (std::size_t i = first; i < entries_.size(); ++i) {
            DiffEntry& entry = entries_[i];
            if (entry.type == DiffType::Modified && entry.path == p) {
                entry.type = DiffType::ArrayItemChanged;
            }
        }
    }

    // ------------------------------------------------------------------------
    // Запись
    // ------------------------------------------------------------------------

    void emit(DiffType type, const path::JsonPath& p, const path::JsonPath& rp,
              const Value* left, const Value* right) {
        DiffEntry entry;
        entry.path = p;
        entry.type = type;
        if (left != nullptr) {
            entry.left_value = *left;
            entry.left_line = left_lines_.find(p);
        }
        if (right != nullptr) {
            entry.right_value = *right;
            entry.right_line = right_lines_.find(rp);
        }
        entries_.push_back(std::move(entry));
    }

    const RuleSet& rules_;
    const parser::PathLineMap& left_lines_;
    const parser::PathLineMap& right_lines_;
    std::vector<DiffEntry> entries_;
};

}  // namespace

// ============================================================================
// compare
// ============================================================================

DiffResult compare(const Value& left, const Value& right, const RuleSet& rules,
                   const parser::PathLineMap& left_lines, const parser::PathLineMap& right_lines) {
    Comparer comparer(rules, left_lines, right_lines);
    comparer.run(left, right);

    DiffResult result;
    result.timestamp = std::chrono::system_clock::now();
    result.entries = comparer.take_entries();
    return result;
}

// ============================================================================
// compare_text / compare_files
// ============================================================================

namespace {

CompareResult compare_documents(parser::ParseResult left, parser::ParseResult right,
                                const RuleSet& rules) {
    CompareResult result;
    if (!left) {
        result.error = std::move(left.error);
        return result;
    }
    if (!right) {
        result.error = std::move(right.error);
        return result;
    }

    result.result = compare(left.document.value, right.document.value, rules,
                            left.document.lines, right.document.lines);
    result.result.entries = sequence(std::move(result.result.entries));
    result.ok = true;
    return result;
}

}  // namespace

CompareResult compare_text(std::string_view left_text, std::string_view right_text,
                           const RuleSet& rules) {
    return compare_documents(parser::parse(left_text, "left"), parser::parse(right_text, "right"),
                             rules);
}

CompareResult compare_files(const std::filesystem::path& left_file,
                            const std::filesystem::path& right_file, const RuleSet& rules) {
    auto left = parser::parse_file(left_file);
    if (!left) {
        CompareResult result;
        result.error = std::move(left.error);
        return result;
    }

    CompareResult result = compare_documents(std::move(left), parser::parse_file(right_file), rules);
    if (result) {
        result.result.left_file = platform::path_to_utf8(left_file);
        result.result.right_file = platform::path_to_utf8(right_file);
    }
    return result;
}

}  // namespace jsondiff::diff
