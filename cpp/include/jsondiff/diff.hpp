// ==============================================================================
// jsondiff/diff.hpp - Структурное сравнение JSON документов
// ==============================================================================
//
// Назначение:
// - DiffType / DiffEntry / DiffResult: типизированный список изменений
// - RuleSet: скомпилированные правила ignore/unordered + переключатели
// - compare(): рекурсивное сравнение двух деревьев Value
// - sequence(): детерминированный порядок записей (по строкам исходника)
// - compare_text() / compare_files(): полный конвейер parse -> compare -> sequence
//
// Движок сравнения не возвращает ошибок: для любых двух корректных
// деревьев результат определён. Ошибки шаблонов отсекаются в RuleSet::from,
// ошибки JSON - в парсере.
//
// ==============================================================================

#ifndef JSONDIFF_DIFF_HPP
#define JSONDIFF_DIFF_HPP

#include <jsondiff/parser.hpp>
#include <jsondiff/path.hpp>
#include <jsondiff/value.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jsondiff::diff {

// ============================================================================
// DiffType
// ============================================================================

enum class DiffType {
    Added,             // есть только справа
    Removed,           // есть только слева
    Modified,          // есть с обеих сторон, значения различны
    ArrayItemChanged,  // элемент неупорядоченного массива изменился
    ArrayReordered,    // элементы неупорядоченного массива переставлены
    Ignored            // путь исключён правилом ignore
};

/// "+", "-", "~", "!", "*", "?"
const char* symbol(DiffType type);

/// "ADDED", "REMOVED", "MODIFIED", "ARRAY_ITEM_CHANGED", "ARRAY_REORDERED", "IGNORED"
const char* readable_text(DiffType type);

/// Однострочное описание типа
const char* description(DiffType type);

// ============================================================================
// DiffEntry / DiffResult
// ============================================================================

struct DiffEntry {
    path::JsonPath path;
    DiffType type = DiffType::Modified;

    std::optional<Value> left_value;
    std::optional<Value> right_value;

    std::optional<std::size_t> left_line;
    std::optional<std::size_t> right_line;
};

struct DiffResult {
    std::optional<std::string> left_file;
    std::optional<std::string> right_file;
    std::chrono::system_clock::time_point timestamp;
    std::vector<DiffEntry> entries;
};

// ============================================================================
// RuleSet
// ============================================================================

struct RuleSetResult;

class RuleSet {
public:
    /// Пустой набор правил со значениями по умолчанию
    RuleSet() = default;

    /// Скомпилировать набор правил. Первый некорректный шаблон
    /// возвращается как PatternError, набор не создаётся.
    static RuleSetResult from(const std::vector<std::string>& ignore,
                              const std::vector<std::string>& unordered,
                              bool show_nested_differences = false,
                              bool identify_array_item_changes = true);

    /// Совпадает ли путь с каким-либо правилом ignore
    bool is_ignored(const path::JsonPath& p) const;

    /// Совпадает ли путь с каким-либо правилом unordered
    bool is_unordered(const path::JsonPath& p) const;

    const std::vector<path::PathPattern>& ignore() const { return ignore_; }
    const std::vector<path::PathPattern>& unordered() const { return unordered_; }
    bool show_nested_differences() const { return show_nested_differences_; }
    bool identify_array_item_changes() const { return identify_array_item_changes_; }

private:
    std::vector<path::PathPattern> ignore_;
    std::vector<path::PathPattern> unordered_;
    bool show_nested_differences_ = false;
    bool identify_array_item_changes_ = true;
};

struct RuleSetResult {
    bool ok = false;
    RuleSet rules;
    path::PatternError error;

    explicit operator bool() const { return ok; }
};

// ============================================================================
// Движок сравнения
// ============================================================================

/// Сравнить два дерева. Записи возвращаются в порядке обхода
/// (без sequence()); timestamp = текущее время UTC.
DiffResult compare(const Value& left, const Value& right, const RuleSet& rules,
                   const parser::PathLineMap& left_lines, const parser::PathLineMap& right_lines);

/// Упорядочить записи: ключ min(left_line, right_line), отсутствующая
/// строка = +inf; при равенстве сохраняется исходный порядок (stable).
std::vector<DiffEntry> sequence(std::vector<DiffEntry> entries);

// ============================================================================
// Полный конвейер
// ============================================================================

struct CompareResult {
    bool ok = false;
    DiffResult result;
    parser::ParseError error;

    explicit operator bool() const { return ok; }
};

/// parse(left) + parse(right) + compare + sequence.
/// Ошибка разбора помечается source = "left" / "right".
CompareResult compare_text(std::string_view left_text, std::string_view right_text,
                           const RuleSet& rules);

/// Прочитать оба файла, сравнить, заполнить left_file/right_file
CompareResult compare_files(const std::filesystem::path& left_file,
                            const std::filesystem::path& right_file, const RuleSet& rules);

}  // namespace jsondiff::diff

#endif  // JSONDIFF_DIFF_HPP
