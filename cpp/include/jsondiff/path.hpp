// ==============================================================================
// jsondiff/path.hpp - JsonPath и шаблоны путей
// ==============================================================================
//
// Назначение:
// - JsonPath: конкретный путь внутри документа ($.a.b[2])
// - PathPattern: скомпилированный шаблон пути (wildcard, recursive descent)
// - Компиляция шаблонов с диагностикой ошибок (PatternError)
// - Сопоставление шаблона с конкретным путём
//
// Синтаксис шаблона:
//   $            корень
//   .name        поле
//   ['na.me']    поле с произвольными символами (также "..." с \-escape)
//   [2]          индекс массива
//   .* / [*]     ровно один любой сегмент (поле или индекс)
//   ..name       ноль или более промежуточных сегментов, затем name
//                (после .. допустимы name, * и [...])
//
// Сопоставление якорное: шаблон должен покрыть путь целиком.
//
// ==============================================================================

#ifndef JSONDIFF_PATH_HPP
#define JSONDIFF_PATH_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace jsondiff::path {

// ============================================================================
// PathSegment - сегмент конкретного пути
// ============================================================================

struct PathSegment {
    enum class Kind { Field, Index };

    Kind kind = Kind::Field;
    std::string name;       // для Field
    std::size_t index = 0;  // для Index

    static PathSegment field(std::string name);
    static PathSegment at(std::size_t index);

    bool is_field() const { return kind == Kind::Field; }
    bool is_index() const { return kind == Kind::Index; }

    bool operator==(const PathSegment& other) const;
    bool operator!=(const PathSegment& other) const { return !(*this == other); }
};

// ============================================================================
// JsonPath - конкретный путь
// ============================================================================

class JsonPath {
public:
    /// Корневой путь "$"
    JsonPath() = default;

    explicit JsonPath(std::vector<PathSegment> segments) : segments_(std::move(segments)) {}

    /// Разобрать каноническую строку пути ("$.a['b.c'][3]").
    /// Wildcard и recursive descent недопустимы.
    /// @return std::nullopt если строка не является конкретным путём
    static std::optional<JsonPath> parse(std::string_view text);

    /// Дочерний путь по имени поля
    JsonPath child(const std::string& name) const;

    /// Дочерний путь по индексу массива
    JsonPath child(std::size_t index) const;

    const std::vector<PathSegment>& segments() const { return segments_; }
    std::size_t depth() const { return segments_.size(); }
    bool is_root() const { return segments_.empty(); }

    /// Является ли этот путь строгим предком other
    bool is_ancestor_of(const JsonPath& other) const;

    /// Каноническая строка: "$", ".name", "['name']", "[2]"
    std::string to_string() const;

    bool operator==(const JsonPath& other) const { return segments_ == other.segments_; }
    bool operator!=(const JsonPath& other) const { return !(*this == other); }

private:
    std::vector<PathSegment> segments_;
};

/// Нужны ли имени поля кавычки в канонической форме
bool needs_quoting(std::string_view name);

// ============================================================================
// PatternSegment / PathPattern - скомпилированный шаблон
// ============================================================================

struct PatternSegment {
    enum class Kind {
        Field,     // точное имя поля
        Index,     // точный индекс
        Wildcard,  // * - ровно один сегмент
        Descent    // .. - ноль или более сегментов
    };

    Kind kind = Kind::Field;
    std::string name;
    std::size_t index = 0;

    /// Совпадает ли матчер с одним сегментом пути (Descent не применим)
    bool accepts(const PathSegment& segment) const;
};

class PathPattern {
public:
    PathPattern() = default;

    PathPattern(std::string text, std::vector<PatternSegment> segments)
        : text_(std::move(text)), segments_(std::move(segments)) {}

    /// Исходный текст шаблона
    const std::string& text() const { return text_; }

    /// Список матчеров (без ведущего $)
    const std::vector<PatternSegment>& segments() const { return segments_; }

    /// Сопоставить с конкретным путём
    bool matches(const JsonPath& path) const;

private:
    std::string text_;
    std::vector<PatternSegment> segments_;
};

// ============================================================================
// Ошибки
// ============================================================================

/// Ошибка компиляции шаблона
struct PatternError {
    std::string pattern;
    std::size_t position = 0;  // смещение в байтах от начала шаблона
    std::string message;

    /// "invalid path pattern '<pattern>' at position <n>: <message>"
    std::string format() const;
};

/// Результат компиляции шаблона
struct PatternResult {
    bool ok = false;
    PathPattern pattern;
    PatternError error;

    explicit operator bool() const { return ok; }
};

// ============================================================================
// API
// ============================================================================

/// Скомпилировать текстовый шаблон пути
PatternResult compile(std::string_view text);

/// Сопоставить шаблон с путём (чистая и тотальная функция)
inline bool matches(const PathPattern& pattern, const JsonPath& path) {
    return pattern.matches(path);
}

/// Совпадает ли путь хотя бы с одним шаблоном списка
bool any_matches(const std::vector<PathPattern>& patterns, const JsonPath& path);

}  // namespace jsondiff::path

#endif  // JSONDIFF_PATH_HPP
