// ==============================================================================
// jsondiff/parser.hpp - Парсер JSON с привязкой к строкам исходного текста
// ==============================================================================
//
// Назначение:
// - Разбор JSON текста в Value (RapidJSON SAX Reader)
// - Карта "конкретный путь -> номер строки" для каждого элемента документа
// - Диагностика ошибок разбора с line/column
// - Загрузка документа из файла
//
// Использование:
// @code
//   auto result = parser::parse(text);
//   if (!result) {
//       writer.error(result.error.format());
//       return 1;
//   }
//   const Value& root = result.document.value;
//   auto line = result.document.lines.find(path::JsonPath());  // корень
// @endcode
//
// ==============================================================================

#ifndef JSONDIFF_PARSER_HPP
#define JSONDIFF_PARSER_HPP

#include <jsondiff/path.hpp>
#include <jsondiff/value.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace jsondiff::parser {

// ----------------------------------------------------------------------------
// PathLineMap - путь -> строка (1-based)
// ----------------------------------------------------------------------------

class PathLineMap {
public:
    /// Записать строку для пути (повторная запись заменяет значение)
    void record(const path::JsonPath& p, std::size_t line);

    /// Строка начала значения по пути
    std::optional<std::size_t> find(const path::JsonPath& p) const;

    std::size_t size() const { return lines_.size(); }
    bool empty() const { return lines_.empty(); }

private:
    // Ключ: каноническая строка пути (JsonPath::to_string инъективна)
    std::unordered_map<std::string, std::size_t> lines_;
};

// ----------------------------------------------------------------------------
// Document - распарсенный документ
// ----------------------------------------------------------------------------

struct Document {
    Value value;
    PathLineMap lines;
};

// ----------------------------------------------------------------------------
// ParseError
// ----------------------------------------------------------------------------

enum class ParseErrorKind {
    Syntax,  // некорректный JSON
    Io       // файл не удалось прочитать
};

struct ParseError {
    ParseErrorKind kind = ParseErrorKind::Syntax;
    std::size_t line = 0;    // 1-based, 0 для Io
    std::size_t column = 0;  // 1-based, 0 для Io
    std::string message;
    std::string source;  // путь к файлу или метка стороны ("left"/"right")

    /// Syntax: "failed to parse '<source>' at line L, column C: <message>"
    /// Io:     "failed to read '<source>': <message>"
    std::string format() const;
};

// ----------------------------------------------------------------------------
// ParseResult
// ----------------------------------------------------------------------------

struct ParseResult {
    bool ok = false;
    Document document;
    ParseError error;

    explicit operator bool() const { return ok; }
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Разобрать JSON текст
/// @param text JSON документ целиком
/// @param source Метка источника для сообщений об ошибках
ParseResult parse(std::string_view text, const std::string& source = {});

/// Прочитать файл и разобрать его
ParseResult parse_file(const std::filesystem::path& file);

/// Пересчитать смещение в байтах в (line, column), оба 1-based
std::pair<std::size_t, std::size_t> offset_to_line_column(std::string_view text,
                                                          std::size_t offset);

}  // namespace jsondiff::parser

#endif  // JSONDIFF_PARSER_HPP
