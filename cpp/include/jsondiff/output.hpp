// ==============================================================================
// jsondiff/output.hpp - Пользовательский вывод
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr (Writer)
// - Текстовый формат отчёта "DIFF-JSON v1" (format_entry / format_result)
// - Цветной вывод (ANSI escape codes, только на TTY)
// - Вывод в файл (--output)
//
// Формат отчёта:
// @code
//   DIFF-JSON v1
//   LEFT: a.json
//   RIGHT: b.json
//   TIMESTAMP: 2024-01-31T12:34:56.123456+00:00
//
//   [MODIFIED] $.name (L2:L2): "Alice" -> "Bob"
//   [ADDED] $.email (L4): "bob@example.com"
// @endcode
//
// ==============================================================================

#ifndef JSONDIFF_OUTPUT_HPP
#define JSONDIFF_OUTPUT_HPP

#include <jsondiff/diff.hpp>

#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace jsondiff::output {

// ----------------------------------------------------------------------------
// Потоки вывода
// ----------------------------------------------------------------------------

enum class Stream { Stdout, Stderr };

// ----------------------------------------------------------------------------
// Стиль меток записей
// ----------------------------------------------------------------------------

enum class Style {
    Readable,  // [ADDED], [REMOVED], ...
    Symbols    // +, -, ...
};

// ----------------------------------------------------------------------------
// ANSI цвета для терминала
// ----------------------------------------------------------------------------

enum class Color {
    Default,
    Green,   // Успех, информация, ADDED
    Yellow,  // Предупреждения, MODIFIED
    Red,     // Ошибки, REMOVED
    Cyan,    // Отладка, ARRAY_ITEM_CHANGED
    Magenta  // Трассировка, ARRAY_REORDERED
};

// ----------------------------------------------------------------------------
// Конфигурация вывода
// ----------------------------------------------------------------------------

struct OutputConfig {
    bool quiet = false;  // -q: подавить informational stderr
    int verbose = 0;     // -v: уровень подробности (0..2+)

    // Путь для вывода (--output)
    std::optional<std::filesystem::path> output_path;
};

// ----------------------------------------------------------------------------
// Writer - единый слой вывода
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    // Базовый вывод
    // -------------------------------------------------------------------------

    /// Записать байты в поток
    void write(Stream s, std::string_view bytes);

    /// Записать строку с переводом строки
    void write_line(Stream s, std::string_view bytes);

    // Сообщения с префиксами
    // -------------------------------------------------------------------------

    /// "[+] <message>" в stderr (если не quiet)
    void info(std::string_view message);

    /// "[!] <message>" в stderr (если не quiet)
    void warn(std::string_view message);

    /// "[x] <message>" в stderr (всегда)
    void error(std::string_view message);

    /// "[*] <message>" в stderr (только при verbose > 0)
    void debug(std::string_view message);

    /// "[~] <message>" в stderr (только при verbose > 1)
    void trace(std::string_view message);

    // Цветной вывод
    // -------------------------------------------------------------------------

    /// Записать строку с цветом; в файл и не на TTY - без ANSI кодов
    void colored_line(Stream s, std::string_view message, Color color);

    // Отчёт
    // -------------------------------------------------------------------------

    /// Записать отчёт в stdout (или в файл --output).
    /// Строки записей раскрашиваются по типу только в стиле Readable.
    void write_result(const diff::DiffResult& result, Style style);

    // Управление
    // -------------------------------------------------------------------------

    /// Сбросить буферы
    void flush();

    const OutputConfig& config() const { return config_; }

    /// Открыть файл для вывода (при заданном output_path)
    bool open_output_file();

    /// Закрыть файл вывода
    void close_output_file();

    bool has_output_file() const { return output_file_ != nullptr; }

private:
    FILE* get_file(Stream s) const;

    /// Префикс "[c] " с цветом на TTY
    void write_prefix(std::string_view prefix, Color color);

    OutputConfig config_;
    FILE* output_file_ = nullptr;
};

// ----------------------------------------------------------------------------
// Форматирование отчёта
// ----------------------------------------------------------------------------

/// Метка записи: "[ADDED]" (Readable) или "+" (Symbols)
std::string format_tag(diff::DiffType type, Style style);

/// Блок строк: " (L3:L4)", " (L3)", " (L4)" или ""
std::string format_lines(const diff::DiffEntry& entry);

/// Одна строка отчёта без перевода строки:
/// "<tag> <path><lines>: <payload>"
std::string format_entry(const diff::DiffEntry& entry, Style style);

/// Заголовок отчёта, включая пустую строку-разделитель
std::string format_header(const diff::DiffResult& result);

/// Полный отчёт: заголовок + по строке на запись
std::string format_result(const diff::DiffResult& result, Style style);

/// Компактный JSON значения (отсутствующее значение = "null")
std::string format_value(const std::optional<Value>& value);

/// Цвет строки записи
Color entry_color(diff::DiffType type);

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// ANSI escape code для цвета
std::string ansi_color_code(Color color);

/// ANSI reset code
std::string ansi_reset_code();

/// Поддерживает ли поток цвета (TTY check)
bool supports_color(Stream s);

}  // namespace jsondiff::output

#endif  // JSONDIFF_OUTPUT_HPP
