// ==============================================================================
// jsondiff/cli.hpp - CLI парсинг
// ==============================================================================
//
// Назначение:
// - Парсинг argv
// - Генерация --help / --version
// - Диагностические ошибки CLI (exit code 2 + usage + подсказка)
//
// ==============================================================================

#ifndef JSONDIFF_CLI_HPP
#define JSONDIFF_CLI_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace jsondiff::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    int verbose = 0;     // -v (repeatable)
    bool quiet = false;  // -q, --quiet
};

// ----------------------------------------------------------------------------
// Команды
// ----------------------------------------------------------------------------

/// Сравнение двух файлов
struct DiffCommand {
    std::filesystem::path left;   // <FILE1>
    std::filesystem::path right;  // <FILE2>

    std::optional<std::filesystem::path> profile;  // -p, --profile
    std::optional<std::filesystem::path> output;   // -o, --output
    bool symbols = false;                          // -S, --symbols

    // Переопределения профиля
    std::vector<std::string> ignore;     // -I, --ignore (repeatable)
    std::vector<std::string> unordered;  // -U, --unordered (repeatable)
    bool show_nested = false;            // --show-nested
    bool no_item_changes = false;        // --no-item-changes
};

/// help - показать справку
struct HelpCommand {};

/// version - показать версию
struct VersionCommand {};

using Command = std::variant<DiffCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Диагностика CLI
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 1;
    std::string stderr_message;
};

// ----------------------------------------------------------------------------
// Результат парсинга
// ----------------------------------------------------------------------------

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

/// Текст --help
std::string render_help();

/// Текст --version: "jsondiff <VERSION>\n"
std::string render_version();

/// Сообщение об ошибке использования: error + usage + подсказка
std::string render_usage_error(const std::string& error_msg);

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

constexpr const char* VERSION = "0.1.0";

constexpr const char* ABOUT = "Structural diff for JSON documents";

}  // namespace jsondiff::cli

#endif  // JSONDIFF_CLI_HPP
