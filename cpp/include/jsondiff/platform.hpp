// ==============================================================================
// jsondiff/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Явные преобразования std::filesystem::path <-> UTF-8
// - Определение TTY для цветного вывода
// - Чтение файла целиком
// - Форматирование времени (RFC 3339, UTC)
//
// Вся платформенная специфика (_WIN32) изолирована в platform.cpp.
//
// ==============================================================================

#ifndef JSONDIFF_PLATFORM_HPP
#define JSONDIFF_PLATFORM_HPP

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace jsondiff::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

/// UTF-8 строка -> native path
std::filesystem::path path_from_utf8(std::string_view u8str);

/// native path -> UTF-8 строка
std::string path_to_utf8(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// TTY
// ----------------------------------------------------------------------------

bool is_tty_stdout();
bool is_tty_stderr();

// ----------------------------------------------------------------------------
// Файлы
// ----------------------------------------------------------------------------

/// Прочитать файл целиком в бинарном режиме
/// @return std::nullopt если файл не удалось открыть или прочитать
std::optional<std::string> read_file(const std::filesystem::path& file);

// ----------------------------------------------------------------------------
// Время
// ----------------------------------------------------------------------------

/// RFC 3339 в UTC с микросекундами: "2024-01-31T12:34:56.123456+00:00"
std::string format_rfc3339(std::chrono::system_clock::time_point tp);

// ----------------------------------------------------------------------------
// Информация о платформе
// ----------------------------------------------------------------------------

/// "Windows" / "macOS" / "Linux" / "Unknown"
std::string os_name();

}  // namespace jsondiff::platform

#endif  // JSONDIFF_PLATFORM_HPP
