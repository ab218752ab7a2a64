// ==============================================================================
// jsondiff/profile.hpp - Профиль сравнения (YAML)
// ==============================================================================
//
// Назначение:
// - Загрузка профиля сравнения из YAML файла (yaml-cpp)
// - Слияние профиля с переопределениями из командной строки
// - Сборка diff::RuleSet
//
// Формат профиля:
// @code
//   ignore: ["$.timestamp", "$.meta.*"]
//   unordered: ["$.tags"]
//   show_nested_differences: true
//   identify_array_item_changes: false
// @endcode
//
// Все ключи необязательны. Неизвестные ключи - предупреждения, не ошибки.
//
// ==============================================================================

#ifndef JSONDIFF_PROFILE_HPP
#define JSONDIFF_PROFILE_HPP

#include <jsondiff/diff.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jsondiff::profile {

// ============================================================================
// Profile
// ============================================================================

struct Profile {
    std::vector<std::string> ignore;
    std::vector<std::string> unordered;
    std::optional<bool> show_nested_differences;
    std::optional<bool> identify_array_item_changes;

    /// Некритичные замечания (неизвестные ключи)
    std::vector<std::string> warnings;
};

// ============================================================================
// Error handling
// ============================================================================

/// Ошибка загрузки профиля
struct Error {
    std::string message;
    std::string path;

    /// "profile error [<path>]: <message>"
    std::string format() const;
};

struct LoadResult {
    bool ok = false;
    Profile profile;
    Error error;

    explicit operator bool() const { return ok; }
};

// ============================================================================
// Load
// ============================================================================

/// Загрузить профиль из файла (.yml / .yaml)
LoadResult load(const std::filesystem::path& path);

/// Разобрать профиль из YAML текста
/// @param source Метка источника для Error::path
LoadResult parse(std::string_view text, const std::string& source = {});

// ============================================================================
// Overrides / RuleSet
// ============================================================================

/// Переопределения из командной строки
struct Overrides {
    std::vector<std::string> ignore;     // добавляются к профилю
    std::vector<std::string> unordered;  // добавляются к профилю
    std::optional<bool> show_nested_differences;
    std::optional<bool> identify_array_item_changes;
};

/// Слить профиль с переопределениями и скомпилировать набор правил.
/// Переключатели: override > профиль > значение по умолчанию.
diff::RuleSetResult to_rule_set(const Profile& profile, const Overrides& overrides = {});

}  // namespace jsondiff::profile

#endif  // JSONDIFF_PROFILE_HPP
