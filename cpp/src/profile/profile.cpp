// ==============================================================================
// profile.cpp - Загрузка профиля сравнения
// ==============================================================================
//
// Профиль читается через yaml-cpp. Ошибки формата внутри разбора
// бросаются как std::invalid_argument и превращаются в Error на границе
// load()/parse(), вместе с YAML::Exception.
//
// ==============================================================================

#include <jsondiff/platform.hpp>
#include <jsondiff/profile.hpp>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace jsondiff::profile {

std::string Error::format() const {
    std::ostringstream oss;
    oss << "profile error";
    if (!path.empty()) {
        oss << " [" << path << "]";
    }
    oss << ": " << message;
    return oss.str();
}

// ============================================================================
// YAML parsing helpers
// ============================================================================

namespace {

constexpr const char* KEY_IGNORE = "ignore";
constexpr const char* KEY_UNORDERED = "unordered";
constexpr const char* KEY_SHOW_NESTED = "show_nested_differences";
constexpr const char* KEY_IDENTIFY = "identify_array_item_changes";

bool is_yaml_extension(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".yml" || ext == ".yaml";
}

// Список шаблонов: последовательность строк или одна строка
std::vector<std::string> parse_pattern_list(const YAML::Node& node, const std::string& key) {
    std::vector<std::string> out;
    if (node.IsNull()) {
        return out;
    }
    if (node.IsScalar()) {
        out.push_back(node.as<std::string>());
        return out;
    }
    if (!node.IsSequence()) {
        throw std::invalid_argument("'" + key + "' must be a list of path patterns");
    }
    for (const auto& item : node) {
        if (!item.IsScalar()) {
            throw std::invalid_argument("'" + key + "' must contain only strings");
        }
        out.push_back(item.as<std::string>());
    }
    return out;
}

bool parse_flag(const YAML::Node& node, const std::string& key) {
    bool value = false;
    if (!node.IsScalar() || !YAML::convert<bool>::decode(node, value)) {
        throw std::invalid_argument("'" + key + "' must be a boolean");
    }
    return value;
}

Profile parse_profile(const YAML::Node& root) {
    Profile profile;

    // Пустой документ - пустой профиль
    if (!root.IsDefined() || root.IsNull()) {
        return profile;
    }
    if (!root.IsMap()) {
        throw std::invalid_argument("profile must be a mapping");
    }

    for (const auto& kv : root) {
        std::string key = kv.first.as<std::string>();
        const YAML::Node& value = kv.second;

        if (key == KEY_IGNORE) {
            profile.ignore = parse_pattern_list(value, key);
        } else if (key == KEY_UNORDERED) {
            profile.unordered = parse_pattern_list(value, key);
        } else if (key == KEY_SHOW_NESTED) {
            profile.show_nested_differences = parse_flag(value, key);
        } else if (key == KEY_IDENTIFY) {
            profile.identify_array_item_changes = parse_flag(value, key);
        } else {
            profile.warnings.push_back("unknown profile key '" + key + "' ignored");
        }
    }

    return profile;
}

}  // anonymous namespace

// ============================================================================
// Load
// ============================================================================

LoadResult parse(std::string_view text, const std::string& source) {
    LoadResult result;

    try {
        YAML::Node root = YAML::Load(std::string(text));
        result.profile = parse_profile(root);
        result.ok = true;
    } catch (const YAML::Exception& e) {
        result.error = Error{e.what(), source};
    } catch (const std::exception& e) {
        result.error = Error{e.what(), source};
    }

    return result;
}

LoadResult load(const std::filesystem::path& path) {
    std::string source = platform::path_to_utf8(path);

    if (!is_yaml_extension(path)) {
        LoadResult result;
        result.error = Error{"profile must have a yaml file extension", source};
        return result;
    }

    auto content = platform::read_file(path);
    if (!content.has_value()) {
        LoadResult result;
        result.error = Error{"could not open file", source};
        return result;
    }

    return parse(*content, source);
}

// ============================================================================
// Overrides / RuleSet
// ============================================================================

diff::RuleSetResult to_rule_set(const Profile& profile, const Overrides& overrides) {
    std::vector<std::string> ignore = profile.ignore;
    ignore.insert(ignore.end(), overrides.ignore.begin(), overrides.ignore.end());

    std::vector<std::string> unordered = profile.unordered;
    unordered.insert(unordered.end(), overrides.unordered.begin(), overrides.unordered.end());

    bool show_nested = overrides.show_nested_differences.value_or(
        profile.show_nested_differences.value_or(false));
    bool identify = overrides.identify_array_item_changes.value_or(
        profile.identify_array_item_changes.value_or(true));

    return diff::RuleSet::from(ignore, unordered, show_nested, identify);
}

}  // namespace jsondiff::profile
