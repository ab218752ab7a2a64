// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================
//
// Собственный разбор argv: короткие и длинные опции, значение опции -
// следующий аргумент или "--opt=value". "--" завершает опции.
//
// ==============================================================================

#include "jsondiff/cli.hpp"

#include "jsondiff/platform.hpp"

#include <cstring>
#include <utility>

namespace jsondiff::cli {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

namespace {

constexpr const char* USAGE = "Usage: jsondiff [OPTIONS] <FILE1> <FILE2>";

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

// "-vvv" -> 3, иначе 0
int count_verbose(const char* arg) {
    if (arg[0] != '-' || arg[1] != 'v') {
        return 0;
    }
    int n = 0;
    for (const char* p = arg + 1; *p != '\0'; ++p) {
        if (*p != 'v') {
            return 0;
        }
        ++n;
    }
    return n;
}

/// Опция со значением: "-p X", "--profile X", "--profile=X"
class ValueOption {
public:
    ValueOption(const char* short_name, const char* long_name, const char* value_name)
        : short_(short_name), long_(long_name), value_name_(value_name) {}

    /// Совпадает ли аргумент с опцией
    bool matches(const char* arg) const {
        if ((short_ != nullptr && str_eq(arg, short_)) || str_eq(arg, long_)) {
            return true;
        }
        return starts_with(arg, long_) && arg[std::strlen(long_)] == '=';
    }

    /// Извлечь значение; при отсутствии - std::nullopt, i не меняется
    std::optional<std::string> take(int argc, char** argv, int& i) const {
        const char* arg = argv[i];
        std::size_t long_len = std::strlen(long_);
        if (starts_with(arg, long_) && arg[long_len] == '=') {
            return std::string(arg + long_len + 1);
        }
        if (i + 1 >= argc) {
            return std::nullopt;
        }
        ++i;
        return std::string(argv[i]);
    }

    std::string display() const {
        std::string out = long_;
        out += " <";
        out += value_name_;
        out += ">";
        return out;
    }

private:
    const char* short_;
    const char* long_;
    const char* value_name_;
};

const ValueOption OPT_PROFILE("-p", "--profile", "PROFILE");
const ValueOption OPT_OUTPUT("-o", "--output", "OUTPUT");
const ValueOption OPT_IGNORE("-I", "--ignore", "PATTERN");
const ValueOption OPT_UNORDERED("-U", "--unordered", "PATTERN");

std::string missing_value(const ValueOption& opt) {
    return "error: a value is required for '" + opt.display() + "' but none was supplied";
}

ParseResult usage_error(ParseResult result, const std::string& message) {
    result.ok = false;
    result.diagnostic.exit_code = 2;
    result.diagnostic.stderr_message = render_usage_error(message);
    return result;
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// render_version / render_help
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("jsondiff ") + VERSION + "\n";
}

std::string render_help() {
    return std::string(ABOUT) +
           "\n"
           "\n"
           "Usage: jsondiff [OPTIONS] <FILE1> <FILE2>\n"
           "\n"
           "Arguments:\n"
           "  <FILE1>  Left (source) JSON file\n"
           "  <FILE2>  Right (target) JSON file\n"
           "\n"
           "Options:\n"
           "  -p, --profile <PROFILE>    YAML profile with comparison rules\n"
           "  -o, --output <OUTPUT>      Write the diff to a file instead of stdout\n"
           "  -S, --symbols              Use symbols instead of readable tags\n"
           "  -I, --ignore <PATTERN>     Additional ignore pattern (repeatable)\n"
           "  -U, --unordered <PATTERN>  Additional unordered array pattern (repeatable)\n"
           "      --show-nested          Show nested differences of changed array items\n"
           "      --no-item-changes      Report changed arrays as a whole\n"
           "  -q, --quiet                Suppress informational output\n"
           "  -v...                      Print verbose output\n"
           "  -h, --help                 Print help\n"
           "  -V, --version              Print version\n"
           "\n"
           "Examples:\n"
           "\n"
           "    Compare two files:\n"
           "        jsondiff old.json new.json\n"
           "\n"
           "    Ignore volatile fields and treat tags as a set:\n"
           "        jsondiff old.json new.json -I '$.meta.*' -U '$.tags'\n"
           "\n"
           "    Use a profile and write symbols to a file:\n"
           "        jsondiff old.json new.json -p profile.yml -S -o diff.txt\n";
}

std::string render_usage_error(const std::string& error_msg) {
    return error_msg + "\n\n" + USAGE + "\n\nFor more information, try '--help'.\n";
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.ok = false;
    result.command = HelpCommand{};

    if (argc < 2) {
        // Без аргументов: справка в stderr, exit code 2
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_help();
        return result;
    }

    DiffCommand diff_cmd;
    std::vector<const char*> positionals;
    bool options_done = false;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (options_done || arg[0] != '-' || str_eq(arg, "-")) {
            positionals.push_back(arg);
            continue;
        }

        if (str_eq(arg, "--")) {
            options_done = true;
        } else if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (int v = count_verbose(arg); v > 0) {
            result.global.verbose += v;
        } else if (str_eq(arg, "-q") || str_eq(arg, "--quiet")) {
            result.global.quiet = true;
        } else if (str_eq(arg, "-S") || str_eq(arg, "--symbols")) {
            diff_cmd.symbols = true;
        } else if (str_eq(arg, "--show-nested")) {
            diff_cmd.show_nested = true;
        } else if (str_eq(arg, "--no-item-changes")) {
            diff_cmd.no_item_changes = true;
        } else if (OPT_PROFILE.matches(arg)) {
            auto value = OPT_PROFILE.take(argc, argv, i);
            if (!value.has_value()) {
                return usage_error(std::move(result), missing_value(OPT_PROFILE));
            }
            diff_cmd.profile = platform::path_from_utf8(*value);
        } else if (OPT_OUTPUT.matches(arg)) {
            auto value = OPT_OUTPUT.take(argc, argv, i);
            if (!value.has_value()) {
                return usage_error(std::move(result), missing_value(OPT_OUTPUT));
            }
            diff_cmd.output = platform::path_from_utf8(*value);
        } else if (OPT_IGNORE.matches(arg)) {
            auto value = OPT_IGNORE.take(argc, argv, i);
            if (!value.has_value()) {
                return usage_error(std::move(result), missing_value(OPT_IGNORE));
            }
            diff_cmd.ignore.push_back(*value);
        } else if (OPT_UNORDERED.matches(arg)) {
            auto value = OPT_UNORDERED.take(argc, argv, i);
            if (!value.has_value()) {
                return usage_error(std::move(result), missing_value(OPT_UNORDERED));
            }
            diff_cmd.unordered.push_back(*value);
        } else {
            return usage_error(std::move(result),
                               std::string("error: unexpected argument '") + arg + "' found");
        }
    }

    if (positionals.size() < 2) {
        std::string missing = positionals.empty() ? "  <FILE1>\n  <FILE2>" : "  <FILE2>";
        return usage_error(std::move(result),
                           "error: the following required arguments were not provided:\n" +
                               missing);
    }
    if (positionals.size() > 2) {
        return usage_error(std::move(result), std::string("error: unexpected argument '") +
                                                  positionals[2] + "' found");
    }

    diff_cmd.left = platform::path_from_utf8(positionals[0]);
    diff_cmd.right = platform::path_from_utf8(positionals[1]);

    result.ok = true;
    result.command = std::move(diff_cmd);
    return result;
}

}  // namespace jsondiff::cli
