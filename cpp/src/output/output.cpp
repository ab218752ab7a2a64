// ==============================================================================
// output.cpp - Пользовательский вывод
// ==============================================================================
//
// Только этот модуль пишет в stdout/stderr. Байты первичны: std::endl не
// используется, перевод строки всегда "\n".
//
// ==============================================================================

#include "jsondiff/output.hpp"

#include "jsondiff/platform.hpp"

#include <cstdio>
#include <string>

namespace jsondiff::output {

// ----------------------------------------------------------------------------
// ANSI Escape Codes
// ----------------------------------------------------------------------------

namespace {

// ANSI SGR (Select Graphic Rendition) коды
constexpr const char* ANSI_RESET = "\x1b[0m";
constexpr const char* ANSI_GREEN = "\x1b[32m";
constexpr const char* ANSI_YELLOW = "\x1b[33m";
constexpr const char* ANSI_RED = "\x1b[31m";
constexpr const char* ANSI_CYAN = "\x1b[36m";
constexpr const char* ANSI_MAGENTA = "\x1b[35m";

constexpr const char* FORMAT_MAGIC = "DIFF-JSON v1";

}  // namespace

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg) : config_(cfg) {
    if (config_.output_path.has_value()) {
        open_output_file();
    }
}

Writer::~Writer() {
    close_output_file();
    flush();
}

void Writer::write(Stream s, std::string_view bytes) {
    FILE* f = nullptr;

    // stdout при открытом --output уходит в файл
    if (s == Stream::Stdout && output_file_ != nullptr) {
        f = output_file_;
    } else {
        f = get_file(s);
    }

    if (f != nullptr) {
        std::fwrite(bytes.data(), 1, bytes.size(), f);
    }
}

void Writer::write_line(Stream s, std::string_view bytes) {
    write(s, bytes);
    write(s, "\n");
}

FILE* Writer::get_file(Stream s) const {
    return (s == Stream::Stdout) ? stdout : stderr;
}

void Writer::write_prefix(std::string_view prefix, Color color) {
    if (supports_color(Stream::Stderr)) {
        write(Stream::Stderr, ansi_color_code(color));
        write(Stream::Stderr, prefix);
        write(Stream::Stderr, ansi_reset_code());
    } else {
        write(Stream::Stderr, prefix);
    }
}

void Writer::info(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefix("[+] ", Color::Green);
    write_line(Stream::Stderr, message);
}

void Writer::warn(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefix("[!] ", Color::Yellow);
    write_line(Stream::Stderr, message);
}

void Writer::error(std::string_view message) {
    // Ошибки печатаются всегда, даже при --quiet
    write_prefix("[x] ", Color::Red);
    write_line(Stream::Stderr, message);
}

void Writer::debug(std::string_view message) {
    if (config_.verbose <= 0) {
        return;
    }
    write_prefix("[*] ", Color::Cyan);
    write_line(Stream::Stderr, message);
}

void Writer::trace(std::string_view message) {
    if (config_.verbose <= 1) {
        return;
    }
    write_prefix("[~] ", Color::Magenta);
    write_line(Stream::Stderr, message);
}

void Writer::colored_line(Stream s, std::string_view message, Color color) {
    // В файл - без ANSI кодов
    bool use_color = color != Color::Default &&
                     ((s == Stream::Stdout && output_file_ == nullptr && supports_color(s)) ||
                      (s == Stream::Stderr && supports_color(s)));

    if (use_color) {
        write(s, ansi_color_code(color));
        write(s, message);
        write(s, ansi_reset_code());
    } else {
        write(s, message);
    }
    write(s, "\n");
}

void Writer::write_result(const diff::DiffResult& result, Style style) {
    write(Stream::Stdout, format_header(result));
    for (const auto& entry : result.entries) {
        Color color = style == Style::Readable ? entry_color(entry.type) : Color::Default;
        colored_line(Stream::Stdout, format_entry(entry, style), color);
    }
    flush();
}

void Writer::flush() {
    std::fflush(stdout);
    std::fflush(stderr);
    if (output_file_ != nullptr) {
        std::fflush(output_file_);
    }
}

bool Writer::open_output_file() {
    if (!config_.output_path.has_value()) {
        return false;
    }

    const auto& path = config_.output_path.value();

#ifdef _WIN32
    // Windows: _wfopen для Unicode путей
    output_file_ = _wfopen(path.c_str(), L"wb");
#else
    std::string path_str = platform::path_to_utf8(path);
    output_file_ = std::fopen(path_str.c_str(), "wb");
#endif

    return output_file_ != nullptr;
}

void Writer::close_output_file() {
    if (output_file_ != nullptr) {
        std::fflush(output_file_);
        std::fclose(output_file_);
        output_file_ = nullptr;
    }
}

// ----------------------------------------------------------------------------
// Форматирование отчёта
// ----------------------------------------------------------------------------

std::string format_tag(diff::DiffType type, Style style) {
    if (style == Style::Symbols) {
        return diff::symbol(type);
    }
    return std::string("[") + diff::readable_text(type) + "]";
}

std::string format_lines(const diff::DiffEntry& entry) {
    if (entry.left_line.has_value() && entry.right_line.has_value()) {
        return " (L" + std::to_string(*entry.left_line) + ":L" +
               std::to_string(*entry.right_line) + ")";
    }
    if (entry.left_line.has_value()) {
        return " (L" + std::to_string(*entry.left_line) + ")";
    }
    if (entry.right_line.has_value()) {
        return " (L" + std::to_string(*entry.right_line) + ")";
    }
    return {};
}

std::string format_value(const std::optional<Value>& value) {
    if (!value.has_value()) {
        return "null";
    }
    return value->to_json();
}

std::string format_entry(const diff::DiffEntry& entry, Style style) {
    std::string line = format_tag(entry.type, style);
    line += ' ';
    line += entry.path.to_string();
    line += format_lines(entry);
    line += ": ";

    switch (entry.type) {
    case diff::DiffType::Added:
        line += format_value(entry.right_value);
        break;
    case diff::DiffType::Removed:
        line += format_value(entry.left_value);
        break;
    case diff::DiffType::Modified:
    case diff::DiffType::ArrayItemChanged:
        line += format_value(entry.left_value);
        line += " -> ";
        line += format_value(entry.right_value);
        break;
    case diff::DiffType::ArrayReordered:
        line += "[REORDERED]";
        break;
    case diff::DiffType::Ignored:
        line += "[IGNORED]";
        break;
    }
    return line;
}

std::string format_header(const diff::DiffResult& result) {
    std::string out = FORMAT_MAGIC;
    out += '\n';
    if (result.left_file.has_value()) {
        out += "LEFT: " + *result.left_file + "\n";
    }
    if (result.right_file.has_value()) {
        out += "RIGHT: " + *result.right_file + "\n";
    }
    out += "TIMESTAMP: " + platform::format_rfc3339(result.timestamp) + "\n";
    out += '\n';
    return out;
}

std::string format_result(const diff::DiffResult& result, Style style) {
    std::string out = format_header(result);
    for (const auto& entry : result.entries) {
        out += format_entry(entry, style);
        out += '\n';
    }
    return out;
}

Color entry_color(diff::DiffType type) {
    switch (type) {
    case diff::DiffType::Added:
        return Color::Green;
    case diff::DiffType::Removed:
        return Color::Red;
    case diff::DiffType::Modified:
        return Color::Yellow;
    case diff::DiffType::ArrayItemChanged:
        return Color::Cyan;
    case diff::DiffType::ArrayReordered:
        return Color::Magenta;
    case diff::DiffType::Ignored:
    default:
        return Color::Default;
    }
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string ansi_color_code(Color color) {
    switch (color) {
    case Color::Green:
        return ANSI_GREEN;
    case Color::Yellow:
        return ANSI_YELLOW;
    case Color::Red:
        return ANSI_RED;
    case Color::Cyan:
        return ANSI_CYAN;
    case Color::Magenta:
        return ANSI_MAGENTA;
    case Color::Default:
    default:
        return "";
    }
}

std::string ansi_reset_code() {
    return ANSI_RESET;
}

bool supports_color(Stream s) {
    if (s == Stream::Stdout) {
        return platform::is_tty_stdout();
    } else {
        return platform::is_tty_stderr();
    }
}

}  // namespace jsondiff::output
