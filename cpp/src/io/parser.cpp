// ==============================================================================
// parser.cpp - Разбор JSON с картой путь -> строка
// ==============================================================================
//
// Разбор идёт через SAX интерфейс RapidJSON (rapidjson::Reader) поверх
// входного потока, который считает переводы строк. Обработчик собирает
// дерево Value на собственном стеке фреймов и в момент начала каждого
// значения записывает текущую строку под его конкретным путём.
//
// Для скаляров обработчик вызывается сразу после лексемы (строка JSON не
// может содержать сырой перевод строки), для контейнеров - сразу после
// '{' / '['. В обоих случаях счётчик строк указывает на строку начала.
//
// ==============================================================================

#include <jsondiff/parser.hpp>
#include <jsondiff/platform.hpp>

#include <rapidjson/error/en.h>
#include <rapidjson/reader.h>
#include <sstream>
#include <unordered_map>
#include <vector>

namespace jsondiff::parser {

// ============================================================================
// PathLineMap
// ============================================================================

void PathLineMap::record(const path::JsonPath& p, std::size_t line) {
    lines_[p.to_string()] = line;
}

std::optional<std::size_t> PathLineMap::find(const path::JsonPath& p) const {
    auto it = lines_.find(p.to_string());
    if (it == lines_.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ============================================================================
// ParseError
// ============================================================================

std::string ParseError::format() const {
    std::ostringstream oss;
    if (kind == ParseErrorKind::Io) {
        oss << "failed to read '" << source << "': " << message;
        return oss.str();
    }
    oss << "failed to parse";
    if (!source.empty()) {
        oss << " '" << source << "'";
    }
    oss << " at line " << line << ", column " << column << ": " << message;
    return oss.str();
}

std::pair<std::size_t, std::size_t> offset_to_line_column(std::string_view text,
                                                          std::size_t offset) {
    if (offset > text.size()) {
        offset = text.size();
    }
    std::size_t line = 1;
    std::size_t line_start = 0;
    for (std::size_t i = 0; i < offset; ++i) {
        if (text[i] == '\n') {
            ++line;
            line_start = i + 1;
        }
    }
    return {line, offset - line_start + 1};
}

namespace {

// ============================================================================
// LineCountingStream - входной поток RapidJSON с подсчётом строк
// ============================================================================

class LineCountingStream {
public:
    typedef char Ch;

    explicit LineCountingStream(std::string_view text) : text_(text) {}

    Ch Peek() const { return pos_ < text_.size() ? text_[pos_] : '\0'; }

    Ch Take() {
        if (pos_ >= text_.size()) {
            return '\0';
        }
        Ch c = text_[pos_++];
        if (c == '\n') {
            ++line_;
        }
        return c;
    }

    std::size_t Tell() const { return pos_; }

    // Поток только для чтения
    Ch* PutBegin() {
        RAPIDJSON_ASSERT(false);
        return nullptr;
    }
    void Put(Ch) { RAPIDJSON_ASSERT(false); }
    void Flush() { RAPIDJSON_ASSERT(false); }
    std::size_t PutEnd(Ch*) {
        RAPIDJSON_ASSERT(false);
        return 0;
    }

    /// Текущая строка (1-based)
    std::size_t line() const { return line_; }

private:
    std::string_view text_;
    std::size_t pos_ = 0;
    std::size_t line_ = 1;
};

// ============================================================================
// TreeBuilder - SAX обработчик
// ============================================================================

class TreeBuilder {
public:
    explicit TreeBuilder(const LineCountingStream& stream) : stream_(stream) {}

    bool Null() { return scalar(Value::make_null()); }
    bool Bool(bool b) { return scalar(Value::make_bool(b)); }
    bool Int(int i) { return scalar(Value::make_int(i)); }
    bool Uint(unsigned u) { return scalar(Value::make_uint(u)); }
    bool Int64(std::int64_t i) { return scalar(Value::make_int(i)); }
    bool Uint64(std::uint64_t u) { return scalar(Value::make_uint(u)); }
    bool Double(double d) { return scalar(Value::make_double(d)); }

    // kParseNumbersAsStringsFlag не используется
    bool RawNumber(const char*, rapidjson::SizeType, bool) { return false; }

    bool String(const char* str, rapidjson::SizeType length, bool /*copy*/) {
        return scalar(Value::make_string(std::string(str, length)));
    }

    bool StartObject() {
        Frame frame;
        frame.is_object = true;
        frame.path = begin_value();
        frames_.push_back(std::move(frame));
        return true;
    }

    bool Key(const char* str, rapidjson::SizeType length, bool /*copy*/) {
        frames_.back().pending_key.assign(str, length);
        return true;
    }

    bool EndObject(rapidjson::SizeType /*count*/) {
        Frame frame = std::move(frames_.back());
        frames_.pop_back();
        return attach(Value(std::move(frame.object)));
    }

    bool StartArray() {
        Frame frame;
        frame.is_object = false;
        frame.path = begin_value();
        frames_.push_back(std::move(frame));
        return true;
    }

    bool EndArray(rapidjson::SizeType /*count*/) {
        Frame frame = std::move(frames_.back());
        frames_.pop_back();
        return attach(Value(std::move(frame.array)));
    }

    Value take_root() { return std::move(root_); }
    PathLineMap take_lines() { return std::move(lines_); }

private:
    struct Frame {
        bool is_object = false;
        path::JsonPath path;
        ValueArray array;
        ValueObject object;
        std::unordered_map<std::string, std::size_t> key_index;
        std::string pending_key;
    };

    // Путь нового значения + запись строки его начала
    path::JsonPath begin_value() {
        path::JsonPath p;
        if (!frames_.empty()) {
            const Frame& parent = frames_.back();
            p = parent.is_object ? parent.path.child(parent.pending_key)
                                 : parent.path.child(parent.array.size());
        }
        lines_.record(p, stream_.line());
        return p;
    }

    bool scalar(Value v) {
        begin_value();
        return attach(std::move(v));
    }

    bool attach(Value v) {
        if (frames_.empty()) {
            root_ = std::move(v);
            return true;
        }

        Frame& parent = frames_.back();
        if (!parent.is_object) {
            parent.array.push_back(std::move(v));
            return true;
        }

        // Повторный ключ: позиция первого вхождения, значение последнего
        auto it = parent.key_index.find(parent.pending_key);
        if (it != parent.key_index.end()) {
            parent.object[it->second].second = std::move(v);
        } else {
            parent.key_index.emplace(parent.pending_key, parent.object.size());
            parent.object.emplace_back(parent.pending_key, std::move(v));
        }
        return true;
    }

    const LineCountingStream& stream_;
    std::vector<Frame> frames_;
    Value root_;
    PathLineMap lines_;
};

}  // namespace

// ============================================================================
// parse / parse_file
// ============================================================================

ParseResult parse(std::string_view text, const std::string& source) {
    ParseResult result;

    LineCountingStream stream(text);
    TreeBuilder builder(stream);
    rapidjson::Reader reader;

    reader.Parse<rapidjson::kParseFullPrecisionFlag>(stream, builder);

    if (reader.HasParseError()) {
        auto [line, column] = offset_to_line_column(text, reader.GetErrorOffset());
        result.error.kind = ParseErrorKind::Syntax;
        result.error.line = line;
        result.error.column = column;
        result.error.message = rapidjson::GetParseError_En(reader.GetParseErrorCode());
        result.error.source = source;
        return result;
    }

    result.ok = true;
    result.document.value = builder.take_root();
    result.document.lines = builder.take_lines();
    return result;
}

ParseResult parse_file(const std::filesystem::path& file) {
    std::string source = platform::path_to_utf8(file);

    auto content = platform::read_file(file);
    if (!content.has_value()) {
        ParseResult result;
        result.error = ParseError{ParseErrorKind::Io, 0, 0, "could not open file", source};
        return result;
    }

    return parse(*content, source);
}

}  // namespace jsondiff::parser
