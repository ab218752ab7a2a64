// ==============================================================================
// path.cpp - JsonPath, компиляция и сопоставление шаблонов путей
// ==============================================================================

#include <jsondiff/path.hpp>

#include <cctype>
#include <sstream>

namespace jsondiff::path {

// ============================================================================
// PathSegment
// ============================================================================

PathSegment PathSegment::field(std::string name) {
    PathSegment seg;
    seg.kind = Kind::Field;
    seg.name = std::move(name);
    return seg;
}

PathSegment PathSegment::at(std::size_t index) {
    PathSegment seg;
    seg.kind = Kind::Index;
    seg.index = index;
    return seg;
}

bool PathSegment::operator==(const PathSegment& other) const {
    if (kind != other.kind) {
        return false;
    }
    return kind == Kind::Field ? name == other.name : index == other.index;
}

// ============================================================================
// Токенизатор шаблонов
// ============================================================================
//
// Общий разбор для JsonPath::parse (allow_patterns = false) и compile
// (allow_patterns = true).
//

namespace {

constexpr std::size_t MAX_INDEX_DIGITS = 18;

bool is_name_terminator(char c) {
    return c == '.' || c == '[';
}

bool is_forbidden_name_char(char c) {
    return c == ']' || c == '\'' || c == '"' || c == '\\' ||
           std::isspace(static_cast<unsigned char>(c)) != 0;
}

struct SegmentParse {
    bool ok = false;
    std::vector<PatternSegment> segments;
    std::size_t error_position = 0;
    std::string error_message;
};

class SegmentParser {
public:
    SegmentParser(std::string_view text, bool allow_patterns)
        : text_(text), allow_patterns_(allow_patterns) {}

    SegmentParse run() {
        if (text_.empty() || text_[0] != '$') {
            return fail(0, "pattern must start with '$'");
        }
        pos_ = 1;

        while (pos_ < text_.size()) {
            char c = text_[pos_];
            if (c == '.') {
                if (peek(1) == '.') {
                    if (!parse_descent()) {
                        return result_;
                    }
                    continue;
                }
                ++pos_;
                if (!parse_name_or_wildcard()) {
                    return result_;
                }
            } else if (c == '[') {
                if (!parse_bracket()) {
                    return result_;
                }
            } else {
                return fail(pos_, std::string("unexpected character '") + c + "'");
            }
        }

        result_.ok = true;
        return result_;
    }

private:
    char peek(std::size_t offset) const {
        std::size_t p = pos_ + offset;
        return p < text_.size() ? text_[p] : '\0';
    }

    SegmentParse fail(std::size_t position, std::string message) {
        result_.ok = false;
        result_.error_position = position;
        result_.error_message = std::move(message);
        return result_;
    }

    bool push(PatternSegment::Kind kind, std::string name = {}, std::size_t index = 0) {
        PatternSegment seg;
        seg.kind = kind;
        seg.name = std::move(name);
        seg.index = index;
        result_.segments.push_back(std::move(seg));
        return true;
    }

    // ".." + сегмент
    bool parse_descent() {
        std::size_t start = pos_;
        if (!allow_patterns_) {
            fail(start, "recursive descent is not allowed in a concrete path");
            return false;
        }
        pos_ += 2;
        if (pos_ >= text_.size()) {
            fail(start, "recursive descent must be followed by a segment");
            return false;
        }
        if (text_[pos_] == '.') {
            fail(pos_, "unexpected character '.'");
            return false;
        }
        push(PatternSegment::Kind::Descent);
        if (text_[pos_] == '[') {
            return parse_bracket();
        }
        return parse_name_or_wildcard();
    }

    // имя поля или * после '.'
    bool parse_name_or_wildcard() {
        std::size_t start = pos_;
        if (pos_ >= text_.size() || is_name_terminator(text_[pos_])) {
            fail(start, "empty field name");
            return false;
        }

        if (text_[pos_] == '*' && (pos_ + 1 == text_.size() || is_name_terminator(peek(1)))) {
            if (!allow_patterns_) {
                fail(start, "wildcard is not allowed in a concrete path");
                return false;
            }
            ++pos_;
            return push(PatternSegment::Kind::Wildcard);
        }

        std::string name;
        while (pos_ < text_.size() && !is_name_terminator(text_[pos_])) {
            char c = text_[pos_];
            if (is_forbidden_name_char(c)) {
                fail(pos_, std::string("unexpected character '") + c + "'");
                return false;
            }
            name.push_back(c);
            ++pos_;
        }
        return push(PatternSegment::Kind::Field, std::move(name));
    }

    // [...]: индекс, *, 'name' или "name"
    bool parse_bracket() {
        std::size_t open = pos_;
        ++pos_;
        if (pos_ >= text_.size()) {
            fail(open, "unterminated bracket");
            return false;
        }

        char c = text_[pos_];
        if (c == '\'' || c == '"') {
            std::string name;
            if (!parse_quoted(c, name)) {
                return false;
            }
            if (!expect_close(open)) {
                return false;
            }
            return push(PatternSegment::Kind::Field, std::move(name));
        }

        if (c == '*') {
            if (!allow_patterns_) {
                fail(pos_, "wildcard is not allowed in a concrete path");
                return false;
            }
            ++pos_;
            if (!expect_close(open)) {
                return false;
            }
            return push(PatternSegment::Kind::Wildcard);
        }

        if (c == ']') {
            fail(open, "empty brackets");
            return false;
        }

        std::size_t start = pos_;
        while (pos_ < text_.size() && text_[pos_] != ']') {
            ++pos_;
        }
        if (pos_ >= text_.size()) {
            fail(open, "unterminated bracket");
            return false;
        }

        std::string_view digits = text_.substr(start, pos_ - start);
        for (char d : digits) {
            if (std::isdigit(static_cast<unsigned char>(d)) == 0) {
                fail(start, "invalid array index '" + std::string(digits) + "'");
                return false;
            }
        }
        if (digits.size() > MAX_INDEX_DIGITS) {
            fail(start, "array index out of range '" + std::string(digits) + "'");
            return false;
        }

        std::size_t index = 0;
        for (char d : digits) {
            index = index * 10 + static_cast<std::size_t>(d - '0');
        }
        ++pos_;  // ']'
        return push(PatternSegment::Kind::Index, {}, index);
    }

    bool parse_quoted(char quote, std::string& out) {
        std::size_t open = pos_;
        ++pos_;
        while (pos_ < text_.size()) {
            char c = text_[pos_];
            if (c == '\\') {
                if (pos_ + 1 >= text_.size()) {
                    break;
                }
                out.push_back(text_[pos_ + 1]);
                pos_ += 2;
                continue;
            }
            if (c == quote) {
                ++pos_;
                return true;
            }
            out.push_back(c);
            ++pos_;
        }
        fail(open, "unterminated quoted name");
        return false;
    }

    bool expect_close(std::size_t open) {
        if (pos_ >= text_.size()) {
            fail(open, "unterminated bracket");
            return false;
        }
        if (text_[pos_] != ']') {
            fail(pos_, std::string("expected ']' but found '") + text_[pos_] + "'");
            return false;
        }
        ++pos_;
        return true;
    }

    std::string_view text_;
    bool allow_patterns_;
    std::size_t pos_ = 0;
    SegmentParse result_;
};

}  // namespace

// ============================================================================
// JsonPath
// ============================================================================

std::optional<JsonPath> JsonPath::parse(std::string_view text) {
    SegmentParse parsed = SegmentParser(text, false).run();
    if (!parsed.ok) {
        return std::nullopt;
    }

    std::vector<PathSegment> segments;
    segments.reserve(parsed.segments.size());
    for (auto& seg : parsed.segments) {
        if (seg.kind == PatternSegment::Kind::Index) {
            segments.push_back(PathSegment::at(seg.index));
        } else {
            segments.push_back(PathSegment::field(std::move(seg.name)));
        }
    }
    return JsonPath(std::move(segments));
}

JsonPath JsonPath::child(const std::string& name) const {
    JsonPath out(*this);
    out.segments_.push_back(PathSegment::field(name));
    return out;
}

JsonPath JsonPath::child(std::size_t index) const {
    JsonPath out(*this);
    out.segments_.push_back(PathSegment::at(index));
    return out;
}

bool JsonPath::is_ancestor_of(const JsonPath& other) const {
    if (segments_.size() >= other.segments_.size()) {
        return false;
    }
    for (std::size_t i = 0; i < segments_.size(); ++i) {
        if (segments_[i] != other.segments_[i]) {
            return false;
        }
    }
    return true;
}

bool needs_quoting(std::string_view name) {
    if (name.empty() || name == "*") {
        return true;
    }
    for (char c : name) {
        if (is_name_terminator(c) || is_forbidden_name_char(c)) {
            return true;
        }
    }
    return false;
}

std::string JsonPath::to_string() const {
    std::string out = "$";
    for (const auto& seg : segments_) {
        if (seg.is_index()) {
            out += "[";
            out += std::to_string(seg.index);
            out += "]";
            continue;
        }
        if (!needs_quoting(seg.name)) {
            out += ".";
            out += seg.name;
            continue;
        }
        out += "['";
        for (char c : seg.name) {
            if (c == '\'' || c == '\\') {
                out.push_back('\\');
            }
            out.push_back(c);
        }
        out += "']";
    }
    return out;
}

// ============================================================================
// PathPattern
// ============================================================================

bool PatternSegment::accepts(const PathSegment& segment) const {
    switch (kind) {
    case Kind::Field:
        return segment.is_field() && segment.name == name;
    case Kind::Index:
        return segment.is_index() && segment.index == index;
    case Kind::Wildcard:
        return true;
    case Kind::Descent:
        return false;
    }
    return false;
}

// Динамическое программирование по (префикс шаблона, префикс пути):
// row[j] == true  <=>  первые i матчеров покрывают первые j сегментов пути.
// Descent закрывает любое количество сегментов (включая ноль).
bool PathPattern::matches(const JsonPath& path) const {
    const auto& segs = path.segments();
    const std::size_t n = segs.size();

    std::vector<char> row(n + 1, 0);
    row[0] = 1;

    for (const auto& matcher : segments_) {
        std::vector<char> next(n + 1, 0);
        if (matcher.kind == PatternSegment::Kind::Descent) {
            char reachable = 0;
            for (std::size_t j = 0; j <= n; ++j) {
                reachable = static_cast<char>(reachable || row[j]);
                next[j] = reachable;
            }
        } else {
            for (std::size_t j = 1; j <= n; ++j) {
                next[j] = static_cast<char>(row[j - 1] && matcher.accepts(segs[j - 1]));
            }
        }
        row.swap(next);
    }

    return row[n] != 0;
}

bool any_matches(const std::vector<PathPattern>& patterns, const JsonPath& path) {
    for (const auto& pattern : patterns) {
        if (pattern.matches(path)) {
            return true;
        }
    }
    return false;
}

// ============================================================================
// PatternError / compile
// ============================================================================

std::string PatternError::format() const {
    std::ostringstream oss;
    oss << "invalid path pattern '" << pattern << "' at position " << position << ": "
        << message;
    return oss.str();
}

PatternResult compile(std::string_view text) {
    PatternResult result;

    SegmentParse parsed = SegmentParser(text, true).run();
    if (!parsed.ok) {
        result.error = PatternError{std::string(text), parsed.error_position,
                                    std::move(parsed.error_message)};
        return result;
    }

    result.ok = true;
    result.pattern = PathPattern(std::string(text), std::move(parsed.segments));
    return result;
}

}  // namespace jsondiff::path
