#include "avrolite/value.hpp"
#include "avrolite/error.hpp"

#include <charconv>
#include <cmath>
#include <sstream>
#include <system_error>

namespace avrolite {

// ------------------------------
// Value helpers
// ------------------------------

Value Value::make_array() {
    Value v;
    v.v = Array{};
    return v;
}

Value Value::make_object() {
    Value v;
    v.v = Object{};
    return v;
}

double Value::as_double() const {
    if (is_int()) return static_cast<double>(std::get<std::int64_t>(v));
    return std::get<double>(v);
}

const Value* Value::find(const std::string& key) const {
    if (!is_object()) return nullptr;
    const auto& obj = std::get<Object>(v);
    auto it = obj.find(key);
    if (it == obj.end()) return nullptr;
    return &it->second;
}

Value* Value::find(const std::string& key) {
    if (!is_object()) return nullptr;
    auto& obj = std::get<Object>(v);
    auto it = obj.find(key);
    if (it == obj.end()) return nullptr;
    return &it->second;
}

Value& Value::operator[](const std::string& key) {
    if (is_null()) v = Object{};
    return std::get<Object>(v)[key];
}

const char* Value::kind_name() const noexcept {
    switch (v.index()) {
        case 0: return "null";
        case 1: return "boolean";
        case 2: return "integer";
        case 3: return "number";
        case 4: return "string";
        case 5: return "array";
        default: return "object";
    }
}

// ------------------------------
// JSON reader
// ------------------------------

namespace {

constexpr int kMaxJsonDepth = 512;

// Encodes one code point; `cp` is at most 0x10FFFF.
void put_utf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
        return;
    }
    char buf[4];
    int n = cp < 0x800 ? 2 : cp < 0x10000 ? 3 : 4;
    for (int i = n - 1; i > 0; --i) {
        buf[i] = static_cast<char>(0x80 | (cp & 0x3F));
        cp >>= 6;
    }
    static const unsigned char lead[] = {0, 0, 0xC0, 0xE0, 0xF0};
    buf[0] = static_cast<char>(lead[n] | cp);
    out.append(buf, static_cast<std::size_t>(n));
}

// Single-character escapes; 0 for anything else.
char unescape(char c) noexcept {
    switch (c) {
        case '"': return '"';
        case '\\': return '\\';
        case '/': return '/';
        case 'b': return '\b';
        case 'f': return '\f';
        case 'n': return '\n';
        case 'r': return '\r';
        case 't': return '\t';
        default: return 0;
    }
}

int hex_digit(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

class JsonReader {
public:
    explicit JsonReader(std::string_view text) : text_(text) {}

    Value document() {
        Value out = value();
        skip_space();
        if (pos_ < text_.size()) fail("trailing data in JSON");
        return out;
    }

private:
    struct DepthGuard {
        explicit DepthGuard(JsonReader& r) : r_(r) {
            if (++r_.depth_ > kMaxJsonDepth) r_.fail("JSON nesting too deep");
        }
        ~DepthGuard() { --r_.depth_; }
        JsonReader& r_;
    };

    [[noreturn]] void fail(const std::string& what) const {
        throw AvroError(ErrorKind::JsonParse, what + " at offset " + std::to_string(pos_));
    }

    bool at_end() const noexcept { return pos_ >= text_.size(); }
    char cur() const noexcept { return at_end() ? '\0' : text_[pos_]; }

    char next() {
        if (at_end()) fail("unexpected end of JSON");
        return text_[pos_++];
    }

    void skip_space() noexcept {
        while (!at_end()) {
            char c = text_[pos_];
            if (c != ' ' && c != '\t' && c != '\r' && c != '\n') break;
            ++pos_;
        }
    }

    // Consumes `c` after optional whitespace.
    bool accept(char c) {
        skip_space();
        if (cur() != c) return false;
        ++pos_;
        return true;
    }

    Value value() {
        skip_space();
        switch (cur()) {
            case '{': return object();
            case '[': return array();
            case '"': ++pos_; return Value(string_body());
            case 't': literal("true"); return Value(true);
            case 'f': literal("false"); return Value(false);
            case 'n': literal("null"); return Value();
            default: return number();
        }
    }

    void literal(std::string_view word) {
        if (text_.substr(pos_, word.size()) != word) fail("invalid literal");
        pos_ += word.size();
    }

    Value array() {
        DepthGuard guard(*this);
        ++pos_;
        Value out = Value::make_array();
        if (accept(']')) return out;
        do {
            out.as_array().push_back(value());
        } while (accept(','));
        if (!accept(']')) fail("expected ',' or ']'");
        return out;
    }

    Value object() {
        DepthGuard guard(*this);
        ++pos_;
        Value out = Value::make_object();
        if (accept('}')) return out;
        do {
            if (!accept('"')) fail("expected string key");
            std::string key = string_body();
            if (!accept(':')) fail("expected ':'");
            out.as_object()[std::move(key)] = value();
        } while (accept(','));
        if (!accept('}')) fail("expected ',' or '}'");
        return out;
    }

    std::uint32_t code_unit() {
        std::uint32_t u = 0;
        for (int i = 0; i < 4; ++i) {
            int d = hex_digit(next());
            if (d < 0) fail("invalid \\u escape");
            u = (u << 4) | static_cast<std::uint32_t>(d);
        }
        return u;
    }

    // After the opening quote; consumes the closing one.
    std::string string_body() {
        std::string out;
        for (;;) {
            std::size_t run = pos_;
            while (!at_end() && text_[pos_] != '"' && text_[pos_] != '\\' &&
                   static_cast<unsigned char>(text_[pos_]) >= 0x20) {
                ++pos_;
            }
            out.append(text_.substr(run, pos_ - run));

            char c = next();
            if (c == '"') return out;
            if (c != '\\') fail("control character in JSON string");

            char e = next();
            if (e != 'u') {
                char plain = unescape(e);
                if (!plain) fail("invalid escape in JSON string");
                out += plain;
                continue;
            }
            std::uint32_t cp = code_unit();
            if (cp >= 0xDC00 && cp <= 0xDFFF) fail("lone low surrogate");
            if (cp >= 0xD800 && cp <= 0xDBFF) {
                if (next() != '\\' || next() != 'u') fail("invalid surrogate pair");
                std::uint32_t low = code_unit();
                if (low < 0xDC00 || low > 0xDFFF) fail("invalid surrogate pair");
                cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
            }
            put_utf8(out, cp);
        }
    }

    // -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?
    Value number() {
        std::size_t start = pos_;
        bool integral = true;
        auto digits = [&] {
            std::size_t from = pos_;
            while (is_digit(cur())) ++pos_;
            if (pos_ == from) fail("invalid number in JSON");
        };

        if (cur() == '-') ++pos_;
        if (cur() == '0') {
            ++pos_;
        } else {
            digits();
        }
        if (cur() == '.') {
            integral = false;
            ++pos_;
            digits();
        }
        if (cur() == 'e' || cur() == 'E') {
            integral = false;
            ++pos_;
            if (cur() == '+' || cur() == '-') ++pos_;
            digits();
        }

        std::string_view raw = text_.substr(start, pos_ - start);
        if (integral) {
            std::int64_t n = 0;
            auto [end, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), n);
            if (ec == std::errc() && end == raw.data() + raw.size()) return Value(n);
        }
        // Fractions, exponents and integers beyond int64.
        std::istringstream iss{std::string(raw)};
        iss.imbue(std::locale::classic());
        double d = 0.0;
        iss >> d;
        if (iss.fail()) fail("number out of range");
        return Value(d);
    }

    std::string_view text_;
    std::size_t pos_{0};
    int depth_{0};
};

// ------------------------------
// JSON writer
// ------------------------------

class JsonWriter {
public:
    explicit JsonWriter(int indent) : indent_(indent) {}

    std::string take() { return std::move(out_); }

    void write(const Value& j, int depth) {
        switch (j.v.index()) {
            case 0: out_ += "null"; break;
            case 1: out_ += j.as_bool() ? "true" : "false"; break;
            case 2: out_ += std::to_string(j.as_int()); break;
            case 3: write_double(std::get<double>(j.v)); break;
            case 4: write_string(j.as_string()); break;
            case 5: write_array(j.as_array(), depth); break;
            default: write_object(j.as_object(), depth); break;
        }
    }

private:
    void break_line(int depth) {
        if (indent_ <= 0) return;
        out_ += '\n';
        out_.append(static_cast<std::size_t>(indent_ * depth), ' ');
    }

    void write_array(const Value::Array& arr, int depth) {
        out_ += '[';
        const char* sep = "";
        for (const auto& el : arr) {
            out_ += sep;
            sep = ",";
            break_line(depth + 1);
            write(el, depth + 1);
        }
        if (!arr.empty()) break_line(depth);
        out_ += ']';
    }

    void write_object(const Value::Object& obj, int depth) {
        out_ += '{';
        const char* sep = "";
        for (const auto& [key, member] : obj) {
            out_ += sep;
            sep = ",";
            break_line(depth + 1);
            write_string(key);
            out_ += indent_ > 0 ? ": " : ":";
            write(member, depth + 1);
        }
        if (!obj.empty()) break_line(depth);
        out_ += '}';
    }

    void write_string(const std::string& s) {
        static const char* hex = "0123456789abcdef";
        out_ += '"';
        for (char ch : s) {
            auto c = static_cast<unsigned char>(ch);
            switch (ch) {
                case '"': out_ += "\\\""; continue;
                case '\\': out_ += "\\\\"; continue;
                case '\b': out_ += "\\b"; continue;
                case '\f': out_ += "\\f"; continue;
                case '\n': out_ += "\\n"; continue;
                case '\r': out_ += "\\r"; continue;
                case '\t': out_ += "\\t"; continue;
                default: break;
            }
            if (c < 0x20) {
                out_ += "\\u00";
                out_ += hex[c >> 4];
                out_ += hex[c & 0x0F];
            } else {
                out_ += ch;
            }
        }
        out_ += '"';
    }

    // Non-finite values have no JSON form and render as null.
    void write_double(double d) {
        char buf[32];
        auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), d);
        if (!std::isfinite(d) || ec != std::errc()) {
            out_ += "null";
            return;
        }
        std::string_view text(buf, static_cast<std::size_t>(end - buf));
        out_ += text;
        // Keep the value a double when read back.
        if (text.find_first_of(".eE") == std::string_view::npos) out_ += ".0";
    }

    int indent_;
    std::string out_;
};

} // namespace

Value parse_json(std::string_view text) {
    return JsonReader(text).document();
}

std::string dump_json(const Value& v) {
    JsonWriter w(0);
    w.write(v, 0);
    return w.take();
}

std::string dump_json_pretty(const Value& v, int indent) {
    JsonWriter w(indent);
    w.write(v, 0);
    return w.take();
}

} // namespace avrolite
