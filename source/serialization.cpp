// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// serialization.cpp - Binary wire codec and JSON text codec for Value

#include <statecast/serialization.h>

#include <bit>
#include <charconv>
#include <cmath>
#include <stdexcept>
#include <string_view>

namespace statecast {

namespace {

// Nested containers deeper than this are rejected on decode; a hostile
// buffer must not be able to exhaust the stack.
constexpr std::size_t kMaxDepth = 256;

// ============================================================
// Binary codec
// ============================================================

enum class Tag : uint8_t {
    Null   = 0x00,
    Int32  = 0x01,
    Double = 0x03,
    Bool   = 0x04,
    String = 0x05,
    Map    = 0x06,
    Vector = 0x07,
    Int64  = 0x0A,
};

// All multi-byte fields are little-endian regardless of the host
class Encoder {
public:
    explicit Encoder(ByteBuffer& out) : out_(out) {}

    void value(const Value& val) {
        std::visit([this](const auto& arg) { put(arg); }, val.data);
    }

private:
    void tag(Tag t) { out_.push_back(static_cast<uint8_t>(t)); }

    template <typename U>
    void fixed(U bits) {
        for (std::size_t i = 0; i < sizeof(U); ++i) {
            out_.push_back(static_cast<uint8_t>(bits >> (8 * i)));
        }
    }

    void length(std::size_t n) {
        if (n > UINT32_MAX) {
            throw std::length_error("serialize: container or string too large");
        }
        fixed(static_cast<uint32_t>(n));
    }

    void text(const std::string& s) {
        length(s.size());
        out_.insert(out_.end(), s.begin(), s.end());
    }

    void put(std::monostate) { tag(Tag::Null); }
    void put(int32_t v) { tag(Tag::Int32); fixed(static_cast<uint32_t>(v)); }
    void put(int64_t v) { tag(Tag::Int64); fixed(static_cast<uint64_t>(v)); }
    void put(double v) { tag(Tag::Double); fixed(std::bit_cast<uint64_t>(v)); }
    void put(bool v) { tag(Tag::Bool); out_.push_back(v ? 1 : 0); }
    void put(const std::string& v) { tag(Tag::String); text(v); }

    void put(const ValueMap& m) {
        tag(Tag::Map);
        length(m.size());
        for (const auto& [key, box] : m) {
            text(key);
            value(*box);
        }
    }

    void put(const ValueVector& v) {
        tag(Tag::Vector);
        length(v.size());
        for (const auto& box : v) {
            value(*box);
        }
    }

    ByteBuffer& out_;
};

class Decoder {
public:
    Decoder(const uint8_t* data, std::size_t size) : begin_(data), cur_(data), end_(data + size) {}

    Value value(std::size_t depth) {
        if (depth > kMaxDepth) fail("nesting too deep");

        const auto t = static_cast<Tag>(byte());
        switch (t) {
            case Tag::Null:   return Value{};
            case Tag::Int32:  return Value{static_cast<int32_t>(fixed<uint32_t>())};
            case Tag::Int64:  return Value{static_cast<int64_t>(fixed<uint64_t>())};
            case Tag::Double: return Value{std::bit_cast<double>(fixed<uint64_t>())};
            case Tag::Bool:   return Value{byte() != 0};
            case Tag::String: return Value{text()};
            case Tag::Map: {
                const auto count = length();
                auto map = ValueMap{}.transient();
                for (uint32_t i = 0; i < count; ++i) {
                    auto key = text();
                    map.set(std::move(key), ValueBox{value(depth + 1)});
                }
                return Value{map.persistent()};
            }
            case Tag::Vector: {
                const auto count = length();
                auto vec = ValueVector{}.transient();
                for (uint32_t i = 0; i < count; ++i) {
                    vec.push_back(ValueBox{value(depth + 1)});
                }
                return Value{vec.persistent()};
            }
        }
        fail("unknown type tag " + std::to_string(static_cast<int>(t)));
    }

    [[nodiscard]] std::size_t remaining() const { return static_cast<std::size_t>(end_ - cur_); }

private:
    [[noreturn]] void fail(const std::string& what) const {
        throw std::runtime_error("deserialize: " + what + " at offset " + std::to_string(cur_ - begin_));
    }

    const uint8_t* take(std::size_t n) {
        if (n > remaining()) fail("unexpected end of buffer");
        const auto* p = cur_;
        cur_ += n;
        return p;
    }

    uint8_t byte() { return *take(1); }

    template <typename U>
    U fixed() {
        const auto* p = take(sizeof(U));
        U bits = 0;
        for (std::size_t i = 0; i < sizeof(U); ++i) {
            bits |= static_cast<U>(p[i]) << (8 * i);
        }
        return bits;
    }

    // Every element needs at least one byte, so a count larger than the
    // rest of the buffer is corrupt
    uint32_t length() {
        const auto n = fixed<uint32_t>();
        if (n > remaining()) fail("length " + std::to_string(n) + " exceeds buffer");
        return n;
    }

    std::string text() {
        const auto n = length();
        const auto* p = take(n);
        return std::string(reinterpret_cast<const char*>(p), n);
    }

    const uint8_t* begin_;
    const uint8_t* cur_;
    const uint8_t* end_;
};

// ============================================================
// JSON writer
// ============================================================

void write_json_string(std::string& out, const std::string& s)
{
    static constexpr char kHex[] = "0123456789abcdef";
    out += '"';
    for (const char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default: {
                const auto u = static_cast<unsigned char>(c);
                if (u < 0x20) {
                    out += "\\u00";
                    out += kHex[u >> 4];
                    out += kHex[u & 0x0F];
                } else {
                    out += c;
                }
            }
        }
    }
    out += '"';
}

template <typename N>
void write_json_number(std::string& out, N n)
{
    char buf[32];
    const auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), n);
    out.append(buf, end);
}

void write_json_double(std::string& out, double d)
{
    // JSON has no representation for NaN or infinity
    if (!std::isfinite(d)) {
        out += "null";
        return;
    }
    const auto start = out.size();
    write_json_number(out, d);
    // Keep integral doubles typed as doubles when read back
    if (out.find_first_of(".eE", start) == std::string::npos) {
        out += ".0";
    }
}

void write_json(std::string& out, const Value& val)
{
    std::visit([&out](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            out += "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            out += arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int32_t> || std::is_same_v<T, int64_t>) {
            write_json_number(out, arg);
        } else if constexpr (std::is_same_v<T, double>) {
            write_json_double(out, arg);
        } else if constexpr (std::is_same_v<T, std::string>) {
            write_json_string(out, arg);
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            out += '{';
            const char* sep = "";
            for (const auto& [key, box] : arg) {
                out += sep;
                write_json_string(out, key);
                out += ':';
                write_json(out, *box);
                sep = ",";
            }
            out += '}';
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            out += '[';
            const char* sep = "";
            for (const auto& box : arg) {
                out += sep;
                write_json(out, *box);
                sep = ",";
            }
            out += ']';
        }
    }, val.data);
}

// ============================================================
// JSON reader
// ============================================================

class JsonReader {
public:
    explicit JsonReader(std::string_view text) : text_(text) {}

    Value document() {
        skip_space();
        if (at_end()) fail("empty input");
        Value result = value(0);
        skip_space();
        if (!at_end()) fail("trailing characters");
        return result;
    }

private:
    [[noreturn]] void fail(const std::string& what) const {
        throw std::runtime_error("JSON: " + what + " at position " + std::to_string(pos_));
    }

    [[nodiscard]] bool at_end() const { return pos_ >= text_.size(); }
    [[nodiscard]] char peek() const { return at_end() ? '\0' : text_[pos_]; }

    void skip_space() {
        while (!at_end() && (peek() == ' ' || peek() == '\t' || peek() == '\n' || peek() == '\r')) {
            ++pos_;
        }
    }

    void expect(char c) {
        skip_space();
        if (peek() != c) fail(std::string("expected '") + c + "'");
        ++pos_;
    }

    // True and consumed when the next non-space character is @p c
    bool accept(char c) {
        skip_space();
        if (peek() != c) return false;
        ++pos_;
        return true;
    }

    void keyword(std::string_view word) {
        if (text_.substr(pos_, word.size()) != word) fail("invalid literal");
        pos_ += word.size();
    }

    Value value(std::size_t depth) {
        if (depth > kMaxDepth) fail("nesting too deep");
        skip_space();
        switch (peek()) {
            case '{': return object(depth);
            case '[': return array(depth);
            case '"': return Value{string()};
            case 't': keyword("true"); return Value{true};
            case 'f': keyword("false"); return Value{false};
            case 'n': keyword("null"); return Value{};
            default:  return number();
        }
    }

    Value object(std::size_t depth) {
        expect('{');
        auto map = ValueMap{}.transient();
        if (accept('}')) return Value{map.persistent()};
        do {
            skip_space();
            auto key = string();
            expect(':');
            map.set(std::move(key), ValueBox{value(depth + 1)});
        } while (accept(','));
        expect('}');
        return Value{map.persistent()};
    }

    Value array(std::size_t depth) {
        expect('[');
        auto vec = ValueVector{}.transient();
        if (accept(']')) return Value{vec.persistent()};
        do {
            vec.push_back(ValueBox{value(depth + 1)});
        } while (accept(','));
        expect(']');
        return Value{vec.persistent()};
    }

    uint32_t hex4() {
        if (text_.size() - pos_ < 4) fail("truncated \\u escape");
        uint32_t unit = 0;
        const auto* first = text_.data() + pos_;
        const auto [ptr, ec] = std::from_chars(first, first + 4, unit, 16);
        if (ec != std::errc{} || ptr != first + 4) fail("invalid \\u escape");
        pos_ += 4;
        return unit;
    }

    static void append_utf8(std::string& out, uint32_t cp) {
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    std::string string() {
        if (peek() != '"') fail("expected string");
        ++pos_;
        std::string out;
        while (!at_end()) {
            const char c = text_[pos_++];
            if (c == '"') return out;
            if (static_cast<unsigned char>(c) < 0x20) fail("control character in string");
            if (c != '\\') {
                out += c;
                continue;
            }
            if (at_end()) break;
            switch (const char e = text_[pos_++]) {
                case '"':  out += '"'; break;
                case '\\': out += '\\'; break;
                case '/':  out += '/'; break;
                case 'b':  out += '\b'; break;
                case 'f':  out += '\f'; break;
                case 'n':  out += '\n'; break;
                case 'r':  out += '\r'; break;
                case 't':  out += '\t'; break;
                case 'u': {
                    uint32_t cp = hex4();
                    if (cp >= 0xD800 && cp < 0xDC00) {
                        // High surrogate; the low half must follow
                        if (text_.substr(pos_, 2) != "\\u") fail("unpaired surrogate");
                        pos_ += 2;
                        const uint32_t low = hex4();
                        if (low < 0xDC00 || low >= 0xE000) fail("unpaired surrogate");
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                    } else if (cp >= 0xDC00 && cp < 0xE000) {
                        fail("unpaired surrogate");
                    }
                    append_utf8(out, cp);
                    break;
                }
                default:
                    fail(std::string("invalid escape '\\") + e + "'");
            }
        }
        fail("unterminated string");
    }

    // Integers that fit int32 become int32, larger ones int64; a fraction,
    // an exponent or an int64 overflow gives a double
    Value number() {
        const auto start = pos_;
        auto digits = [this] {
            const auto before = pos_;
            while (!at_end() && peek() >= '0' && peek() <= '9') ++pos_;
            return pos_ > before;
        };

        if (peek() == '-') ++pos_;
        if (!digits()) fail("unexpected character");
        bool integral = true;
        if (peek() == '.') {
            ++pos_;
            if (!digits()) fail("expected digits after '.'");
            integral = false;
        }
        if (peek() == 'e' || peek() == 'E') {
            ++pos_;
            if (peek() == '+' || peek() == '-') ++pos_;
            if (!digits()) fail("expected exponent digits");
            integral = false;
        }

        const auto* first = text_.data() + start;
        const auto* last = text_.data() + pos_;
        if (integral) {
            int64_t n = 0;
            const auto [ptr, ec] = std::from_chars(first, last, n);
            if (ec == std::errc{} && ptr == last) {
                if (n >= INT32_MIN && n <= INT32_MAX) return Value{static_cast<int32_t>(n)};
                return Value{n};
            }
        }
        double d = 0.0;
        const auto [ptr, ec] = std::from_chars(first, last, d);
        if (ec != std::errc{} || ptr != last) fail("number out of range");
        return Value{d};
    }

    std::string_view text_;
    std::size_t pos_ = 0;
};

} // anonymous namespace

ByteBuffer serialize(const Value& val)
{
    ByteBuffer out;
    Encoder(out).value(val);
    return out;
}

Value deserialize(const ByteBuffer& buffer)
{
    return deserialize(buffer.data(), buffer.size());
}

Value deserialize(const uint8_t* data, std::size_t size)
{
    if (size == 0) return Value{};
    Decoder decoder(data, size);
    Value result = decoder.value(0);
    if (decoder.remaining() != 0) {
        throw std::runtime_error("deserialize: " + std::to_string(decoder.remaining()) + " trailing byte(s)");
    }
    return result;
}

std::string to_json(const Value& val)
{
    std::string out;
    write_json(out, val);
    return out;
}

Value from_json(const std::string& json_str, std::string* error_out)
{
    try {
        return JsonReader(json_str).document();
    } catch (const std::runtime_error& e) {
        if (error_out) *error_out = e.what();
        return Value{};
    }
}

} // namespace statecast
