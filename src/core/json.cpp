#include "json.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>

namespace panedock::json
{

// ─── Parser ──────────────────────────────────────────────────────────────────

class Parser
{
   public:
    explicit Parser(std::string_view text) : text_(text) {}

    std::optional<Value> parse_document()
    {
        Value v;
        if (!parse_value(v, 0))
            return std::nullopt;
        skip_ws();
        if (pos_ != text_.size())
            return std::nullopt;  // Trailing garbage
        return v;
    }

   private:
    static constexpr int MAX_DEPTH = 128;

    std::string_view text_;
    size_t           pos_ = 0;

    void skip_ws()
    {
        while (pos_ < text_.size()
               && (text_[pos_] == ' ' || text_[pos_] == '\t' || text_[pos_] == '\n'
                   || text_[pos_] == '\r'))
            ++pos_;
    }

    bool consume(char c)
    {
        skip_ws();
        if (pos_ < text_.size() && text_[pos_] == c)
        {
            ++pos_;
            return true;
        }
        return false;
    }

    bool consume_literal(std::string_view lit)
    {
        if (text_.substr(pos_, lit.size()) == lit)
        {
            pos_ += lit.size();
            return true;
        }
        return false;
    }

    bool parse_value(Value& out, int depth)
    {
        if (depth > MAX_DEPTH)
            return false;

        skip_ws();
        if (pos_ >= text_.size())
            return false;

        char c = text_[pos_];
        if (c == '{')
            return parse_object(out, depth);
        if (c == '[')
            return parse_array(out, depth);
        if (c == '"')
        {
            out.type_ = Value::Type::String;
            return parse_string(out.string_);
        }
        if (consume_literal("true"))
        {
            out.type_ = Value::Type::Bool;
            out.bool_ = true;
            return true;
        }
        if (consume_literal("false"))
        {
            out.type_ = Value::Type::Bool;
            out.bool_ = false;
            return true;
        }
        if (consume_literal("null"))
        {
            out.type_ = Value::Type::Null;
            return true;
        }
        return parse_number(out);
    }

    bool parse_object(Value& out, int depth)
    {
        ++pos_;  // '{'
        out.type_ = Value::Type::Object;
        if (consume('}'))
            return true;

        while (true)
        {
            skip_ws();
            std::string key;
            if (pos_ >= text_.size() || text_[pos_] != '"' || !parse_string(key))
                return false;
            if (!consume(':'))
                return false;
            Value member;
            if (!parse_value(member, depth + 1))
                return false;
            bool replaced = false;
            for (auto& [existing_key, existing] : out.object_)
            {
                if (existing_key == key)
                {
                    existing = std::move(member);  // Last duplicate wins
                    replaced = true;
                    break;
                }
            }
            if (!replaced)
                out.object_.emplace_back(std::move(key), std::move(member));

            if (consume(','))
                continue;
            return consume('}');
        }
    }

    bool parse_array(Value& out, int depth)
    {
        ++pos_;  // '['
        out.type_ = Value::Type::Array;
        if (consume(']'))
            return true;

        while (true)
        {
            Value item;
            if (!parse_value(item, depth + 1))
                return false;
            out.array_.push_back(std::move(item));

            if (consume(','))
                continue;
            return consume(']');
        }
    }

    static void append_utf8(std::string& out, unsigned long cp)
    {
        if (cp < 0x80)
        {
            out += static_cast<char>(cp);
        }
        else if (cp < 0x800)
        {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
        else if (cp < 0x10000)
        {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
        else
        {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    // Exactly four hex digits; no sign, whitespace or "0x".
    bool parse_hex4(unsigned long& out)
    {
        if (pos_ + 4 > text_.size())
            return false;
        unsigned long value = 0;
        for (size_t i = 0; i < 4; ++i)
        {
            char c     = text_[pos_ + i];
            int  digit = 0;
            if (c >= '0' && c <= '9')
                digit = c - '0';
            else if (c >= 'a' && c <= 'f')
                digit = c - 'a' + 10;
            else if (c >= 'A' && c <= 'F')
                digit = c - 'A' + 10;
            else
                return false;
            value = value * 16 + static_cast<unsigned long>(digit);
        }
        out = value;
        pos_ += 4;
        return true;
    }

    bool parse_string(std::string& out)
    {
        ++pos_;  // opening quote
        while (pos_ < text_.size())
        {
            char c = text_[pos_++];
            if (c == '"')
                return true;
            if (c != '\\')
            {
                out += c;
                continue;
            }
            if (pos_ >= text_.size())
                return false;
            char esc = text_[pos_++];
            switch (esc)
            {
                case '"':
                    out += '"';
                    break;
                case '\\':
                    out += '\\';
                    break;
                case '/':
                    out += '/';
                    break;
                case 'b':
                    out += '\b';
                    break;
                case 'f':
                    out += '\f';
                    break;
                case 'n':
                    out += '\n';
                    break;
                case 'r':
                    out += '\r';
                    break;
                case 't':
                    out += '\t';
                    break;
                case 'u':
                {
                    unsigned long cp = 0;
                    if (!parse_hex4(cp))
                        return false;
                    if (cp >= 0xDC00 && cp <= 0xDFFF)
                        return false;  // Lone low surrogate
                    if (cp >= 0xD800 && cp <= 0xDBFF)
                    {
                        unsigned long low = 0;
                        if (!consume_literal("\\u") || !parse_hex4(low))
                            return false;
                        if (low < 0xDC00 || low > 0xDFFF)
                            return false;
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                    }
                    append_utf8(out, cp);
                    break;
                }
                default:
                    return false;
            }
        }
        return false;  // Unterminated
    }

    bool parse_number(Value& out)
    {
        size_t start = pos_;
        while (pos_ < text_.size())
        {
            char c = text_[pos_];
            if ((c >= '0' && c <= '9') || c == '-' || c == '+' || c == '.' || c == 'e' || c == 'E')
                ++pos_;
            else
                break;
        }
        if (pos_ == start)
            return false;

        std::string token(text_.substr(start, pos_ - start));
        char*       end = nullptr;
        double      v   = std::strtod(token.c_str(), &end);
        if (end != token.c_str() + token.size() || !std::isfinite(v))
            return false;

        out.type_   = Value::Type::Number;
        out.number_ = v;
        return true;
    }
};

// ─── Value ───────────────────────────────────────────────────────────────────

std::optional<Value> Value::parse(std::string_view text)
{
    Parser parser(text);
    return parser.parse_document();
}

const Value* Value::find(const std::string& key) const
{
    if (!is_object())
        return nullptr;
    for (const auto& [k, v] : object_)
    {
        if (k == key)
            return &v;
    }
    return nullptr;
}

std::optional<std::string> Value::string_member(const std::string& key) const
{
    const Value* v = find(key);
    if (!v || !v->is_string())
        return std::nullopt;
    return v->as_string();
}

std::optional<double> Value::number_member(const std::string& key) const
{
    const Value* v = find(key);
    if (!v || !v->is_number())
        return std::nullopt;
    return v->as_number();
}

std::optional<float> Value::float_member(const std::string& key) const
{
    auto v = number_member(key);
    if (!v || !std::isfinite(*v) || std::fabs(*v) > std::numeric_limits<float>::max())
        return std::nullopt;
    return static_cast<float>(*v);
}

std::optional<bool> Value::bool_member(const std::string& key) const
{
    const Value* v = find(key);
    if (!v || !v->is_bool())
        return std::nullopt;
    return v->as_bool();
}

// ─── Writing helpers ─────────────────────────────────────────────────────────

std::string escape(std::string_view s)
{
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s)
    {
        switch (c)
        {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20)
                {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    out += buf;
                }
                else
                {
                    out += c;
                }
                break;
        }
    }
    return out;
}

std::string format_number(double v)
{
    if (!std::isfinite(v))
        return "0";
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.9g", v);
    return buf;
}

}  // namespace panedock::json
