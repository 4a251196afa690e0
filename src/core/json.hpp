#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace panedock::json
{

// Minimal JSON document model for the formats this library writes (layout
// state, dock config). Parsing never throws; a malformed document yields
// std::nullopt.
class Value
{
   public:
    enum class Type
    {
        Null,
        Bool,
        Number,
        String,
        Array,
        Object
    };

    Value() = default;

    static std::optional<Value> parse(std::string_view text);

    Type type() const { return type_; }
    bool is_null() const { return type_ == Type::Null; }
    bool is_bool() const { return type_ == Type::Bool; }
    bool is_number() const { return type_ == Type::Number; }
    bool is_string() const { return type_ == Type::String; }
    bool is_array() const { return type_ == Type::Array; }
    bool is_object() const { return type_ == Type::Object; }

    bool               as_bool(bool def = false) const { return is_bool() ? bool_ : def; }
    double             as_number(double def = 0.0) const { return is_number() ? number_ : def; }
    const std::string& as_string() const { return string_; }

    const std::vector<Value>& items() const { return array_; }

    // Object member lookup; nullptr if absent or not an object.
    const Value* find(const std::string& key) const;

    std::optional<std::string> string_member(const std::string& key) const;
    std::optional<double>      number_member(const std::string& key) const;
    // nullopt also when the number does not fit in a float.
    std::optional<float>       float_member(const std::string& key) const;
    std::optional<bool>        bool_member(const std::string& key) const;

   private:
    friend class Parser;

    Type                         type_   = Type::Null;
    bool                         bool_   = false;
    double                       number_ = 0.0;
    std::string                  string_;
    std::vector<Value>           array_;
    std::vector<std::pair<std::string, Value>> object_;  // Insertion order
};

std::string escape(std::string_view s);

// Shortest round-trippable text for layout coordinates ("80", "12.5").
std::string format_number(double v);

}  // namespace panedock::json
