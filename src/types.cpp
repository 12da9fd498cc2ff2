#include "outputguard/types.hpp"

#include <algorithm>
#include <cctype>

namespace outputguard {

// ── Value ─────────────────────────────────────────────────────────────────────

Value Value::null() {
    return Value{};
}

Value Value::boolean(bool b) {
    Value v;
    v.kind_ = Kind::Bool;
    v.bool_ = b;
    return v;
}

Value Value::number(double n) {
    Value v;
    v.kind_   = Kind::Number;
    v.number_ = n;
    return v;
}

Value Value::string(std::string s) {
    Value v;
    v.kind_   = Kind::String;
    v.string_ = std::move(s);
    return v;
}

Value Value::array(Array items) {
    Value v;
    v.kind_  = Kind::Array;
    v.array_ = std::move(items);
    return v;
}

Value Value::object(Object members) {
    Value v;
    v.kind_   = Kind::Object;
    v.object_ = std::move(members);
    return v;
}

// ── Parameter types ───────────────────────────────────────────────────────────

ParameterType parse_parameter_type(const std::string& text) {
    std::string t = text;
    std::transform(t.begin(), t.end(), t.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (t == "string")       return ParameterType::String;
    if (t == "securestring") return ParameterType::SecureString;
    if (t == "int")          return ParameterType::Int;
    if (t == "bool")         return ParameterType::Bool;
    if (t == "object")       return ParameterType::Object;
    if (t == "secureobject") return ParameterType::SecureObject;
    if (t == "array")        return ParameterType::Array;
    return ParameterType::Unknown;
}

} // namespace outputguard
