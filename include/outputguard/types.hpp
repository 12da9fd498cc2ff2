#pragma once

#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace outputguard {

/**
 * Value
 *
 * Typed tree for an output's value as declared in the template: scalars,
 * arrays and objects. Object members keep their declaration order.
 */
class Value {
public:
    enum class Kind { Null, Bool, Number, String, Array, Object };

    using Array  = std::vector<Value>;
    using Member = std::pair<std::string, Value>;
    using Object = std::vector<Member>;

    Value() = default;

    static Value null();
    static Value boolean(bool b);
    static Value number(double n);
    static Value string(std::string s);
    static Value array(Array items);
    static Value object(Object members);

    Kind kind() const { return kind_; }

    bool as_bool() const { return bool_; }
    double as_number() const { return number_; }
    const std::string& as_string() const { return string_; }
    const Array& as_array() const { return array_; }
    const Object& as_object() const { return object_; }

private:
    Kind        kind_   = Kind::Null;
    bool        bool_   = false;
    double      number_ = 0.0;
    std::string string_;
    Array       array_;
    Object      object_;
};

struct OutputDefinition {
    std::string name;
    std::string type;           // "string", "object", "array", "securestring", ...
    Value       value;
};

enum class ParameterType {
    String, SecureString, Int, Bool, Object, SecureObject, Array, Unknown
};

/// Case-insensitive; unrecognised text maps to ParameterType::Unknown.
ParameterType parse_parameter_type(const std::string& text);

inline bool is_secure(ParameterType t) {
    return t == ParameterType::SecureString || t == ParameterType::SecureObject;
}

struct ParameterDefinition {
    std::string name;
    std::string type;           // declared text, e.g. "secureString"

    ParameterType kind() const { return parse_parameter_type(type); }
};

struct Template {
    std::vector<OutputDefinition>    outputs;
    std::vector<ParameterDefinition> parameters;
};

enum class FindingKind { ListFunctionSecret, NameSuggestsSecret, SecureParameterLeak };

struct Finding {
    std::string output_name;
    FindingKind kind;
    std::string message;
};

inline const char* kind_name(FindingKind k) {
    switch (k) {
        case FindingKind::ListFunctionSecret:  return "ListFunctionSecret";
        case FindingKind::NameSuggestsSecret:  return "NameSuggestsSecret";
        case FindingKind::SecureParameterLeak: return "SecureParameterLeak";
        default:                               return "Unknown";
    }
}

inline std::ostream& operator<<(std::ostream& os, FindingKind k) {
    return os << kind_name(k);
}

inline std::ostream& operator<<(std::ostream& os, ParameterType t) {
    switch (t) {
        case ParameterType::String:       return os << "string";
        case ParameterType::SecureString: return os << "securestring";
        case ParameterType::Int:          return os << "int";
        case ParameterType::Bool:         return os << "bool";
        case ParameterType::Object:       return os << "object";
        case ParameterType::SecureObject: return os << "secureobject";
        case ParameterType::Array:        return os << "array";
        default:                          return os << "unknown";
    }
}

} // namespace outputguard
