#include "outputguard/value_text.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace outputguard {

namespace {

const std::string quote_escape = "\\u0027";

class TextWriter {
public:
    TextWriter(const TextOptions& options, std::string* error)
        : options_(options), error_(error) {}

    bool write(const Value& v, std::size_t depth) {
        switch (v.kind()) {
            case Value::Kind::Null:   out_ += "null"; break;
            case Value::Kind::Bool:   out_ += v.as_bool() ? "true" : "false"; break;
            case Value::Kind::Number: if (!write_number(v.as_number())) return false; break;
            case Value::Kind::String: write_string(v.as_string()); break;
            case Value::Kind::Array:  if (!write_array(v.as_array(), depth)) return false; break;
            case Value::Kind::Object: if (!write_object(v.as_object(), depth)) return false; break;
        }
        if (out_.size() > options_.max_bytes) {
            return fail("serialized value exceeds " + std::to_string(options_.max_bytes) + " bytes");
        }
        return true;
    }

    std::string take() { return std::move(out_); }

private:
    bool fail(const std::string& reason) {
        if (error_) *error_ = reason;
        return false;
    }

    bool write_number(double n) {
        if (!std::isfinite(n)) return fail("value contains a non-finite number");

        std::ostringstream os;
        if (std::floor(n) == n && std::fabs(n) < 1e15) {
            os << static_cast<long long>(n);
        } else {
            os << std::setprecision(17) << n;
        }
        out_ += os.str();
        return true;
    }

    void write_string(const std::string& s) {
        out_ += '"';
        out_ += escape_string(s, options_.escape_single_quotes);
        out_ += '"';
    }

    bool enter(std::size_t depth) {
        if (depth >= options_.max_depth) {
            return fail("value nesting exceeds depth " + std::to_string(options_.max_depth));
        }
        return true;
    }

    bool write_array(const Value::Array& items, std::size_t depth) {
        if (!enter(depth)) return false;
        out_ += '[';
        for (std::size_t i = 0; i < items.size(); ++i) {
            if (i > 0) out_ += ',';
            if (!write(items[i], depth + 1)) return false;
        }
        out_ += ']';
        return true;
    }

    bool write_object(const Value::Object& members, std::size_t depth) {
        if (!enter(depth)) return false;
        out_ += '{';
        for (std::size_t i = 0; i < members.size(); ++i) {
            if (i > 0) out_ += ',';
            write_string(members[i].first);
            out_ += ':';
            if (!write(members[i].second, depth + 1)) return false;
        }
        out_ += '}';
        return true;
    }

    const TextOptions& options_;
    std::string*       error_;
    std::string        out_;
};

} // namespace

std::string escape_string(const std::string& s, bool escape_single_quotes) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n";  break;
            case '\r': result += "\\r";  break;
            case '\t': result += "\\t";  break;
            case '\'':
                if (escape_single_quotes) result += quote_escape;
                else result += c;
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    result += buf;
                } else {
                    result += c;
                }
                break;
        }
    }
    return result;
}

std::optional<std::string> to_text(const Value& value,
                                   const TextOptions& options,
                                   std::string* error) {
    TextWriter writer(options, error);
    if (!writer.write(value, 0)) return std::nullopt;
    return writer.take();
}

std::string normalize_for_matching(const std::string& text) {
    std::string result;
    result.reserve(text.size());

    auto put_space = [&result]() {
        if (result.empty() || result.back() != ' ') result += ' ';
    };

    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (std::isspace(static_cast<unsigned char>(c))) {
            put_space();
            continue;
        }
        if (c != '\\' || i + 1 >= text.size()) {
            result += c;
            continue;
        }
        char next = text[i + 1];
        if (text.compare(i, quote_escape.size(), quote_escape) == 0) {
            result += '\'';
            i += quote_escape.size() - 1;
        } else if (next == 'n' || next == 'r' || next == 't') {
            put_space();
            ++i;
        } else {
            result += c;
            result += next;
            ++i;
        }
    }
    return result;
}

} // namespace outputguard
