#include "outputguard/matchers.hpp"

#include <algorithm>
#include <cctype>

namespace outputguard {

namespace {

bool same_icase(unsigned char a, unsigned char b) {
    return std::tolower(a) == std::tolower(b);
}

// Repeats are bounded: std::regex recurses once per consumed character.
const std::string bounded_name = "{1," + std::to_string(max_identifier_length) + "}";

} // namespace

// ── Context ───────────────────────────────────────────────────────────────────

ContextIndex::ContextIndex(const std::string& text)
    : before_(text.size() + 1, TextContext::None) {
    TextContext current = TextContext::None;
    std::size_t backslashes = 0;

    for (std::size_t i = 0; i < text.size(); ++i) {
        before_[i] = current;
        char c = text[i];
        if ((c == '[' || c == '"') && backslashes % 2 == 0) {
            current = c == '[' ? TextContext::Expression : TextContext::StringLiteral;
        }
        backslashes = c == '\\' ? backslashes + 1 : 0;
    }
    before_[text.size()] = current;
}

TextContext ContextIndex::at(std::size_t pos) const {
    return before_[std::min(pos, before_.size() - 1)];
}

TextContext context_at(const std::string& text, std::size_t pos) {
    return ContextIndex(text).at(pos);
}

bool contains_icase(const std::string& haystack, const std::string& needle) {
    auto it = std::search(haystack.begin(), haystack.end(),
                          needle.begin(), needle.end(), same_icase);
    return it != haystack.end();
}

bool equals_icase(const std::string& a, const std::string& b) {
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), same_icase);
}

// ── list*() calls ─────────────────────────────────────────────────────────────

const std::regex& list_function_pattern() {
    // The trailing '(' is a lookahead so it can delimit a nested call.
    static const std::regex pattern(R"(([\[\(,])\s?(list\w)" + bounded_name + R"()(?=\s?\())",
                                    std::regex::ECMAScript | std::regex::icase);
    return pattern;
}

std::vector<ListCall> find_list_function_calls(const std::string& text) {
    return find_list_function_calls(text, ContextIndex(text));
}

std::vector<ListCall> find_list_function_calls(const std::string& text,
                                               const ContextIndex& index) {
    std::vector<ListCall> calls;
    const auto& pattern = list_function_pattern();

    for (auto it = std::sregex_iterator(text.begin(), text.end(), pattern);
         it != std::sregex_iterator(); ++it) {
        const auto& m = *it;
        auto position = static_cast<std::size_t>(m.position(0));

        bool starts_expression = m.str(1) == "[";
        if (starts_expression || index.at(position) == TextContext::Expression) {
            calls.push_back({ m.str(2), position });
        }
    }
    return calls;
}

// ── parameters('name') references ─────────────────────────────────────────────

const std::regex& parameter_reference_pattern() {
    static const std::regex pattern(R"(parameters\s?\(\s?'([^'])" + bounded_name + R"()'\s?\))",
                                    std::regex::ECMAScript | std::regex::icase);
    return pattern;
}

std::vector<ParameterReference> find_live_parameter_references(const std::string& text) {
    return find_live_parameter_references(text, ContextIndex(text));
}

std::vector<ParameterReference> find_live_parameter_references(const std::string& text,
                                                               const ContextIndex& index) {
    std::vector<ParameterReference> references;
    const auto& pattern = parameter_reference_pattern();

    for (auto it = std::sregex_iterator(text.begin(), text.end(), pattern);
         it != std::sregex_iterator(); ++it) {
        auto position = static_cast<std::size_t>(it->position(0));
        if (index.at(position) == TextContext::Expression) {
            references.push_back({ it->str(1), position });
        }
    }
    return references;
}

std::optional<std::size_t> find_live_parameter_reference(const std::string& text,
                                                         const std::string& parameter_name) {
    for (const auto& ref : find_live_parameter_references(text)) {
        if (equals_icase(ref.name, parameter_name)) return ref.position;
    }
    return std::nullopt;
}

} // namespace outputguard
