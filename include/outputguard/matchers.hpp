#pragma once

#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace outputguard {

// The matchers below expect text from normalize_for_matching(): whitespace
// runs are already collapsed, so the patterns allow at most one blank
// between tokens.

// Upper bound on a function or parameter name the patterns will match.
constexpr std::size_t max_identifier_length = 256;

// Where a position in serialized text sits, judged by the nearest
// unescaped '[' or '"' before it.
enum class TextContext : unsigned char { Expression, StringLiteral, None };

/**
 * ContextIndex
 *
 * Context of every position in a text, built in one forward pass. A '['
 * or '"' preceded by an odd number of backslashes is escaped and is not a
 * boundary.
 */
class ContextIndex {
public:
    explicit ContextIndex(const std::string& text);

    /// Context of the text before pos; pos past the end is clamped.
    TextContext at(std::size_t pos) const;

private:
    std::vector<TextContext> before_;
};

TextContext context_at(const std::string& text, std::size_t pos);

bool contains_icase(const std::string& haystack, const std::string& needle);
bool equals_icase(const std::string& a, const std::string& b);

// ── list*() calls ─────────────────────────────────────────────────────────

struct ListCall {
    std::string function;     // e.g. "listKeys"
    std::size_t position;     // offset of the leading delimiter
};

/// '[', '(' or ',' then list<word>( with an optional blank between tokens.
const std::regex& list_function_pattern();

/// Every list*() call in text that starts an expression or sits inside one.
std::vector<ListCall> find_list_function_calls(const std::string& text);
std::vector<ListCall> find_list_function_calls(const std::string& text,
                                               const ContextIndex& index);

// ── parameters('name') references ─────────────────────────────────────────

struct ParameterReference {
    std::string name;
    std::size_t position;
};

/// parameters('<name>') with an optional blank between tokens; captures the name.
const std::regex& parameter_reference_pattern();

/// Every parameters('name') reference that sits inside an expression.
std::vector<ParameterReference> find_live_parameter_references(const std::string& text);
std::vector<ParameterReference> find_live_parameter_references(const std::string& text,
                                                               const ContextIndex& index);

/// Offset of the first live reference to parameter_name (case-insensitive).
std::optional<std::size_t> find_live_parameter_reference(const std::string& text,
                                                         const std::string& parameter_name);

} // namespace outputguard
