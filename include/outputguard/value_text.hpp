#pragma once

#include "outputguard/types.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace outputguard {

struct TextOptions {
    bool        escape_single_quotes = false;   // write ' as \u0027
    std::size_t max_depth            = 100;
    std::size_t max_bytes            = 1024 * 1024;
};

/// JSON string escaping (without the surrounding quotes). Control
/// characters other than \n, \r and \t are written as \u00XX.
std::string escape_string(const std::string& s, bool escape_single_quotes = false);

/**
 * Renders a Value as compact JSON text, keeping every level of nesting so
 * that expression strings inside nested arrays and objects stay visible.
 *
 * Returns std::nullopt when the value cannot be rendered: a non-finite
 * number, nesting deeper than max_depth, or text longer than max_bytes.
 * The reason is written to *error when error is non-null.
 */
std::optional<std::string> to_text(const Value& value,
                                   const TextOptions& options = {},
                                   std::string* error = nullptr);

/**
 * Prepares serialized text for the matchers in one forward pass:
 *   - \u0027 becomes a literal single quote;
 *   - \n, \r and \t escapes count as whitespace;
 *   - every run of whitespace collapses to a single space.
 * Other escape pairs are copied unchanged, so an escaped backslash never
 * starts a new escape.
 */
std::string normalize_for_matching(const std::string& text);

} // namespace outputguard
