#include "outputguard/matchers.hpp"
#include "outputguard/value_text.hpp"

#include <iostream>
#include <string>

using namespace outputguard;

static int passed = 0;
static int failed = 0;

#define ASSERT_EQ(label, expected, actual)                                  \
    do {                                                                    \
        if ((expected) == (actual)) {                                       \
            std::cout << "  [PASS] " << label << "\n";                     \
            ++passed;                                                       \
        } else {                                                            \
            std::cout << "  [FAIL] " << label                              \
                      << "  (expected=" << (expected)                      \
                      << " got=" << (actual) << ")\n";                     \
            ++failed;                                                       \
        }                                                                   \
    } while (0)

#define ASSERT_TRUE(label, expr)                                            \
    do {                                                                    \
        if ((expr)) {                                                       \
            std::cout << "  [PASS] " << label << "\n";                     \
            ++passed;                                                       \
        } else {                                                            \
            std::cout << "  [FAIL] " << label << "\n";                     \
            ++failed;                                                       \
        }                                                                   \
    } while (0)

// ── Suites ────────────────────────────────────────────────────────────────────

void test_context_at() {
    std::cout << "\n[ContextAt]\n";
    std::string expr = "\"[concat('a', x)]\"";
    ASSERT_TRUE("inside bracket expression",
                context_at(expr, expr.find('x')) == TextContext::Expression);

    std::string literal = "\"see x here\"";
    ASSERT_TRUE("inside plain string",
                context_at(literal, literal.find('x')) == TextContext::StringLiteral);

    ASSERT_TRUE("no boundary before position",
                context_at("abc", 2) == TextContext::None);
    ASSERT_TRUE("position past the end is clamped",
                context_at("[abc", 100) == TextContext::Expression);
    ASSERT_TRUE("boundary at the position itself not counted",
                context_at("\"[", 1) == TextContext::StringLiteral);
}

void test_escaped_boundaries() {
    std::cout << "\n[EscapedBoundaries]\n";
    // "[a \"b\" x : the nearest quotes are escaped, so '[' is found.
    std::string text = "\"[a \\\"b\\\" x";
    ASSERT_TRUE("escaped quote is not a boundary",
                context_at(text, text.find('x')) == TextContext::Expression);

    // An escaped backslash does not escape the quote after it.
    std::string text2 = "[a \\\\\" x";
    ASSERT_TRUE("quote after escaped backslash is a boundary",
                context_at(text2, text2.find('x')) == TextContext::StringLiteral);

    std::string text3 = "\"a \\[ x";
    ASSERT_TRUE("escaped bracket is not a boundary",
                context_at(text3, text3.find('x')) == TextContext::StringLiteral);
}

void test_context_index() {
    std::cout << "\n[ContextIndex]\n";
    std::string text = "{\"a\":\"doc\",\"b\":\"[expr]\"}";
    ContextIndex index(text);
    ASSERT_TRUE("inside doc string",
                index.at(text.find("doc")) == TextContext::StringLiteral);
    ASSERT_TRUE("inside expression",
                index.at(text.find("expr")) == TextContext::Expression);
    ASSERT_TRUE("agrees with context_at",
                index.at(text.find("expr")) == context_at(text, text.find("expr")));
    ASSERT_TRUE("empty text has no context", ContextIndex("").at(0) == TextContext::None);
}

void test_icase_helpers() {
    std::cout << "\n[IcaseHelpers]\n";
    ASSERT_TRUE("mixed case match", contains_icase("adminPassWord", "password"));
    ASSERT_TRUE("upper case match", contains_icase("DB_PASSWORD", "password"));
    ASSERT_TRUE("no match",         !contains_icase("passwd", "password"));
    ASSERT_TRUE("equals ignoring case", equals_icase("AdminPassword", "adminpassword"));
    ASSERT_TRUE("prefix is not equal",  !equals_icase("admin", "adminPassword"));
}

void test_list_call_starting_expression() {
    std::cout << "\n[ListCallStartingExpression]\n";
    auto calls = find_list_function_calls(
        "\"[listKeys(parameters('acct'),'2017-10-01').keys[0].value]\"");
    ASSERT_EQ("one call found", static_cast<std::size_t>(1), calls.size());
    if (!calls.empty()) {
        ASSERT_EQ("function name captured", std::string("listKeys"), calls[0].function);
        ASSERT_EQ("position at opening bracket", static_cast<std::size_t>(1), calls[0].position);
    }
}

void test_list_call_nested_in_expression() {
    std::cout << "\n[ListCallNested]\n";
    auto calls = find_list_function_calls("\"[concat('k=', listSecrets(x, '2020').value)]\"");
    ASSERT_EQ("nested call found", static_cast<std::size_t>(1), calls.size());

    auto upper = find_list_function_calls("\"[ListKeys (x)]\"");
    ASSERT_EQ("case-insensitive with space before paren",
              static_cast<std::size_t>(1), upper.size());

    auto inner = find_list_function_calls("\"[listA(listB(x))]\"");
    ASSERT_EQ("call nested directly in another call",
              static_cast<std::size_t>(2), inner.size());
}

void test_list_call_not_in_expression() {
    std::cout << "\n[ListCallNotInExpression]\n";
    ASSERT_TRUE("plain string mention ignored",
                find_list_function_calls("\"call (listKeys(x)) later\"").empty());
    ASSERT_TRUE("no delimiter before name",
                find_list_function_calls("\"[concat('prefix ', myListKeys())]\"").empty());
    ASSERT_TRUE("name without call",
                find_list_function_calls("\"[variables('listKeys')]\"").empty());
}

void test_list_calls_not_deduplicated() {
    std::cout << "\n[ListCallsNotDeduplicated]\n";
    auto calls = find_list_function_calls(
        "[\"[listKeys(a).k1]\",\"[listKeys(b).k2]\"]");
    ASSERT_EQ("each call reported", static_cast<std::size_t>(2), calls.size());
}

void test_list_call_name_bound() {
    std::cout << "\n[ListCallNameBound]\n";
    std::string at_limit = "list" + std::string(max_identifier_length - 4, 'a');
    auto calls = find_list_function_calls("\"[" + at_limit + "(x)]\"");
    ASSERT_EQ("name at the limit matched", static_cast<std::size_t>(1), calls.size());

    std::string too_long = "list" + std::string(100000, 'a');
    ASSERT_TRUE("overlong name ignored without failing",
                find_list_function_calls("\"[" + too_long + "(x)]\"").empty());
}

void test_parameter_reference() {
    std::cout << "\n[ParameterReference]\n";
    std::string live = "\"[concat('x', parameters('adminPassword'))]\"";
    ASSERT_TRUE("live reference found",
                find_live_parameter_reference(live, "adminPassword").has_value());

    auto refs = find_live_parameter_references(live);
    ASSERT_EQ("one live reference", static_cast<std::size_t>(1), refs.size());
    if (!refs.empty()) {
        ASSERT_EQ("name captured", std::string("adminPassword"), refs[0].name);
    }

    ASSERT_TRUE("case-insensitive, spaced and multi-line",
                find_live_parameter_reference(
                    normalize_for_matching("\"[PARAMETERS (\\n 'AdminPassword' \n)]\""),
                    "adminPassword").has_value());

    ASSERT_TRUE("different parameter not matched",
                !find_live_parameter_reference(live, "admin").has_value());

    ASSERT_TRUE("reference in plain string ignored",
                !find_live_parameter_reference("\"use parameters('adminPassword') here\"",
                                               "adminPassword").has_value());

    ASSERT_TRUE("dot in name matched literally",
                !find_live_parameter_reference("\"[parameters('aXb')]\"", "a.b").has_value());
}

void test_parameter_reference_later_match() {
    std::cout << "\n[ParameterReferenceLaterMatch]\n";
    std::string text = "{\"doc\":\"see parameters('pw')\",\"v\":\"[parameters('pw')]\"}";
    auto pos = find_live_parameter_reference(text, "pw");
    ASSERT_TRUE("live reference after a string mention found", pos.has_value());
    if (pos) ASSERT_EQ("position of second reference", text.rfind("parameters"), *pos);
}

// ── Main ──────────────────────────────────────────────────────────────────────

int main() {
    std::cout << "=== Matcher Tests ===\n";

    test_context_at();
    test_escaped_boundaries();
    test_context_index();
    test_icase_helpers();
    test_list_call_starting_expression();
    test_list_call_nested_in_expression();
    test_list_call_not_in_expression();
    test_list_calls_not_deduplicated();
    test_list_call_name_bound();
    test_parameter_reference();
    test_parameter_reference_later_match();

    std::cout << "\n--- Results: "
              << passed << " passed, " << failed << " failed ---\n";
    return failed == 0 ? 0 : 1;
}
