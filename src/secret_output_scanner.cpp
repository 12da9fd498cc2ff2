#include "outputguard/secret_output_scanner.hpp"
#include "outputguard/matchers.hpp"

#include <sstream>

namespace outputguard {

namespace {

// Matcher results for one output, computed once from its serialized value.
// Left empty for an output whose value could not be serialized.
struct ScannedOutput {
    std::vector<ListCall>           list_calls;
    std::vector<ParameterReference> live_references;

    bool references(const std::string& parameter_name) const {
        for (const auto& ref : live_references)
            if (equals_icase(ref.name, parameter_name)) return true;
        return false;
    }
};

void find_list_function_secrets(const Template& tmpl, const std::vector<ScannedOutput>& scanned,
                                std::vector<Finding>& findings) {
    for (std::size_t i = 0; i < tmpl.outputs.size(); ++i) {
        const auto& output = tmpl.outputs[i];

        for (const auto& call : scanned[i].list_calls) {
            findings.push_back({ output.name, FindingKind::ListFunctionSecret,
                "Output '" + output.name + "' calls " + call.function +
                "(), which can return secret material." });
        }
    }
}

void find_password_names(const Template& tmpl, std::vector<Finding>& findings) {
    for (const auto& output : tmpl.outputs) {
        if (contains_icase(output.name, "password")) {
            findings.push_back({ output.name, FindingKind::NameSuggestsSecret,
                "Output name '" + output.name + "' suggests it contains a password." });
        }
    }
}

void find_secure_parameter_leaks(const Template& tmpl, const std::vector<ScannedOutput>& scanned,
                                 std::vector<Finding>& findings) {
    for (const auto& parameter : tmpl.parameters) {
        // Unrecognised types parse to Unknown and are not secure.
        if (!is_secure(parameter.kind())) continue;

        for (std::size_t i = 0; i < tmpl.outputs.size(); ++i) {
            if (!scanned[i].references(parameter.name)) continue;

            const auto& output = tmpl.outputs[i];
            std::ostringstream msg;
            msg << "Output '" << output.name << "' references " << parameter.type
                << " parameter '" << parameter.name << "'.";
            findings.push_back({ output.name, FindingKind::SecureParameterLeak, msg.str() });
        }
    }
}

} // namespace

// ── SecretOutputScanner ───────────────────────────────────────────────────────

TextOptions SecretOutputScanner::text_options() const {
    TextOptions text;
    text.escape_single_quotes = options_.escape_single_quotes;
    text.max_depth            = options_.max_depth;
    text.max_bytes            = options_.max_text_bytes;
    return text;
}

ScanReport SecretOutputScanner::scan_report(const Template& tmpl) const {
    ScanReport report;
    const TextOptions text = text_options();

    std::vector<ScannedOutput> scanned(tmpl.outputs.size());
    for (std::size_t i = 0; i < tmpl.outputs.size(); ++i) {
        const auto& output = tmpl.outputs[i];

        std::string error;
        auto rendered = to_text(output.value, text, &error);
        if (!rendered) {
            report.skipped.push_back({ output.name, error });
            continue;
        }

        const std::string normalized = normalize_for_matching(*rendered);
        const ContextIndex index(normalized);
        scanned[i].list_calls      = find_list_function_calls(normalized, index);
        scanned[i].live_references = find_live_parameter_references(normalized, index);
    }

    find_list_function_secrets(tmpl, scanned, report.findings);
    find_password_names(tmpl, report.findings);
    find_secure_parameter_leaks(tmpl, scanned, report.findings);
    return report;
}

std::vector<Finding> SecretOutputScanner::scan(const Template& tmpl) const {
    return scan_report(tmpl).findings;
}

SecretOutputScanner default_secret_output_scanner() {
    return SecretOutputScanner{ ScanOptions{} };
}

} // namespace outputguard
