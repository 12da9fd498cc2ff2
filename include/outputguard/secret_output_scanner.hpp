#pragma once

#include "outputguard/types.hpp"
#include "outputguard/value_text.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace outputguard {

struct ScanOptions {
    std::size_t max_depth            = 100;
    std::size_t max_text_bytes       = 1024 * 1024;   // per output value
    bool        escape_single_quotes = false;
};

struct SkippedOutput {
    std::string output_name;
    std::string reason;
};

struct ScanReport {
    std::vector<Finding>       findings;
    std::vector<SkippedOutput> skipped;     // values that could not be serialized

    bool clean() const { return findings.empty(); }

    std::size_t count(FindingKind kind) const {
        std::size_t n = 0;
        for (const auto& f : findings)
            if (f.kind == kind) ++n;
        return n;
    }
};

/**
 * SecretOutputScanner
 *
 * Flags template outputs that may expose secret material. Three passes,
 * reported in this order:
 *   1. A list*() call inside a live expression of the output's value.
 *   2. An output name containing "password" (case-insensitive).
 *   3. A live parameters('name') reference to a securestring or
 *      secureobject parameter.
 *
 * Each output value is serialized once. A value that cannot be serialized
 * is recorded in ScanReport::skipped and takes no part in passes 1 and 3.
 * The template is never modified and no state is kept between scans.
 */
class SecretOutputScanner {
public:
    SecretOutputScanner() = default;
    explicit SecretOutputScanner(ScanOptions options) : options_(options) {}

    std::vector<Finding> scan(const Template& tmpl) const;

    ScanReport scan_report(const Template& tmpl) const;

    const ScanOptions& options() const { return options_; }

private:
    TextOptions text_options() const;

    ScanOptions options_;
};

/// Returns a SecretOutputScanner with the default limits.
SecretOutputScanner default_secret_output_scanner();

} // namespace outputguard
