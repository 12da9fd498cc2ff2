#pragma once

#include "outputguard/secret_output_scanner.hpp"
#include "outputguard/value_text.hpp"

#include <sstream>
#include <string>

namespace outputguard {

namespace json_detail {

inline std::string quoted(const std::string& s) {
    return "\"" + escape_string(s) + "\"";
}

} // namespace json_detail

inline std::string to_json(const Finding& f) {
    std::ostringstream os;
    os << "{ \"output\": "  << json_detail::quoted(f.output_name)
       << ", \"kind\": "    << json_detail::quoted(kind_name(f.kind))
       << ", \"message\": " << json_detail::quoted(f.message)
       << " }";
    return os.str();
}

inline std::string to_json(const SkippedOutput& s) {
    std::ostringstream os;
    os << "{ \"output\": " << json_detail::quoted(s.output_name)
       << ", \"reason\": " << json_detail::quoted(s.reason)
       << " }";
    return os.str();
}

inline std::string to_json(const ScanReport& report) {
    std::ostringstream os;
    os << "{\n"
       << "  \"clean\": " << (report.clean() ? "true" : "false") << ",\n"
       << "  \"findings\": [";
    for (std::size_t i = 0; i < report.findings.size(); ++i) {
        os << "\n    " << to_json(report.findings[i]);
        if (i + 1 < report.findings.size()) os << ",";
    }
    os << "\n  ],\n"
       << "  \"skipped\": [";
    for (std::size_t i = 0; i < report.skipped.size(); ++i) {
        os << "\n    " << to_json(report.skipped[i]);
        if (i + 1 < report.skipped.size()) os << ",";
    }
    os << "\n  ]\n"
       << "}";
    return os.str();
}

} // namespace outputguard
