#include "outputguard/secret_output_scanner.hpp"
#include "outputguard/json.hpp"

#include <iostream>
#include <limits>
#include <string>
#include <utility>
#include <vector>

using namespace outputguard;

static void separator(const std::string& title) {
    std::cout << "\n" << std::string(55, '-') << "\n"
              << "  " << title << "\n"
              << std::string(55, '-') << "\n";
}

static void print_report(const std::string& name, const ScanReport& report) {
    std::cout << "\n  Template : " << name << "\n";
    if (report.clean()) {
        std::cout << "  Status   : Clean\n";
    } else {
        std::cout << "  Status   : " << report.findings.size() << " finding(s)\n";
        for (const auto& f : report.findings)
            std::cout << "             -> [" << f.kind << "] " << f.message << "\n";
    }
    for (const auto& s : report.skipped)
        std::cout << "  Skipped  : " << s.output_name << " -- " << s.reason << "\n";
}

int main() {
    auto scanner = default_secret_output_scanner();

    // ── Sample templates ─────────────────────────────────────────────────────
    Template storage {
        {
            { "storageKey", "string",
              Value::string("[listKeys(resourceId('Microsoft.Storage/storageAccounts', "
                            "parameters('accountName')), '2019-06-01').keys[0].value]") },
            { "endpoint", "string",
              Value::string("[reference(parameters('accountName')).primaryEndpoints.blob]") },
        },
        {
            { "accountName", "string" },
        }
    };

    Template vm {
        {
            { "adminPassword", "securestring", Value::string("[parameters('adminPassword')]") },
            { "connection", "object",
              Value::object({
                  { "user", Value::string("[parameters('adminUser')]") },
                  { "secret", Value::string("[concat('pw=', parameters('adminPassword'))]") },
              }) },
            { "notes", "string",
              Value::string("Set parameters('adminPassword') before deploying.") },
        },
        {
            { "adminUser",     "string" },
            { "adminPassword", "secureString" },
        }
    };

    Template network {
        {
            { "vnetId", "string",
              Value::string("[resourceId('Microsoft.Network/virtualNetworks', 'vnet')]") },
            { "ports", "array",
              Value::array({ Value::number(80), Value::number(443),
                             Value::number(std::numeric_limits<double>::quiet_NaN()) }) },
        },
        {}
    };

    std::vector<std::pair<std::string, const Template*>> templates = {
        { "storage.json", &storage },
        { "vm.json",      &vm      },
        { "network.json", &network },
    };

    // ── Scan ─────────────────────────────────────────────────────────────────
    separator("SECRET OUTPUT SCAN");

    for (const auto& entry : templates) {
        print_report(entry.first, scanner.scan_report(*entry.second));
    }

    // ── JSON Output ──────────────────────────────────────────────────────────
    separator("JSON OUTPUT");

    std::cout << "\n  ScanReport (vm.json):\n" << to_json(scanner.scan_report(vm)) << "\n";

    std::cout << "\n" << std::string(55, '-') << "\n"
              << "  Scan complete.\n"
              << std::string(55, '-') << "\n\n";
    return 0;
}
