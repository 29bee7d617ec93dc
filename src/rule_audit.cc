// rule_audit.cc - Audit a translated rules file against its English version
// Reports drift and optionally rewrites the translated file with "# [AUDIT]" comments

#include <getopt.h>
#include <iostream>
#include <string>

#include "audit.h"

using namespace ruleaudit;

int main(int argc, char* argv[]) {
    auto usage = [&]() {
        std::cerr << "Usage:\n"
                  << "  " << argv[0] << " [options] <english_rules> <translated_rules>\n"
                  << "\nOptions:\n"
                  << "  -m, --mode <warnings|new_version>\n"
                  << "                        'warnings' (default) lists differences;\n"
                  << "                        'new_version' rewrites the translated file\n"
                  << "                        with comments where translation is needed\n"
                  << "  -u, --unicode <true|false|auto>\n"
                  << "                        Handle the files as unicode definitions\n"
                  << "                        (one key per item); 'auto' (default) checks\n"
                  << "                        the translated file name for 'unicode'\n"
                  << "  -v, --verbose         Show where missing rules will be inserted\n"
                  << "  -h, --help            Show this help message\n";
        return 1;
    };

    static struct option long_options[] = {
        {"mode",    required_argument, nullptr, 'm'},
        {"unicode", required_argument, nullptr, 'u'},
        {"verbose", no_argument,       nullptr, 'v'},
        {"help",    no_argument,       nullptr, 'h'},
        {nullptr,   0,                 nullptr, 0}
    };

    AuditConfig config;

    int opt;
    while ((opt = getopt_long(argc, argv, "m:u:vh", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'm': {
                std::string mode = optarg;
                if (mode == "warnings") config.mode = AuditConfig::Mode::WARNINGS;
                else if (mode == "new_version") config.mode = AuditConfig::Mode::NEW_VERSION;
                else return usage();
                break;
            }
            case 'u': {
                std::string unicode = optarg;
                if (unicode == "true") config.unicode = AuditConfig::Unicode::YES;
                else if (unicode == "false") config.unicode = AuditConfig::Unicode::NO;
                else if (unicode == "auto") config.unicode = AuditConfig::Unicode::AUTO;
                else return usage();
                break;
            }
            case 'v': config.verbose = true; break;
            case 'h': return usage();
            default:  return usage();
        }
    }

    if (argc - optind != 2) return usage();
    config.english_path = argv[optind];
    config.translated_path = argv[optind + 1];

    AuditReport report;
    if (!run_audit(config, report, std::cout)) return 1;
    return 0;
}
