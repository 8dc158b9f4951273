#include <powgiver/cli/args.hpp>

#include <string>
#include <utility>

#include <cxxopts.hpp>
#include <fmt/core.h>

#ifndef POWGIVER_VERSION
#define POWGIVER_VERSION "0.0.0"
#endif

namespace powgiver::cli {

powgiver::config::ParseResult parse(int argc, char** argv, powgiver::logging::Logger& log) {
    powgiver::config::ParseResult pr;
    cxxopts::Options options("powgiver-job", "Build and check mining jobs for a PoW giver contract");
    options.add_options()
        ("giver",      "Giver contract address (wc:hex)", cxxopts::value<std::string>())
        ("wallet",     "Reward wallet address (wc:hex, basic workchain)", cxxopts::value<std::string>())
        ("params",     "Saved get_pow_params response (JSON file)", cxxopts::value<std::string>())
        ("state",      "Giver data cell bits (hex)", cxxopts::value<std::string>())
        ("state-bits", "Bit length of --state (default: all bits)", cxxopts::value<std::string>())
        ("random",     "Job random, 16 bytes hex (default: generated)", cxxopts::value<std::string>())
        ("expires-in", "Job lifetime in seconds", cxxopts::value<std::string>())
        ("expires-at", "Absolute job expiry (unixtime)", cxxopts::value<std::string>())
        ("hash",       "Candidate hash to verify (32 bytes hex)", cxxopts::value<std::string>())
        ("config",     "Path to config file", cxxopts::value<std::string>()->default_value("powgiver.conf"))
        ("d,debug",    "Enable debug logging")
        ("v,version",  "Show version and exit")
        ("h,help",     "Show help and exit");

    // CLI flag -> config setting name
    static const std::pair<const char*, const char*> kSettings[] = {
        {"giver", "giver"},           {"wallet", "wallet"},
        {"params", "params"},         {"state", "state"},
        {"state-bits", "state_bits"}, {"random", "random"},
        {"expires-in", "expires_in"}, {"expires-at", "expires_at"},
        {"hash", "hash"},
    };

    try {
        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            log.info(options.help());
            pr.show_only = true;
            return pr;
        }
        if (result.count("version")) {
            log.infof("powgiver-job v{}", POWGIVER_VERSION);
            pr.show_only = true;
            return pr;
        }
        for (const auto& [flag, key] : kSettings) {
            if (result.count(flag)) {
                pr.overrides.emplace_back(key, result[flag].as<std::string>());
            }
        }
        pr.config_path = result["config"].as<std::string>();
        pr.debug = result.count("debug") > 0;
        pr.ok = true;
    } catch (const std::exception& e) {
        log.errorf("Argument error: {}\n\n{}", e.what(), options.help());
        return pr;
    }
    return pr;
}

} // namespace powgiver::cli
