#include <powgiver/config/loader.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include <powgiver/config/validator.hpp>

namespace powgiver::config {

std::vector<std::string> apply_setting(JobConfig& cfg, const std::string& key, const std::string& value) {
    std::vector<std::string> errs;
    std::string e;
    if (key == "giver") cfg.giver = value;
    else if (key == "wallet") cfg.wallet = value;
    else if (key == "params") cfg.params_path = value;
    else if (key == "state") cfg.state_hex = value;
    else if (key == "random") cfg.random_hex = value;
    else if (key == "hash") cfg.hash_hex = value;
    else if (key == "expires_in" || key == "expires_at" || key == "state_bits") {
        uint32_t v = 0;
        if (!parse_uint32(value, v, e)) {
            errs.push_back(fmt::format("{}: {}", key, e));
        } else if (key == "expires_in") {
            cfg.expires_in = v;
        } else if (key == "expires_at") {
            cfg.expires_at = v;
        } else {
            cfg.state_bits = v;
        }
    } else {
        errs.push_back(fmt::format("unknown setting '{}'", key));
    }
    return errs;
}

static std::vector<std::string> load_key_value(JobConfig& cfg, const std::string& text) {
    std::vector<std::string> errs;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        auto key_errs = apply_setting(cfg, line.substr(0, eq), line.substr(eq + 1));
        errs.insert(errs.end(), key_errs.begin(), key_errs.end());
    }
    return errs;
}

std::vector<std::string> load_from_file(JobConfig& cfg, const std::string& path) {
    std::vector<std::string> errs;
    std::ifstream in(path);
    if (!in.good()) return errs; // optional

    std::stringstream buffer; buffer << in.rdbuf();
    std::string text = buffer.str();
    auto first_non_space = text.find_first_not_of(" \t\n\r");
    if (first_non_space == std::string::npos) return errs;

    if (text[first_non_space] != '{') {
        return load_key_value(cfg, text);
    }

    // JSON
    try {
        nlohmann::json j = nlohmann::json::parse(text);
        for (const auto& item : j.items()) {
            const auto& v = item.value();
            std::vector<std::string> key_errs;
            if (v.is_string()) {
                key_errs = apply_setting(cfg, item.key(), v.get<std::string>());
            } else if (v.is_number_unsigned()) {
                key_errs = apply_setting(cfg, item.key(), std::to_string(v.get<uint64_t>()));
            } else {
                key_errs.push_back(fmt::format("'{}' must be a string or unsigned number", item.key()));
            }
            errs.insert(errs.end(), key_errs.begin(), key_errs.end());
        }
    } catch (const nlohmann::json::exception& ex) {
        errs.push_back(fmt::format("failed to read {}: {}", path, ex.what()));
    }
    return errs;
}

std::vector<std::string> apply_env_overrides(JobConfig& cfg) {
    std::vector<std::string> errs;
    if (const char* v = std::getenv("POWGIVER_GIVER"))  cfg.giver  = v;
    if (const char* v = std::getenv("POWGIVER_WALLET")) cfg.wallet = v;
    if (const char* v = std::getenv("POWGIVER_EXPIRES_IN")) {
        auto e = apply_setting(cfg, "expires_in", v);
        errs.insert(errs.end(), e.begin(), e.end());
    }
    return errs;
}

std::vector<std::string> validate_final(const JobConfig& cfg) {
    std::vector<std::string> errs;
    std::string e;
    if (cfg.giver.empty()) errs.push_back("giver is required");
    else if (!is_valid_raw_address(cfg.giver, e)) errs.push_back(fmt::format("giver: {}", e));

    if (cfg.wallet.empty()) errs.push_back("wallet is required");
    else if (!is_valid_raw_address(cfg.wallet, e)) errs.push_back(fmt::format("wallet: {}", e));

    const bool has_params = !cfg.params_path.empty();
    const bool has_state = !cfg.state_hex.empty();
    if (has_params == has_state) errs.push_back("exactly one of params or state is required");
    if (cfg.state_bits && !has_state) errs.push_back("state_bits requires state");
    if (has_state && !is_whole_byte_hex(cfg.state_hex, e)) {
        errs.push_back(fmt::format("state: {}", e));
    }

    if (!cfg.expires_at && cfg.expires_in == 0) errs.push_back("expires_in must be positive");
    if (!cfg.random_hex.empty() && !is_valid_hex_width(cfg.random_hex, 16, e)) {
        errs.push_back(fmt::format("random: {}", e));
    }
    if (!cfg.hash_hex.empty() && !is_valid_hex_width(cfg.hash_hex, 32, e)) {
        errs.push_back(fmt::format("hash: {}", e));
    }
    return errs;
}

} // namespace powgiver::config
