#pragma once

#include <string>
#include <vector>

#include <powgiver/config/types.hpp>

namespace powgiver::config {

// Set one setting by name (giver, wallet, expires_in, expires_at, params,
// state, state_bits, random, hash). Returns errors (empty if ok).
std::vector<std::string> apply_setting(JobConfig& cfg, const std::string& key, const std::string& value);

// Read configuration from file (JSON or key=value). Missing file is not an error.
std::vector<std::string> load_from_file(JobConfig& cfg, const std::string& path);

// Apply POWGIVER_* environment variables (GIVER, WALLET, EXPIRES_IN) on top of current cfg.
std::vector<std::string> apply_env_overrides(JobConfig& cfg);

// Validate final config (addresses, one params source, field widths). Returns list of errors.
std::vector<std::string> validate_final(const JobConfig& cfg);

} // namespace powgiver::config
