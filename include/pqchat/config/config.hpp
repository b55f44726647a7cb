#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "pqchat/crypto/kem.hpp"
#include "pqchat/crypto/pwhash.hpp"

namespace pqchat::config {

// Upper bound on kdf_workers; each derivation holds pwhash.memlimit bytes
constexpr size_t MAX_KDF_WORKERS = 64;

// Core service configuration
struct CoreConfig {
    std::string kem_algorithm{crypto::KEM_DEFAULT};  // Lattice KEM parameter set
    crypto::PwhashParams pwhash;                      // Vault work factor
    size_t kdf_workers = 1;                           // Threads dedicated to password derivation
    std::string log_level = "info";
    std::string log_pattern;                          // Empty = default pattern
};

// Parse configuration from an INI file
std::optional<CoreConfig> load_config(const std::string& path);

// Parse configuration from CLI arguments
std::optional<CoreConfig> parse_cli(int argc, char* argv[]);

// Save configuration to file
bool save_config(const CoreConfig& config, const std::string& path);

// Merge CLI arguments over config file
CoreConfig merge_config(const CoreConfig& base, const CoreConfig& overlay);

// Validate configuration
struct ValidationResult {
    bool valid{true};
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

ValidationResult validate_config(const CoreConfig& config);

}  // namespace pqchat::config
