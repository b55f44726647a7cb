#include "pqchat/config/config.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

#include "pqchat/utils/logging.hpp"

namespace pqchat::config {

namespace {

// Simple INI parser
class IniParser {
public:
    struct Entry {
        std::string section;
        std::string key;
        std::string value;
        size_t line;
    };

    static std::vector<Entry> parse(std::istream& input) {
        std::vector<Entry> entries;
        std::string current_section;
        std::string line;
        size_t line_number = 0;

        while (std::getline(input, line)) {
            ++line_number;

            // Trim whitespace
            line.erase(0, line.find_first_not_of(" \t\r\n"));
            line.erase(line.find_last_not_of(" \t\r\n") + 1);

            // Skip empty lines and comments
            if (line.empty() || line[0] == '#' || line[0] == ';') {
                continue;
            }

            // Section header
            if (line[0] == '[' && line.back() == ']') {
                current_section = line.substr(1, line.size() - 2);
                continue;
            }

            // Key=value
            auto eq_pos = line.find('=');
            if (eq_pos != std::string::npos) {
                std::string key = line.substr(0, eq_pos);
                std::string value = line.substr(eq_pos + 1);

                // Trim
                key.erase(key.find_last_not_of(" \t") + 1);
                value.erase(0, value.find_first_not_of(" \t"));

                // Remove quotes
                if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                    value = value.substr(1, value.size() - 2);
                }

                entries.push_back({current_section, key, value, line_number});
            }
        }

        return entries;
    }
};

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

// std::stoull wraps a leading '-' around instead of rejecting it
uint64_t parse_unsigned(const std::string& value) {
    if (value.find('-') != std::string::npos) {
        throw std::invalid_argument("negative value");
    }
    return std::stoull(value);
}

uint64_t mib_to_bytes(uint64_t mib) {
    if (mib > (std::numeric_limits<uint64_t>::max() >> 20)) {
        throw std::out_of_range("memlimit_mib too large");
    }
    return mib << 20;
}

void apply_entry(CoreConfig& config, const std::string& section, const std::string& key,
                 const std::string& value) {
    if (section == "crypto") {
        if (key == "kem" || key == "kem_algorithm") {
            config.kem_algorithm = value;
        }
    } else if (section == "vault") {
        if (key == "opslimit") {
            config.pwhash.opslimit = parse_unsigned(value);
        } else if (key == "memlimit") {
            config.pwhash.memlimit = parse_unsigned(value);
        } else if (key == "memlimit_mib") {
            config.pwhash.memlimit = mib_to_bytes(parse_unsigned(value));
        }
    } else if (section == "service") {
        if (key == "kdf_workers") {
            config.kdf_workers = parse_unsigned(value);
        }
    } else if (section == "logging") {
        if (key == "level") {
            config.log_level = value;
        } else if (key == "pattern") {
            config.log_pattern = value;
        }
    }
}

}  // namespace

std::optional<CoreConfig> load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return std::nullopt;
    }

    auto entries = IniParser::parse(file);
    CoreConfig config;

    for (const auto& entry : entries) {
        try {
            apply_entry(config, to_lower(entry.section), to_lower(entry.key), entry.value);
        } catch (const std::logic_error&) {
            // std::stoull family: invalid_argument / out_of_range
            spdlog::error("{}:{}: invalid value for {}: {}", path, entry.line, entry.key, entry.value);
            return std::nullopt;
        }
    }

    return config;
}

std::optional<CoreConfig> parse_cli(int argc, char* argv[]) {
    CLI::App app{"pqchat - post-quantum room chat core"};

    CoreConfig config;
    uint64_t memlimit_mib = 0;

    app.add_option("--kem", config.kem_algorithm, "KEM parameter set")
        ->check(CLI::IsMember({std::string(crypto::KEM_ML_KEM_512),
                               std::string(crypto::KEM_ML_KEM_768),
                               std::string(crypto::KEM_ML_KEM_1024)}));
    app.add_option("--pwhash-ops", config.pwhash.opslimit, "Argon2id opslimit");
    app.add_option("--pwhash-mem-mib", memlimit_mib, "Argon2id memlimit in MiB");
    app.add_option("--kdf-workers", config.kdf_workers, "Password derivation threads");
    app.add_option("-l,--log-level", config.log_level, "Log level: trace,debug,info,warn,error");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        spdlog::error("Command line: {}", e.what());
        return std::nullopt;
    }

    if (memlimit_mib != 0) {
        if (memlimit_mib > (std::numeric_limits<uint64_t>::max() >> 20)) {
            spdlog::error("Command line: --pwhash-mem-mib {} is out of range", memlimit_mib);
            return std::nullopt;
        }
        config.pwhash.memlimit = memlimit_mib << 20;
    }

    return config;
}

bool save_config(const CoreConfig& config, const std::string& path) {
    std::ofstream file(path);
    if (!file) {
        return false;
    }

    file << "[crypto]\n";
    file << "kem = " << config.kem_algorithm << "\n";
    file << "\n";

    file << "[vault]\n";
    file << "opslimit = " << config.pwhash.opslimit << "\n";
    file << "memlimit = " << config.pwhash.memlimit << "\n";
    file << "\n";

    file << "[service]\n";
    file << "kdf_workers = " << config.kdf_workers << "\n";
    file << "\n";

    file << "[logging]\n";
    file << "level = " << config.log_level << "\n";
    if (!config.log_pattern.empty()) {
        file << "pattern = \"" << config.log_pattern << "\"\n";
    }

    return static_cast<bool>(file);
}

CoreConfig merge_config(const CoreConfig& base, const CoreConfig& overlay) {
    const CoreConfig defaults;
    CoreConfig result = base;

    // Override with values the overlay changed from the defaults
    if (overlay.kem_algorithm != defaults.kem_algorithm) {
        result.kem_algorithm = overlay.kem_algorithm;
    }
    if (overlay.pwhash.opslimit != defaults.pwhash.opslimit) {
        result.pwhash.opslimit = overlay.pwhash.opslimit;
    }
    if (overlay.pwhash.memlimit != defaults.pwhash.memlimit) {
        result.pwhash.memlimit = overlay.pwhash.memlimit;
    }
    if (overlay.kdf_workers != defaults.kdf_workers) {
        result.kdf_workers = overlay.kdf_workers;
    }
    if (overlay.log_level != defaults.log_level) {
        result.log_level = overlay.log_level;
    }
    if (!overlay.log_pattern.empty()) {
        result.log_pattern = overlay.log_pattern;
    }

    return result;
}

ValidationResult validate_config(const CoreConfig& config) {
    ValidationResult result;

    // No fallback exists for the KEM, so an unusable one is fatal
    if (!crypto::Kem::is_supported(config.kem_algorithm)) {
        result.errors.push_back("KEM algorithm unavailable or not permitted: " + config.kem_algorithm);
        result.valid = false;
    }

    if (!crypto::pwhash_params_acceptable(config.pwhash)) {
        result.errors.push_back("Vault work factor below the interactive floor or above limits");
        result.valid = false;
    }

    if (config.kdf_workers == 0) {
        result.errors.push_back("kdf_workers must be at least 1");
        result.valid = false;
    } else if (config.kdf_workers > MAX_KDF_WORKERS) {
        result.errors.push_back("kdf_workers must not exceed " + std::to_string(MAX_KDF_WORKERS));
        result.valid = false;
    }

    unsigned hw = std::thread::hardware_concurrency();
    if (hw != 0 && config.kdf_workers > hw) {
        result.warnings.push_back("kdf_workers exceeds hardware threads");
    }

    constexpr uint64_t kdf_memory_budget = 4ULL << 30;
    if (config.kdf_workers != 0 &&
        config.pwhash.memlimit > kdf_memory_budget / config.kdf_workers) {
        result.warnings.push_back("Concurrent vault derivations may use more than 4 GiB");
    }

    if (!utils::is_log_level(config.log_level)) {
        result.warnings.push_back("Unknown log level '" + config.log_level + "', using info");
    }

    return result;
}

}  // namespace pqchat::config
