#pragma once

#include <idforge/digest.hpp>
#include <idforge/log.hpp>
#include <idforge/result.hpp>
#include <string>

namespace idforge {

// Defaults for IdFactory, read from TOML:
//
//   [name]
//   version = 5        # 3 or 5
//
//   [v8]
//   hash = "SHA256"    # SHA256, SHA384 or SHA512
//
//   [log]
//   level = "info"
//   color = false
struct FactoryConfig {
    int name_version = 5;
    HashAlgorithm v8_hash = HashAlgorithm::Sha256;
    log::Level log_level = log::Info;
    bool log_color = false;

    // Track which fields were explicitly set (for merge and apply_logging)
    bool name_version_set = false;
    bool v8_hash_set = false;
    bool log_level_set = false;
    bool log_color_set = false;

    // Parse from TOML string
    static Result<FactoryConfig> parse(const std::string& toml_str);

    // Load from a TOML file
    static Result<FactoryConfig> load(const std::string& path);

    // Merge another config on top (other's explicitly set values win)
    void merge(const FactoryConfig& other);

    // Push the [log] settings that were set into idforge::log.
    void apply_logging() const;
};

} // namespace idforge
