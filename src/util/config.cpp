#include <idforge/config.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>

namespace idforge {

Result<FactoryConfig> FactoryConfig::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return IdError{IdError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    FactoryConfig cfg;

    // [name] section
    if (auto name = doc["name"].as_table()) {
        if (auto v = (*name)["version"].value<int64_t>()) {
            if (*v != 3 && *v != 5) {
                return IdError{IdError::Config,
                    "invalid [name] version " + std::to_string(*v),
                    "name-based version must be 3 or 5"};
            }
            cfg.name_version = static_cast<int>(*v);
            cfg.name_version_set = true;
        }
    }

    // [v8] section
    if (auto v8 = doc["v8"].as_table()) {
        if (auto v = (*v8)["hash"].value<std::string>()) {
            auto alg = parse_hash_algorithm(*v);
            if (alg.is_err() || alg.value() == HashAlgorithm::Md5 ||
                alg.value() == HashAlgorithm::Sha1) {
                return IdError{IdError::Config,
                    "invalid [v8] hash '" + *v + "'",
                    "expected SHA256, SHA384 or SHA512"};
            }
            cfg.v8_hash = alg.value();
            cfg.v8_hash_set = true;
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto v = (*lg)["level"].value<std::string>()) {
            auto lvl = log::parse_level(*v);
            if (lvl.is_err()) {
                return IdError{IdError::Config,
                    "invalid [log] level '" + *v + "'",
                    lvl.error().hint};
            }
            cfg.log_level = lvl.value();
            cfg.log_level_set = true;
        }
        if (auto v = (*lg)["color"].value<bool>()) {
            cfg.log_color = *v;
            cfg.log_color_set = true;
        }
    }

    return Result<FactoryConfig>::ok(std::move(cfg));
}

Result<FactoryConfig> FactoryConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return IdError{IdError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto cfg = FactoryConfig::parse(ss.str());
    if (cfg.is_err()) {
        cfg.error().message += " (in " + path + ")";
    }
    return cfg;
}

void FactoryConfig::merge(const FactoryConfig& other) {
    if (other.name_version_set) {
        name_version = other.name_version;
        name_version_set = true;
    }
    if (other.v8_hash_set) {
        v8_hash = other.v8_hash;
        v8_hash_set = true;
    }
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
    if (other.log_color_set) {
        log_color = other.log_color;
        log_color_set = true;
    }
}

void FactoryConfig::apply_logging() const {
    if (log_level_set) log::set_level(log_level);
    if (log_color_set) log::set_color_enabled(log_color);
}

} // namespace idforge
