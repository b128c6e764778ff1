#include "config.hpp"
#include "symmetric.hpp"
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <stdexcept>
#include <string>

static const uint64_t kMaxEntrySizeCeiling = AEAD_MAX_SEALED;
static const uint32_t kMaxEntriesCeiling   = 1u << 20;

static std::runtime_error config_error(const std::string& path, const std::string& msg) {
    return std::runtime_error("config " + path + ": " + msg);
}

EngineConfig load_config(const std::string& path) {
    YAML::Node doc;
    try {
        doc = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw config_error(path, e.what());
    }

    EngineConfig cfg;
    if (doc.IsNull())
        return cfg;
    if (!doc.IsMap())
        throw config_error(path, "top level must be a mapping");

    try {
        for (const auto& kv : doc) {
            const std::string key = kv.first.as<std::string>();
            const YAML::Node& val = kv.second;

            if (key == "max-entry-size") {
                uint64_t v = val.as<uint64_t>();
                if (v == 0 || v > kMaxEntrySizeCeiling)
                    throw config_error(path, "max-entry-size out of range");
                cfg.max_entry_size = v;
            } else if (key == "max-entries") {
                uint32_t v = val.as<uint32_t>();
                if (v == 0 || v > kMaxEntriesCeiling)
                    throw config_error(path, "max-entries out of range");
                cfg.max_entries = v;
            } else if (key == "cipher") {
                try {
                    cfg.default_cipher = cipher_from_name(val.as<std::string>());
                } catch (const std::invalid_argument& e) {
                    throw config_error(path, e.what());
                }
            } else if (key == "compress") {
                cfg.compress = val.as<bool>();
            } else if (key == "compression-level") {
                int v = val.as<int>();
                if (v < 1 || v > 9)
                    throw config_error(path, "compression-level must be 1..9");
                cfg.compression_level = v;
            } else if (key == "producer-id") {
                cfg.producer_id = val.as<std::string>();
                if (cfg.producer_id.empty())
                    throw config_error(path, "producer-id must not be empty");
            } else if (key == "require-signature") {
                cfg.require_signature = val.as<bool>();
            } else {
                throw config_error(path, "unknown key '" + key + "'");
            }
        }
    } catch (const YAML::Exception& e) {
        throw config_error(path, e.what());
    }
    return cfg;
}

EngineConfig resolve_config(const std::string& cli_path) {
    if (!cli_path.empty())
        return load_config(cli_path);
    const char* env = std::getenv("TGSP_CONFIG");
    if (env && *env)
        return load_config(env);
    return EngineConfig{};
}
