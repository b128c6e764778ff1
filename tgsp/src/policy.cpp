#include "policy.hpp"
#include "digest.hpp"
#include <yaml-cpp/yaml.h>
#include <stdexcept>

PolicyDocument parse_policy(const std::vector<uint8_t>& raw, const std::string& origin) {
    YAML::Node doc;
    try {
        doc = YAML::Load(std::string(raw.begin(), raw.end()));
    } catch (const YAML::Exception& e) {
        throw std::invalid_argument("policy " + origin + ": " + e.what());
    }
    if (!doc.IsMap())
        throw std::invalid_argument("policy " + origin + ": top level must be a mapping");

    PolicyDocument p;
    try {
        // Scalars keep their source spelling, so "version: 1.0" stays "1.0".
        if (doc["id"] && doc["id"].IsScalar())
            p.id = doc["id"].as<std::string>();
        if (doc["version"] && doc["version"].IsScalar())
            p.version = doc["version"].as<std::string>();
    } catch (const YAML::Exception& e) {
        throw std::invalid_argument("policy " + origin + ": " + e.what());
    }

    if (p.id.empty())
        throw std::invalid_argument("policy " + origin + ": missing 'id'");
    if (p.version.empty())
        throw std::invalid_argument("policy " + origin + ": missing 'version'");

    p.raw  = raw;
    p.hash = sha256_hex(raw);
    return p;
}
