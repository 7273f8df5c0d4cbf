#include <reel/config.h>
#include <reel/composition.h>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace reel {

SceneConfig::SceneConfig()
    : m_json(json::object()) {}

SceneConfig::SceneConfig(json j, std::string path)
    : m_json(std::move(j)), m_path(std::move(path)) {}

SceneConfig SceneConfig::fromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigurationError("Cannot open scene config: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::exception& e) {
        std::cerr << "[SceneConfig] Error parsing " << path << ": " << e.what() << std::endl;
        throw ConfigurationError("Malformed scene config " + path + ": " + e.what());
    }

    std::clog << "[SceneConfig] Loaded " << path << std::endl;
    return fromJson(std::move(j));
}

SceneConfig SceneConfig::fromJson(json j) {
    if (!j.is_object()) {
        throw ConfigurationError("Scene config must be a JSON object");
    }
    return SceneConfig(std::move(j), "");
}

std::string SceneConfig::keyPath(const std::string& key) const {
    return m_path.empty() ? key : m_path + "." + key;
}

int SceneConfig::getInt(const std::string& key, int def) const {
    if (!has(key)) return def;
    const json& v = m_json.at(key);
    if (!v.is_number_integer()) {
        throw ConfigurationError("'" + keyPath(key) + "' must be an integer");
    }
    return v.get<int>();
}

float SceneConfig::getFloat(const std::string& key, float def) const {
    if (!has(key)) return def;
    const json& v = m_json.at(key);
    if (!v.is_number()) {
        throw ConfigurationError("'" + keyPath(key) + "' must be a number");
    }
    return v.get<float>();
}

bool SceneConfig::getBool(const std::string& key, bool def) const {
    if (!has(key)) return def;
    const json& v = m_json.at(key);
    if (!v.is_boolean()) {
        throw ConfigurationError("'" + keyPath(key) + "' must be true or false");
    }
    return v.get<bool>();
}

std::string SceneConfig::getString(const std::string& key, const std::string& def) const {
    if (!has(key)) return def;
    const json& v = m_json.at(key);
    if (v.is_string()) {
        return v.get<std::string>();
    }
    // Selected values are often written as numbers ("weekday": 3)
    if (v.is_number_integer()) {
        return std::to_string(v.get<int>());
    }
    throw ConfigurationError("'" + keyPath(key) + "' must be a string");
}

std::vector<float> SceneConfig::getFloats(const std::string& key, const std::vector<float>& def) const {
    if (!has(key)) return def;
    const json& v = m_json.at(key);
    if (!v.is_array()) {
        throw ConfigurationError("'" + keyPath(key) + "' must be an array of numbers");
    }
    std::vector<float> out;
    out.reserve(v.size());
    for (size_t i = 0; i < v.size(); ++i) {
        if (!v[i].is_number()) {
            throw ConfigurationError("'" + keyPath(key) + "[" + std::to_string(i) + "]' must be a number");
        }
        out.push_back(v[i].get<float>());
    }
    return out;
}

std::vector<int> SceneConfig::getInts(const std::string& key, const std::vector<int>& def) const {
    if (!has(key)) return def;
    const json& v = m_json.at(key);
    if (!v.is_array()) {
        throw ConfigurationError("'" + keyPath(key) + "' must be an array of integers");
    }
    std::vector<int> out;
    out.reserve(v.size());
    for (size_t i = 0; i < v.size(); ++i) {
        if (!v[i].is_number_integer()) {
            throw ConfigurationError("'" + keyPath(key) + "[" + std::to_string(i) + "]' must be an integer");
        }
        out.push_back(v[i].get<int>());
    }
    return out;
}

SceneConfig SceneConfig::section(const std::string& key) const {
    if (!has(key)) {
        return SceneConfig(json::object(), keyPath(key));
    }
    const json& v = m_json.at(key);
    if (!v.is_object()) {
        throw ConfigurationError("'" + keyPath(key) + "' must be an object");
    }
    return SceneConfig(v, keyPath(key));
}

size_t SceneConfig::applyParams(Composition& composition) const {
    SceneConfig params = section("params");
    size_t written = 0;

    for (const auto& [elementName, values] : params.raw().items()) {
        Element* element = composition.getByName(elementName);
        if (!element) {
            std::cerr << "[SceneConfig] Unknown element '" << elementName << "' in params, skipping\n";
            continue;
        }
        if (!values.is_object()) {
            throw ConfigurationError("'params." + elementName + "' must be an object");
        }

        for (const auto& [paramName, value] : values.items()) {
            const std::string key = "params." + elementName + "." + paramName;
            float current[4];
            if (!element->getParam(paramName, current)) {
                std::cerr << "[SceneConfig] " << element->name() << " '" << elementName
                          << "' has no parameter '" << paramName << "', skipping\n";
                continue;
            }

            float v[4] = {0, 0, 0, 0};
            if (value.is_boolean()) {
                v[0] = value.get<bool>() ? 1.0f : 0.0f;
            } else if (value.is_number()) {
                v[0] = value.get<float>();
            } else {
                throw ConfigurationError("'" + key + "' must be a number or boolean");
            }

            if (!element->setParam(paramName, v)) {
                throw ConfigurationError("'" + key + "' is out of range");
            }
            ++written;
        }
    }
    return written;
}

} // namespace reel
