#pragma once

/**
 * @file config.h
 * @brief JSON scene configuration
 *
 * All configuration is static: it is loaded and applied before the first
 * frame is rendered. Missing keys fall back to defaults, unknown keys are
 * ignored, and keys with the wrong type raise ConfigurationError.
 *
 * @par File format
 * @code{.json}
 * {
 *   "fps": 30,
 *   "starsGiven": 214,
 *   "params": {
 *     "tablet": { "fullscreenAmount": 0.7 }
 *   }
 * }
 * @endcode
 */

#include <reel/types.h>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace reel {

class Composition;

/**
 * @brief Read-only view over a JSON configuration object
 */
class SceneConfig {
public:
    /// @brief Empty configuration (every getter returns its default)
    SceneConfig();

    /**
     * @brief Load from a JSON file
     * @throw ConfigurationError if the file is missing, malformed or not an object
     */
    static SceneConfig fromFile(const std::string& path);

    /**
     * @brief Wrap a JSON value
     * @throw ConfigurationError if it is not an object
     */
    static SceneConfig fromJson(nlohmann::json j);

    bool has(const std::string& key) const { return m_json.contains(key); }

    /// @name Typed getters
    /// Each throws ConfigurationError naming the key if the value has the wrong type.
    /// @{
    int getInt(const std::string& key, int def) const;
    float getFloat(const std::string& key, float def) const;
    bool getBool(const std::string& key, bool def) const;
    std::string getString(const std::string& key, const std::string& def) const;
    std::vector<float> getFloats(const std::string& key, const std::vector<float>& def) const;
    std::vector<int> getInts(const std::string& key, const std::vector<int>& def) const;
    /// @}

    /// @brief Nested object, empty if absent
    SceneConfig section(const std::string& key) const;

    /**
     * @brief Apply the "params" object to a composition's elements
     *
     * Unknown element or parameter names are logged and skipped.
     *
     * @return Number of parameters written
     * @throw ConfigurationError for non-numeric values or values outside the
     *        parameter's range
     */
    size_t applyParams(Composition& composition) const;

    const nlohmann::json& raw() const { return m_json; }

private:
    explicit SceneConfig(nlohmann::json j, std::string path);

    std::string keyPath(const std::string& key) const;

    nlohmann::json m_json;
    std::string m_path;   ///< Dotted location for error messages
};

} // namespace reel
