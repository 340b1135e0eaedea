#pragma once

#include <string>
#include <string_view>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <glm/glm.hpp>

namespace Hillkeeper {

/**
 * @brief JSON-backed key/value configuration
 *
 * Holds a JSON document and resolves dot-separated key paths
 * (e.g. "map.sizeX"). Used for mod options and scenario files.
 */
class Config {
public:
    Config() = default;
    explicit Config(nlohmann::json data) : m_data(std::move(data)) {}

    /**
     * @brief Load configuration from JSON file
     * @param filepath Path to configuration file
     * @return true if loaded successfully
     */
    bool Load(const std::filesystem::path& filepath);

    /**
     * @brief Parse configuration from a JSON string
     * @return true if parsed successfully
     */
    bool LoadFromString(std::string_view text);

    /**
     * @brief Get a configuration value with type safety
     * @tparam T The expected type
     * @param key Dot-separated key path (e.g., "map.sizeX")
     * @param defaultValue Value to return if key not found or has the wrong type
     */
    template<typename T>
    T Get(std::string_view key, const T& defaultValue = T{}) const;

    /**
     * @brief Set a configuration value, creating intermediate objects
     */
    template<typename T>
    void Set(std::string_view key, const T& value);

    /**
     * @brief Check if a key exists and is not null
     */
    [[nodiscard]] bool Has(std::string_view key) const;

    /**
     * @brief Raw node lookup, nullptr when missing
     */
    [[nodiscard]] const nlohmann::json* Find(std::string_view key) const;

    /**
     * @brief Get the underlying JSON object for direct access
     */
    [[nodiscard]] const nlohmann::json& GetJson() const { return m_data; }

    [[nodiscard]] const std::filesystem::path& GetPath() const { return m_filepath; }

private:
    nlohmann::json m_data = nlohmann::json::object();
    std::filesystem::path m_filepath;

    nlohmann::json* NavigateToKey(std::string_view key, bool create);
    const nlohmann::json* NavigateToKey(std::string_view key) const;
};

// Template implementations
template<typename T>
T Config::Get(std::string_view key, const T& defaultValue) const {
    const auto* node = NavigateToKey(key);
    if (!node || node->is_null()) {
        return defaultValue;
    }

    try {
        if constexpr (std::is_same_v<T, glm::vec2>) {
            if (node->is_array() && node->size() >= 2) {
                return glm::vec2((*node)[0].get<float>(), (*node)[1].get<float>());
            }
        } else if constexpr (std::is_same_v<T, glm::vec4>) {
            if (node->is_array() && node->size() >= 4) {
                return glm::vec4(
                    (*node)[0].get<float>(),
                    (*node)[1].get<float>(),
                    (*node)[2].get<float>(),
                    (*node)[3].get<float>()
                );
            }
        } else {
            return node->get<T>();
        }
    } catch (const nlohmann::json::exception&) {
        return defaultValue;
    }
    return defaultValue;
}

template<typename T>
void Config::Set(std::string_view key, const T& value) {
    auto* node = NavigateToKey(key, true);
    if (node) {
        if constexpr (std::is_same_v<T, glm::vec2>) {
            *node = nlohmann::json::array({value.x, value.y});
        } else if constexpr (std::is_same_v<T, glm::vec4>) {
            *node = nlohmann::json::array({value.x, value.y, value.z, value.w});
        } else {
            *node = value;
        }
    }
}

} // namespace Hillkeeper
