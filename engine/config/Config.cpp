#include "config/Config.hpp"
#include "core/Logger.hpp"
#include <fstream>
#include <vector>

namespace Hillkeeper {

namespace {

std::vector<std::string> SplitKey(std::string_view key) {
    std::vector<std::string> parts;
    size_t start = 0;
    size_t end = 0;
    while ((end = key.find('.', start)) != std::string_view::npos) {
        parts.emplace_back(key.substr(start, end - start));
        start = end + 1;
    }
    parts.emplace_back(key.substr(start));
    return parts;
}

} // namespace

bool Config::Load(const std::filesystem::path& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        HILLKEEPER_LOG_ERROR("Failed to open config file: {}", filepath.string());
        return false;
    }

    try {
        nlohmann::json parsed = nlohmann::json::parse(file);
        if (!parsed.is_object()) {
            HILLKEEPER_LOG_ERROR("Config file {} is not a JSON object", filepath.string());
            return false;
        }
        m_data = std::move(parsed);
        m_filepath = filepath;
        HILLKEEPER_LOG_DEBUG("Loaded configuration from: {}", filepath.string());
        return true;
    } catch (const nlohmann::json::exception& e) {
        HILLKEEPER_LOG_ERROR("Failed to parse config file {}: {}", filepath.string(), e.what());
        return false;
    }
}

bool Config::LoadFromString(std::string_view text) {
    try {
        nlohmann::json parsed = nlohmann::json::parse(text);
        if (!parsed.is_object()) {
            HILLKEEPER_LOG_ERROR("Config text is not a JSON object");
            return false;
        }
        m_data = std::move(parsed);
        return true;
    } catch (const nlohmann::json::exception& e) {
        HILLKEEPER_LOG_ERROR("Failed to parse config text: {}", e.what());
        return false;
    }
}

bool Config::Has(std::string_view key) const {
    const auto* node = NavigateToKey(key);
    return node != nullptr && !node->is_null();
}

const nlohmann::json* Config::Find(std::string_view key) const {
    return NavigateToKey(key);
}

nlohmann::json* Config::NavigateToKey(std::string_view key, bool create) {
    nlohmann::json* current = &m_data;
    for (const auto& p : SplitKey(key)) {
        if (!current->is_object()) {
            if (!create) {
                return nullptr;
            }
            *current = nlohmann::json::object();
        }
        if (!current->contains(p)) {
            if (!create) {
                return nullptr;
            }
            (*current)[p] = nlohmann::json::object();
        }
        current = &(*current)[p];
    }
    return current;
}

const nlohmann::json* Config::NavigateToKey(std::string_view key) const {
    const nlohmann::json* current = &m_data;
    for (const auto& p : SplitKey(key)) {
        if (!current->is_object()) {
            return nullptr;
        }
        auto it = current->find(p);
        if (it == current->end()) {
            return nullptr;
        }
        current = &(*it);
    }
    return current;
}

} // namespace Hillkeeper
