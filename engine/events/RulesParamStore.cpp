#include "events/RulesParamStore.hpp"

namespace Hillkeeper {
namespace Events {

void RulesParamStore::SetRulesParam(std::string_view name, const nlohmann::json& value) {
    auto it = m_params.find(name);
    if (it == m_params.end()) {
        it = m_params.emplace(std::string(name), Entry{}).first;
    }
    it->second.value = value;
    ++it->second.writes;
    ++m_totalWrites;
}

const nlohmann::json* RulesParamStore::Find(std::string_view name) const {
    auto it = m_params.find(name);
    return it != m_params.end() ? &it->second.value : nullptr;
}

std::optional<double> RulesParamStore::GetNumber(std::string_view name) const {
    const auto* value = Find(name);
    if (!value || !value->is_number()) {
        return std::nullopt;
    }
    return value->get<double>();
}

std::optional<int64_t> RulesParamStore::GetInteger(std::string_view name) const {
    const auto* value = Find(name);
    if (!value || !value->is_number()) {
        return std::nullopt;
    }
    if (value->is_number_float()) {
        return static_cast<int64_t>(value->get<double>());
    }
    return value->get<int64_t>();
}

bool RulesParamStore::GetBool(std::string_view name, bool defaultValue) const {
    const auto* value = Find(name);
    if (!value || !value->is_boolean()) {
        return defaultValue;
    }
    return value->get<bool>();
}

uint64_t RulesParamStore::GetWriteCount(std::string_view name) const {
    auto it = m_params.find(name);
    return it != m_params.end() ? it->second.writes : 0;
}

nlohmann::json RulesParamStore::ToJson() const {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [name, entry] : m_params) {
        j[name] = entry.value;
    }
    return j;
}

void RulesParamStore::Clear() {
    m_params.clear();
    m_totalWrites = 0;
}

} // namespace Events
} // namespace Hillkeeper
