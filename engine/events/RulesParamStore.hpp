#pragma once

#include "PublishedValue.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace Hillkeeper {
namespace Events {

/**
 * @brief In-memory rules parameter table
 *
 * Receiving end of the published state. Observers read parameters by
 * name; a per-name write counter records how many transmissions arrived.
 */
class RulesParamStore : public IRulesParamSink {
public:
    void SetRulesParam(std::string_view name, const nlohmann::json& value) override;

    /**
     * @brief Get a parameter, nullptr when it was never transmitted
     */
    [[nodiscard]] const nlohmann::json* Find(std::string_view name) const;

    /**
     * @brief Get a numeric parameter; null or missing yields nullopt
     */
    [[nodiscard]] std::optional<double> GetNumber(std::string_view name) const;

    /**
     * @brief Get an integral parameter; null or missing yields nullopt
     */
    [[nodiscard]] std::optional<int64_t> GetInteger(std::string_view name) const;

    [[nodiscard]] bool GetBool(std::string_view name, bool defaultValue = false) const;

    [[nodiscard]] uint64_t GetWriteCount(std::string_view name) const;
    [[nodiscard]] uint64_t GetTotalWrites() const noexcept { return m_totalWrites; }

    [[nodiscard]] nlohmann::json ToJson() const;

    void Clear();

private:
    struct Entry {
        nlohmann::json value;
        uint64_t writes = 0;
    };

    std::map<std::string, Entry, std::less<>> m_params;
    uint64_t m_totalWrites = 0;
};

} // namespace Events
} // namespace Hillkeeper
