#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace Hillkeeper {
namespace Events {

/**
 * @brief Destination for published state parameters
 *
 * One-way transport from the authoritative rules to observers.
 */
class IRulesParamSink {
public:
    virtual ~IRulesParamSink() = default;

    virtual void SetRulesParam(std::string_view name, const nlohmann::json& value) = 0;
};

/**
 * @brief Convert a published value to its transport form
 *
 * Empty optionals are transmitted as null.
 */
template<typename T>
nlohmann::json ToRulesParam(const T& value) {
    return nlohmann::json(value);
}

template<typename T>
nlohmann::json ToRulesParam(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

/**
 * @brief A value that is only transmitted when it changes
 *
 * Set() stores without sending; Send() transmits if the value differs
 * from the last transmitted value. The first Send() always transmits.
 *
 * @code
 * PublishedValue<int> score("score", sink);
 * score.SetAndSend(3);   // transmitted
 * score.SetAndSend(3);   // skipped
 * @endcode
 */
template<typename T>
class PublishedValue {
public:
    PublishedValue(std::string name, IRulesParamSink* sink, T initial = T{})
        : m_name(std::move(name)), m_sink(sink), m_value(std::move(initial)) {}

    void Set(const T& value) { m_value = value; }

    /**
     * @brief Transmit the current value if it differs from the last one sent
     * @return true if a transmission happened
     */
    bool Send() {
        if (m_lastSent && *m_lastSent == m_value) {
            return false;
        }
        if (m_sink) {
            m_sink->SetRulesParam(m_name, ToRulesParam(m_value));
        }
        m_lastSent = m_value;
        return true;
    }

    bool SetAndSend(const T& value) {
        Set(value);
        return Send();
    }

    [[nodiscard]] const T& Get() const noexcept { return m_value; }
    [[nodiscard]] const std::string& GetName() const noexcept { return m_name; }
    [[nodiscard]] bool IsDirty() const { return !m_lastSent || !(*m_lastSent == m_value); }

private:
    std::string m_name;
    IRulesParamSink* m_sink = nullptr;
    T m_value;
    std::optional<T> m_lastSent;
};

} // namespace Events
} // namespace Hillkeeper
