#include "HillConfig.hpp"
#include "config/Config.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <string>
#include <vector>

namespace Hillkeeper {
namespace Rules {

namespace {

std::vector<std::string> SplitWords(std::string_view text) {
    std::vector<std::string> words;
    std::string current;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!current.empty()) {
                words.push_back(std::move(current));
                current.clear();
            }
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) {
        words.push_back(std::move(current));
    }
    return words;
}

std::optional<double> ParseDouble(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool ReadFlag(const Config& options, std::string_view key, bool defaultValue) {
    const auto* node = options.Find(key);
    if (!node || node->is_null()) {
        return defaultValue;
    }
    if (node->is_boolean()) {
        return node->get<bool>();
    }
    if (node->is_number()) {
        return node->get<double>() != 0.0;
    }
    if (node->is_string()) {
        const std::string value = ToLower(node->get<std::string>());
        if (value == "1" || value == "true" || value == "yes" || value == "on") {
            return true;
        }
        if (value == "0" || value == "false" || value == "no" || value == "off" || value.empty()) {
            return false;
        }
    }
    HILLKEEPER_LOG_WARN("Invalid value for option {}: {}. Using default {}.",
                        key, node->dump(), defaultValue);
    return defaultValue;
}

/**
 * Reads a number in [0, maxValue] given either as JSON number or numeric string.
 */
double ReadNumber(const Config& options, std::string_view key, double defaultValue,
                  double maxValue = std::numeric_limits<double>::max()) {
    const auto* node = options.Find(key);
    if (!node || node->is_null()) {
        HILLKEEPER_LOG_WARN("Missing option {}. Using default {}.", key, defaultValue);
        return defaultValue;
    }

    std::optional<double> value;
    if (node->is_number()) {
        value = node->get<double>();
    } else if (node->is_string()) {
        value = ParseDouble(node->get<std::string>());
    }

    if (!value || *value < 0.0) {
        HILLKEEPER_LOG_WARN("Invalid value for option {}: {}. Using default {}.",
                            key, node->dump(), defaultValue);
        return defaultValue;
    }
    if (*value > maxValue) {
        HILLKEEPER_LOG_WARN("Option {} is out of range: {} exceeds {}. Using default {}.",
                            key, node->dump(), maxValue, defaultValue);
        return defaultValue;
    }
    return *value;
}

Tick ToTicks(double ticks) {
    if (!(ticks > 0.0)) {
        return 0;
    }
    return static_cast<Tick>(std::llround(std::min(ticks, static_cast<double>(MaxOptionTicks))));
}

} // namespace

// ============================================================================
// Hill Area Parsing
// ============================================================================

MapRegion DefaultHillArea(const MapInfo& map) {
    return MapRegion::Rect(75.0f * map.sizeX / MapAreaScale,
                           125.0f * map.sizeZ / MapAreaScale,
                           125.0f * map.sizeX / MapAreaScale,
                           75.0f * map.sizeZ / MapAreaScale);
}

std::optional<MapRegion> ParseHillArea(std::string_view text, const MapInfo& map) {
    const auto words = SplitWords(text);
    if (words.size() < 4) {
        HILLKEEPER_LOG_WARN("Not enough arguments in area string \"{}\". Resorting to default area box.", text);
        return std::nullopt;
    }

    const std::string& shape = words[0];
    size_t numArgumentCount = 0;
    if (shape == "rect") {
        numArgumentCount = 4;
    } else if (shape == "circle") {
        numArgumentCount = 3;
    } else {
        HILLKEEPER_LOG_WARN("Invalid shape \"{}\" in area string. Resorting to default area box.", shape);
        return std::nullopt;
    }

    std::array<float, 4> nums{};
    for (size_t i = 0; i < numArgumentCount; ++i) {
        std::optional<double> num;
        if (i + 1 < words.size()) {
            num = ParseDouble(words[i + 1]);
        }
        if (!num || *num < 0.0 || *num > MapAreaScale) {
            HILLKEEPER_LOG_WARN("Invalid number in area string \"{}\". Resorting to default area box.", text);
            return std::nullopt;
        }
        nums[i] = static_cast<float>(*num);
    }

    if (shape == "rect") {
        return MapRegion::Rect(nums[0] * map.sizeX / MapAreaScale,
                               nums[1] * map.sizeZ / MapAreaScale,
                               nums[2] * map.sizeX / MapAreaScale,
                               nums[3] * map.sizeZ / MapAreaScale);
    }
    return MapRegion::Circle(nums[0] * map.sizeX / MapAreaScale,
                             nums[1] * map.sizeZ / MapAreaScale,
                             nums[2] * std::max(map.sizeX, map.sizeZ) / MapAreaScale);
}

// ============================================================================
// HillConfig Implementation
// ============================================================================

HillConfig HillConfig::FromOptions(const Config& options, const MapInfo& map) {
    HillConfig c;
    c.ticksPerSecond = map.ticksPerSecond;

    c.enabled = ReadFlag(options, OptionKeys::Enabled, false);
    if (!c.enabled) {
        c.hillArea = DefaultHillArea(map);
        c.UpdateDerived();
        return c;
    }

    const auto* areaNode = options.Find(OptionKeys::Area);
    if (areaNode && areaNode->is_string()) {
        c.hillArea = ParseHillArea(areaNode->get<std::string>(), map).value_or(DefaultHillArea(map));
    } else {
        HILLKEEPER_LOG_WARN("Missing or non-string option {}. Resorting to default area box.", OptionKeys::Area);
        c.hillArea = DefaultHillArea(map);
    }

    // Durations whose tick count would not fit are rejected like malformed ones
    const double ticksPerSecond = std::max(1, map.ticksPerSecond);
    const double maxTicks = static_cast<double>(MaxOptionTicks);

    c.buildOutsideBoxes = ReadFlag(options, OptionKeys::BuildOutsideBoxes, true);
    c.winKingTimeMinutes = ReadNumber(options, OptionKeys::WinKingTime, 10.0, maxTicks / (ticksPerSecond * 60.0));
    c.captureDelaySeconds = ReadNumber(options, OptionKeys::CaptureDelay, 20.0, maxTicks / ticksPerSecond);
    c.healthMultiplier = ReadNumber(options, OptionKeys::HealthMultiplier, 1.0,
                                    std::numeric_limits<float>::max());
    c.kingGlobalLos = ReadFlag(options, OptionKeys::KingGlobalLos, false);

    if (options.Has(OptionKeys::UpdateInterval)) {
        const double interval = ReadNumber(options, OptionKeys::UpdateInterval, 6.0,
                                           std::numeric_limits<int>::max());
        c.ticksPerUpdate = std::max(1, static_cast<int>(std::lround(interval)));
    }

    c.UpdateDerived();

    HILLKEEPER_LOG_INFO("King of the Hill enabled: hill {}, win after {} min, capture delay {} s",
                        c.hillArea.ToString(), c.winKingTimeMinutes, c.captureDelaySeconds);
    return c;
}

void HillConfig::UpdateDerived() {
    winKingTicks = ToTicks(ticksPerSecond * winKingTimeMinutes * 60.0);
    captureDelayTicks = ToTicks(ticksPerSecond * captureDelaySeconds);
}

nlohmann::json HillConfig::ToJson() const {
    nlohmann::json j;
    j["enabled"] = enabled;
    j["hillArea"] = hillArea.ToString();
    j["buildOutsideBoxes"] = buildOutsideBoxes;
    j["winKingTimeMinutes"] = winKingTimeMinutes;
    j["captureDelaySeconds"] = captureDelaySeconds;
    j["healthMultiplier"] = healthMultiplier;
    j["kingGlobalLos"] = kingGlobalLos;
    j["ticksPerUpdate"] = ticksPerUpdate;
    j["ticksPerSecond"] = ticksPerSecond;
    j["winKingTicks"] = winKingTicks;
    j["captureDelayTicks"] = captureDelayTicks;
    return j;
}

} // namespace Rules
} // namespace Hillkeeper
