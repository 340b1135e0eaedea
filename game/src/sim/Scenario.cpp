#include "Scenario.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <array>
#include <stdexcept>
#include <utility>

namespace Hillkeeper {
namespace Sim {

namespace {

constexpr std::array<std::pair<EventType, std::string_view>, 7> kEventNames = {{
    {EventType::Spawn, "spawn"},
    {EventType::Move, "move"},
    {EventType::Give, "give"},
    {EventType::Destroy, "destroy"},
    {EventType::TeamDied, "teamDied"},
    {EventType::Build, "build"},
    {EventType::Damage, "damage"}
}};

MapRegion ParseStartBox(const nlohmann::json& j) {
    // [left, bottom, right, top]
    if (!j.is_array() || j.size() != 4) {
        throw std::invalid_argument("startBox must be an array of 4 numbers");
    }
    return MapRegion::Rect(j[0].get<float>(), j[3].get<float>(), j[2].get<float>(), j[1].get<float>());
}

} // namespace

const char* EventTypeToString(EventType type) {
    for (const auto& [value, name] : kEventNames) {
        if (value == type) {
            return name.data();
        }
    }
    return "unknown";
}

std::optional<EventType> EventTypeFromString(std::string_view name) {
    for (const auto& [value, text] : kEventNames) {
        if (text == name) {
            return value;
        }
    }
    return std::nullopt;
}

// ============================================================================
// ScenarioEvent
// ============================================================================

ScenarioEvent ScenarioEvent::FromJson(const nlohmann::json& j) {
    ScenarioEvent e;
    e.tick = j.at("tick").get<Tick>();

    const std::string typeName = j.at("type").get<std::string>();
    auto type = EventTypeFromString(typeName);
    if (!type) {
        throw std::invalid_argument("unknown event type: " + typeName);
    }
    e.type = *type;

    e.unit = j.value("unit", 0);
    e.unitDef = j.value("def", std::string{});
    e.team = j.value("team", 0);
    e.position = glm::vec2(j.value("x", 0.0f), j.value("z", 0.0f));
    e.facing = j.value("facing", 0);
    e.finished = j.value("finished", true);
    if (j.contains("attackerTeam") && !j["attackerTeam"].is_null()) {
        e.attackerTeam = j["attackerTeam"].get<TeamId>();
    }
    e.damage = j.value("damage", 0.0f);
    return e;
}

nlohmann::json ScenarioEvent::ToJson() const {
    nlohmann::json j;
    j["tick"] = tick;
    j["type"] = EventTypeToString(type);
    j["unit"] = unit;
    if (!unitDef.empty()) {
        j["def"] = unitDef;
    }
    j["team"] = team;
    j["x"] = position.x;
    j["z"] = position.y;
    if (type == EventType::Build) {
        j["facing"] = facing;
    }
    if (type == EventType::Damage) {
        j["damage"] = damage;
        if (attackerTeam) {
            j["attackerTeam"] = *attackerTeam;
        }
    }
    return j;
}

// ============================================================================
// Scenario
// ============================================================================

bool Scenario::Load(const std::filesystem::path& path) {
    Config document;
    if (!document.Load(path)) {
        SIM_LOG_ERROR("Could not read scenario file: {}", path.string());
        return false;
    }
    if (!LoadFromConfig(document)) {
        return false;
    }
    if (name.empty()) {
        name = path.stem().string();
    }
    return true;
}

bool Scenario::LoadFromConfig(const Config& document) {
    Scenario loaded;
    loaded.name = document.Get<std::string>("name", "");

    auto& map = loaded.setup.map;
    map.sizeX = document.Get<float>("map.sizeX", 0.0f);
    map.sizeZ = document.Get<float>("map.sizeZ", 0.0f);
    map.squareSize = document.Get<float>("map.squareSize", 8.0f);
    map.ticksPerSecond = document.Get<int>("map.ticksPerSecond", 30);
    if (map.sizeX <= 0.0f || map.sizeZ <= 0.0f || map.ticksPerSecond <= 0) {
        SIM_LOG_ERROR("Scenario map needs positive sizeX, sizeZ and ticksPerSecond");
        return false;
    }

    const auto& root = document.GetJson();
    try {
        if (const auto* options = document.Find("modOptions"); options && options->is_object()) {
            loaded.modOptions = Config(*options);
        }

        Rules::UnitDefId nextDefId = 1;
        for (const auto& defJson : root.value("unitDefs", nlohmann::json::array())) {
            ScenarioUnitDef def;
            def.def.id = nextDefId++;
            def.def.name = defJson.at("name").get<std::string>();
            def.def.isBuilding = defJson.value("building", false);
            def.def.isStaticBuilder = defJson.value("staticBuilder", false);
            def.def.xsize = defJson.value("xsize", 1);
            def.def.zsize = defJson.value("zsize", 1);
            def.maxHealth = defJson.value("health", 100.0f);
            loaded.unitDefs.push_back(std::move(def));
        }

        if (root.contains("gaiaAlliance") && !root.at("gaiaAlliance").is_null()) {
            loaded.setup.gaiaAlliance = root.at("gaiaAlliance").get<AllianceId>();
        }

        for (const auto& allianceJson : root.at("alliances")) {
            Rules::AllianceSetup alliance;
            alliance.id = allianceJson.at("id").get<AllianceId>();
            alliance.teams = allianceJson.at("teams").get<std::vector<TeamId>>();
            alliance.startBox = ParseStartBox(allianceJson.at("startBox"));
            loaded.setup.alliances.push_back(std::move(alliance));
        }

        for (const auto& eventJson : root.value("events", nlohmann::json::array())) {
            loaded.events.push_back(ScenarioEvent::FromJson(eventJson));
        }
    } catch (const nlohmann::json::exception& e) {
        SIM_LOG_ERROR("Malformed scenario: {}", e.what());
        return false;
    } catch (const std::invalid_argument& e) {
        SIM_LOG_ERROR("Malformed scenario: {}", e.what());
        return false;
    }

    std::stable_sort(loaded.events.begin(), loaded.events.end(),
                     [](const ScenarioEvent& a, const ScenarioEvent& b) { return a.tick < b.tick; });

    const Tick lastEventTick = loaded.events.empty() ? 0 : loaded.events.back().tick;
    loaded.durationTicks = document.Get<Tick>("durationTicks", lastEventTick);

    SIM_LOG_DEBUG("Loaded scenario \"{}\": {} alliances, {} unit kinds, {} events",
                  loaded.name, loaded.setup.alliances.size(), loaded.unitDefs.size(), loaded.events.size());

    *this = std::move(loaded);
    return true;
}

} // namespace Sim
} // namespace Hillkeeper
