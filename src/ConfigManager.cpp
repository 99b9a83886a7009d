#include "ConfigManager.h"
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

static char const* kCfgFile = "config.json";

namespace cfg {
std::string defaultConfigPath() { return kCfgFile; }

std::optional<EngineSettings> loadSettings(std::string const& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return std::nullopt;

    try {
        nlohmann::json j;
        in >> j;
        if (!j.is_object()) {
            spdlog::warn("[cfg] {} is not a JSON object, ignoring", path);
            return std::nullopt;
        }
        return j.get<EngineSettings>();
    } catch (std::exception const& e) {
        spdlog::warn("[cfg] Failed to read {}: {}", path, e.what());
    }
    return std::nullopt;
}

bool saveSettings(std::string const& path, EngineSettings const& s)
{
    try {
        nlohmann::json j = s;
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out) {
            spdlog::error("[cfg] Cannot open {} for writing", path);
            return false;
        }
        out << j.dump(4);
        return static_cast<bool>(out);
    } catch (std::exception const& e) {
        spdlog::error("[cfg] Failed to write {}: {}", path, e.what());
    }
    return false;
}
} // namespace cfg
