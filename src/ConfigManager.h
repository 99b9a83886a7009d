#pragma once
#include "EngineSettings.h"

#include <optional>
#include <string>

namespace cfg
{
    std::string                        defaultConfigPath();
    std::optional<EngineSettings>      loadSettings(std::string const& path);
    bool                               saveSettings(std::string const& path, EngineSettings const&);
} // namespace cfg
