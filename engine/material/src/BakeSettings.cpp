#include "tarmac/material/BakeSettings.h"
#include "tarmac/core/Log.h"

#include <fstream>
#include <utility>

namespace tarmac::material {

static std::string Trim(std::string s) {
    auto isSpace = [](unsigned char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
    while (!s.empty() && isSpace((unsigned char)s.front())) s.erase(s.begin());
    while (!s.empty() && isSpace((unsigned char)s.back())) s.pop_back();
    return s;
}

static const std::pair<const char*, spdlog::level::level_enum> s_LogLevels[] = {
    { "trace", spdlog::level::trace },
    { "debug", spdlog::level::debug },
    { "info", spdlog::level::info },
    { "warn", spdlog::level::warn },
    { "error", spdlog::level::err },
    { "critical", spdlog::level::critical },
    { "off", spdlog::level::off },
};

static bool ParseLogLevel(const std::string& value, spdlog::level::level_enum& out) {
    for (const auto& [name, level] : s_LogLevels) {
        if (value == name) {
            out = level;
            return true;
        }
    }
    return false;
}

static const char* LogLevelName(spdlog::level::level_enum level) {
    for (const auto& [name, l] : s_LogLevels) {
        if (l == level) return name;
    }
    return "info";
}

BakeSettings BakeSettings::Load(const std::string& path) {
    BakeSettings s{};
    std::ifstream f(path);
    if (!f.is_open()) return s;

    std::string line;
    while (std::getline(f, line)) {
        line = Trim(line);
        if (line.empty()) continue;
        if (line[0] == '#' || line[0] == ';') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = Trim(line.substr(0, eq));
        std::string val = Trim(line.substr(eq + 1));

        if (key == "ColorSocket") {
            s.colorSocket = val;
        } else if (key == "AlphaSocket") {
            s.alphaSocket = val;
        } else if (key == "SpecularSocket") {
            s.specularSocket = val;
        } else if (key == "SwayFrequencySocket") {
            s.swayFrequencySocket = val;
        } else if (key == "SwayAmplitudeSocket") {
            s.swayAmplitudeSocket = val;
        } else if (key == "SwayPhaseSocket") {
            s.swayPhaseSocket = val;
        } else if (key == "ParallelChannels") {
            if (val == "0" || val == "1") {
                s.parallelChannels = val == "1";
            } else {
                TARMAC_CORE_WARN("BakeSettings: ParallelChannels must be 0 or 1, got '{}'", val);
            }
        } else if (key == "LogLevel") {
            if (!ParseLogLevel(val, s.logLevel)) {
                TARMAC_CORE_WARN("BakeSettings: unknown LogLevel '{}'", val);
            }
        }
    }

    TARMAC_CORE_DEBUG("BakeSettings loaded from {} (ParallelChannels={}, LogLevel={})",
        path, s.parallelChannels ? 1 : 0, LogLevelName(s.logLevel));
    return s;
}

bool BakeSettings::Save(const std::string& path) const {
    std::ofstream f(path, std::ios::trunc);
    if (!f.is_open()) {
        TARMAC_CORE_ERROR("Failed to save BakeSettings to {}", path);
        return false;
    }

    f << "# Tarmac vertex bake settings\n";
    f << "# *Socket keys name the TrackShader input baked for each channel.\n";
    f << "ColorSocket=" << colorSocket << "\n";
    f << "AlphaSocket=" << alphaSocket << "\n";
    f << "SpecularSocket=" << specularSocket << "\n";
    f << "SwayFrequencySocket=" << swayFrequencySocket << "\n";
    f << "SwayAmplitudeSocket=" << swayAmplitudeSocket << "\n";
    f << "SwayPhaseSocket=" << swayPhaseSocket << "\n";
    f << "ParallelChannels=" << (parallelChannels ? 1 : 0) << "\n";
    f << "# trace|debug|info|warn|error|critical|off\n";
    f << "LogLevel=" << LogLevelName(logLevel) << "\n";
    f.close();

    if (!f) {
        TARMAC_CORE_ERROR("Failed to write BakeSettings to {}", path);
        return false;
    }

    TARMAC_CORE_INFO("BakeSettings saved to {}", path);
    return true;
}

void BakeSettings::ApplyLogLevel() const {
    Log::SetLevel(logLevel);
}

} // namespace tarmac::material
