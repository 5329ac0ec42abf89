#pragma once

#include "tarmac/material/MaterialGraph.h"

#include <spdlog/common.h>
#include <string>

namespace tarmac::material {

struct BakeSettings {
    // TrackShader inputs read for each channel
    std::string colorSocket = kTrackShaderColorInput;
    std::string alphaSocket = kTrackShaderAlphaInput;
    std::string specularSocket = kTrackShaderSpecularInput;
    std::string swayFrequencySocket = kTrackShaderSwayFrequencyInput;
    std::string swayAmplitudeSocket = kTrackShaderSwayAmplitudeInput;
    std::string swayPhaseSocket = kTrackShaderSwayPhaseInput;

    // BakeAll runs independent channels concurrently
    bool parallelChannels = false;

    spdlog::level::level_enum logLevel = spdlog::level::info;

    // Missing file: defaults. Unknown keys are ignored; bad values keep the default with a warning.
    static BakeSettings Load(const std::string& path = "tarmac_bake.ini");
    bool Save(const std::string& path = "tarmac_bake.ini") const;

    // Set the core logger to logLevel
    void ApplyLogLevel() const;
};

} // namespace tarmac::material
