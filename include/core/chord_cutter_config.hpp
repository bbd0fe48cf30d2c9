// BSD 3-Clause License
//
// Copyright (c) 2021-2025, 🍀☀🌕🌥 🌊
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

/**
 * @file chord_cutter_config.hpp
 * @brief Run configuration for the chord segmentation pipeline
 * @details Parameters of one run (input masks, vertebrae selection,
 *          threshold, export destination, logging), read from a JSON file.
 *
 * Example file:
 * @code
 * {
 *   "chordMaskPath": "/data/case01/chord.nii.gz",
 *   "vertebraMaskDirectory": "/data/case01/segmentations",
 *   "groups": ["cervical", "thorax"],
 *   "threshold": 0.02,
 *   "produceConfinedMasks": true,
 *   "outputDirectory": "/data/case01/chord_segments",
 *   "verbosity": 2,
 *   "logging": { "level": "info" }
 * }
 * @endcode
 */
#pragma once

#include "core/logging.hpp"

#include <expected>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace chord_cutter::core {

struct ConfigError {
    enum class Code {
        FileNotFound,
        InvalidFormat,
        InvalidValue
    };

    Code code = Code::InvalidValue;
    std::string message;

    [[nodiscard]] std::string toString() const {
        switch (code) {
            case Code::FileNotFound: return "Configuration not found: " + message;
            case Code::InvalidFormat: return "Invalid configuration format: " + message;
            case Code::InvalidValue: return "Invalid configuration value: " + message;
        }
        return "Unknown error";
    }
};

struct ChordCutterConfig {
    /// Spinal chord mask (NIfTI / NRRD)
    std::filesystem::path chordMaskPath;

    /// Directory holding `<maskFilePrefix><vertebra>.nii.gz` files
    std::filesystem::path vertebraMaskDirectory;

    std::string maskFilePrefix = "vertebrae_";

    /// Segmentation model outputs are mirrored along y
    bool flipVertebraMasks = true;
    bool flipChordMask = false;

    /// Anatomical groups (cervical, thorax, lumbar), expanded first
    std::vector<std::string> groups;

    /// Individual vertebrae, added after the groups
    std::vector<std::string> vertebrae;

    double threshold = 0.02;

    bool produceConfinedMasks = false;
    std::filesystem::path outputDirectory;

    /// Prepended to every exported structure name
    std::string structureNamePrefix;

    int verbosity = 1;

    /// 0 = hardware concurrency
    unsigned int maxWorkers = 0;

    logging::LogConfig logConfig;

    /**
     * @brief Check value ranges and required paths
     *
     * The mask directory must exist. Group names are checked when they
     * are expanded.
     */
    [[nodiscard]] std::expected<void, ConfigError> validate() const;

    /// Negative maxWorkers and unknown logging levels are InvalidValue
    [[nodiscard]] static std::expected<ChordCutterConfig, ConfigError>
    fromJson(const nlohmann::json& json);

    [[nodiscard]] static std::expected<ChordCutterConfig, ConfigError>
    loadFromFile(const std::filesystem::path& path);
};

} // namespace chord_cutter::core
