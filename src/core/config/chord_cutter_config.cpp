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

#include "core/chord_cutter_config.hpp"

#include <fstream>
#include <system_error>

#include <nlohmann/json.hpp>

namespace chord_cutter::core {

std::expected<void, ConfigError> ChordCutterConfig::validate() const {
    if (!(threshold > 0.0 && threshold < 1.0)) {
        return std::unexpected(ConfigError{
            ConfigError::Code::InvalidValue,
            "threshold must satisfy 0 < threshold < 1"
        });
    }

    if (vertebraMaskDirectory.empty()) {
        return std::unexpected(ConfigError{
            ConfigError::Code::InvalidValue,
            "vertebraMaskDirectory is required"
        });
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(vertebraMaskDirectory, ec)) {
        return std::unexpected(ConfigError{
            ConfigError::Code::InvalidValue,
            "vertebraMaskDirectory is not a directory: " + vertebraMaskDirectory.string()
        });
    }

    if (groups.empty() && vertebrae.empty()) {
        return std::unexpected(ConfigError{
            ConfigError::Code::InvalidValue,
            "at least one group or vertebra must be selected"
        });
    }

    if (produceConfinedMasks) {
        if (chordMaskPath.empty()) {
            return std::unexpected(ConfigError{
                ConfigError::Code::InvalidValue,
                "chordMaskPath is required when produceConfinedMasks is set"
            });
        }
        if (outputDirectory.empty()) {
            return std::unexpected(ConfigError{
                ConfigError::Code::InvalidValue,
                "outputDirectory is required when produceConfinedMasks is set"
            });
        }
    }

    if (verbosity < 0 || verbosity > 2) {
        return std::unexpected(ConfigError{
            ConfigError::Code::InvalidValue,
            "verbosity must be 0, 1 or 2"
        });
    }

    return {};
}

std::expected<ChordCutterConfig, ConfigError>
ChordCutterConfig::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        return std::unexpected(ConfigError{
            ConfigError::Code::InvalidFormat,
            "top-level value must be an object"
        });
    }

    try {
        ChordCutterConfig config;
        config.chordMaskPath = j.value("chordMaskPath", std::string{});
        config.vertebraMaskDirectory = j.value("vertebraMaskDirectory", std::string{});
        config.maskFilePrefix = j.value("maskFilePrefix", config.maskFilePrefix);
        config.flipVertebraMasks = j.value("flipVertebraMasks", config.flipVertebraMasks);
        config.flipChordMask = j.value("flipChordMask", config.flipChordMask);
        config.groups = j.value("groups", std::vector<std::string>{});
        config.vertebrae = j.value("vertebrae", std::vector<std::string>{});
        config.threshold = j.value("threshold", config.threshold);
        config.produceConfinedMasks = j.value("produceConfinedMasks", config.produceConfinedMasks);
        config.outputDirectory = j.value("outputDirectory", std::string{});
        config.structureNamePrefix = j.value("structureNamePrefix", std::string{});
        config.verbosity = j.value("verbosity", config.verbosity);

        const auto workers = j.value("maxWorkers", static_cast<long long>(config.maxWorkers));
        if (workers < 0) {
            return std::unexpected(ConfigError{
                ConfigError::Code::InvalidValue,
                "maxWorkers must not be negative"
            });
        }
        config.maxWorkers = static_cast<unsigned int>(workers);

        if (j.contains("logging")) {
            const auto& log = j["logging"];
            const auto levelName = log.value("level", std::string("info"));
            auto level = logging::parseLogLevel(levelName);
            if (!level) {
                return std::unexpected(ConfigError{
                    ConfigError::Code::InvalidValue,
                    "unknown logging level: " + levelName
                });
            }
            config.logConfig.level = *level;
            config.logConfig.enableFileLogging = log.value("fileLogging", false);
            config.logConfig.logDirectory = log.value("directory", std::string{});
        }

        return config;
    }
    catch (const nlohmann::json::exception& e) {
        return std::unexpected(ConfigError{
            ConfigError::Code::InvalidFormat,
            e.what()
        });
    }
}

std::expected<ChordCutterConfig, ConfigError>
ChordCutterConfig::loadFromFile(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return std::unexpected(ConfigError{
            ConfigError::Code::FileNotFound,
            path.string()
        });
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(ConfigError{
            ConfigError::Code::FileNotFound,
            "Failed to open file: " + path.string()
        });
    }

    auto j = nlohmann::json::parse(file, nullptr, false);
    if (j.is_discarded()) {
        return std::unexpected(ConfigError{
            ConfigError::Code::InvalidFormat,
            "Malformed JSON in " + path.string()
        });
    }

    auto config = fromJson(j);
    if (!config) {
        return config;
    }

    auto validation = config->validate();
    if (!validation) {
        return std::unexpected(validation.error());
    }
    return config;
}

} // namespace chord_cutter::core
