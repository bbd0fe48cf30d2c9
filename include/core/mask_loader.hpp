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
 * @file mask_loader.hpp
 * @brief Loading of binary masks from NIfTI / NRRD files
 * @details Reads chord and vertebra masks through ITK and normalizes them to
 *          0/1 occupancy volumes. Vertebra masks are located by identifier
 *          inside the directory written by the external segmentation model
 *          (`<prefix><identifier>.nii.gz`).
 */
#pragma once

#include "core/mask_types.hpp"

#include <expected>
#include <filesystem>
#include <string>
#include <vector>

namespace chord_cutter::core {

/// Error result with message
struct LoadError {
    enum class Code {
        FileNotFound,
        ReadFailed,
        UnsupportedImage
    };

    Code code = Code::ReadFailed;
    std::string message;

    [[nodiscard]] std::string toString() const {
        switch (code) {
            case Code::FileNotFound: return "File not found: " + message;
            case Code::ReadFailed: return "Read failed: " + message;
            case Code::UnsupportedImage: return "Unsupported image: " + message;
        }
        return "Unknown error";
    }
};

/// Masks found for a list of vertebrae
struct VertebraMaskLoad {
    VertebraMaskSet masks;

    /// Identifiers without a mask file, in request order
    std::vector<std::string> missing;
};

class MaskLoader {
public:
    static constexpr const char* kDefaultPrefix = "vertebrae_";
    static constexpr const char* kMaskExtension = ".nii.gz";

    /**
     * @brief Load a mask file as a 0/1 volume
     *
     * Any non-zero input value becomes 1.
     *
     * @param path NIfTI (.nii, .nii.gz) or NRRD (.nrrd, .nhdr) file
     * @param flip Reverse the y axis (segmentation model outputs)
     */
    [[nodiscard]] static std::expected<MaskVolumeType::Pointer, LoadError>
    loadMask(const std::filesystem::path& path, bool flip = false);

    /**
     * @brief Load the mask of every identifier that has a file
     *
     * Identifiers without a file are listed in VertebraMaskLoad::missing;
     * unreadable files are an error.
     */
    [[nodiscard]] static std::expected<VertebraMaskLoad, LoadError>
    loadVertebraMasks(const std::filesystem::path& directory,
                      const std::vector<std::string>& identifiers,
                      const std::string& prefix = kDefaultPrefix,
                      bool flip = true);

    /// Identifiers of @p identifiers without a mask file in @p directory
    [[nodiscard]] static std::vector<std::string>
    missingSegmentations(const std::filesystem::path& directory,
                         const std::vector<std::string>& identifiers,
                         const std::string& prefix = kDefaultPrefix);

    [[nodiscard]] static std::filesystem::path
    maskPath(const std::filesystem::path& directory,
             const std::string& identifier,
             const std::string& prefix = kDefaultPrefix);

    /// Reverse the row (y) order of every slice in place
    static void flipYAxis(MaskVolumeType* mask);
};

} // namespace chord_cutter::core
