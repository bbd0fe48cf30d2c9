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
 * @file i_structure_set_writer.hpp
 * @brief Abstract sink for named binary regions
 * @details Defines the NamedMask record handed over by OutputAssembler and
 *          the IStructureSetWriter interface implemented by concrete
 *          structure-set serializers.
 */
#pragma once

#include "services/chord/chord_segmentation_types.hpp"

#include <expected>
#include <filesystem>
#include <string>
#include <vector>

namespace chord_cutter::services {

/**
 * @brief Error information for structure export operations
 */
struct ExportError {
    enum class Code {
        Success,
        FileAccessDenied,
        InvalidData,
        EncodingFailed,
        InternalError
    };

    Code code = Code::Success;
    std::string message;

    [[nodiscard]] bool isSuccess() const noexcept {
        return code == Code::Success;
    }

    [[nodiscard]] std::string toString() const {
        switch (code) {
            case Code::Success: return "Success";
            case Code::FileAccessDenied: return "File access denied: " + message;
            case Code::InvalidData: return "Invalid data: " + message;
            case Code::EncodingFailed: return "Encoding failed: " + message;
            case Code::InternalError: return "Internal error: " + message;
        }
        return "Unknown error";
    }
};

/**
 * @brief One named region ready for serialization
 *
 * The mask holds only 0 and 1.
 */
struct NamedMask {
    std::string name;
    MaskVolumeType::Pointer mask;
    SliceRange range;
    size_t voxelCount = 0;
};

/**
 * @brief Interface for structure-set serializers
 *
 * Implementations write every region of @p regions, in order, to
 * @p destination. An empty sequence is valid.
 */
class IStructureSetWriter {
public:
    virtual ~IStructureSetWriter() = default;

    [[nodiscard]] virtual std::expected<void, ExportError> write(
        const std::vector<NamedMask>& regions,
        const std::filesystem::path& destination) = 0;

    /// Short format name for log messages
    [[nodiscard]] virtual std::string formatName() const = 0;
};

}  // namespace chord_cutter::services
