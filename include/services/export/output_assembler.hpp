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
 * @file output_assembler.hpp
 * @brief Converts confined chord masks into named boolean regions
 * @details Bridges ChordSegmentationEngine results and an
 *          IStructureSetWriter: regions are emitted in registry order,
 *          one per vertebra whose confined chord mask is non-empty.
 */
#pragma once

#include "services/chord/chord_segmentation_types.hpp"
#include "services/export/i_structure_set_writer.hpp"

#include <expected>
#include <filesystem>
#include <string>
#include <vector>

namespace chord_cutter::services {

class OutputAssembler {
public:
    OutputAssembler() = default;

    /// @param namePrefix Prepended to every vertebra identifier
    explicit OutputAssembler(std::string namePrefix);

    /**
     * @brief Build the ordered region sequence
     *
     * Vertebrae of @p vertebraOrder without a confined mask are left out.
     * Confined masks whose vertebra is not in @p vertebraOrder are ignored.
     */
    [[nodiscard]] std::vector<NamedMask> assemble(
        const ChordSegmentation& segmentation,
        const std::vector<std::string>& vertebraOrder) const;

    /**
     * @brief Assemble and hand the regions to @p writer
     * @return Number of regions written, or the writer's error
     */
    [[nodiscard]] std::expected<size_t, ExportError> write(
        const ChordSegmentation& segmentation,
        const std::vector<std::string>& vertebraOrder,
        IStructureSetWriter& writer,
        const std::filesystem::path& destination) const;

    /// Strict 0/1 copy of @p mask with the same geometry
    [[nodiscard]] static MaskVolumeType::Pointer toBooleanMask(const MaskVolumeType* mask);

    [[nodiscard]] std::string structureName(const std::string& vertebra) const;

private:
    std::string namePrefix_;
};

}  // namespace chord_cutter::services
