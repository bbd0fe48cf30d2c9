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
 * @file nifti_structure_set_writer.hpp
 * @brief Writes named regions as NIfTI masks with a JSON manifest
 * @details Each region becomes `<name>.nii.gz` inside the destination
 *          directory; `structures.json` lists the regions in order with
 *          their file name, slice range and voxel count.
 */
#pragma once

#include "services/export/i_structure_set_writer.hpp"

#include <string>

namespace chord_cutter::services {

class NiftiStructureSetWriter : public IStructureSetWriter {
public:
    static constexpr const char* kManifestFileName = "structures.json";

    NiftiStructureSetWriter() = default;
    ~NiftiStructureSetWriter() override = default;

    /**
     * @brief Write all regions into @p destination (created if missing)
     */
    [[nodiscard]] std::expected<void, ExportError> write(
        const std::vector<NamedMask>& regions,
        const std::filesystem::path& destination) override;

    [[nodiscard]] std::string formatName() const override { return "NIfTI"; }

    [[nodiscard]] static std::string fileNameFor(const std::string& regionName);
};

}  // namespace chord_cutter::services
