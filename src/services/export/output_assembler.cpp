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

#include "services/export/output_assembler.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <unordered_set>
#include <utility>

namespace chord_cutter::services {

namespace {
auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("OutputAssembler");
    return logger;
}
}

OutputAssembler::OutputAssembler(std::string namePrefix)
    : namePrefix_(std::move(namePrefix)) {}

std::string OutputAssembler::structureName(const std::string& vertebra) const {
    return namePrefix_ + vertebra;
}

MaskVolumeType::Pointer OutputAssembler::toBooleanMask(const MaskVolumeType* mask) {
    if (!mask) {
        return nullptr;
    }

    auto output = MaskVolumeType::New();
    output->SetRegions(mask->GetLargestPossibleRegion());
    output->SetSpacing(mask->GetSpacing());
    output->SetOrigin(mask->GetOrigin());
    output->SetDirection(mask->GetDirection());
    output->Allocate();

    const auto* src = mask->GetBufferPointer();
    const size_t total = mask->GetBufferedRegion().GetNumberOfPixels();
    std::transform(src, src + total, output->GetBufferPointer(),
                   [](uint8_t v) -> uint8_t { return v != 0 ? 1 : 0; });
    return output;
}

std::vector<NamedMask> OutputAssembler::assemble(
    const ChordSegmentation& segmentation,
    const std::vector<std::string>& vertebraOrder) const
{
    std::vector<NamedMask> regions;
    std::unordered_set<std::string> emitted;
    for (const auto& vertebra : vertebraOrder) {
        if (!emitted.insert(vertebra).second) {
            continue;
        }
        const auto* confined = segmentation.findConfinedMask(vertebra);
        if (!confined || !confined->mask) {
            continue;
        }

        regions.push_back(NamedMask{
            structureName(vertebra),
            toBooleanMask(confined->mask.GetPointer()),
            confined->range,
            confined->voxelCount
        });
    }
    return regions;
}

std::expected<size_t, ExportError> OutputAssembler::write(
    const ChordSegmentation& segmentation,
    const std::vector<std::string>& vertebraOrder,
    IStructureSetWriter& writer,
    const std::filesystem::path& destination) const
{
    auto regions = assemble(segmentation, vertebraOrder);
    getLogger()->info("Writing {} chord segments as {} to {}",
                      regions.size(), writer.formatName(), destination.string());

    auto written = writer.write(regions, destination);
    if (!written) {
        getLogger()->error("Structure export failed: {}", written.error().toString());
        return std::unexpected(written.error());
    }
    return regions.size();
}

}  // namespace chord_cutter::services
