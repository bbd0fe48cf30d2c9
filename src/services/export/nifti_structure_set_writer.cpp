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

#include "services/export/nifti_structure_set_writer.hpp"
#include "core/logging.hpp"

#include <fstream>
#include <system_error>

#include <nlohmann/json.hpp>

#include <itkImageFileWriter.h>
#include <itkNiftiImageIO.h>

namespace chord_cutter::services {

namespace {
auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("NiftiStructureSetWriter");
    return logger;
}
}

std::string NiftiStructureSetWriter::fileNameFor(const std::string& regionName) {
    return regionName + ".nii.gz";
}

std::expected<void, ExportError> NiftiStructureSetWriter::write(
    const std::vector<NamedMask>& regions,
    const std::filesystem::path& destination)
{
    for (const auto& region : regions) {
        if (!region.mask) {
            return std::unexpected(ExportError{
                ExportError::Code::InvalidData,
                "Region '" + region.name + "' has no mask"
            });
        }
        if (region.name.empty() ||
            region.name.find_first_of("/\\") != std::string::npos) {
            return std::unexpected(ExportError{
                ExportError::Code::InvalidData,
                "Region name '" + region.name + "' is not a valid file name"
            });
        }
    }

    std::error_code ec;
    std::filesystem::create_directories(destination, ec);
    if (ec) {
        return std::unexpected(ExportError{
            ExportError::Code::FileAccessDenied,
            "Cannot create " + destination.string() + ": " + ec.message()
        });
    }

    nlohmann::json manifest;
    manifest["version"] = "1.0";
    manifest["structures"] = nlohmann::json::array();

    for (const auto& region : regions) {
        const auto fileName = fileNameFor(region.name);
        try {
            using WriterType = itk::ImageFileWriter<MaskVolumeType>;
            auto writer = WriterType::New();
            writer->SetInput(region.mask);
            writer->SetFileName((destination / fileName).string());
            writer->SetImageIO(itk::NiftiImageIO::New());
            writer->UseCompressionOn();
            writer->Update();
        } catch (const itk::ExceptionObject& e) {
            return std::unexpected(ExportError{
                ExportError::Code::EncodingFailed,
                "Failed to write " + fileName + ": " + e.GetDescription()
            });
        }

        manifest["structures"].push_back({
            {"name", region.name},
            {"file", fileName},
            {"firstSlice", region.range.minIndex},
            {"lastSlice", region.range.maxIndex},
            {"voxelCount", region.voxelCount}
        });
        getLogger()->debug("Wrote {} ({} voxels)", fileName, region.voxelCount);
    }

    const auto manifestPath = destination / kManifestFileName;
    std::ofstream file(manifestPath);
    if (!file.is_open()) {
        return std::unexpected(ExportError{
            ExportError::Code::FileAccessDenied,
            "Failed to open file for writing: " + manifestPath.string()
        });
    }
    file << manifest.dump(2);

    getLogger()->info("Wrote {} structures to {}", regions.size(), destination.string());
    return {};
}

}  // namespace chord_cutter::services
