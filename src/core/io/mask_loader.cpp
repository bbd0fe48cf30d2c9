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

#include "core/mask_loader.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <system_error>

#include <itkBinaryThresholdImageFilter.h>
#include <itkImageFileReader.h>
#include <itkNiftiImageIO.h>
#include <itkNrrdImageIO.h>

namespace chord_cutter::core {

namespace {
auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("MaskLoader");
    return logger;
}

using InputImageType = itk::Image<float, 3>;

bool fileExists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

} // anonymous namespace

std::filesystem::path MaskLoader::maskPath(
    const std::filesystem::path& directory,
    const std::string& identifier,
    const std::string& prefix)
{
    return directory / (prefix + identifier + kMaskExtension);
}

void MaskLoader::flipYAxis(MaskVolumeType* mask) {
    if (!mask) {
        return;
    }

    const auto size = mask->GetBufferedRegion().GetSize();
    const size_t rowLength = size[0];
    const size_t rows = size[1];
    const size_t sliceLength = rowLength * rows;
    auto* buffer = mask->GetBufferPointer();

    for (size_t z = 0; z < size[2]; ++z) {
        auto* slice = buffer + z * sliceLength;
        for (size_t y = 0; y < rows / 2; ++y) {
            std::swap_ranges(slice + y * rowLength,
                             slice + (y + 1) * rowLength,
                             slice + (rows - 1 - y) * rowLength);
        }
    }
}

std::expected<MaskVolumeType::Pointer, LoadError>
MaskLoader::loadMask(const std::filesystem::path& path, bool flip) {
    if (!fileExists(path)) {
        return std::unexpected(LoadError{LoadError::Code::FileNotFound, path.string()});
    }

    try {
        using ReaderType = itk::ImageFileReader<InputImageType>;
        auto reader = ReaderType::New();
        reader->SetFileName(path.string());

        // Explicitly set ImageIO to avoid IO factory registration issues
        auto ext = path.extension().string();
        auto stem = path.stem().extension().string();
        if (ext == ".nrrd" || ext == ".nhdr") {
            reader->SetImageIO(itk::NrrdImageIO::New());
        } else if (ext == ".nii" || (ext == ".gz" && stem == ".nii")) {
            reader->SetImageIO(itk::NiftiImageIO::New());
        } else {
            return std::unexpected(LoadError{
                LoadError::Code::UnsupportedImage,
                "Unknown mask extension: " + path.string()
            });
        }

        // Zero stays background, every other value becomes 1
        using ThresholdType = itk::BinaryThresholdImageFilter<InputImageType, MaskVolumeType>;
        auto binarize = ThresholdType::New();
        binarize->SetInput(reader->GetOutput());
        binarize->SetLowerThreshold(0.0f);
        binarize->SetUpperThreshold(0.0f);
        binarize->SetInsideValue(0);
        binarize->SetOutsideValue(1);
        binarize->Update();

        MaskVolumeType::Pointer mask = binarize->GetOutput();
        mask->DisconnectPipeline();

        if (flip) {
            flipYAxis(mask.GetPointer());
        }

        const auto size = mask->GetLargestPossibleRegion().GetSize();
        getLogger()->debug("Loaded {} ({}x{}x{}{})", path.string(),
                           size[0], size[1], size[2], flip ? ", flipped" : "");
        return mask;
    }
    catch (const itk::ExceptionObject& e) {
        return std::unexpected(LoadError{
            LoadError::Code::ReadFailed,
            path.string() + ": " + e.GetDescription()
        });
    }
}

std::expected<VertebraMaskLoad, LoadError> MaskLoader::loadVertebraMasks(
    const std::filesystem::path& directory,
    const std::vector<std::string>& identifiers,
    const std::string& prefix,
    bool flip)
{
    VertebraMaskLoad result;

    for (const auto& identifier : identifiers) {
        auto path = maskPath(directory, identifier, prefix);
        if (!fileExists(path)) {
            result.missing.push_back(identifier);
            continue;
        }

        getLogger()->debug("Reading {}", path.string());
        auto mask = loadMask(path, flip);
        if (!mask) {
            getLogger()->error("{}", mask.error().toString());
            return std::unexpected(mask.error());
        }
        result.masks.emplace(identifier, *mask);
    }

    getLogger()->info("Loaded {} vertebra masks from {} ({} missing)",
                      result.masks.size(), directory.string(), result.missing.size());
    return result;
}

std::vector<std::string> MaskLoader::missingSegmentations(
    const std::filesystem::path& directory,
    const std::vector<std::string>& identifiers,
    const std::string& prefix)
{
    std::vector<std::string> missing;
    for (const auto& identifier : identifiers) {
        if (!fileExists(maskPath(directory, identifier, prefix))) {
            missing.push_back(identifier);
        }
    }
    return missing;
}

} // namespace chord_cutter::core
