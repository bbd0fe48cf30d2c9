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
#include "core/logging.hpp"
#include "core/mask_loader.hpp"
#include "services/chord/chord_segmentation_engine.hpp"
#include "services/chord/vertebrae_registry.hpp"
#include "services/export/nifti_structure_set_writer.hpp"
#include "services/export/output_assembler.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>

namespace {

volatile std::sig_atomic_t gInterrupted = 0;

void onInterrupt(int) {
    gInterrupted = 1;
}

enum ExitCode {
    kSuccess = 0,
    kUsage = 1,
    kConfiguration = 2,
    kInput = 3,
    kSegmentation = 4,
    kExport = 5
};

} // anonymous namespace

/**
 * @brief Command line entry point
 *
 * Usage: chord_cutter <config.json>
 */
int main(int argc, char* argv[])
{
    using namespace chord_cutter;

    if (argc != 2) {
        std::cerr << "Usage: " << argv[0] << " <config.json>\n";
        return kUsage;
    }

    const auto start = std::chrono::steady_clock::now();

    auto config = core::ChordCutterConfig::loadFromFile(argv[1]);
    if (!config) {
        std::cerr << config.error().toString() << "\n";
        return kConfiguration;
    }

    logging::LoggerFactory::configure(config->logConfig);
    auto logger = logging::LoggerFactory::create("ChordCutter");

    services::VertebraeRegistry registry;
    for (const auto& group : config->groups) {
        auto added = registry.addGroup(group);
        if (!added) {
            logger->error("{}", added.error().toString());
            return kConfiguration;
        }
    }
    for (const auto& vertebra : config->vertebrae) {
        registry.add(vertebra);
    }

    auto missing = core::MaskLoader::missingSegmentations(
        config->vertebraMaskDirectory, registry.list(), config->maskFilePrefix);
    if (missing.empty()) {
        logger->info("All segmentations found in {}", config->vertebraMaskDirectory.string());
    } else {
        for (const auto& vertebra : missing) {
            logger->warn("No segmentation for {} in {}", vertebra,
                         config->vertebraMaskDirectory.string());
        }
    }

    auto masks = core::MaskLoader::loadVertebraMasks(
        config->vertebraMaskDirectory, registry.list(),
        config->maskFilePrefix, config->flipVertebraMasks);
    if (!masks) {
        logger->error("{}", masks.error().toString());
        return kInput;
    }

    core::MaskVolumeType::Pointer chord;
    if (config->produceConfinedMasks) {
        auto loaded = core::MaskLoader::loadMask(config->chordMaskPath, config->flipChordMask);
        if (!loaded) {
            logger->error("{}", loaded.error().toString());
            return kInput;
        }
        chord = *loaded;
    }

    services::ChordSegmentationEngine engine({config->verbosity, config->maxWorkers});
    engine.setProgressCallback([&logger](size_t completed, size_t total) {
        logger->debug("Processed {}/{} vertebrae", completed, total);
    });
    std::signal(SIGINT, onInterrupt);
    engine.setCancelPredicate([] { return gInterrupted != 0; });

    auto segmentation = engine.computeSegments(
        chord, masks->masks, registry.list(), config->threshold, config->produceConfinedMasks);
    if (!segmentation) {
        logger->error("{}", segmentation.error().toString());
        return kSegmentation;
    }

    for (const auto& [vertebra, range] : segmentation->ranges) {
        logger->info("{}: slices {}-{}", vertebra, range.minIndex, range.maxIndex);
    }

    if (config->produceConfinedMasks) {
        services::OutputAssembler assembler(config->structureNamePrefix);
        services::NiftiStructureSetWriter writer;
        auto written = assembler.write(*segmentation, registry.list(), writer, config->outputDirectory);
        if (!written) {
            logger->error("{}", written.error().toString());
            return kExport;
        }
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    logger->info("Done in {} ms", elapsed.count());

    logging::LoggerFactory::shutdown();
    return kSuccess;
}
