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
 * @file chord_segmentation_types.hpp
 * @brief Value types produced by ChordSegmentationEngine
 * @details Defines the per-vertebra slice range, the tagged per-vertebra
 *          outcome and the aggregate result returned by a single
 *          computeSegments() call.
 */
#pragma once

#include "core/mask_types.hpp"

#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace chord_cutter::services {

using core::MaskVolumeType;
using core::VertebraMaskSet;

/**
 * @brief Inclusive range of axial slice indices
 */
struct SliceRange {
    int minIndex = 0;
    int maxIndex = 0;

    [[nodiscard]] int sliceCount() const noexcept {
        return maxIndex - minIndex + 1;
    }

    [[nodiscard]] bool contains(int z) const noexcept {
        return z >= minIndex && z <= maxIndex;
    }

    bool operator==(const SliceRange&) const = default;
};

/**
 * @brief Non-fatal condition met while processing one vertebra
 */
enum class VertebraCondition {
    MissingMask,        ///< No mask was supplied for the identifier
    Unsegmented,        ///< Mask present but without any true voxel
    NoQualifyingSlice,  ///< No slice exceeds the density threshold
    NoChordOverlap      ///< Chord mask is empty inside the vertebra range
};

[[nodiscard]] inline const char* toString(VertebraCondition condition) {
    switch (condition) {
        case VertebraCondition::MissingMask: return "missing mask";
        case VertebraCondition::Unsegmented: return "not segmented";
        case VertebraCondition::NoQualifyingSlice: return "no slice above threshold";
        case VertebraCondition::NoChordOverlap: return "no overlap between chord and vertebra";
    }
    return "unknown";
}

struct ChordDiagnostic {
    std::string vertebra;
    VertebraCondition condition;
};

/// Per-vertebra outcome alternatives
namespace outcome {

struct Missing {};
struct Unsegmented {};
struct NoQualifyingSlice {};

struct Ranged {
    SliceRange range;
};

/// Range found but the confined chord mask is empty
struct RangedNoOverlap {
    SliceRange range;
};

struct RangedWithMask {
    SliceRange range;
    MaskVolumeType::Pointer mask;
    size_t voxelCount = 0;
};

}  // namespace outcome

using VertebraOutcome = std::variant<
    outcome::Missing,
    outcome::Unsegmented,
    outcome::NoQualifyingSlice,
    outcome::Ranged,
    outcome::RangedNoOverlap,
    outcome::RangedWithMask>;

/**
 * @brief Chord sub-mask confined to one vertebra's slice range
 */
struct ConfinedChordMask {
    std::string vertebra;
    SliceRange range;
    MaskVolumeType::Pointer mask;
    size_t voxelCount = 0;
};

/**
 * @brief Aggregate result of one computeSegments() call
 *
 * All sequences follow the order of the vertebra list given to the engine.
 */
struct ChordSegmentation {
    /// Vertebra to slice range, only for vertebrae with a qualifying range
    std::vector<std::pair<std::string, SliceRange>> ranges;

    /// Confined chord masks with a non-empty overlap (when requested)
    std::vector<ConfinedChordMask> confinedMasks;

    /// Per-vertebra conditions met during the run
    std::vector<ChordDiagnostic> diagnostics;

    /// One outcome per processed identifier
    std::vector<std::pair<std::string, VertebraOutcome>> outcomes;

    [[nodiscard]] const SliceRange* findRange(const std::string& vertebra) const {
        for (const auto& [name, range] : ranges) {
            if (name == vertebra) {
                return &range;
            }
        }
        return nullptr;
    }

    [[nodiscard]] const ConfinedChordMask* findConfinedMask(const std::string& vertebra) const {
        for (const auto& confined : confinedMasks) {
            if (confined.vertebra == vertebra) {
                return &confined;
            }
        }
        return nullptr;
    }
};

} // namespace chord_cutter::services
