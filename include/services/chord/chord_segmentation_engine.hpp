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
 * @file chord_segmentation_engine.hpp
 * @brief Per-vertebra axial range detection and chord confinement
 * @details For every vertebra the engine finds the inclusive range of axial
 *          slices whose share of the vertebra's voxels exceeds a relative
 *          density threshold, then optionally restricts the spinal chord
 *          mask to that range. Vertebrae are processed independently and
 *          concurrently; results are reported in the requested order.
 *
 * ## Thread Safety
 * - computeSegments() only reads its inputs and may run concurrently on
 *   different engines or on the same engine
 * - Callbacks are invoked from the calling thread
 */
#pragma once

#include "services/chord/chord_error.hpp"
#include "services/chord/chord_segmentation_types.hpp"

#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace chord_cutter::services {

/**
 * @brief Splits a spinal chord mask into per-vertebra segments
 *
 * @example
 * @code
 * ChordSegmentationEngine engine;
 * auto result = engine.computeSegments(chord, masks, registry.list(), 0.02, true);
 * if (result) {
 *     for (const auto& [vertebra, range] : result->ranges) {
 *         // range.minIndex .. range.maxIndex
 *     }
 * }
 * @endcode
 */
class ChordSegmentationEngine {
public:
    /// Progress callback (completed vertebrae, total vertebrae)
    using ProgressCallback = std::function<void(size_t completed, size_t total)>;

    /// Returns true when no further vertebra should be started
    using CancelPredicate = std::function<bool()>;

    struct Options {
        /// 0: silent, 1: report per-vertebra conditions, 2: also report ranges
        int verbosity = 0;

        /// Concurrent per-vertebra tasks (0 = hardware concurrency, 1 = sequential)
        unsigned int maxWorkers = 0;
    };

    ChordSegmentationEngine() = default;
    explicit ChordSegmentationEngine(Options options);

    /**
     * @brief Compute slice ranges and confined chord masks
     *
     * Identifiers without an entry in @p vertebraMasks are skipped. The chord
     * mask may be null when @p produceConfinedMasks is false.
     *
     * @param chordMask Spinal chord occupancy
     * @param vertebraMasks Vertebra identifier to occupancy mask
     * @param vertebraOrder Identifiers to process, in reporting order.
     *        A repeated identifier is processed once, at its first position
     * @param threshold Minimum slice share of a vertebra's voxels, 0 < T < 1
     * @param produceConfinedMasks Also build the chord mask confined to each range
     * @return Aggregate result, or InvalidThreshold / GridMismatch /
     *         InvalidInput / Cancelled
     */
    [[nodiscard]] std::expected<ChordSegmentation, ChordCutError>
    computeSegments(
        const MaskVolumeType::Pointer& chordMask,
        const VertebraMaskSet& vertebraMasks,
        const std::vector<std::string>& vertebraOrder,
        double threshold,
        bool produceConfinedMasks
    ) const;

    /**
     * @brief Process a single vertebra
     *
     * Pure function of its arguments; a null @p mask yields outcome::Missing.
     * @p chordMask is only read when @p produceConfinedMask is true.
     */
    [[nodiscard]] static VertebraOutcome processVertebra(
        const MaskVolumeType* mask,
        const MaskVolumeType* chordMask,
        double threshold,
        bool produceConfinedMask
    );

    /// Number of non-zero voxels
    [[nodiscard]] static size_t countVoxels(const MaskVolumeType* mask);

    /// Non-zero voxel count of every axial slice, indexed from the first slice
    [[nodiscard]] static std::vector<size_t> sliceCounts(const MaskVolumeType* mask);

    /**
     * @brief Smallest and largest slice with counts[z] / total > threshold
     * @param firstSlice Image index of counts[0]
     * @return Range in image indices, or nullopt when no slice qualifies
     */
    [[nodiscard]] static std::optional<SliceRange> qualifyingRange(
        const std::vector<size_t>& counts,
        size_t total,
        double threshold,
        int firstSlice = 0
    );

    /**
     * @brief Copy of @p chordMask with every slice outside @p range zeroed
     *
     * The output has the chord mask's geometry. Slices of @p range outside
     * the image extent are ignored.
     */
    [[nodiscard]] static MaskVolumeType::Pointer confineToSlices(
        const MaskVolumeType* chordMask,
        const SliceRange& range
    );

    [[nodiscard]] static bool isValidThreshold(double threshold) noexcept {
        return threshold > 0.0 && threshold < 1.0;
    }

    void setOptions(const Options& options);
    [[nodiscard]] const Options& options() const noexcept { return options_; }

    void setProgressCallback(ProgressCallback callback);
    void setCancelPredicate(CancelPredicate predicate);

private:
    [[nodiscard]] std::expected<void, ChordCutError> validateInputs(
        const MaskVolumeType::Pointer& chordMask,
        const VertebraMaskSet& vertebraMasks,
        const std::vector<std::string>& vertebraOrder,
        bool produceConfinedMasks
    ) const;

    [[nodiscard]] unsigned int workerCount(size_t taskCount) const;

    Options options_;
    ProgressCallback progressCallback_;
    CancelPredicate cancelPredicate_;
};

} // namespace chord_cutter::services
