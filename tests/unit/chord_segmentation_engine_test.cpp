#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "core/logging.hpp"
#include "services/chord/chord_segmentation_engine.hpp"

#include <spdlog/sinks/ringbuffer_sink.h>

#include "../test_utils/mask_generator.hpp"

using namespace chord_cutter::services;
using chord_cutter::test_utils::countSliceVoxels;
using chord_cutter::test_utils::createMask;
using chord_cutter::test_utils::createRandomSlabMask;
using chord_cutter::test_utils::createSlabMask;
using chord_cutter::test_utils::fillSlices;
using chord_cutter::test_utils::fillVoxelsInSlice;

namespace {

bool hasDiagnostic(const ChordSegmentation& result,
                   const std::string& vertebra,
                   VertebraCondition condition) {
    for (const auto& d : result.diagnostics) {
        if (d.vertebra == vertebra && d.condition == condition) return true;
    }
    return false;
}

ChordSegmentationEngine sequentialEngine() {
    return ChordSegmentationEngine({0, 1});
}

}  // namespace

// =============================================================================
// Precondition tests
// =============================================================================

TEST(ChordSegmentationEngine, ThresholdAboveOneIsRejected) {
    auto chord = createSlabMask(10, 10, 50, 10, 40);
    // Null mask would be InvalidInput if inspected; threshold must fail first
    VertebraMaskSet masks{{"T5", nullptr}};

    ChordSegmentationEngine engine;
    auto result = engine.computeSegments(chord, masks, {"T5"}, 1.2, true);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ChordCutError::Code::InvalidThreshold);
}

TEST(ChordSegmentationEngine, ThresholdBoundsAreExclusive) {
    auto chord = createSlabMask(10, 10, 20, 0, 19);
    VertebraMaskSet masks{{"T5", createSlabMask(10, 10, 20, 5, 6)}};

    ChordSegmentationEngine engine;
    for (double t : {0.0, 1.0, -0.1, std::numeric_limits<double>::quiet_NaN()}) {
        auto result = engine.computeSegments(chord, masks, {"T5"}, t, false);
        ASSERT_FALSE(result.has_value()) << "threshold " << t;
        EXPECT_EQ(result.error().code, ChordCutError::Code::InvalidThreshold);
    }
}

TEST(ChordSegmentationEngine, GridMismatchWithChordIsRejected) {
    auto chord = createSlabMask(10, 10, 50, 10, 40);
    VertebraMaskSet masks{
        {"T4", createSlabMask(10, 10, 50, 5, 9)},
        {"T5", createSlabMask(12, 10, 50, 15, 25)}
    };

    ChordSegmentationEngine engine;
    auto result = engine.computeSegments(chord, masks, {"T4", "T5"}, 0.05, true);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ChordCutError::Code::GridMismatch);
    EXPECT_NE(result.error().message.find("T5"), std::string::npos);
}

TEST(ChordSegmentationEngine, GridMismatchBetweenVertebraeWithoutChord) {
    VertebraMaskSet masks{
        {"C1", createSlabMask(10, 10, 30, 1, 2)},
        {"C2", createSlabMask(10, 10, 31, 3, 4)}
    };

    ChordSegmentationEngine engine;
    auto result = engine.computeSegments(nullptr, masks, {"C1", "C2"}, 0.05, false);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ChordCutError::Code::GridMismatch);
}

TEST(ChordSegmentationEngine, MasksOutsideOrderAreNotValidated) {
    VertebraMaskSet masks{
        {"C1", createSlabMask(10, 10, 30, 1, 2)},
        {"L5", createSlabMask(4, 4, 4, 0, 0)}
    };

    ChordSegmentationEngine engine;
    auto result = engine.computeSegments(nullptr, masks, {"C1"}, 0.05, false);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->ranges.size(), 1u);
}

TEST(ChordSegmentationEngine, ConfinedMasksRequireChord) {
    VertebraMaskSet masks{{"T5", createSlabMask(10, 10, 50, 15, 25)}};

    ChordSegmentationEngine engine;
    auto result = engine.computeSegments(nullptr, masks, {"T5"}, 0.05, true);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ChordCutError::Code::InvalidInput);
}

TEST(ChordSegmentationEngine, RangesWithoutChordMask) {
    VertebraMaskSet masks{{"T5", createSlabMask(10, 10, 50, 15, 25)}};

    ChordSegmentationEngine engine;
    auto result = engine.computeSegments(nullptr, masks, {"T5"}, 0.05, false);
    ASSERT_TRUE(result.has_value());
    ASSERT_NE(result->findRange("T5"), nullptr);
    EXPECT_EQ(*result->findRange("T5"), (SliceRange{15, 25}));
    EXPECT_TRUE(result->confinedMasks.empty());
}

// =============================================================================
// Range detection
// =============================================================================

TEST(ChordSegmentationEngine, UniformVertebraInsideChord) {
    // 11 full slices of 100 voxels: each slice holds ~9.1% of the vertebra
    auto chord = createSlabMask(10, 10, 50, 10, 40);
    VertebraMaskSet masks{{"T5", createSlabMask(10, 10, 50, 15, 25)}};

    auto engine = sequentialEngine();
    auto result = engine.computeSegments(chord, masks, {"T5"}, 0.05, true);
    ASSERT_TRUE(result.has_value());

    ASSERT_EQ(result->ranges.size(), 1u);
    EXPECT_EQ(result->ranges[0].first, "T5");
    EXPECT_EQ(result->ranges[0].second, (SliceRange{15, 25}));

    const auto* confined = result->findConfinedMask("T5");
    ASSERT_NE(confined, nullptr);
    EXPECT_EQ(confined->voxelCount, 1100u);
    for (int z = 0; z < 50; ++z) {
        int expected = (z >= 15 && z <= 25) ? 100 : 0;
        EXPECT_EQ(countSliceVoxels(confined->mask.GetPointer(), z), expected) << "slice " << z;
    }
    EXPECT_TRUE(result->diagnostics.empty());
}

TEST(ChordSegmentationEngine, SingleSliceVertebraBelowChord) {
    // 500 voxels, all in slice 60; chord only covers slices 0-40
    auto chord = createSlabMask(25, 20, 80, 0, 40);
    VertebraMaskSet masks{{"L5", createSlabMask(25, 20, 80, 60, 60)}};

    ChordSegmentationEngine engine;
    auto result = engine.computeSegments(chord, masks, {"L5"}, 0.02, true);
    ASSERT_TRUE(result.has_value());

    ASSERT_NE(result->findRange("L5"), nullptr);
    EXPECT_EQ(*result->findRange("L5"), (SliceRange{60, 60}));
    EXPECT_EQ(result->findConfinedMask("L5"), nullptr);
    EXPECT_TRUE(result->confinedMasks.empty());
    EXPECT_TRUE(hasDiagnostic(*result, "L5", VertebraCondition::NoChordOverlap));
}

TEST(ChordSegmentationEngine, RangeEndpointsAlwaysQualify) {
    // Slices 10 and 14 dense, 12 sparse; stray voxels at 8 and 16
    auto mask = createMask(10, 10, 30);
    fillVoxelsInSlice(mask.GetPointer(), 8, 1);
    fillVoxelsInSlice(mask.GetPointer(), 10, 100);
    fillVoxelsInSlice(mask.GetPointer(), 12, 2);
    fillVoxelsInSlice(mask.GetPointer(), 14, 100);
    fillVoxelsInSlice(mask.GetPointer(), 16, 1);

    const double threshold = 0.05;
    VertebraMaskSet masks{{"C3", mask}};

    ChordSegmentationEngine engine;
    auto result = engine.computeSegments(nullptr, masks, {"C3"}, threshold, false);
    ASSERT_TRUE(result.has_value());
    const auto* range = result->findRange("C3");
    ASSERT_NE(range, nullptr);
    EXPECT_EQ(*range, (SliceRange{10, 14}));

    const double total = 204.0;
    EXPECT_GT(countSliceVoxels(mask.GetPointer(), range->minIndex) / total, threshold);
    EXPECT_GT(countSliceVoxels(mask.GetPointer(), range->maxIndex) / total, threshold);
    // Interior slice 12 does not qualify on its own
    EXPECT_LE(countSliceVoxels(mask.GetPointer(), 12) / total, threshold);
}

TEST(ChordSegmentationEngine, SliceShareEqualToThresholdDoesNotQualify) {
    std::vector<size_t> counts = {0, 5, 5, 0};
    EXPECT_FALSE(ChordSegmentationEngine::qualifyingRange(counts, 10, 0.5).has_value());

    auto range = ChordSegmentationEngine::qualifyingRange(counts, 10, 0.49);
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(*range, (SliceRange{1, 2}));
}

TEST(ChordSegmentationEngine, QualifyingRangeHonorsFirstSliceOffset) {
    std::vector<size_t> counts = {0, 10, 0};
    auto range = ChordSegmentationEngine::qualifyingRange(counts, 10, 0.5, 7);
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(*range, (SliceRange{8, 8}));
}

TEST(ChordSegmentationEngine, SliceCountsSumOverAxialPlane) {
    auto mask = createMask(4, 3, 5);
    fillVoxelsInSlice(mask.GetPointer(), 1, 7);
    fillSlices(mask.GetPointer(), 3, 3);

    auto counts = ChordSegmentationEngine::sliceCounts(mask.GetPointer());
    ASSERT_EQ(counts.size(), 5u);
    EXPECT_EQ(counts[0], 0u);
    EXPECT_EQ(counts[1], 7u);
    EXPECT_EQ(counts[2], 0u);
    EXPECT_EQ(counts[3], 12u);
    EXPECT_EQ(counts[4], 0u);
    EXPECT_EQ(ChordSegmentationEngine::countVoxels(mask.GetPointer()), 19u);
}

// =============================================================================
// Per-vertebra conditions
// =============================================================================

TEST(ChordSegmentationEngine, EmptyMaskNeverProducesRange) {
    auto chord = createSlabMask(10, 10, 30, 0, 29);
    VertebraMaskSet masks{{"T1", createMask(10, 10, 30)}};

    ChordSegmentationEngine engine;
    for (double t : {0.001, 0.05, 0.5, 0.999}) {
        auto result = engine.computeSegments(chord, masks, {"T1"}, t, true);
        ASSERT_TRUE(result.has_value());
        EXPECT_EQ(result->findRange("T1"), nullptr);
        EXPECT_EQ(result->findConfinedMask("T1"), nullptr);
        EXPECT_TRUE(hasDiagnostic(*result, "T1", VertebraCondition::Unsegmented));
    }
}

TEST(ChordSegmentationEngine, MissingMaskIsSkipped) {
    auto chord = createSlabMask(10, 10, 50, 0, 49);
    VertebraMaskSet masks{{"T5", createSlabMask(10, 10, 50, 15, 25)}};

    ChordSegmentationEngine engine;
    auto result = engine.computeSegments(chord, masks, {"T4", "T5", "T6"}, 0.05, true);
    ASSERT_TRUE(result.has_value());

    ASSERT_EQ(result->ranges.size(), 1u);
    EXPECT_EQ(result->ranges[0].first, "T5");
    EXPECT_TRUE(hasDiagnostic(*result, "T4", VertebraCondition::MissingMask));
    EXPECT_TRUE(hasDiagnostic(*result, "T6", VertebraCondition::MissingMask));
    EXPECT_EQ(result->outcomes.size(), 3u);
}

TEST(ChordSegmentationEngine, SmearedMaskDoesNotAbortBatch) {
    // 50 slices of 2 voxels each: every slice holds 2% of the mask
    auto smeared = createMask(10, 10, 60);
    for (int z = 5; z < 55; ++z) {
        fillVoxelsInSlice(smeared.GetPointer(), z, 2);
    }
    VertebraMaskSet masks{
        {"T7", smeared},
        {"T8", createSlabMask(10, 10, 60, 40, 45)}
    };

    ChordSegmentationEngine engine;
    auto result = engine.computeSegments(nullptr, masks, {"T7", "T8"}, 0.05, false);
    ASSERT_TRUE(result.has_value());

    EXPECT_EQ(result->findRange("T7"), nullptr);
    EXPECT_TRUE(hasDiagnostic(*result, "T7", VertebraCondition::NoQualifyingSlice));
    ASSERT_NE(result->findRange("T8"), nullptr);
    EXPECT_EQ(*result->findRange("T8"), (SliceRange{40, 45}));
}

TEST(ChordSegmentationEngine, ProcessVertebraOutcomes) {
    auto chord = createSlabMask(10, 10, 40, 0, 20);
    auto inside = createSlabMask(10, 10, 40, 5, 10);
    auto outside = createSlabMask(10, 10, 40, 30, 35);
    auto empty = createMask(10, 10, 40);

    using E = ChordSegmentationEngine;
    EXPECT_TRUE(std::holds_alternative<outcome::Missing>(
        E::processVertebra(nullptr, chord.GetPointer(), 0.05, true)));
    EXPECT_TRUE(std::holds_alternative<outcome::Unsegmented>(
        E::processVertebra(empty.GetPointer(), chord.GetPointer(), 0.05, true)));
    EXPECT_TRUE(std::holds_alternative<outcome::NoQualifyingSlice>(
        E::processVertebra(inside.GetPointer(), chord.GetPointer(), 0.5, true)));
    EXPECT_TRUE(std::holds_alternative<outcome::Ranged>(
        E::processVertebra(inside.GetPointer(), chord.GetPointer(), 0.05, false)));
    EXPECT_TRUE(std::holds_alternative<outcome::RangedNoOverlap>(
        E::processVertebra(outside.GetPointer(), chord.GetPointer(), 0.05, true)));

    auto withMask = E::processVertebra(inside.GetPointer(), chord.GetPointer(), 0.05, true);
    ASSERT_TRUE(std::holds_alternative<outcome::RangedWithMask>(withMask));
    const auto& ranged = std::get<outcome::RangedWithMask>(withMask);
    EXPECT_EQ(ranged.range, (SliceRange{5, 10}));
    EXPECT_EQ(ranged.voxelCount, 600u);
}

// =============================================================================
// Confinement
// =============================================================================

TEST(ChordSegmentationEngine, ConfinementIsInclusiveAndPreservesChordValues) {
    auto chord = createMask(6, 6, 30);
    fillSlices(chord.GetPointer(), 0, 29, 255);
    chord->GetBufferPointer()[0] = 0;

    auto confined = ChordSegmentationEngine::confineToSlices(chord.GetPointer(), SliceRange{12, 18});
    ASSERT_TRUE(confined);
    EXPECT_NE(confined.GetPointer(), chord.GetPointer());

    const auto* src = chord->GetBufferPointer();
    const auto* out = confined->GetBufferPointer();
    const size_t sliceVoxels = 36;
    for (size_t i = 0; i < 36u * 30u; ++i) {
        const int z = static_cast<int>(i / sliceVoxels);
        if (z >= 12 && z <= 18) {
            EXPECT_EQ(out[i], src[i]) << "voxel " << i;
        } else {
            EXPECT_EQ(out[i], 0) << "voxel " << i;
        }
    }
    // Source unmodified
    EXPECT_EQ(countSliceVoxels(chord.GetPointer(), 5), 36);
}

TEST(ChordSegmentationEngine, ConfinementKeepsChordGeometry) {
    auto chord = createSlabMask(8, 8, 10, 0, 9);
    MaskVolumeType::SpacingType spacing;
    spacing[0] = 0.8; spacing[1] = 0.8; spacing[2] = 2.5;
    chord->SetSpacing(spacing);
    MaskVolumeType::PointType origin;
    origin[0] = -100.0; origin[1] = 50.0; origin[2] = 300.0;
    chord->SetOrigin(origin);

    auto confined = ChordSegmentationEngine::confineToSlices(chord.GetPointer(), SliceRange{2, 3});
    EXPECT_EQ(confined->GetSpacing(), chord->GetSpacing());
    EXPECT_EQ(confined->GetOrigin(), chord->GetOrigin());
    EXPECT_EQ(confined->GetLargestPossibleRegion(), chord->GetLargestPossibleRegion());
}

TEST(ChordSegmentationEngine, ConfinedMaskLiesWithinRangeAndMatchesChord) {
    auto chord = createRandomSlabMask(12, 12, 60, 0, 59, 0.3, 7);
    VertebraMaskSet masks{{"T9", createSlabMask(12, 12, 60, 20, 30)}};

    ChordSegmentationEngine engine;
    auto result = engine.computeSegments(chord, masks, {"T9"}, 0.01, true);
    ASSERT_TRUE(result.has_value());
    const auto* confined = result->findConfinedMask("T9");
    ASSERT_NE(confined, nullptr);

    const auto* src = chord->GetBufferPointer();
    const auto* out = confined->mask->GetBufferPointer();
    for (size_t i = 0; i < 12u * 12u * 60u; ++i) {
        const int z = static_cast<int>(i / 144u);
        if (confined->range.contains(z)) {
            EXPECT_EQ(out[i], src[i]);
        } else {
            EXPECT_EQ(out[i], 0);
        }
    }
}

// =============================================================================
// Laws
// =============================================================================

TEST(ChordSegmentationEngine, RepeatedRunsAreIdentical) {
    auto chord = createSlabMask(10, 10, 60, 5, 50);
    VertebraMaskSet masks{
        {"T1", createRandomSlabMask(10, 10, 60, 10, 20, 0.5, 1)},
        {"T2", createRandomSlabMask(10, 10, 60, 18, 30, 0.4, 2)},
        {"T3", createMask(10, 10, 60)}
    };
    std::vector<std::string> order = {"T1", "T2", "T3"};

    ChordSegmentationEngine engine;
    auto first = engine.computeSegments(chord, masks, order, 0.03, true);
    auto second = engine.computeSegments(chord, masks, order, 0.03, true);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());

    EXPECT_EQ(first->ranges, second->ranges);
    ASSERT_EQ(first->confinedMasks.size(), second->confinedMasks.size());
    for (size_t i = 0; i < first->confinedMasks.size(); ++i) {
        const auto& a = first->confinedMasks[i];
        const auto& b = second->confinedMasks[i];
        EXPECT_EQ(a.vertebra, b.vertebra);
        EXPECT_EQ(a.voxelCount, b.voxelCount);
        EXPECT_TRUE(std::equal(a.mask->GetBufferPointer(),
                               a.mask->GetBufferPointer() + 6000,
                               b.mask->GetBufferPointer()));
    }
}

TEST(ChordSegmentationEngine, RaisingThresholdNeverWidensRange) {
    // Density tapers towards both ends of the vertebra
    auto mask = createMask(20, 20, 50);
    for (int z = 10; z <= 30; ++z) {
        const int count = 400 - 35 * std::abs(z - 20);
        fillVoxelsInSlice(mask.GetPointer(), z, count);
    }
    VertebraMaskSet masks{{"L2", mask}};

    ChordSegmentationEngine engine;
    std::optional<SliceRange> previous;
    bool eliminated = false;
    for (double t : {0.001, 0.01, 0.03, 0.05, 0.07, 0.09, 0.2}) {
        auto result = engine.computeSegments(nullptr, masks, {"L2"}, t, false);
        ASSERT_TRUE(result.has_value());
        const auto* range = result->findRange("L2");
        if (!range) {
            eliminated = true;
            continue;
        }
        EXPECT_FALSE(eliminated) << "range reappeared at threshold " << t;
        if (previous) {
            EXPECT_GE(range->minIndex, previous->minIndex) << "threshold " << t;
            EXPECT_LE(range->maxIndex, previous->maxIndex) << "threshold " << t;
        }
        previous = *range;
    }
    EXPECT_TRUE(eliminated);
}

// =============================================================================
// Ordering, concurrency and callbacks
// =============================================================================

TEST(ChordSegmentationEngine, ParallelRunMatchesSequentialOrder) {
    auto chord = createSlabMask(8, 8, 120, 0, 119);
    VertebraMaskSet masks;
    std::vector<std::string> order;
    for (int i = 0; i < 12; ++i) {
        const std::string id = "T" + std::to_string(i + 1);
        order.push_back(id);
        if (i % 5 != 4) {
            masks.emplace(id, createSlabMask(8, 8, 120, i * 10, i * 10 + 8));
        }
    }
    // Reverse order to make sure reporting follows the request, not the map
    std::vector<std::string> reversed(order.rbegin(), order.rend());

    ChordSegmentationEngine parallel({0, 4});
    auto sequential = sequentialEngine();
    auto a = parallel.computeSegments(chord, masks, reversed, 0.05, true);
    auto b = sequential.computeSegments(chord, masks, reversed, 0.05, true);
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());

    EXPECT_EQ(a->ranges, b->ranges);
    ASSERT_EQ(a->ranges.size(), 10u);
    EXPECT_EQ(a->ranges.front().first, "T12");
    EXPECT_EQ(a->ranges.back().first, "T1");

    ASSERT_EQ(a->outcomes.size(), reversed.size());
    for (size_t i = 0; i < reversed.size(); ++i) {
        EXPECT_EQ(a->outcomes[i].first, reversed[i]);
    }
}

TEST(ChordSegmentationEngine, ProgressReportsEveryVertebra) {
    VertebraMaskSet masks{
        {"C1", createSlabMask(6, 6, 20, 1, 3)},
        {"C2", createSlabMask(6, 6, 20, 4, 6)}
    };

    ChordSegmentationEngine engine({0, 2});
    std::vector<std::pair<size_t, size_t>> calls;
    engine.setProgressCallback([&calls](size_t done, size_t total) {
        calls.emplace_back(done, total);
    });

    auto result = engine.computeSegments(nullptr, masks, {"C1", "C2", "C3"}, 0.05, false);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(calls.size(), 3u);
    EXPECT_EQ(calls.back(), (std::pair<size_t, size_t>{3, 3}));
}

TEST(ChordSegmentationEngine, CancelStopsLaunchingVertebrae) {
    VertebraMaskSet masks{
        {"C1", createSlabMask(6, 6, 20, 1, 3)},
        {"C2", createSlabMask(6, 6, 20, 4, 6)},
        {"C3", createSlabMask(6, 6, 20, 7, 9)}
    };

    auto engine = sequentialEngine();
    std::atomic<int> checks{0};
    engine.setCancelPredicate([&checks] { return ++checks > 1; });

    auto result = engine.computeSegments(nullptr, masks, {"C1", "C2", "C3"}, 0.05, false);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ChordCutError::Code::Cancelled);
    EXPECT_EQ(checks.load(), 2);
}

TEST(ChordSegmentationEngine, EmptyOrderYieldsEmptyResult) {
    ChordSegmentationEngine engine;
    auto result = engine.computeSegments(nullptr, {}, {}, 0.05, false);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->ranges.empty());
    EXPECT_TRUE(result->outcomes.empty());
}

TEST(ChordSegmentationEngine, RepeatedVertebraIsReportedOnce) {
    auto chord = createSlabMask(10, 10, 50, 10, 40);
    VertebraMaskSet masks{
        {"T5", createSlabMask(10, 10, 50, 15, 25)},
        {"T6", createSlabMask(10, 10, 50, 26, 30)}
    };

    ChordSegmentationEngine engine({0, 2});
    auto result = engine.computeSegments(chord, masks, {"T5", "T6", "T5"}, 0.05, true);
    ASSERT_TRUE(result.has_value());

    ASSERT_EQ(result->ranges.size(), 2u);
    EXPECT_EQ(result->ranges[0].first, "T5");
    EXPECT_EQ(result->ranges[1].first, "T6");
    EXPECT_EQ(result->confinedMasks.size(), 2u);
    ASSERT_EQ(result->outcomes.size(), 2u);
    EXPECT_EQ(result->outcomes[0].first, "T5");
}

TEST(ChordSegmentationEngine, RepeatedMissingVertebraIsDiagnosedOnce) {
    auto engine = sequentialEngine();
    auto result = engine.computeSegments(nullptr, {}, {"L1", "L1"}, 0.05, false);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->diagnostics.size(), 1u);
    EXPECT_EQ(result->diagnostics.front().condition, VertebraCondition::MissingMask);
}

// =============================================================================
// Verbosity
// =============================================================================

class ChordSegmentationVerbosityTest : public ::testing::Test {
protected:
    void SetUp() override {
        logger_ = chord_cutter::logging::LoggerFactory::create("ChordSegmentationEngine");
        previousLevel_ = logger_->level();
        logger_->set_level(spdlog::level::trace);
        sink_ = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(256);
        sink_->set_level(spdlog::level::trace);
        logger_->sinks().push_back(sink_);

        // 2% of the smeared mask per slice never clears T = 0.05
        auto smeared = createMask(10, 10, 60);
        for (int z = 5; z < 55; ++z) {
            fillVoxelsInSlice(smeared.GetPointer(), z, 2);
        }
        masks_ = {
            {"T7", smeared},
            {"T8", createSlabMask(10, 10, 60, 40, 45)}
        };
    }

    void TearDown() override {
        auto& sinks = logger_->sinks();
        sinks.erase(std::remove(sinks.begin(), sinks.end(), sink_), sinks.end());
        logger_->set_level(previousLevel_);
    }

    void run(int verbosity) {
        ChordSegmentationEngine engine({verbosity, 1});
        auto result = engine.computeSegments(nullptr, masks_, {"T7", "T8"}, 0.05, false);
        ASSERT_TRUE(result.has_value());
    }

    size_t countMessages(spdlog::level::level_enum level, const std::string& prefix) const {
        size_t count = 0;
        for (const auto& msg : sink_->last_raw()) {
            std::string text(msg.payload.data(), msg.payload.size());
            if (msg.level == level && text.starts_with(prefix)) {
                ++count;
            }
        }
        return count;
    }

    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink_;
    spdlog::level::level_enum previousLevel_ = spdlog::level::info;
    VertebraMaskSet masks_;
};

TEST_F(ChordSegmentationVerbosityTest, QuietRunKeepsConditionsAtDebug) {
    run(0);
    EXPECT_EQ(countMessages(spdlog::level::info, "T7: "), 0u);
    EXPECT_EQ(countMessages(spdlog::level::debug, "T7: "), 1u);
    EXPECT_EQ(countMessages(spdlog::level::info, "T8, Min z"), 0u);
}

TEST_F(ChordSegmentationVerbosityTest, DefaultVerbosityReportsConditions) {
    run(1);
    EXPECT_EQ(countMessages(spdlog::level::info, "T7: "), 1u);
    EXPECT_EQ(countMessages(spdlog::level::debug, "T7: "), 0u);
    EXPECT_EQ(countMessages(spdlog::level::info, "T8, Min z"), 0u);
    EXPECT_EQ(countMessages(spdlog::level::debug, "T8, Min z: 40; Max z: 45"), 1u);
}

TEST_F(ChordSegmentationVerbosityTest, HighVerbosityReportsRanges) {
    run(2);
    EXPECT_EQ(countMessages(spdlog::level::info, "T7: "), 1u);
    EXPECT_EQ(countMessages(spdlog::level::info, "T8, Min z: 40; Max z: 45"), 1u);
}
