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

#include "services/chord/chord_segmentation_engine.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <deque>
#include <format>
#include <future>
#include <thread>
#include <unordered_set>
#include <utility>

#include <itkMacro.h>

namespace chord_cutter::services {

namespace {
auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("ChordSegmentationEngine");
    return logger;
}
}

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

std::string formatSize(const MaskVolumeType::SizeType& size) {
    return std::format("{}x{}x{}", size[0], size[1], size[2]);
}

size_t voxelsPerSlice(const MaskVolumeType::SizeType& size) {
    return static_cast<size_t>(size[0]) * static_cast<size_t>(size[1]);
}

// First occurrence of an identifier keeps its position
std::vector<std::string> withoutRepeats(const std::vector<std::string>& order) {
    std::vector<std::string> unique;
    unique.reserve(order.size());
    std::unordered_set<std::string> seen;
    for (const auto& vertebra : order) {
        if (seen.insert(vertebra).second) {
            unique.push_back(vertebra);
        } else {
            getLogger()->warn("Ignoring repeated vertebra {}", vertebra);
        }
    }
    return unique;
}

} // anonymous namespace

ChordSegmentationEngine::ChordSegmentationEngine(Options options)
    : options_(options) {}

void ChordSegmentationEngine::setOptions(const Options& options) {
    options_ = options;
}

void ChordSegmentationEngine::setProgressCallback(ProgressCallback callback) {
    progressCallback_ = std::move(callback);
}

void ChordSegmentationEngine::setCancelPredicate(CancelPredicate predicate) {
    cancelPredicate_ = std::move(predicate);
}

size_t ChordSegmentationEngine::countVoxels(const MaskVolumeType* mask) {
    if (!mask) {
        return 0;
    }

    const auto* buffer = mask->GetBufferPointer();
    const size_t total = mask->GetBufferedRegion().GetNumberOfPixels();
    return static_cast<size_t>(
        std::count_if(buffer, buffer + total, [](uint8_t v) { return v != 0; }));
}

std::vector<size_t> ChordSegmentationEngine::sliceCounts(const MaskVolumeType* mask) {
    if (!mask) {
        return {};
    }

    const auto size = mask->GetBufferedRegion().GetSize();
    const size_t sliceVoxels = voxelsPerSlice(size);
    const auto* buffer = mask->GetBufferPointer();

    std::vector<size_t> counts(size[2], 0);
    for (size_t z = 0; z < counts.size(); ++z) {
        const auto* slice = buffer + z * sliceVoxels;
        counts[z] = static_cast<size_t>(
            std::count_if(slice, slice + sliceVoxels, [](uint8_t v) { return v != 0; }));
    }
    return counts;
}

std::optional<SliceRange> ChordSegmentationEngine::qualifyingRange(
    const std::vector<size_t>& counts,
    size_t total,
    double threshold,
    int firstSlice
) {
    if (total == 0) {
        return std::nullopt;
    }

    std::optional<SliceRange> range;
    const auto denominator = static_cast<double>(total);
    for (size_t z = 0; z < counts.size(); ++z) {
        if (static_cast<double>(counts[z]) / denominator <= threshold) {
            continue;
        }
        const int index = firstSlice + static_cast<int>(z);
        if (!range) {
            range = SliceRange{index, index};
        } else {
            range->maxIndex = index;
        }
    }
    return range;
}

MaskVolumeType::Pointer ChordSegmentationEngine::confineToSlices(
    const MaskVolumeType* chordMask,
    const SliceRange& range
) {
    auto output = MaskVolumeType::New();
    output->SetRegions(chordMask->GetLargestPossibleRegion());
    output->SetSpacing(chordMask->GetSpacing());
    output->SetOrigin(chordMask->GetOrigin());
    output->SetDirection(chordMask->GetDirection());
    output->Allocate(true);

    const auto region = chordMask->GetBufferedRegion();
    const auto size = region.GetSize();
    const int firstSlice = static_cast<int>(region.GetIndex()[2]);
    const int lastSlice = firstSlice + static_cast<int>(size[2]) - 1;

    const int from = std::max(range.minIndex, firstSlice);
    const int to = std::min(range.maxIndex, lastSlice);
    if (from > to) {
        return output;
    }

    const size_t sliceVoxels = voxelsPerSlice(size);
    const size_t begin = static_cast<size_t>(from - firstSlice) * sliceVoxels;
    const size_t end = static_cast<size_t>(to - firstSlice + 1) * sliceVoxels;

    const auto* src = chordMask->GetBufferPointer();
    std::copy(src + begin, src + end, output->GetBufferPointer() + begin);
    return output;
}

VertebraOutcome ChordSegmentationEngine::processVertebra(
    const MaskVolumeType* mask,
    const MaskVolumeType* chordMask,
    double threshold,
    bool produceConfinedMask
) {
    if (!mask) {
        return outcome::Missing{};
    }

    const size_t total = countVoxels(mask);
    if (total == 0) {
        return outcome::Unsegmented{};
    }

    const int firstSlice = static_cast<int>(mask->GetBufferedRegion().GetIndex()[2]);
    auto range = qualifyingRange(sliceCounts(mask), total, threshold, firstSlice);
    if (!range) {
        return outcome::NoQualifyingSlice{};
    }

    if (!produceConfinedMask || !chordMask) {
        return outcome::Ranged{*range};
    }

    auto confined = confineToSlices(chordMask, *range);
    const size_t overlap = countVoxels(confined.GetPointer());
    if (overlap == 0) {
        return outcome::RangedNoOverlap{*range};
    }
    return outcome::RangedWithMask{*range, confined, overlap};
}

std::expected<void, ChordCutError> ChordSegmentationEngine::validateInputs(
    const MaskVolumeType::Pointer& chordMask,
    const VertebraMaskSet& vertebraMasks,
    const std::vector<std::string>& vertebraOrder,
    bool produceConfinedMasks
) const {
    if (produceConfinedMasks && !chordMask) {
        return std::unexpected(ChordCutError{
            ChordCutError::Code::InvalidInput,
            "Chord mask is required to produce confined masks"
        });
    }

    std::optional<MaskVolumeType::RegionType> reference;
    std::string referenceName;
    if (chordMask) {
        reference = chordMask->GetLargestPossibleRegion();
        referenceName = "chord";
    }

    for (const auto& vertebra : vertebraOrder) {
        auto it = vertebraMasks.find(vertebra);
        if (it == vertebraMasks.end()) {
            continue;
        }
        if (!it->second) {
            return std::unexpected(ChordCutError{
                ChordCutError::Code::InvalidInput,
                std::format("Mask of {} is null", vertebra)
            });
        }

        const auto region = it->second->GetLargestPossibleRegion();
        if (!reference) {
            reference = region;
            referenceName = vertebra;
            continue;
        }
        if (region != *reference) {
            return std::unexpected(ChordCutError{
                ChordCutError::Code::GridMismatch,
                std::format("{} is {} but {} is {}",
                            vertebra, formatSize(region.GetSize()),
                            referenceName, formatSize(reference->GetSize()))
            });
        }
    }
    return {};
}

unsigned int ChordSegmentationEngine::workerCount(size_t taskCount) const {
    unsigned int workers = options_.maxWorkers;
    if (workers == 0) {
        workers = std::max(1u, std::thread::hardware_concurrency());
    }
    return static_cast<unsigned int>(
        std::max<size_t>(1, std::min<size_t>(workers, taskCount)));
}

std::expected<ChordSegmentation, ChordCutError>
ChordSegmentationEngine::computeSegments(
    const MaskVolumeType::Pointer& chordMask,
    const VertebraMaskSet& vertebraMasks,
    const std::vector<std::string>& requestedOrder,
    double threshold,
    bool produceConfinedMasks
) const {
    if (!isValidThreshold(threshold)) {
        getLogger()->error("Invalid threshold {} (must satisfy 0 < T < 1)", threshold);
        return std::unexpected(ChordCutError{
            ChordCutError::Code::InvalidThreshold,
            std::format("{} is outside (0, 1)", threshold)
        });
    }

    const auto vertebraOrder = withoutRepeats(requestedOrder);

    auto validation = validateInputs(chordMask, vertebraMasks, vertebraOrder, produceConfinedMasks);
    if (!validation) {
        getLogger()->error("{}", validation.error().toString());
        return std::unexpected(validation.error());
    }

    getLogger()->info("Segmenting chord over {} vertebrae (T={}, confined masks: {})",
                      vertebraOrder.size(), threshold, produceConfinedMasks);

    const size_t total = vertebraOrder.size();
    const unsigned int workers = workerCount(total);
    const MaskVolumeType* chord = chordMask.GetPointer();

    std::vector<std::optional<VertebraOutcome>> slots(total);
    std::deque<std::pair<size_t, std::future<VertebraOutcome>>> inFlight;
    size_t completed = 0;
    bool cancelled = false;

    auto maskOf = [&vertebraMasks](const std::string& vertebra) -> const MaskVolumeType* {
        auto it = vertebraMasks.find(vertebra);
        return it == vertebraMasks.end() ? nullptr : it->second.GetPointer();
    };

    auto collect = [&]() {
        auto& [index, future] = inFlight.front();
        slots[index] = future.get();
        inFlight.pop_front();
        ++completed;
        if (progressCallback_) {
            progressCallback_(completed, total);
        }
    };

    try {
        for (size_t i = 0; i < total; ++i) {
            if (cancelPredicate_ && cancelPredicate_()) {
                cancelled = true;
                break;
            }

            const MaskVolumeType* mask = maskOf(vertebraOrder[i]);
            if (options_.verbosity > 1 && mask) {
                getLogger()->info("Processing {}", vertebraOrder[i]);
            }

            if (workers == 1) {
                slots[i] = processVertebra(mask, chord, threshold, produceConfinedMasks);
                ++completed;
                if (progressCallback_) {
                    progressCallback_(completed, total);
                }
                continue;
            }

            if (inFlight.size() >= workers) {
                collect();
            }
            inFlight.emplace_back(i, std::async(std::launch::async,
                [mask, chord, threshold, produceConfinedMasks]() {
                    return processVertebra(mask, chord, threshold, produceConfinedMasks);
                }));
        }

        while (!inFlight.empty()) {
            collect();
        }
    }
    catch (const itk::ExceptionObject& e) {
        return std::unexpected(ChordCutError{
            ChordCutError::Code::InternalError,
            std::string("ITK exception: ") + e.GetDescription()
        });
    }
    catch (const std::exception& e) {
        return std::unexpected(ChordCutError{
            ChordCutError::Code::InternalError,
            std::string("Standard exception: ") + e.what()
        });
    }

    if (cancelled) {
        getLogger()->warn("Segmentation cancelled after {} of {} vertebrae", completed, total);
        return std::unexpected(ChordCutError{
            ChordCutError::Code::Cancelled,
            std::format("stopped after {} of {} vertebrae", completed, total)
        });
    }

    const bool reportConditions = options_.verbosity > 0;
    const bool reportRanges = options_.verbosity > 1;

    ChordSegmentation result;
    result.outcomes.reserve(total);

    for (size_t i = 0; i < total; ++i) {
        const auto& vertebra = vertebraOrder[i];
        const auto& slot = *slots[i];

        auto note = [&](VertebraCondition condition) {
            result.diagnostics.push_back({vertebra, condition});
            if (reportConditions) {
                getLogger()->info("{}: {}", vertebra, toString(condition));
            } else {
                getLogger()->debug("{}: {}", vertebra, toString(condition));
            }
        };

        auto addRange = [&](const SliceRange& range) {
            result.ranges.emplace_back(vertebra, range);
            if (reportRanges) {
                getLogger()->info("{}, Min z: {}; Max z: {}", vertebra, range.minIndex, range.maxIndex);
            } else {
                getLogger()->debug("{}, Min z: {}; Max z: {}", vertebra, range.minIndex, range.maxIndex);
            }
        };

        std::visit(Overloaded{
            [&](const outcome::Missing&) { note(VertebraCondition::MissingMask); },
            [&](const outcome::Unsegmented&) { note(VertebraCondition::Unsegmented); },
            [&](const outcome::NoQualifyingSlice&) { note(VertebraCondition::NoQualifyingSlice); },
            [&](const outcome::Ranged& r) { addRange(r.range); },
            [&](const outcome::RangedNoOverlap& r) {
                addRange(r.range);
                note(VertebraCondition::NoChordOverlap);
            },
            [&](const outcome::RangedWithMask& r) {
                addRange(r.range);
                result.confinedMasks.push_back({vertebra, r.range, r.mask, r.voxelCount});
            },
        }, slot);

        result.outcomes.emplace_back(vertebra, slot);
    }

    getLogger()->info("Found {} slice ranges, {} confined chord masks, {} conditions",
                      result.ranges.size(), result.confinedMasks.size(),
                      result.diagnostics.size());
    return result;
}

} // namespace chord_cutter::services
