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

#include "services/chord/vertebrae_registry.hpp"

#include <algorithm>
#include <array>
#include <format>

namespace chord_cutter::services {

namespace {

struct VertebraGroup {
    std::string_view name;
    char prefix;
    int count;
};

constexpr std::array<VertebraGroup, 3> kGroups = {{
    {"cervical", 'C', 7},
    {"thorax", 'T', 12},
    {"lumbar", 'L', 5},
}};

} // anonymous namespace

bool VertebraeRegistry::add(const std::string& identifier) {
    if (contains(identifier)) {
        return false;
    }
    vertebrae_.push_back(identifier);
    return true;
}

std::expected<void, ChordCutError>
VertebraeRegistry::addGroup(std::string_view groupName) {
    auto members = groupMembers(groupName);
    if (!members) {
        return std::unexpected(members.error());
    }

    for (const auto& identifier : *members) {
        add(identifier);
    }
    return {};
}

void VertebraeRegistry::clear() noexcept {
    vertebrae_.clear();
}

const std::vector<std::string>& VertebraeRegistry::list() const noexcept {
    return vertebrae_;
}

bool VertebraeRegistry::contains(std::string_view identifier) const {
    return std::find(vertebrae_.begin(), vertebrae_.end(), identifier) != vertebrae_.end();
}

size_t VertebraeRegistry::size() const noexcept {
    return vertebrae_.size();
}

bool VertebraeRegistry::empty() const noexcept {
    return vertebrae_.empty();
}

std::expected<std::vector<std::string>, ChordCutError>
VertebraeRegistry::groupMembers(std::string_view groupName) {
    auto it = std::find_if(kGroups.begin(), kGroups.end(),
                           [groupName](const VertebraGroup& g) { return g.name == groupName; });
    if (it == kGroups.end()) {
        return std::unexpected(ChordCutError{
            ChordCutError::Code::UnknownGroup,
            std::format("'{}' (expected cervical, thorax or lumbar)", groupName)
        });
    }

    std::vector<std::string> members;
    members.reserve(static_cast<size_t>(it->count));
    for (int i = 1; i <= it->count; ++i) {
        members.push_back(std::format("{}{}", it->prefix, i));
    }
    return members;
}

std::vector<std::string> VertebraeRegistry::knownGroups() {
    std::vector<std::string> names;
    for (const auto& group : kGroups) {
        names.emplace_back(group.name);
    }
    return names;
}

} // namespace chord_cutter::services
