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
 * @file vertebrae_registry.hpp
 * @brief Ordered, deduplicated collection of vertebra identifiers
 * @details Holds the vertebrae to process and the order in which results
 *          are reported. Named anatomical groups expand to their canonical
 *          member identifiers (C1..C7, T1..T12, L1..L5).
 */
#pragma once

#include "services/chord/chord_error.hpp"

#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace chord_cutter::services {

/**
 * @brief Registry of vertebrae to segment, in first-insertion order
 *
 * @example
 * @code
 * VertebraeRegistry registry;
 * registry.addGroup("cervical");
 * registry.addGroup("thorax");
 * registry.add("L1");
 * for (const auto& id : registry.list()) { ... }   // C1..C7, T1..T12, L1
 * @endcode
 */
class VertebraeRegistry {
public:
    VertebraeRegistry() = default;

    /**
     * @brief Insert an identifier if not already present
     * @param identifier Canonical vertebra name (e.g. "T5")
     * @return true if inserted, false if already registered
     */
    bool add(const std::string& identifier);

    /**
     * @brief Add every member of a named anatomical group
     *
     * Recognized groups: "cervical", "thorax", "lumbar".
     *
     * @param groupName Group name
     * @return Success, or UnknownGroup for any other name
     */
    [[nodiscard]] std::expected<void, ChordCutError> addGroup(std::string_view groupName);

    void clear() noexcept;

    /// Identifiers in first-insertion order
    [[nodiscard]] const std::vector<std::string>& list() const noexcept;

    [[nodiscard]] bool contains(std::string_view identifier) const;
    [[nodiscard]] size_t size() const noexcept;
    [[nodiscard]] bool empty() const noexcept;

    /**
     * @brief Canonical members of a group, in anatomical order
     * @return Member identifiers, or UnknownGroup
     */
    [[nodiscard]] static std::expected<std::vector<std::string>, ChordCutError>
    groupMembers(std::string_view groupName);

    [[nodiscard]] static std::vector<std::string> knownGroups();

private:
    std::vector<std::string> vertebrae_;
};

} // namespace chord_cutter::services
