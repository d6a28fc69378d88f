// Copyright 2025 Xiaochen Cui
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

// =====================================================================
// c++ std
// =====================================================================

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

// =====================================================================
// third-party libraries
// =====================================================================

// fmt
#include "fmt/format.h"

namespace uid::id {

// An identifier that is unique within the current process.
//
// Instances can only be obtained from Generate() (or generate()) and by
// copying. Identifiers compare in creation order. The underlying integer
// is not part of the interface; use DebugString() or fmt/spdlog
// formatting for diagnostics only.
//
// Uniqueness does not hold across processes: a restarted process starts
// again from the same first value, and a child created by fork() shares
// the parent's counter state at the time of the fork.
class ProcessUniqueId {
   public:
    // Issues an identifier that no other call in this process returns.
    //
    // Thread-safe and lock-free. Values run from 0 to UINT64_MAX - 1; once
    // they are used up every further call logs and aborts the process.
    static ProcessUniqueId Generate();

    friend bool operator==(const ProcessUniqueId&,
                           const ProcessUniqueId&) = default;
    friend std::strong_ordering operator<=>(const ProcessUniqueId&,
                                            const ProcessUniqueId&) = default;

    // Human readable form, e.g. "ProcessUniqueId(42)". Not a stable format.
    std::string DebugString() const;

    template <typename H>
    friend H AbslHashValue(H h, const ProcessUniqueId& id) {
        return H::combine(std::move(h), id.value);
    }

   private:
    explicit ProcessUniqueId(uint64_t value);

    uint64_t value;

    friend struct std::hash<ProcessUniqueId>;
};

ProcessUniqueId generate();

}  // namespace uid::id

template <>
struct std::hash<uid::id::ProcessUniqueId> {
    size_t operator()(const uid::id::ProcessUniqueId& id) const noexcept {
        return std::hash<uint64_t>{}(id.value);
    }
};

template <>
struct fmt::formatter<uid::id::ProcessUniqueId>
    : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const uid::id::ProcessUniqueId& id, FormatContext& ctx) const
        -> decltype(ctx.out()) {
        return fmt::formatter<std::string_view>::format(id.DebugString(),
                                                        ctx);
    }
};
