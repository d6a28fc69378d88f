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

// =====================================================================
// c++ std
// =====================================================================

#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <string>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/strings/str_cat.h"

// spdlog
#include "spdlog/spdlog.h"

// =====================================================================
// self header
// =====================================================================

#include "src/id/process_unique_id.h"

namespace uid::id {

namespace {

// Shared by every caller in the process. Constant-initialized, so it is
// usable from other translation units' static initializers.
std::atomic<uint64_t> id_counter{0};

// Never issued. The counter stops here instead of wrapping to 0.
constexpr uint64_t kExhausted = std::numeric_limits<uint64_t>::max();

}  // namespace

ProcessUniqueId::ProcessUniqueId(uint64_t value) : value(value) {}

ProcessUniqueId ProcessUniqueId::Generate() {
    // Relaxed is enough: all increments share one modification order.
    uint64_t value = id_counter.load(std::memory_order_relaxed);
    do {
        // The counter is left at kExhausted, so callers racing with the
        // abort below fail the same way instead of receiving 0 again.
        if (value == kExhausted) {
            SPDLOG_CRITICAL("process unique id counter exhausted after {} ids",
                            value);
            spdlog::default_logger_raw()->flush();
            std::abort();
        }
    } while (!id_counter.compare_exchange_weak(value, value + 1,
                                               std::memory_order_relaxed));
    return ProcessUniqueId(value);
}

std::string ProcessUniqueId::DebugString() const {
    return absl::StrCat("ProcessUniqueId(", value, ")");
}

ProcessUniqueId generate() { return ProcessUniqueId::Generate(); }

}  // namespace uid::id
