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

#include <chrono>
#include <cstddef>
#include <thread>
#include <vector>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"

// spdlog
#include "spdlog/spdlog.h"

// CLI11
#include "CLI/CLI.hpp"

// =====================================================================
// local libraries
// =====================================================================

#include "src/id/process_unique_id.h"

namespace play::id_stress {

using uid::id::ProcessUniqueId;

using Batch = std::vector<ProcessUniqueId>;

std::vector<Batch> run_threads(size_t threads, size_t per_thread) {
    std::vector<Batch> batches(threads);

    std::vector<std::thread> workers;
    workers.reserve(threads);
    for (size_t t = 0; t < threads; ++t) {
        workers.emplace_back([&batches, t, per_thread]() {
            batches[t].reserve(per_thread);
            for (size_t i = 0; i < per_thread; ++i) {
                batches[t].push_back(uid::id::generate());
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    return batches;
}

// Checks that every batch is increasing and that no id appears twice.
absl::StatusOr<size_t> verify(const std::vector<Batch>& batches,
                              bool verbose) {
    size_t total = 0;
    for (const auto& batch : batches) {
        total += batch.size();
    }

    absl::flat_hash_set<ProcessUniqueId> seen;
    seen.reserve(total);

    for (size_t t = 0; t < batches.size(); ++t) {
        const Batch& batch = batches[t];
        if (verbose && !batch.empty()) {
            SPDLOG_DEBUG("thread {}: first {}, last {}", t, batch.front(),
                         batch.back());
        }

        for (size_t i = 0; i < batch.size(); ++i) {
            if (i > 0 && !(batch[i - 1] < batch[i])) {
                return absl::InternalError(absl::StrFormat(
                    "thread %d: id %s at %d is not greater than %s", t,
                    batch[i].DebugString(), i, batch[i - 1].DebugString()));
            }
            if (!seen.insert(batch[i]).second) {
                return absl::InternalError(
                    absl::StrFormat("thread %d: duplicate id %s at %d", t,
                                    batch[i].DebugString(), i));
            }
        }
    }

    return seen.size();
}

absl::Status run(size_t threads, size_t per_thread, bool verbose) {
    auto start = std::chrono::steady_clock::now();
    std::vector<Batch> batches = run_threads(threads, per_thread);
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);

    auto unique = verify(batches, verbose);
    if (!unique.ok()) {
        return unique.status();
    }

    size_t expected = threads * per_thread;
    if (unique.value() != expected) {
        return absl::InternalError(absl::StrFormat(
            "expected %d unique ids, got %d", expected, unique.value()));
    }

    double seconds = static_cast<double>(elapsed.count()) / 1e6;
    SPDLOG_INFO("{} threads generated {} unique ids in {:.3f}s ({:.0f} ids/s)",
                threads, unique.value(), seconds,
                seconds > 0 ? static_cast<double>(expected) / seconds : 0.0);
    return absl::OkStatus();
}

}  // namespace play::id_stress

int main(int argc, char *argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%s:%#] %v");

    CLI::App app{"id-stress"};

    size_t threads = 8;
    app.add_option("--threads", threads, "Number of generating threads")
        ->check(CLI::Range(1, 1024));

    size_t per_thread = 100000;
    app.add_option("--per-thread", per_thread, "Ids generated per thread")
        ->check(CLI::PositiveNumber);

    bool verbose = false;
    app.add_flag("--verbose", verbose, "Log first and last id of each thread");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError &e) {
        return app.exit(e);
    }

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    }

    auto status = play::id_stress::run(threads, per_thread, verbose);
    if (!status.ok()) {
        SPDLOG_ERROR("id stress failed: {}", status.ToString());
        return 1;
    }
    return 0;
}
