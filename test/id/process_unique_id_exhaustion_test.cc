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

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <memory>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/strings/str_cat.h"

// fmt
#include "fmt/format.h"

// gtest
#include "gtest/gtest.h"

// spdlog
#include "spdlog/details/null_mutex.h"
#include "spdlog/sinks/base_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

// =====================================================================
// library under test
// =====================================================================

// Compiled into this binary directly so the tests can move the counter
// close to its limit.
#include "src/id/process_unique_id.cc"

using uid::id::ProcessUniqueId;

class ExhaustionEnvironment : public ::testing::Environment {
   public:
    ~ExhaustionEnvironment() override {}

    void SetUp() override {
        // death tests match against stderr
        spdlog::set_default_logger(spdlog::stderr_color_mt("stderr"));
        spdlog::set_level(spdlog::level::debug);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%s:%#] %v");
    }
};

// Requests another id from inside the exhaustion log message. Exits with
// status 0 if that request is ever answered.
class GeneratingSink
    : public spdlog::sinks::base_sink<spdlog::details::null_mutex> {
   protected:
    void sink_it_(const spdlog::details::log_msg&) override {
        if (inside) {
            return;
        }
        inside = true;

        ProcessUniqueId id = uid::id::generate();
        fmt::print(stderr, "issued after exhaustion: {}\n", id);
        std::_Exit(0);
    }

    void flush_() override {}

   private:
    bool inside = false;
};

TEST(ProcessUniqueIdExhaustionTest, LastValueBelowLimitIsIssued) {
    uid::id::id_counter.store(uid::id::kExhausted - 1);

    ProcessUniqueId last = uid::id::generate();
    EXPECT_EQ(last.DebugString(),
              absl::StrCat("ProcessUniqueId(", uid::id::kExhausted - 1, ")"));
    EXPECT_EQ(uid::id::id_counter.load(), uid::id::kExhausted);

    EXPECT_DEATH(uid::id::generate(), "exhausted");
}

TEST(ProcessUniqueIdExhaustionTest, GenerateAtLimitAborts) {
    uid::id::id_counter.store(uid::id::kExhausted);

    EXPECT_DEATH(uid::id::generate(), "exhausted");
    EXPECT_DEATH(ProcessUniqueId::Generate(), "exhausted");

    // the counter is not moved past the limit
    EXPECT_EQ(uid::id::id_counter.load(), uid::id::kExhausted);
}

TEST(ProcessUniqueIdExhaustionTest, IdRequestedWhileLoggingIsNotIssued) {
    uid::id::id_counter.store(uid::id::kExhausted);

    EXPECT_DEATH(
        {
            auto logger = std::make_shared<spdlog::logger>(
                "generating",
                spdlog::sinks_init_list{
                    std::make_shared<spdlog::sinks::stderr_color_sink_st>(),
                    std::make_shared<GeneratingSink>()});
            spdlog::set_default_logger(logger);

            uid::id::generate();
        },
        "exhausted");
}

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);

    testing::AddGlobalTestEnvironment(new ExhaustionEnvironment);

    return RUN_ALL_TESTS();
}
