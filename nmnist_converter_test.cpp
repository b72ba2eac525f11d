/**********************************************************************************************************************
 * Copyright (c) Prophesee S.A.                                                                                       *
 *                                                                                                                    *
 * Licensed under the Apache License, Version 2.0 (the "License");                                                    *
 * you may not use this file except in compliance with the License.                                                   *
 * You may obtain a copy of the License at http://www.apache.org/licenses/LICENSE-2.0                                 *
 * Unless required by applicable law or agreed to in writing, software distributed under the License is distributed   *
 * on an "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.                      *
 * See the License for the specific language governing permissions and limitations under the License.                 *
 **********************************************************************************************************************/

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>

#include "nmnist_converter.h"
#include "nmnist_h5store.h"
#include "nmnist_test_utils.h"

using namespace NMNIST;
namespace fs = std::filesystem;

class ConverterTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() / (std::string("nmnist_converter_test_") +
                                             ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(root_);
        fs::create_directories(root_);

        write("train/3/00001.bin", {RECORD(1, 1, 1, 10), OVERFLOW_MARKER(0), RECORD(2, 2, 0, 20)});
        write("train/5/00002.bin", {RECORD(3, 3, 1, 30)});
        write("train/seven/00003.bin", {RECORD(4, 4, 0, 40)});

        options_.root   = root_.generic_string();
        options_.output = (root_ / "out.h5").generic_string();
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    std::string write(const std::string &relative_path, const std::vector<std::uint8_t> &content) {
        const fs::path path = root_ / relative_path;
        fs::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::binary);
        file.write(reinterpret_cast<const char *>(content.data()), static_cast<std::streamsize>(content.size()));
        return path.generic_string();
    }

    fs::path root_;
    ConvertOptions options_;
};

TEST(Converter, sample_name) {
    EXPECT_EQ("7/00123", sampleName("/data/train/7/00123.bin"));
    EXPECT_EQ("7/00123", sampleName("7/00123.bin"));
}

TEST_F(ConverterTest, dataset_continues_after_failure) {
    const auto summary = convert(options_);
    EXPECT_EQ(2u, summary.converted);
    EXPECT_EQ(1u, summary.failed);
    EXPECT_EQ(3u, summary.events);
    EXPECT_EQ(1, summary.exitCode());

    const auto first = readH5Sample(options_.output, "3/00001");
    EXPECT_EQ(3, first.target);
    ASSERT_EQ(2u, first.events.size());
    EXPECT_EQ(10, first.events[0].t);
    EXPECT_EQ(20 + 8192, first.events[1].t);

    const auto second = readH5Sample(options_.output, "5/00002");
    EXPECT_EQ(5, second.target);
    ASSERT_EQ(1u, second.events.size());
    EXPECT_EQ(30, second.events[0].t);

    ASSERT_THROW(readH5Sample(options_.output, "seven/00003"), H5Error);
}

TEST_F(ConverterTest, dataset_limit) {
    options_.limit     = 2;
    const auto summary = convertDataset(options_);
    EXPECT_EQ(2u, summary.converted);
    EXPECT_EQ(0u, summary.failed);
    EXPECT_EQ(0, summary.exitCode());

    EXPECT_EQ(5, readH5Sample(options_.output, "5/00002").target);
    ASSERT_THROW(readH5Sample(options_.output, "seven/00003"), H5Error);
}

TEST_F(ConverterTest, dataset_test_split_missing) {
    options_.train = false;
    ASSERT_THROW(convert(options_), IOError);
}

TEST_F(ConverterTest, input_takes_precedence_over_root) {
    options_.input     = (root_ / "train/5/00002.bin").generic_string();
    options_.print     = 1;
    const auto summary = convert(options_);
    EXPECT_EQ(1u, summary.converted);
    EXPECT_EQ(1u, summary.events);
    EXPECT_EQ(0, summary.exitCode());

    EXPECT_EQ(5, readH5Sample(options_.output, "5/00002").target);
    ASSERT_THROW(readH5Sample(options_.output, "3/00001"), H5Error);
}

TEST_F(ConverterTest, input_first_saccade_only) {
    options_.input              = write("train/1/00004.bin", {RECORD(1, 1, 1, 50000), RECORD(2, 2, 0, 150000)});
    options_.first_saccade_only = true;
    const auto summary          = convertFile(options_);
    EXPECT_EQ(1u, summary.events);

    const auto sample = readH5Sample(options_.output, "1/00004");
    ASSERT_EQ(1u, sample.events.size());
    EXPECT_EQ(150000, sample.events[0].t);
}

TEST_F(ConverterTest, input_invalid_label) {
    options_.input = (root_ / "train/seven/00003.bin").generic_string();
    ASSERT_THROW(convert(options_), InvalidLabelFormat);
}

TEST_F(ConverterTest, input_strict_truncated_record) {
    options_.input  = write("train/2/00005.bin", {RECORD(1, 1, 1, 1), 42});
    options_.strict = true;
    ASSERT_THROW(convertFile(options_), TruncatedRecord);
}
