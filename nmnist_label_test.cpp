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

#include <gtest/gtest.h>

#include "nmnist_error.h"
#include "nmnist_label.h"

using namespace NMNIST;

TEST(Label, extract_from_parent_folder) {
    EXPECT_EQ(7, extractLabel("train/7/00123.bin"));
    EXPECT_EQ(0, extractLabel("/data/N-MNIST/Test/0/00004.bin"));
    EXPECT_EQ(101, extractLabel("caltech/101/image_0001.bin"));
}

TEST(Label, extract_from_two_segments) {
    EXPECT_EQ(7, extractLabel("7/00123.bin"));
}

TEST(Label, extract_signed_and_padded) {
    EXPECT_EQ(3, extractLabel("train/03/1.bin"));
    EXPECT_EQ(4, extractLabel("train/ 4 /1.bin"));
    EXPECT_EQ(5, extractLabel("train/+5/1.bin"));
    EXPECT_EQ(-1, extractLabel("train/-1/1.bin"));
}

TEST(Label, extract_from_single_segment) {
    ASSERT_THROW(extractLabel("00123.bin"), InvalidLabelFormat);
    ASSERT_THROW(extractLabel(""), InvalidLabelFormat);
}

TEST(Label, extract_from_empty_segment) {
    ASSERT_THROW(extractLabel("/00123.bin"), InvalidLabelFormat);
    ASSERT_THROW(extractLabel("train//00123.bin"), InvalidLabelFormat);
    ASSERT_THROW(extractLabel("train/  /00123.bin"), InvalidLabelFormat);
}

TEST(Label, extract_from_non_integer_segment) {
    ASSERT_THROW(extractLabel("train/seven/00123.bin"), InvalidLabelFormat);
    ASSERT_THROW(extractLabel("train/7a/00123.bin"), InvalidLabelFormat);
    ASSERT_THROW(extractLabel("train/0x7/00123.bin"), InvalidLabelFormat);
    ASSERT_THROW(extractLabel("train/7.5/00123.bin"), InvalidLabelFormat);
    ASSERT_THROW(extractLabel("train/99999999999999999999/00123.bin"), InvalidLabelFormat);
}

TEST(Label, extract_error_code) {
    try {
        extractLabel("00123.bin");
        FAIL() << "expected InvalidLabelFormat";
    } catch (const Exception &e) {
        EXPECT_EQ(Error::InvalidLabelFormat, e.code());
        EXPECT_STREQ("Invalid label format", errorString(e.code()));
    }
}
