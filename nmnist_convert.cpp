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

#include <algorithm>
#include <exception>
#include <gflags/gflags.h>
#include <glog/logging.h>

#include "nmnist_converter.h"

DEFINE_string(root, "", "the extracted dataset root, containing the train and test folders");
DEFINE_string(input, "", "a single .bin file to convert, takes precedence over --root");
DEFINE_string(output, "nmnist.h5", "the HDF5 file to write");
DEFINE_bool(train, true, "convert the train split, otherwise the test split");
DEFINE_bool(first_saccade_only, false, "only keep the events after the saccade threshold");
DEFINE_bool(strict, false, "fail on files whose size is not a multiple of the record size");
DEFINE_int32(limit, 0, "maximum number of samples to convert, 0 converts all");
DEFINE_int32(print, 10, "number of events printed when converting a single file");

int main(int argc, char **argv) {
    FLAGS_logtostderr = true;
    google::InitGoogleLogging(argv[0]);
    google::SetUsageMessage("Convert N-MNIST binary event files to HDF5\n"
                            "  nmnist_convert --root <dataset> [--train=false] [--output nmnist.h5]\n"
                            "  nmnist_convert --input <file.bin> [--output sample.h5]");
    google::ParseCommandLineFlags(&argc, &argv, true);

    if (FLAGS_input.empty() && FLAGS_root.empty()) {
        google::ShowUsageWithFlagsRestrict(argv[0], "nmnist_convert");
        return 1;
    }

    NMNIST::ConvertOptions options;
    options.root               = FLAGS_root;
    options.input              = FLAGS_input;
    options.output             = FLAGS_output;
    options.train              = FLAGS_train;
    options.first_saccade_only = FLAGS_first_saccade_only;
    options.strict             = FLAGS_strict;
    options.limit              = static_cast<size_t>(std::max(FLAGS_limit, 0));
    options.print              = static_cast<size_t>(std::max(FLAGS_print, 0));

    try {
        return NMNIST::convert(options).exitCode();
    } catch (const std::exception &e) {
        LOG(ERROR) << e.what();
        return 1;
    }
}
