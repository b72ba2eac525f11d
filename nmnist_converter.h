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

#ifndef NMNIST_CONVERTER_H
#define NMNIST_CONVERTER_H

#include <cstddef>
#include <string>
#include "nmnist_codec.h"

namespace NMNIST {

struct ConvertOptions {
    // extracted dataset root, containing the train and test folders
    std::string root;
    // single .bin file, takes precedence over root
    std::string input;
    std::string output      = "nmnist.h5";
    bool train              = true;
    bool first_saccade_only = false;
    bool strict             = false;
    // maximum number of samples, 0 converts all
    size_t limit = 0;
    // number of events printed when converting a single file
    size_t print = 10;

    DecoderConfig decoderConfig() const;
};

struct ConvertSummary {
    size_t converted = 0;
    size_t failed    = 0;
    size_t events    = 0;

    int exitCode() const {
        return failed > 0 ? 1 : 0;
    }
};

/// "<...>/7/00123.bin" -> "7/00123", the HDF5 dataset name of a sample.
std::string sampleName(const std::string &path);

/// Converts options.input to options.output, printing the label and the first events to stdout.
ConvertSummary convertFile(const ConvertOptions &options);

/// Converts the split of options.root to options.output. A file that fails to convert is logged and counted, the
/// conversion goes on with the next one.
ConvertSummary convertDataset(const ConvertOptions &options);

/// convertFile when options.input is set, convertDataset otherwise.
ConvertSummary convert(const ConvertOptions &options);

} // namespace NMNIST

#endif // NMNIST_CONVERTER_H
