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
#include <cstdio>
#include <exception>
#include <filesystem>
#include <glog/logging.h>

#include "nmnist_converter.h"
#include "nmnist_dataset.h"
#include "nmnist_h5store.h"

namespace NMNIST {

DecoderConfig ConvertOptions::decoderConfig() const {
    DecoderConfig config;
    config.strict = strict;
    return config;
}

std::string sampleName(const std::string &path) {
    const std::filesystem::path p(path);
    return (p.parent_path().filename() / p.stem()).generic_string();
}

ConvertSummary convertFile(const ConvertOptions &options) {
    const Decoder decoder(options.decoderConfig());
    const auto buffer        = readFile(options.input);
    auto sample              = decodeSample(buffer, options.input, decoder);
    const size_t num_markers = decoder.countOverflowMarkers(buffer.data(), buffer.data() + buffer.size());
    LOG(INFO) << options.input << ": " << buffer.size() / Decoder::kRecordSize << " records, " << num_markers
              << " overflow markers, " << sample.events.size() << " events, label " << sample.target;

    if (options.first_saccade_only) {
        SaccadeFilter()(sample.events);
        LOG(INFO) << sample.events.size() << " events after the saccade filter";
    }

    std::printf("label: %d\n", sample.target);
    const size_t num_printed = std::min(sample.events.size(), options.print);
    for (size_t i = 0; i < num_printed; ++i) {
        const auto &ev = sample.events[i];
        std::printf("%hu,%hu,%lld,%hd\n", ev.x, ev.y, ev.t, ev.p);
    }

    H5SampleWriter writer(options.output);
    writer.write(sampleName(options.input), sample);
    writer.close();

    ConvertSummary summary;
    summary.converted = 1;
    summary.events    = sample.events.size();
    return summary;
}

ConvertSummary convertDataset(const ConvertOptions &options) {
    Dataset dataset(options.root, options.train, options.first_saccade_only, options.decoderConfig());
    size_t num_samples = dataset.size();
    if (options.limit > 0 && options.limit < num_samples) {
        num_samples = options.limit;
    }

    H5SampleWriter writer(options.output);
    ConvertSummary summary;
    for (size_t i = 0; i < num_samples; ++i) {
        const std::string &path = dataset.files()[i];
        try {
            const auto sample = dataset[i];
            writer.write(sampleName(path), sample);
            summary.events += sample.events.size();
            ++summary.converted;
        } catch (const std::exception &e) {
            LOG(ERROR) << "Failed to convert " << path << ": " << e.what();
            ++summary.failed;
        }
        LOG_EVERY_N(INFO, 1000) << "Converted " << i + 1 << "/" << num_samples << " samples";
    }
    writer.close();

    LOG(INFO) << "Converted " << summary.converted << " samples (" << summary.events << " events) from "
              << dataset.folder() << " to " << options.output;
    LOG_IF(ERROR, summary.failed > 0) << summary.failed << " samples failed";
    return summary;
}

ConvertSummary convert(const ConvertOptions &options) {
    if (!options.input.empty()) {
        return convertFile(options);
    }
    return convertDataset(options);
}

} // namespace NMNIST
