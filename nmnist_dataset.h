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

#ifndef NMNIST_DATASET_H
#define NMNIST_DATASET_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>
#include "nmnist_codec.h"
#include "nmnist_codec_export.h"
#include "nmnist_saccade_filter.h"

namespace NMNIST {

struct SensorSize {
    int width, height, polarities;
};

constexpr SensorSize kSensorSize{34, 34, 2};

struct Sample {
    std::vector<EventTD> events;
    int target = 0;
};

/// Lists the regular files under dir (recursively) whose name ends with extension, sorted.
NMNIST_CODEC_EXPORT std::vector<std::string> listFiles(const std::string &dir, const std::string &extension);

NMNIST_CODEC_EXPORT std::vector<std::uint8_t> readFile(const std::string &path);

/// Decodes the content of the file at path, the label is taken from the path.
NMNIST_CODEC_EXPORT Sample decodeSample(const std::vector<std::uint8_t> &buffer, const std::string &path,
                                        const Decoder &decoder);

NMNIST_CODEC_EXPORT Sample readSample(const std::string &path, const Decoder &decoder);

/// Extracted N-MNIST split, laid out as <root>/<train|test>/<label>/<id>.bin
///
/// The capitalized split folders of the published archives (Train, Test) are accepted as well.
class Dataset {
public:
    using Transform       = std::function<void(std::vector<EventTD> &)>;
    using TargetTransform = std::function<int(int)>;
    using Transforms      = std::function<void(Sample &)>;

    static constexpr size_t kTrainSize = 60000;
    static constexpr size_t kTestSize  = 10000;

    NMNIST_CODEC_EXPORT Dataset(const std::string &root, bool train = true, bool first_saccade_only = false,
                                const DecoderConfig &config = DecoderConfig());

    NMNIST_CODEC_EXPORT Sample get(size_t index) const;
    Sample operator[](size_t index) const {
        return get(index);
    }

    size_t size() const {
        return files_.size();
    }
    const std::vector<std::string> &files() const {
        return files_;
    }
    const std::string &folder() const {
        return folder_;
    }
    bool train() const {
        return train_;
    }
    bool firstSaccadeOnly() const {
        return first_saccade_only_;
    }

    static size_t expectedSize(bool train) {
        return train ? kTrainSize : kTestSize;
    }

    /// When set, transforms is applied to the whole sample and transform / target_transform are ignored.
    void setTransform(Transform transform) {
        transform_ = std::move(transform);
    }
    void setTargetTransform(TargetTransform target_transform) {
        target_transform_ = std::move(target_transform);
    }
    void setTransforms(Transforms transforms) {
        transforms_ = std::move(transforms);
    }

private:
    bool train_;
    bool first_saccade_only_;
    std::string folder_;
    std::vector<std::string> files_;
    Decoder decoder_;
    SaccadeFilter saccade_filter_;
    Transform transform_;
    TargetTransform target_transform_;
    Transforms transforms_;
};

} // namespace NMNIST

#endif // NMNIST_DATASET_H
