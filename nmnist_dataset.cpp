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
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <glog/logging.h>

#include "nmnist_dataset.h"
#include "nmnist_label.h"

namespace fs = std::filesystem;

namespace NMNIST {

namespace {
bool ends_with(const std::string &s, const std::string &suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string find_split_folder(const std::string &root, bool train) {
    const std::vector<std::string> candidates = train ? std::vector<std::string>{"train", "Train"} :
                                                        std::vector<std::string>{"test", "Test"};
    for (const auto &name : candidates) {
        const fs::path folder = fs::path(root) / name;
        if (fs::is_directory(folder)) {
            return folder.generic_string();
        }
    }
    throw IOError("No " + candidates.front() + " split folder under '" + root + "'");
}
} // namespace

std::vector<std::string> listFiles(const std::string &dir, const std::string &extension) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        throw IOError("Not a directory: '" + dir + "'");
    }

    std::vector<std::string> files;
    for (fs::recursive_directory_iterator it(dir, ec), end; it != end; it.increment(ec)) {
        if (ec) {
            throw IOError("Failed to list '" + dir + "': " + ec.message());
        }
        if (!it->is_regular_file(ec)) {
            continue;
        }
        std::string path = it->path().generic_string();
        if (ends_with(path, extension)) {
            files.push_back(std::move(path));
        }
    }
    if (ec) {
        throw IOError("Failed to list '" + dir + "': " + ec.message());
    }
    std::sort(files.begin(), files.end());
    return files;
}

std::vector<std::uint8_t> readFile(const std::string &path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        throw IOError("Cannot open file '" + path + "'");
    }

    const std::streamsize size = file.tellg();
    if (size < 0) {
        throw IOError("Cannot get size of file '" + path + "'");
    }
    file.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> buffer(static_cast<size_t>(size));
    if (size > 0 && !file.read(reinterpret_cast<char *>(buffer.data()), size)) {
        throw IOError("Cannot read file '" + path + "'");
    }
    return buffer;
}

Sample decodeSample(const std::vector<std::uint8_t> &buffer, const std::string &path, const Decoder &decoder) {
    Sample sample;
    sample.events = decoder(buffer);
    sample.target = extractLabel(path);
    return sample;
}

Sample readSample(const std::string &path, const Decoder &decoder) {
    return decodeSample(readFile(path), path, decoder);
}

Dataset::Dataset(const std::string &root, bool train, bool first_saccade_only, const DecoderConfig &config) :
    train_(train),
    first_saccade_only_(first_saccade_only),
    folder_(find_split_folder(root, train)),
    files_(listFiles(folder_, ".bin")),
    decoder_(config) {
    LOG(INFO) << "Found " << files_.size() << " samples in " << folder_;
    LOG_IF(WARNING, files_.size() != expectedSize(train_))
        << "Expected " << expectedSize(train_) << " samples in the " << (train_ ? "train" : "test")
        << " split, found " << files_.size();
}

Sample Dataset::get(size_t index) const {
    if (index >= files_.size()) {
        throw std::out_of_range("Sample index " + std::to_string(index) + " out of range, dataset has " +
                                std::to_string(files_.size()) + " samples");
    }

    Sample sample = readSample(files_[index], decoder_);
    VLOG(1) << files_[index] << ": " << sample.events.size() << " events, target " << sample.target;

    if (first_saccade_only_) {
        saccade_filter_(sample.events);
    }
    if (transforms_) {
        transforms_(sample);
    } else {
        if (transform_) {
            transform_(sample.events);
        }
        if (target_transform_) {
            sample.target = target_transform_(sample.target);
        }
    }
    return sample;
}

} // namespace NMNIST
