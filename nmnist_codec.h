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

#ifndef NMNIST_CODEC_H
#define NMNIST_CODEC_H

#include <cstddef>
#include <cstdint>
#include <vector>
#include "nmnist_codec_export.h"
#include "nmnist_error.h"

namespace NMNIST {
struct EventTD {
    unsigned short x, y;
    short p;
    long long t;
};

struct DecoderConfig {
    // throw TruncatedRecord instead of dropping a trailing partial record
    bool strict = false;
    // throw UnexpectedEOF on an empty buffer
    bool require_events = false;
    // compared against the y byte of each record
    std::uint8_t overflow_marker_y = 240;
    std::uint32_t overflow_increment = 1 << 13;
};

/// Decodes the 5-byte ATIS records of the N-MNIST and N-Caltech101 binary files.
///
/// Each record is laid out as
///   byte 0: x
///   byte 1: y
///   byte 2: bit 7 polarity, bits 6..0 timestamp bits 22..16
///   byte 3: timestamp bits 15..8
///   byte 4: timestamp bits 7..0
/// A record whose y equals the overflow marker does not carry an event: it adds the overflow increment to the
/// timestamp of every following record and is removed from the output.
class Decoder {
public:
    static constexpr size_t kRecordSize = 5;

    NMNIST_CODEC_EXPORT explicit Decoder(const DecoderConfig &config = DecoderConfig());

    NMNIST_CODEC_EXPORT std::vector<EventTD> operator()(const std::uint8_t *begin, const std::uint8_t *end) const;
    NMNIST_CODEC_EXPORT std::vector<EventTD> operator()(const std::vector<std::uint8_t> &buffer) const;

    /// Decodes [begin, end) into event_ptr, which must hold getMaxDecodedSize(end - begin) bytes.
    /// Returns the number of events written.
    NMNIST_CODEC_EXPORT size_t decode(const std::uint8_t *begin, const std::uint8_t *end, EventTD *event_ptr) const;
    NMNIST_CODEC_EXPORT size_t getMaxDecodedSize(size_t num_bytes) const;
    NMNIST_CODEC_EXPORT size_t countOverflowMarkers(const std::uint8_t *begin, const std::uint8_t *end) const;

    const DecoderConfig &config() const {
        return config_;
    }

private:
    size_t num_records(const std::uint8_t *begin, const std::uint8_t *end) const;

    DecoderConfig config_;
};
} // namespace NMNIST

#endif // NMNIST_CODEC_H
