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

#include <iterator>
#include <stdexcept>
#include <string>

#include "nmnist_codec.h"

namespace NMNIST {

Decoder::Decoder(const DecoderConfig &config) : config_(config) {}

size_t Decoder::num_records(const std::uint8_t *begin, const std::uint8_t *end) const {
    if (begin > end) {
        throw std::runtime_error(std::string("Invalid range to decode, check the buffer passed"));
    }
    const size_t num_bytes = static_cast<size_t>(std::distance(begin, end));
    if (num_bytes == 0 && config_.require_events) {
        throw UnexpectedEOF("Empty buffer, at least one record is required");
    }
    const size_t trailing = num_bytes % kRecordSize;
    if (trailing != 0 && config_.strict) {
        throw TruncatedRecord(std::string("Buffer of ") + std::to_string(num_bytes) + " bytes ends with " +
                              std::to_string(trailing) + " bytes of an incomplete record");
    }
    return num_bytes / kRecordSize;
}

std::vector<EventTD> Decoder::operator()(const std::uint8_t *begin, const std::uint8_t *end) const {
    std::vector<EventTD> events(num_records(begin, end));
    events.resize(decode(begin, end, events.data()));
    return events;
}

std::vector<EventTD> Decoder::operator()(const std::vector<std::uint8_t> &buffer) const {
    return (*this)(buffer.data(), buffer.data() + buffer.size());
}

size_t Decoder::decode(const std::uint8_t *begin, const std::uint8_t *end, EventTD *event_ptr) const {
    const size_t n = num_records(begin, end);

    // a marker counts towards its own offset, it is dropped so only the records after it observe the increment
    long long offset        = 0;
    EventTD *out            = event_ptr;
    const std::uint8_t *ptr = begin;
    for (size_t i = 0; i < n; ++i, ptr += kRecordSize) {
        if (ptr[1] == config_.overflow_marker_y) {
            offset += config_.overflow_increment;
            continue;
        }

        const std::uint32_t t_raw =
            (static_cast<std::uint32_t>(ptr[2] & 0x7F) << 16) | (static_cast<std::uint32_t>(ptr[3]) << 8) | ptr[4];
        out->x = ptr[0];
        out->y = ptr[1];
        out->p = static_cast<short>((ptr[2] & 0x80) >> 7);
        out->t = static_cast<long long>(t_raw) + offset;
        ++out;
    }

    return static_cast<size_t>(std::distance(event_ptr, out));
}

size_t Decoder::getMaxDecodedSize(size_t num_bytes) const {
    return (num_bytes / kRecordSize) * sizeof(EventTD);
}

size_t Decoder::countOverflowMarkers(const std::uint8_t *begin, const std::uint8_t *end) const {
    const size_t n = num_records(begin, end);
    size_t count   = 0;
    for (size_t i = 0; i < n; ++i) {
        if (begin[i * kRecordSize + 1] == config_.overflow_marker_y) {
            ++count;
        }
    }
    return count;
}

} // namespace NMNIST
