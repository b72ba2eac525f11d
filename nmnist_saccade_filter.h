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

#ifndef NMNIST_SACCADE_FILTER_H
#define NMNIST_SACCADE_FILTER_H

#include <vector>
#include "nmnist_codec.h"
#include "nmnist_codec_export.h"

namespace NMNIST {

/// Keeps the events with a timestamp strictly greater than the threshold (in us), in order.
class SaccadeFilter {
public:
    static constexpr long long kDefaultThreshold = 100000;

    NMNIST_CODEC_EXPORT explicit SaccadeFilter(long long threshold = kDefaultThreshold);

    NMNIST_CODEC_EXPORT void operator()(std::vector<EventTD> &events) const;
    NMNIST_CODEC_EXPORT std::vector<EventTD> apply(const std::vector<EventTD> &events) const;

    long long threshold() const {
        return threshold_;
    }

private:
    long long threshold_;
};

} // namespace NMNIST

#endif // NMNIST_SACCADE_FILTER_H
