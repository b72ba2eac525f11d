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

#include "nmnist_saccade_filter.h"

namespace NMNIST {

SaccadeFilter::SaccadeFilter(long long threshold) : threshold_(threshold) {}

void SaccadeFilter::operator()(std::vector<EventTD> &events) const {
    if (events.empty()) {
        return;
    }
    std::vector<EventTD> filtered;
    filtered.reserve(events.size());
    for (const auto &ev : events) {
        if (ev.t > threshold_) {
            filtered.push_back(ev);
        }
    }
    events.swap(filtered);
}

std::vector<EventTD> SaccadeFilter::apply(const std::vector<EventTD> &events) const {
    std::vector<EventTD> filtered(events);
    (*this)(filtered);
    return filtered;
}

} // namespace NMNIST
