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

#include <stdexcept>

#include "nmnist_error.h"
#include "nmnist_label.h"

namespace NMNIST {

namespace {
const char *const kWhitespace = " \t\n\v\f\r";
}

int extractLabel(const std::string &path) {
    const size_t last = path.rfind('/');
    if (last == std::string::npos) {
        throw InvalidLabelFormat("Cannot extract label from '" + path + "': expected at least 2 path segments");
    }
    const size_t prev  = (last == 0) ? std::string::npos : path.rfind('/', last - 1);
    const size_t begin = (prev == std::string::npos) ? 0 : prev + 1;

    std::string segment = path.substr(begin, last - begin);
    segment.erase(segment.find_last_not_of(kWhitespace) + 1);
    segment.erase(0, segment.find_first_not_of(kWhitespace));
    if (segment.empty()) {
        throw InvalidLabelFormat("Cannot extract label from '" + path + "': empty label segment");
    }

    try {
        size_t idx      = 0;
        const int label = std::stoi(segment, &idx, 10);
        if (idx != segment.size()) {
            throw InvalidLabelFormat("Cannot extract label from '" + path + "': '" + segment +
                                     "' is not an integer");
        }
        return label;
    } catch (const std::invalid_argument &) {
        throw InvalidLabelFormat("Cannot extract label from '" + path + "': '" + segment + "' is not an integer");
    } catch (const std::out_of_range &) {
        throw InvalidLabelFormat("Cannot extract label from '" + path + "': '" + segment + "' is out of range");
    }
}

} // namespace NMNIST
