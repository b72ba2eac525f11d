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

#ifndef NMNIST_TEST_UTILS_H
#define NMNIST_TEST_UTILS_H

#include <cstdint>

// 5 bytes record: x, y, polarity and 23 bits timestamp
#define RECORD(x, y, p, t)                                                                                 \
    std::uint8_t(x), std::uint8_t(y), std::uint8_t((((p) & 1) << 7) | (((t) >> 16) & 0x7f)),              \
        std::uint8_t(((t) >> 8) & 0xff), std::uint8_t((t) & 0xff)
#define OVERFLOW_MARKER(t) RECORD(0, 240, 0, t)

#endif // NMNIST_TEST_UTILS_H
