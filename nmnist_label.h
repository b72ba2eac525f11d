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

#ifndef NMNIST_LABEL_H
#define NMNIST_LABEL_H

#include <string>
#include "nmnist_codec_export.h"

namespace NMNIST {

/// Returns the class id stored as the parent directory of a sample, e.g. "train/7/00123.bin" -> 7.
///
/// The path is split on '/' and the second to last segment is parsed as a base 10 integer. Throws
/// InvalidLabelFormat if the path has fewer than two segments or the segment is not an integer.
NMNIST_CODEC_EXPORT int extractLabel(const std::string &path);

} // namespace NMNIST

#endif // NMNIST_LABEL_H
