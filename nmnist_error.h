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

#ifndef NMNIST_ERROR_H
#define NMNIST_ERROR_H

#include <stdexcept>
#include <string>
#include "nmnist_codec_export.h"

namespace NMNIST {

enum class Error {
    Ok                 = 0,
    TruncatedRecord    = -1,
    UnexpectedEOF      = -2,
    InvalidLabelFormat = -3,
    IOError            = -4
};

inline const char *errorString(Error error) noexcept {
    switch (error) {
    case Error::Ok:
        return "Success";
    case Error::TruncatedRecord:
        return "Trailing bytes do not form a complete record";
    case Error::UnexpectedEOF:
        return "Unexpected end of input";
    case Error::InvalidLabelFormat:
        return "Invalid label format";
    case Error::IOError:
        return "I/O error";
    default:
        return "Unknown error";
    }
}

/// Base class of all errors raised by the codec and the dataset reader.
class NMNIST_CODEC_EXPORT Exception : public std::runtime_error {
public:
    explicit Exception(const std::string &message, Error code) : std::runtime_error(message), code_(code) {}

    Error code() const noexcept {
        return code_;
    }

private:
    Error code_;
};

/// Raised in strict mode when the buffer length is not a multiple of the record size.
class NMNIST_CODEC_EXPORT TruncatedRecord : public Exception {
public:
    explicit TruncatedRecord(const std::string &message) : Exception(message, Error::TruncatedRecord) {}
};

/// Raised when an empty buffer is decoded and events are required.
class NMNIST_CODEC_EXPORT UnexpectedEOF : public Exception {
public:
    explicit UnexpectedEOF(const std::string &message) : Exception(message, Error::UnexpectedEOF) {}
};

class NMNIST_CODEC_EXPORT InvalidLabelFormat : public Exception {
public:
    explicit InvalidLabelFormat(const std::string &message) : Exception(message, Error::InvalidLabelFormat) {}
};

class NMNIST_CODEC_EXPORT IOError : public Exception {
public:
    explicit IOError(const std::string &message) : Exception(message, Error::IOError) {}
};

} // namespace NMNIST

#endif // NMNIST_ERROR_H
