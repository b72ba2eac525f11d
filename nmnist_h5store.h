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

#ifndef NMNIST_H5STORE_H
#define NMNIST_H5STORE_H

#include <cstddef>
#include <stdexcept>
#include <string>
#include <hdf5.h>
#include "nmnist_dataset.h"

namespace NMNIST {

class H5Error : public std::runtime_error {
public:
    explicit H5Error(const std::string &message) : std::runtime_error(message) {}
};

/// Writes decoded samples to an HDF5 file.
///
/// Each sample is stored as a 1D dataset of EventTD compound values {x: u16, y: u16, t: i64, p: i16} named after the
/// sample, with its target in the integer attribute "label". Names may contain '/', missing groups are created.
class H5SampleWriter {
public:
    /// Creates the file, truncating any existing one.
    explicit H5SampleWriter(const std::string &path);
    ~H5SampleWriter();

    H5SampleWriter(const H5SampleWriter &) = delete;
    H5SampleWriter &operator=(const H5SampleWriter &) = delete;

    /// Stores sample under name. On failure nothing is linked under name.
    void write(const std::string &name, const Sample &sample);
    /// Closes the file, flushing it. Throws H5Error if HDF5 fails to release a handle, the writer is closed anyway.
    /// Does nothing when already closed.
    void close();
    bool isOpen() const {
        return file_ >= 0;
    }
    /// HDF5 file identifier, -1 once closed.
    hid_t fileId() const {
        return file_;
    }

    size_t count() const {
        return count_;
    }
    const std::string &path() const {
        return path_;
    }

private:
    std::string path_;
    hid_t file_;
    hid_t event_type_;
    hid_t lcpl_;
    size_t count_;
};

/// Reads back a sample written by H5SampleWriter.
Sample readH5Sample(const std::string &path, const std::string &name);

} // namespace NMNIST

#endif // NMNIST_H5STORE_H
