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

#include <glog/logging.h>

#include "nmnist_h5store.h"

namespace NMNIST {

namespace {
constexpr const char *kLabelAttribute = "label";

template<typename T>
T check(T ret, const std::string &what) {
    if (ret < 0) {
        throw H5Error("HDF5 error: " + what);
    }
    return ret;
}

// Disables the automatic printing of the HDF5 error stack while in scope, failures are reported through H5Error
class SilenceErrorStack {
public:
    SilenceErrorStack() {
        H5Eget_auto2(H5E_DEFAULT, &func_, &client_data_);
        H5Eset_auto2(H5E_DEFAULT, NULL, NULL);
    }
    ~SilenceErrorStack() {
        H5Eset_auto2(H5E_DEFAULT, func_, client_data_);
    }
    SilenceErrorStack(const SilenceErrorStack &) = delete;
    SilenceErrorStack &operator=(const SilenceErrorStack &) = delete;

private:
    H5E_auto2_t func_ = NULL;
    void *client_data_ = NULL;
};

// Closes an HDF5 identifier when leaving scope
class H5Handle {
public:
    H5Handle(hid_t id, herr_t (*close)(hid_t)) : id_(id), close_(close) {}
    ~H5Handle() {
        if (id_ >= 0) {
            close_(id_);
        }
    }
    H5Handle(const H5Handle &) = delete;
    H5Handle &operator=(const H5Handle &) = delete;

    hid_t get() const {
        return id_;
    }

private:
    hid_t id_;
    herr_t (*close_)(hid_t);
};

hid_t create_event_type() {
    hid_t type = check(H5Tcreate(H5T_COMPOUND, sizeof(EventTD)), "create event type");
    H5Handle guard(type, H5Tclose);
    check(H5Tinsert(type, "x", HOFFSET(EventTD, x), H5T_NATIVE_USHORT), "insert x member");
    check(H5Tinsert(type, "y", HOFFSET(EventTD, y), H5T_NATIVE_USHORT), "insert y member");
    check(H5Tinsert(type, "t", HOFFSET(EventTD, t), H5T_NATIVE_LLONG), "insert t member");
    check(H5Tinsert(type, "p", HOFFSET(EventTD, p), H5T_NATIVE_SHORT), "insert p member");
    return check(H5Tcopy(type), "copy event type");
}
} // namespace

H5SampleWriter::H5SampleWriter(const std::string &path) :
    path_(path), file_(-1), event_type_(-1), lcpl_(-1), count_(0) {
    SilenceErrorStack silence;
    file_ = check(H5Fcreate(path.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT), "create file " + path);
    try {
        event_type_ = create_event_type();
        lcpl_       = check(H5Pcreate(H5P_LINK_CREATE), "create link property list");
        check(H5Pset_create_intermediate_group(lcpl_, 1), "set intermediate group creation");
    } catch (const H5Error &) {
        try {
            close();
        } catch (const H5Error &close_error) {
            LOG(ERROR) << close_error.what();
        }
        throw;
    }
}

H5SampleWriter::~H5SampleWriter() {
    try {
        close();
    } catch (const H5Error &e) {
        LOG(ERROR) << e.what();
    }
}

void H5SampleWriter::close() {
    SilenceErrorStack silence;
    const hid_t lcpl       = lcpl_;
    const hid_t event_type = event_type_;
    const hid_t file       = file_;
    lcpl_ = event_type_ = file_ = -1;

    std::string failed;
    if (lcpl >= 0 && H5Pclose(lcpl) < 0) {
        failed += " link property list";
    }
    if (event_type >= 0 && H5Tclose(event_type) < 0) {
        failed += " event type";
    }
    if (file >= 0) {
        // flushes the file
        if (H5Fclose(file) < 0) {
            failed += " file";
        } else {
            LOG(INFO) << "Wrote " << count_ << " samples to " << path_;
        }
    }
    if (!failed.empty()) {
        throw H5Error("HDF5 error: close" + failed + " of " + path_);
    }
}

void H5SampleWriter::write(const std::string &name, const Sample &sample) {
    if (file_ < 0) {
        throw H5Error("Cannot write sample '" + name + "', " + path_ + " is closed");
    }

    SilenceErrorStack silence;
    hsize_t dims[1] = {static_cast<hsize_t>(sample.events.size())};
    H5Handle space(check(H5Screate_simple(1, dims, NULL), "create dataspace for " + name), H5Sclose);
    // the dataset is only linked under its name once the events and the label are written
    H5Handle dset(check(H5Dcreate_anon(file_, event_type_, space.get(), H5P_DEFAULT, H5P_DEFAULT),
                        "create dataset " + name),
                  H5Dclose);
    if (!sample.events.empty()) {
        check(H5Dwrite(dset.get(), event_type_, H5S_ALL, H5S_ALL, H5P_DEFAULT, sample.events.data()),
              "write dataset " + name);
    }

    H5Handle attr_space(check(H5Screate(H5S_SCALAR), "create attribute dataspace"), H5Sclose);
    H5Handle attr(check(H5Acreate2(dset.get(), kLabelAttribute, H5T_NATIVE_INT, attr_space.get(), H5P_DEFAULT,
                                   H5P_DEFAULT),
                        "create label attribute of " + name),
                  H5Aclose);
    check(H5Awrite(attr.get(), H5T_NATIVE_INT, &sample.target), "write label attribute of " + name);
    check(H5Olink(dset.get(), file_, name.c_str(), lcpl_, H5P_DEFAULT), "link dataset " + name);

    ++count_;
    VLOG(1) << "Stored " << name << ": " << sample.events.size() << " events, label " << sample.target;
}

Sample readH5Sample(const std::string &path, const std::string &name) {
    SilenceErrorStack silence;
    H5Handle file(check(H5Fopen(path.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT), "open file " + path), H5Fclose);
    H5Handle dset(check(H5Dopen2(file.get(), name.c_str(), H5P_DEFAULT), "open dataset " + name), H5Dclose);
    H5Handle space(check(H5Dget_space(dset.get()), "get dataspace of " + name), H5Sclose);
    H5Handle type(create_event_type(), H5Tclose);

    const hssize_t num_events = check(H5Sget_simple_extent_npoints(space.get()), "get size of " + name);

    Sample sample;
    sample.events.resize(static_cast<size_t>(num_events));
    if (num_events > 0) {
        check(H5Dread(dset.get(), type.get(), H5S_ALL, H5S_ALL, H5P_DEFAULT, sample.events.data()),
              "read dataset " + name);
    }

    H5Handle attr(check(H5Aopen(dset.get(), kLabelAttribute, H5P_DEFAULT), "open label attribute of " + name),
                  H5Aclose);
    check(H5Aread(attr.get(), H5T_NATIVE_INT, &sample.target), "read label attribute of " + name);
    return sample;
}

} // namespace NMNIST
