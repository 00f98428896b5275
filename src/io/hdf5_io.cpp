#include "beam_analysis/io/hdf5_io.hpp"
#include "beam_analysis/core/errors.hpp"
#include "beam_analysis/core/utils.hpp"

#include <cmath>
#include <cstdint>
#include <utility>

namespace beam_analysis::io {

namespace {

// Silences the HDF5 error stack printer; errors are reported as exceptions.
class ErrorPrintGuard {
public:
    ErrorPrintGuard() {
        H5Eget_auto2(H5E_DEFAULT, &func_, &data_);
        H5Eset_auto2(H5E_DEFAULT, nullptr, nullptr);
    }
    ~ErrorPrintGuard() { H5Eset_auto2(H5E_DEFAULT, func_, data_); }

    ErrorPrintGuard(const ErrorPrintGuard&) = delete;
    ErrorPrintGuard& operator=(const ErrorPrintGuard&) = delete;

private:
    H5E_auto2_t func_ = nullptr;
    void* data_ = nullptr;
};

Hdf5Handle open_file(const fs::path& path, unsigned flags) {
    hid_t f = H5Fopen(path.string().c_str(), flags, H5P_DEFAULT);
    if (f < 0) {
        throw Hdf5Error("Cannot open HDF5 file: " + path.string());
    }
    return Hdf5Handle(f, H5Fclose);
}

// H5Lexists needs every intermediate link to exist, so walk the path.
bool link_exists(hid_t loc, const std::string& object_path) {
    if (object_path.empty()) return false;
    if (object_path == "/") return true;

    std::string partial;
    for (const auto& part : core::split(object_path, '/')) {
        if (part.empty()) continue;
        partial += "/" + part;
        if (H5Lexists(loc, partial.c_str(), H5P_DEFAULT) <= 0) {
            return false;
        }
    }
    return !partial.empty();
}

Hdf5Handle open_dataset(hid_t file, const fs::path& path, const std::string& dataset) {
    if (!link_exists(file, dataset)) {
        throw Hdf5Error("Dataset not found: " + dataset + " in " + path.string());
    }
    hid_t ds = H5Dopen2(file, dataset.c_str(), H5P_DEFAULT);
    if (ds < 0) {
        throw Hdf5Error("Cannot open dataset " + dataset + " in " + path.string());
    }
    return Hdf5Handle(ds, H5Dclose);
}

std::vector<size_t> dataset_shape(hid_t ds, const std::string& dataset) {
    Hdf5Handle space(H5Dget_space(ds), H5Sclose);
    if (!space.valid()) {
        throw Hdf5Error("Cannot get dataspace of " + dataset);
    }
    const int ndims = H5Sget_simple_extent_ndims(space.get());
    if (ndims < 0) {
        throw Hdf5Error("Cannot get rank of " + dataset);
    }
    std::vector<hsize_t> dims(static_cast<size_t>(ndims));
    if (ndims > 0 && H5Sget_simple_extent_dims(space.get(), dims.data(), nullptr) < 0) {
        throw Hdf5Error("Cannot get dimensions of " + dataset);
    }
    return std::vector<size_t>(dims.begin(), dims.end());
}

std::vector<double> read_numeric(hid_t ds, const std::string& dataset, size_t count) {
    Hdf5Handle type(H5Dget_type(ds), H5Tclose);
    const H5T_class_t cls = H5Tget_class(type.get());
    if (cls != H5T_INTEGER && cls != H5T_FLOAT) {
        throw Hdf5Error("Dataset " + dataset + " is not numeric");
    }

    std::vector<double> values(count);
    if (count == 0) return values;
    if (H5Dread(ds, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, values.data()) < 0) {
        throw Hdf5Error("Cannot read dataset " + dataset +
                        " (missing compression filter plugin?)");
    }
    return values;
}

size_t element_count(const std::vector<size_t>& shape) {
    size_t n = 1;
    for (size_t d : shape) n *= d;
    return n;
}

void write_string_attribute(hid_t obj, const std::string& name, const std::string& value) {
    if (H5Aexists(obj, name.c_str()) > 0) {
        if (H5Adelete(obj, name.c_str()) < 0) {
            throw WriteError("Cannot replace attribute '" + name + "'");
        }
    }

    Hdf5Handle type(H5Tcopy(H5T_C_S1), H5Tclose);
    H5Tset_size(type.get(), H5T_VARIABLE);
    H5Tset_cset(type.get(), H5T_CSET_UTF8);
    Hdf5Handle space(H5Screate(H5S_SCALAR), H5Sclose);

    Hdf5Handle attr(H5Acreate2(obj, name.c_str(), type.get(), space.get(),
                               H5P_DEFAULT, H5P_DEFAULT), H5Aclose);
    if (!attr.valid()) {
        throw WriteError("Cannot create attribute '" + name + "'");
    }
    const char* cstr = value.c_str();
    if (H5Awrite(attr.get(), type.get(), &cstr) < 0) {
        throw WriteError("Cannot write attribute '" + name + "'");
    }
}

template <typename T>
std::vector<T> convert_integers(const std::vector<double>& values, const std::string& destination) {
    std::vector<T> out;
    out.reserve(values.size());
    for (double v : values) {
        if (!std::isfinite(v)) {
            throw WriteError("non-finite value for integer dataset " + destination);
        }
        out.push_back(static_cast<T>(std::llround(v)));
    }
    return out;
}

} // namespace

Hdf5Handle::Hdf5Handle(Hdf5Handle&& o) noexcept
    : id_(std::exchange(o.id_, H5I_INVALID_HID)), closer_(o.closer_) {}

Hdf5Handle& Hdf5Handle::operator=(Hdf5Handle&& o) noexcept {
    if (this != &o) {
        reset();
        id_ = std::exchange(o.id_, H5I_INVALID_HID);
        closer_ = o.closer_;
    }
    return *this;
}

void Hdf5Handle::reset() {
    if (id_ >= 0 && closer_) {
        closer_(id_);
    }
    id_ = H5I_INVALID_HID;
}

bool is_hdf5_path(const fs::path& path) {
    return core::has_extension(path, {".h5", ".hdf5", ".nxs"});
}

std::vector<size_t> read_hdf5_shape(const fs::path& path, const std::string& dataset) {
    ErrorPrintGuard guard;
    Hdf5Handle file = open_file(path, H5F_ACC_RDONLY);
    Hdf5Handle ds = open_dataset(file.get(), path, dataset);
    return dataset_shape(ds.get(), dataset);
}

DetectorStack read_hdf5_stack(const fs::path& path, const std::string& dataset) {
    ErrorPrintGuard guard;
    Hdf5Handle file = open_file(path, H5F_ACC_RDONLY);
    Hdf5Handle ds = open_dataset(file.get(), path, dataset);

    DetectorStack stack;
    stack.shape = dataset_shape(ds.get(), dataset);
    if (stack.rank() < 2) {
        throw ShapeError("dataset " + dataset + " has shape " + shape_to_string(stack.shape) +
                         ", need at least 2 dimensions");
    }
    stack.data = read_numeric(ds.get(), dataset, element_count(stack.shape));
    return stack;
}

std::vector<double> read_hdf5_values(const fs::path& path, const std::string& dataset) {
    ErrorPrintGuard guard;
    Hdf5Handle file = open_file(path, H5F_ACC_RDONLY);
    Hdf5Handle ds = open_dataset(file.get(), path, dataset);
    auto shape = dataset_shape(ds.get(), dataset);
    return read_numeric(ds.get(), dataset, element_count(shape));
}

bool hdf5_object_exists(const fs::path& path, const std::string& object_path) {
    ErrorPrintGuard guard;
    Hdf5Handle file = open_file(path, H5F_ACC_RDONLY);
    return link_exists(file.get(), object_path);
}

std::optional<std::string> read_hdf5_string_attribute(const fs::path& path,
                                                      const std::string& object_path,
                                                      const std::string& name) {
    ErrorPrintGuard guard;
    Hdf5Handle file = open_file(path, H5F_ACC_RDONLY);
    if (!link_exists(file.get(), object_path)) {
        return std::nullopt;
    }
    Hdf5Handle obj(H5Oopen(file.get(), object_path.c_str(), H5P_DEFAULT), H5Oclose);
    if (!obj.valid() || H5Aexists(obj.get(), name.c_str()) <= 0) {
        return std::nullopt;
    }

    Hdf5Handle attr(H5Aopen(obj.get(), name.c_str(), H5P_DEFAULT), H5Aclose);
    Hdf5Handle ftype(H5Aget_type(attr.get()), H5Tclose);
    if (H5Tget_class(ftype.get()) != H5T_STRING) {
        return std::nullopt;
    }

    if (H5Tis_variable_str(ftype.get()) > 0) {
        Hdf5Handle mtype(H5Tcopy(H5T_C_S1), H5Tclose);
        H5Tset_size(mtype.get(), H5T_VARIABLE);
        H5Tset_cset(mtype.get(), H5Tget_cset(ftype.get()));
        char* buf = nullptr;
        if (H5Aread(attr.get(), mtype.get(), &buf) < 0) {
            throw Hdf5Error("Cannot read attribute '" + name + "' of " + object_path);
        }
        std::string value = buf ? std::string(buf) : std::string();
        H5free_memory(buf);
        return value;
    }

    const size_t size = H5Tget_size(ftype.get());
    Hdf5Handle mtype(H5Tcopy(H5T_C_S1), H5Tclose);
    H5Tset_size(mtype.get(), size + 1);
    H5Tset_cset(mtype.get(), H5Tget_cset(ftype.get()));
    std::vector<char> buf(size + 1, '\0');
    if (H5Aread(attr.get(), mtype.get(), buf.data()) < 0) {
        throw Hdf5Error("Cannot read attribute '" + name + "' of " + object_path);
    }
    return std::string(buf.data());
}

Hdf5ResultWriter::Hdf5ResultWriter(const fs::path& path, OpenMode mode) : path_(path) {
    ErrorPrintGuard guard;
    if (mode == OpenMode::Truncate) {
        hid_t f = H5Fcreate(path.string().c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT);
        if (f < 0) {
            throw Hdf5Error("Cannot create HDF5 file: " + path.string());
        }
        file_ = Hdf5Handle(f, H5Fclose);
    } else {
        file_ = open_file(path, H5F_ACC_RDWR);
    }
}

void Hdf5ResultWriter::attach(const ResultDescriptor& descriptor) {
    descriptor.validate();
    ErrorPrintGuard guard;
    const hid_t file = file_.get();
    const std::string& dest = descriptor.destination;

    if (link_exists(file, dest)) {
        Hdf5Handle existing(H5Oopen(file, dest.c_str(), H5P_DEFAULT), H5Oclose);
        if (!existing.valid() || H5Iget_type(existing.get()) != H5I_DATASET) {
            throw WriteError(dest + " exists in " + path_.string() + " and is not a dataset");
        }
        existing.reset();
        if (H5Ldelete(file, dest.c_str(), H5P_DEFAULT) < 0) {
            throw WriteError("Cannot replace " + dest + " in " + path_.string());
        }
    }

    const std::vector<size_t> shape = descriptor.storage_shape();
    Hdf5Handle space;
    if (shape.empty()) {
        space = Hdf5Handle(H5Screate(H5S_SCALAR), H5Sclose);
    } else {
        std::vector<hsize_t> dims(shape.begin(), shape.end());
        space = Hdf5Handle(H5Screate_simple(static_cast<int>(dims.size()), dims.data(), nullptr),
                           H5Sclose);
    }
    if (!space.valid()) {
        throw WriteError("Cannot create dataspace for " + dest);
    }

    hid_t file_type = H5T_IEEE_F64LE;
    if (descriptor.data_type == "float32") file_type = H5T_IEEE_F32LE;
    else if (descriptor.data_type == "int32") file_type = H5T_STD_I32LE;
    else if (descriptor.data_type == "int64") file_type = H5T_STD_I64LE;

    Hdf5Handle lcpl(H5Pcreate(H5P_LINK_CREATE), H5Pclose);
    H5Pset_create_intermediate_group(lcpl.get(), 1);

    Hdf5Handle ds(H5Dcreate2(file, dest.c_str(), file_type, space.get(), lcpl.get(),
                             H5P_DEFAULT, H5P_DEFAULT), H5Dclose);
    if (!ds.valid()) {
        throw WriteError("Cannot create dataset " + dest + " in " + path_.string());
    }

    herr_t status = 0;
    if (descriptor.data_type == "int32") {
        auto v = convert_integers<int32_t>(descriptor.values, dest);
        status = H5Dwrite(ds.get(), H5T_NATIVE_INT32, H5S_ALL, H5S_ALL, H5P_DEFAULT, v.data());
    } else if (descriptor.data_type == "int64") {
        auto v = convert_integers<int64_t>(descriptor.values, dest);
        status = H5Dwrite(ds.get(), H5T_NATIVE_INT64, H5S_ALL, H5S_ALL, H5P_DEFAULT, v.data());
    } else {
        status = H5Dwrite(ds.get(), H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT,
                          descriptor.values.data());
    }
    if (status < 0) {
        throw WriteError("Cannot write dataset " + dest + " in " + path_.string());
    }

    if (!descriptor.units.empty()) {
        write_string_attribute(ds.get(), "units", descriptor.units);
    }
    for (const auto& [key, value] : descriptor.attributes) {
        write_string_attribute(ds.get(), key, value);
    }
}

void Hdf5ResultWriter::flush() {
    if (H5Fflush(file_.get(), H5F_SCOPE_GLOBAL) < 0) {
        throw WriteError("Cannot flush " + path_.string());
    }
}

} // namespace beam_analysis::io
