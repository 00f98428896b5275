#pragma once

#include "beam_analysis/core/types.hpp"
#include "beam_analysis/io/result_writer.hpp"

#include <hdf5.h>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace beam_analysis::io {

// Owns an HDF5 identifier and closes it with the matching H5*close call.
class Hdf5Handle {
public:
    using Closer = herr_t (*)(hid_t);

    Hdf5Handle() = default;
    Hdf5Handle(hid_t id, Closer closer) : id_(id), closer_(closer) {}
    ~Hdf5Handle() { reset(); }

    Hdf5Handle(const Hdf5Handle&) = delete;
    Hdf5Handle& operator=(const Hdf5Handle&) = delete;
    Hdf5Handle(Hdf5Handle&& o) noexcept;
    Hdf5Handle& operator=(Hdf5Handle&& o) noexcept;

    hid_t get() const { return id_; }
    bool valid() const { return id_ >= 0; }
    void reset();

private:
    hid_t id_ = H5I_INVALID_HID;
    Closer closer_ = nullptr;
};

bool is_hdf5_path(const fs::path& path);

// Reads a numeric dataset of rank >= 2 converted to double.
// Filtered (compressed) datasets need their filter plugin on HDF5_PLUGIN_PATH.
DetectorStack read_hdf5_stack(const fs::path& path, const std::string& dataset);

// Reads all values of a numeric dataset (scalar or array) as double.
std::vector<double> read_hdf5_values(const fs::path& path, const std::string& dataset);

std::vector<size_t> read_hdf5_shape(const fs::path& path, const std::string& dataset);

bool hdf5_object_exists(const fs::path& path, const std::string& object_path);

std::optional<std::string> read_hdf5_string_attribute(const fs::path& path,
                                                      const std::string& object_path,
                                                      const std::string& name);

// Writes result descriptors into an HDF5 file.
class Hdf5ResultWriter : public ResultWriter {
public:
    enum class OpenMode {
        ReadWrite,  // file must exist
        Truncate    // create or overwrite
    };

    explicit Hdf5ResultWriter(const fs::path& path, OpenMode mode = OpenMode::ReadWrite);

    void attach(const ResultDescriptor& descriptor) override;

    // Flushes buffered data to disk
    void flush();

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
    Hdf5Handle file_;
};

} // namespace beam_analysis::io
