#pragma once

#include "beam_analysis/core/types.hpp"
#include "beam_analysis/io/result_writer.hpp"

#include <nlohmann/json.hpp>

namespace beam_analysis::io {

// JSON sidecar keyed by destination path:
// {"/entry/.../flux": {"values": [...], "shape": [...], "units": ..., ...}}
class JsonResultWriter : public ResultWriter {
public:
    explicit JsonResultWriter(const fs::path& path) : path_(path) {}

    void attach(const ResultDescriptor& descriptor) override;

    const fs::path& path() const { return path_; }

private:
    nlohmann::json load_existing() const;

    fs::path path_;
};

nlohmann::json descriptor_to_json(const ResultDescriptor& descriptor);

} // namespace beam_analysis::io
