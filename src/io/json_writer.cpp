#include "beam_analysis/io/json_writer.hpp"
#include "beam_analysis/core/errors.hpp"
#include "beam_analysis/core/utils.hpp"

namespace beam_analysis::io {

using json = nlohmann::json;

json descriptor_to_json(const ResultDescriptor& descriptor) {
    json j;
    j["values"] = descriptor.values;
    j["shape"] = descriptor.storage_shape();
    j["data_type"] = descriptor.data_type;
    j["minimum_dimensionality"] = descriptor.minimum_dimensionality;
    j["units"] = descriptor.units;
    j["attributes"] = descriptor.attributes;
    return j;
}

json JsonResultWriter::load_existing() const {
    if (!fs::exists(path_)) {
        return json::object();
    }
    json doc;
    try {
        doc = json::parse(core::read_text(path_));
    } catch (const json::parse_error& e) {
        throw WriteError("Cannot parse existing sidecar " + path_.string() + ": " + e.what());
    } catch (const IOError& e) {
        throw WriteError(e.what());
    }
    if (!doc.is_object()) {
        throw WriteError("Sidecar " + path_.string() + " is not a JSON object");
    }
    return doc;
}

void JsonResultWriter::attach(const ResultDescriptor& descriptor) {
    descriptor.validate();

    json doc = load_existing();
    doc[descriptor.destination] = descriptor_to_json(descriptor);

    try {
        core::write_text(path_, doc.dump(2) + "\n");
    } catch (const IOError& e) {
        throw WriteError(e.what());
    }
}

} // namespace beam_analysis::io
