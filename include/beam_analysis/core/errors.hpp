#pragma once

#include <stdexcept>
#include <string>

namespace beam_analysis {

class BeamAnalysisError : public std::runtime_error {
public:
    explicit BeamAnalysisError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public BeamAnalysisError {
public:
    explicit ConfigError(const std::string& message)
        : BeamAnalysisError("Config error: " + message) {}
};

class ValidationError : public BeamAnalysisError {
public:
    explicit ValidationError(const std::string& message)
        : BeamAnalysisError("Validation error: " + message) {}
};

class IOError : public BeamAnalysisError {
public:
    explicit IOError(const std::string& message)
        : BeamAnalysisError("I/O error: " + message) {}
};

class Hdf5Error : public IOError {
public:
    explicit Hdf5Error(const std::string& message)
        : IOError("HDF5 error: " + message) {}
};

class FitsError : public IOError {
public:
    explicit FitsError(const std::string& message)
        : IOError("FITS error: " + message) {}
};

// Input cannot be reduced to a 2-D frame
class ShapeError : public BeamAnalysisError {
public:
    explicit ShapeError(const std::string& message)
        : BeamAnalysisError("Shape error: " + message) {}
};

// Thresholding left no usable foreground region
class NoRegionFound : public BeamAnalysisError {
public:
    explicit NoRegionFound(const std::string& message)
        : BeamAnalysisError("No region found: " + message) {}
};

class InvalidExposureTime : public BeamAnalysisError {
public:
    explicit InvalidExposureTime(const std::string& message)
        : BeamAnalysisError("Invalid exposure time: " + message) {}
};

class WriteError : public BeamAnalysisError {
public:
    explicit WriteError(const std::string& message)
        : BeamAnalysisError("Write error: " + message) {}
};

} // namespace beam_analysis
