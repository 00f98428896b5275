#include "beam_analysis/io/fits_io.hpp"
#include "beam_analysis/core/errors.hpp"
#include "beam_analysis/core/utils.hpp"

#include <fitsio.h>
#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace beam_analysis::io {

namespace {

constexpr int kMaxFitsAxes = 8;

// Closes with a fresh status; cfitsio ignores the call while status != 0.
void close_after_error(fitsfile* fptr) {
    int close_status = 0;
    fits_close_file(fptr, &close_status);
}

FitsHeader read_header_cards(fitsfile* fptr) {
    FitsHeader header;
    int status = 0;

    char card[FLEN_CARD];
    int nkeys = 0;
    fits_get_hdrspace(fptr, &nkeys, nullptr, &status);

    for (int i = 1; i <= nkeys; ++i) {
        status = 0;
        fits_read_record(fptr, i, card, &status);
        if (status) continue;

        char keyname[FLEN_KEYWORD];
        char value[FLEN_VALUE];
        char comment[FLEN_COMMENT];
        int keylen = 0;

        fits_get_keyname(card, keyname, &keylen, &status);
        if (status) continue;

        std::string key(keyname);
        if (key.empty() || key == "COMMENT" || key == "HISTORY" || key == "END") {
            continue;
        }

        fits_parse_value(card, value, comment, &status);
        if (status) continue;

        char dtype = 'C';
        fits_get_keytype(value, &dtype, &status);
        if (status) continue;

        std::string val_str(value);
        val_str.erase(0, val_str.find_first_not_of(" '"));
        val_str.erase(val_str.find_last_not_of(" '") + 1);

        switch (dtype) {
            case 'C':
                header.set(key, val_str);
                break;
            case 'L':
                header.set(key, val_str == "T" || val_str == "1");
                break;
            case 'I':
                try {
                    header.set(key, std::stoi(val_str));
                } catch (const std::logic_error&) {
                    header.set(key, val_str);
                }
                break;
            case 'F':
                try {
                    header.set(key, std::stod(val_str));
                } catch (const std::logic_error&) {
                    header.set(key, val_str);
                }
                break;
            default:
                header.set(key, val_str);
                break;
        }
    }
    return header;
}

} // namespace

std::optional<std::string> FitsHeader::get_string(const std::string& key) const {
    auto it = string_values.find(key);
    if (it != string_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<double> FitsHeader::get_double(const std::string& key) const {
    auto it = numeric_values.find(key);
    if (it != numeric_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<int> FitsHeader::get_int(const std::string& key) const {
    auto it = int_values.find(key);
    if (it != int_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<bool> FitsHeader::get_bool(const std::string& key) const {
    auto it = bool_values.find(key);
    if (it != bool_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

void FitsHeader::set(const std::string& key, const std::string& value) {
    string_values[key] = value;
}

void FitsHeader::set(const std::string& key, double value) {
    numeric_values[key] = value;
}

void FitsHeader::set(const std::string& key, int value) {
    int_values[key] = value;
}

void FitsHeader::set(const std::string& key, bool value) {
    bool_values[key] = value;
}

bool is_fits_image_path(const fs::path& path) {
    return core::has_extension(path, {".fit", ".fits", ".fts"});
}

std::pair<DetectorStack, FitsHeader> read_fits_stack(const fs::path& path) {
    fitsfile* fptr = nullptr;
    int status = 0;

    if (fits_open_file(&fptr, path.string().c_str(), READONLY, &status)) {
        throw FitsError("Cannot open FITS file: " + path.string());
    }

    int naxis = 0;
    long naxes[kMaxFitsAxes] = {0};
    int bitpix = 0;

    fits_get_img_param(fptr, kMaxFitsAxes, &bitpix, &naxis, naxes, &status);
    if (status) {
        close_after_error(fptr);
        throw FitsError("Cannot read FITS image parameters: " + path.string());
    }

    if (naxis < 2 || naxis > kMaxFitsAxes) {
        close_after_error(fptr);
        throw ShapeError("FITS image has " + std::to_string(naxis) +
                         " axes, need 2.." + std::to_string(kMaxFitsAxes) + ": " + path.string());
    }

    DetectorStack stack;
    for (int i = naxis - 1; i >= 0; --i) {
        stack.shape.push_back(static_cast<size_t>(naxes[i]));
    }
    const size_t npixels = stack.element_count();
    stack.data.resize(npixels);

    long fpixel[kMaxFitsAxes];
    std::fill(fpixel, fpixel + kMaxFitsAxes, 1L);

    if (npixels > 0) {
        fits_read_pix(fptr, TDOUBLE, fpixel, static_cast<LONGLONG>(npixels), nullptr,
                      stack.data.data(), nullptr, &status);
        if (status) {
            close_after_error(fptr);
            throw FitsError("Cannot read FITS pixel data: " + path.string());
        }
    }

    FitsHeader header = read_header_cards(fptr);

    fits_close_file(fptr, &status);
    return {std::move(stack), std::move(header)};
}

void write_fits_stack(const fs::path& path, const DetectorStack& stack, const FitsHeader& header) {
    stack.validate();
    if (stack.rank() < 2 || stack.rank() > static_cast<size_t>(kMaxFitsAxes)) {
        throw ShapeError("cannot write shape " + shape_to_string(stack.shape) + " as FITS image");
    }

    fitsfile* fptr = nullptr;
    int status = 0;

    std::string filepath = "!" + path.string();

    if (fits_create_file(&fptr, filepath.c_str(), &status)) {
        throw FitsError("Cannot create FITS file: " + path.string());
    }

    long naxes[kMaxFitsAxes] = {0};
    const int naxis = static_cast<int>(stack.rank());
    for (int i = 0; i < naxis; ++i) {
        naxes[i] = static_cast<long>(stack.shape[static_cast<size_t>(naxis - 1 - i)]);
    }

    fits_create_img(fptr, DOUBLE_IMG, naxis, naxes, &status);
    if (status) {
        close_after_error(fptr);
        throw FitsError("Cannot create FITS image: " + path.string());
    }

    for (const auto& [key, value] : header.string_values) {
        if (key.size() <= 8) {
            fits_update_key(fptr, TSTRING, key.c_str(),
                            const_cast<char*>(value.c_str()), nullptr, &status);
        }
    }

    for (const auto& [key, value] : header.numeric_values) {
        if (key.size() <= 8) {
            double val = value;
            fits_update_key(fptr, TDOUBLE, key.c_str(), &val, nullptr, &status);
        }
    }

    for (const auto& [key, value] : header.int_values) {
        if (key.size() <= 8) {
            int val = value;
            fits_update_key(fptr, TINT, key.c_str(), &val, nullptr, &status);
        }
    }

    for (const auto& [key, value] : header.bool_values) {
        if (key.size() <= 8) {
            int val = value ? 1 : 0;
            fits_update_key(fptr, TLOGICAL, key.c_str(), &val, nullptr, &status);
        }
    }

    if (status) {
        close_after_error(fptr);
        throw FitsError("Cannot write FITS header: " + path.string());
    }

    long fpixel[kMaxFitsAxes];
    std::fill(fpixel, fpixel + kMaxFitsAxes, 1L);
    fits_write_pix(fptr, TDOUBLE, fpixel, static_cast<LONGLONG>(stack.data.size()),
                   const_cast<double*>(stack.data.data()), &status);
    if (status) {
        close_after_error(fptr);
        throw FitsError("Cannot write FITS pixel data: " + path.string());
    }

    if (fits_close_file(fptr, &status)) {
        throw FitsError("Cannot close FITS file: " + path.string());
    }
}

std::optional<double> detect_exposure_time(const FitsHeader& header) {
    for (const char* key : {"EXPTIME", "EXPOSURE", "ITIME"}) {
        if (auto v = header.get_double(key)) return *v;
        if (auto v = header.get_int(key)) return static_cast<double>(*v);
    }
    return std::nullopt;
}

} // namespace beam_analysis::io
