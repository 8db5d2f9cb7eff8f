#include "TiffResolution.h"

#include <tiffio.h>
#include <cstdint>

namespace {

static std::string parseImagejUnit(const char* description) {
    if (description == nullptr) return {};
    const std::string text(description);
    const std::string key = "unit=";
    const size_t pos = text.find(key);
    if (pos == std::string::npos) return {};
    const size_t start = pos + key.size();
    const size_t end = text.find_first_of("\r\n", start);
    return text.substr(start, end == std::string::npos ? std::string::npos : end - start);
}

} // namespace

namespace CellImage {

std::optional<TiffResolution> readTiffResolution(const std::string& path) {
    // libtiff reports every non-TIFF input on stderr otherwise.
    TIFFSetWarningHandler(nullptr);
    TIFFSetErrorHandler(nullptr);

    TIFF* tif = TIFFOpen(path.c_str(), "r");
    if (tif == nullptr) return std::nullopt;

    float xres = 0.0f;
    float yres = 0.0f;
    uint16_t unit = RESUNIT_NONE;
    char* description = nullptr;
    const bool hasX = TIFFGetField(tif, TIFFTAG_XRESOLUTION, &xres) == 1;
    const bool hasY = TIFFGetField(tif, TIFFTAG_YRESOLUTION, &yres) == 1;
    TIFFGetFieldDefaulted(tif, TIFFTAG_RESOLUTIONUNIT, &unit);

    TiffResolution out;
    if (TIFFGetField(tif, TIFFTAG_IMAGEDESCRIPTION, &description) == 1) {
        out.imagejUnit = parseImagejUnit(description);
    }
    TIFFClose(tif);

    if (!hasX || xres <= 0.0f) return std::nullopt;
    out.xResolution = xres;
    out.yResolution = (hasY && yres > 0.0f) ? yres : xres;
    out.resolutionUnit = unit;
    return out;
}

bool writeTiffResolution(const std::string& path, const TiffResolution& resolution) {
    if (resolution.xResolution <= 0.0 || resolution.yResolution <= 0.0) return false;
    TIFFSetWarningHandler(nullptr);
    TIFFSetErrorHandler(nullptr);

    TIFF* tif = TIFFOpen(path.c_str(), "r+");
    if (tif == nullptr) return false;

    bool ok = TIFFSetField(tif, TIFFTAG_XRESOLUTION, static_cast<float>(resolution.xResolution)) == 1 &&
              TIFFSetField(tif, TIFFTAG_YRESOLUTION, static_cast<float>(resolution.yResolution)) == 1 &&
              TIFFSetField(tif, TIFFTAG_RESOLUTIONUNIT, static_cast<uint16_t>(resolution.resolutionUnit)) == 1;
    if (ok && !resolution.imagejUnit.empty()) {
        const std::string description = "ImageJ=1.11a\nunit=" + resolution.imagejUnit + "\n";
        ok = TIFFSetField(tif, TIFFTAG_IMAGEDESCRIPTION, description.c_str()) == 1;
    }
    if (ok) ok = TIFFRewriteDirectory(tif) == 1;
    TIFFClose(tif);
    return ok;
}

} // namespace CellImage
