#pragma once

#include <optional>
#include <string>

// Physical pixel size carried by a TIFF file (XResolution/YResolution/ResolutionUnit,
// plus the "unit=" entry ImageJ stores in ImageDescription).
struct TiffResolution {
    double xResolution = 0.0; // pixels per unit
    double yResolution = 0.0;
    int resolutionUnit = 1;   // 1 none, 2 inch, 3 centimeter (TIFF convention)
    std::string imagejUnit;   // e.g. "micron"; empty when absent
};

namespace CellImage {

// Returns nullopt for non-TIFF files and for TIFFs without a positive resolution.
std::optional<TiffResolution> readTiffResolution(const std::string& path);

// Stamps the resolution onto an existing TIFF: rational X/Y resolution, the unit tag
// and, when imagejUnit is set, an ImageJ description carrying "unit=". Returns false
// when the file cannot be opened for update or the directory cannot be rewritten.
bool writeTiffResolution(const std::string& path, const TiffResolution& resolution);

} // namespace CellImage
