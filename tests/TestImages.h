#pragma once

#include <opencv2/opencv.hpp>
#include <filesystem>
#include <string>
#include <vector>
#include "CellTypes.h"

namespace testutil {

// Scratch directory under the system temp dir, named after the running test and
// removed on destruction.
class TempDir {
public:
    TempDir();
    ~TempDir();
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

// h x w CV_16UC1 filled with value.
cv::Mat constant16(int h, int w, int value);

// Writes a 16-bit single-channel TIFF; returns the written path.
std::string writeCell(const std::filesystem::path& dir, const std::string& name, const cv::Mat& image);

// Samples carrying only a feature value, in input order.
std::vector<CellSample> samplesFromFeatures(const std::vector<double>& features);

std::vector<std::string> readLines(const std::filesystem::path& file);

} // namespace testutil
