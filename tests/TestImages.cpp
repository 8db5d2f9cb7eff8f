#include "TestImages.h"

#include <gtest/gtest.h>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace testutil {

TempDir::TempDir() {
    const ::testing::TestInfo* info = ::testing::UnitTest::GetInstance()->current_test_info();
    std::string name = "cellbinner";
    if (info != nullptr) name += std::string("_") + info->test_suite_name() + "_" + info->name();
    for (char& c : name) {
        if (c == '/') c = '_';
    }
    path_ = fs::temp_directory_path() / name;
    std::error_code ec;
    fs::remove_all(path_, ec);
    fs::create_directories(path_);
}

TempDir::~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

cv::Mat constant16(int h, int w, int value) {
    return cv::Mat(h, w, CV_16UC1, cv::Scalar(value));
}

std::string writeCell(const fs::path& dir, const std::string& name, const cv::Mat& image) {
    const std::string path = (dir / name).string();
    if (!cv::imwrite(path, image)) throw std::runtime_error("could not write test image " + path);
    return path;
}

std::vector<CellSample> samplesFromFeatures(const std::vector<double>& features) {
    std::vector<CellSample> samples(features.size());
    for (size_t i = 0; i < features.size(); ++i) {
        samples[i].path = "CELL" + std::to_string(i) + ".tif";
        samples[i].id = std::to_string(i);
        samples[i].feature = features[i];
    }
    return samples;
}

std::vector<std::string> readLines(const fs::path& file) {
    std::ifstream in(file);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

} // namespace testutil
