#include "CellImage.h"

#include <opencv2/core/utils/logger.hpp>
#include <algorithm>
#include <vector>

namespace CellImage {

cv::Mat loadGrayscale(const std::string& path) {
    cv::Mat image;
    try {
        image = cv::imread(path, cv::IMREAD_UNCHANGED);
    } catch (const cv::Exception& e) {
        CV_LOG_WARNING(NULL, "Failed to read " << path << ": " << e.what());
        return cv::Mat();
    }
    if (image.empty()) {
        CV_LOG_WARNING(NULL, "Unable to read " << path);
        return image;
    }
    if (image.channels() == 1) return image;

    // Average the channels in double precision, then go back to the source depth.
    std::vector<cv::Mat> channels;
    cv::split(image, channels);
    cv::Mat acc = cv::Mat::zeros(image.rows, image.cols, CV_64FC1);
    for (const auto& ch : channels) {
        cv::Mat ch64;
        ch.convertTo(ch64, CV_64F);
        acc += ch64;
    }
    acc /= static_cast<double>(channels.size());

    cv::Mat gray;
    acc.convertTo(gray, image.depth());
    return gray;
}

cv::Mat fitToCanvas(const cv::Mat& image, int targetHeight, int targetWidth) {
    cv::Mat canvas = cv::Mat::zeros(targetHeight, targetWidth, image.type());
    if (image.empty() || targetHeight <= 0 || targetWidth <= 0) return canvas;

    const long long h = image.rows;
    const long long w = image.cols;
    int newW = 0;
    int newH = 0;
    // Compare w/h against targetW/targetH without floating point rounding.
    if (w * targetHeight > static_cast<long long>(targetWidth) * h) {
        newW = targetWidth;
        newH = static_cast<int>((static_cast<long long>(targetWidth) * h) / w);
    } else {
        newH = targetHeight;
        newW = static_cast<int>((static_cast<long long>(targetHeight) * w) / h);
    }
    newW = std::clamp(newW, 1, targetWidth);
    newH = std::clamp(newH, 1, targetHeight);

    cv::Mat resized;
    if (newW == image.cols && newH == image.rows) {
        resized = image;
    } else {
        cv::resize(image, resized, cv::Size(newW, newH), 0, 0, cv::INTER_AREA);
    }

    const int padTop = (targetHeight - newH) / 2;
    const int padLeft = (targetWidth - newW) / 2;
    resized.copyTo(canvas(cv::Rect(padLeft, padTop, newW, newH)));
    return canvas;
}

} // namespace CellImage
