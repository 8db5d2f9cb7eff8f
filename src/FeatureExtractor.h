#pragma once

#include <opencv2/opencv.hpp>
#include <optional>
#include <string>
#include <vector>
#include "CellTypes.h"
#include "TiffResolution.h"

struct ExtractionResult {
    std::vector<CellSample> samples;
    // Files that matched the cell pattern but could not be read.
    int skippedCount = 0;
    int zeroCount = 0;
    int nonZeroCount = 0;
    // Resolution of the first cell image that carries one.
    std::optional<TiffResolution> referenceResolution;
};

class FeatureExtractor {
public:
    /// 读取目录下所有细胞图像，并为每个细胞计算一个标量特征。
    ///
    /// - 文件匹配规则：普通文件，文件名以 cellPrefix 开头、扩展名为 cellExtension（大小写不敏感），按路径排序。
    /// - 读取失败的文件被跳过并计入 skippedCount，不会中断整个目录。
    /// - 同时统计 feature == 0 / > 0 的数量，供后续判断退化输入。
    static ExtractionResult extract(const std::string& cellDir, FeatureMetric metric,
                                    const std::string& cellPrefix = "CELL", const std::string& cellExtension = ".tif");

    // Sorted cell image paths of one directory (non-recursive).
    static std::vector<std::string> listCellImages(const std::string& cellDir,
                                                   const std::string& cellPrefix = "CELL",
                                                   const std::string& cellExtension = ".tif");

    // Single-channel image -> scalar feature.
    static double computeFeature(const cv::Mat& image, FeatureMetric metric);

    // sum(px >= p95) / sum(px <= p50). A zero background sum yields the signal sum itself.
    static double signalToGroundRatio(const cv::Mat& image);

    // Linear-interpolated percentile (0..100) of all pixel values.
    static double percentile(const cv::Mat& image, double p);

    // "CELL12_x.tif" -> "12"; other stems are returned unchanged.
    static std::string cellIdFromFilename(const std::string& path);
};
