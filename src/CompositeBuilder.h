#pragma once

#include <opencv2/opencv.hpp>
#include <optional>
#include <string>
#include <vector>
#include "CellTypes.h"
#include "TiffResolution.h"

struct CompositeWriteResult {
    int groupId = 0; // 1-based
    int cellCount = 0;
    std::string path;
    bool written = false;
};

class CompositeBuilder {
public:
    /// 按组生成叠加图（composite）。
    ///
    /// 对每个组：
    /// 1) 画布尺寸 = 组内成员的最大高度 / 最大宽度；
    /// 2) 每个成员等比缩放并居中贴到零画布（CellImage::fitToCanvas）；
    /// 3) 以 CV_64F 逐像素累加；
    /// 4) 线性拉伸到 0..65535 并以 16-bit TIFF 写出，文件名 `<dirName>_bin_<groupId>.tif`。
    ///
    /// - 空组只记录警告并跳过，不会中断其它组；
    /// - 单个文件写失败同样只影响该组（written=false）；
    /// - 写入前会删除上一次运行遗留的、组号大于当前组数的 `_bin_<j>.tif`。
    static std::vector<CompositeWriteResult> buildAndWrite(const std::vector<CellSample>& samples,
                                                           const LabelMapping& mapping,
                                                           const std::string& outputDir,
                                                           const std::string& dirName,
                                                           const std::optional<TiffResolution>& resolution);

    // Groups 1..mapping.size() with members taken from CellSample::groupId.
    static std::vector<Group> collectGroups(const std::vector<CellSample>& samples, const LabelMapping& mapping);

    // Sets the canvas to the members' max height/width and sums the fitted members into the accumulator.
    static void accumulate(Group& group, const std::vector<CellSample>& samples);

    // Min-max stretch to CV_16U 0..65535; a constant accumulator gives an all-zero image.
    static cv::Mat normalizeTo16U(const cv::Mat& accumulator);

    static std::string compositeFileName(const std::string& dirName, int groupId);

    // Removes <dirName>_bin_<j>.tif with j > keepBins. Returns the number of files removed.
    static int removeStaleComposites(const std::string& outputDir, const std::string& dirName, int keepBins);

    // Writes the 16-bit image, then stamps the resolution (libtiff) when available.
    // A metadata failure is logged and leaves the plain image in place.
    static bool writeComposite(const std::string& path, const cv::Mat& image16,
                               const std::optional<TiffResolution>& resolution);
};
