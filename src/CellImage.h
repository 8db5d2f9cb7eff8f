#pragma once

#include <opencv2/opencv.hpp>
#include <string>

namespace CellImage {

/// 读取单个细胞图像，返回单通道、保持原始位深的矩阵（失败时返回空 Mat）。
///
/// 规则：
/// - 以 IMREAD_UNCHANGED 读取，16-bit TIFF 不会被截断为 8-bit。
/// - 多通道图像按通道取平均后转回原始位深（alpha 通道同样参与平均）。
/// - OpenCV 抛出的异常会被记录并当作读取失败处理，不会向上传播。
///
/// @param path 图像路径。
cv::Mat loadGrayscale(const std::string& path);

/// 等比缩放后居中放入 targetHeight x targetWidth 的零画布（fit + letterbox，不裁剪）。
///
/// - 图像比目标更“宽”时以宽度为准，否则以高度为准；缩放后的边长向下取整，最小 1px。
/// - 缩放使用 INTER_AREA；尺寸恰好一致时直接拷贝。
/// - 返回值与输入同类型。
cv::Mat fitToCanvas(const cv::Mat& image, int targetHeight, int targetWidth);

} // namespace CellImage
