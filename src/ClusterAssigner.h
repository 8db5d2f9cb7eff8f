#pragma once

#include <opencv2/opencv.hpp>
#include <vector>
#include "CellTypes.h"
#include "GroupingOptions.h"

class ClusterAssigner {
public:
    /// 将 N 个标量特征分成 actualBins = min(requestedBins, N) 个原始簇（raw label），并给出每簇均值。
    ///
    /// ----------------------------
    /// 流程（回退链）
    /// ----------------------------
    /// ```
    /// if allZero(features) or range(features) < 1e-6:
    ///     labels = quantilePartition(features, k)          // 退化输入：直接确定性均分
    /// else:
    ///     x = logTransform && all(features > 0) ? log1p(features) : features
    ///     if method == gmm:
    ///         labels = GMM(x, k)                            // 多次初始化，取总对数似然最大者
    ///         if failed or distinct(labels) == 1 or (force and distinct(labels) < k):
    ///             method = kmeans                           // 回退
    ///     if method == kmeans:
    ///         labels = KMeans(x, k)
    ///         if distinct(labels) < k:
    ///             labels = quantilePartition(features, k)   // 最后兜底，与 force 无关
    ///     if method == quantile:
    ///         labels = quantilePartition(features, k)
    /// means[label] = mean(features[labels == label])        // 始终使用未变换的原始特征
    /// ```
    ///
    /// - 随机初始化全部由 options.seed 决定，同样的输入必然得到同样的 labels。
    /// - distinct(labels) 按簇均值去重计数：把相同取值拆到不同 label 的结果不算新簇。
    /// - converged 表示再迭代一步拟合也不会超出停止阈值（GMM 看对数似然，K-Means 看中心位移）。
    /// - k 被缩减（样本不足）只记录警告，不视为错误。
    /// - 空的原始簇仍出现在 members 中（成员为空），但不会有 meanFeature。
    static ClusterResult assign(const std::vector<double>& features, int requestedBins, const GroupingOptions& options);

    /// 确定性均分：按特征升序（稳定排序，平局按输入顺序）切成 bins 段连续区间，
    /// 每段 N / bins 个，前 N % bins 段各多 1 个；返回每个样本的段序号。
    static std::vector<int> quantilePartition(const std::vector<double>& features, int bins);

    // BIC-optimal component count among 1..min(maxBins, N); 1 for degenerate input.
    static int selectBinCount(const std::vector<double>& features, int maxBins, const GroupingOptions& options);

    // True when every value is zero or the value range is below the degeneracy epsilon.
    static bool isDegenerate(const std::vector<double>& features);

    static constexpr double kDegenerateRange = 1e-6;

private:
    struct FitResult {
        bool ok = false;
        // Another iteration would not move the fit by more than the stopping tolerance.
        bool converged = false;
        std::vector<int> labels;
        double logLikelihood = 0.0;
    };

    // Features as the N x 1 CV_64F clustering input (log1p applied when enabled and all positive).
    static cv::Mat clusteringInput(const std::vector<double>& features, bool logTransform);

    static FitResult fitGmm(const cv::Mat& samples, int k, const GroupingOptions& options);
    static FitResult fitKMeans(const cv::Mat& samples, int k, const GroupingOptions& options);

    // Number of clusters with distinct mean feature. Labels splitting identical
    // values count once, so a fit that only relabels duplicates is a shortfall.
    static int effectiveClusters(const std::vector<double>& features, const std::vector<int>& labels);
    static void fillMembersAndMeans(const std::vector<double>& features, ClusterResult& result);
};
