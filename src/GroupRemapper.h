#pragma once

#include "CellTypes.h"

class GroupRemapper {
public:
    /// 把聚类产生的任意 raw label 映射为按均值升序排列的连续组号（内部 0-based，对外 1-based）。
    ///
    /// 排序键：(是否为空簇, 均值, raw label)。
    /// - 组 1 永远是最暗的一组，与聚类算法给出的 label 编号无关；
    /// - 均值相同时按 raw label 升序；
    /// - 没有成员的 raw label 排在所有非空组之后（均值未定义）。
    static LabelMapping remap(const ClusterResult& result);

    // Writes rawLabel / groupId (1-based) into each sample. samples[i] corresponds to result.labels[i].
    static void applyToSamples(const ClusterResult& result, const LabelMapping& mapping, std::vector<CellSample>& samples);
};
