#pragma once

#include <string>
#include <vector>
#include "CellTypes.h"
#include "GroupingOptions.h"

class CellGrouper {
public:
    /// 对单个细胞目录执行完整流程：特征提取 -> 聚类 -> 组重映射 -> 叠加图 + 溯源记录。
    ///
    /// 输出目录：`<outputRoot>/<condition>/<dirName>/`，其中 condition 为 cellDir 的父目录名。
    /// 产物：
    /// - `<dirName>_bin_<i>.tif`（i = 1..actualBins，组 1 为平均强度最低的一组）
    /// - `<dirName>_cell_groups.csv`
    /// - `<dirName>_grouping_info.txt`
    ///
    /// 错误策略：单个文件读/写失败只记录日志并继续；只有当一张叠加图都没写出时 ok=false。
    /// 本函数不会抛出异常（文件系统与 OpenCV 异常在内部被转换为 report.error）。
    static DirectoryReport groupAndSumCells(const std::string& cellDir, const std::string& outputRoot,
                                            const GroupingOptions& options);

    // Directories under cellsRoot (recursive, root included) holding at least one cell image; sorted.
    static std::vector<std::string> findCellDirectories(const std::string& cellsRoot, const GroupingOptions& options);

    // True when channels is empty or any channel string occurs in the directory path.
    static bool matchesChannels(const std::string& cellDir, const std::vector<std::string>& channels);
};
