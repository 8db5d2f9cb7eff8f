#include <iostream>
#include <opencv2/opencv.hpp>
#include <opencv2/core/utils/logger.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>
#include "CellGrouper.h"
#include "GroupingOptions.h"

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

static void printUsage() {
    std::cout << "Usage: CellIntensityBinner <cells_dir> <output_dir> [--bins N] [--auto-bins MAX]\n"
              << "           [--method gmm|kmeans|quantile] [--metric auc|max|sg] [--force-clusters]\n"
              << "           [--channels CH ...] [--seed N] [--config file.json] [--verbose]" << std::endl;
}

static int parsePositiveInt(const std::string& flag, const std::string& value) {
    std::size_t used = 0;
    const int v = std::stoi(value, &used);
    if (used != value.size() || v < 1) throw std::invalid_argument(flag + " expects a positive integer, got " + value);
    return v;
}

} // namespace

int main(int argc, char** argv) {
    // Library warnings go through OpenCV's logger; keep its own INFO chatter out unless asked.
    cv::utils::logging::setLogLevel(cv::utils::logging::LOG_LEVEL_WARNING);

    if (argc < 3) {
        printUsage();
        return 1;
    }

    const std::string cellsDir = argv[1];
    const std::string outputDir = argv[2];

    GroupingOptions options;
    bool verbose = false;
    try {
        // --config is applied first so that explicit flags override the file.
        for (int i = 3; i + 1 < argc; ++i) {
            if (std::string(argv[i]) == "--config") options = loadGroupingOptions(argv[i + 1]);
        }

        for (int i = 3; i < argc; ++i) {
            const std::string arg = argv[i];
            auto next = [&]() -> std::string {
                if (i + 1 >= argc) throw std::invalid_argument(arg + " expects a value");
                return argv[++i];
            };

            if (arg == "--bins") {
                options.bins = parsePositiveInt(arg, next());
                options.autoBins = false;
            } else if (arg == "--auto-bins") {
                options.maxBins = parsePositiveInt(arg, next());
                options.autoBins = true;
            } else if (arg == "--method") {
                const std::string v = next();
                const auto method = parseClusterMethod(v);
                if (!method) throw std::invalid_argument("unknown clustering method: " + v);
                options.method = *method;
            } else if (arg == "--metric") {
                const std::string v = next();
                const auto metric = parseFeatureMetric(v);
                if (!metric) throw std::invalid_argument("unknown feature metric: " + v);
                options.metric = *metric;
            } else if (arg == "--force-clusters") {
                options.forceRedistribute = true;
            } else if (arg == "--seed") {
                options.seed = static_cast<unsigned int>(std::stoul(next()));
            } else if (arg == "--config") {
                ++i;
            } else if (arg == "--verbose") {
                verbose = true;
            } else if (arg == "--channels") {
                options.channels.clear();
                while (i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0) {
                    options.channels.emplace_back(argv[++i]);
                }
            } else {
                throw std::invalid_argument("unknown argument: " + arg);
            }
        }
    } catch (const std::exception& e) {
        std::cout << "[ERROR] " << e.what() << std::endl;
        printUsage();
        return 1;
    }

    if (verbose) cv::utils::logging::setLogLevel(cv::utils::logging::LOG_LEVEL_INFO);

    const std::vector<std::string> cellDirs = CellGrouper::findCellDirectories(cellsDir, options);
    if (cellDirs.empty()) {
        std::cout << "[ERROR] No cell directories found in " << cellsDir << std::endl;
        return 1;
    }
    std::cout << "Found " << cellDirs.size() << " cell directories in " << cellsDir << std::endl;

    std::error_code ec;
    fs::create_directories(outputDir, ec);
    if (ec) {
        std::cout << "[ERROR] Cannot create output directory " << outputDir << ": " << ec.message() << std::endl;
        return 1;
    }

    json out;
    out["input"] = cellsDir;
    out["output"] = outputDir;
    out["options"] = options;
    out["results"] = json::array();

    int successCount = 0;
    int processedCount = 0;
    for (const auto& dir : cellDirs) {
        if (!CellGrouper::matchesChannels(dir, options.channels)) {
            std::cout << "  Skipping " << dir << " - no matching channels" << std::endl;
            continue;
        }
        processedCount++;

        std::cout << "  Grouping: " << fs::path(dir).filename().string() << "... ";
        const DirectoryReport report = CellGrouper::groupAndSumCells(dir, outputDir, options);
        if (report.ok) {
            successCount++;
            std::cout << "[OK] " << report.inputCount << " cells -> " << report.actualBins << " bins ("
                      << report.method << ")" << std::endl;
        } else {
            std::cout << "[FAILED] " << report.error << std::endl;
        }
        out["results"].push_back(json(report));
    }

    out["processedCount"] = processedCount;
    out["successCount"] = successCount;

    const std::string outPath = (fs::path(outputDir) / "CellIntensityBinner_results.json").string();
    std::ofstream o(outPath);
    o << out.dump(2) << std::endl;
    if (!o) std::cout << "[WARN] Could not write " << outPath << std::endl;

    std::cout << "\nSuccessfully processed " << successCount << " out of " << processedCount
              << " cell directories. -> " << fs::path(outPath).filename().string() << std::endl;
    return successCount > 0 ? 0 : 1;
}
