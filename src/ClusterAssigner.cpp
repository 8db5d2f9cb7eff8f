#include "ClusterAssigner.h"

#include <opencv2/ml.hpp>
#include <opencv2/core/utils/logger.hpp>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <numeric>
#include <map>
#include <utility>

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kEmEpsilon = 1e-6;
constexpr double kKMeansEpsilon = 1e-4;

// Every randomized step reseeds OpenCV's RNG from here. cv::RNG maps a zero state to a
// fixed non-zero one, so any seed value is usable.
static cv::RNG seededRng(unsigned int seed, int attempt) {
    const std::uint64_t state = 0x9E3779B9ULL + static_cast<std::uint64_t>(seed) * 1000003ULL + static_cast<std::uint64_t>(attempt);
    return cv::RNG(state);
}

static double columnMean(const cv::Mat& samples) {
    return cv::mean(samples)[0];
}

static double columnVariance(const cv::Mat& samples) {
    cv::Scalar mean, stddev;
    cv::meanStdDev(samples, mean, stddev);
    return stddev[0] * stddev[0];
}

// Log-likelihood of a single Gaussian (k = 1) with regularized ML variance.
static double singleGaussianLogLikelihood(const cv::Mat& samples, double reg) {
    const double m = columnMean(samples);
    const double v = std::max(columnVariance(samples) + reg, std::numeric_limits<double>::min());
    double ll = 0.0;
    for (int i = 0; i < samples.rows; ++i) {
        const double d = samples.at<double>(i, 0) - m;
        ll += -0.5 * (std::log(2.0 * kPi * v) + d * d / v);
    }
    return ll;
}

// One more E/M round from the trained parameters; converged when the log-likelihood
// gain stays below the EM stopping tolerance.
static bool emStepConverged(const cv::Ptr<cv::ml::EM>& em, const cv::Mat& samples, double logLikelihood) {
    std::vector<cv::Mat> covs;
    em->getCovs(covs);

    cv::Ptr<cv::ml::EM> next = cv::ml::EM::create();
    next->setClustersNumber(em->getClustersNumber());
    next->setCovarianceMatrixType(em->getCovarianceMatrixType());
    next->setTermCriteria(cv::TermCriteria(cv::TermCriteria::COUNT, 2, 0.0));

    cv::Mat logLikelihoods;
    if (!next->trainE(samples, em->getMeans(), covs, em->getWeights(), logLikelihoods, cv::noArray(), cv::noArray())) {
        return false;
    }
    const double nextLL = cv::sum(logLikelihoods)[0];
    return std::isfinite(nextLL) && nextLL - logLikelihood < kEmEpsilon * std::fabs(nextLL);
}

// One Lloyd step from the returned centers; converged when no center moves more than
// the K-means stopping tolerance.
static bool lloydStepConverged(const cv::Mat& samples32, const cv::Mat& centers) {
    const int k = centers.rows;
    std::vector<double> sums(static_cast<size_t>(k), 0.0);
    std::vector<int> counts(static_cast<size_t>(k), 0);
    for (int i = 0; i < samples32.rows; ++i) {
        const double x = samples32.at<float>(i, 0);
        int nearest = 0;
        for (int c = 1; c < k; ++c) {
            if (std::fabs(x - centers.at<float>(c, 0)) < std::fabs(x - centers.at<float>(nearest, 0))) nearest = c;
        }
        sums[static_cast<size_t>(nearest)] += x;
        counts[static_cast<size_t>(nearest)]++;
    }
    for (int c = 0; c < k; ++c) {
        if (counts[static_cast<size_t>(c)] == 0) continue;
        const double moved = sums[static_cast<size_t>(c)] / counts[static_cast<size_t>(c)] - centers.at<float>(c, 0);
        if (std::fabs(moved) > kKMeansEpsilon) return false;
    }
    return true;
}

} // namespace

bool ClusterAssigner::isDegenerate(const std::vector<double>& features) {
    if (features.empty()) return true;
    const auto [mn, mx] = std::minmax_element(features.begin(), features.end());
    const bool allZero = std::all_of(features.begin(), features.end(), [](double v) { return v == 0.0; });
    return allZero || (*mx - *mn) < kDegenerateRange;
}

std::vector<int> ClusterAssigner::quantilePartition(const std::vector<double>& features, int bins) {
    const size_t n = features.size();
    std::vector<int> labels(n, 0);
    if (n == 0 || bins <= 1) return labels;
    bins = std::min<int>(bins, static_cast<int>(n));

    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) { return features[a] < features[b]; });

    const size_t perBin = n / static_cast<size_t>(bins);
    const size_t remainder = n % static_cast<size_t>(bins);
    size_t start = 0;
    for (int b = 0; b < bins; ++b) {
        const size_t size = perBin + (static_cast<size_t>(b) < remainder ? 1 : 0);
        for (size_t i = start; i < start + size; ++i) labels[order[i]] = b;
        start += size;
    }
    return labels;
}

cv::Mat ClusterAssigner::clusteringInput(const std::vector<double>& features, bool logTransform) {
    cv::Mat samples(static_cast<int>(features.size()), 1, CV_64F);
    const bool allPositive = std::all_of(features.begin(), features.end(), [](double v) { return v > 0.0; });
    const bool useLog = logTransform && allPositive;
    for (size_t i = 0; i < features.size(); ++i) {
        samples.at<double>(static_cast<int>(i), 0) = useLog ? std::log1p(features[i]) : features[i];
    }
    return samples;
}

int ClusterAssigner::effectiveClusters(const std::vector<double>& features, const std::vector<int>& labels) {
    std::map<int, std::pair<double, int>> acc;
    for (size_t i = 0; i < labels.size() && i < features.size(); ++i) {
        auto& a = acc[labels[i]];
        a.first += features[i];
        a.second++;
    }
    std::vector<double> means;
    means.reserve(acc.size());
    for (const auto& entry : acc) means.push_back(entry.second.first / entry.second.second);
    std::sort(means.begin(), means.end());

    int count = means.empty() ? 0 : 1;
    for (size_t i = 1; i < means.size(); ++i) {
        if (means[i] - means[i - 1] >= kDegenerateRange) count++;
    }
    return count;
}

ClusterAssigner::FitResult ClusterAssigner::fitGmm(const cv::Mat& samples, int k, const GroupingOptions& options) {
    FitResult best{};
    const int n = samples.rows;
    if (k < 2 || n < k) return best;

    cv::Mat samples32;
    samples.convertTo(samples32, CV_32F);
    const double overallVar = columnVariance(samples);
    const cv::TermCriteria kmCriteria(cv::TermCriteria::EPS + cv::TermCriteria::MAX_ITER, options.maxIterations, kKMeansEpsilon);
    const cv::TermCriteria emCriteria(cv::TermCriteria::COUNT + cv::TermCriteria::EPS, options.maxIterations, kEmEpsilon);
    cv::Ptr<cv::ml::EM> bestModel;

    for (int attempt = 0; attempt < options.initializations; ++attempt) {
        try {
            // k-means++ seeding of the component means (sklearn's init_params='kmeans').
            cv::theRNG() = seededRng(options.seed, attempt);
            cv::Mat kmLabels, centers;
            cv::kmeans(samples32, k, kmLabels, kmCriteria, 1, cv::KMEANS_PP_CENTERS, centers);

            cv::Mat means0(k, 1, CV_64F);
            cv::Mat weights0(1, k, CV_64F);
            std::vector<cv::Mat> covs0;
            covs0.reserve(static_cast<size_t>(k));
            for (int c = 0; c < k; ++c) {
                const double center = centers.at<float>(c, 0);
                double sq = 0.0;
                int count = 0;
                for (int i = 0; i < n; ++i) {
                    if (kmLabels.at<int>(i, 0) != c) continue;
                    const double d = samples.at<double>(i, 0) - center;
                    sq += d * d;
                    count++;
                }
                const double var = (count > 1 ? sq / count : overallVar) + options.covarianceRegularization;
                means0.at<double>(c, 0) = center;
                weights0.at<double>(0, c) = static_cast<double>(std::max(count, 1));
                covs0.push_back(cv::Mat(1, 1, CV_64F, cv::Scalar(std::max(var, options.covarianceRegularization))));
            }
            weights0 /= cv::sum(weights0)[0];

            cv::Ptr<cv::ml::EM> em = cv::ml::EM::create();
            em->setClustersNumber(k);
            em->setCovarianceMatrixType(cv::ml::EM::COV_MAT_DIAGONAL);
            em->setTermCriteria(emCriteria);

            cv::Mat logLikelihoods, labels;
            if (!em->trainE(samples, means0, covs0, weights0, logLikelihoods, labels, cv::noArray())) {
                CV_LOG_INFO(NULL, "GMM initialization " << attempt << " did not converge");
                continue;
            }
            const double ll = cv::sum(logLikelihoods)[0];
            if (!std::isfinite(ll)) continue;
            if (best.ok && ll <= best.logLikelihood) continue;

            best.ok = true;
            best.logLikelihood = ll;
            bestModel = em;
            best.labels.assign(static_cast<size_t>(n), 0);
            for (int i = 0; i < n; ++i) best.labels[static_cast<size_t>(i)] = labels.at<int>(i, 0);
        } catch (const cv::Exception& e) {
            CV_LOG_WARNING(NULL, "GMM initialization " << attempt << " failed: " << e.what());
        }
    }

    if (bestModel) {
        try {
            best.converged = emStepConverged(bestModel, samples, best.logLikelihood);
        } catch (const cv::Exception& e) {
            CV_LOG_WARNING(NULL, "GMM convergence check failed: " << e.what());
        }
        if (!best.converged) {
            CV_LOG_INFO(NULL, "GMM stopped after " << options.maxIterations << " iterations without converging");
        }
    }
    return best;
}

ClusterAssigner::FitResult ClusterAssigner::fitKMeans(const cv::Mat& samples, int k, const GroupingOptions& options) {
    FitResult out{};
    const int n = samples.rows;
    if (k < 1 || n < k) return out;

    cv::Mat samples32;
    samples.convertTo(samples32, CV_32F);
    const cv::TermCriteria criteria(cv::TermCriteria::EPS + cv::TermCriteria::MAX_ITER, options.maxIterations, kKMeansEpsilon);

    try {
        cv::theRNG() = seededRng(options.seed, 0);
        cv::Mat labels, centers;
        const double compactness =
            cv::kmeans(samples32, k, labels, criteria, options.initializations, cv::KMEANS_PP_CENTERS, centers);
        out.ok = true;
        out.converged = lloydStepConverged(samples32, centers);
        out.logLikelihood = -compactness;
        out.labels.assign(static_cast<size_t>(n), 0);
        for (int i = 0; i < n; ++i) out.labels[static_cast<size_t>(i)] = labels.at<int>(i, 0);
    } catch (const cv::Exception& e) {
        CV_LOG_WARNING(NULL, "K-means failed: " << e.what());
    }
    return out;
}

void ClusterAssigner::fillMembersAndMeans(const std::vector<double>& features, ClusterResult& result) {
    result.members.clear();
    result.meanFeature.clear();
    for (int label = 0; label < result.actualBins; ++label) result.members[label];
    for (size_t i = 0; i < result.labels.size(); ++i) result.members[result.labels[i]].push_back(i);

    for (const auto& [label, idx] : result.members) {
        if (idx.empty()) continue;
        double sum = 0.0;
        for (const size_t i : idx) sum += features[i];
        result.meanFeature[label] = sum / static_cast<double>(idx.size());
    }
}

int ClusterAssigner::selectBinCount(const std::vector<double>& features, int maxBins, const GroupingOptions& options) {
    const int n = static_cast<int>(features.size());
    if (n <= 1 || maxBins <= 1 || isDegenerate(features)) return 1;

    const cv::Mat samples = clusteringInput(features, options.logTransform);
    const double logN = std::log(static_cast<double>(n));
    auto bic = [&](double ll, int k) { return -2.0 * ll + static_cast<double>(3 * k - 1) * logN; };

    int bestK = 1;
    double bestBic = bic(singleGaussianLogLikelihood(samples, options.covarianceRegularization), 1);
    CV_LOG_INFO(NULL, "BIC k=1: " << bestBic);

    const int kMax = std::min(maxBins, n);
    for (int k = 2; k <= kMax; ++k) {
        const FitResult fit = fitGmm(samples, k, options);
        if (!fit.ok) continue;
        const double score = bic(fit.logLikelihood, k);
        CV_LOG_INFO(NULL, "BIC k=" << k << ": " << score);
        if (score < bestBic) {
            bestBic = score;
            bestK = k;
        }
    }
    return bestK;
}

ClusterResult ClusterAssigner::assign(const std::vector<double>& features, int requestedBins, const GroupingOptions& options) {
    ClusterResult result{};
    result.requestedBins = requestedBins;
    const int n = static_cast<int>(features.size());
    if (n == 0) {
        CV_LOG_WARNING(NULL, "No features to cluster");
        return result;
    }

    const int k = std::min(std::max(1, requestedBins), n);
    if (k < requestedBins) {
        CV_LOG_WARNING(NULL, "Reducing bins from " << requestedBins << " to " << k << " due to limited samples");
    }
    result.actualBins = k;

    const bool force = options.forceRedistribute;

    if (isDegenerate(features)) {
        CV_LOG_WARNING(NULL, "All " << n << " features are zero or identical; using forced equal distribution");
        result.labels = quantilePartition(features, k);
        result.methodUsed = ClusterMethod::ForcedQuantile;
        result.converged = true;
        result.degenerate = true;
        fillMembersAndMeans(features, result);
        return result;
    }

    if (k == 1) {
        result.labels.assign(static_cast<size_t>(n), 0);
        result.methodUsed = options.method;
        result.converged = true;
        fillMembersAndMeans(features, result);
        return result;
    }

    const cv::Mat samples = clusteringInput(features, options.logTransform);
    ClusterMethod method = options.method;
    bool kmeansFailed = false;

    if (method == ClusterMethod::Gmm) {
        const FitResult fit = fitGmm(samples, k, options);
        const int distinct = fit.ok ? effectiveClusters(features, fit.labels) : 0;
        if (fit.ok && distinct > 1 && !(force && distinct < k)) {
            result.labels = fit.labels;
            result.methodUsed = ClusterMethod::Gmm;
            result.converged = fit.converged;
        } else {
            if (!fit.ok) {
                CV_LOG_WARNING(NULL, "GMM fit failed; falling back to K-means");
            } else {
                CV_LOG_WARNING(NULL, "GMM only found " << distinct << " clusters but " << k
                                     << " were requested; falling back to K-means");
            }
            method = ClusterMethod::KMeans;
        }
    }

    if (method == ClusterMethod::KMeans) {
        const FitResult fit = fitKMeans(samples, k, options);
        if (!fit.ok) {
            CV_LOG_WARNING(NULL, "K-means failed; falling back to quantile-based binning");
            method = ClusterMethod::ForcedQuantile;
            kmeansFailed = true;
        } else {
            const int distinct = effectiveClusters(features, fit.labels);
            if (distinct < k) {
                CV_LOG_WARNING(NULL, "K-means only found " << distinct << " distinct clusters but " << k
                                     << " were requested; falling back to quantile-based binning");
                method = ClusterMethod::ForcedQuantile;
            } else {
                result.labels = fit.labels;
                result.methodUsed = ClusterMethod::KMeans;
                result.converged = fit.converged;
            }
        }
    }

    if (method == ClusterMethod::ForcedQuantile) {
        result.labels = quantilePartition(features, k);
        result.methodUsed = ClusterMethod::ForcedQuantile;
        result.converged = !kmeansFailed;
    }

    fillMembersAndMeans(features, result);
    for (const auto& [label, idx] : result.members) {
        CV_LOG_INFO(NULL, toString(result.methodUsed) << " cluster " << label << " has " << idx.size() << " cells ("
                          << (100.0 * static_cast<double>(idx.size()) / n) << "%)");
    }
    return result;
}
