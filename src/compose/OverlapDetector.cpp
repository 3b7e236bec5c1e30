#include "compose/OverlapDetector.h"
#include "utils/MatConverter.h"

#include <opencv2/core.hpp>

#include <QDebug>
#include <algorithm>
#include <cmath>
#include <limits>

namespace
{
OverlapMeasurement rejected(OverlapReason reason, int overlap, double score, int candidateCount)
{
    OverlapMeasurement measurement;
    measurement.overlapPx = 0;
    measurement.score = score;
    measurement.decision = OverlapDecision::Rejected;
    measurement.reason = reason;
    measurement.candidateCount = candidateCount;
    qDebug() << "OverlapDetector: Rejected overlap" << overlap
             << "score=" << score << "reason=" << overlapReasonToString(reason);
    return measurement;
}

// Bottom `rows` rows of an image
cv::Mat tailRows(const cv::Mat &mat, int rows)
{
    return mat.rowRange(mat.rows - rows, mat.rows);
}

// Top `rows` rows of an image
cv::Mat headRows(const cv::Mat &mat, int rows)
{
    return mat.rowRange(0, rows);
}
} // namespace

int OverlapDetector::defaultMaxOverlap(int topHeight, int bottomHeight, const Config &config)
{
    return static_cast<int>(std::floor(std::min(topHeight, bottomHeight) * config.maxOverlapRatio));
}

double OverlapDetector::regionVariance(const cv::Mat &region)
{
    if (region.empty()) {
        return 0.0;
    }

    // Population variance over every channel sample
    cv::Mat samples = region.clone().reshape(1);
    cv::Scalar mean, stddev;
    cv::meanStdDev(samples, mean, stddev);
    return stddev[0] * stddev[0];
}

double OverlapDetector::medianScore(const std::vector<Candidate> &candidates)
{
    std::vector<double> scores;
    scores.reserve(candidates.size());
    for (const Candidate &candidate : candidates) {
        scores.push_back(candidate.score);
    }
    std::sort(scores.begin(), scores.end());
    return scores[scores.size() / 2];
}

std::vector<OverlapDetector::Candidate> OverlapDetector::scoreCandidates(
    const QImage &top, const QImage &bottom, int maxOverlap, const Config &config)
{
    if (top.isNull() || bottom.isNull()) {
        return {};
    }

    const int width = std::min(top.width(), bottom.width());
    return scoreCandidates(MatConverter::toBgr(top, width), MatConverter::toBgr(bottom, width),
                           maxOverlap, config);
}

std::vector<OverlapDetector::Candidate> OverlapDetector::scoreCandidates(
    const cv::Mat &topBgr, const cv::Mat &bottomBgr, int maxOverlap, const Config &config)
{
    std::vector<Candidate> candidates;
    if (topBgr.empty() || bottomBgr.empty() || topBgr.cols != bottomBgr.cols) {
        return candidates;
    }

    if (maxOverlap < 0) {
        maxOverlap = defaultMaxOverlap(topBgr.rows, bottomBgr.rows, config);
    }
    const int upperBound = std::min({maxOverlap, topBgr.rows, bottomBgr.rows});
    if (upperBound <= config.minCandidate) {
        return candidates;
    }

    candidates.reserve(static_cast<size_t>(upperBound - config.minCandidate));
    const double samplesPerRow = static_cast<double>(topBgr.cols) * topBgr.channels();

    for (int overlap = config.minCandidate; overlap < upperBound; ++overlap) {
        const double sumSquared = cv::norm(tailRows(topBgr, overlap), headRows(bottomBgr, overlap),
                                           cv::NORM_L2SQR);
        Candidate candidate;
        candidate.overlap = overlap;
        candidate.score = sumSquared / (samplesPerRow * overlap);
        candidates.push_back(candidate);
    }

    return candidates;
}

OverlapMeasurement OverlapDetector::measure(const QImage &top, const QImage &bottom,
                                            int maxOverlap, const Config &config)
{
    if (top.isNull() || bottom.isNull()) {
        return rejected(OverlapReason::InvalidInput, 0, 0.0, 0);
    }

    const int width = std::min(top.width(), bottom.width());
    const cv::Mat topBgr = MatConverter::toBgr(top, width);
    const cv::Mat bottomBgr = MatConverter::toBgr(bottom, width);

    const std::vector<Candidate> candidates = scoreCandidates(topBgr, bottomBgr, maxOverlap, config);
    const int candidateCount = static_cast<int>(candidates.size());
    if (candidates.empty()) {
        return rejected(OverlapReason::NoCandidates, 0, 0.0, 0);
    }

    // Prefer the largest overlap that is good enough. Small overlaps match
    // by accident far more often (a few rows of background look alike).
    int bestOverlap = 0;
    double bestScore = std::numeric_limits<double>::infinity();
    for (auto it = candidates.rbegin(); it != candidates.rend(); ++it) {
        if (it->score < config.scoreThreshold) {
            bestOverlap = it->overlap;
            bestScore = it->score;
            break;
        }
    }

    if (bestOverlap == 0) {
        for (const Candidate &candidate : candidates) {
            if (candidate.score < bestScore) {
                bestScore = candidate.score;
                bestOverlap = candidate.overlap;
            }
        }
    }

    if (bestScore > config.scoreThreshold) {
        return rejected(OverlapReason::ScoreAboveThreshold, bestOverlap, bestScore, candidateCount);
    }

    // Every overlap amount matching about equally well means there is no
    // distinctive overlap, only a uniform-looking region
    if (candidateCount > config.medianCheckMinCandidates) {
        const double median = medianScore(candidates);
        if (bestScore > median * config.medianRatio && bestScore > config.excellentScore) {
            qDebug() << "OverlapDetector: Best score" << bestScore << "close to median" << median;
            return rejected(OverlapReason::IndistinctMinimum, bestOverlap, bestScore, candidateCount);
        }
    }

    const double topVariance = regionVariance(tailRows(topBgr, bestOverlap));
    const double bottomVariance = regionVariance(headRows(bottomBgr, bestOverlap));
    if (topVariance < config.minVariance && bottomVariance < config.minVariance) {
        qDebug() << "OverlapDetector: Blank region detected, variance" << topVariance << bottomVariance;
        return rejected(OverlapReason::LowVariance, bestOverlap, bestScore, candidateCount);
    }

    OverlapMeasurement measurement;
    measurement.overlapPx = bestOverlap;
    measurement.score = bestScore;
    measurement.decision = OverlapDecision::Accepted;
    measurement.reason = OverlapReason::Accepted;
    measurement.candidateCount = candidateCount;
    qDebug() << "OverlapDetector: Detected" << bestOverlap << "px overlap, score=" << bestScore;
    return measurement;
}

int OverlapDetector::detectOverlap(const QImage &top, const QImage &bottom,
                                   int maxOverlap, const Config &config)
{
    return measure(top, bottom, maxOverlap, config).overlapPx;
}

int OverlapDetector::detectOverlap(const Frame &top, const Frame &bottom,
                                   int maxOverlap, const Config &config)
{
    return detectOverlap(top.image, bottom.image, maxOverlap, config);
}
