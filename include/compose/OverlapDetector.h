#ifndef OVERLAPDETECTOR_H
#define OVERLAPDETECTOR_H

#include "compose/CompositionTypes.h"
#include "compose/Frame.h"

#include <QImage>

#include <vector>

namespace cv {
    class Mat;
}

/**
 * @brief Estimates duplicated rows between two vertically adjacent captures
 *
 * Compares the bottom k rows of the upper image with the top k rows of the
 * lower image for every candidate k and scores each by mean squared error
 * over the RGB channels. The selection favours the largest plausible overlap
 * and rejects matches that look accidental:
 * - score above the acceptance threshold
 * - best score not clearly separated from the median score
 * - near-solid rows on both sides (blank background matching blank background)
 *
 * A rejected pair reports overlapPx = 0, which callers treat as "stack flush".
 *
 * Pure algorithm class (no state, unit-testable).
 */
class OverlapDetector
{
public:
    struct Config {
        int minCandidate = 10;             // Smallest overlap tried
        double maxOverlapRatio = 0.95;     // Default max overlap, fraction of min height
        double scoreThreshold = 2000.0;    // MSE below this is "good enough"
        int medianCheckMinCandidates = 5;  // Median test needs more candidates than this
        double medianRatio = 0.5;          // Best must be below medianRatio * median...
        double excellentScore = 50.0;      // ...unless it is at most this
        double minVariance = 10.0;         // Rows below this on both sides are blank
    };

    struct Candidate {
        int overlap = 0;
        double score = 0.0;
    };

    // Returns the accepted overlap in rows, or 0 when no confident overlap exists.
    // maxOverlap < 0 selects the default (maxOverlapRatio of the shorter image).
    static int detectOverlap(const QImage &top, const QImage &bottom,
                             int maxOverlap = -1, const Config &config = Config());
    static int detectOverlap(const Frame &top, const Frame &bottom,
                             int maxOverlap = -1, const Config &config = Config());

    // Full decision record for one adjacent pair
    static OverlapMeasurement measure(const QImage &top, const QImage &bottom,
                                      int maxOverlap = -1, const Config &config = Config());

    // Scores for every candidate overlap in ascending order
    static std::vector<Candidate> scoreCandidates(const QImage &top, const QImage &bottom,
                                                  int maxOverlap = -1,
                                                  const Config &config = Config());

private:
    static std::vector<Candidate> scoreCandidates(const cv::Mat &topBgr, const cv::Mat &bottomBgr,
                                                  int maxOverlap, const Config &config);
    static int defaultMaxOverlap(int topHeight, int bottomHeight, const Config &config);
    static double regionVariance(const cv::Mat &region);
    static double medianScore(const std::vector<Candidate> &candidates);
};

#endif // OVERLAPDETECTOR_H
