#ifndef TIMINGSMOOTHER_H
#define TIMINGSMOOTHER_H

#include "captiontypes.h"

#include <QStringList>

struct TimingStats
{
    int wordCount = 0;
    int activeCount = 0;
    double minDurationSec = 0.0;
    double maxDurationSec = 0.0;
    double meanDurationSec = 0.0;
    double medianDurationSec = 0.0;
    int gapCount = 0; // gaps strictly between consecutive tokens
    double meanGapSec = 0.0;
    double maxGapSec = 0.0;
    double totalSpanSec = 0.0;
    double wordsPerSecond = 0.0; // active words over the whole span
    QString difficulty = "Easy";

    QString summary() const;
};

/**
 * @brief Adjusts word timing for readability
 *
 * Rules, applied in this order:
 *  0. no token lasts longer than maxDurationSec (ASR stretches words over silence);
 *  1. every token lasts at least minDurationSec, the earlier token wins an overlap
 *     and pushes its successor;
 *  2. gaps shorter than gapMergeSec are closed at their midpoint, a side already
 *     at maxDurationSec leaves the rest of the gap to its neighbour;
 *  3. no token ends after the clip. Tokens that overrun are pulled back
 *     as one block without breaking order. If the clip leaves less than the
 *     minimum, the shorter duration is accepted and reported as a warning.
 *
 * Only startSec/endSec are touched. Smoothing smoothed output changes nothing.
 */
class TimingSmoother
{
public:
    struct Parameters
    {
        double minDurationSec = 0.45;
        double gapMergeSec = 0.10;
        double maxDurationSec = 1.5; // <= 0 disables the cap
    };

    TimingSmoother() = default;
    explicit TimingSmoother(const Parameters& params);

    // clipDurationSec <= 0 disables the clip clamp. Returns warnings, if any.
    QStringList smooth(TokenList& tokens, double clipDurationSec) const;

    const Parameters& parameters() const
    {
        return m_params;
    }

    static bool isOrdered(const TokenList& tokens, QString* offending = nullptr);
    static TimingStats computeStats(const TokenList& tokens);

private:
    void applyMaximumDurations(TokenList& tokens) const;
    void applyMinimumDurations(TokenList& tokens) const;
    double roomToGrow(const WordToken& token) const;
    void mergeShortGaps(TokenList& tokens) const;
    void clampToClip(TokenList& tokens, double clipDurationSec, QStringList& warnings) const;

    Parameters m_params;
};

#endif // TIMINGSMOOTHER_H
