#include "timingsmoother.h"

#include <algorithm>
#include <limits>

static constexpr double Epsilon = 1e-9;

TimingSmoother::TimingSmoother(const Parameters& params) : m_params(params) {}

QStringList TimingSmoother::smooth(TokenList& tokens, double clipDurationSec) const
{
    QStringList warnings;
    if (tokens.isEmpty())
        return warnings;

    applyMaximumDurations(tokens);
    applyMinimumDurations(tokens);
    if (tokens.size() > 1)
        mergeShortGaps(tokens);
    if (clipDurationSec > 0.0)
        clampToClip(tokens, clipDurationSec, warnings);

    return warnings;
}

void TimingSmoother::applyMaximumDurations(TokenList& tokens) const
{
    if (m_params.maxDurationSec <= 0.0)
        return;
    // a cap below the minimum would fight rule 1
    const double cap = qMax(m_params.maxDurationSec, m_params.minDurationSec);
    for (WordToken& token : tokens)
    {
        if (token.endSec - token.startSec > cap + Epsilon)
            token.endSec = token.startSec + cap;
    }
}

double TimingSmoother::roomToGrow(const WordToken& token) const
{
    if (m_params.maxDurationSec <= 0.0)
        return std::numeric_limits<double>::max();
    const double cap = qMax(m_params.maxDurationSec, m_params.minDurationSec);
    return qMax(0.0, cap - token.duration());
}

void TimingSmoother::applyMinimumDurations(TokenList& tokens) const
{
    for (int i = 0; i < tokens.size(); ++i)
    {
        WordToken& token = tokens[i];
        if (token.endSec - token.startSec < m_params.minDurationSec - Epsilon)
            token.endSec = token.startSec + m_params.minDurationSec;

        if (i + 1 >= tokens.size())
            break;

        WordToken& next = tokens[i + 1];
        if (next.startSec < token.endSec - Epsilon)
        {
            const double previousDuration = next.endSec - next.startSec;
            next.startSec = token.endSec;
            if (next.endSec <= next.startSec + Epsilon)
            {
                // keep what the token had, rule 1 tops it up on the next iteration
                next.endSec = next.startSec + qMax(previousDuration, Epsilon * 10);
            }
        }
    }
}

void TimingSmoother::mergeShortGaps(TokenList& tokens) const
{
    for (int i = 0; i + 1 < tokens.size(); ++i)
    {
        WordToken& current = tokens[i];
        WordToken& next = tokens[i + 1];
        const double gap = next.startSec - current.endSec;
        if (gap > Epsilon && gap < m_params.gapMergeSec - Epsilon)
        {
            const double forCurrent = qMin(gap / 2.0, roomToGrow(current));
            const double forNext = qMin(gap - forCurrent, roomToGrow(next));
            if (forCurrent + forNext < gap - Epsilon)
                continue; // both sides are at the cap, the gap stays
            current.endSec += forCurrent;
            next.startSec = current.endSec;
        }
    }
}

void TimingSmoother::clampToClip(TokenList& tokens, double clipDurationSec, QStringList& warnings) const
{
    const int count = tokens.size();
    int first = -1;
    for (int i = 0; i < count; ++i)
    {
        if (tokens.at(i).endSec > clipDurationSec + Epsilon)
        {
            first = i;
            break;
        }
    }
    if (first < 0)
        return;

    auto windowStart = [&tokens](int index) { return index > 0 ? tokens.at(index - 1).endSec : 0.0; };

    // Grow the block backwards while it has no room at all before the clip end
    while (first > 0 && clipDurationSec - windowStart(first) <= Epsilon)
        --first;

    const double lower = qMin(windowStart(first), clipDurationSec);
    const int blockSize = count - first;
    const double window = clipDurationSec - lower;

    if (window >= blockSize * m_params.minDurationSec - Epsilon)
    {
        double limit = clipDurationSec;
        for (int i = count - 1; i >= first; --i)
        {
            WordToken& token = tokens[i];
            token.endSec = limit;
            token.startSec = qMax(lower, qMin(token.startSec, token.endSec - m_params.minDurationSec));
            limit = token.startSec;
        }
    }
    else
    {
        const double slice = window / blockSize;
        for (int i = first; i < count; ++i)
        {
            WordToken& token = tokens[i];
            token.startSec = lower + slice * (i - first);
            token.endSec = (i == count - 1) ? clipDurationSec : lower + slice * (i - first + 1);
        }
    }

    // the first clamped token must not open a gap shorter than the merge threshold
    WordToken& head = tokens[first];
    const double gap = head.startSec - lower;
    if (first > 0 && gap > Epsilon && gap < m_params.gapMergeSec - Epsilon && roomToGrow(head) >= gap - Epsilon)
        head.startSec = lower;

    for (int i = first; i < count; ++i)
    {
        const WordToken& token = tokens.at(i);
        if (token.duration() < m_params.minDurationSec - Epsilon)
        {
            warnings << QString("'%1' shortened to %2 s to fit the clip end at %3 s")
                            .arg(token.text)
                            .arg(token.duration(), 0, 'f', 3)
                            .arg(clipDurationSec, 0, 'f', 3);
        }
    }
}

bool TimingSmoother::isOrdered(const TokenList& tokens, QString* offending)
{
    for (int i = 0; i < tokens.size(); ++i)
    {
        const WordToken& token = tokens.at(i);
        if (!(token.endSec > token.startSec))
        {
            if (offending)
                *offending = QString("'%1' has non-positive duration [%2, %3]")
                                 .arg(token.text)
                                 .arg(token.startSec)
                                 .arg(token.endSec);
            return false;
        }
        if (i > 0 && token.startSec < tokens.at(i - 1).endSec - Epsilon)
        {
            if (offending)
                *offending = QString("'%1' starts at %2 before '%3' ends at %4")
                                 .arg(token.text)
                                 .arg(token.startSec)
                                 .arg(tokens.at(i - 1).text)
                                 .arg(tokens.at(i - 1).endSec);
            return false;
        }
    }
    return true;
}

TimingStats TimingSmoother::computeStats(const TokenList& tokens)
{
    TimingStats stats;
    stats.wordCount = tokens.size();
    if (tokens.isEmpty())
        return stats;

    QList<double> durations;
    durations.reserve(tokens.size());
    double durationSum = 0.0;
    double gapSum = 0.0;

    for (int i = 0; i < tokens.size(); ++i)
    {
        const WordToken& token = tokens.at(i);
        if (token.active)
            ++stats.activeCount;
        durations << token.duration();
        durationSum += token.duration();

        if (i > 0)
        {
            const double gap = token.startSec - tokens.at(i - 1).endSec;
            if (gap > Epsilon)
            {
                ++stats.gapCount;
                gapSum += gap;
                stats.maxGapSec = qMax(stats.maxGapSec, gap);
            }
        }
    }

    std::sort(durations.begin(), durations.end());
    stats.minDurationSec = durations.first();
    stats.maxDurationSec = durations.last();
    stats.meanDurationSec = durationSum / durations.size();
    const int mid = durations.size() / 2;
    stats.medianDurationSec = durations.size() % 2 ? durations.at(mid) : (durations.at(mid - 1) + durations.at(mid)) / 2.0;
    if (stats.gapCount > 0)
        stats.meanGapSec = gapSum / stats.gapCount;

    stats.totalSpanSec = tokens.last().endSec - tokens.first().startSec;
    if (stats.totalSpanSec > 0.0)
        stats.wordsPerSecond = stats.activeCount / stats.totalSpanSec;

    if (stats.wordsPerSecond > 3.5)
        stats.difficulty = "Very Hard";
    else if (stats.wordsPerSecond > 2.5)
        stats.difficulty = "Hard";
    else if (stats.wordsPerSecond > 1.5)
        stats.difficulty = "Medium";
    else
        stats.difficulty = "Easy";

    return stats;
}

QString TimingStats::summary() const
{
    return QString("%1 words (%2 shown), duration min %3 s / median %4 s / max %5 s, "
                   "%6 gaps (max %7 s), %8 words/s, reading: %9")
        .arg(wordCount)
        .arg(activeCount)
        .arg(minDurationSec, 0, 'f', 2)
        .arg(medianDurationSec, 0, 'f', 2)
        .arg(maxDurationSec, 0, 'f', 2)
        .arg(gapCount)
        .arg(maxGapSec, 0, 'f', 2)
        .arg(wordsPerSecond, 0, 'f', 1)
        .arg(difficulty);
}
