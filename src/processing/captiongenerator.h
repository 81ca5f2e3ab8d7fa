#ifndef CAPTIONGENERATOR_H
#define CAPTIONGENERATOR_H

#include "jobrecord.h"
#include "stylepreset.h"
#include "subtitletrackbuilder.h"
#include "timingsmoother.h"

struct CaptionLimits
{
    int minFontSizePx = 16;
    int maxFontSizePx = 120;
};

struct CaptionTrackResult
{
    CaptionTrack track;
    TokenList tokens; // filtered and smoothed
    TimingStats stats;
    QStringList warnings;
    CaptionError error;

    bool isOk() const
    {
        return !error.isError();
    }
};

/**
 * @brief The in-core caption pipeline: filter, smooth, build
 *
 * Each stage can be run on its own so the orchestrator can publish a stage
 * boundary between them. A failed stage leaves error() set and makes every
 * following stage a no-op returning false.
 */
class CaptionPipeline
{
public:
    CaptionPipeline(const JobOptions& options, const PresetTable& presets, const CaptionLimits& limits = {},
                    const TimingSmoother::Parameters& smoothing = {});

    bool prepare(const TokenList& tokens, double clipDurationSec);
    bool filter();
    bool smooth();
    bool build();

    const CaptionTrack& track() const
    {
        return m_track;
    }
    const TokenList& tokens() const
    {
        return m_tokens;
    }
    const CaptionError& error() const
    {
        return m_error;
    }
    const QStringList& warnings() const
    {
        return m_warnings;
    }
    const TimingStats& stats() const
    {
        return m_stats;
    }
    const StylePreset* preset() const
    {
        return m_preset;
    }

    static bool validateOptions(const JobOptions& options, const PresetTable& presets, const CaptionLimits& limits,
                                CaptionError& error);
    static bool validateTokens(const TokenList& tokens, CaptionError& error);

private:
    bool fail(CaptionErrorKind kind, const QString& message, const QString& diagnostics = QString());

    JobOptions m_options;
    const PresetTable& m_presets;
    CaptionLimits m_limits;
    TimingSmoother m_smoother;
    const StylePreset* m_preset = nullptr;
    double m_clipDurationSec = 0.0;

    TokenList m_tokens;
    CaptionTrack m_track;
    TimingStats m_stats;
    QStringList m_warnings;
    CaptionError m_error;
    bool m_prepared = false;
};

CaptionTrackResult generateCaptionTrack(const TokenList& tokens, const JobOptions& options, const PresetTable& presets,
                                        double clipDurationSec = 0.0, const CaptionLimits& limits = {});

#endif // CAPTIONGENERATOR_H
