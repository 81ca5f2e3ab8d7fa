#include "captiongenerator.h"

#include "linguisticfilter.h"

#include <cmath>

CaptionPipeline::CaptionPipeline(const JobOptions& options, const PresetTable& presets, const CaptionLimits& limits,
                                 const TimingSmoother::Parameters& smoothing)
    : m_options(options), m_presets(presets), m_limits(limits), m_smoother(smoothing)
{
}

bool CaptionPipeline::fail(CaptionErrorKind kind, const QString& message, const QString& diagnostics)
{
    m_error = CaptionError::make(kind, message, diagnostics);
    return false;
}

bool CaptionPipeline::validateOptions(const JobOptions& options, const PresetTable& presets,
                                      const CaptionLimits& limits, CaptionError& error)
{
    if (!presets.find(options.presetId))
    {
        error = CaptionError::make(CaptionErrorKind::ConfigurationInvalid,
                                   QString("Unknown caption preset '%1'").arg(options.presetId),
                                   "available: " + presets.ids().join(", "));
        return false;
    }
    if (options.fontSizePx < limits.minFontSizePx || options.fontSizePx > limits.maxFontSizePx)
    {
        error = CaptionError::make(
            CaptionErrorKind::ConfigurationInvalid,
            QString("Font size %1 px is outside %2..%3 px")
                .arg(options.fontSizePx)
                .arg(limits.minFontSizePx)
                .arg(limits.maxFontSizePx));
        return false;
    }
    return true;
}

bool CaptionPipeline::validateTokens(const TokenList& tokens, CaptionError& error)
{
    if (tokens.isEmpty())
    {
        error = CaptionError::make(CaptionErrorKind::InputMalformed, "Transcript contains no words");
        return false;
    }

    for (int i = 0; i < tokens.size(); ++i)
    {
        const WordToken& token = tokens.at(i);
        const QString where = QString("token #%1 '%2' [%3, %4]").arg(i).arg(token.text).arg(token.startSec).arg(token.endSec);

        if (!std::isfinite(token.startSec) || !std::isfinite(token.endSec) || token.startSec < 0.0)
        {
            error = CaptionError::make(CaptionErrorKind::InputMalformed, "Transcript has an invalid timestamp", where);
            return false;
        }
        if (!(token.startSec < token.endSec))
        {
            error = CaptionError::make(CaptionErrorKind::InputMalformed, "Transcript word has no duration", where);
            return false;
        }
        if (i > 0 && token.startSec < tokens.at(i - 1).startSec)
        {
            error = CaptionError::make(CaptionErrorKind::InputMalformed, "Transcript words are not time-ordered", where);
            return false;
        }
    }
    return true;
}

bool CaptionPipeline::prepare(const TokenList& tokens, double clipDurationSec)
{
    m_error = CaptionError();
    m_warnings.clear();
    m_prepared = false;

    if (!validateOptions(m_options, m_presets, m_limits, m_error))
        return false;
    if (!validateTokens(tokens, m_error))
        return false;

    m_preset = m_presets.find(m_options.presetId);
    m_clipDurationSec = clipDurationSec;
    m_tokens = tokens;
    // freeze the ingested timing, sentence grouping reads it after smoothing
    for (WordToken& token : m_tokens)
    {
        token.rawStartSec = token.startSec;
        token.rawEndSec = token.endSec;
    }
    m_prepared = true;
    return true;
}

bool CaptionPipeline::filter()
{
    if (!m_prepared || m_error.isError())
        return false;

    // sentence captions keep every word
    if (m_options.captionMode == CaptionMode::Sentences)
        return true;

    const FilterResult result = LinguisticFilter::filter(m_tokens, m_options.showFillerWords);
    if (result.tokens.size() != m_tokens.size())
    {
        return fail(CaptionErrorKind::InternalInvariantViolation, "Linguistic filter changed the token count",
                    QString("%1 -> %2").arg(m_tokens.size()).arg(result.tokens.size()));
    }
    m_tokens = result.tokens;
    if (result.emittedCount == 0)
        m_warnings << "Every word was classified as filler, the caption track will be empty";
    return true;
}

bool CaptionPipeline::smooth()
{
    if (!m_prepared || m_error.isError())
        return false;

    m_warnings << m_smoother.smooth(m_tokens, m_clipDurationSec);

    QString offending;
    if (!TimingSmoother::isOrdered(m_tokens, &offending))
        return fail(CaptionErrorKind::InternalInvariantViolation, "Timing smoother broke token order", offending);

    m_stats = TimingSmoother::computeStats(m_tokens);
    return true;
}

bool CaptionPipeline::build()
{
    if (!m_prepared || m_error.isError())
        return false;

    return SubtitleTrackBuilder::build(m_tokens, m_options.captionMode, m_options.showFillerWords, *m_preset,
                                       m_options.fontSizePx, m_track, m_error);
}

CaptionTrackResult generateCaptionTrack(const TokenList& tokens, const JobOptions& options, const PresetTable& presets,
                                        double clipDurationSec, const CaptionLimits& limits)
{
    CaptionTrackResult result;
    CaptionPipeline pipeline(options, presets, limits);

    const bool ok = pipeline.prepare(tokens, clipDurationSec) && pipeline.filter() && pipeline.smooth() &&
                    pipeline.build();

    result.tokens = pipeline.tokens();
    result.warnings = pipeline.warnings();
    result.error = pipeline.error();
    if (ok)
    {
        result.track = pipeline.track();
        result.stats = pipeline.stats();
    }
    return result;
}
