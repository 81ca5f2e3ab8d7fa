#ifndef SUBTITLETRACKBUILDER_H
#define SUBTITLETRACKBUILDER_H

#include "captionerror.h"
#include "captiontypes.h"
#include "stylepreset.h"
#include "styleresolver.h"

struct CaptionTrack
{
    CaptionMode mode = CaptionMode::Words;
    QList<CaptionEvent> events;
    QList<AssStyle> styles;
    StylePreset preset;
};

// Readability caps for one sentence-mode line
struct SentenceLimits
{
    int maxWords = 6;
    double maxDurationSec = 3.5;
};

/**
 * @brief Projects filtered and smoothed tokens onto caption events
 *
 * Word mode emits one event per visible token, sentence mode groups tokens at
 * sentence-final punctuation or long pauses (measured on the raw ASR timing),
 * and breaks a line early once it reaches the word or duration cap.
 * The result is validated before it is handed out: either a complete track or
 * an InternalInvariantViolation, never a partial track.
 */
class SubtitleTrackBuilder
{
public:
    static constexpr double SentencePauseSec = 0.6;

    static bool build(const TokenList& tokens, CaptionMode mode, bool showFiller, const StylePreset& preset,
                      int fontSizePx, CaptionTrack& track, CaptionError& error,
                      const SentenceLimits& limits = SentenceLimits());

    static bool validate(const QList<CaptionEvent>& events, QString* offending = nullptr);

    // Inverse of build() for word tracks: visible words in emission order
    static QStringList regroupWords(const CaptionTrack& track);

private:
    static QList<CaptionEvent> buildWordEvents(const TokenList& tokens, bool showFiller, StyleResolver& resolver);
    static QList<CaptionEvent> buildSentenceEvents(const TokenList& tokens, const SentenceLimits& limits,
                                                   StyleResolver& resolver);
};

#endif // SUBTITLETRACKBUILDER_H
