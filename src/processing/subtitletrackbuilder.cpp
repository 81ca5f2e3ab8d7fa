#include "subtitletrackbuilder.h"

#include "linguisticfilter.h"

static constexpr double Epsilon = 1e-9;

bool SubtitleTrackBuilder::build(const TokenList& tokens, CaptionMode mode, bool showFiller, const StylePreset& preset,
                                 int fontSizePx, CaptionTrack& track, CaptionError& error,
                                 const SentenceLimits& limits)
{
    StyleResolver resolver(preset, mode, fontSizePx);

    QList<CaptionEvent> events = mode == CaptionMode::Words ? buildWordEvents(tokens, showFiller, resolver)
                                                            : buildSentenceEvents(tokens, limits, resolver);

    QString offending;
    if (!validate(events, &offending))
    {
        error = CaptionError::make(CaptionErrorKind::InternalInvariantViolation,
                                   "Caption events are not strictly time-ordered", offending);
        return false;
    }

    CaptionTrack result;
    result.mode = mode;
    result.events = events;
    result.styles = resolver.styleSheet();
    result.preset = preset;
    result.preset.fontSizePx = fontSizePx > 0 ? fontSizePx : preset.fontSizePx;
    track = result;
    return true;
}

QList<CaptionEvent> SubtitleTrackBuilder::buildWordEvents(const TokenList& tokens, bool showFiller,
                                                          StyleResolver& resolver)
{
    QList<CaptionEvent> events;
    for (const WordToken& token : tokens)
    {
        if (!token.active && !showFiller)
            continue;

        const ResolvedStyle style = resolver.resolve(token);
        CaptionEvent event;
        event.startSec = token.startSec;
        event.endSec = token.endSec;
        event.displayText = token.text.trimmed();
        event.styleId = style.styleId;
        event.isEmphasized = style.isEmphasized;
        event.verticalSlot = resolver.nextSlot();
        event.activeStartSec = token.startSec;
        event.activeEndSec = token.endSec;
        events << event;
    }
    return events;
}

QList<CaptionEvent> SubtitleTrackBuilder::buildSentenceEvents(const TokenList& tokens, const SentenceLimits& limits,
                                                              StyleResolver& resolver)
{
    QList<CaptionEvent> events;
    QStringList words;
    int first = -1;

    auto flush = [&](int last) {
        if (first < 0 || words.isEmpty())
            return;
        const ResolvedStyle style = resolver.resolve(tokens.at(first));
        CaptionEvent event;
        event.startSec = tokens.at(first).startSec;
        event.endSec = tokens.at(last).endSec;
        event.displayText = words.join(' ');
        event.styleId = style.styleId;
        event.isEmphasized = style.isEmphasized;
        event.verticalSlot = resolver.nextSlot();
        event.activeStartSec = event.startSec;
        event.activeEndSec = event.endSec;
        events << event;
        words.clear();
        first = -1;
    };

    for (int i = 0; i < tokens.size(); ++i)
    {
        const WordToken& token = tokens.at(i);
        // pauses are judged on the ASR timing, smoothing may have closed them
        if (first >= 0 && token.rawStartSec - tokens.at(i - 1).rawEndSec >= SentencePauseSec - Epsilon)
            flush(i - 1);
        // this word would stretch the line past the duration cap
        if (first >= 0 && limits.maxDurationSec > 0 &&
            token.endSec - tokens.at(first).startSec > limits.maxDurationSec + Epsilon)
            flush(i - 1);

        const QString text = token.text.trimmed();
        if (text.isEmpty())
            continue;
        if (first < 0)
            first = i;
        words << text;

        if (LinguisticFilter::endsSentence(text) || (limits.maxWords > 0 && words.size() >= limits.maxWords))
            flush(i);
    }
    if (!tokens.isEmpty())
        flush(tokens.size() - 1);

    return events;
}

bool SubtitleTrackBuilder::validate(const QList<CaptionEvent>& events, QString* offending)
{
    double lastEnd[2] = {-1.0, -1.0};
    double lastStart = -1.0;

    for (int i = 0; i < events.size(); ++i)
    {
        const CaptionEvent& event = events.at(i);
        const int slot = event.verticalSlot == VerticalSlot::Primary ? 0 : 1;

        QString problem;
        if (!(event.endSec > event.startSec))
            problem = "non-positive duration";
        else if (i > 0 && !(event.startSec > lastStart))
            problem = "does not start after the previous event";
        else if (event.startSec < lastEnd[slot] - Epsilon)
            problem = QString("overlaps the previous %1 event").arg(verticalSlotToString(event.verticalSlot));

        if (!problem.isEmpty())
        {
            if (offending)
                *offending = QString("event #%1 '%2' [%3, %4]: %5")
                                 .arg(i)
                                 .arg(event.displayText)
                                 .arg(event.startSec)
                                 .arg(event.endSec)
                                 .arg(problem);
            return false;
        }
        lastStart = event.startSec;
        lastEnd[slot] = event.endSec;
    }
    return true;
}

QStringList SubtitleTrackBuilder::regroupWords(const CaptionTrack& track)
{
    QStringList words;
    for (const CaptionEvent& event : track.events)
    {
        if (track.mode == CaptionMode::Words)
            words << event.displayText;
        else
            words << event.displayText.split(' ', Qt::SkipEmptyParts);
    }
    return words;
}
