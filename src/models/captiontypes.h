#ifndef CAPTIONTYPES_H
#define CAPTIONTYPES_H

#include <QList>
#include <QMetaType>
#include <QString>

enum class PartOfSpeech
{
    Unknown, // not classified yet, the linguistic filter fills it in
    Article,
    Auxiliary,
    Interjection,
    CoordinatingConjunction,
    Pronoun,
    Noun,
    Verb,
    Adjective,
    Adverb,
    Other
};

enum class CaptionMode
{
    Sentences,
    Words
};

enum class VerticalSlot
{
    Primary,
    Alternate
};

// mvp: ASR timestamps are used as is, enterprise: a forced aligner refines them
enum class Precision
{
    Mvp,
    Enterprise
};

/**
 * @brief One recognized word flowing through every pipeline stage
 *
 * text, confidence and the raw timing are fixed once the token enters the
 * caption pipeline. startSec/endSec are adjusted in place by the timing smoother,
 * isFillerCandidate/active are set once by the linguistic filter.
 */
struct WordToken
{
    QString text;
    double startSec = 0.0;
    double endSec = 0.0;
    double rawStartSec = 0.0;
    double rawEndSec = 0.0;
    double confidence = 1.0;
    PartOfSpeech partOfSpeech = PartOfSpeech::Unknown;
    bool isFillerCandidate = false;
    bool active = true;

    double duration() const
    {
        return endSec - startSec;
    }

    static WordToken make(const QString& text, double startSec, double endSec, double confidence = 1.0)
    {
        WordToken token;
        token.text = text;
        token.startSec = startSec;
        token.endSec = endSec;
        token.rawStartSec = startSec;
        token.rawEndSec = endSec;
        token.confidence = confidence;
        return token;
    }
};

using TokenList = QList<WordToken>;

/**
 * @brief One renderable caption unit: a whole sentence or a single karaoke word
 *
 * The active window is the span during which the renderer highlights the text.
 */
struct CaptionEvent
{
    double startSec = 0.0;
    double endSec = 0.0;
    QString displayText;
    QString styleId;
    bool isEmphasized = false;
    VerticalSlot verticalSlot = VerticalSlot::Primary;
    double activeStartSec = 0.0;
    double activeEndSec = 0.0;
};

QString partOfSpeechToString(PartOfSpeech pos);
QString captionModeToString(CaptionMode mode);
CaptionMode captionModeFromString(const QString& value, bool* ok = nullptr);
QString verticalSlotToString(VerticalSlot slot);
QString precisionToString(Precision precision);
Precision precisionFromString(const QString& value, bool* ok = nullptr);

Q_DECLARE_METATYPE(WordToken)
Q_DECLARE_METATYPE(CaptionEvent)

#endif // CAPTIONTYPES_H
