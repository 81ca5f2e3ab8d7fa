#include "captiontypes.h"

QString partOfSpeechToString(PartOfSpeech pos)
{
    switch (pos)
    {
    case PartOfSpeech::Unknown:
        return "unknown";
    case PartOfSpeech::Article:
        return "article";
    case PartOfSpeech::Auxiliary:
        return "auxiliary";
    case PartOfSpeech::Interjection:
        return "interjection";
    case PartOfSpeech::CoordinatingConjunction:
        return "cconj";
    case PartOfSpeech::Pronoun:
        return "pronoun";
    case PartOfSpeech::Noun:
        return "noun";
    case PartOfSpeech::Verb:
        return "verb";
    case PartOfSpeech::Adjective:
        return "adjective";
    case PartOfSpeech::Adverb:
        return "adverb";
    case PartOfSpeech::Other:
        return "other";
    }
    return "other";
}

QString captionModeToString(CaptionMode mode)
{
    return mode == CaptionMode::Words ? "words" : "sentences";
}

CaptionMode captionModeFromString(const QString& value, bool* ok)
{
    const QString normalized = value.trimmed().toLower();
    if (ok)
    {
        *ok = (normalized == "words" || normalized == "sentences");
    }
    return normalized == "words" ? CaptionMode::Words : CaptionMode::Sentences;
}

QString verticalSlotToString(VerticalSlot slot)
{
    return slot == VerticalSlot::Primary ? "primary" : "alternate";
}

QString precisionToString(Precision precision)
{
    return precision == Precision::Enterprise ? "enterprise" : "mvp";
}

Precision precisionFromString(const QString& value, bool* ok)
{
    const QString normalized = value.trimmed().toLower();
    if (ok)
    {
        *ok = (normalized == "enterprise" || normalized == "mvp");
    }
    return normalized == "enterprise" ? Precision::Enterprise : Precision::Mvp;
}
