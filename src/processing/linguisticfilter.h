#ifndef LINGUISTICFILTER_H
#define LINGUISTICFILTER_H

#include "captiontypes.h"

#include <QStringList>

struct FilterResult
{
    TokenList tokens;
    int fillerCount = 0;  // tokens marked as filler candidates
    int emittedCount = 0; // tokens that will produce a word-mode event
};

/**
 * @brief Marks filler words (articles, auxiliaries, interjections) in a token sequence
 *
 * The filter never drops or reorders tokens, it only sets partOfSpeech,
 * isFillerCandidate and active. A filler token keeps its time slot so the
 * smoother still sees the real gaps.
 *
 * Negations ("not", "never", "can't") are classified as adverbs and stay visible.
 *
 * Exceptions that keep a function word visible:
 *  - it is the only function word of a short noun phrase ("the one", "a lot");
 *  - it sits within one token of a preserved idiom ("at the moment", "you know").
 */
class LinguisticFilter
{
public:
    // Pause (seconds) after which a new phrase starts even without punctuation
    static constexpr double PhrasePauseSec = 0.3;

    static FilterResult filter(const TokenList& tokens, bool showFiller);

    static PartOfSpeech classify(const QString& word, bool sentenceStart = true);
    static QString normalize(const QString& text);
    static bool endsClause(const QString& text);
    static bool endsSentence(const QString& text);
    static const QList<QStringList>& idioms();
};

#endif // LINGUISTICFILTER_H
