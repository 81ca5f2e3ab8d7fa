#include "linguisticfilter.h"

#include <QHash>
#include <QSet>

static const QSet<QString>& articles()
{
    static const QSet<QString> set = {"a", "an", "the"};
    return set;
}

static const QSet<QString>& auxiliaries()
{
    static const QSet<QString> set = {"am",    "is",     "are",   "was",   "were",  "be",    "been",
                                      "being", "do",     "does",  "did",   "have",  "has",   "had",
                                      "will",  "would",  "shall", "should", "can",  "could", "may",
                                      "might", "must"};
    return set;
}

static const QSet<QString>& negations()
{
    static const QSet<QString> set = {"not", "no", "never", "none", "neither", "cannot"};
    return set;
}

// "can't", "don't", "isn't": the negation carries the meaning, never filler
static bool isNegation(const QString& norm)
{
    return negations().contains(norm) || norm.endsWith("n't");
}

static const QSet<QString>& interjections()
{
    static const QSet<QString> set = {"um",   "umm", "uh",   "uhm", "uh-huh", "erm", "er",
                                      "ah",   "ahh", "oh",   "hmm", "hm",     "mm",  "mhm",
                                      "yeah", "ok",  "okay", "wow", "huh",    "eh",  "oops"};
    return set;
}

static const QSet<QString>& conjunctions()
{
    static const QSet<QString> set = {"and", "but", "or", "nor", "so", "yet"};
    return set;
}

static const QSet<QString>& pronouns()
{
    static const QSet<QString> set = {
        "i",       "me",       "my",        "mine",      "myself",   "you",      "your",     "yours",
        "yourself", "he",      "him",       "his",       "himself",  "she",      "her",      "hers",
        "herself", "it",       "its",       "itself",    "we",       "us",       "our",      "ours",
        "ourselves", "they",   "them",      "their",     "theirs",   "themselves", "this",   "that",
        "these",   "those",    "who",       "whom",      "whose",    "which",    "what",     "someone",
        "something", "everyone", "everything", "anyone", "anything", "nobody",   "nothing",  "i'm",
        "you're",  "he's",     "she's",     "it's",      "we're",    "they're",  "i've",     "you've",
        "we've",   "they've",  "i'll",      "you'll",    "he'll",    "she'll",   "we'll",    "they'll",
        "i'd",     "you'd",    "he'd",      "she'd",     "we'd",     "they'd",   "that's",   "there's",
        "what's"};
    return set;
}

static const QSet<QString>& numberWords()
{
    static const QSet<QString> set = {"zero",     "one",     "two",      "three",   "four",    "five",
                                      "six",      "seven",   "eight",    "nine",    "ten",     "eleven",
                                      "twelve",   "thirteen", "fourteen", "fifteen", "sixteen", "seventeen",
                                      "eighteen", "nineteen", "twenty",  "thirty",  "forty",   "fifty",
                                      "hundred",  "thousand", "million", "billion"};
    return set;
}

static bool hasSuffix(const QString& word, const QStringList& suffixes, int minStem)
{
    for (const QString& suffix : suffixes)
    {
        if (word.size() >= suffix.size() + minStem && word.endsWith(suffix))
            return true;
    }
    return false;
}

static bool isNumeric(const QString& word)
{
    bool hasDigit = false;
    for (const QChar& ch : word)
    {
        if (ch.isDigit())
            hasDigit = true;
        else if (ch != '.' && ch != ',' && ch != '%' && ch != '$')
            return false;
    }
    return hasDigit;
}

static bool isFunctionWord(PartOfSpeech pos)
{
    return pos == PartOfSpeech::Article || pos == PartOfSpeech::Auxiliary || pos == PartOfSpeech::Interjection;
}

static bool isNominal(PartOfSpeech pos)
{
    return pos == PartOfSpeech::Noun || pos == PartOfSpeech::Pronoun || pos == PartOfSpeech::Adjective ||
           pos == PartOfSpeech::Other;
}

QString LinguisticFilter::normalize(const QString& text)
{
    QString word = text.toLower();
    word.replace(QChar(0x2019), '\''); // typographic apostrophe
    int begin = 0;
    int end = word.size();
    while (begin < end && !word.at(begin).isLetterOrNumber())
        ++begin;
    while (end > begin && !word.at(end - 1).isLetterOrNumber())
        --end;
    return word.mid(begin, end - begin);
}

bool LinguisticFilter::endsClause(const QString& text)
{
    const QString trimmed = text.trimmed();
    if (trimmed.isEmpty())
        return false;
    static const QString clausePunctuation = QStringLiteral(",.!?;:…");
    return clausePunctuation.contains(trimmed.back());
}

bool LinguisticFilter::endsSentence(const QString& text)
{
    QString trimmed = text.trimmed();
    // closing quotes and brackets after the terminator: "done." / (really?)
    while (!trimmed.isEmpty() && QStringLiteral("\"')]”").contains(trimmed.back()))
        trimmed.chop(1);
    if (trimmed.isEmpty())
        return false;
    static const QString sentencePunctuation = QStringLiteral(".!?…");
    return sentencePunctuation.contains(trimmed.back());
}

PartOfSpeech LinguisticFilter::classify(const QString& word, bool sentenceStart)
{
    const QString norm = normalize(word);
    if (norm.isEmpty())
        return PartOfSpeech::Other;

    if (isNegation(norm))
        return PartOfSpeech::Adverb;
    if (articles().contains(norm))
        return PartOfSpeech::Article;
    if (auxiliaries().contains(norm))
        return PartOfSpeech::Auxiliary;
    if (interjections().contains(norm))
        return PartOfSpeech::Interjection;
    if (conjunctions().contains(norm))
        return PartOfSpeech::CoordinatingConjunction;
    if (pronouns().contains(norm))
        return PartOfSpeech::Pronoun;
    if (numberWords().contains(norm) || isNumeric(norm))
        return PartOfSpeech::Noun;

    // proper nouns in running text
    const QString stripped = word.trimmed();
    if (!sentenceStart && !stripped.isEmpty())
    {
        int first = 0;
        while (first < stripped.size() && !stripped.at(first).isLetter())
            ++first;
        if (first < stripped.size() && stripped.at(first).isUpper())
            return PartOfSpeech::Noun;
    }

    static const QStringList nounSuffixes = {"tion", "sion", "ness", "ment", "ity",  "ship",
                                             "ism",  "ist",  "ance", "ence", "hood", "dom"};
    static const QStringList adjectiveSuffixes = {"ous", "ful", "ive", "able", "ible", "less", "ish", "ical", "ic"};
    static const QStringList adverbSuffixes = {"ly"};
    static const QStringList verbSuffixes = {"ing", "ed", "ize", "ise", "ify"};

    if (hasSuffix(norm, nounSuffixes, 3))
        return PartOfSpeech::Noun;
    if (hasSuffix(norm, adjectiveSuffixes, 3))
        return PartOfSpeech::Adjective;
    if (hasSuffix(norm, adverbSuffixes, 3))
        return PartOfSpeech::Adverb;
    if (hasSuffix(norm, verbSuffixes, 2))
        return PartOfSpeech::Verb;

    return PartOfSpeech::Other;
}

const QList<QStringList>& LinguisticFilter::idioms()
{
    static const QList<QStringList> list = {
        {"a", "lot"},     {"a", "bit"},        {"a", "little"},      {"a", "few"},      {"the", "end"},
        {"the", "one"},   {"the", "same"},     {"at", "the", "moment"}, {"at", "the", "end"}, {"kind", "of"},
        {"sort", "of"},   {"you", "know"},     {"i", "mean"},        {"of", "course"},  {"by", "the", "way"},
        {"have", "to"},   {"has", "to"},       {"had", "to"},        {"in", "a", "way"}, {"thank", "you"},
        {"oh", "my", "god"}, {"all", "the", "time"}};
    return list;
}

FilterResult LinguisticFilter::filter(const TokenList& tokens, bool showFiller)
{
    FilterResult result;
    result.tokens = tokens;
    TokenList& out = result.tokens;
    const int count = out.size();
    if (count == 0)
        return result;

    QStringList norms;
    norms.reserve(count);
    QList<int> phraseOf(count, 0);
    int phrase = 0;

    for (int i = 0; i < count; ++i)
    {
        WordToken& token = out[i];
        norms << normalize(token.text);

        const bool sentenceStart = (i == 0) || endsSentence(out.at(i - 1).text);
        if (token.partOfSpeech == PartOfSpeech::Unknown)
            token.partOfSpeech = classify(token.text, sentenceStart);

        if (i > 0 && (endsClause(out.at(i - 1).text) || token.startSec - out.at(i - 1).endSec >= PhrasePauseSec))
            ++phrase;
        phraseOf[i] = phrase;
    }

    // Idioms protect their own tokens and one neighbour on each side
    QList<bool> protectedToken(count, false);
    for (const QStringList& idiom : idioms())
    {
        const int len = idiom.size();
        for (int i = 0; i + len <= count; ++i)
        {
            bool match = true;
            for (int k = 0; k < len && match; ++k)
                match = norms.at(i + k) == idiom.at(k);
            if (!match)
                continue;
            for (int k = qMax(0, i - 1); k <= qMin(count - 1, i + len); ++k)
                protectedToken[k] = true;
        }
    }

    QHash<int, QList<int>> phraseMembers;
    for (int i = 0; i < count; ++i)
        phraseMembers[phraseOf.at(i)].append(i);

    for (int i = 0; i < count; ++i)
    {
        WordToken& token = out[i];
        bool candidate = isFunctionWord(token.partOfSpeech) && !protectedToken.at(i);

        if (candidate && token.partOfSpeech == PartOfSpeech::Article)
        {
            // "the one", "a lot": a determiner heading a two-word phrase stays
            const QList<int>& members = phraseMembers.value(phraseOf.at(i));
            if (members.size() == 2 && members.first() == i && isNominal(out.at(members.last()).partOfSpeech))
                candidate = false;
        }

        token.isFillerCandidate = candidate;
        token.active = !candidate;
        if (candidate)
            ++result.fillerCount;
    }

    result.emittedCount = showFiller ? count : count - result.fillerCount;
    return result;
}
