#ifndef TRANSCRIPTPARSER_H
#define TRANSCRIPTPARSER_H

#include "captiontypes.h"

#include <QByteArray>
#include <QString>

struct AlignmentStats
{
    int alignerWords = 0;  // words reported by the aligner
    int alignedTokens = 0; // tokens whose timing was replaced
    int repairedTokens = 0;

    double rate(int tokenCount) const
    {
        return tokenCount > 0 ? static_cast<double>(alignedTokens) / tokenCount : 0.0;
    }
};

/**
 * @brief Turns recognizer and aligner JSON into WordTokens
 *
 * Two ASR dialects are understood:
 *  - whisper.cpp (-oj): transcription[] with offsets in milliseconds;
 *  - OpenAI style: segments[].words[] with start/end in seconds.
 * Segments without per-word timing are split evenly across their words.
 */
class TranscriptParser
{
public:
    static constexpr double UnalignedConfidence = 0.5;

    static bool parseAsrJson(const QByteArray& data, TokenList& tokens, QString* error = nullptr);
    static bool parseAsrFile(const QString& path, TokenList& tokens, QString* error = nullptr);

    // Gentle output: words[] {word, case, start, end}. Matching is positional with a short lookahead.
    static bool applyAlignment(const QByteArray& data, TokenList& tokens, AlignmentStats* stats = nullptr,
                               QString* error = nullptr);
    static bool applyAlignmentFile(const QString& path, TokenList& tokens, AlignmentStats* stats = nullptr,
                                   QString* error = nullptr);

    static QString transcriptText(const TokenList& tokens);

private:
    static void appendSegment(const QString& text, double startSec, double endSec, double confidence,
                              TokenList& tokens);
    static bool isNonSpeechMarker(const QString& text);
};

#endif // TRANSCRIPTPARSER_H
