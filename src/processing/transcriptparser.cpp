#include "transcriptparser.h"

#include "linguisticfilter.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QRegularExpression>

static constexpr double MinimumWordSec = 0.01;
static constexpr int AlignmentLookahead = 3;

static bool readFile(const QString& path, QByteArray& data, QString* error)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly))
    {
        if (error)
            *error = QString("cannot open %1: %2").arg(path, file.errorString());
        return false;
    }
    data = file.readAll();
    return true;
}

static bool parseObject(const QByteArray& data, QJsonObject& root, QString* error)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    if (doc.isNull() || !doc.isObject())
    {
        if (error)
            *error = doc.isNull() ? parseError.errorString() : "top-level JSON value is not an object";
        return false;
    }
    root = doc.object();
    return true;
}

bool TranscriptParser::isNonSpeechMarker(const QString& text)
{
    // [BLANK_AUDIO], [Music], (laughs), *applause*
    static const QRegularExpression markerRe(R"(^\s*(\[[^\]]*\]|\([^)]*\)|\*[^*]*\*)\s*$)");
    return markerRe.match(text).hasMatch();
}

void TranscriptParser::appendSegment(const QString& text, double startSec, double endSec, double confidence,
                                     TokenList& tokens)
{
    if (isNonSpeechMarker(text))
        return;

    const QStringList words = text.split(QRegularExpression("\\s+"), Qt::SkipEmptyParts);
    if (words.isEmpty())
        return;

    if (endSec <= startSec)
        endSec = startSec + MinimumWordSec * words.size();

    const double step = (endSec - startSec) / words.size();
    for (int i = 0; i < words.size(); ++i)
    {
        const double wordStart = startSec + step * i;
        const double wordEnd = (i == words.size() - 1) ? endSec : wordStart + step;
        tokens << WordToken::make(words.at(i), wordStart, wordEnd, confidence);
    }
}

bool TranscriptParser::parseAsrJson(const QByteArray& data, TokenList& tokens, QString* error)
{
    QJsonObject root;
    if (!parseObject(data, root, error))
        return false;

    TokenList parsed;
    if (root.contains("transcription"))
    {
        const QJsonArray segments = root["transcription"].toArray();
        for (const QJsonValue& value : segments)
        {
            const QJsonObject segment = value.toObject();
            const QJsonObject offsets = segment["offsets"].toObject();
            const double start = offsets["from"].toDouble() / 1000.0;
            const double end = offsets["to"].toDouble() / 1000.0;
            appendSegment(segment["text"].toString().trimmed(), start, end, 1.0, parsed);
        }
    }
    else if (root.contains("segments"))
    {
        const QJsonArray segments = root["segments"].toArray();
        for (const QJsonValue& value : segments)
        {
            const QJsonObject segment = value.toObject();
            const QJsonArray words = segment["words"].toArray();
            if (words.isEmpty())
            {
                appendSegment(segment["text"].toString().trimmed(), segment["start"].toDouble(),
                              segment["end"].toDouble(), 1.0, parsed);
                continue;
            }
            for (const QJsonValue& wordValue : words)
            {
                const QJsonObject word = wordValue.toObject();
                appendSegment(word["word"].toString().trimmed(), word["start"].toDouble(), word["end"].toDouble(),
                              word["probability"].toDouble(1.0), parsed);
            }
        }
    }
    else
    {
        if (error)
            *error = "unknown transcript format: neither 'transcription' nor 'segments' present";
        return false;
    }

    tokens = parsed;
    return true;
}

bool TranscriptParser::parseAsrFile(const QString& path, TokenList& tokens, QString* error)
{
    QByteArray data;
    if (!readFile(path, data, error))
        return false;
    return parseAsrJson(data, tokens, error);
}

bool TranscriptParser::applyAlignment(const QByteArray& data, TokenList& tokens, AlignmentStats* stats,
                                      QString* error)
{
    QJsonObject root;
    if (!parseObject(data, root, error))
        return false;
    if (!root["words"].isArray())
    {
        if (error)
            *error = "alignment output has no 'words' array";
        return false;
    }

    AlignmentStats result;
    QList<bool> aligned(tokens.size(), false);
    QStringList norms;
    for (const WordToken& token : tokens)
        norms << LinguisticFilter::normalize(token.text);

    const QJsonArray words = root["words"].toArray();
    result.alignerWords = words.size();
    int cursor = 0;

    for (const QJsonValue& value : words)
    {
        const QJsonObject word = value.toObject();
        const QString norm = LinguisticFilter::normalize(word["word"].toString());
        if (norm.isEmpty())
            continue;

        int match = -1;
        for (int k = cursor; k < tokens.size() && k <= cursor + AlignmentLookahead; ++k)
        {
            if (norms.at(k) == norm)
            {
                match = k;
                break;
            }
        }
        if (match < 0)
            continue;
        cursor = match + 1;

        if (word["case"].toString() != "success")
            continue;
        const double start = word["start"].toDouble(-1.0);
        const double end = word["end"].toDouble(-1.0);
        if (start < 0.0 || end <= start)
            continue;

        WordToken& token = tokens[match];
        token.startSec = start;
        token.endSec = end;
        token.rawStartSec = start;
        token.rawEndSec = end;
        token.confidence = 1.0;
        aligned[match] = true;
        ++result.alignedTokens;
    }

    // Mixed aligner and ASR timing may disagree, keep the sequence ordered
    double previousStart = 0.0;
    for (int i = 0; i < tokens.size(); ++i)
    {
        WordToken& token = tokens[i];
        if (!aligned.at(i))
            token.confidence = UnalignedConfidence;

        if (token.startSec < previousStart)
        {
            const double duration = qMax(token.endSec - token.startSec, MinimumWordSec);
            token.startSec = previousStart;
            token.endSec = qMax(token.endSec, previousStart + duration);
            token.rawStartSec = token.startSec;
            token.rawEndSec = token.endSec;
            ++result.repairedTokens;
        }
        previousStart = token.startSec;
    }

    if (stats)
        *stats = result;
    return true;
}

bool TranscriptParser::applyAlignmentFile(const QString& path, TokenList& tokens, AlignmentStats* stats,
                                          QString* error)
{
    QByteArray data;
    if (!readFile(path, data, error))
        return false;
    return applyAlignment(data, tokens, stats, error);
}

QString TranscriptParser::transcriptText(const TokenList& tokens)
{
    QStringList words;
    for (const WordToken& token : tokens)
        words << token.text;
    return words.join(' ');
}
