/**
 * @file captiongenerator_test.cpp
 * @brief Tests for the in-core caption pipeline (filter, smooth, build)
 */

#include <QtTest/QtTest>

#include "captiongenerator.h"

class CaptionGeneratorTest : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();

    void testGenerate_fillerHidden();
    void testGenerate_fillerShownDimmed();
    void testGenerate_sentenceModeKeepsEveryWord();
    void testGenerate_clipClampWarning();
    void testGenerate_statsComputed();

    void testErrors_unknownPreset();
    void testErrors_fontSizeOutOfBounds();
    void testErrors_emptyTranscript();
    void testErrors_zeroDurationWord();
    void testErrors_unorderedWords();
    void testErrors_negativeStart();

    void testPipeline_stagesStopAfterError();
    void testPipeline_allFillerWarns();

private:
    static TokenList scenarioTokens();

    PresetTable m_presets;
};

TokenList CaptionGeneratorTest::scenarioTokens()
{
    TokenList tokens;
    tokens << WordToken::make("the", 0.0, 0.05) << WordToken::make("cat", 0.06, 0.40)
           << WordToken::make("sat", 0.42, 0.80);
    return tokens;
}

void CaptionGeneratorTest::initTestCase()
{
    m_presets = PresetTable::builtIn();
}

void CaptionGeneratorTest::testGenerate_fillerHidden()
{
    JobOptions options;
    options.captionMode = CaptionMode::Words;
    options.showFillerWords = false;

    const CaptionTrackResult result = generateCaptionTrack(scenarioTokens(), options, m_presets);
    QVERIFY2(result.isOk(), qPrintable(result.error.message));

    QCOMPARE(result.track.events.size(), 2);
    const CaptionEvent& cat = result.track.events.at(0);
    const CaptionEvent& sat = result.track.events.at(1);
    QCOMPARE(cat.displayText, QString("cat"));
    QCOMPARE(sat.displayText, QString("sat"));
    QVERIFY(qAbs(cat.startSec - 0.45) < 1e-6);
    QVERIFY(qAbs(cat.endSec - 0.90) < 1e-6);
    QVERIFY(qAbs(sat.startSec - 0.90) < 1e-6);
    QVERIFY(qAbs(sat.endSec - 1.35) < 1e-6);
    QVERIFY(cat.endSec <= sat.startSec + 1e-9);

    // the filler keeps its slot in the token list
    QCOMPARE(result.tokens.size(), 3);
    QVERIFY(!result.tokens.at(0).active);
}

void CaptionGeneratorTest::testGenerate_fillerShownDimmed()
{
    JobOptions options;
    options.showFillerWords = true;

    const CaptionTrackResult result = generateCaptionTrack(scenarioTokens(), options, m_presets);
    QVERIFY(result.isOk());

    QCOMPARE(result.track.events.size(), 3);
    const StylePreset* preset = m_presets.find(options.presetId);
    QCOMPARE(result.track.events.at(0).displayText, QString("the"));
    QCOMPARE(result.track.events.at(0).styleId, preset->inactiveStyleId);
    QCOMPARE(result.track.events.at(1).styleId, preset->activeStyleId);
    for (const CaptionEvent& event : result.track.events)
        QVERIFY(event.endSec - event.startSec >= 0.45 - 1e-9);
}

void CaptionGeneratorTest::testGenerate_sentenceModeKeepsEveryWord()
{
    JobOptions options;
    options.captionMode = CaptionMode::Sentences;
    options.presetId = "neon-pop";

    TokenList tokens = scenarioTokens();
    tokens << WordToken::make("down.", 1.5, 1.9);

    const CaptionTrackResult result = generateCaptionTrack(tokens, options, m_presets);
    QVERIFY(result.isOk());

    // 0.7 s pause between "sat" and "down."
    QCOMPARE(result.track.events.size(), 2);
    QCOMPARE(result.track.events.at(0).displayText, QString("the cat sat"));
    QCOMPARE(result.track.events.at(1).displayText, QString("down."));
    for (const WordToken& token : result.tokens)
        QVERIFY(token.active);
}

void CaptionGeneratorTest::testGenerate_clipClampWarning()
{
    JobOptions options;
    TokenList tokens;
    tokens << WordToken::make("hi", 0.0, 0.1);

    const CaptionTrackResult result = generateCaptionTrack(tokens, options, m_presets, 0.3);
    QVERIFY(result.isOk());
    QCOMPARE(result.track.events.size(), 1);
    QVERIFY(qAbs(result.track.events.first().endSec - 0.3) < 1e-9);
    QCOMPARE(result.warnings.size(), 1);
}

void CaptionGeneratorTest::testGenerate_statsComputed()
{
    JobOptions options;
    const CaptionTrackResult result = generateCaptionTrack(scenarioTokens(), options, m_presets);
    QVERIFY(result.isOk());
    QCOMPARE(result.stats.wordCount, 3);
    QCOMPARE(result.stats.activeCount, 2);
    QVERIFY(result.stats.minDurationSec >= 0.45 - 1e-9);
}

void CaptionGeneratorTest::testErrors_unknownPreset()
{
    JobOptions options;
    options.presetId = "comic-sans-deluxe";

    const CaptionTrackResult result = generateCaptionTrack(scenarioTokens(), options, m_presets);
    QVERIFY(!result.isOk());
    QCOMPARE(result.error.kind, CaptionErrorKind::ConfigurationInvalid);
    QVERIFY(result.error.message.contains("comic-sans-deluxe"));
    QVERIFY(result.track.events.isEmpty());
}

void CaptionGeneratorTest::testErrors_fontSizeOutOfBounds()
{
    JobOptions options;
    options.fontSizePx = 200;
    QCOMPARE(generateCaptionTrack(scenarioTokens(), options, m_presets).error.kind,
             CaptionErrorKind::ConfigurationInvalid);

    options.fontSizePx = 8;
    QCOMPARE(generateCaptionTrack(scenarioTokens(), options, m_presets).error.kind,
             CaptionErrorKind::ConfigurationInvalid);

    // custom limits from settings
    CaptionLimits limits;
    limits.maxFontSizePx = 300;
    options.fontSizePx = 200;
    QVERIFY(generateCaptionTrack(scenarioTokens(), options, m_presets, 0.0, limits).isOk());
}

void CaptionGeneratorTest::testErrors_emptyTranscript()
{
    const CaptionTrackResult result = generateCaptionTrack(TokenList(), JobOptions(), m_presets);
    QCOMPARE(result.error.kind, CaptionErrorKind::InputMalformed);
}

void CaptionGeneratorTest::testErrors_zeroDurationWord()
{
    TokenList tokens = scenarioTokens();
    tokens[1].endSec = tokens[1].startSec;

    const CaptionTrackResult result = generateCaptionTrack(tokens, JobOptions(), m_presets);
    QCOMPARE(result.error.kind, CaptionErrorKind::InputMalformed);
    QVERIFY(result.error.diagnostics.contains("'cat'"));
}

void CaptionGeneratorTest::testErrors_unorderedWords()
{
    TokenList tokens = scenarioTokens();
    tokens.swapItemsAt(1, 2);

    const CaptionTrackResult result = generateCaptionTrack(tokens, JobOptions(), m_presets);
    QCOMPARE(result.error.kind, CaptionErrorKind::InputMalformed);
}

void CaptionGeneratorTest::testErrors_negativeStart()
{
    TokenList tokens;
    tokens << WordToken::make("early", -0.5, 0.2);

    const CaptionTrackResult result = generateCaptionTrack(tokens, JobOptions(), m_presets);
    QCOMPARE(result.error.kind, CaptionErrorKind::InputMalformed);
}

void CaptionGeneratorTest::testPipeline_stagesStopAfterError()
{
    JobOptions options;
    options.presetId = "missing";
    CaptionPipeline pipeline(options, m_presets);

    QVERIFY(!pipeline.prepare(scenarioTokens(), 0.0));
    QVERIFY(!pipeline.filter());
    QVERIFY(!pipeline.smooth());
    QVERIFY(!pipeline.build());
    QCOMPARE(pipeline.error().kind, CaptionErrorKind::ConfigurationInvalid);
}

void CaptionGeneratorTest::testPipeline_allFillerWarns()
{
    TokenList tokens;
    tokens << WordToken::make("um", 0.0, 0.5) << WordToken::make("uh", 0.5, 1.0);

    CaptionPipeline pipeline(JobOptions(), m_presets);
    QVERIFY(pipeline.prepare(tokens, 0.0));
    QVERIFY(pipeline.filter());
    QVERIFY(pipeline.smooth());
    QVERIFY(pipeline.build());
    QVERIFY(pipeline.track().events.isEmpty());
    QCOMPARE(pipeline.warnings().size(), 1);
}

QTEST_MAIN(CaptionGeneratorTest)
#include "captiongenerator_test.moc"
