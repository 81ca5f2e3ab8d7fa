/**
 * @file styleresolver_test.cpp
 * @brief Unit tests for StyleResolver and the ASS style rows it produces
 */

#include <QtTest/QtTest>

#include "styleresolver.h"

class StyleResolverTest : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();

    void testResolve_activeWordIsEmphasized();
    void testResolve_inactiveWordUsesInactiveStyle();
    void testResolve_sentenceModeUsesPresetId();
    void testNextSlot_alternatesEveryEightEvents();
    void testNextSlot_resetStartsOver();

    void testStyleSheet_wordModeHasActiveAndInactive();
    void testStyleSheet_sentenceModeHasOneStyle();
    void testStyleSheet_backgroundBecomesOpaqueBox();
    void testStyleSheet_gradientBecomesTwoToneGlow();
    void testStyleSheet_fontSizeOverride();
    void testToAssLine_fieldLayout();

private:
    PresetTable m_presets;
};

void StyleResolverTest::initTestCase()
{
    m_presets = PresetTable::builtIn();
    QVERIFY(m_presets.find("highlight-bold"));
    QVERIFY(m_presets.find("neon-pop"));
}

void StyleResolverTest::testResolve_activeWordIsEmphasized()
{
    const StylePreset& preset = *m_presets.find("neon-pop");
    const WordToken token = WordToken::make("hello", 0.0, 0.5);

    const ResolvedStyle style = StyleResolver::resolve(preset, token, CaptionMode::Words);
    QCOMPARE(style.styleId, QString("neon-pop-active"));
    QVERIFY(style.isEmphasized);
}

void StyleResolverTest::testResolve_inactiveWordUsesInactiveStyle()
{
    const StylePreset& preset = *m_presets.find("neon-pop");
    WordToken token = WordToken::make("the", 0.0, 0.5);
    token.active = false;

    const ResolvedStyle style = StyleResolver::resolve(preset, token, CaptionMode::Words);
    QCOMPARE(style.styleId, QString("neon-pop-inactive"));
    QVERIFY(!style.isEmphasized);
}

void StyleResolverTest::testResolve_sentenceModeUsesPresetId()
{
    const StylePreset& preset = *m_presets.find("glass-glow");
    StyleResolver resolver(preset, CaptionMode::Sentences, 42);

    const ResolvedStyle style = resolver.resolve(WordToken::make("Hello there.", 0.0, 1.0));
    QCOMPARE(style.styleId, QString("glass-glow"));
    QVERIFY(!style.isEmphasized);
}

void StyleResolverTest::testNextSlot_alternatesEveryEightEvents()
{
    StyleResolver resolver(*m_presets.find("highlight-bold"), CaptionMode::Words, 42);

    for (int i = 0; i < 24; ++i)
    {
        const VerticalSlot expected = (i / 8) % 2 == 0 ? VerticalSlot::Primary : VerticalSlot::Alternate;
        QCOMPARE(resolver.nextSlot(), expected);
    }
}

void StyleResolverTest::testNextSlot_resetStartsOver()
{
    StyleResolver resolver(*m_presets.find("highlight-bold"), CaptionMode::Words, 42);
    for (int i = 0; i < 8; ++i)
        resolver.nextSlot();
    QCOMPARE(resolver.nextSlot(), VerticalSlot::Alternate);

    resolver.reset();
    QCOMPARE(resolver.nextSlot(), VerticalSlot::Primary);
}

void StyleResolverTest::testStyleSheet_wordModeHasActiveAndInactive()
{
    const StylePreset& preset = *m_presets.find("neon-pop");
    StyleResolver resolver(preset, CaptionMode::Words, 42);

    const QList<AssStyle> sheet = resolver.styleSheet();
    QCOMPARE(sheet.size(), 2);
    QCOMPARE(sheet.at(0).name, preset.activeStyleId);
    QCOMPARE(sheet.at(1).name, preset.inactiveStyleId);

    // karaoke fill goes from secondary to primary
    QCOMPARE(sheet.at(0).primaryColor, preset.accentColor);
    QCOMPARE(sheet.at(0).secondaryColor, preset.fillColor);
    QCOMPARE(sheet.at(0).borderStyle, 1);
    QCOMPARE(sheet.at(0).outline, 3.0);

    // dimmed, no shadow
    QCOMPARE(sheet.at(1).primaryColor.a, preset.fillColor.a / 2);
    QCOMPARE(sheet.at(1).shadow, 0.0);
}

void StyleResolverTest::testStyleSheet_sentenceModeHasOneStyle()
{
    StyleResolver resolver(*m_presets.find("neon-pop"), CaptionMode::Sentences, 42);

    const QList<AssStyle> sheet = resolver.styleSheet();
    QCOMPARE(sheet.size(), 1);
    QCOMPARE(sheet.first().name, QString("neon-pop"));
}

void StyleResolverTest::testStyleSheet_backgroundBecomesOpaqueBox()
{
    const StylePreset& preset = *m_presets.find("highlight-bold");
    StyleResolver resolver(preset, CaptionMode::Words, 42);

    const QList<AssStyle> sheet = resolver.styleSheet();
    QCOMPARE(sheet.at(0).borderStyle, 3);
    QCOMPARE(sheet.at(0).outlineColor, preset.backColor);
    QVERIFY(sheet.at(0).outline >= 4.0);
    QCOMPARE(sheet.at(0).primaryColor, preset.fillColor);

    // filler words are drawn without the bar
    QCOMPARE(sheet.at(1).borderStyle, 1);
    QCOMPARE(sheet.at(1).outline, 0.0);
}

void StyleResolverTest::testStyleSheet_gradientBecomesTwoToneGlow()
{
    const StylePreset& preset = *m_presets.find("glass-glow");
    QVERIFY(preset.gradient);

    StyleResolver resolver(preset, CaptionMode::Words, 42);
    const QList<AssStyle> sheet = resolver.styleSheet();

    // the glow replaces the translucent box
    QCOMPARE(sheet.at(0).borderStyle, 1);
    QCOMPARE(sheet.at(0).outlineColor, preset.gradientFrom);
    QCOMPARE(sheet.at(0).backColor, preset.gradientTo);
    QVERIFY(sheet.at(0).outline >= 3.0);
    QVERIFY(sheet.at(0).shadow >= 2.0);
    QVERIFY(sheet.at(0).toAssLine().contains(preset.gradientTo.toAss()));

    // the same preset without gradient falls back to the box
    StylePreset flat = preset;
    flat.gradient = false;
    StyleResolver flatResolver(flat, CaptionMode::Sentences, 42);
    QCOMPARE(flatResolver.styleSheet().first().borderStyle, 3);
}

void StyleResolverTest::testStyleSheet_fontSizeOverride()
{
    StyleResolver resolver(*m_presets.find("neon-pop"), CaptionMode::Words, 64);
    for (const AssStyle& style : resolver.styleSheet())
        QCOMPARE(style.fontSize, 64);

    StyleResolver fallback(*m_presets.find("neon-pop"), CaptionMode::Words, 0);
    QCOMPARE(fallback.styleSheet().first().fontSize, m_presets.find("neon-pop")->fontSizePx);
}

void StyleResolverTest::testToAssLine_fieldLayout()
{
    AssStyle style;
    style.name = "word-active";
    style.fontName = "Poppins Bold";
    style.fontSize = 48;
    style.primaryColor = RgbaColor::fromRgba(255, 230, 0);
    style.bold = true;
    style.outline = 2;
    style.marginV = 30;

    const QString line = style.toAssLine();
    QVERIFY(line.startsWith("Style: word-active,Poppins Bold,48,&H0000E6FF,"));

    const QStringList fields = line.mid(QString("Style: ").size()).split(',');
    QCOMPARE(fields.size(), 23);
    QCOMPARE(fields.at(7), QString("-1"));
    QCOMPARE(fields.at(15), QString("1"));
    QCOMPARE(fields.at(16), QString("2"));
    QCOMPARE(fields.at(18), QString("2"));
    QCOMPARE(fields.at(21), QString("30"));
    QCOMPARE(fields.at(22), QString("1"));
}

QTEST_MAIN(StyleResolverTest)
#include "styleresolver_test.moc"
