#ifndef STYLEPRESET_H
#define STYLEPRESET_H

#include <QJsonObject>
#include <QList>
#include <QString>
#include <QStringList>

/**
 * @brief 8-bit RGBA color, parsed once from the preset file
 *
 * Accepted notations: "#RRGGBB", "#RRGGBBAA", "rgba(r, g, b, a)" with a in 0..1,
 * "transparent" and the ASS form "&HAABBGGRR" (ASS alpha: 00 = opaque).
 */
struct RgbaColor
{
    int r = 255;
    int g = 255;
    int b = 255;
    int a = 255; // 255 = opaque

    static RgbaColor fromString(const QString& value, bool* ok = nullptr);
    static RgbaColor fromRgba(int r, int g, int b, int a = 255);

    RgbaColor withAlpha(int alpha) const;
    bool isTransparent() const
    {
        return a == 0;
    }

    QString toAss() const; // &HAABBGGRR
    QString toHex() const; // #RRGGBBAA

    bool operator==(const RgbaColor& other) const
    {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }
};

/**
 * @brief Typed caption style record
 *
 * Loaded once per job from static configuration and shared by const reference
 * for the whole job. activeStyleId/inactiveStyleId name the ASS styles used for
 * karaoke words, the preset id itself names the sentence-mode style.
 */
struct StylePreset
{
    QString id;
    QString name;
    QString fontFamily = "Poppins SemiBold";
    int fontSizePx = 42;
    RgbaColor fillColor;
    RgbaColor accentColor = RgbaColor::fromRgba(0xFF, 0xE6, 0x00);
    RgbaColor outlineColor = RgbaColor::fromRgba(0, 0, 0);
    RgbaColor backColor = RgbaColor::fromRgba(0, 0, 0, 0);
    bool hasOutline = false;
    double outlineWidth = 2.0;
    double shadow = 0.0;
    bool bold = true;
    bool gradient = false;
    // gradient presets glow from gradientFrom (outline) into gradientTo (shadow)
    RgbaColor gradientFrom = RgbaColor::fromRgba(255, 193, 204, 204);
    RgbaColor gradientTo = RgbaColor::fromRgba(137, 255, 253, 204);
    QString activeStyleId;
    QString inactiveStyleId;

    bool read(const QJsonObject& json, QString* error = nullptr);
    void write(QJsonObject& json) const;
};

class PresetTable
{
public:
    PresetTable() = default;

    static PresetTable builtIn();
    static bool fromJson(const QByteArray& data, PresetTable& table, QString* error = nullptr);
    static bool loadFromFile(const QString& path, PresetTable& table, QString* error = nullptr);

    void add(const StylePreset& preset);
    const StylePreset* find(const QString& id) const;
    QStringList ids() const;
    const QList<StylePreset>& presets() const
    {
        return m_presets;
    }
    bool isEmpty() const
    {
        return m_presets.isEmpty();
    }

private:
    QList<StylePreset> m_presets;
};

#endif // STYLEPRESET_H
