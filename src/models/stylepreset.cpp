#include "stylepreset.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QRegularExpression>

static int clampChannel(int value)
{
    return qBound(0, value, 255);
}

RgbaColor RgbaColor::fromRgba(int r, int g, int b, int a)
{
    RgbaColor color;
    color.r = clampChannel(r);
    color.g = clampChannel(g);
    color.b = clampChannel(b);
    color.a = clampChannel(a);
    return color;
}

RgbaColor RgbaColor::fromString(const QString& value, bool* ok)
{
    const QString text = value.trimmed();
    bool parsed = false;
    RgbaColor color;

    if (text.compare("transparent", Qt::CaseInsensitive) == 0)
    {
        color = fromRgba(0, 0, 0, 0);
        parsed = true;
    }
    else if (text.startsWith('#') && (text.size() == 7 || text.size() == 9))
    {
        bool okHex = false;
        const uint rgb = text.mid(1, 6).toUInt(&okHex, 16);
        uint alpha = 0xFF;
        bool okAlpha = true;
        if (text.size() == 9)
        {
            alpha = text.mid(7, 2).toUInt(&okAlpha, 16);
        }
        if (okHex && okAlpha)
        {
            color = fromRgba((rgb >> 16) & 0xFF, (rgb >> 8) & 0xFF, rgb & 0xFF, static_cast<int>(alpha));
            parsed = true;
        }
    }
    else if (text.startsWith("&H", Qt::CaseInsensitive))
    {
        // ASS stores colors as &HAABBGGRR, alpha inverted (00 = opaque)
        QString hex = text.mid(2);
        if (hex.endsWith('&'))
            hex.chop(1);
        bool okHex = false;
        const uint value32 = hex.toUInt(&okHex, 16);
        if (okHex && !hex.isEmpty() && hex.size() <= 8)
        {
            const int assAlpha = hex.size() > 6 ? static_cast<int>((value32 >> 24) & 0xFF) : 0;
            color = fromRgba(value32 & 0xFF, (value32 >> 8) & 0xFF, (value32 >> 16) & 0xFF, 255 - assAlpha);
            parsed = true;
        }
    }
    else
    {
        static const QRegularExpression rgbaRe(
            R"(^rgba?\(\s*(\d{1,3})\s*,\s*(\d{1,3})\s*,\s*(\d{1,3})\s*(?:,\s*([0-9]*\.?[0-9]+)\s*)?\)$)",
            QRegularExpression::CaseInsensitiveOption);
        const QRegularExpressionMatch match = rgbaRe.match(text);
        if (match.hasMatch())
        {
            double alpha = 1.0;
            if (!match.captured(4).isEmpty())
            {
                alpha = qBound(0.0, match.captured(4).toDouble(), 1.0);
            }
            color = fromRgba(match.captured(1).toInt(), match.captured(2).toInt(), match.captured(3).toInt(),
                             qRound(alpha * 255.0));
            parsed = true;
        }
    }

    if (ok)
        *ok = parsed;
    return parsed ? color : RgbaColor();
}

RgbaColor RgbaColor::withAlpha(int alpha) const
{
    RgbaColor copy = *this;
    copy.a = clampChannel(alpha);
    return copy;
}

QString RgbaColor::toAss() const
{
    return QString("&H%1%2%3%4")
        .arg(255 - a, 2, 16, QChar('0'))
        .arg(b, 2, 16, QChar('0'))
        .arg(g, 2, 16, QChar('0'))
        .arg(r, 2, 16, QChar('0'))
        .toUpper();
}

QString RgbaColor::toHex() const
{
    return QString("#%1%2%3%4")
        .arg(r, 2, 16, QChar('0'))
        .arg(g, 2, 16, QChar('0'))
        .arg(b, 2, 16, QChar('0'))
        .arg(a, 2, 16, QChar('0'))
        .toUpper();
}

static bool readColor(const QJsonObject& json, const QString& key, RgbaColor& target, QString* error)
{
    if (!json.contains(key))
        return true;
    bool ok = false;
    const RgbaColor parsed = RgbaColor::fromString(json[key].toString(), &ok);
    if (!ok)
    {
        if (error)
            *error = QString("invalid color '%1' in field '%2'").arg(json[key].toString(), key);
        return false;
    }
    target = parsed;
    return true;
}

bool StylePreset::read(const QJsonObject& json, QString* error)
{
    id = json["id"].toString().trimmed();
    if (id.isEmpty())
    {
        if (error)
            *error = "preset without 'id'";
        return false;
    }
    name = json["name"].toString(id);
    fontFamily = json["font"].toString(fontFamily);
    fontSizePx = json["fontSize"].toInt(fontSizePx);
    hasOutline = json["hasOutline"].toBool(hasOutline);
    outlineWidth = json["outline"].toDouble(hasOutline ? outlineWidth : 0.0);
    shadow = json["shadow"].toDouble(shadow);
    bold = json["bold"].toBool(bold);
    gradient = json["gradient"].toBool(gradient);
    activeStyleId = json["activeStyleId"].toString(id + "-active");
    inactiveStyleId = json["inactiveStyleId"].toString(id + "-inactive");

    if (!readColor(json, "textColor", fillColor, error) || !readColor(json, "accentColor", accentColor, error) ||
        !readColor(json, "outlineColor", outlineColor, error) || !readColor(json, "backgroundColor", backColor, error) ||
        !readColor(json, "gradientFrom", gradientFrom, error) || !readColor(json, "gradientTo", gradientTo, error))
    {
        return false;
    }

    if (activeStyleId == inactiveStyleId || activeStyleId == id || inactiveStyleId == id)
    {
        if (error)
            *error = QString("preset '%1' reuses a style id").arg(id);
        return false;
    }
    return true;
}

void StylePreset::write(QJsonObject& json) const
{
    json["id"] = id;
    json["name"] = name;
    json["font"] = fontFamily;
    json["fontSize"] = fontSizePx;
    json["textColor"] = fillColor.toHex();
    json["accentColor"] = accentColor.toHex();
    json["outlineColor"] = outlineColor.toHex();
    json["backgroundColor"] = backColor.toHex();
    json["hasOutline"] = hasOutline;
    json["outline"] = outlineWidth;
    json["shadow"] = shadow;
    json["bold"] = bold;
    json["gradient"] = gradient;
    if (gradient)
    {
        json["gradientFrom"] = gradientFrom.toHex();
        json["gradientTo"] = gradientTo.toHex();
    }
    json["activeStyleId"] = activeStyleId;
    json["inactiveStyleId"] = inactiveStyleId;
}

PresetTable PresetTable::builtIn()
{
    PresetTable table;

    // Modern creator standard: bold white on a yellow bar
    StylePreset highlight;
    highlight.id = "highlight-bold";
    highlight.name = "Highlight Bold";
    highlight.fontFamily = "Poppins ExtraBold";
    highlight.fillColor = RgbaColor::fromRgba(0xFF, 0xFF, 0xFF);
    highlight.accentColor = RgbaColor::fromRgba(0xFF, 0xE6, 0x00);
    highlight.backColor = RgbaColor::fromRgba(0xFF, 0xE6, 0x00);
    highlight.outlineWidth = 0.0;
    highlight.activeStyleId = "highlight-bold-active";
    highlight.inactiveStyleId = "highlight-bold-inactive";
    table.add(highlight);

    StylePreset neon;
    neon.id = "neon-pop";
    neon.name = "Neon Pop";
    neon.fontFamily = "Poppins Bold";
    neon.fillColor = RgbaColor::fromRgba(0x2B, 0xFF, 0x88);
    neon.accentColor = RgbaColor::fromRgba(0xFF, 0xFF, 0xFF);
    neon.outlineColor = RgbaColor::fromRgba(0, 0, 0);
    neon.hasOutline = true;
    neon.outlineWidth = 3.0;
    neon.shadow = 2.0;
    neon.activeStyleId = "neon-pop-active";
    neon.inactiveStyleId = "neon-pop-inactive";
    table.add(neon);

    StylePreset glass;
    glass.id = "glass-glow";
    glass.name = "Glass Glow";
    glass.fontFamily = "Poppins SemiBold";
    glass.fillColor = RgbaColor::fromRgba(0x33, 0x41, 0x55);
    glass.accentColor = RgbaColor::fromRgba(0x89, 0xFF, 0xFD);
    glass.backColor = RgbaColor::fromRgba(255, 255, 255, 51);
    glass.outlineWidth = 0.0;
    glass.bold = false;
    glass.gradient = true;
    glass.activeStyleId = "glass-glow-active";
    glass.inactiveStyleId = "glass-glow-inactive";
    table.add(glass);

    return table;
}

bool PresetTable::fromJson(const QByteArray& data, PresetTable& table, QString* error)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    if (doc.isNull() || !doc.isArray())
    {
        if (error)
            *error = doc.isNull() ? parseError.errorString() : "preset file must contain a JSON array";
        return false;
    }

    PresetTable parsed;
    const QJsonArray array = doc.array();
    for (const QJsonValue& value : array)
    {
        StylePreset preset;
        QString presetError;
        if (!preset.read(value.toObject(), &presetError))
        {
            if (error)
                *error = presetError;
            return false;
        }
        if (parsed.find(preset.id))
        {
            if (error)
                *error = QString("duplicate preset id '%1'").arg(preset.id);
            return false;
        }
        parsed.add(preset);
    }

    if (parsed.isEmpty())
    {
        if (error)
            *error = "preset file contains no presets";
        return false;
    }

    table = parsed;
    return true;
}

bool PresetTable::loadFromFile(const QString& path, PresetTable& table, QString* error)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly))
    {
        if (error)
            *error = QString("cannot open %1: %2").arg(path, file.errorString());
        return false;
    }
    return fromJson(file.readAll(), table, error);
}

void PresetTable::add(const StylePreset& preset)
{
    m_presets.append(preset);
}

const StylePreset* PresetTable::find(const QString& id) const
{
    for (const StylePreset& preset : m_presets)
    {
        if (preset.id == id)
            return &preset;
    }
    return nullptr;
}

QStringList PresetTable::ids() const
{
    QStringList result;
    for (const StylePreset& preset : m_presets)
    {
        result << preset.id;
    }
    return result;
}
