#include "assprocessor.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QTextStream>

static bool writeAssFile(const QString& path, const QStringList& lines)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly))
    {
        return false;
    }
    QTextStream out(&file);
    out.setEncoding(QStringConverter::Utf8);
    out.setGenerateByteOrderMark(true);
    for (const QString& line : lines)
    {
        out << line << "\n";
    }
    out.flush();
    const bool ok = out.status() == QTextStream::Ok;
    file.close();
    return ok;
}

AssProcessor::AssProcessor(QObject* parent) : QObject{parent}
{
}

QString AssProcessor::formatAssTime(double seconds)
{
    // ASS counts centiseconds: H:MM:SS.CC
    const qint64 total = qMax<qint64>(0, qRound64(seconds * 100.0));
    const qint64 hours = total / 360000;
    const qint64 minutes = (total / 6000) % 60;
    const qint64 secs = (total / 100) % 60;
    const qint64 centis = total % 100;
    return QString("%1:%2:%3.%4")
        .arg(hours)
        .arg(minutes, 2, 10, QChar('0'))
        .arg(secs, 2, 10, QChar('0'))
        .arg(centis, 2, 10, QChar('0'));
}

QString AssProcessor::escapeText(const QString& text)
{
    // ASS has no escape for braces, they would open an override block
    QString escaped = text;
    escaped.replace('\\', '/');
    escaped.replace('{', '(');
    escaped.replace('}', ')');
    escaped.replace("\r\n", "\\N");
    escaped.replace('\n', "\\N");
    return escaped;
}

QString AssProcessor::dialogueLine(const CaptionEvent& event, int playResX, int playResY)
{
    const int x = playResX / 2;
    const int y = event.verticalSlot == VerticalSlot::Primary ? playResY * 85 / 100 : playResY * 88 / 100;
    const QString text = escapeText(event.displayText);

    QString effect;
    QString tags = QString("\\pos(%1,%2)").arg(x).arg(y);
    if (event.isEmphasized)
    {
        const int karaokeCs = qMax(1, static_cast<int>(qRound((event.activeEndSec - event.activeStartSec) * 100.0)));
        tags += QString("\\fad(100,100)\\k%1").arg(karaokeCs);
        effect = "Karaoke";
    }

    return QString("Dialogue: 0,%1,%2,%3,,0,0,0,%4,{%5}%6")
        .arg(formatAssTime(event.startSec), formatAssTime(event.endSec), event.styleId, effect, tags, text);
}

QStringList AssProcessor::buildScript(const CaptionTrack& track, int playResX, int playResY)
{
    QStringList lines;
    lines << "[Script Info]" << "; Script generated by CapFuse"
          << QString("Title: %1 captions").arg(track.preset.name) << "ScriptType: v4.00+" << "WrapStyle: 0"
          << "ScaledBorderAndShadow: yes" << "YCbCr Matrix: TV.709" << QString("PlayResX: %1").arg(playResX)
          << QString("PlayResY: %1").arg(playResY) << ""
          << "[V4+ Styles]"
          << "Format: Name, Fontname, Fontsize, PrimaryColour, SecondaryColour, OutlineColour, BackColour, Bold, "
             "Italic, Underline, StrikeOut, ScaleX, ScaleY, Spacing, Angle, BorderStyle, Outline, Shadow, Alignment, "
             "MarginL, MarginR, MarginV, Encoding";

    for (const AssStyle& style : track.styles)
    {
        lines << style.toAssLine();
    }

    lines << ""
          << "[Events]"
          << "Format: Layer, Start, End, Style, Name, MarginL, MarginR, MarginV, Effect, Text";

    for (const CaptionEvent& event : track.events)
    {
        lines << dialogueLine(event, playResX, playResY);
    }
    return lines;
}

bool AssProcessor::writeScript(const QString& outputPath, const CaptionTrack& track, int playResX, int playResY)
{
    emit logMessage(QString("Writing %1 caption events to %2").arg(track.events.size()).arg(outputPath),
                    LogCategory::APP);

    if (!writeAssFile(outputPath, buildScript(track, playResX, playResY)))
    {
        emit logMessage("Error: cannot write subtitle file " + outputPath, LogCategory::APP);
        return false;
    }
    return true;
}

QJsonObject AssProcessor::toJson(const CaptionTrack& track)
{
    QJsonObject root;
    root["mode"] = captionModeToString(track.mode);

    QJsonObject presetObj;
    track.preset.write(presetObj);
    root["preset"] = presetObj;

    QJsonArray stylesArray;
    for (const AssStyle& style : track.styles)
    {
        QJsonObject styleObj;
        styleObj["name"] = style.name;
        styleObj["font"] = style.fontName;
        styleObj["fontSize"] = style.fontSize;
        styleObj["primaryColour"] = style.primaryColor.toAss();
        styleObj["secondaryColour"] = style.secondaryColor.toAss();
        styleObj["outlineColour"] = style.outlineColor.toAss();
        styleObj["backColour"] = style.backColor.toAss();
        styleObj["bold"] = style.bold;
        styleObj["borderStyle"] = style.borderStyle;
        styleObj["outline"] = style.outline;
        styleObj["shadow"] = style.shadow;
        stylesArray.append(styleObj);
    }
    root["styles"] = stylesArray;

    QJsonArray eventsArray;
    for (const CaptionEvent& event : track.events)
    {
        QJsonObject eventObj;
        eventObj["start"] = event.startSec;
        eventObj["end"] = event.endSec;
        eventObj["text"] = event.displayText;
        eventObj["style"] = event.styleId;
        eventObj["emphasized"] = event.isEmphasized;
        eventObj["slot"] = verticalSlotToString(event.verticalSlot);
        eventObj["activeStart"] = event.activeStartSec;
        eventObj["activeEnd"] = event.activeEndSec;
        eventsArray.append(eventObj);
    }
    root["events"] = eventsArray;
    return root;
}

bool AssProcessor::writeDescription(const QString& outputPath, const CaptionTrack& track)
{
    QFile file(outputPath);
    if (!file.open(QIODevice::WriteOnly))
    {
        emit logMessage("Error: cannot write caption description " + outputPath + ": " + file.errorString(),
                        LogCategory::APP);
        return false;
    }
    if (file.write(QJsonDocument(toJson(track)).toJson(QJsonDocument::Indented)) < 0)
    {
        emit logMessage("Error: writing " + outputPath + " failed: " + file.errorString(), LogCategory::APP);
        return false;
    }
    file.close();
    return true;
}
