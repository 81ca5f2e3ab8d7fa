#ifndef ASSPROCESSOR_H
#define ASSPROCESSOR_H

#include "appsettings.h"
#include "subtitletrackbuilder.h"

#include <QJsonObject>
#include <QObject>
#include <QStringList>

class AssProcessor : public QObject
{
    Q_OBJECT
public:
    static constexpr int DefaultPlayResX = 1080;
    static constexpr int DefaultPlayResY = 1920;

    explicit AssProcessor(QObject* parent = nullptr);

    bool writeScript(const QString& outputPath, const CaptionTrack& track, int playResX = DefaultPlayResX,
                     int playResY = DefaultPlayResY);
    bool writeDescription(const QString& outputPath, const CaptionTrack& track);

    static QStringList buildScript(const CaptionTrack& track, int playResX = DefaultPlayResX,
                                   int playResY = DefaultPlayResY);
    static QJsonObject toJson(const CaptionTrack& track);
    static QString formatAssTime(double seconds);
    static QString escapeText(const QString& text);

signals:
    void logMessage(const QString&, LogCategory);

private:
    static QString dialogueLine(const CaptionEvent& event, int playResX, int playResY);
};

#endif // ASSPROCESSOR_H
