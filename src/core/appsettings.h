#ifndef APPSETTINGS_H
#define APPSETTINGS_H

#include <QObject>
#include <QSettings>
#include <QSet>
#include "stylepreset.h"


enum class LogCategory {
    APP,
    FFMPEG,
    WHISPER,
    ALIGNER,
    DEFECT,
    DEBUG
};

QString logCategoryToString(LogCategory category);

class AppSettings : public QObject
{
    Q_OBJECT
private:
    explicit AppSettings(QObject *parent = nullptr);
    AppSettings(const AppSettings&) = delete;
    AppSettings& operator=(const AppSettings&) = delete;

public:
    static AppSettings& instance();
    void load();
    void save();

    QSet<LogCategory> enabledLogCategories() const;
    void setEnabledLogCategories(const QSet<LogCategory> &categories);
    QString ffmpegPath() const;
    void setFfmpegPath(const QString &path);
    QString ffprobePath() const;
    void setFfprobePath(const QString &path);
    QString whisperPath() const;
    void setWhisperPath(const QString &path);
    QString whisperModelPath() const;
    void setWhisperModelPath(const QString &path);
    QString alignerCommand() const;
    void setAlignerCommand(const QString &command);
    QString renderCommand() const;
    void setRenderCommand(const QString &command);
    int maxParallelJobs() const;
    void setMaxParallelJobs(int count);
    int jobRetentionMinutes() const;
    void setJobRetentionMinutes(int minutes);
    QString outputDir() const;
    void setOutputDir(const QString &path);
    bool deleteTempFiles() const;
    void setDeleteTempFiles(bool enabled);
    int minFontSizePx() const;
    int maxFontSizePx() const;
    void setFontSizeLimits(int minPx, int maxPx);
    QString presetsFile() const;
    void setPresetsFile(const QString &path);

    // Built-in presets unless presetsFile points to a JSON array
    bool loadPresets(PresetTable &table, QString *error = nullptr) const;

    static QString defaultRenderCommand();

private:
    void loadDefaults();
    QSet<LogCategory> m_enabledLogCategories;
    QString m_ffmpegPath;
    QString m_ffprobePath;
    QString m_whisperPath;
    QString m_whisperModelPath;
    QString m_alignerCommand;
    QString m_renderCommand;
    int m_maxParallelJobs;
    int m_jobRetentionMinutes;
    QString m_outputDir;
    bool m_deleteTempFiles;
    int m_minFontSizePx;
    int m_maxFontSizePx;
    QString m_presetsFile;
};

#endif // APPSETTINGS_H
