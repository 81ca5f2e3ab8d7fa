#include "appsettings.h"
#include <QCoreApplication>
#include <QStandardPaths>
#include <QDir>
#include <QFileInfo>


static QString findExecutablePath(const QString &exeName) {
    // 1. tools/ next to the binary
    const QString kAppDir = QCoreApplication::applicationDirPath();
    QString candidate = QDir(kAppDir).filePath("tools/" + exeName);
    if (QFileInfo::exists(candidate)) {
        return QDir::toNativeSeparators(candidate);
    }

    // 2. next to the binary
    candidate = QDir(kAppDir).filePath(exeName);
    if (QFileInfo::exists(candidate)) {
        return QDir::toNativeSeparators(candidate);
    }

    // 3. PATH
    QString path = QStandardPaths::findExecutable(exeName);
    if (!path.isEmpty()) {
        return QDir::toNativeSeparators(path);
    }

    // 4. bare name, the process start will report it missing
    return exeName;
}

/**
 * @brief Load a tool path from settings, re-detecting if the stored path no longer exists.
 */
static QString loadToolPath(const QSettings &settings, const QString &key, const QString &exeName) {
    QString stored = settings.value(key).toString();
    if (!stored.isEmpty() && QFileInfo::exists(stored)) {
        return stored;
    }
    return findExecutablePath(exeName);
}

QString logCategoryToString(LogCategory category) {
    switch (category) {
    case LogCategory::APP: return "APP";
    case LogCategory::FFMPEG: return "FFMPEG";
    case LogCategory::WHISPER: return "WHISPER";
    case LogCategory::ALIGNER: return "ALIGNER";
    case LogCategory::DEFECT: return "DEFECT";
    case LogCategory::DEBUG: return "DEBUG";
    }
    return "APP";
}

AppSettings& AppSettings::instance() {
    static AppSettings self;
    return self;
}

AppSettings::AppSettings(QObject *parent) : QObject(parent) {
    loadDefaults();
}

void AppSettings::load() {
    QSettings settings("CapFuse", "capfuse");

    m_ffmpegPath = loadToolPath(settings, "paths/ffmpeg", "ffmpeg");
    m_whisperPath = loadToolPath(settings, "paths/whisper", "whisper-cli");
    m_whisperModelPath = settings.value("paths/whisperModel", "models/ggml-base.bin").toString();

    // ffprobe usually sits next to ffmpeg
    QString storedProbe = settings.value("paths/ffprobe").toString();
    if (!storedProbe.isEmpty() && QFileInfo::exists(storedProbe)) {
        m_ffprobePath = storedProbe;
    } else {
        QString sibling = QDir(QFileInfo(m_ffmpegPath).absolutePath()).filePath("ffprobe");
        m_ffprobePath = QFileInfo::exists(sibling) ? sibling : findExecutablePath("ffprobe");
    }

    m_alignerCommand = settings.value("alignment/command", "").toString();
    m_renderCommand = settings.value("render/command", defaultRenderCommand()).toString();
    m_maxParallelJobs = qMax(1, settings.value("jobs/maxParallel", 4).toInt());
    m_jobRetentionMinutes = qMax(1, settings.value("jobs/retentionMinutes", 60).toInt());
    m_outputDir = settings.value("jobs/outputDir", "output").toString();
    m_deleteTempFiles = settings.value("general/deleteTempFiles", true).toBool();
    m_minFontSizePx = settings.value("captions/minFontSizePx", 16).toInt();
    m_maxFontSizePx = settings.value("captions/maxFontSizePx", 120).toInt();
    m_presetsFile = settings.value("captions/presetsFile", "").toString();

    if (m_renderCommand.trimmed().isEmpty()) {
        m_renderCommand = defaultRenderCommand();
    }

    m_enabledLogCategories.clear();
    QVariantList enabledCategoriesInts = settings.value("logging/enabledCategories").toList();
    if (enabledCategoriesInts.isEmpty()) {
        m_enabledLogCategories.insert(LogCategory::APP);
        m_enabledLogCategories.insert(LogCategory::DEFECT);
    } else {
        for (const QVariant& val : enabledCategoriesInts) {
            m_enabledLogCategories.insert(static_cast<LogCategory>(val.toInt()));
        }
    }
}

void AppSettings::save() {
    QSettings settings("CapFuse", "capfuse");
    settings.setValue("paths/ffmpeg", m_ffmpegPath);
    settings.setValue("paths/ffprobe", m_ffprobePath);
    settings.setValue("paths/whisper", m_whisperPath);
    settings.setValue("paths/whisperModel", m_whisperModelPath);
    settings.setValue("alignment/command", m_alignerCommand);
    settings.setValue("render/command", m_renderCommand);
    settings.setValue("jobs/maxParallel", m_maxParallelJobs);
    settings.setValue("jobs/retentionMinutes", m_jobRetentionMinutes);
    settings.setValue("jobs/outputDir", m_outputDir);
    settings.setValue("general/deleteTempFiles", m_deleteTempFiles);
    settings.setValue("captions/minFontSizePx", m_minFontSizePx);
    settings.setValue("captions/maxFontSizePx", m_maxFontSizePx);
    settings.setValue("captions/presetsFile", m_presetsFile);

    QVariantList enabledCategoriesInts;
    for (const auto& category : m_enabledLogCategories) {
        enabledCategoriesInts.append(static_cast<int>(category));
    }
    settings.setValue("logging/enabledCategories", enabledCategoriesInts);
}

void AppSettings::loadDefaults() {
    m_enabledLogCategories = {LogCategory::APP, LogCategory::DEFECT};
    m_ffmpegPath = "ffmpeg";
    m_ffprobePath = "ffprobe";
    m_whisperPath = "whisper-cli";
    m_whisperModelPath = "models/ggml-base.bin";
    m_alignerCommand.clear();
    m_renderCommand = defaultRenderCommand();
    m_maxParallelJobs = 4;
    m_jobRetentionMinutes = 60;
    m_outputDir = "output";
    m_deleteTempFiles = true;
    m_minFontSizePx = 16;
    m_maxFontSizePx = 120;
    m_presetsFile.clear();
}

QString AppSettings::defaultRenderCommand() {
    // %INPUT% - source video
    // %SUBS% - escaped path to the .ass script for the subtitles filter
    // %OUTPUT% - rendered video
    return "ffmpeg -y -hide_banner -i \"%INPUT%\" -vf \"subtitles=%SUBS%\" -c:v libx264 -preset veryfast -crf 21 "
           "-c:a copy -movflags +faststart -pix_fmt yuv420p \"%OUTPUT%\"";
}

bool AppSettings::loadPresets(PresetTable &table, QString *error) const {
    if (m_presetsFile.isEmpty()) {
        table = PresetTable::builtIn();
        return true;
    }
    return PresetTable::loadFromFile(m_presetsFile, table, error);
}


QSet<LogCategory> AppSettings::enabledLogCategories() const { return m_enabledLogCategories; }
void AppSettings::setEnabledLogCategories(const QSet<LogCategory> &categories) { m_enabledLogCategories = categories; }
QString AppSettings::ffmpegPath() const { return m_ffmpegPath; }
void AppSettings::setFfmpegPath(const QString &path) { m_ffmpegPath = path; }
QString AppSettings::ffprobePath() const { return m_ffprobePath; }
void AppSettings::setFfprobePath(const QString &path) { m_ffprobePath = path; }
QString AppSettings::whisperPath() const { return m_whisperPath; }
void AppSettings::setWhisperPath(const QString &path) { m_whisperPath = path; }
QString AppSettings::whisperModelPath() const { return m_whisperModelPath; }
void AppSettings::setWhisperModelPath(const QString &path) { m_whisperModelPath = path; }
QString AppSettings::alignerCommand() const { return m_alignerCommand; }
void AppSettings::setAlignerCommand(const QString &command) { m_alignerCommand = command; }
QString AppSettings::renderCommand() const { return m_renderCommand; }
void AppSettings::setRenderCommand(const QString &command) { m_renderCommand = command; }
int AppSettings::maxParallelJobs() const { return m_maxParallelJobs; }
void AppSettings::setMaxParallelJobs(int count) { m_maxParallelJobs = qMax(1, count); }
int AppSettings::jobRetentionMinutes() const { return m_jobRetentionMinutes; }
void AppSettings::setJobRetentionMinutes(int minutes) { m_jobRetentionMinutes = qMax(1, minutes); }
QString AppSettings::outputDir() const { return m_outputDir; }
void AppSettings::setOutputDir(const QString &path) { m_outputDir = path; }
bool AppSettings::deleteTempFiles() const { return m_deleteTempFiles; }
void AppSettings::setDeleteTempFiles(bool enabled) { m_deleteTempFiles = enabled; }
int AppSettings::minFontSizePx() const { return m_minFontSizePx; }
int AppSettings::maxFontSizePx() const { return m_maxFontSizePx; }
void AppSettings::setFontSizeLimits(int minPx, int maxPx) { m_minFontSizePx = minPx; m_maxFontSizePx = maxPx; }
QString AppSettings::presetsFile() const { return m_presetsFile; }
void AppSettings::setPresetsFile(const QString &path) { m_presetsFile = path; }
