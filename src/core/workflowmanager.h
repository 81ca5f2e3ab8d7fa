#ifndef WORKFLOWMANAGER_H
#define WORKFLOWMANAGER_H

#include "appsettings.h"
#include "captiongenerator.h"
#include "jobrecord.h"
#include "stylepreset.h"

#include <QDir>
#include <QFileInfo>
#include <QMap>
#include <QObject>
#include <QProcess>

class AssProcessor;
class JobStore;
class ProcessManager;

struct JobPaths
{
    QString basePath;

    /**
     * @brief Replaces characters that are forbidden in file names.
     *
     * Apostrophe (') is also replaced as it breaks ffmpeg filter paths.
     */
    static QString sanitizeForPath(const QString& name)
    {
        QString result = name;
        result.replace(':', ' ');
        result.replace('"', ' ');
        result.replace('<', ' ');
        result.replace('>', ' ');
        result.replace('|', ' ');
        result.replace('?', ' ');
        result.replace('*', ' ');
        result.replace('\'', ' ');
        result = result.simplified();
        return result;
    }

    JobPaths() = default;

    // creates <outputDir>/<jobId>
    JobPaths(const QString& outputDir, const QString& jobId)
    {
        basePath = QDir(outputDir).filePath(jobId);
        QDir(basePath).mkpath(".");
    }

    QString audio() const
    {
        return QDir(basePath).filePath("audio.wav");
    }
    // whisper-cli appends .json to -of
    QString transcriptBase() const
    {
        return QDir(basePath).filePath("transcript");
    }
    QString transcriptJson() const
    {
        return transcriptBase() + ".json";
    }
    QString transcriptText() const
    {
        return QDir(basePath).filePath("transcript.txt");
    }
    QString alignment() const
    {
        return QDir(basePath).filePath("alignment.json");
    }
    QString captionsAss() const
    {
        return QDir(basePath).filePath("captions.ass");
    }
    QString captionsJson() const
    {
        return QDir(basePath).filePath("captions.json");
    }
    QString renderedVideo(const QString& inputPath) const
    {
        return QDir(basePath).filePath(sanitizeForPath(QFileInfo(inputPath).completeBaseName() + "_captioned.mp4"));
    }
};

/**
 * @brief Drives one caption job from the source video to the rendered result
 *
 * External stages run as asynchronous child processes, the in-core caption
 * stages run synchronously between them. Every stage boundary is published to
 * the JobStore; a cancel request is honoured at the next boundary or by killing
 * the running child process.
 */
class WorkflowManager : public QObject
{
    Q_OBJECT

public:
    WorkflowManager(const QString& jobId, JobStore* store, const PresetTable& presets, QObject* parent = nullptr);
    ~WorkflowManager();

    void start();
    void killChildProcesses();
    ProcessManager* getProcessManager() const;
    QString jobId() const;
    bool isFinished() const;

public slots:
    void cancelOperation();

signals:
    void logMessage(const QString& message, LogCategory category = LogCategory::APP);
    void progressUpdated(int percentage, const QString& stageName = "");
    void finished(const QString& jobId);

private slots:
    void onProcessFinished(int exitCode, QProcess::ExitStatus exitStatus);
    void onProcessStartFailed(const QString& error);
    void onProcessStdOut(const QString& output);
    void onProcessStdErr(const QString& output);

private:
    enum class Step
    {
        Idle,
        ExtractingAudio,
        Transcribing,
        Aligning,
        Rendering
    };

    Step m_currentStep = Step::Idle;

    bool enterStage(JobStage stage);
    void readMediaDuration();
    void extractAudio();
    void transcribe();
    void align();
    void runCaptionStages();
    void render(const CaptionTrack& track);
    void finishWorkflow();

    void failJob(const CaptionError& error);
    void failStage(const QString& message, const QString& diagnostics = QString());
    void cancelJob();
    LogCategory categoryForStep(Step step) const;
    static QString stepLabel(Step step);
    QStringList prepareCommandArguments(const QString& commandTemplate, const QMap<QString, QString>& placeholders);
    static QString escapePathForFfmpegFilter(const QString& path);

    QString m_jobId;
    JobStore* m_store;
    PresetTable m_presets;
    JobRecord m_job;
    JobPaths m_paths;
    CaptionLimits m_limits;
    TokenList m_tokens;
    double m_clipDurationSec = 0.0;

    QString m_ffmpegPath;
    QString m_ffprobePath;
    QString m_whisperPath;
    QString m_whisperModelPath;
    QString m_alignerCommand;
    QString m_renderCommand;
    QString m_outputDir;
    QString m_outputVideoPath;
    bool m_deleteTempFiles = true;
    bool m_isFinished = false;

    ProcessManager* m_processManager;
    AssProcessor* m_assProcessor;
};

#endif // WORKFLOWMANAGER_H
