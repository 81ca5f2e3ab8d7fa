#include "workflowmanager.h"
#include "assprocessor.h"
#include "jobstore.h"
#include "processmanager.h"
#include "transcriptparser.h"
#include <QFile>
#include <QRegularExpression>
#include <QTextStream>


WorkflowManager::WorkflowManager(const QString &jobId, JobStore *store, const PresetTable &presets, QObject *parent)
    : QObject(parent),
    m_jobId(jobId),
    m_store(store),
    m_presets(presets)
{
    const AppSettings &settings = AppSettings::instance();
    m_ffmpegPath = settings.ffmpegPath();
    m_ffprobePath = settings.ffprobePath();
    m_whisperPath = settings.whisperPath();
    m_whisperModelPath = settings.whisperModelPath();
    m_alignerCommand = settings.alignerCommand().trimmed();
    m_renderCommand = settings.renderCommand();
    m_outputDir = settings.outputDir();
    m_deleteTempFiles = settings.deleteTempFiles();
    m_limits.minFontSizePx = settings.minFontSizePx();
    m_limits.maxFontSizePx = settings.maxFontSizePx();

    m_processManager = new ProcessManager(this);
    m_assProcessor = new AssProcessor(this);

    connect(m_assProcessor, &AssProcessor::logMessage, this, &WorkflowManager::logMessage);
    connect(m_processManager, &ProcessManager::processOutput, this, &WorkflowManager::onProcessStdOut);
    connect(m_processManager, &ProcessManager::processStdErr, this, &WorkflowManager::onProcessStdErr);
    connect(m_processManager, &ProcessManager::processFinished, this, &WorkflowManager::onProcessFinished);
    connect(m_processManager, &ProcessManager::processStartFailed, this, &WorkflowManager::onProcessStartFailed);
    connect(m_processManager, &ProcessManager::processError, this,
            [this](const QString &error) { emit logMessage(error, categoryForStep(m_currentStep)); });
}

WorkflowManager::~WorkflowManager()
{
    // processes killed here must not call back into a half-destroyed manager
    disconnect(m_processManager, nullptr, this, nullptr);
    m_processManager->killProcess();
}

void WorkflowManager::start()
{
    if (!m_store->snapshot(m_jobId, m_job)) {
        emit logMessage("Job " + m_jobId + " is not registered.", LogCategory::DEFECT);
        m_isFinished = true;
        emit finished(m_jobId);
        return;
    }

    emit logMessage(QString("Job %1: %2 (%3 captions, preset '%4', %5 px, %6 precision)")
                        .arg(m_jobId, QFileInfo(m_job.inputPath).fileName(),
                             captionModeToString(m_job.options.captionMode), m_job.options.presetId)
                        .arg(m_job.options.fontSizePx)
                        .arg(precisionToString(m_job.options.precision)),
                    LogCategory::APP);

    // configuration problems fail the job before any tool runs
    CaptionError error;
    if (!CaptionPipeline::validateOptions(m_job.options, m_presets, m_limits, error)) {
        failJob(error);
        return;
    }
    if (!QFileInfo::exists(m_job.inputPath)) {
        failJob(CaptionError::make(CaptionErrorKind::InputMalformed, "Input video not found", m_job.inputPath));
        return;
    }

    m_paths = JobPaths(m_outputDir, m_jobId);
    m_outputVideoPath = m_paths.renderedVideo(m_job.inputPath);
    emit logMessage("Job directory: " + m_paths.basePath, LogCategory::APP);

    if (!enterStage(JobStage::Extracting))
        return;
    readMediaDuration();
    extractAudio();
}

bool WorkflowManager::enterStage(JobStage stage)
{
    if (m_isFinished)
        return false;

    if (m_store->isCancelRequested(m_jobId)) {
        cancelJob();
        return false;
    }

    if (!m_store->advance(m_jobId, stage)) {
        failJob(CaptionError::make(CaptionErrorKind::InternalInvariantViolation, "Job store rejected a stage transition",
                                   "to " + jobStageToString(stage)));
        return false;
    }

    emit progressUpdated(progressForStage(stage), jobStageToString(stage));
    return true;
}

void WorkflowManager::readMediaDuration()
{
    QByteArray output;
    const QStringList args = {"-v", "error", "-show_entries", "format=duration",
                              "-of", "default=noprint_wrappers=1:nokey=1", m_job.inputPath};

    if (!m_processManager->executeAndWait(m_ffprobePath, args, output)) {
        emit logMessage("Warning: clip duration unknown (ffprobe failed), captions are not clamped to the clip end.",
                        LogCategory::APP);
        m_clipDurationSec = 0.0;
        return;
    }

    bool ok = false;
    const double duration = QString::fromUtf8(output).trimmed().toDouble(&ok);
    if (!ok || duration <= 0.0) {
        emit logMessage("Warning: ffprobe returned no usable duration: " + QString::fromUtf8(output).trimmed(),
                        LogCategory::APP);
        m_clipDurationSec = 0.0;
        return;
    }

    m_clipDurationSec = duration;
    emit logMessage(QString("Clip duration: %1 s").arg(duration, 0, 'f', 2), LogCategory::FFMPEG);
}

void WorkflowManager::extractAudio()
{
    emit logMessage("Step 1: extracting mono 16 kHz audio...", LogCategory::APP);
    m_currentStep = Step::ExtractingAudio;

    const QStringList args = {"-hide_banner", "-y", "-i", m_job.inputPath, "-vn", "-acodec", "pcm_s16le",
                              "-ar", "16000", "-ac", "1", m_paths.audio()};
    m_processManager->startProcess(m_ffmpegPath, args);
}

void WorkflowManager::transcribe()
{
    if (!enterStage(JobStage::Transcribing))
        return;

    emit logMessage("Step 2: speech recognition...", LogCategory::APP);
    m_currentStep = Step::Transcribing;

    // -ml 1 -sow: one word per segment, split on word boundaries
    const QStringList args = {"-m", m_whisperModelPath, "-f", m_paths.audio(), "-oj",
                              "-of", m_paths.transcriptBase(), "-ml", "1", "-sow"};
    m_processManager->startProcess(m_whisperPath, args);
}

void WorkflowManager::align()
{
    if (!enterStage(JobStage::Aligning))
        return;

    if (m_job.options.precision == Precision::Mvp) {
        emit logMessage("Step 3: forced alignment skipped (mvp precision), using recognizer timing.", LogCategory::APP);
        runCaptionStages();
        return;
    }
    if (m_alignerCommand.isEmpty()) {
        emit logMessage("Step 3: no aligner configured, using recognizer timing.", LogCategory::APP);
        runCaptionStages();
        return;
    }

    emit logMessage("Step 3: forced alignment...", LogCategory::APP);

    QFile textFile(m_paths.transcriptText());
    if (!textFile.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        failStage("Cannot write transcript text for the aligner", textFile.errorString());
        return;
    }
    QTextStream out(&textFile);
    out.setEncoding(QStringConverter::Utf8);
    out << TranscriptParser::transcriptText(m_tokens) << "\n";
    out.flush();
    textFile.close();

    const QMap<QString, QString> placeholders = {{"%AUDIO%", m_paths.audio()},
                                                 {"%TRANSCRIPT%", m_paths.transcriptJson()},
                                                 {"%TEXT%", m_paths.transcriptText()},
                                                 {"%OUTPUT%", m_paths.alignment()}};
    QStringList args = prepareCommandArguments(m_alignerCommand, placeholders);
    if (args.isEmpty()) {
        failJob(CaptionError::make(CaptionErrorKind::ConfigurationInvalid, "Aligner command is empty",
                                   m_alignerCommand));
        return;
    }

    QString program = args.takeFirst();
    m_currentStep = Step::Aligning;
    m_processManager->startProcess(program, args);
}

void WorkflowManager::runCaptionStages()
{
    m_currentStep = Step::Idle;
    CaptionPipeline pipeline(m_job.options, m_presets, m_limits);

    if (!enterStage(JobStage::Filtering))
        return;
    if (!pipeline.prepare(m_tokens, m_clipDurationSec) || !pipeline.filter()) {
        failJob(pipeline.error());
        return;
    }
    if (m_job.options.captionMode == CaptionMode::Words) {
        int fillers = 0;
        for (const WordToken &token : pipeline.tokens()) {
            if (token.isFillerCandidate)
                ++fillers;
        }
        emit logMessage(QString("Filler words: %1 of %2 (%3)")
                            .arg(fillers)
                            .arg(pipeline.tokens().size())
                            .arg(m_job.options.showFillerWords ? "dimmed" : "hidden"),
                        LogCategory::APP);
    }

    if (!enterStage(JobStage::Smoothing))
        return;
    if (!pipeline.smooth()) {
        failJob(pipeline.error());
        return;
    }
    for (const QString &warning : pipeline.warnings()) {
        emit logMessage("Warning: " + warning, LogCategory::APP);
    }
    emit logMessage("Timing: " + pipeline.stats().summary(), LogCategory::APP);

    if (!enterStage(JobStage::Building))
        return;
    if (!pipeline.build()) {
        failJob(pipeline.error());
        return;
    }
    emit logMessage(QString("Caption track: %1 events").arg(pipeline.track().events.size()), LogCategory::APP);

    render(pipeline.track());
}

void WorkflowManager::render(const CaptionTrack &track)
{
    if (!enterStage(JobStage::Rendering))
        return;

    emit logMessage("Step 4: burning captions into the video...", LogCategory::APP);

    if (!m_assProcessor->writeScript(m_paths.captionsAss(), track)
        || !m_assProcessor->writeDescription(m_paths.captionsJson(), track)) {
        failStage("Cannot write caption files", m_paths.basePath);
        return;
    }

    const QMap<QString, QString> placeholders = {
        {"%INPUT%", m_job.inputPath},
        {"%OUTPUT%", m_outputVideoPath},
        {"%SUBS%", "'" + escapePathForFfmpegFilter(m_paths.captionsAss()) + "'"}};
    QStringList args = prepareCommandArguments(m_renderCommand, placeholders);
    if (args.isEmpty()) {
        failJob(CaptionError::make(CaptionErrorKind::ConfigurationInvalid, "Render command is empty", m_renderCommand));
        return;
    }

    QString program = args.takeFirst();
    if (program == "ffmpeg") {
        program = m_ffmpegPath;
    }

    emit logMessage("Render: " + program + " " + args.join(" "), LogCategory::FFMPEG);
    m_currentStep = Step::Rendering;
    m_processManager->startProcess(program, args);
}

void WorkflowManager::finishWorkflow()
{
    m_currentStep = Step::Idle;

    if (m_deleteTempFiles && QFile::exists(m_paths.audio()) && !QFile::remove(m_paths.audio())) {
        emit logMessage("Warning: could not delete temporary file " + m_paths.audio(), LogCategory::APP);
    }

    if (!m_store->complete(m_jobId, m_outputVideoPath)) {
        emit logMessage("Job " + m_jobId + " was already finished, completion ignored.", LogCategory::DEFECT);
    }
    emit progressUpdated(100, jobStageToString(JobStage::Completed));
    emit logMessage("Job done: " + m_outputVideoPath, LogCategory::APP);

    m_isFinished = true;
    emit finished(m_jobId);
}

void WorkflowManager::onProcessFinished(int exitCode, QProcess::ExitStatus exitStatus)
{
    if (m_isFinished)
        return;

    if (m_processManager->wasKilled()) {
        cancelJob();
        return;
    }

    if (exitCode != 0 || exitStatus != QProcess::NormalExit) {
        failStage(stepLabel(m_currentStep) + " failed",
                  QString("exit code %1 (%2)\n%3")
                      .arg(exitCode)
                      .arg(exitStatus == QProcess::NormalExit ? "normal exit" : "crashed")
                      .arg(m_processManager->stderrTail()));
        return;
    }

    switch (m_currentStep)
    {
        case Step::ExtractingAudio:
        {
            if (!QFileInfo::exists(m_paths.audio())) {
                failStage("Audio extraction produced no file", m_paths.audio());
                return;
            }
            emit logMessage("Audio extracted.", LogCategory::APP);
            transcribe();
            break;
        }
        case Step::Transcribing:
        {
            if (!QFileInfo::exists(m_paths.transcriptJson())) {
                failStage("Speech recognition produced no transcript", m_paths.transcriptJson());
                return;
            }
            QString error;
            TokenList tokens;
            if (!TranscriptParser::parseAsrFile(m_paths.transcriptJson(), tokens, &error)) {
                failStage("Cannot read the recognizer output", error);
                return;
            }
            m_tokens = tokens;
            emit logMessage(QString("Recognized %1 words.").arg(m_tokens.size()), LogCategory::WHISPER);
            align();
            break;
        }
        case Step::Aligning:
        {
            if (!QFileInfo::exists(m_paths.alignment())) {
                failStage("Forced aligner produced no output", m_paths.alignment());
                return;
            }
            AlignmentStats stats;
            QString error;
            if (!TranscriptParser::applyAlignmentFile(m_paths.alignment(), m_tokens, &stats, &error)) {
                failStage("Cannot read the aligner output", error);
                return;
            }
            emit logMessage(QString("Aligned %1 of %2 words (%3%).")
                                .arg(stats.alignedTokens)
                                .arg(m_tokens.size())
                                .arg(qRound(stats.rate(m_tokens.size()) * 100)),
                            LogCategory::ALIGNER);
            if (stats.repairedTokens > 0) {
                emit logMessage(QString("%1 words were shifted to keep the timeline ordered.").arg(stats.repairedTokens),
                                LogCategory::ALIGNER);
            }
            runCaptionStages();
            break;
        }
        case Step::Rendering:
        {
            if (!QFileInfo::exists(m_outputVideoPath)) {
                failStage("Render produced no output file", m_outputVideoPath);
                return;
            }
            finishWorkflow();
            break;
        }
        case Step::Idle:
            break;
    }
}

void WorkflowManager::onProcessStartFailed(const QString &error)
{
    if (m_isFinished)
        return;
    failStage(stepLabel(m_currentStep) + " could not be started", error);
}

void WorkflowManager::onProcessStdOut(const QString &output)
{
    const QString text = output.trimmed();
    if (!text.isEmpty()) {
        emit logMessage(text, m_currentStep == Step::Idle ? LogCategory::DEBUG : categoryForStep(m_currentStep));
    }
}

void WorkflowManager::onProcessStdErr(const QString &output)
{
    const QString text = output.trimmed();
    if (!text.isEmpty()) {
        emit logMessage("STDERR: " + text, categoryForStep(m_currentStep));
    }

    if (m_currentStep != Step::Rendering || m_clipDurationSec <= 0.0)
        return;

    // ffmpeg writes progress in chunks, the last time= of the chunk wins
    static const QRegularExpression re("time=(\\d{2}):(\\d{2}):(\\d{2})\\.(\\d{2})");
    QRegularExpressionMatchIterator it = re.globalMatch(output);
    QRegularExpressionMatch match;
    while (it.hasNext()) {
        match = it.next();
    }
    if (!match.hasMatch())
        return;

    const double currentTimeS = match.captured(1).toInt() * 3600 + match.captured(2).toInt() * 60
                                + match.captured(3).toInt() + match.captured(4).toInt() / 100.0;
    const int base = progressForStage(JobStage::Rendering);
    const int percentage = base + static_cast<int>(qMin(1.0, currentTimeS / m_clipDurationSec) * (99 - base));
    if (m_store->updateProgress(m_jobId, percentage)) {
        emit progressUpdated(percentage, jobStageToString(JobStage::Rendering));
    }
}

void WorkflowManager::failJob(const CaptionError &error)
{
    if (m_isFinished)
        return;
    m_isFinished = true;
    m_currentStep = Step::Idle;

    const LogCategory category = error.kind == CaptionErrorKind::InternalInvariantViolation ? LogCategory::DEFECT
                                                                                              : LogCategory::APP;
    emit logMessage(QString("Job %1 failed (%2): %3").arg(m_jobId, captionErrorKindToString(error.kind), error.message),
                    category);
    if (!error.diagnostics.isEmpty()) {
        emit logMessage(error.diagnostics, category);
    }

    if (!m_store->fail(m_jobId, error)) {
        emit logMessage("Job " + m_jobId + " was already finished, error not recorded.", LogCategory::DEBUG);
    }
    emit finished(m_jobId);
}

void WorkflowManager::failStage(const QString &message, const QString &diagnostics)
{
    failJob(CaptionError::make(CaptionErrorKind::ExternalStageFailed, message, diagnostics));
}

void WorkflowManager::cancelJob()
{
    if (m_isFinished)
        return;
    m_isFinished = true;
    m_currentStep = Step::Idle;

    emit logMessage("Job " + m_jobId + " cancelled.", LogCategory::APP);
    if (!m_store->markCancelled(m_jobId)) {
        emit logMessage("Job " + m_jobId + " was already finished, cancel ignored.", LogCategory::DEBUG);
    }
    emit finished(m_jobId);
}

void WorkflowManager::cancelOperation()
{
    if (m_isFinished)
        return;

    emit logMessage("Cancel requested for job " + m_jobId + ".", LogCategory::APP);
    // a running tool is killed, onProcessFinished() then sees wasKilled()
    if (m_processManager->isRunning()) {
        killChildProcesses();
    }
}

void WorkflowManager::killChildProcesses()
{
    if (m_processManager) {
        m_processManager->killProcess();
    }
}

ProcessManager *WorkflowManager::getProcessManager() const
{
    return m_processManager;
}

QString WorkflowManager::jobId() const
{
    return m_jobId;
}

bool WorkflowManager::isFinished() const
{
    return m_isFinished;
}

LogCategory WorkflowManager::categoryForStep(Step step) const
{
    switch (step)
    {
        case Step::ExtractingAudio:
        case Step::Rendering:
            return LogCategory::FFMPEG;
        case Step::Transcribing:
            return LogCategory::WHISPER;
        case Step::Aligning:
            return LogCategory::ALIGNER;
        case Step::Idle:
            break;
    }
    return LogCategory::APP;
}

QString WorkflowManager::stepLabel(Step step)
{
    switch (step)
    {
        case Step::ExtractingAudio:
            return "Audio extraction";
        case Step::Transcribing:
            return "Speech recognition";
        case Step::Aligning:
            return "Forced alignment";
        case Step::Rendering:
            return "Render";
        case Step::Idle:
            break;
    }
    return "External tool";
}

QStringList WorkflowManager::prepareCommandArguments(const QString &commandTemplate,
                                                     const QMap<QString, QString> &placeholders)
{
    QString processedTemplate = commandTemplate;
    for (auto it = placeholders.constBegin(); it != placeholders.constEnd(); ++it) {
        processedTemplate.replace(it.key(), it.value());
    }

    // QProcess handles quoted arguments
    return QProcess::splitCommand(processedTemplate);
}

QString WorkflowManager::escapePathForFfmpegFilter(const QString &path)
{
    QString escaped = QDir::fromNativeSeparators(QFileInfo(path).absoluteFilePath());
    escaped.replace(':', "\\:");
    escaped.replace('\'', "\\'");
    return escaped;
}
