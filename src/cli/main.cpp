#include "appsettings.h"
#include "assprocessor.h"
#include "captiongenerator.h"
#include "commandoptions.h"
#include "jobscheduler.h"
#include "jobstore.h"
#include "logsink.h"
#include "transcriptparser.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QTextStream>

namespace
{

enum ExitCode
{
    ExitOk = 0,
    ExitJobFailed = 1,
    ExitUsage = 2
};

int runCaptionCommand(const QCommandLineParser& parser, const QStringList& files, const JobOptions& options,
                      const PresetTable& presets, LogSink& log)
{
    if (files.size() != 1)
    {
        log.logMessage("caption expects exactly one transcript JSON file.", LogCategory::APP);
        return ExitUsage;
    }

    bool ok = false;
    const double clipDuration = parser.value("clip-duration").toDouble(&ok);
    if (!ok)
    {
        log.logMessage("Clip duration is not a number: " + parser.value("clip-duration"), LogCategory::APP);
        return ExitUsage;
    }

    TokenList tokens;
    QString error;
    if (!TranscriptParser::parseAsrFile(files.first(), tokens, &error))
    {
        log.logMessage("Cannot read transcript: " + error, LogCategory::APP);
        return ExitJobFailed;
    }

    if (parser.isSet("alignment"))
    {
        AlignmentStats stats;
        if (!TranscriptParser::applyAlignmentFile(parser.value("alignment"), tokens, &stats, &error))
        {
            log.logMessage("Cannot read alignment: " + error, LogCategory::ALIGNER);
            return ExitJobFailed;
        }
        log.logMessage(QString("Aligned %1 of %2 words.").arg(stats.alignedTokens).arg(tokens.size()),
                       LogCategory::ALIGNER);
    }

    const AppSettings& settings = AppSettings::instance();
    CaptionLimits limits;
    limits.minFontSizePx = settings.minFontSizePx();
    limits.maxFontSizePx = settings.maxFontSizePx();

    const CaptionTrackResult result = generateCaptionTrack(tokens, options, presets, clipDuration, limits);
    for (const QString& warning : result.warnings)
    {
        log.logMessage("Warning: " + warning, LogCategory::APP);
    }
    if (!result.isOk())
    {
        const LogCategory category = result.error.kind == CaptionErrorKind::InternalInvariantViolation
                                         ? LogCategory::DEFECT
                                         : LogCategory::APP;
        log.logMessage(QString("%1: %2").arg(captionErrorKindToString(result.error.kind), result.error.message),
                       category);
        if (!result.error.diagnostics.isEmpty())
            log.logMessage(result.error.diagnostics, category);
        return ExitJobFailed;
    }
    log.logMessage("Timing: " + result.stats.summary(), LogCategory::APP);

    const QString assPath = parser.value("out");
    const QString jsonPath = QDir(QFileInfo(assPath).absolutePath()).filePath(QFileInfo(assPath).completeBaseName()
                                                                               + ".json");
    AssProcessor assProcessor;
    QObject::connect(&assProcessor, &AssProcessor::logMessage, &log, &LogSink::logMessage);
    if (!assProcessor.writeScript(assPath, result.track) || !assProcessor.writeDescription(jsonPath, result.track))
    {
        return ExitJobFailed;
    }

    log.logMessage(QString("%1 caption events written to %2").arg(result.track.events.size()).arg(assPath),
                   LogCategory::APP);
    return ExitOk;
}

int runJobsCommand(const QCommandLineParser& parser, const QStringList& files, const JobOptions& options,
                   const PresetTable& presets, LogSink& log, QCoreApplication& app)
{
    if (files.isEmpty())
    {
        log.logMessage("run expects at least one video file.", LogCategory::APP);
        return ExitUsage;
    }

    int maxParallel = 0;
    if (parser.isSet("jobs"))
    {
        bool ok = false;
        maxParallel = parser.value("jobs").toInt(&ok);
        if (!ok || maxParallel < 1)
        {
            log.logMessage("Invalid --jobs value: " + parser.value("jobs"), LogCategory::APP);
            return ExitUsage;
        }
    }

    JobStore store;
    store.startRetentionSweep(AppSettings::instance().jobRetentionMinutes());
    JobScheduler scheduler(&store, presets, maxParallel);

    QObject::connect(&scheduler, &JobScheduler::logMessage, &log, &LogSink::logMessage);
    QObject::connect(&scheduler, &JobScheduler::progressUpdated, &log,
                     [&log](const QString& jobId, int percentage, const QString& stageName)
                     { log.logMessage(QString("%1: %2% (%3)").arg(jobId).arg(percentage).arg(stageName)); });
    QObject::connect(&scheduler, &JobScheduler::allJobsFinished, &app, &QCoreApplication::quit,
                     Qt::QueuedConnection);

    for (const QString& file : files)
    {
        scheduler.submit(QFileInfo(file).absoluteFilePath(), options);
    }

    app.exec();

    // final job table on stdout
    QJsonArray records;
    bool allCompleted = true;
    for (const JobRecord& record : store.jobs())
    {
        QJsonObject json;
        record.write(json);
        records.append(json);
        if (record.status != JobStatus::Completed)
            allCompleted = false;
    }
    QTextStream out(stdout);
    out << QJsonDocument(records).toJson(QJsonDocument::Indented);
    out.flush();

    return allCompleted ? ExitOk : ExitJobFailed;
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("capfuse");
    QCoreApplication::setOrganizationName("CapFuse");

    QCommandLineParser parser;
    parser.setApplicationDescription("Word-level caption generator and burn-in pipeline.");
    parser.addHelpOption();
    parser.addPositionalArgument("command", "run: full jobs on videos; caption: captions from a transcript JSON.");
    parser.addPositionalArgument("files", "Input videos (run) or one transcript JSON (caption).", "<file>...");
    addCaptionOptions(parser);
    parser.process(app);

    AppSettings& settings = AppSettings::instance();
    settings.load();
    if (parser.isSet("output-dir"))
        settings.setOutputDir(parser.value("output-dir"));
    if (parser.isSet("presets"))
        settings.setPresetsFile(parser.value("presets"));

    LogSink log(QDir(settings.outputDir()).filePath("capfuse.log"));

    QStringList positional = parser.positionalArguments();
    if (positional.isEmpty())
    {
        parser.showHelp(ExitUsage);
    }
    const QString command = positional.takeFirst();

    PresetTable presets;
    QString error;
    if (!settings.loadPresets(presets, &error))
    {
        log.logMessage("ConfigurationInvalid: cannot load presets: " + error, LogCategory::APP);
        return ExitUsage;
    }

    JobOptions options;
    if (!readJobOptions(parser, presets, options, error))
    {
        log.logMessage("ConfigurationInvalid: " + error, LogCategory::APP);
        return ExitUsage;
    }

    if (command == "caption")
        return runCaptionCommand(parser, positional, options, presets, log);
    if (command == "run")
        return runJobsCommand(parser, positional, options, presets, log, app);

    log.logMessage("Unknown command: " + command, LogCategory::APP);
    return ExitUsage;
}
