/**
 * @file jobscheduler_test.cpp
 * @brief Tests for JobScheduler and the WorkflowManager stage machine
 *
 * No media tools are required. By default the tool paths point to missing
 * binaries, so every job that gets past validation fails at audio extraction.
 * The full-run and cancel tests install small shell scripts that stand in for
 * ffprobe, ffmpeg and whisper-cli.
 */

#include <QtTest/QtTest>
#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QSignalSpy>
#include <QTemporaryDir>

#include "jobscheduler.h"
#include "jobstore.h"

class JobSchedulerTest : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void cleanup();

    void testSubmit_missingToolFailsExternalStage();
    void testSubmit_missingInputIsMalformed();
    void testSubmit_unknownPresetIsConfigurationError();
    void testSubmit_respectsMaxParallel();
    void testCancel_pendingJobIsCancelledImmediately();
    void testCancel_finishedJobIsRejected();
    void testRun_stubToolsCompleteTheJob();
    void testCancel_runningJobKillsTheTool();

private:
    QString createInput(const QString& name) const;
    QString writeScript(const QString& name, const QByteArray& body) const;
    void useMissingTools();
    void useStubTools(bool slowExtraction);
    static bool waitForIdle(JobScheduler& scheduler, QSignalSpy& allFinished);

    QTemporaryDir m_dir;
    PresetTable m_presets;
};

void JobSchedulerTest::initTestCase()
{
    QVERIFY(m_dir.isValid());
    m_presets = PresetTable::builtIn();

    AppSettings& settings = AppSettings::instance();
    settings.setOutputDir(m_dir.filePath("output"));
    settings.setDeleteTempFiles(true);
    settings.setFontSizeLimits(16, 120);
    settings.setAlignerCommand(QString());
    settings.setRenderCommand(AppSettings::defaultRenderCommand());
    useMissingTools();
}

void JobSchedulerTest::cleanup()
{
    useMissingTools();
}

void JobSchedulerTest::useMissingTools()
{
    AppSettings& settings = AppSettings::instance();
    settings.setFfmpegPath(m_dir.filePath("missing-tools/ffmpeg"));
    settings.setFfprobePath(m_dir.filePath("missing-tools/ffprobe"));
    settings.setWhisperPath(m_dir.filePath("missing-tools/whisper-cli"));
}

QString JobSchedulerTest::writeScript(const QString& name, const QByteArray& body) const
{
    QDir(m_dir.path()).mkpath("stub-tools");
    const QString path = m_dir.filePath("stub-tools/" + name);
    QFile file(path);
    if (file.open(QIODevice::WriteOnly | QIODevice::Truncate))
    {
        file.write("#!/bin/sh\n");
        file.write(body);
        file.close();
    }
    file.setPermissions(QFileDevice::ReadOwner | QFileDevice::WriteOwner | QFileDevice::ExeOwner);
    return path;
}

void JobSchedulerTest::useStubTools(bool slowExtraction)
{
    AppSettings& settings = AppSettings::instance();
    settings.setFfprobePath(writeScript("ffprobe", "echo 2.0\n"));

    // the output file is the last argument, both for extraction and for the render
    const QByteArray ffmpeg = slowExtraction ? QByteArray("exec sleep 30\n")
                                             : QByteArray("for last; do :; done\n"
                                                          "echo 'frame=1 time=00:00:01.00 bitrate=1kbits/s' >&2\n"
                                                          "printf 'media' > \"$last\"\n");
    settings.setFfmpegPath(writeScript(slowExtraction ? "ffmpeg-slow" : "ffmpeg", ffmpeg));

    settings.setWhisperPath(writeScript("whisper-cli",
                                        "while [ $# -gt 0 ]; do\n"
                                        "  if [ \"$1\" = \"-of\" ]; then out=\"$2\"; fi\n"
                                        "  shift\n"
                                        "done\n"
                                        "cat > \"$out.json\" <<'JSON'\n"
                                        "{\"transcription\": [\n"
                                        "  {\"offsets\": {\"from\": 0, \"to\": 400}, \"text\": \" Hello\"},\n"
                                        "  {\"offsets\": {\"from\": 400, \"to\": 900}, \"text\": \" world.\"}\n"
                                        "]}\n"
                                        "JSON\n"));
}

QString JobSchedulerTest::createInput(const QString& name) const
{
    const QString path = m_dir.filePath(name);
    QFile file(path);
    if (file.open(QIODevice::WriteOnly))
    {
        file.write("not really a video");
        file.close();
    }
    return path;
}

bool JobSchedulerTest::waitForIdle(JobScheduler& scheduler, QSignalSpy& allFinished)
{
    if (scheduler.isIdle())
        return true;
    return allFinished.count() > 0 || allFinished.wait(15000);
}

void JobSchedulerTest::testSubmit_missingToolFailsExternalStage()
{
    JobStore store;
    JobScheduler scheduler(&store, m_presets, 2);
    QSignalSpy finished(&scheduler, &JobScheduler::jobFinished);
    QSignalSpy allFinished(&scheduler, &JobScheduler::allJobsFinished);

    const QString id = scheduler.submit(createInput("clip1.mp4"), JobOptions());
    QVERIFY(waitForIdle(scheduler, allFinished));

    QCOMPARE(finished.count(), 1);
    QCOMPARE(finished.first().at(0).toString(), id);

    JobRecord record;
    QVERIFY(store.snapshot(id, record));
    QCOMPARE(record.status, JobStatus::Error);
    QCOMPARE(record.error.kind, CaptionErrorKind::ExternalStageFailed);
    QVERIFY(!record.error.message.isEmpty());
    // the job got as far as extraction before failing
    QCOMPARE(record.progress, progressForStage(JobStage::Extracting));
}

void JobSchedulerTest::testSubmit_missingInputIsMalformed()
{
    JobStore store;
    JobScheduler scheduler(&store, m_presets, 1);
    QSignalSpy allFinished(&scheduler, &JobScheduler::allJobsFinished);

    const QString id = scheduler.submit(m_dir.filePath("does-not-exist.mp4"), JobOptions());
    QVERIFY(waitForIdle(scheduler, allFinished));

    JobRecord record;
    QVERIFY(store.snapshot(id, record));
    QCOMPARE(record.status, JobStatus::Error);
    QCOMPARE(record.error.kind, CaptionErrorKind::InputMalformed);
}

void JobSchedulerTest::testSubmit_unknownPresetIsConfigurationError()
{
    JobStore store;
    JobScheduler scheduler(&store, m_presets, 1);
    QSignalSpy allFinished(&scheduler, &JobScheduler::allJobsFinished);

    JobOptions options;
    options.presetId = "does-not-exist";
    const QString id = scheduler.submit(createInput("clip2.mp4"), options);
    QVERIFY(waitForIdle(scheduler, allFinished));

    JobRecord record;
    QVERIFY(store.snapshot(id, record));
    QCOMPARE(record.error.kind, CaptionErrorKind::ConfigurationInvalid);
    // nothing ran, the stage never left pending
    QCOMPARE(record.progress, 0);
}

void JobSchedulerTest::testSubmit_respectsMaxParallel()
{
    JobStore store;
    JobScheduler scheduler(&store, m_presets, 1);
    QSignalSpy finished(&scheduler, &JobScheduler::jobFinished);
    QSignalSpy allFinished(&scheduler, &JobScheduler::allJobsFinished);

    QStringList ids;
    for (int i = 0; i < 3; ++i)
        ids << scheduler.submit(createInput(QString("batch%1.mp4").arg(i)), JobOptions());

    QCOMPARE(scheduler.maxParallel(), 1);
    QCOMPARE(scheduler.runningCount(), 1);
    QCOMPARE(scheduler.pendingCount(), 2);

    QVERIFY(waitForIdle(scheduler, allFinished));
    QCOMPARE(finished.count(), 3);

    // FIFO: jobs finish in submission order when only one runs at a time
    for (int i = 0; i < 3; ++i)
        QCOMPARE(finished.at(i).at(0).toString(), ids.at(i));
}

void JobSchedulerTest::testCancel_pendingJobIsCancelledImmediately()
{
    JobStore store;
    JobScheduler scheduler(&store, m_presets, 1);
    QSignalSpy finished(&scheduler, &JobScheduler::jobFinished);
    QSignalSpy allFinished(&scheduler, &JobScheduler::allJobsFinished);

    const QString first = scheduler.submit(createInput("first.mp4"), JobOptions());
    const QString second = scheduler.submit(createInput("second.mp4"), JobOptions());
    QCOMPARE(scheduler.pendingCount(), 1);

    QVERIFY(scheduler.cancel(second));
    QCOMPARE(scheduler.pendingCount(), 0);
    QCOMPARE(finished.count(), 1);
    QCOMPARE(finished.first().at(0).toString(), second);

    JobRecord record;
    QVERIFY(store.snapshot(second, record));
    QCOMPARE(record.status, JobStatus::Cancelled);
    QCOMPARE(record.stage, JobStage::Cancelled);

    QVERIFY(waitForIdle(scheduler, allFinished));
    QVERIFY(store.snapshot(first, record));
    QVERIFY(record.isTerminal());
}

void JobSchedulerTest::testCancel_finishedJobIsRejected()
{
    JobStore store;
    JobScheduler scheduler(&store, m_presets, 1);
    QSignalSpy allFinished(&scheduler, &JobScheduler::allJobsFinished);

    const QString id = scheduler.submit(m_dir.filePath("nothing-here.mp4"), JobOptions());
    QVERIFY(waitForIdle(scheduler, allFinished));

    QVERIFY(!scheduler.cancel(id));
    QVERIFY(!scheduler.cancel("unknown-job"));

    JobRecord record;
    QVERIFY(store.snapshot(id, record));
    QCOMPARE(record.status, JobStatus::Error);
}

void JobSchedulerTest::testRun_stubToolsCompleteTheJob()
{
    useStubTools(false);

    JobStore store;
    JobScheduler scheduler(&store, m_presets, 1);
    QSignalSpy progress(&scheduler, &JobScheduler::progressUpdated);
    QSignalSpy allFinished(&scheduler, &JobScheduler::allJobsFinished);

    JobOptions options;
    options.precision = Precision::Mvp;
    const QString id = scheduler.submit(createInput("happy.mp4"), options);
    QVERIFY(waitForIdle(scheduler, allFinished));

    JobRecord record;
    QVERIFY(store.snapshot(id, record));
    QVERIFY2(record.status == JobStatus::Completed, qPrintable(record.error.message + "\n" + record.error.diagnostics));
    QCOMPARE(record.stage, JobStage::Completed);
    QCOMPARE(record.progress, 100);
    QVERIFY(!record.error.isError());
    QVERIFY(!record.outputRef.isEmpty());
    QVERIFY(QFileInfo::exists(record.outputRef));

    // the caption files sit next to the rendered video, the audio is gone
    const QDir jobDir = QFileInfo(record.outputRef).dir();
    QVERIFY(jobDir.exists("captions.ass"));
    QVERIFY(jobDir.exists("captions.json"));
    QVERIFY(!jobDir.exists("audio.wav"));

    // progress only rises and ends at 100, with the render's time= report in between
    QVERIFY(progress.count() >= 2);
    int previous = -1;
    bool sawRenderProgress = false;
    for (const QList<QVariant>& args : progress)
    {
        QCOMPARE(args.at(0).toString(), id);
        const int percentage = args.at(1).toInt();
        QVERIFY2(percentage >= previous, qPrintable(QString("%1 after %2").arg(percentage).arg(previous)));
        if (percentage > progressForStage(JobStage::Rendering) && percentage < 100)
            sawRenderProgress = true;
        previous = percentage;
    }
    QCOMPARE(previous, 100);
    QVERIFY(sawRenderProgress);
}

void JobSchedulerTest::testCancel_runningJobKillsTheTool()
{
    useStubTools(true);

    JobStore store;
    JobScheduler scheduler(&store, m_presets, 1);
    QSignalSpy progress(&scheduler, &JobScheduler::progressUpdated);
    QSignalSpy allFinished(&scheduler, &JobScheduler::allJobsFinished);

    const QString id = scheduler.submit(createInput("slow.mp4"), JobOptions());
    QCOMPARE(scheduler.runningCount(), 1);

    // wait until extraction is under way
    QTRY_VERIFY_WITH_TIMEOUT(progress.count() > 0, 5000);
    QCOMPARE(progress.last().at(1).toInt(), progressForStage(JobStage::Extracting));
    QTest::qWait(200);

    QElapsedTimer timer;
    timer.start();
    QVERIFY(scheduler.cancel(id));
    QVERIFY(waitForIdle(scheduler, allFinished));
    // the tool would sleep for 30 s if it had not been killed
    QVERIFY(timer.elapsed() < 10000);

    JobRecord record;
    QVERIFY(store.snapshot(id, record));
    QCOMPARE(record.status, JobStatus::Cancelled);
    QCOMPARE(record.stage, JobStage::Cancelled);
    QVERIFY(!record.error.isError());
    QVERIFY(record.outputRef.isEmpty());
    QVERIFY(!scheduler.cancel(id));
}

QTEST_MAIN(JobSchedulerTest)
#include "jobscheduler_test.moc"
