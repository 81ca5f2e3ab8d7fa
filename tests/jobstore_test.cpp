/**
 * @file jobstore_test.cpp
 * @brief Unit tests for JobStore lifecycle rules
 */

#include <QtTest/QtTest>
#include <QJsonObject>
#include <QSignalSpy>

#include "jobstore.h"

class JobStoreTest : public QObject
{
    Q_OBJECT

private slots:
    void testCreate_pendingRecord();
    void testAdvance_movesForwardOnly();
    void testAdvance_rejectsTerminalStage();
    void testProgress_isMonotonic();
    void testComplete_isFinal();
    void testFail_recordsError();
    void testCancel_requestThenMark();
    void testPurge_dropsOnlyExpiredTerminalJobs();
    void testRecord_jsonShape();
    void testUnknownJob();
};

void JobStoreTest::testCreate_pendingRecord()
{
    JobStore store;
    QSignalSpy spy(&store, &JobStore::jobUpdated);

    JobOptions options;
    options.presetId = "neon-pop";
    const QString id = store.createJob("/videos/clip.mp4", options);

    QVERIFY(!id.isEmpty());
    QVERIFY(!id.startsWith('{'));
    QCOMPARE(spy.count(), 1);
    QCOMPARE(store.count(), 1);

    JobRecord record;
    QVERIFY(store.snapshot(id, record));
    QCOMPARE(record.status, JobStatus::Pending);
    QCOMPARE(record.stage, JobStage::Pending);
    QCOMPARE(record.progress, 0);
    QCOMPARE(record.options.presetId, QString("neon-pop"));
    QVERIFY(record.createdAt.isValid());
    QVERIFY(!record.finishedAt.isValid());
}

void JobStoreTest::testAdvance_movesForwardOnly()
{
    JobStore store;
    const QString id = store.createJob("a.mp4", JobOptions());

    QVERIFY(store.advance(id, JobStage::Extracting));
    QVERIFY(store.advance(id, JobStage::Aligning));
    QVERIFY2(!store.advance(id, JobStage::Transcribing), "Stages never go backwards");
    // re-entering the same stage is harmless
    QVERIFY(store.advance(id, JobStage::Aligning));

    JobRecord record;
    QVERIFY(store.snapshot(id, record));
    QCOMPARE(record.status, JobStatus::Processing);
    QCOMPARE(record.stage, JobStage::Aligning);
    QCOMPARE(record.progress, progressForStage(JobStage::Aligning));
}

void JobStoreTest::testAdvance_rejectsTerminalStage()
{
    JobStore store;
    const QString id = store.createJob("a.mp4", JobOptions());

    QVERIFY(!store.advance(id, JobStage::Completed));
    QVERIFY(!store.advance(id, JobStage::Error));
    QVERIFY(!store.advance(id, JobStage::Cancelled));
}

void JobStoreTest::testProgress_isMonotonic()
{
    JobStore store;
    const QString id = store.createJob("a.mp4", JobOptions());
    QVERIFY(store.advance(id, JobStage::Rendering));

    QVERIFY(store.updateProgress(id, 80));
    QVERIFY(!store.updateProgress(id, 78));
    QVERIFY(!store.updateProgress(id, 80));
    QVERIFY(store.updateProgress(id, 150));

    JobRecord record;
    QVERIFY(store.snapshot(id, record));
    QCOMPARE(record.progress, 99);

    // an earlier stage does not lower progress either
    QVERIFY(!store.advance(id, JobStage::Building));
    QVERIFY(store.snapshot(id, record));
    QCOMPARE(record.progress, 99);
}

void JobStoreTest::testComplete_isFinal()
{
    JobStore store;
    const QString id = store.createJob("a.mp4", JobOptions());
    QVERIFY(store.advance(id, JobStage::Rendering));
    QVERIFY(store.complete(id, "/out/a_captioned.mp4"));

    QVERIFY(!store.complete(id, "/out/other.mp4"));
    QVERIFY(!store.fail(id, CaptionError::make(CaptionErrorKind::ExternalStageFailed, "late")));
    QVERIFY(!store.advance(id, JobStage::Rendering));
    QVERIFY(!store.updateProgress(id, 50));
    QVERIFY(!store.requestCancel(id));
    QVERIFY(!store.markCancelled(id));

    JobRecord record;
    QVERIFY(store.snapshot(id, record));
    QCOMPARE(record.status, JobStatus::Completed);
    QCOMPARE(record.stage, JobStage::Completed);
    QCOMPARE(record.progress, 100);
    QCOMPARE(record.outputRef, QString("/out/a_captioned.mp4"));
    QVERIFY(!record.error.isError());
    QVERIFY(record.finishedAt.isValid());
}

void JobStoreTest::testFail_recordsError()
{
    JobStore store;
    const QString id = store.createJob("a.mp4", JobOptions());
    QVERIFY(store.advance(id, JobStage::Transcribing));

    const CaptionError error =
        CaptionError::make(CaptionErrorKind::ExternalStageFailed, "Speech recognition failed", "exit code 3");
    QVERIFY(store.fail(id, error));
    QVERIFY(!store.complete(id, "x"));

    JobRecord record;
    QVERIFY(store.snapshot(id, record));
    QCOMPARE(record.status, JobStatus::Error);
    QCOMPARE(record.stage, JobStage::Error);
    QCOMPARE(record.error.kind, CaptionErrorKind::ExternalStageFailed);
    QCOMPARE(record.error.diagnostics, QString("exit code 3"));
    QVERIFY(record.outputRef.isEmpty());
}

void JobStoreTest::testCancel_requestThenMark()
{
    JobStore store;
    const QString id = store.createJob("a.mp4", JobOptions());

    QVERIFY(!store.isCancelRequested(id));
    QVERIFY(store.requestCancel(id));
    QVERIFY(store.isCancelRequested(id));

    JobRecord record;
    QVERIFY(store.snapshot(id, record));
    QCOMPARE(record.status, JobStatus::Pending);

    QVERIFY(store.markCancelled(id));
    QVERIFY(store.snapshot(id, record));
    QCOMPARE(record.status, JobStatus::Cancelled);
    QCOMPARE(record.stage, JobStage::Cancelled);
    QVERIFY(record.isTerminal());
}

void JobStoreTest::testPurge_dropsOnlyExpiredTerminalJobs()
{
    JobStore store;
    QSignalSpy purged(&store, &JobStore::jobsPurged);

    const QString done = store.createJob("done.mp4", JobOptions());
    const QString failed = store.createJob("failed.mp4", JobOptions());
    const QString running = store.createJob("running.mp4", JobOptions());
    QVERIFY(store.complete(done, "out.mp4"));
    QVERIFY(store.fail(failed, CaptionError::make(CaptionErrorKind::InputMalformed, "empty")));
    QVERIFY(store.advance(running, JobStage::Transcribing));

    const QDateTime now = QDateTime::currentDateTimeUtc();
    QCOMPARE(store.purgeExpired(now, 60), 0);
    QCOMPARE(purged.count(), 0);

    QCOMPARE(store.purgeExpired(now.addSecs(61 * 60), 60), 2);
    QCOMPARE(purged.count(), 1);
    QCOMPARE(purged.first().at(0).toInt(), 2);

    JobRecord record;
    QVERIFY(!store.snapshot(done, record));
    QVERIFY(!store.snapshot(failed, record));
    QVERIFY(store.snapshot(running, record));
    QCOMPARE(store.jobs().size(), 1);
}

void JobStoreTest::testRecord_jsonShape()
{
    JobStore store;
    JobOptions options;
    options.captionMode = CaptionMode::Sentences;
    options.precision = Precision::Mvp;
    const QString id = store.createJob("clip.mp4", options);
    QVERIFY(store.fail(id, CaptionError::make(CaptionErrorKind::ConfigurationInvalid, "bad preset")));

    JobRecord record;
    QVERIFY(store.snapshot(id, record));
    QJsonObject json;
    record.write(json);

    QCOMPARE(json["id"].toString(), id);
    QCOMPARE(json["status"].toString(), QString("error"));
    QCOMPARE(json["stage"].toString(), QString("error"));
    QCOMPARE(json["input"].toString(), QString("clip.mp4"));
    QCOMPARE(json["error"].toObject()["kind"].toString(), QString("ConfigurationInvalid"));
    QCOMPARE(json["options"].toObject()["captionMode"].toString(), QString("sentences"));
}

void JobStoreTest::testUnknownJob()
{
    JobStore store;
    JobRecord record;
    QVERIFY(!store.snapshot("nope", record));
    QVERIFY(!store.advance("nope", JobStage::Extracting));
    QVERIFY(!store.updateProgress("nope", 10));
    QVERIFY(!store.requestCancel("nope"));
    QVERIFY(!store.isCancelRequested("nope"));
}

QTEST_MAIN(JobStoreTest)
#include "jobstore_test.moc"
