#ifndef JOBSTORE_H
#define JOBSTORE_H

#include "jobrecord.h"

#include <QDateTime>
#include <QHash>
#include <QList>
#include <QMutex>
#include <QObject>

class QTimer;

/**
 * @brief Process-wide registry of caption jobs
 *
 * Every mutation goes through the store under its mutex, readers get copies.
 * Terminal records (completed, error, cancelled) are never changed again and
 * are dropped by the retention sweep once they are older than the retention
 * period. Progress only moves forward.
 */
class JobStore : public QObject
{
    Q_OBJECT
public:
    explicit JobStore(QObject* parent = nullptr);

    QString createJob(const QString& inputPath, const JobOptions& options);

    bool snapshot(const QString& id, JobRecord& record) const;
    QList<JobRecord> jobs() const;
    int count() const;

    bool advance(const QString& id, JobStage stage);
    bool updateProgress(const QString& id, int progress);
    bool complete(const QString& id, const QString& outputRef);
    bool fail(const QString& id, const CaptionError& error);
    bool requestCancel(const QString& id);
    bool markCancelled(const QString& id);
    bool isCancelRequested(const QString& id) const;

    int purgeExpired(const QDateTime& now, int retentionMinutes);
    void startRetentionSweep(int retentionMinutes, int intervalMs = 60000);

signals:
    void jobUpdated(const QString& id);
    void jobsPurged(int count);

private slots:
    void onSweepTimeout();

private:
    bool finish(const QString& id, JobStatus status, JobStage stage);

    mutable QMutex m_mutex;
    QHash<QString, JobRecord> m_jobs;
    QTimer* m_sweepTimer = nullptr;
    int m_retentionMinutes = 60;
};

#endif // JOBSTORE_H
