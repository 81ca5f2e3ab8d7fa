#include "jobstore.h"

#include <QMutexLocker>
#include <QTimer>
#include <QUuid>
#include <algorithm>

JobStore::JobStore(QObject* parent) : QObject{parent}
{
}

QString JobStore::createJob(const QString& inputPath, const JobOptions& options)
{
    JobRecord record;
    record.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    record.inputPath = inputPath;
    record.options = options;
    record.createdAt = QDateTime::currentDateTimeUtc();

    {
        QMutexLocker locker(&m_mutex);
        m_jobs.insert(record.id, record);
    }
    emit jobUpdated(record.id);
    return record.id;
}

bool JobStore::snapshot(const QString& id, JobRecord& record) const
{
    QMutexLocker locker(&m_mutex);
    auto it = m_jobs.constFind(id);
    if (it == m_jobs.constEnd())
        return false;
    record = it.value();
    return true;
}

QList<JobRecord> JobStore::jobs() const
{
    QMutexLocker locker(&m_mutex);
    QList<JobRecord> result = m_jobs.values();
    std::sort(result.begin(), result.end(),
              [](const JobRecord& a, const JobRecord& b) { return a.createdAt < b.createdAt; });
    return result;
}

int JobStore::count() const
{
    QMutexLocker locker(&m_mutex);
    return m_jobs.size();
}

bool JobStore::advance(const QString& id, JobStage stage)
{
    if (isTerminalStage(stage))
        return false;

    {
        QMutexLocker locker(&m_mutex);
        auto it = m_jobs.find(id);
        if (it == m_jobs.end() || it->isTerminal())
            return false;
        if (static_cast<int>(stage) < static_cast<int>(it->stage))
            return false;

        it->stage = stage;
        if (stage != JobStage::Pending)
            it->status = JobStatus::Processing;
        it->progress = qMax(it->progress, progressForStage(stage));
    }
    emit jobUpdated(id);
    return true;
}

bool JobStore::updateProgress(const QString& id, int progress)
{
    {
        QMutexLocker locker(&m_mutex);
        auto it = m_jobs.find(id);
        if (it == m_jobs.end() || it->isTerminal())
            return false;
        // 100 is reserved for completion
        const int bounded = qBound(0, progress, 99);
        if (bounded <= it->progress)
            return false;
        it->progress = bounded;
    }
    emit jobUpdated(id);
    return true;
}

bool JobStore::complete(const QString& id, const QString& outputRef)
{
    {
        QMutexLocker locker(&m_mutex);
        auto it = m_jobs.find(id);
        if (it == m_jobs.end() || it->isTerminal())
            return false;
        it->status = JobStatus::Completed;
        it->stage = JobStage::Completed;
        it->progress = 100;
        it->outputRef = outputRef;
        it->finishedAt = QDateTime::currentDateTimeUtc();
    }
    emit jobUpdated(id);
    return true;
}

bool JobStore::fail(const QString& id, const CaptionError& error)
{
    {
        QMutexLocker locker(&m_mutex);
        auto it = m_jobs.find(id);
        if (it == m_jobs.end() || it->isTerminal())
            return false;
        it->status = JobStatus::Error;
        it->stage = JobStage::Error;
        it->error = error;
        it->finishedAt = QDateTime::currentDateTimeUtc();
    }
    emit jobUpdated(id);
    return true;
}

bool JobStore::requestCancel(const QString& id)
{
    {
        QMutexLocker locker(&m_mutex);
        auto it = m_jobs.find(id);
        if (it == m_jobs.end() || it->isTerminal())
            return false;
        it->cancelRequested = true;
    }
    emit jobUpdated(id);
    return true;
}

bool JobStore::markCancelled(const QString& id)
{
    return finish(id, JobStatus::Cancelled, JobStage::Cancelled);
}

bool JobStore::finish(const QString& id, JobStatus status, JobStage stage)
{
    {
        QMutexLocker locker(&m_mutex);
        auto it = m_jobs.find(id);
        if (it == m_jobs.end() || it->isTerminal())
            return false;
        it->status = status;
        it->stage = stage;
        it->finishedAt = QDateTime::currentDateTimeUtc();
    }
    emit jobUpdated(id);
    return true;
}

bool JobStore::isCancelRequested(const QString& id) const
{
    QMutexLocker locker(&m_mutex);
    auto it = m_jobs.constFind(id);
    return it != m_jobs.constEnd() && it->cancelRequested;
}

int JobStore::purgeExpired(const QDateTime& now, int retentionMinutes)
{
    int purged = 0;
    {
        QMutexLocker locker(&m_mutex);
        const QDateTime cutoff = now.addSecs(-60LL * retentionMinutes);
        for (auto it = m_jobs.begin(); it != m_jobs.end();)
        {
            if (it->isTerminal() && it->finishedAt.isValid() && it->finishedAt <= cutoff)
            {
                it = m_jobs.erase(it);
                ++purged;
            }
            else
            {
                ++it;
            }
        }
    }
    if (purged > 0)
        emit jobsPurged(purged);
    return purged;
}

void JobStore::startRetentionSweep(int retentionMinutes, int intervalMs)
{
    m_retentionMinutes = retentionMinutes;
    if (!m_sweepTimer)
    {
        m_sweepTimer = new QTimer(this);
        connect(m_sweepTimer, &QTimer::timeout, this, &JobStore::onSweepTimeout);
    }
    m_sweepTimer->start(intervalMs);
}

void JobStore::onSweepTimeout()
{
    purgeExpired(QDateTime::currentDateTimeUtc(), m_retentionMinutes);
}
