#include "jobscheduler.h"
#include "jobstore.h"
#include "workflowmanager.h"

#include <QThread>

JobScheduler::JobScheduler(JobStore* store, const PresetTable& presets, int maxParallel, QObject* parent)
    : QObject(parent),
    m_store(store),
    m_presets(presets),
    m_maxParallel(maxParallel > 0 ? maxParallel : AppSettings::instance().maxParallelJobs())
{
    if (m_maxParallel < 1)
        m_maxParallel = 1;
}

JobScheduler::~JobScheduler()
{
    m_pending.clear();
    for (const QPointer<WorkflowManager>& worker : std::as_const(m_running))
    {
        if (!worker)
            continue;
        QThread* thread = worker->thread();
        disconnect(worker, nullptr, this, nullptr);
        WorkflowManager* raw = worker.data();
        QMetaObject::invokeMethod(raw, [raw]() { raw->killChildProcesses(); }, Qt::BlockingQueuedConnection);
        thread->quit();
        thread->wait();
    }
    m_running.clear();
}

QString JobScheduler::submit(const QString& inputPath, const JobOptions& options)
{
    const QString jobId = m_store->createJob(inputPath, options);
    m_pending.enqueue(jobId);
    emit logMessage(QString("Job %1 queued: %2").arg(jobId, inputPath), LogCategory::APP);
    tryStartNext();
    return jobId;
}

bool JobScheduler::cancel(const QString& jobId)
{
    if (!m_store->requestCancel(jobId))
        return false;

    // a queued job never started, it is finished right here
    if (m_pending.removeAll(jobId) > 0)
    {
        m_store->markCancelled(jobId);
        emit logMessage("Job " + jobId + " cancelled before start.", LogCategory::APP);
        emit jobFinished(jobId);
        if (isIdle())
            emit allJobsFinished();
        return true;
    }

    QPointer<WorkflowManager> worker = m_running.value(jobId);
    if (worker)
    {
        QMetaObject::invokeMethod(worker, "cancelOperation", Qt::QueuedConnection);
    }
    return true;
}

int JobScheduler::runningCount() const
{
    return m_running.size();
}

int JobScheduler::pendingCount() const
{
    return m_pending.size();
}

int JobScheduler::maxParallel() const
{
    return m_maxParallel;
}

bool JobScheduler::isIdle() const
{
    return m_pending.isEmpty() && m_running.isEmpty();
}

void JobScheduler::tryStartNext()
{
    while (m_running.size() < m_maxParallel && !m_pending.isEmpty())
    {
        startWorkflow(m_pending.dequeue());
    }
}

void JobScheduler::startWorkflow(const QString& jobId)
{
    QThread* thread = new QThread(this);
    WorkflowManager* workflowManager = new WorkflowManager(jobId, m_store, m_presets);
    m_running.insert(jobId, workflowManager);

    workflowManager->moveToThread(thread);

    connect(thread, &QThread::started, workflowManager, &WorkflowManager::start);
    connect(workflowManager, &WorkflowManager::finished, this, &JobScheduler::onWorkflowFinished,
            Qt::QueuedConnection);
    connect(thread, &QThread::finished, workflowManager, &WorkflowManager::deleteLater);
    connect(workflowManager, &WorkflowManager::destroyed, thread, &QThread::deleteLater);
    connect(workflowManager, &WorkflowManager::logMessage, this, &JobScheduler::logMessage);
    connect(workflowManager, &WorkflowManager::progressUpdated, this,
            [this, jobId](int percentage, const QString& stageName)
            { emit progressUpdated(jobId, percentage, stageName); });

    thread->start();
}

void JobScheduler::onWorkflowFinished(const QString& jobId)
{
    QPointer<WorkflowManager> worker = m_running.take(jobId);
    if (worker && worker->thread() != thread())
    {
        // the worker has nothing left to do, its thread only has to drain
        QThread* workerThread = worker->thread();
        workerThread->quit();
        workerThread->wait();
    }

    JobRecord record;
    if (m_store->snapshot(jobId, record))
    {
        emit logMessage(QString("Job %1 finished: %2").arg(jobId, jobStatusToString(record.status)),
                        LogCategory::APP);
    }
    emit jobFinished(jobId);

    tryStartNext();
    if (isIdle())
        emit allJobsFinished();
}
