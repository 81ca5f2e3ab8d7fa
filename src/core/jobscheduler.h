#ifndef JOBSCHEDULER_H
#define JOBSCHEDULER_H

#include "appsettings.h"
#include "jobrecord.h"
#include "stylepreset.h"

#include <QHash>
#include <QObject>
#include <QPointer>
#include <QQueue>

class JobStore;
class WorkflowManager;

/**
 * @brief Runs submitted caption jobs with a bounded number of workers
 *
 * Jobs start in submission order. Each running job gets its own WorkflowManager
 * living in its own QThread; at most maxParallel of them exist at a time.
 */
class JobScheduler : public QObject
{
    Q_OBJECT

public:
    JobScheduler(JobStore* store, const PresetTable& presets, int maxParallel = 0, QObject* parent = nullptr);
    ~JobScheduler();

    QString submit(const QString& inputPath, const JobOptions& options);
    bool cancel(const QString& jobId);

    int runningCount() const;
    int pendingCount() const;
    int maxParallel() const;
    bool isIdle() const;

signals:
    void logMessage(const QString& message, LogCategory category);
    void progressUpdated(const QString& jobId, int percentage, const QString& stageName);
    void jobFinished(const QString& jobId);
    void allJobsFinished();

private slots:
    void onWorkflowFinished(const QString& jobId);

private:
    void tryStartNext();
    void startWorkflow(const QString& jobId);

    JobStore* m_store;
    PresetTable m_presets;
    int m_maxParallel;
    QQueue<QString> m_pending;
    QHash<QString, QPointer<WorkflowManager>> m_running;
};

#endif // JOBSCHEDULER_H
