#ifndef JOBRECORD_H
#define JOBRECORD_H

#include "captionerror.h"
#include "captiontypes.h"

#include <QDateTime>
#include <QJsonObject>
#include <QString>

enum class JobStatus
{
    Pending,
    Processing,
    Completed,
    Error,
    Cancelled
};

// Pipeline stages in execution order. Completed, Error and Cancelled are terminal.
enum class JobStage
{
    Pending,
    Extracting,
    Transcribing,
    Aligning,
    Filtering,
    Smoothing,
    Building,
    Rendering,
    Completed,
    Error,
    Cancelled
};

struct JobOptions
{
    CaptionMode captionMode = CaptionMode::Words;
    bool showFillerWords = false;
    QString presetId = "highlight-bold";
    int fontSizePx = 42;
    Precision precision = Precision::Enterprise;

    // Word captions need tight per-word timing, sentences do fine with raw ASR timing
    static Precision defaultPrecisionFor(CaptionMode mode)
    {
        return mode == CaptionMode::Words ? Precision::Enterprise : Precision::Mvp;
    }

    void write(QJsonObject& json) const;
};

struct JobRecord
{
    QString id;
    QString inputPath;
    JobOptions options;
    JobStatus status = JobStatus::Pending;
    JobStage stage = JobStage::Pending;
    int progress = 0;
    CaptionError error;
    QString outputRef;
    QDateTime createdAt;
    QDateTime finishedAt;
    bool cancelRequested = false;

    bool isTerminal() const
    {
        return status == JobStatus::Completed || status == JobStatus::Error || status == JobStatus::Cancelled;
    }

    void write(QJsonObject& json) const;
};

int progressForStage(JobStage stage);
bool isTerminalStage(JobStage stage);
QString jobStatusToString(JobStatus status);
QString jobStageToString(JobStage stage);

#endif // JOBRECORD_H
