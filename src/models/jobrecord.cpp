#include "jobrecord.h"

int progressForStage(JobStage stage)
{
    switch (stage)
    {
    case JobStage::Pending:
        return 0;
    case JobStage::Extracting:
        return 10;
    case JobStage::Transcribing:
        return 20;
    case JobStage::Aligning:
        return 40;
    case JobStage::Filtering:
        return 50;
    case JobStage::Smoothing:
        return 60;
    case JobStage::Building:
        return 70;
    case JobStage::Rendering:
        return 75;
    case JobStage::Completed:
        return 100;
    case JobStage::Error:
    case JobStage::Cancelled:
        return 0; // terminal failures keep the progress they reached
    }
    return 0;
}

bool isTerminalStage(JobStage stage)
{
    return stage == JobStage::Completed || stage == JobStage::Error || stage == JobStage::Cancelled;
}

QString jobStatusToString(JobStatus status)
{
    switch (status)
    {
    case JobStatus::Pending:
        return "pending";
    case JobStatus::Processing:
        return "processing";
    case JobStatus::Completed:
        return "completed";
    case JobStatus::Error:
        return "error";
    case JobStatus::Cancelled:
        return "cancelled";
    }
    return "error";
}

QString jobStageToString(JobStage stage)
{
    switch (stage)
    {
    case JobStage::Pending:
        return "pending";
    case JobStage::Extracting:
        return "extracting";
    case JobStage::Transcribing:
        return "transcribing";
    case JobStage::Aligning:
        return "aligning";
    case JobStage::Filtering:
        return "filtering";
    case JobStage::Smoothing:
        return "smoothing";
    case JobStage::Building:
        return "building";
    case JobStage::Rendering:
        return "rendering";
    case JobStage::Completed:
        return "completed";
    case JobStage::Error:
        return "error";
    case JobStage::Cancelled:
        return "cancelled";
    }
    return "error";
}

void JobOptions::write(QJsonObject& json) const
{
    json["captionMode"] = captionModeToString(captionMode);
    json["showFillerWords"] = showFillerWords;
    json["presetId"] = presetId;
    json["fontSizePx"] = fontSizePx;
    json["precision"] = precisionToString(precision);
}

void JobRecord::write(QJsonObject& json) const
{
    json["id"] = id;
    json["input"] = inputPath;
    json["status"] = jobStatusToString(status);
    json["stage"] = jobStageToString(stage);
    json["progress"] = progress;

    QJsonObject optionsObj;
    options.write(optionsObj);
    json["options"] = optionsObj;

    if (error.isError())
    {
        QJsonObject errorObj;
        errorObj["kind"] = captionErrorKindToString(error.kind);
        errorObj["message"] = error.message;
        if (!error.diagnostics.isEmpty())
            errorObj["diagnostics"] = error.diagnostics;
        json["error"] = errorObj;
    }
    if (!outputRef.isEmpty())
        json["output"] = outputRef;
    json["createdAt"] = createdAt.toString(Qt::ISODate);
    if (finishedAt.isValid())
        json["finishedAt"] = finishedAt.toString(Qt::ISODate);
}
