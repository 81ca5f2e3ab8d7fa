#ifndef LOGSINK_H
#define LOGSINK_H

#include "appsettings.h"

#include <QFile>
#include <QObject>

// Writes every message to the log file, echoes enabled categories to stderr
class LogSink : public QObject
{
    Q_OBJECT

public:
    explicit LogSink(const QString& logFilePath, QObject* parent = nullptr);
    ~LogSink();

    static QString formatLine(const QString& message, LogCategory category);

public slots:
    void logMessage(const QString& message, LogCategory category = LogCategory::APP);

private:
    QFile m_logFile;
};

#endif // LOGSINK_H
