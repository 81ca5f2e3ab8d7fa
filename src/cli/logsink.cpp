#include "logsink.h"

#include <QDateTime>
#include <QDir>
#include <QFileInfo>
#include <QTextStream>

LogSink::LogSink(const QString& logFilePath, QObject* parent) : QObject{parent}
{
    QDir().mkpath(QFileInfo(logFilePath).absolutePath());
    m_logFile.setFileName(logFilePath);
    if (!m_logFile.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text))
    {
        qWarning("Failed to open %s for writing", qPrintable(logFilePath));
    }
}

LogSink::~LogSink()
{
    if (m_logFile.isOpen())
        m_logFile.close();
}

QString LogSink::formatLine(const QString& message, LogCategory category)
{
    return QString("[%1] %2 - %3")
        .arg(logCategoryToString(category))
        .arg(QDateTime::currentDateTime().toString("hh:mm:ss"))
        .arg(message.trimmed());
}

void LogSink::logMessage(const QString& message, LogCategory category)
{
    const QString line = formatLine(message, category);

    // the file gets all categories
    if (m_logFile.isOpen())
    {
        m_logFile.write(line.toUtf8());
        m_logFile.write("\n");
        m_logFile.flush();
    }

    if (!AppSettings::instance().enabledLogCategories().contains(category))
        return;

    QTextStream err(stderr);
    err << line << Qt::endl;
}
