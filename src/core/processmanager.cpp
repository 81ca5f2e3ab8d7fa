#include "processmanager.h"

#include <QFileInfo>
#include <QRegularExpression>

static constexpr int StderrBufferLimit = 16 * 1024;

ProcessManager::ProcessManager(QObject* parent) : QObject{parent}
{
}

ProcessManager::~ProcessManager()
{
    killProcess();
}

void ProcessManager::setWorkingDirectory(const QString& dir)
{
    m_workingDir = dir;
}

void ProcessManager::startProcess(const QString& program, const QStringList& arguments)
{
    m_wasKilled = false;
    m_stderrBuffer.clear();
    emit processOutput(QString("Starting (async): %1 %2").arg(program, arguments.join(" ")));

    QProcess* newProcess = new QProcess(this);
    if (!m_workingDir.isEmpty())
    {
        newProcess->setWorkingDirectory(m_workingDir);
    }
    m_activeProcesses.append(newProcess);

    connect(newProcess, &QProcess::readyReadStandardOutput, this, &ProcessManager::onReadyReadStandardOutput);
    connect(newProcess, &QProcess::readyReadStandardError, this, &ProcessManager::onReadyReadStandardError);

    connect(newProcess, &QProcess::errorOccurred, this,
            [this, newProcess](QProcess::ProcessError error)
            {
                // a process that never started will not emit finished()
                if (error == QProcess::FailedToStart)
                {
                    const QString message = "Failed to start process: " + newProcess->errorString();
                    m_activeProcesses.removeOne(newProcess);
                    newProcess->deleteLater();
                    emit processStartFailed(message);
                    return;
                }
                emit processError("Process error: " + newProcess->errorString());
            });

    // remove the process from the list once it is done
    connect(newProcess, QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished), this,
            [this, newProcess](int exitCode, QProcess::ExitStatus exitStatus)
            {
                emit processOutput(QString("Process (async) finished with code %1.").arg(exitCode));
                m_activeProcesses.removeOne(newProcess);
                newProcess->deleteLater();
                emit processFinished(exitCode, exitStatus);
            });

    newProcess->start(program, arguments);
    m_workingDir.clear();
}

bool ProcessManager::executeAndWait(const QString& program, const QStringList& arguments, QByteArray& output,
                                    int timeoutMs)
{
    emit processOutput(QString("Starting (sync): %1 %2").arg(program, arguments.join(" ")));

    QProcess syncProcess;
    if (!m_workingDir.isEmpty())
    {
        syncProcess.setWorkingDirectory(m_workingDir);
    }
    syncProcess.start(program, arguments);

    if (!syncProcess.waitForStarted())
    {
        emit processError("Failed to start process '" + program + "': " + syncProcess.errorString());
        return false;
    }

    if (!syncProcess.waitForFinished(timeoutMs))
    {
        syncProcess.kill();
        syncProcess.waitForFinished(500);
        emit processError(QString("Process '%1' did not finish within %2 seconds (timeout).")
                              .arg(program)
                              .arg(timeoutMs / 1000));
        return false;
    }

    if (syncProcess.exitStatus() != QProcess::NormalExit || syncProcess.exitCode() != 0)
    {
        QString errorString = QString("Process '%1' failed. Code: %2, Status: %3.")
                                  .arg(QFileInfo(program).fileName())
                                  .arg(syncProcess.exitCode())
                                  .arg(syncProcess.exitStatus() == QProcess::NormalExit ? "Normal" : "Crash");
        emit processError(errorString);
        QByteArray stderrData = syncProcess.readAllStandardError();
        if (!stderrData.isEmpty())
        {
            emit processError("STDERR: " + QString::fromUtf8(stderrData));
        }
        return false;
    }

    output = syncProcess.readAllStandardOutput();
    emit processOutput("Process finished. Received " + QString::number(output.size()) + " bytes.");
    return true;
}

void ProcessManager::killProcess()
{
    if (m_activeProcesses.isEmpty())
        return;

    m_wasKilled = true;

    emit processOutput(QString("Terminating %1 child processes...").arg(m_activeProcesses.count()));

    // the list changes while processes finish
    QList<QProcess*> processesToKill = m_activeProcesses;
    m_activeProcesses.clear();

    for (QProcess* process : processesToKill)
    {
        if (process && process->state() != QProcess::NotRunning)
        {
            process->terminate();
            if (!process->waitForFinished(500))
            {
                process->kill();
                process->waitForFinished(500);
            }
        }
    }
}

bool ProcessManager::wasKilled() const
{
    return m_wasKilled;
}

bool ProcessManager::isRunning() const
{
    return !m_activeProcesses.isEmpty();
}

QString ProcessManager::stderrTail(int maxLines) const
{
    QStringList lines = m_stderrBuffer.split(QRegularExpression("[\r\n]+"), Qt::SkipEmptyParts);
    if (lines.size() > maxLines)
        lines = lines.mid(lines.size() - maxLines);
    return lines.join("\n");
}

void ProcessManager::appendStderr(const QString& text)
{
    m_stderrBuffer += text;
    if (m_stderrBuffer.size() > StderrBufferLimit)
        m_stderrBuffer = m_stderrBuffer.right(StderrBufferLimit);
}

void ProcessManager::onReadyReadStandardOutput()
{
    QProcess* process = qobject_cast<QProcess*>(sender());
    if (!process)
        return;
    emit processOutput(QString::fromUtf8(process->readAllStandardOutput()));
}

void ProcessManager::onReadyReadStandardError()
{
    QProcess* process = qobject_cast<QProcess*>(sender());
    if (!process)
        return;
    const QString text = QString::fromUtf8(process->readAllStandardError());
    appendStderr(text);
    emit processStdErr(text);
}
