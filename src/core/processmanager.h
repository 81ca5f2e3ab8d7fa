#ifndef PROCESSMANAGER_H
#define PROCESSMANAGER_H

#include <QObject>
#include <QProcess>
#include <QList>


class ProcessManager : public QObject
{
    Q_OBJECT
public:
    explicit ProcessManager(QObject *parent = nullptr);
    ~ProcessManager();

    void setWorkingDirectory(const QString &dir);
    void startProcess(const QString &program, const QStringList &arguments);
    bool executeAndWait(const QString &program, const QStringList &arguments, QByteArray &output, int timeoutMs = 30000);
    void killProcess();
    bool wasKilled() const;
    bool isRunning() const;

    // Last lines the most recent process wrote to stderr
    QString stderrTail(int maxLines = 15) const;

signals:
    void processOutput(const QString &output);
    void processFinished(int exitCode, QProcess::ExitStatus exitStatus);
    void processStartFailed(const QString &error);
    void processError(const QString &error);
    void processStdErr(const QString &output);

private slots:
    void onReadyReadStandardOutput();
    void onReadyReadStandardError();

private:
    void appendStderr(const QString &text);

    // all processes started by this manager that are still alive
    QList<QProcess*> m_activeProcesses;
    QString m_workingDir;
    QString m_stderrBuffer;
    bool m_wasKilled = false;
};

#endif // PROCESSMANAGER_H
