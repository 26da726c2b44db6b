#include "processsupervisor.h"

#include <QDebug>
#include <QEventLoop>
#include <QFile>
#include <QFileInfo>
#include <QProcess>
#include <QRegularExpression>
#include <QTimer>

namespace {
const int kStartTimeoutMs = 15000;
const int kKillWaitMs = 2000;
}

ProcessSupervisor::ProcessSupervisor(const Cropping::PipelineSettings& settings, QObject* parent)
    : QObject(parent),
    m_settings(settings),
    m_state(State::NotStarted),
    m_cancelRequested(0),
    m_externalCancel(nullptr),
    m_durationSeconds(-1.0),
    m_lastPercent(-2) {
}

void ProcessSupervisor::requestCancel() {
    m_cancelRequested.storeRelease(1);
}

bool ProcessSupervisor::isCancelRequested() const {
    if (m_cancelRequested.loadAcquire() != 0) return true;
    return m_externalCancel && m_externalCancel->loadAcquire() != 0;
}

bool ProcessSupervisor::parseElapsedSeconds(const QString& line, double& seconds) {
    static const QRegularExpression timePattern("time=(\\d+):(\\d+):(\\d+\\.\\d+)");
    QRegularExpressionMatchIterator it = timePattern.globalMatch(line);
    bool found = false;
    while (it.hasNext()) {
        QRegularExpressionMatch match = it.next();
        seconds = match.captured(1).toDouble() * 3600.0 +
                  match.captured(2).toDouble() * 60.0 +
                  match.captured(3).toDouble();
        found = true;
    }
    return found;
}

int ProcessSupervisor::progressPercent(double elapsedSeconds, double durationSeconds) {
    if (durationSeconds <= 0.0) return -1;
    double percent = elapsedSeconds / durationSeconds * 100.0;
    return qBound(0, static_cast<int>(percent), 100);
}

bool ProcessSupervisor::removePartialOutput(const QString& outputPath) {
    if (outputPath.isEmpty() || !QFileInfo::exists(outputPath)) return true;
    QFile f(outputPath);
    if (!f.remove()) {
        qWarning() << "ProcessSupervisor: Failed to remove partial output" << outputPath << ":" << f.errorString();
        return false;
    }
    qDebug() << "ProcessSupervisor: removed partial output" << outputPath;
    return true;
}

void ProcessSupervisor::setState(State state) {
    if (state == m_state) return;
    m_state = state;
    emit stateChanged(state);
}

void ProcessSupervisor::consumeDiagnostics(const QByteArray& data, bool flush) {
    m_pendingDiagnostics.append(data);

    // The transcoder rewrites its status line with '\r', so both terminators end a line
    int start = 0;
    for (int i = 0; i < m_pendingDiagnostics.size(); ++i) {
        char c = m_pendingDiagnostics.at(i);
        if (c == '\r' || c == '\n') {
            if (i > start) {
                handleDiagnosticLine(QString::fromUtf8(m_pendingDiagnostics.mid(start, i - start)));
            }
            start = i + 1;
        }
    }
    m_pendingDiagnostics.remove(0, start);

    if (flush && !m_pendingDiagnostics.isEmpty()) {
        handleDiagnosticLine(QString::fromUtf8(m_pendingDiagnostics));
        m_pendingDiagnostics.clear();
    }
}

void ProcessSupervisor::handleDiagnosticLine(const QString& line) {
    QString trimmed = line.trimmed();
    if (trimmed.isEmpty()) return;
    m_lastDiagnosticLine = trimmed;

    double elapsed = 0.0;
    if (!parseElapsedSeconds(trimmed, elapsed)) return;

    int percent = progressPercent(elapsed, m_durationSeconds);
    if (percent >= 0 && percent == m_lastPercent) return;
    m_lastPercent = percent;
    emit progressUpdated(percent, elapsed);
}

ProcessSupervisor::Outcome ProcessSupervisor::finish(State state, Outcome::Status status, Cropping::CropError error,
                                                     const QString& reason, int exitCode, const QString& outputPath) {
    if (status != Outcome::Status::Success) {
        // Cleanup failures are only logged
        removePartialOutput(outputPath);
    }
    setState(state);

    Outcome outcome;
    outcome.status = status;
    outcome.error = error;
    outcome.reason = reason;
    outcome.exitCode = exitCode;
    return outcome;
}

ProcessSupervisor::Outcome ProcessSupervisor::run(const QString& program, const QStringList& arguments,
                                                  const QString& outputPath, double durationSeconds) {
    if (m_state != State::NotStarted) {
        qWarning() << "ProcessSupervisor::run: supervisor already used, state" << static_cast<int>(m_state);
        Outcome outcome;
        outcome.error = Cropping::CropError::ProcessLaunchFailure;
        outcome.reason = "Supervisor already used.";
        return outcome;
    }

    m_durationSeconds = durationSeconds;
    m_lastPercent = -2;
    m_pendingDiagnostics.clear();
    m_lastDiagnosticLine.clear();

    // A cancellation that arrives before launch never starts the process
    if (isCancelRequested()) {
        setState(State::Running);
        setState(State::Cancelling);
        return finish(State::Cancelled, Outcome::Status::Cancelled, Cropping::CropError::Cancelled,
                      "Cancelled before start.", -1, QString());
    }

    setState(State::Running);

    QProcess process;
    process.setProgram(program);
    process.setArguments(arguments);
    process.setStandardOutputFile(QProcess::nullDevice());
    qDebug() << "ProcessSupervisor::run:" << program << arguments.join(' ');

    process.start();
    if (!process.waitForStarted(kStartTimeoutMs)) {
        QString reason = QString("Failed to start %1: %2").arg(program, process.errorString());
        qWarning() << "ProcessSupervisor::run:" << reason;
        return finish(State::Failed, Outcome::Status::Failed, Cropping::CropError::ProcessLaunchFailure,
                      reason, -1, outputPath);
    }

    QEventLoop loop;
    bool cancelled = false;

    connect(&process, &QProcess::readyReadStandardError, &loop, [this, &process]() {
        consumeDiagnostics(process.readAllStandardError(), false);
    });
    connect(&process, QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished),
            &loop, &QEventLoop::quit);

    QTimer cancelPoll;
    cancelPoll.setInterval(m_settings.cancelPollIntervalMs);
    connect(&cancelPoll, &QTimer::timeout, &loop, [this, &loop, &cancelled]() {
        if (isCancelRequested()) {
            cancelled = true;
            loop.quit();
        }
    });
    cancelPoll.start();

    // finished() may already be queued if the process exited immediately
    if (process.state() != QProcess::NotRunning) {
        loop.exec();
    }
    cancelPoll.stop();

    if (cancelled && process.state() != QProcess::NotRunning) {
        setState(State::Cancelling);
        qDebug() << "ProcessSupervisor::run: cancelling" << program;
        process.terminate();
        if (!process.waitForFinished(m_settings.terminateTimeoutMs)) {
            qWarning() << "ProcessSupervisor::run: process ignored terminate, killing";
            process.kill();
            process.waitForFinished(kKillWaitMs);
        }
        return finish(State::Cancelled, Outcome::Status::Cancelled, Cropping::CropError::Cancelled,
                      "Cancelled by user.", -1, outputPath);
    }

    if (process.state() != QProcess::NotRunning) {
        process.waitForFinished(-1);
    }
    consumeDiagnostics(process.readAllStandardError(), true);

    if (process.exitStatus() == QProcess::CrashExit) {
        QString reason = QString("%1 crashed: %2").arg(QFileInfo(program).fileName(), m_lastDiagnosticLine);
        qWarning() << "ProcessSupervisor::run:" << reason;
        return finish(State::Failed, Outcome::Status::Failed, Cropping::CropError::ProcessNonZeroExit,
                      reason, process.exitCode(), outputPath);
    }
    if (process.exitCode() != 0) {
        QString reason = QString("%1 exited with code %2: %3")
                             .arg(QFileInfo(program).fileName())
                             .arg(process.exitCode())
                             .arg(m_lastDiagnosticLine);
        qWarning() << "ProcessSupervisor::run:" << reason;
        return finish(State::Failed, Outcome::Status::Failed, Cropping::CropError::ProcessNonZeroExit,
                      reason, process.exitCode(), outputPath);
    }

    if (m_durationSeconds > 0.0 && m_lastPercent != 100) {
        emit progressUpdated(100, m_durationSeconds);
    }
    return finish(State::Completed, Outcome::Status::Success, Cropping::CropError::None,
                  QString(), 0, outputPath);
}
