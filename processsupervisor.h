#ifndef PROCESSSUPERVISOR_H
#define PROCESSSUPERVISOR_H

#include <QObject>
#include <QAtomicInt>
#include <QByteArray>
#include <QString>
#include <QStringList>

#include "cropcommon.h"
#include "cropsettings.h"

/**
 * @brief Runs one external transcode and watches it until it ends.
 *
 * run() blocks the calling thread in a local event loop. The diagnostic
 * stream is consumed as it arrives and never blocks the cancellation poll,
 * which fires every cancelPollIntervalMs. On cancellation the process is
 * asked to terminate, given terminateTimeoutMs, then killed. Whenever the run
 * does not succeed the partially written output file is removed.
 *
 * A supervisor is single use:
 *   NotStarted -> Running -> Completed
 *                         -> Cancelling -> Cancelled
 *                         -> Failed
 */
class ProcessSupervisor : public QObject {
    Q_OBJECT

public:
    enum class State {
        NotStarted,
        Running,
        Completed,
        Cancelling,
        Cancelled,
        Failed
    };
    Q_ENUM(State)

    struct Outcome {
        enum class Status { Success, Cancelled, Failed };

        Status status = Status::Failed;
        Cropping::CropError error = Cropping::CropError::None;
        QString reason;
        int exitCode = -1;
    };

    explicit ProcessSupervisor(const Cropping::PipelineSettings& settings, QObject* parent = nullptr);

    // Optional batch-wide flag, checked together with requestCancel()
    void setCancellationFlag(const QAtomicInt* flag) { m_externalCancel = flag; }

    // Thread-safe
    void requestCancel();
    bool isCancelRequested() const;

    /**
     * @brief Launches program and supervises it until it exits or is cancelled.
     * @param outputPath File the process writes; removed on any non-success
     * @param durationSeconds Expected media duration; <= 0 makes progress indeterminate
     */
    Outcome run(const QString& program, const QStringList& arguments,
                const QString& outputPath, double durationSeconds);

    State state() const { return m_state; }

    // Last "time=HH:MM:SS.ff" marker on the line, in seconds
    static bool parseElapsedSeconds(const QString& line, double& seconds);
    // clamp(elapsed / duration * 100, 0, 100), or -1 when the duration is unknown
    static int progressPercent(double elapsedSeconds, double durationSeconds);

    static bool removePartialOutput(const QString& outputPath);

signals:
    void progressUpdated(int percent, double elapsedSeconds);
    void stateChanged(ProcessSupervisor::State state);

private:
    void consumeDiagnostics(const QByteArray& data, bool flush);
    void handleDiagnosticLine(const QString& line);
    void setState(State state);
    Outcome finish(State state, Outcome::Status status, Cropping::CropError error,
                   const QString& reason, int exitCode, const QString& outputPath);

    Cropping::PipelineSettings m_settings;
    State m_state;
    QAtomicInt m_cancelRequested;
    const QAtomicInt* m_externalCancel;

    double m_durationSeconds;
    int m_lastPercent;
    QByteArray m_pendingDiagnostics;
    QString m_lastDiagnosticLine;
};

Q_DECLARE_METATYPE(ProcessSupervisor::Outcome)

#endif // PROCESSSUPERVISOR_H
