#ifndef CROPMESSAGEQUEUE_H
#define CROPMESSAGEQUEUE_H

#include <QList>
#include <QMutex>
#include <QQueue>
#include <QString>
#include <QWaitCondition>

#include "cropcommon.h"

/**
 * @brief One notification from the batch pipeline to whoever displays it.
 */
struct CropMessage {
    enum class Type {
        ProgressUpdate,   // percent of the current video job, -1 if indeterminate
        JobCompleted,     // status/error/reason describe the job
        BatchCompleted    // summary holds the final counts
    };

    Type type = Type::ProgressUpdate;
    int jobIndex = -1;
    int jobCount = 0;
    QString sourcePath;
    QString outputPath;
    int percent = -1;
    double elapsedSeconds = 0.0;
    Cropping::JobStatus status = Cropping::JobStatus::Succeeded;
    Cropping::CropError error = Cropping::CropError::None;
    QString reason;
    Cropping::BatchSummary summary;
};

/**
 * @brief Thread-safe FIFO between the pipeline worker and the display layer.
 */
class CropMessageQueue {
public:
    CropMessageQueue() = default;

    void post(const CropMessage& message);
    bool tryTake(CropMessage& message);
    // Blocks up to timeoutMs for a message; returns false on timeout
    bool waitTake(CropMessage& message, int timeoutMs);
    QList<CropMessage> drain();

    int size() const;
    bool isEmpty() const { return size() == 0; }

private:
    QQueue<CropMessage> m_messages;
    mutable QMutex m_mutex;
    QWaitCondition m_waitCondition;
};

#endif // CROPMESSAGEQUEUE_H
