#ifndef CROPWORKER_H
#define CROPWORKER_H

#include <QThread>

#include "cropexecutor.h"

class CropMessageQueue;

// Runs one batch off the editor thread. Progress goes through the message queue.
class CropWorker : public QThread {
    Q_OBJECT
public:
    explicit CropWorker(const CropRequest& request,
                        const Cropping::PipelineSettings& settings,
                        CropMessageQueue* queue,
                        QObject* parent = nullptr);
    ~CropWorker();

    void stopProcessing();

signals:
    void batchFinished(const Cropping::BatchSummary& summary);

protected:
    void run() override;

private:
    CropRequest m_request;
    CropExecutor m_executor;
    CropMessageQueue* m_queue;
};

#endif // CROPWORKER_H
