#include "cropworker.h"

#include <QDebug>

CropWorker::CropWorker(const CropRequest& request,
                       const Cropping::PipelineSettings& settings,
                       CropMessageQueue* queue,
                       QObject* parent)
    : QThread(parent),
    m_request(request),
    m_executor(settings),
    m_queue(queue) {
    qRegisterMetaType<Cropping::BatchSummary>("Cropping::BatchSummary");
}

CropWorker::~CropWorker() {
    stopProcessing();
    wait();
}

void CropWorker::stopProcessing() {
    m_executor.requestCancel();
}

void CropWorker::run() {
    qDebug() << "CropWorker: starting batch of" << m_request.candidates.size() << "files into" << m_request.outputDirectory;
    Cropping::BatchSummary summary = m_executor.execute(m_request, m_queue);
    emit batchFinished(summary);
}
