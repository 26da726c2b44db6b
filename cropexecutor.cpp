#include "cropexecutor.h"
#include "cropmessagequeue.h"
#include "mediaprobe.h"
#include "outputnaming.h"
#include "processsupervisor.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QImage>
#include <QImageReader>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

using Cropping::CropError;
using Cropping::JobStatus;

CropExecutor::CropExecutor(const Cropping::PipelineSettings& settings)
    : m_settings(settings),
    m_cancelRequested(0),
    m_transcoderDetected(false) {
}

void CropExecutor::requestCancel() {
    m_cancelRequested.storeRelease(1);
}

bool CropExecutor::isCancelRequested() const {
    return m_cancelRequested.loadAcquire() != 0;
}

void CropExecutor::count(Cropping::BatchSummary& summary, JobStatus status) {
    switch (status) {
    case JobStatus::Succeeded: summary.succeeded++; break;
    case JobStatus::SkippedForSize: summary.skippedForSize++; break;
    case JobStatus::Failed: summary.failed++; break;
    case JobStatus::Cancelled: summary.cancelled++; break;
    }
}

void CropExecutor::postJobCompleted(CropMessageQueue* queue, const Cropping::CropJob& job, int jobIndex, int jobCount,
                                    const JobResult& result) {
    if (!queue) return;
    CropMessage msg;
    msg.type = CropMessage::Type::JobCompleted;
    msg.jobIndex = jobIndex;
    msg.jobCount = jobCount;
    msg.sourcePath = job.sourcePath;
    msg.outputPath = result.status == JobStatus::Succeeded ? job.outputPath : QString();
    msg.status = result.status;
    msg.error = result.error;
    msg.reason = result.reason;
    queue->post(msg);
}

Cropping::BatchSummary CropExecutor::execute(const CropRequest& request, CropMessageQueue* queue) {
    Cropping::BatchSummary summary;
    const int jobCount = request.candidates.size();
    const QRect region = request.region.toRect();

    // Problems with the request as a whole fail every candidate
    QString requestError;
    if (!request.region.isValidWithin(request.referenceSize)) {
        requestError = "Crop region is empty or outside the reference image.";
    } else if (request.outputDirectory.isEmpty() || !QDir().mkpath(request.outputDirectory)) {
        requestError = QString("Cannot use output directory '%1'.").arg(request.outputDirectory);
    }

    QList<Cropping::CropJob> jobs;
    QList<int> jobIndices;
    for (int i = 0; i < jobCount; ++i) {
        const Cropping::MediaItem& item = request.candidates.at(i);
        Cropping::CropJob job;
        job.sourcePath = item.path;
        job.region = region;
        job.kind = item.kind;

        if (!requestError.isEmpty()) {
            JobResult result;
            result.status = JobStatus::Failed;
            result.reason = requestError;
            count(summary, result.status);
            postJobCompleted(queue, job, i, jobCount, result);
            continue;
        }
        if (item.size() != request.referenceSize) {
            JobResult result;
            result.status = JobStatus::SkippedForSize;
            result.error = CropError::DimensionMismatch;
            result.reason = QString("Size %1x%2 differs from reference %3x%4.")
                                .arg(item.pixelWidth).arg(item.pixelHeight)
                                .arg(request.referenceSize.width()).arg(request.referenceSize.height());
            count(summary, result.status);
            postJobCompleted(queue, job, i, jobCount, result);
            continue;
        }
        jobs.append(job);
        jobIndices.append(i);
    }

    if (!requestError.isEmpty()) {
        qWarning() << "CropExecutor::execute:" << requestError;
    }

    bool hasVideo = false;
    for (const Cropping::CropJob& job : jobs) {
        if (job.kind == Cropping::MediaKind::Video) { hasVideo = true; break; }
    }
    if (hasVideo && !m_transcoderDetected) {
        m_transcoder = TranscoderCapabilities::detect(m_settings);
        m_transcoderDetected = true;
    }

    for (int j = 0; j < jobs.size(); ++j) {
        Cropping::CropJob job = jobs.at(j);
        const int jobIndex = jobIndices.at(j);

        if (isCancelRequested()) {
            JobResult result;
            result.status = JobStatus::Cancelled;
            result.error = CropError::Cancelled;
            result.reason = "Batch cancelled before this file started.";
            count(summary, result.status);
            postJobCompleted(queue, job, jobIndex, jobCount, result);
            continue;
        }

        // Chosen just before writing so earlier outputs of this batch count as collisions
        job.outputPath = OutputNaming::uniqueOutputPath(request.outputDirectory, job.sourcePath, m_settings.outputSuffix);

        JobResult result = job.kind == Cropping::MediaKind::Video
                               ? runVideoJob(job, jobIndex, jobCount, queue)
                               : runImageJob(job);
        count(summary, result.status);
        postJobCompleted(queue, job, jobIndex, jobCount, result);

        if (result.status == JobStatus::Succeeded) {
            qDebug() << "CropExecutor: cropped" << job.sourcePath << "->" << job.outputPath;
        } else {
            qWarning() << "CropExecutor:" << Cropping::jobStatusToString(result.status) << job.sourcePath << "-" << result.reason;
        }
    }

    qInfo() << "CropExecutor: batch finished -" << summary.succeeded << "succeeded," << summary.skippedForSize
            << "skipped for size," << summary.failed << "failed," << summary.cancelled << "cancelled";

    if (queue) {
        CropMessage done;
        done.type = CropMessage::Type::BatchCompleted;
        done.jobCount = jobCount;
        done.summary = summary;
        queue->post(done);
    }
    return summary;
}

CropExecutor::JobResult CropExecutor::runImageJob(const Cropping::CropJob& job) {
    JobResult result;
    CropError error = CropError::None;
    QString message;
    if (cropImage(job.sourcePath, job.region, job.outputPath, error, message)) {
        result.status = JobStatus::Succeeded;
        return result;
    }
    result.status = error == CropError::DimensionMismatch ? JobStatus::SkippedForSize : JobStatus::Failed;
    result.error = error;
    result.reason = message;
    return result;
}

CropExecutor::JobResult CropExecutor::runVideoJob(const Cropping::CropJob& job, int jobIndex, int jobCount,
                                                  CropMessageQueue* queue) {
    JobResult result;
    if (!m_transcoder.isAvailable()) {
        result.status = JobStatus::Failed;
        result.error = CropError::ExternalToolMissing;
        result.reason = m_transcoder.errorMessage();
        return result;
    }

    // Unknown duration only makes progress indeterminate
    double duration = MediaProbe::durationSeconds(job.sourcePath);

    ProcessSupervisor supervisor(m_settings);
    supervisor.setCancellationFlag(&m_cancelRequested);
    QObject::connect(&supervisor, &ProcessSupervisor::progressUpdated,
                     [queue, &job, jobIndex, jobCount](int percent, double elapsedSeconds) {
        if (!queue) return;
        CropMessage msg;
        msg.type = CropMessage::Type::ProgressUpdate;
        msg.jobIndex = jobIndex;
        msg.jobCount = jobCount;
        msg.sourcePath = job.sourcePath;
        msg.percent = percent;
        msg.elapsedSeconds = elapsedSeconds;
        queue->post(msg);
    });

    ProcessSupervisor::Outcome outcome = supervisor.run(m_transcoder.program(),
                                                        m_transcoder.cropArguments(job.sourcePath, job.region, job.outputPath),
                                                        job.outputPath, duration);
    switch (outcome.status) {
    case ProcessSupervisor::Outcome::Status::Success:
        result.status = JobStatus::Succeeded;
        break;
    case ProcessSupervisor::Outcome::Status::Cancelled:
        result.status = JobStatus::Cancelled;
        break;
    case ProcessSupervisor::Outcome::Status::Failed:
        result.status = JobStatus::Failed;
        break;
    }
    result.error = outcome.error;
    result.reason = outcome.reason;
    return result;
}

bool CropExecutor::cropImage(const QString& sourcePath, const QRect& region, const QString& outputPath,
                             CropError& error, QString& errorMessage) {
    cv::Mat source;
    try {
        source = cv::imread(sourcePath.toStdString(), cv::IMREAD_UNCHANGED);
    } catch (const cv::Exception& ex) {
        qWarning() << "CropExecutor::cropImage: OpenCV exception reading" << sourcePath << ":" << ex.what();
    }

    if (!source.empty()) {
        if (region.x() < 0 || region.y() < 0 || region.right() >= source.cols || region.bottom() >= source.rows) {
            error = CropError::DimensionMismatch;
            errorMessage = QString("Image is %1x%2, region does not fit.").arg(source.cols).arg(source.rows);
            return false;
        }
        try {
            cv::Mat cropped = source(cv::Rect(region.x(), region.y(), region.width(), region.height()));
            if (cv::imwrite(outputPath.toStdString(), cropped)) {
                return true;
            }
            qDebug() << "CropExecutor::cropImage: OpenCV cannot encode" << outputPath << "- trying Qt";
        } catch (const cv::Exception& ex) {
            qDebug() << "CropExecutor::cropImage: OpenCV exception writing" << outputPath << ":" << ex.what();
        }
    }

    // Formats OpenCV has no codec for (GIF, some TIFF variants) go through Qt's image plugins
    QImageReader reader(sourcePath);
    reader.setAutoTransform(false);
    QImage image = reader.read();
    if (image.isNull()) {
        error = CropError::UnreadableMedia;
        errorMessage = QString("Cannot read %1: %2").arg(QFileInfo(sourcePath).fileName(), reader.errorString());
        return false;
    }
    if (!image.rect().contains(region)) {
        error = CropError::DimensionMismatch;
        errorMessage = QString("Image is %1x%2, region does not fit.").arg(image.width()).arg(image.height());
        return false;
    }
    if (!image.copy(region).save(outputPath)) {
        error = CropError::UnreadableMedia;
        errorMessage = QString("Cannot write %1.").arg(outputPath);
        ProcessSupervisor::removePartialOutput(outputPath);
        return false;
    }
    return true;
}
