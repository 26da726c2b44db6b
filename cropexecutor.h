#ifndef CROPEXECUTOR_H
#define CROPEXECUTOR_H

#include <QAtomicInt>
#include <QList>
#include <QRect>
#include <QSize>
#include <QString>

#include "cropcommon.h"
#include "cropregion.h"
#include "cropsettings.h"
#include "transcodercapabilities.h"

class CropMessageQueue;

/**
 * @brief Everything a batch needs, copied from the editor at commit time.
 */
struct CropRequest {
    CropRegion region;
    QSize referenceSize;                     // dimensions of the reference item
    QList<Cropping::MediaItem> candidates;
    QString outputDirectory;
};

/**
 * @brief Applies one committed crop region to a list of files.
 *
 * Candidates whose size differs from the reference are skipped, never
 * rescaled. Images are cropped synchronously with OpenCV; each video runs
 * through a ProcessSupervisor, one at a time. A failing file never stops the
 * batch. Cancellation stops the job in flight and every job after it, and
 * outputs that were already written are kept.
 */
class CropExecutor {
public:
    explicit CropExecutor(const Cropping::PipelineSettings& settings = Cropping::PipelineSettings());

    // Runs the whole batch on the calling thread. queue may be null.
    Cropping::BatchSummary execute(const CropRequest& request, CropMessageQueue* queue);

    // Thread-safe
    void requestCancel();
    bool isCancelRequested() const;

    // Copies region out of sourcePath into outputPath, keeping the source format and depth
    static bool cropImage(const QString& sourcePath, const QRect& region, const QString& outputPath,
                          Cropping::CropError& error, QString& errorMessage);

private:
    struct JobResult {
        Cropping::JobStatus status = Cropping::JobStatus::Failed;
        Cropping::CropError error = Cropping::CropError::None;
        QString reason;
    };

    JobResult runImageJob(const Cropping::CropJob& job);
    JobResult runVideoJob(const Cropping::CropJob& job, int jobIndex, int jobCount, CropMessageQueue* queue);

    void postJobCompleted(CropMessageQueue* queue, const Cropping::CropJob& job, int jobIndex, int jobCount,
                          const JobResult& result);
    static void count(Cropping::BatchSummary& summary, Cropping::JobStatus status);

    Cropping::PipelineSettings m_settings;
    QAtomicInt m_cancelRequested;

    // Detected once, on the first batch that contains a video
    bool m_transcoderDetected;
    TranscoderCapabilities m_transcoder;
};

#endif // CROPEXECUTOR_H
