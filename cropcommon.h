#ifndef CROPCOMMON_H
#define CROPCOMMON_H

#include <QString>
#include <QSize>
#include <QRect>
#include <QMetaType>

// This header defines types shared by the crop editor and the batch pipeline
// so neither side has to include the other.

namespace Cropping {

/**
 * @brief Which part of the crop rectangle a drag is manipulating.
 */
enum class DragMode {
    Move,
    ResizeTL,
    ResizeTR,
    ResizeBL,
    ResizeBR,
    ResizeT,
    ResizeB,
    ResizeL,
    ResizeR
};

inline bool isCornerMode(DragMode mode) {
    return mode == DragMode::ResizeTL || mode == DragMode::ResizeTR ||
           mode == DragMode::ResizeBL || mode == DragMode::ResizeBR;
}

inline bool isEdgeMode(DragMode mode) {
    return mode == DragMode::ResizeT || mode == DragMode::ResizeB ||
           mode == DragMode::ResizeL || mode == DragMode::ResizeR;
}

inline QString dragModeToString(DragMode mode) {
    switch (mode) {
    case DragMode::Move: return "Move";
    case DragMode::ResizeTL: return "ResizeTL";
    case DragMode::ResizeTR: return "ResizeTR";
    case DragMode::ResizeBL: return "ResizeBL";
    case DragMode::ResizeBR: return "ResizeBR";
    case DragMode::ResizeT: return "ResizeT";
    case DragMode::ResizeB: return "ResizeB";
    case DragMode::ResizeL: return "ResizeL";
    case DragMode::ResizeR: return "ResizeR";
    default: return "Unknown";
    }
}

/**
 * @brief Optional width:height lock applied while editing the crop region.
 */
struct AspectConstraint {
    bool locked = false;
    double ratio = 1.0; // width / height, > 0

    bool isActive() const { return locked && ratio > 0.0; }
};

enum class MediaKind {
    Image,
    Video
};

inline QString mediaKindToString(MediaKind kind) {
    return kind == MediaKind::Video ? "Video" : "Image";
}

// A file registered with the catalog, with its probed dimensions.
struct MediaItem {
    QString path;
    int pixelWidth = 0;
    int pixelHeight = 0;
    MediaKind kind = MediaKind::Image;

    QSize size() const { return QSize(pixelWidth, pixelHeight); }
};

enum class CropError {
    None,
    UnreadableMedia,
    DimensionMismatch,
    ExternalToolMissing,
    ProcessLaunchFailure,
    ProcessNonZeroExit,
    Cancelled
};

inline QString cropErrorToString(CropError error) {
    switch (error) {
    case CropError::None: return "None";
    case CropError::UnreadableMedia: return "Unreadable media";
    case CropError::DimensionMismatch: return "Dimension mismatch";
    case CropError::ExternalToolMissing: return "External tool missing";
    case CropError::ProcessLaunchFailure: return "Process launch failure";
    case CropError::ProcessNonZeroExit: return "Process exited with an error";
    case CropError::Cancelled: return "Cancelled";
    default: return "Unknown";
    }
}

// One file's worth of work, created by the executor at execution time.
struct CropJob {
    QString sourcePath;
    QRect region;       // source-pixel space
    QString outputPath;
    MediaKind kind = MediaKind::Image;
};

enum class JobStatus {
    Succeeded,
    SkippedForSize,
    Failed,
    Cancelled
};

inline QString jobStatusToString(JobStatus status) {
    switch (status) {
    case JobStatus::Succeeded: return "Succeeded";
    case JobStatus::SkippedForSize: return "Skipped (size)";
    case JobStatus::Failed: return "Failed";
    case JobStatus::Cancelled: return "Cancelled";
    default: return "Unknown";
    }
}

/**
 * @brief Aggregate counts reported for a batch, complete or interrupted.
 */
struct BatchSummary {
    int succeeded = 0;
    int skippedForSize = 0;
    int failed = 0;
    int cancelled = 0;

    int total() const { return succeeded + skippedForSize + failed + cancelled; }
};

} // namespace Cropping

Q_DECLARE_METATYPE(Cropping::BatchSummary)

#endif // CROPCOMMON_H
