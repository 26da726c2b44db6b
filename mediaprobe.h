#ifndef MEDIAPROBE_H
#define MEDIAPROBE_H

#include <QString>
#include <QStringList>
#include <QImage>

#include "cropcommon.h"

namespace cv {
class Mat;
}

namespace MediaProbe {

struct ProbeResult {
    bool ok = false;
    Cropping::MediaItem item;
    Cropping::CropError error = Cropping::CropError::None;
    QString errorMessage;
};

// Classifies by file extension; anything not listed in videoExtensions is treated as an image
Cropping::MediaKind kindForPath(const QString& path, const QStringList& videoExtensions);

/**
 * @brief Reads pixel dimensions without decoding more than needed.
 *
 * Images are read through QImageReader's header parser first and fall back to
 * cv::imread. Videos are opened with cv::VideoCapture. Any failure yields
 * CropError::UnreadableMedia.
 */
ProbeResult probe(const QString& path, const QStringList& videoExtensions);

// Clip length from frame count and frame rate, or a negative value if unknown
double durationSeconds(const QString& path);

/**
 * @brief Decodes one frame to show in the crop editor.
 *
 * Seeks to roughly 10% into the clip so the frame is less likely to be a
 * black leader; falls back to the first frame when seeking fails.
 * @return false and sets errorMessage if no frame could be decoded
 */
bool extractRepresentativeFrame(const QString& path, QImage& frame, QString& errorMessage);

// Loads a still image or a representative video frame for display
bool loadPreview(const Cropping::MediaItem& item, QImage& image, QString& errorMessage);

void convertCvMatToQImage(const cv::Mat& mat, QImage& qimg);

} // namespace MediaProbe

#endif // MEDIAPROBE_H
