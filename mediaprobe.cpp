#include "mediaprobe.h"

#include <QDebug>
#include <QFileInfo>
#include <QImageReader>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/videoio.hpp>

namespace MediaProbe {

Cropping::MediaKind kindForPath(const QString& path, const QStringList& videoExtensions) {
    QString suffix = QFileInfo(path).suffix().toLower();
    return videoExtensions.contains(suffix) ? Cropping::MediaKind::Video : Cropping::MediaKind::Image;
}

namespace {

ProbeResult unreadable(const QString& path, const QString& message) {
    ProbeResult result;
    result.item.path = path;
    result.error = Cropping::CropError::UnreadableMedia;
    result.errorMessage = message;
    qWarning() << "MediaProbe:" << path << "-" << message;
    return result;
}

bool probeImage(const QString& path, QSize& size, QString& errorMessage) {
    QImageReader reader(path);
    QSize headerSize = reader.size();
    if (headerSize.isValid() && !headerSize.isEmpty()) {
        size = headerSize;
        return true;
    }

    // Formats the Qt image plugins cannot parse may still be readable by OpenCV
    try {
        cv::Mat img = cv::imread(path.toStdString(), cv::IMREAD_UNCHANGED);
        if (!img.empty()) {
            size = QSize(img.cols, img.rows);
            return true;
        }
    } catch (const cv::Exception& ex) {
        errorMessage = QString("OpenCV exception: %1").arg(ex.what());
        return false;
    }
    errorMessage = reader.errorString();
    return false;
}

bool probeVideo(const QString& path, QSize& size, QString& errorMessage) {
    try {
        cv::VideoCapture capture(path.toStdString());
        if (!capture.isOpened()) {
            errorMessage = "Failed to open video file with OpenCV.";
            return false;
        }
        size = QSize(static_cast<int>(capture.get(cv::CAP_PROP_FRAME_WIDTH)),
                     static_cast<int>(capture.get(cv::CAP_PROP_FRAME_HEIGHT)));
        capture.release();
    } catch (const cv::Exception& ex) {
        errorMessage = QString("OpenCV exception: %1").arg(ex.what());
        return false;
    }
    if (size.isEmpty()) {
        errorMessage = "Video has invalid dimensions.";
        return false;
    }
    return true;
}

} // namespace

ProbeResult probe(const QString& path, const QStringList& videoExtensions) {
    QFileInfo info(path);
    if (!info.exists() || !info.isFile()) {
        return unreadable(path, "File does not exist.");
    }

    Cropping::MediaKind kind = kindForPath(path, videoExtensions);
    QSize size;
    QString errorMessage;
    bool ok = kind == Cropping::MediaKind::Video ? probeVideo(path, size, errorMessage)
                                                 : probeImage(path, size, errorMessage);
    if (!ok) {
        return unreadable(path, errorMessage);
    }

    ProbeResult result;
    result.ok = true;
    result.item.path = info.absoluteFilePath();
    result.item.pixelWidth = size.width();
    result.item.pixelHeight = size.height();
    result.item.kind = kind;
    return result;
}

double durationSeconds(const QString& path) {
    try {
        cv::VideoCapture capture(path.toStdString());
        if (!capture.isOpened()) return -1.0;
        double fps = capture.get(cv::CAP_PROP_FPS);
        double frames = capture.get(cv::CAP_PROP_FRAME_COUNT);
        capture.release();
        if (fps <= 0.0 || frames <= 0.0) {
            qDebug() << "MediaProbe::durationSeconds: unknown duration for" << path << "fps" << fps << "frames" << frames;
            return -1.0;
        }
        return frames / fps;
    } catch (const cv::Exception& ex) {
        qWarning() << "MediaProbe::durationSeconds: OpenCV exception for" << path << ":" << ex.what();
        return -1.0;
    }
}

bool extractRepresentativeFrame(const QString& path, QImage& frame, QString& errorMessage) {
    try {
        cv::VideoCapture capture(path.toStdString());
        if (!capture.isOpened()) {
            errorMessage = "Failed to open video file with OpenCV.";
            return false;
        }

        cv::Mat mat;
        int totalFrames = static_cast<int>(capture.get(cv::CAP_PROP_FRAME_COUNT));
        if (totalFrames > 10) {
            capture.set(cv::CAP_PROP_POS_FRAMES, totalFrames / 10);
            capture.read(mat);
        }
        if (mat.empty()) {
            capture.set(cv::CAP_PROP_POS_FRAMES, 0);
            capture.read(mat);
        }
        capture.release();

        if (mat.empty()) {
            errorMessage = "No frame could be decoded.";
            return false;
        }
        convertCvMatToQImage(mat, frame);
    } catch (const cv::Exception& ex) {
        errorMessage = QString("OpenCV exception: %1").arg(ex.what());
        return false;
    }

    if (frame.isNull()) {
        errorMessage = "Unsupported frame format.";
        return false;
    }
    return true;
}

bool loadPreview(const Cropping::MediaItem& item, QImage& image, QString& errorMessage) {
    if (item.kind == Cropping::MediaKind::Video) {
        return extractRepresentativeFrame(item.path, image, errorMessage);
    }

    QImageReader reader(item.path);
    reader.setAutoTransform(false); // crop coordinates refer to the stored pixel grid
    image = reader.read();
    if (!image.isNull()) return true;

    try {
        cv::Mat mat = cv::imread(item.path.toStdString(), cv::IMREAD_COLOR);
        convertCvMatToQImage(mat, image);
    } catch (const cv::Exception& ex) {
        errorMessage = QString("OpenCV exception: %1").arg(ex.what());
        return false;
    }
    if (image.isNull()) {
        errorMessage = reader.errorString();
        return false;
    }
    return true;
}

void convertCvMatToQImage(const cv::Mat& mat, QImage& qimg) {
    if (mat.empty()) { qimg = QImage(); return; }
    // copy() detaches the QImage from the Mat buffer, which is released by the caller
    if (mat.type() == CV_8UC3) {
        qimg = QImage(mat.data, mat.cols, mat.rows, static_cast<int>(mat.step), QImage::Format_RGB888).rgbSwapped();
    } else if (mat.type() == CV_8UC1) {
        qimg = QImage(mat.data, mat.cols, mat.rows, static_cast<int>(mat.step), QImage::Format_Grayscale8).copy();
    } else {
        cv::Mat temp;
        try {
            if (mat.channels() == 4) { cv::cvtColor(mat, temp, cv::COLOR_BGRA2BGR); qimg = QImage(temp.data, temp.cols, temp.rows, static_cast<int>(temp.step), QImage::Format_RGB888).rgbSwapped(); }
            else if (mat.channels() == 3) { mat.convertTo(temp, CV_8UC3, 1.0 / 256.0); qimg = QImage(temp.data, temp.cols, temp.rows, static_cast<int>(temp.step), QImage::Format_RGB888).rgbSwapped(); }
            else if (mat.channels() == 1) { mat.convertTo(temp, CV_8UC1, 1.0 / 256.0); qimg = QImage(temp.data, temp.cols, temp.rows, static_cast<int>(temp.step), QImage::Format_Grayscale8).copy(); }
            else { qimg = QImage(); }
        } catch (const cv::Exception& ex) {
            qWarning() << "OpenCV conversion exception:" << ex.what(); qimg = QImage();
        }
    }
}

} // namespace MediaProbe
