#include "testhelpers.h"

#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QThread>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace TestHelpers {

bool writeImage(const QString& path, const QSize& size) {
    cv::Mat img(size.height(), size.width(), CV_8UC3, cv::Scalar(40, 120, 200));
    // A marker in the top-left corner so crops are distinguishable from the source
    cv::rectangle(img, cv::Rect(0, 0, qMin(5, size.width()), qMin(5, size.height())), cv::Scalar(255, 255, 255), cv::FILLED);
    return cv::imwrite(path.toStdString(), img);
}

bool writeScript(const QString& path, const QString& body) {
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text)) return false;
    f.write("#!/bin/sh\n");
    f.write(body.toUtf8());
    f.close();
    return f.setPermissions(QFile::ReadOwner | QFile::WriteOwner | QFile::ExeOwner |
                            QFile::ReadGroup | QFile::ExeGroup);
}

QString readTextFile(const QString& path) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly | QIODevice::Text)) return QString();
    return QString::fromUtf8(f.readAll());
}

bool waitForFile(const QString& path, int timeoutMs) {
    QElapsedTimer timer;
    timer.start();
    while (timer.elapsed() < timeoutMs) {
        if (QFileInfo::exists(path)) return true;
        QThread::msleep(20);
    }
    return QFileInfo::exists(path);
}

} // namespace TestHelpers
