#include "transcodercapabilities.h"

#include <QDebug>
#include <QFileInfo>
#include <QProcess>
#include <QStandardPaths>

TranscoderCapabilities::TranscoderCapabilities()
    : m_hardwareAccelerated(false) {
}

QString TranscoderCapabilities::resolveProgram(const QString& program) {
    if (program.isEmpty()) return QString();
    QFileInfo info(program);
    if (info.isAbsolute() || program.contains('/')) {
        return (info.isFile() && info.isExecutable()) ? info.absoluteFilePath() : QString();
    }
    return QStandardPaths::findExecutable(program);
}

bool TranscoderCapabilities::runProbe(const QString& program, const QStringList& arguments, int timeoutMs,
                                      QByteArray* output) {
    QProcess p;
    p.setProgram(program);
    p.setArguments(arguments);
    p.start();
    if (!p.waitForStarted(timeoutMs)) {
        qWarning() << "TranscoderCapabilities: probe failed to start:" << p.errorString();
        return false;
    }
    if (!p.waitForFinished(timeoutMs)) {
        qWarning() << "TranscoderCapabilities: probe timed out:" << arguments.join(' ');
        p.kill();
        p.waitForFinished(1000);
        return false;
    }
    if (output) *output = p.readAllStandardOutput();
    return p.exitStatus() == QProcess::NormalExit && p.exitCode() == 0;
}

bool TranscoderCapabilities::encoderWorks(const QString& program, const QString& encoderName, int timeoutMs) {
    // Builds may list hardware encoders the machine has no device for, so encode one frame
    return runProbe(program,
                    {"-hide_banner", "-nostdin", "-f", "lavfi", "-i", "nullsrc=s=256x256",
                     "-frames:v", "1", "-c:v", encoderName, "-f", "null", "-"},
                    timeoutMs, nullptr);
}

TranscoderCapabilities TranscoderCapabilities::detect(const Cropping::PipelineSettings& settings) {
    TranscoderCapabilities caps;
    caps.m_encoder = settings.softwareEncoder;
    caps.m_webmEncoder = settings.webmEncoder;

    caps.m_program = resolveProgram(settings.transcoderProgram);
    if (caps.m_program.isEmpty()) {
        caps.m_errorMessage = QString("Transcoder '%1' was not found.").arg(settings.transcoderProgram);
        qWarning() << "TranscoderCapabilities::detect:" << caps.m_errorMessage;
        return caps;
    }

    if (!settings.preferHardwareEncoding || settings.hardwareEncoder.isEmpty()) {
        qDebug() << "TranscoderCapabilities::detect: using" << caps.m_program << "with" << caps.m_encoder;
        return caps;
    }

    QByteArray listing;
    if (!runProbe(caps.m_program, {"-hide_banner", "-encoders"}, settings.encoderProbeTimeoutMs, &listing)) {
        qWarning() << "TranscoderCapabilities::detect: encoder listing failed, using" << caps.m_encoder;
    } else if (encoderListContains(QString::fromUtf8(listing), settings.hardwareEncoder)) {
        if (encoderWorks(caps.m_program, settings.hardwareEncoder, settings.encoderProbeTimeoutMs)) {
            caps.m_encoder = settings.hardwareEncoder;
            caps.m_hardwareAccelerated = true;
        } else {
            qInfo() << "TranscoderCapabilities::detect:" << settings.hardwareEncoder
                    << "is listed but cannot encode here, falling back to" << caps.m_encoder;
        }
    }
    qDebug() << "TranscoderCapabilities::detect: using" << caps.m_program << "with" << caps.m_encoder
             << (caps.m_hardwareAccelerated ? "(hardware)" : "(software)");
    return caps;
}

bool TranscoderCapabilities::encoderListContains(const QString& encodersOutput, const QString& encoderName) {
    // Lines look like " V....D h264_nvenc           NVIDIA NVENC H.264 encoder"
    const QStringList lines = encodersOutput.split('\n');
    for (const QString& line : lines) {
        QStringList columns = line.simplified().split(' ');
        if (columns.size() >= 2 && columns.at(1) == encoderName) return true;
    }
    return false;
}

QString TranscoderCapabilities::encoderFor(const QString& outputPath) const {
    // The WebM muxer only takes VP8/VP9/AV1 video
    if (QFileInfo(outputPath).suffix().compare("webm", Qt::CaseInsensitive) == 0 && !m_webmEncoder.isEmpty()) {
        return m_webmEncoder;
    }
    return m_encoder;
}

QString TranscoderCapabilities::cropFilter(const QRect& region) {
    // exact=1 keeps odd x/y instead of rounding them down to the chroma grid
    QString filter = QString("crop=%1:%2:%3:%4:exact=1")
                         .arg(region.width())
                         .arg(region.height())
                         .arg(region.x())
                         .arg(region.y());
    // 4:2:0 encoders refuse odd frame sizes; one padding row/column keeps every cropped pixel
    if (region.width() % 2 != 0 || region.height() % 2 != 0) {
        filter += ",pad=ceil(iw/2)*2:ceil(ih/2)*2";
    }
    return filter;
}

QStringList TranscoderCapabilities::cropArguments(const QString& sourcePath, const QRect& region, const QString& outputPath) const {
    return {"-hide_banner", "-nostdin", "-y",
            "-i", sourcePath,
            "-vf", cropFilter(region),
            "-c:v", encoderFor(outputPath),
            "-c:a", "copy",
            outputPath};
}
