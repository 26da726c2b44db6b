#ifndef TRANSCODERCAPABILITIES_H
#define TRANSCODERCAPABILITIES_H

#include <QByteArray>
#include <QString>
#include <QStringList>
#include <QRect>

#include "cropsettings.h"

/**
 * @brief What the external transcoder on this machine can do.
 *
 * Detected once per batch, before the first video job: the executable is
 * resolved and, when hardware encoding is preferred, the configured hardware
 * encoder is used if the encoder list names it and a one-frame test encode
 * with it succeeds.
 */
class TranscoderCapabilities {
public:
    TranscoderCapabilities();

    static TranscoderCapabilities detect(const Cropping::PipelineSettings& settings);

    bool isAvailable() const { return !m_program.isEmpty(); }
    QString program() const { return m_program; }
    QString encoder() const { return m_encoder; }
    bool isHardwareAccelerated() const { return m_hardwareAccelerated; }
    QString errorMessage() const { return m_errorMessage; }

    // ffmpeg arguments for cropping source to region (source-pixel space) into output
    QStringList cropArguments(const QString& sourcePath, const QRect& region, const QString& outputPath) const;

    // Video encoder for an output file; WebM outputs get the WebM encoder
    QString encoderFor(const QString& outputPath) const;

    static QString cropFilter(const QRect& region);

    // True if an "-encoders" listing names encoderName in its name column
    static bool encoderListContains(const QString& encodersOutput, const QString& encoderName);

    // Encodes one synthetic frame with encoderName and reports whether that succeeded
    static bool encoderWorks(const QString& program, const QString& encoderName, int timeoutMs);

    static QString resolveProgram(const QString& program);

private:
    static bool runProbe(const QString& program, const QStringList& arguments, int timeoutMs, QByteArray* output);

    QString m_program;
    QString m_encoder;
    QString m_webmEncoder;
    bool m_hardwareAccelerated;
    QString m_errorMessage;
};

#endif // TRANSCODERCAPABILITIES_H
