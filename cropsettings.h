#ifndef CROPSETTINGS_H
#define CROPSETTINGS_H

#include <QString>
#include <QStringList>
#include <QJsonObject>

namespace Cropping {

/**
 * @brief Tunables for the interactive crop editor.
 */
struct EditorSettings {
    int handleSize = 8;            // Handle square side in viewport pixels
    int minimumCropSize = 10;      // Smallest width/height kept by selection, move, resize and numeric edits
    double minZoom = 0.1;
    double maxZoom = 10.0;
    double zoomStepBase = 1.1;     // Scale multiplier per wheel notch
    int wheelNotchDelta = 120;     // angleDelta units per notch
    int canvasMultiple = 3;        // Canvas is this many times the scaled image
    double fitMargin = 0.95;       // Fit-to-window leaves 5% around the image
    bool geometryDebug = false;    // Verbose pointer tracing
};

/**
 * @brief Tunables for the batch pipeline and the external transcoder.
 */
struct PipelineSettings {
    QString transcoderProgram = "ffmpeg";
    QString softwareEncoder = "libx264";
    QString hardwareEncoder = "h264_nvenc";
    QString webmEncoder = "libvpx-vp9";
    bool preferHardwareEncoding = true;
    int encoderProbeTimeoutMs = 5000;
    int cancelPollIntervalMs = 100;
    int terminateTimeoutMs = 3000;
    QString outputSuffix = "_cropped";
    QStringList videoExtensions = {"mp4", "mov", "avi", "mkv", "webm", "m4v", "wmv", "flv", "mpg", "mpeg"};
};

struct AppSettings {
    EditorSettings editor;
    PipelineSettings pipeline;
};

QJsonObject editorSettingsToJson(const EditorSettings& settings);
EditorSettings editorSettingsFromJson(const QJsonObject& json);

QJsonObject pipelineSettingsToJson(const PipelineSettings& settings);
PipelineSettings pipelineSettingsFromJson(const QJsonObject& json);

QJsonObject settingsToJson(const AppSettings& settings);
AppSettings settingsFromJson(const QJsonObject& json);

// Reads a JSON settings file. A missing file yields defaults silently; a
// malformed one yields defaults and a warning.
AppSettings loadSettingsFile(const QString& filePath);
bool saveSettingsFile(const QString& filePath, const AppSettings& settings);

} // namespace Cropping

#endif // CROPSETTINGS_H
