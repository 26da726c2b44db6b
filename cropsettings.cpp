#include "cropsettings.h"

#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QDir>
#include <QJsonDocument>
#include <QJsonArray>
#include <QJsonParseError>

namespace Cropping {

QJsonObject editorSettingsToJson(const EditorSettings& settings) {
    QJsonObject obj;
    obj["handleSize"] = settings.handleSize;
    obj["minimumCropSize"] = settings.minimumCropSize;
    obj["minZoom"] = settings.minZoom;
    obj["maxZoom"] = settings.maxZoom;
    obj["zoomStepBase"] = settings.zoomStepBase;
    obj["wheelNotchDelta"] = settings.wheelNotchDelta;
    obj["canvasMultiple"] = settings.canvasMultiple;
    obj["fitMargin"] = settings.fitMargin;
    obj["geometryDebug"] = settings.geometryDebug;
    return obj;
}

EditorSettings editorSettingsFromJson(const QJsonObject& json) {
    EditorSettings s;
    s.handleSize = json.value("handleSize").toInt(s.handleSize);
    s.minimumCropSize = json.value("minimumCropSize").toInt(s.minimumCropSize);
    s.minZoom = json.value("minZoom").toDouble(s.minZoom);
    s.maxZoom = json.value("maxZoom").toDouble(s.maxZoom);
    s.zoomStepBase = json.value("zoomStepBase").toDouble(s.zoomStepBase);
    s.wheelNotchDelta = json.value("wheelNotchDelta").toInt(s.wheelNotchDelta);
    s.canvasMultiple = json.value("canvasMultiple").toInt(s.canvasMultiple);
    s.fitMargin = json.value("fitMargin").toDouble(s.fitMargin);
    s.geometryDebug = json.value("geometryDebug").toBool(s.geometryDebug);

    // Reject values the geometry engine cannot work with
    if (s.handleSize < 1) s.handleSize = EditorSettings().handleSize;
    if (s.minimumCropSize < 1) s.minimumCropSize = EditorSettings().minimumCropSize;
    if (s.minZoom <= 0.0 || s.maxZoom < s.minZoom) {
        qWarning() << "editorSettingsFromJson: invalid zoom range" << s.minZoom << s.maxZoom << "- using defaults";
        s.minZoom = EditorSettings().minZoom;
        s.maxZoom = EditorSettings().maxZoom;
    }
    if (s.zoomStepBase <= 1.0) s.zoomStepBase = EditorSettings().zoomStepBase;
    if (s.wheelNotchDelta <= 0) s.wheelNotchDelta = EditorSettings().wheelNotchDelta;
    if (s.canvasMultiple < 1) s.canvasMultiple = EditorSettings().canvasMultiple;
    if (s.fitMargin <= 0.0 || s.fitMargin > 1.0) s.fitMargin = EditorSettings().fitMargin;
    return s;
}

QJsonObject pipelineSettingsToJson(const PipelineSettings& settings) {
    QJsonObject obj;
    obj["transcoderProgram"] = settings.transcoderProgram;
    obj["softwareEncoder"] = settings.softwareEncoder;
    obj["hardwareEncoder"] = settings.hardwareEncoder;
    obj["webmEncoder"] = settings.webmEncoder;
    obj["preferHardwareEncoding"] = settings.preferHardwareEncoding;
    obj["encoderProbeTimeoutMs"] = settings.encoderProbeTimeoutMs;
    obj["cancelPollIntervalMs"] = settings.cancelPollIntervalMs;
    obj["terminateTimeoutMs"] = settings.terminateTimeoutMs;
    obj["outputSuffix"] = settings.outputSuffix;
    obj["videoExtensions"] = QJsonArray::fromStringList(settings.videoExtensions);
    return obj;
}

PipelineSettings pipelineSettingsFromJson(const QJsonObject& json) {
    PipelineSettings s;
    s.transcoderProgram = json.value("transcoderProgram").toString(s.transcoderProgram);
    s.softwareEncoder = json.value("softwareEncoder").toString(s.softwareEncoder);
    s.hardwareEncoder = json.value("hardwareEncoder").toString(s.hardwareEncoder);
    s.webmEncoder = json.value("webmEncoder").toString(s.webmEncoder);
    s.preferHardwareEncoding = json.value("preferHardwareEncoding").toBool(s.preferHardwareEncoding);
    s.encoderProbeTimeoutMs = json.value("encoderProbeTimeoutMs").toInt(s.encoderProbeTimeoutMs);
    s.cancelPollIntervalMs = json.value("cancelPollIntervalMs").toInt(s.cancelPollIntervalMs);
    s.terminateTimeoutMs = json.value("terminateTimeoutMs").toInt(s.terminateTimeoutMs);
    s.outputSuffix = json.value("outputSuffix").toString(s.outputSuffix);

    if (json.contains("videoExtensions")) {
        QStringList extensions;
        const QJsonArray arr = json.value("videoExtensions").toArray();
        for (const QJsonValue& v : arr) {
            QString ext = v.toString().trimmed().toLower();
            if (ext.startsWith('.')) ext.remove(0, 1);
            if (!ext.isEmpty()) extensions.append(ext);
        }
        s.videoExtensions = extensions;
    }

    // The poll interval is an upper bound on cancellation latency
    if (s.cancelPollIntervalMs <= 0 || s.cancelPollIntervalMs > 100) {
        s.cancelPollIntervalMs = PipelineSettings().cancelPollIntervalMs;
    }
    if (s.terminateTimeoutMs < 0) s.terminateTimeoutMs = PipelineSettings().terminateTimeoutMs;
    if (s.encoderProbeTimeoutMs <= 0) s.encoderProbeTimeoutMs = PipelineSettings().encoderProbeTimeoutMs;
    if (s.outputSuffix.isEmpty()) s.outputSuffix = PipelineSettings().outputSuffix;
    return s;
}

QJsonObject settingsToJson(const AppSettings& settings) {
    QJsonObject root;
    root["version"] = 1;
    root["editor"] = editorSettingsToJson(settings.editor);
    root["pipeline"] = pipelineSettingsToJson(settings.pipeline);
    return root;
}

AppSettings settingsFromJson(const QJsonObject& json) {
    AppSettings settings;
    settings.editor = editorSettingsFromJson(json.value("editor").toObject());
    settings.pipeline = pipelineSettingsFromJson(json.value("pipeline").toObject());
    return settings;
}

AppSettings loadSettingsFile(const QString& filePath) {
    QFile f(filePath);
    if (!f.exists()) {
        qDebug() << "loadSettingsFile: no settings at" << filePath << "- using defaults";
        return AppSettings();
    }
    if (!f.open(QIODevice::ReadOnly)) {
        qWarning() << "loadSettingsFile: Failed to open" << filePath << ":" << f.errorString();
        return AppSettings();
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(f.readAll(), &parseError);
    f.close();
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "loadSettingsFile: Malformed settings in" << filePath << ":" << parseError.errorString();
        return AppSettings();
    }

    qDebug() << "loadSettingsFile: Loaded settings from" << filePath;
    return settingsFromJson(doc.object());
}

bool saveSettingsFile(const QString& filePath, const AppSettings& settings) {
    QDir().mkpath(QFileInfo(filePath).absolutePath());
    QFile f(filePath);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        qWarning() << "saveSettingsFile: Failed to open" << filePath << "for writing.";
        return false;
    }
    QByteArray data = QJsonDocument(settingsToJson(settings)).toJson(QJsonDocument::Indented);
    qint64 written = f.write(data);
    f.close();
    if (written != data.size()) {
        qWarning() << "saveSettingsFile: Failed to write data to" << filePath;
        return false;
    }
    return true;
}

} // namespace Cropping
