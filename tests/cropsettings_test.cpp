#include "cropsettings.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonObject>
#include <QTemporaryDir>

#include <gtest/gtest.h>

using namespace Cropping;

TEST(CropSettingsTest, Defaults) {
    AppSettings s;
    EXPECT_EQ(s.editor.handleSize, 8);
    EXPECT_EQ(s.editor.minimumCropSize, 10);
    EXPECT_DOUBLE_EQ(s.editor.minZoom, 0.1);
    EXPECT_DOUBLE_EQ(s.editor.maxZoom, 10.0);
    EXPECT_EQ(s.pipeline.transcoderProgram, "ffmpeg");
    EXPECT_EQ(s.pipeline.softwareEncoder, "libx264");
    EXPECT_EQ(s.pipeline.hardwareEncoder, "h264_nvenc");
    EXPECT_EQ(s.pipeline.webmEncoder, "libvpx-vp9");
    EXPECT_LE(s.pipeline.cancelPollIntervalMs, 100);
    EXPECT_EQ(s.pipeline.outputSuffix, "_cropped");
    EXPECT_TRUE(s.pipeline.videoExtensions.contains("mp4"));
}

TEST(CropSettingsTest, SaveAndLoadFile) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath("nested/batchcropper.json");

    AppSettings s;
    s.editor.handleSize = 12;
    s.editor.geometryDebug = true;
    s.pipeline.transcoderProgram = "/opt/ffmpeg/bin/ffmpeg";
    s.pipeline.preferHardwareEncoding = false;
    s.pipeline.videoExtensions = QStringList{"mp4", "ts"};
    ASSERT_TRUE(saveSettingsFile(path, s));

    AppSettings loaded = loadSettingsFile(path);
    EXPECT_EQ(loaded.editor.handleSize, 12);
    EXPECT_TRUE(loaded.editor.geometryDebug);
    EXPECT_EQ(loaded.pipeline.transcoderProgram, "/opt/ffmpeg/bin/ffmpeg");
    EXPECT_FALSE(loaded.pipeline.preferHardwareEncoding);
    EXPECT_EQ(loaded.pipeline.videoExtensions, (QStringList{"mp4", "ts"}));
}

TEST(CropSettingsTest, MissingOrMalformedFileGivesDefaults) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    AppSettings missing = loadSettingsFile(dir.filePath("absent.json"));
    EXPECT_EQ(missing.editor.handleSize, 8);

    QFile f(dir.filePath("broken.json"));
    ASSERT_TRUE(f.open(QIODevice::WriteOnly));
    f.write("{ \"editor\": { \"handleSize\": ");
    f.close();
    AppSettings broken = loadSettingsFile(f.fileName());
    EXPECT_EQ(broken.editor.handleSize, 8);
    EXPECT_EQ(broken.pipeline.transcoderProgram, "ffmpeg");
}

TEST(CropSettingsTest, OutOfRangeValuesFallBack) {
    QJsonObject editor;
    editor["minZoom"] = 5.0;
    editor["maxZoom"] = 1.0;
    editor["fitMargin"] = 2.0;
    EditorSettings e = editorSettingsFromJson(editor);
    EXPECT_DOUBLE_EQ(e.minZoom, 0.1);
    EXPECT_DOUBLE_EQ(e.maxZoom, 10.0);
    EXPECT_DOUBLE_EQ(e.fitMargin, 0.95);

    QJsonObject pipeline;
    pipeline["cancelPollIntervalMs"] = 500;
    pipeline["videoExtensions"] = QJsonArray{".MP4", " Mov ", ""};
    PipelineSettings p = pipelineSettingsFromJson(pipeline);
    EXPECT_EQ(p.cancelPollIntervalMs, 100);
    EXPECT_EQ(p.videoExtensions, (QStringList{"mp4", "mov"}));
}
