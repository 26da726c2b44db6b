#include "transcodercapabilities.h"
#include "testhelpers.h"

#include <QDir>
#include <QTemporaryDir>

#include <gtest/gtest.h>

namespace {

const char* kEncoderListing =
    "Encoders:\n"
    " V..... = Video\n"
    " ------\n"
    " V....D libx264              libx264 H.264 / AVC / MPEG-4 AVC (codec h264)\n"
    " V....D h264_nvenc           NVIDIA NVENC H.264 encoder (codec h264)\n"
    " A....D aac                  AAC (Advanced Audio Coding)\n";

} // namespace

TEST(TranscoderCapabilitiesTest, FindsEncoderInListing) {
    EXPECT_TRUE(TranscoderCapabilities::encoderListContains(kEncoderListing, "h264_nvenc"));
    EXPECT_TRUE(TranscoderCapabilities::encoderListContains(kEncoderListing, "libx264"));
    EXPECT_FALSE(TranscoderCapabilities::encoderListContains(kEncoderListing, "hevc_nvenc"));
    // Names in the description column do not count
    EXPECT_FALSE(TranscoderCapabilities::encoderListContains(kEncoderListing, "NVIDIA"));
}

TEST(TranscoderCapabilitiesTest, MissingProgram) {
    Cropping::PipelineSettings settings;
    settings.transcoderProgram = "/nonexistent/bin/ffmpeg";

    TranscoderCapabilities caps = TranscoderCapabilities::detect(settings);
    EXPECT_FALSE(caps.isAvailable());
    EXPECT_FALSE(caps.errorMessage().isEmpty());
}

TEST(TranscoderCapabilitiesTest, PrefersHardwareEncoderWhenListed) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString tool = QDir(dir.path()).filePath("ffmpeg");
    ASSERT_TRUE(TestHelpers::writeScript(tool, QString("cat <<'LIST'\n%1LIST\n").arg(kEncoderListing)));

    Cropping::PipelineSettings settings;
    settings.transcoderProgram = tool;

    TranscoderCapabilities caps = TranscoderCapabilities::detect(settings);
    ASSERT_TRUE(caps.isAvailable());
    EXPECT_TRUE(caps.isHardwareAccelerated());
    EXPECT_EQ(caps.encoder(), "h264_nvenc");

    settings.preferHardwareEncoding = false;
    TranscoderCapabilities software = TranscoderCapabilities::detect(settings);
    EXPECT_FALSE(software.isHardwareAccelerated());
    EXPECT_EQ(software.encoder(), "libx264");
}

TEST(TranscoderCapabilitiesTest, ListedHardwareEncoderMustPassTestEncode) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString tool = QDir(dir.path()).filePath("ffmpeg");
    // Lists the hardware encoder, but any encode fails as it would without the device
    ASSERT_TRUE(TestHelpers::writeScript(tool, QString("case \"$*\" in\n"
                                                       "  *-encoders*) cat <<'LIST'\n%1LIST\n"
                                                       "    exit 0 ;;\n"
                                                       "esac\n"
                                                       "echo 'No NVENC capable devices found' >&2\n"
                                                       "exit 1\n").arg(kEncoderListing)));

    Cropping::PipelineSettings settings;
    settings.transcoderProgram = tool;

    EXPECT_FALSE(TranscoderCapabilities::encoderWorks(tool, "h264_nvenc", settings.encoderProbeTimeoutMs));
    TranscoderCapabilities caps = TranscoderCapabilities::detect(settings);
    ASSERT_TRUE(caps.isAvailable());
    EXPECT_FALSE(caps.isHardwareAccelerated());
    EXPECT_EQ(caps.encoder(), "libx264");
}

TEST(TranscoderCapabilitiesTest, FallsBackToSoftwareEncoder) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString tool = QDir(dir.path()).filePath("ffmpeg");
    ASSERT_TRUE(TestHelpers::writeScript(tool, "echo ' V....D libx264   libx264 H.264'\n"));

    Cropping::PipelineSettings settings;
    settings.transcoderProgram = tool;

    TranscoderCapabilities caps = TranscoderCapabilities::detect(settings);
    ASSERT_TRUE(caps.isAvailable());
    EXPECT_FALSE(caps.isHardwareAccelerated());
    EXPECT_EQ(caps.cropArguments("/in/clip.mp4", QRect(100, 50, 200, 150), "/out/clip_cropped.mp4"),
              (QStringList{"-hide_banner", "-nostdin", "-y", "-i", "/in/clip.mp4",
                           "-vf", "crop=200:150:100:50:exact=1", "-c:v", "libx264", "-c:a", "copy",
                           "/out/clip_cropped.mp4"}));
}

TEST(TranscoderCapabilitiesTest, CropFilterKeepsOddRectangleExact) {
    EXPECT_EQ(TranscoderCapabilities::cropFilter(QRect(100, 50, 200, 150)), "crop=200:150:100:50:exact=1");
    EXPECT_EQ(TranscoderCapabilities::cropFilter(QRect(101, 51, 201, 151)),
              "crop=201:151:101:51:exact=1,pad=ceil(iw/2)*2:ceil(ih/2)*2");
    EXPECT_EQ(TranscoderCapabilities::cropFilter(QRect(0, 0, 64, 33)),
              "crop=64:33:0:0:exact=1,pad=ceil(iw/2)*2:ceil(ih/2)*2");
}

TEST(TranscoderCapabilitiesTest, WebmOutputUsesWebmEncoder) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString tool = QDir(dir.path()).filePath("ffmpeg");
    ASSERT_TRUE(TestHelpers::writeScript(tool, "echo ' V....D libx264   libx264 H.264'\n"));

    Cropping::PipelineSettings settings;
    settings.transcoderProgram = tool;
    TranscoderCapabilities caps = TranscoderCapabilities::detect(settings);
    ASSERT_TRUE(caps.isAvailable());

    EXPECT_EQ(caps.encoderFor("/out/clip_cropped.mp4"), "libx264");
    EXPECT_EQ(caps.encoderFor("/out/clip_cropped.WEBM"), "libvpx-vp9");
    EXPECT_EQ(caps.cropArguments("/in/clip.webm", QRect(101, 51, 201, 151), "/out/clip_cropped.webm"),
              (QStringList{"-hide_banner", "-nostdin", "-y", "-i", "/in/clip.webm",
                           "-vf", "crop=201:151:101:51:exact=1,pad=ceil(iw/2)*2:ceil(ih/2)*2",
                           "-c:v", "libvpx-vp9", "-c:a", "copy", "/out/clip_cropped.webm"}));
}
