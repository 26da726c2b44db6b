#include "processsupervisor.h"
#include "testhelpers.h"

#include <QAtomicInt>
#include <QDir>
#include <QElapsedTimer>
#include <QFileInfo>
#include <QList>
#include <QTemporaryDir>
#include <QTimer>

#include <gtest/gtest.h>

using Outcome = ProcessSupervisor::Outcome;

TEST(ProcessSupervisorTest, ParsesLastElapsedMarker) {
    double seconds = 0.0;
    ASSERT_TRUE(ProcessSupervisor::parseElapsedSeconds("frame=  10 fps=0.0 q=28.0 size=0kB time=00:00:30.00 bitrate=N/A", seconds));
    EXPECT_DOUBLE_EQ(seconds, 30.0);

    ASSERT_TRUE(ProcessSupervisor::parseElapsedSeconds("time=00:00:01.00 time=01:01:00.50", seconds));
    EXPECT_DOUBLE_EQ(seconds, 3660.5);

    EXPECT_FALSE(ProcessSupervisor::parseElapsedSeconds("Input #0, mov,mp4, from 'a.mp4':", seconds));
    EXPECT_FALSE(ProcessSupervisor::parseElapsedSeconds("time=N/A", seconds));
}

TEST(ProcessSupervisorTest, ProgressIsClampedPercentOfDuration) {
    EXPECT_EQ(ProcessSupervisor::progressPercent(30.0, 60.0), 50);
    EXPECT_EQ(ProcessSupervisor::progressPercent(59.9, 60.0), 99);
    EXPECT_EQ(ProcessSupervisor::progressPercent(70.0, 60.0), 100);
    EXPECT_EQ(ProcessSupervisor::progressPercent(-1.0, 60.0), 0);
    EXPECT_EQ(ProcessSupervisor::progressPercent(5.0, 0.0), -1);
    EXPECT_EQ(ProcessSupervisor::progressPercent(5.0, -1.0), -1);
}

class ProcessSupervisorRunTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(dir.isValid());
        output = path("out.mp4");
    }

    QString path(const QString& name) const { return QDir(dir.path()).filePath(name); }

    // Runs script through /bin/sh with the output path as $1
    Outcome runScript(ProcessSupervisor& supervisor, const QString& body, double duration) {
        const QString script = path("tool.sh");
        EXPECT_TRUE(TestHelpers::writeScript(script, body));
        return supervisor.run("/bin/sh", {script, output}, output, duration);
    }

    QTemporaryDir dir;
    QString output;
    Cropping::PipelineSettings settings;
};

TEST_F(ProcessSupervisorRunTest, SuccessReportsProgress) {
    ProcessSupervisor supervisor(settings);
    QList<int> percents;
    QObject::connect(&supervisor, &ProcessSupervisor::progressUpdated,
                     [&percents](int percent, double) { percents.append(percent); });

    Outcome outcome = runScript(supervisor,
                                "echo data > \"$1\"\n"
                                "printf 'frame=1 time=00:00:30.00 bitrate=1\\r' >&2\n"
                                "printf 'frame=2 time=00:00:45.00 bitrate=1\\r' >&2\n"
                                "printf 'frame=3 time=00:01:00.00 bitrate=1\\n' >&2\n"
                                "exit 0\n",
                                60.0);

    EXPECT_EQ(outcome.status, Outcome::Status::Success);
    EXPECT_EQ(outcome.exitCode, 0);
    EXPECT_EQ(supervisor.state(), ProcessSupervisor::State::Completed);
    EXPECT_TRUE(QFileInfo::exists(output));
    EXPECT_EQ(percents, (QList<int>{50, 75, 100}));
}

TEST_F(ProcessSupervisorRunTest, UnknownDurationIsIndeterminate) {
    ProcessSupervisor supervisor(settings);
    QList<int> percents;
    QObject::connect(&supervisor, &ProcessSupervisor::progressUpdated,
                     [&percents](int percent, double) { percents.append(percent); });

    Outcome outcome = runScript(supervisor,
                                "echo data > \"$1\"\n"
                                "echo 'time=00:00:02.00' >&2\n",
                                -1.0);

    EXPECT_EQ(outcome.status, Outcome::Status::Success);
    EXPECT_EQ(percents, (QList<int>{-1}));
}

TEST_F(ProcessSupervisorRunTest, NonZeroExitRemovesPartialOutput) {
    ProcessSupervisor supervisor(settings);
    Outcome outcome = runScript(supervisor,
                                "echo partial > \"$1\"\n"
                                "echo 'Invalid crop geometry' >&2\n"
                                "exit 3\n",
                                10.0);

    EXPECT_EQ(outcome.status, Outcome::Status::Failed);
    EXPECT_EQ(outcome.error, Cropping::CropError::ProcessNonZeroExit);
    EXPECT_EQ(outcome.exitCode, 3);
    EXPECT_TRUE(outcome.reason.contains("Invalid crop geometry"));
    EXPECT_EQ(supervisor.state(), ProcessSupervisor::State::Failed);
    EXPECT_FALSE(QFileInfo::exists(output));
}

TEST_F(ProcessSupervisorRunTest, LaunchFailure) {
    ProcessSupervisor supervisor(settings);
    Outcome outcome = supervisor.run(path("does-not-exist"), {}, output, 10.0);

    EXPECT_EQ(outcome.status, Outcome::Status::Failed);
    EXPECT_EQ(outcome.error, Cropping::CropError::ProcessLaunchFailure);
    EXPECT_EQ(supervisor.state(), ProcessSupervisor::State::Failed);
}

TEST_F(ProcessSupervisorRunTest, CancelTerminatesAndRemovesOutput) {
    ProcessSupervisor supervisor(settings);
    QList<ProcessSupervisor::State> states;
    QObject::connect(&supervisor, &ProcessSupervisor::stateChanged,
                     [&states](ProcessSupervisor::State s) { states.append(s); });

    // Fires inside the supervisor's local event loop
    QTimer::singleShot(300, [&supervisor]() { supervisor.requestCancel(); });

    QElapsedTimer timer;
    timer.start();
    Outcome outcome = runScript(supervisor,
                                "echo partial > \"$1\"\n"
                                "while true; do\n"
                                "  echo 'time=00:00:01.00' >&2\n"
                                "  sleep 0.05\n"
                                "done\n",
                                100.0);

    EXPECT_EQ(outcome.status, Outcome::Status::Cancelled);
    EXPECT_EQ(outcome.error, Cropping::CropError::Cancelled);
    EXPECT_FALSE(QFileInfo::exists(output));
    EXPECT_LT(timer.elapsed(), 300 + settings.cancelPollIntervalMs + settings.terminateTimeoutMs + 2000);
    EXPECT_EQ(states, (QList<ProcessSupervisor::State>{ProcessSupervisor::State::Running,
                                                       ProcessSupervisor::State::Cancelling,
                                                       ProcessSupervisor::State::Cancelled}));
}

TEST_F(ProcessSupervisorRunTest, CancelledBeforeStartNeverLaunches) {
    QAtomicInt batchCancelled(1);
    ProcessSupervisor supervisor(settings);
    supervisor.setCancellationFlag(&batchCancelled);

    const QString marker = path("started");
    Outcome outcome = runScript(supervisor, QString("touch \"%1\"\n").arg(marker), 10.0);

    EXPECT_EQ(outcome.status, Outcome::Status::Cancelled);
    EXPECT_FALSE(QFileInfo::exists(marker));
}

TEST_F(ProcessSupervisorRunTest, SupervisorIsSingleUse) {
    ProcessSupervisor supervisor(settings);
    ASSERT_EQ(runScript(supervisor, "exit 0\n", 1.0).status, Outcome::Status::Success);

    Outcome second = runScript(supervisor, "exit 0\n", 1.0);
    EXPECT_EQ(second.status, Outcome::Status::Failed);
    EXPECT_EQ(supervisor.state(), ProcessSupervisor::State::Completed);
}
