#include "cropregion.h"

#include <gtest/gtest.h>

using Cropping::AspectConstraint;
using Cropping::DragMode;

namespace {

const int kMin = CropRegion::DefaultMinimumSize;

AspectConstraint lockedAt(double ratio) {
    AspectConstraint aspect;
    aspect.locked = true;
    aspect.ratio = ratio;
    return aspect;
}

// The derived side is within one pixel of what the ratio asks for
bool keepsRatio(const CropRegion& r, double ratio) {
    double widthError = qAbs(r.width() - r.height() * ratio);
    double heightError = qAbs(r.height() - r.width() / ratio);
    return qMin(widthError, heightError) <= 1.0;
}

} // namespace

TEST(CropRegionTest, CreateNormalizesDragDirection) {
    CropRegion r = CropRegion::create(QPoint(50, 40), QPoint(10, 10), QSize(100, 80), AspectConstraint());
    EXPECT_EQ(r, CropRegion(10, 10, 40, 30));
}

TEST(CropRegionTest, CreateClampsPointerToImage) {
    CropRegion r = CropRegion::create(QPoint(90, 70), QPoint(200, -20), QSize(100, 80), AspectConstraint());
    EXPECT_EQ(r, CropRegion(90, 0, 10, 70));
}

TEST(CropRegionTest, CreateUnderLockGrowsIntoDragQuadrant) {
    CropRegion r = CropRegion::create(QPoint(10, 10), QPoint(50, 12), QSize(200, 200), lockedAt(2.0));
    EXPECT_EQ(r, CropRegion(10, 10, 40, 20));

    CropRegion upLeft = CropRegion::create(QPoint(100, 100), QPoint(60, 95), QSize(200, 200), lockedAt(1.0));
    EXPECT_EQ(upLeft, CropRegion(60, 60, 40, 40));

    // Vertical drag dominates once it is scaled by the ratio
    CropRegion tall = CropRegion::create(QPoint(100, 100), QPoint(110, 130), QSize(200, 200), lockedAt(1.0));
    EXPECT_EQ(tall, CropRegion(100, 100, 30, 30));
}

TEST(CropRegionTest, CreateUnderLockFitsImage) {
    CropRegion r = CropRegion::create(QPoint(10, 10), QPoint(300, 10), QSize(100, 100), lockedAt(2.0));
    EXPECT_EQ(r, CropRegion(10, 10, 90, 45));
    EXPECT_TRUE(r.isValidWithin(QSize(100, 100)));
}

TEST(CropRegionTest, MoveSlidesBackInsideBounds) {
    CropRegion out;
    ASSERT_TRUE(CropRegion(10, 10, 20, 20).moveBy(QPoint(100, -50), QSize(100, 100), kMin, out));
    EXPECT_EQ(out, CropRegion(80, 0, 20, 20));
}

TEST(CropRegionTest, MoveRejectsRegionBelowMinimum) {
    CropRegion out(1, 2, 3, 4);
    EXPECT_FALSE(CropRegion(0, 0, 5, 5).moveBy(QPoint(10, 10), QSize(100, 100), kMin, out));
    EXPECT_EQ(out, CropRegion(1, 2, 3, 4));
}

TEST(CropRegionTest, ResizeCornerAndEdges) {
    const CropRegion anchor(10, 10, 50, 50);
    const QSize bounds(100, 100);
    CropRegion out;

    ASSERT_TRUE(anchor.resizeBy(DragMode::ResizeBR, QPoint(20, 10), bounds, AspectConstraint(), kMin, out));
    EXPECT_EQ(out, CropRegion(10, 10, 70, 60));

    ASSERT_TRUE(anchor.resizeBy(DragMode::ResizeTL, QPoint(-5, 15), bounds, AspectConstraint(), kMin, out));
    EXPECT_EQ(out, CropRegion(5, 25, 55, 35));

    ASSERT_TRUE(anchor.resizeBy(DragMode::ResizeT, QPoint(40, -4), bounds, AspectConstraint(), kMin, out));
    EXPECT_EQ(out, CropRegion(10, 6, 50, 54));

    ASSERT_TRUE(anchor.resizeBy(DragMode::ResizeBR, QPoint(1000, 1000), bounds, AspectConstraint(), kMin, out));
    EXPECT_EQ(out, CropRegion(10, 10, 90, 90));
}

TEST(CropRegionTest, ResizeRejectsShrinkBelowMinimumAndInversion) {
    const CropRegion anchor(10, 10, 50, 50);
    const QSize bounds(100, 100);
    CropRegion out(7, 7, 7, 7);

    EXPECT_FALSE(anchor.resizeBy(DragMode::ResizeR, QPoint(-45, 0), bounds, AspectConstraint(), kMin, out));
    EXPECT_FALSE(anchor.resizeBy(DragMode::ResizeL, QPoint(60, 0), bounds, AspectConstraint(), kMin, out));
    EXPECT_FALSE(anchor.resizeBy(DragMode::ResizeTL, QPoint(0, 80), bounds, AspectConstraint(), kMin, out));
    EXPECT_FALSE(anchor.resizeBy(DragMode::Move, QPoint(1, 1), bounds, AspectConstraint(), kMin, out));
    EXPECT_EQ(out, CropRegion(7, 7, 7, 7));
}

TEST(CropRegionTest, EdgeHandlesDisabledUnderLock) {
    const CropRegion anchor(10, 10, 40, 20);
    CropRegion out;
    const DragMode edges[] = {DragMode::ResizeT, DragMode::ResizeB, DragMode::ResizeL, DragMode::ResizeR};
    for (DragMode edge : edges) {
        EXPECT_FALSE(anchor.resizeBy(edge, QPoint(5, 5), QSize(200, 200), lockedAt(2.0), kMin, out))
            << Cropping::dragModeToString(edge).toStdString();
    }
}

TEST(CropRegionTest, LockedCornerResizeKeepsRatio) {
    const CropRegion anchor(0, 0, 160, 90);
    const double ratio = 16.0 / 9.0;
    CropRegion out;

    ASSERT_TRUE(anchor.resizeBy(DragMode::ResizeBR, QPoint(33, 5), QSize(1920, 1080), lockedAt(ratio), kMin, out));
    EXPECT_EQ(out.x(), 0);
    EXPECT_EQ(out.y(), 0);
    EXPECT_EQ(out.width(), 193);
    EXPECT_TRUE(keepsRatio(out, ratio));
}

TEST(CropRegionTest, LockedCornerSweepKeepsRatioAndOppositeCorner) {
    const CropRegion anchor(100, 100, 160, 90);
    const QSize bounds(640, 480);
    const double ratios[] = {16.0 / 9.0, 1.0, 0.5, 4.0 / 3.0};
    const DragMode corners[] = {DragMode::ResizeTL, DragMode::ResizeTR, DragMode::ResizeBL, DragMode::ResizeBR};

    for (double ratio : ratios) {
        for (DragMode corner : corners) {
            for (int dx = -200; dx <= 600; dx += 13) {
                for (int dy = -200; dy <= 450; dy += 11) {
                    CropRegion out;
                    if (!anchor.resizeBy(corner, QPoint(dx, dy), bounds, lockedAt(ratio), kMin, out)) continue;

                    ASSERT_TRUE(out.isValidWithin(bounds, kMin)) << out.x() << "," << out.y() << " " << out.width() << "x" << out.height();
                    EXPECT_TRUE(keepsRatio(out, ratio)) << "ratio " << ratio << " got " << out.width() << "x" << out.height();

                    if (corner == DragMode::ResizeBR) {
                        EXPECT_EQ(out.x(), anchor.x());
                        EXPECT_EQ(out.y(), anchor.y());
                    } else if (corner == DragMode::ResizeTL) {
                        EXPECT_EQ(out.right(), anchor.right());
                        EXPECT_EQ(out.bottom(), anchor.bottom());
                    } else if (corner == DragMode::ResizeTR) {
                        EXPECT_EQ(out.x(), anchor.x());
                        EXPECT_EQ(out.bottom(), anchor.bottom());
                    } else {
                        EXPECT_EQ(out.right(), anchor.right());
                        EXPECT_EQ(out.y(), anchor.y());
                    }
                }
            }
        }
    }
}

TEST(CropRegionTest, UnlockedSweepNeverLeavesBoundsOrMinimum) {
    const CropRegion anchor(30, 20, 60, 40);
    const QSize bounds(160, 120);
    const DragMode handles[] = {DragMode::ResizeTL, DragMode::ResizeTR, DragMode::ResizeBL, DragMode::ResizeBR,
                                DragMode::ResizeT, DragMode::ResizeB, DragMode::ResizeL, DragMode::ResizeR};

    for (DragMode handle : handles) {
        for (int dx = -250; dx <= 250; dx += 9) {
            for (int dy = -250; dy <= 250; dy += 9) {
                CropRegion out(-1, -1, -1, -1);
                if (anchor.resizeBy(handle, QPoint(dx, dy), bounds, AspectConstraint(), kMin, out)) {
                    EXPECT_TRUE(out.isValidWithin(bounds, kMin));
                } else {
                    EXPECT_EQ(out.x(), -1);
                }

                CropRegion moved;
                ASSERT_TRUE(anchor.moveBy(QPoint(dx, dy), bounds, kMin, moved));
                EXPECT_TRUE(moved.isValidWithin(bounds, kMin));
                EXPECT_EQ(moved.width(), anchor.width());
                EXPECT_EQ(moved.height(), anchor.height());
            }
        }
    }
}

TEST(CropRegionTest, HeightDrivesOnlyWhenScaledVerticalDominates) {
    EXPECT_FALSE(CropRegion::heightDrivesAspect(QPointF(10, 10), 1.0));
    EXPECT_TRUE(CropRegion::heightDrivesAspect(QPointF(5, 10), 1.0));
    EXPECT_TRUE(CropRegion::heightDrivesAspect(QPointF(20, 10), 2.5));
    EXPECT_FALSE(CropRegion::heightDrivesAspect(QPointF(-30, 10), 2.5));
}

TEST(CropRegionTest, NumericEditsClampToImage) {
    const CropRegion r(10, 10, 50, 50);
    const QSize bounds(100, 100);

    EXPECT_EQ(r.withX(80, bounds, kMin), CropRegion(80, 10, 20, 50));
    EXPECT_EQ(r.withX(-5, bounds, kMin), CropRegion(0, 10, 50, 50));
    EXPECT_EQ(r.withWidth(500, bounds, kMin), CropRegion(0, 10, 100, 50));
    EXPECT_EQ(r.withWidth(3, bounds, kMin), CropRegion(10, 10, 10, 50));
    EXPECT_EQ(r.withY(95, bounds, kMin), CropRegion(10, 90, 50, 10));
    EXPECT_EQ(r.withHeight(95, bounds, kMin), CropRegion(10, 5, 50, 95));

    // An empty region is seeded with the minimum size before the edit applies
    EXPECT_EQ(CropRegion().withX(5, bounds, kMin), CropRegion(5, 0, 10, 10));
}

TEST(CropRegionTest, ClampedToSmallerImage) {
    EXPECT_EQ(CropRegion(50, 50, 100, 100).clampedTo(QSize(120, 80)), CropRegion(50, 50, 70, 30));
    EXPECT_TRUE(CropRegion(200, 200, 10, 10).clampedTo(QSize(100, 100)).isEmpty());
}
