#include "coordinatemapper.h"

#include <gtest/gtest.h>

TEST(CoordinateMapperTest, MapsBothDirections) {
    CoordinateMapper mapper(2.0, QPointF(10.0, 20.0));

    EXPECT_EQ(mapper.toViewportSpace(QPointF(5.0, 5.0)), QPointF(20.0, 30.0));
    EXPECT_EQ(mapper.toImageSpace(QPointF(20.0, 30.0)), QPointF(5.0, 5.0));
    EXPECT_EQ(mapper.toImageDelta(QPointF(7.0, -7.0)), QPoint(4, -4));
}

TEST(CoordinateMapperTest, RoundsHalfAwayFromZero) {
    EXPECT_EQ(CoordinateMapper::roundHalfAwayFromZero(2.5), 3);
    EXPECT_EQ(CoordinateMapper::roundHalfAwayFromZero(-2.5), -3);
    EXPECT_EQ(CoordinateMapper::roundHalfAwayFromZero(0.49), 0);
    EXPECT_EQ(CoordinateMapper::roundHalfAwayFromZero(-0.49), 0);
}

TEST(CoordinateMapperTest, CentersScaledImageInCanvas) {
    CoordinateMapper mapper = CoordinateMapper::centeredInCanvas(0.5, QSize(200, 100), QSizeF(300.0, 150.0));

    EXPECT_DOUBLE_EQ(mapper.imageOffset().x(), 100.0);
    EXPECT_DOUBLE_EQ(mapper.imageOffset().y(), 50.0);
    EXPECT_EQ(mapper.scaledSize(QSize(200, 100)), QSizeF(100.0, 50.0));
}

TEST(CoordinateMapperTest, RoundTripStaysWithinOnePixel) {
    const double scales[] = {0.1, 0.37, 1.0, 2.5, 7.3, 10.0};
    for (double scale : scales) {
        CoordinateMapper mapper(scale, QPointF(13.25, -41.5));
        for (int x = -50; x <= 2000; x += 37) {
            for (int y = -50; y <= 1500; y += 53) {
                QPointF exact = mapper.toViewportSpace(mapper.toImageSpace(QPointF(x, y)));
                EXPECT_NEAR(exact.x(), x, 1e-9);
                EXPECT_NEAR(exact.y(), y, 1e-9);

                QPoint rounded(CoordinateMapper::roundHalfAwayFromZero(exact.x()),
                               CoordinateMapper::roundHalfAwayFromZero(exact.y()));
                EXPECT_LE(qAbs(rounded.x() - x), 1) << "scale " << scale;
                EXPECT_LE(qAbs(rounded.y() - y), 1) << "scale " << scale;

                // Zoomed in, a viewport pixel is finer than an image pixel so image pixels survive the trip
                if (scale >= 1.0) {
                    QPoint imageBack = mapper.toImagePixel(mapper.toViewportPixel(QPoint(x, y)));
                    EXPECT_LE(qAbs(imageBack.x() - x), 1) << "scale " << scale;
                    EXPECT_LE(qAbs(imageBack.y() - y), 1) << "scale " << scale;
                }
            }
        }
    }
}

TEST(CoordinateMapperTest, ViewportRectCoversScaledRegion) {
    CoordinateMapper mapper(0.5, QPointF(100.0, 50.0));
    QRect r = mapper.toViewportRect(QRect(10, 20, 100, 60));

    EXPECT_EQ(r, QRect(105, 60, 50, 30));
    EXPECT_TRUE(mapper.toViewportRect(QRect()).isNull());
}
