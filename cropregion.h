#ifndef CROPREGION_H
#define CROPREGION_H

#include <QRect>
#include <QPoint>
#include <QSize>
#include <QDebug>
#include <QMetaType>

#include "cropcommon.h"

/**
 * @brief Crop rectangle in source-pixel space.
 *
 * Valid regions satisfy x >= 0, y >= 0, width >= 1, height >= 1 and lie
 * entirely inside the image. Every editing operation is computed from an
 * immutable anchor region (the region at mouse-down) and either produces a
 * new valid region or rejects the edit, leaving the caller's region as it
 * was. Nothing is ever partially clamped into a degenerate shape.
 */
class CropRegion {
public:
    static constexpr int DefaultMinimumSize = 10;

    CropRegion();
    CropRegion(int x, int y, int width, int height);
    static CropRegion fromRect(const QRect& rect);

    int x() const { return m_x; }
    int y() const { return m_y; }
    int width() const { return m_width; }
    int height() const { return m_height; }
    int right() const { return m_x + m_width; }    // exclusive
    int bottom() const { return m_y + m_height; }  // exclusive

    bool isEmpty() const { return m_width < 1 || m_height < 1; }
    QRect toRect() const;

    // True when the region lies inside bounds and is at least minimumSize on both axes
    bool isValidWithin(const QSize& bounds, int minimumSize = 1) const;

    bool operator==(const CropRegion& other) const;
    bool operator!=(const CropRegion& other) const { return !(*this == other); }

    /**
     * @brief Builds the region spanned by a new selection drag.
     * @param anchor Image-space mouse-down point
     * @param pointer Image-space current pointer
     * @param bounds Image size
     * @param aspect Optional ratio lock; under a lock the region grows from the
     *               anchor into the quadrant the drag points to
     * @return The (possibly empty) region, always inside bounds
     */
    static CropRegion create(const QPoint& anchor, const QPoint& pointer,
                             const QSize& bounds, const Cropping::AspectConstraint& aspect);

    /**
     * @brief Translates this region by delta, sliding it back inside bounds.
     * @return false (out untouched) if this region is below the minimum size or cannot fit
     */
    bool moveBy(const QPoint& delta, const QSize& bounds, int minimumSize, CropRegion& out) const;

    /**
     * @brief Drags one edge or corner by delta.
     *
     * Under an active aspect constraint only corners are accepted, and the
     * dimension not driving the drag is derived from the other through the ratio.
     * @return false (out untouched) if the result would be smaller than
     *         minimumSize, inverted, or the handle is disabled
     */
    bool resizeBy(Cropping::DragMode handle, const QPoint& delta, const QSize& bounds,
                  const Cropping::AspectConstraint& aspect, int minimumSize, CropRegion& out) const;

    // Numeric field edits. Each clamps its own value to the allowed range and
    // re-clamps the other axis member so the region stays inside bounds.
    CropRegion withX(int value, const QSize& bounds, int minimumSize) const;
    CropRegion withY(int value, const QSize& bounds, int minimumSize) const;
    CropRegion withWidth(int value, const QSize& bounds, int minimumSize) const;
    CropRegion withHeight(int value, const QSize& bounds, int minimumSize) const;

    // Pulls a region from another image into bounds, or returns an empty region if it cannot fit
    CropRegion clampedTo(const QSize& bounds) const;

    // Decides whether a drag with this displacement should let height drive width under a ratio lock
    static bool heightDrivesAspect(const QPointF& displacement, double ratio);

private:
    CropRegion seededForEdit(const QSize& bounds, int minimumSize) const;

    int m_x;
    int m_y;
    int m_width;
    int m_height;
};

QDebug operator<<(QDebug debug, const CropRegion& region);

Q_DECLARE_METATYPE(CropRegion)

#endif // CROPREGION_H
