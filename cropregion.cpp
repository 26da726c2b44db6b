#include "cropregion.h"
#include "coordinatemapper.h"

#include <QtGlobal>
#include <cstdlib>

namespace {

// Shrinks (w, h) until it fits in (maxW, maxH) while keeping w/h close to ratio.
void fitAspectWithin(int& w, int& h, int maxW, int maxH, double ratio) {
    if (w > maxW) {
        w = maxW;
        h = CoordinateMapper::roundHalfAwayFromZero(w / ratio);
    }
    if (h > maxH) {
        h = maxH;
        w = CoordinateMapper::roundHalfAwayFromZero(h * ratio);
    }
    // Rounding the derived side can overshoot by a pixel
    if (w > maxW) w = maxW;
}

} // namespace

CropRegion::CropRegion()
    : m_x(0), m_y(0), m_width(0), m_height(0) {
}

CropRegion::CropRegion(int x, int y, int width, int height)
    : m_x(x), m_y(y), m_width(width), m_height(height) {
}

CropRegion CropRegion::fromRect(const QRect& rect) {
    if (rect.isEmpty()) return CropRegion();
    return CropRegion(rect.x(), rect.y(), rect.width(), rect.height());
}

QRect CropRegion::toRect() const {
    if (isEmpty()) return QRect();
    return QRect(m_x, m_y, m_width, m_height);
}

bool CropRegion::isValidWithin(const QSize& bounds, int minimumSize) const {
    if (isEmpty()) return false;
    int minW = qMin(minimumSize, bounds.width());
    int minH = qMin(minimumSize, bounds.height());
    return m_x >= 0 && m_y >= 0 &&
           m_width >= qMax(1, minW) && m_height >= qMax(1, minH) &&
           right() <= bounds.width() && bottom() <= bounds.height();
}

bool CropRegion::operator==(const CropRegion& other) const {
    if (isEmpty() && other.isEmpty()) return true;
    return m_x == other.m_x && m_y == other.m_y &&
           m_width == other.m_width && m_height == other.m_height;
}

bool CropRegion::heightDrivesAspect(const QPointF& displacement, double ratio) {
    // Vertical displacement is converted to width units before comparing. Ties go to width.
    return qAbs(displacement.y()) * ratio > qAbs(displacement.x());
}

CropRegion CropRegion::create(const QPoint& anchor, const QPoint& pointer,
                              const QSize& bounds, const Cropping::AspectConstraint& aspect) {
    if (bounds.isEmpty()) return CropRegion();

    const int W = bounds.width();
    const int H = bounds.height();
    QPoint a(qBound(0, anchor.x(), W), qBound(0, anchor.y(), H));

    if (!aspect.isActive()) {
        QPoint p(qBound(0, pointer.x(), W), qBound(0, pointer.y(), H));
        int left = qMin(a.x(), p.x());
        int top = qMin(a.y(), p.y());
        return CropRegion(left, top, qAbs(p.x() - a.x()), qAbs(p.y() - a.y()));
    }

    const int dx = pointer.x() - a.x();
    const int dy = pointer.y() - a.y();
    int w = 0;
    int h = 0;
    if (heightDrivesAspect(QPointF(dx, dy), aspect.ratio)) {
        h = std::abs(dy);
        w = CoordinateMapper::roundHalfAwayFromZero(h * aspect.ratio);
    } else {
        w = std::abs(dx);
        h = CoordinateMapper::roundHalfAwayFromZero(w / aspect.ratio);
    }

    const int maxW = dx >= 0 ? W - a.x() : a.x();
    const int maxH = dy >= 0 ? H - a.y() : a.y();
    fitAspectWithin(w, h, maxW, maxH, aspect.ratio);
    if (w <= 0 || h <= 0) return CropRegion();

    int x = dx >= 0 ? a.x() : a.x() - w;
    int y = dy >= 0 ? a.y() : a.y() - h;
    return CropRegion(x, y, w, h);
}

bool CropRegion::moveBy(const QPoint& delta, const QSize& bounds, int minimumSize, CropRegion& out) const {
    if (!isValidWithin(bounds, minimumSize)) return false;

    int newX = qBound(0, m_x + delta.x(), bounds.width() - m_width);
    int newY = qBound(0, m_y + delta.y(), bounds.height() - m_height);
    out = CropRegion(newX, newY, m_width, m_height);
    return true;
}

bool CropRegion::resizeBy(Cropping::DragMode handle, const QPoint& delta, const QSize& bounds,
                          const Cropping::AspectConstraint& aspect, int minimumSize, CropRegion& out) const {
    using Cropping::DragMode;

    if (isEmpty() || bounds.isEmpty() || handle == DragMode::Move) return false;

    const int W = bounds.width();
    const int H = bounds.height();
    const int minW = qMin(minimumSize, W);
    const int minH = qMin(minimumSize, H);

    if (aspect.isActive()) {
        // Single-edge handles would break the ratio, so only corners resize under a lock
        if (!Cropping::isCornerMode(handle)) return false;

        const bool movesRight = handle == DragMode::ResizeTR || handle == DragMode::ResizeBR;
        const bool movesDown = handle == DragMode::ResizeBL || handle == DragMode::ResizeBR;
        const int fixedX = movesRight ? m_x : right();
        const int fixedY = movesDown ? m_y : bottom();
        const int draggedX = (movesRight ? right() : m_x) + delta.x();
        const int draggedY = (movesDown ? bottom() : m_y) + delta.y();
        const int rawW = movesRight ? draggedX - fixedX : fixedX - draggedX;
        const int rawH = movesDown ? draggedY - fixedY : fixedY - draggedY;

        int w = 0;
        int h = 0;
        if (heightDrivesAspect(QPointF(delta), aspect.ratio)) {
            h = rawH;
            w = CoordinateMapper::roundHalfAwayFromZero(h * aspect.ratio);
        } else {
            w = rawW;
            h = CoordinateMapper::roundHalfAwayFromZero(w / aspect.ratio);
        }
        if (w <= 0 || h <= 0) return false; // inverted

        const int maxW = movesRight ? W - fixedX : fixedX;
        const int maxH = movesDown ? H - fixedY : fixedY;
        fitAspectWithin(w, h, maxW, maxH, aspect.ratio);
        if (w < minW || h < minH) return false;

        out = CropRegion(movesRight ? fixedX : fixedX - w,
                         movesDown ? fixedY : fixedY - h,
                         w, h);
        return true;
    }

    int left = m_x;
    int top = m_y;
    int r = right();
    int b = bottom();

    switch (handle) {
    case DragMode::ResizeTL: left += delta.x(); top += delta.y(); break;
    case DragMode::ResizeTR: r += delta.x(); top += delta.y(); break;
    case DragMode::ResizeBL: left += delta.x(); b += delta.y(); break;
    case DragMode::ResizeBR: r += delta.x(); b += delta.y(); break;
    case DragMode::ResizeT: top += delta.y(); break;
    case DragMode::ResizeB: b += delta.y(); break;
    case DragMode::ResizeL: left += delta.x(); break;
    case DragMode::ResizeR: r += delta.x(); break;
    default: return false;
    }

    left = qMax(0, left);
    top = qMax(0, top);
    r = qMin(W, r);
    b = qMin(H, b);

    // Covers inversion too: an inverted edge pair has a negative span
    if (r - left < minW || b - top < minH) return false;

    out = CropRegion(left, top, r - left, b - top);
    return true;
}

CropRegion CropRegion::seededForEdit(const QSize& bounds, int minimumSize) const {
    const int minW = qMin(minimumSize, bounds.width());
    const int minH = qMin(minimumSize, bounds.height());

    CropRegion r = clampedTo(bounds);
    if (r.isEmpty()) return CropRegion(0, 0, minW, minH);

    if (r.m_width < minW) {
        r.m_width = minW;
        r.m_x = qMin(r.m_x, bounds.width() - minW);
    }
    if (r.m_height < minH) {
        r.m_height = minH;
        r.m_y = qMin(r.m_y, bounds.height() - minH);
    }
    return r;
}

CropRegion CropRegion::withX(int value, const QSize& bounds, int minimumSize) const {
    if (bounds.isEmpty()) return *this;
    const int minW = qMin(minimumSize, bounds.width());
    CropRegion r = seededForEdit(bounds, minimumSize);
    r.m_x = qBound(0, value, bounds.width() - minW);
    r.m_width = qBound(minW, r.m_width, bounds.width() - r.m_x);
    return r;
}

CropRegion CropRegion::withY(int value, const QSize& bounds, int minimumSize) const {
    if (bounds.isEmpty()) return *this;
    const int minH = qMin(minimumSize, bounds.height());
    CropRegion r = seededForEdit(bounds, minimumSize);
    r.m_y = qBound(0, value, bounds.height() - minH);
    r.m_height = qBound(minH, r.m_height, bounds.height() - r.m_y);
    return r;
}

CropRegion CropRegion::withWidth(int value, const QSize& bounds, int minimumSize) const {
    if (bounds.isEmpty()) return *this;
    const int minW = qMin(minimumSize, bounds.width());
    CropRegion r = seededForEdit(bounds, minimumSize);
    r.m_width = qBound(minW, value, bounds.width());
    if (r.m_x + r.m_width > bounds.width()) {
        r.m_x = bounds.width() - r.m_width;
    }
    return r;
}

CropRegion CropRegion::withHeight(int value, const QSize& bounds, int minimumSize) const {
    if (bounds.isEmpty()) return *this;
    const int minH = qMin(minimumSize, bounds.height());
    CropRegion r = seededForEdit(bounds, minimumSize);
    r.m_height = qBound(minH, value, bounds.height());
    if (r.m_y + r.m_height > bounds.height()) {
        r.m_y = bounds.height() - r.m_height;
    }
    return r;
}

CropRegion CropRegion::clampedTo(const QSize& bounds) const {
    if (isEmpty() || bounds.isEmpty()) return CropRegion();
    int left = qMax(0, m_x);
    int top = qMax(0, m_y);
    int r = qMin(bounds.width(), right());
    int b = qMin(bounds.height(), bottom());
    if (r <= left || b <= top) return CropRegion();
    return CropRegion(left, top, r - left, b - top);
}

QDebug operator<<(QDebug debug, const CropRegion& region) {
    QDebugStateSaver saver(debug);
    debug.nospace() << "CropRegion(" << region.x() << "," << region.y() << " "
                    << region.width() << "x" << region.height() << ")";
    return debug;
}
