#include "coordinatemapper.h"

#include <cmath>

CoordinateMapper::CoordinateMapper()
    : m_scaleFactor(1.0),
    m_imageOffset(0.0, 0.0) {
}

CoordinateMapper::CoordinateMapper(double scaleFactor, const QPointF& imageOffset)
    : m_scaleFactor(scaleFactor),
    m_imageOffset(imageOffset) {
}

CoordinateMapper CoordinateMapper::centeredInCanvas(double scaleFactor, const QSize& imageSize, const QSizeF& canvasSize) {
    QSizeF scaled(imageSize.width() * scaleFactor, imageSize.height() * scaleFactor);
    QPointF offset((canvasSize.width() - scaled.width()) / 2.0,
                   (canvasSize.height() - scaled.height()) / 2.0);
    return CoordinateMapper(scaleFactor, offset);
}

int CoordinateMapper::roundHalfAwayFromZero(double value) {
    // std::round rounds halfway cases away from zero regardless of the current rounding mode
    return static_cast<int>(std::round(value));
}

QPointF CoordinateMapper::toImageSpace(const QPointF& viewportPoint) const {
    if (!isValid()) return QPointF();
    return (viewportPoint - m_imageOffset) / m_scaleFactor;
}

QPointF CoordinateMapper::toViewportSpace(const QPointF& imagePoint) const {
    return imagePoint * m_scaleFactor + m_imageOffset;
}

QPoint CoordinateMapper::toImagePixel(const QPoint& viewportPoint) const {
    QPointF p = toImageSpace(QPointF(viewportPoint));
    return QPoint(roundHalfAwayFromZero(p.x()), roundHalfAwayFromZero(p.y()));
}

QPoint CoordinateMapper::toViewportPixel(const QPoint& imagePoint) const {
    QPointF p = toViewportSpace(QPointF(imagePoint));
    return QPoint(roundHalfAwayFromZero(p.x()), roundHalfAwayFromZero(p.y()));
}

QRect CoordinateMapper::toViewportRect(const QRect& imageRect) const {
    if (imageRect.isEmpty()) return QRect();
    QPoint topLeft = toViewportPixel(QPoint(imageRect.x(), imageRect.y()));
    QPoint bottomRight = toViewportPixel(QPoint(imageRect.x() + imageRect.width(),
                                                imageRect.y() + imageRect.height()));
    return QRect(topLeft.x(), topLeft.y(),
                 bottomRight.x() - topLeft.x(), bottomRight.y() - topLeft.y());
}

QPoint CoordinateMapper::toImageDelta(const QPointF& viewportDelta) const {
    if (!isValid()) return QPoint();
    return QPoint(roundHalfAwayFromZero(viewportDelta.x() / m_scaleFactor),
                  roundHalfAwayFromZero(viewportDelta.y() / m_scaleFactor));
}

QSizeF CoordinateMapper::scaledSize(const QSize& imageSize) const {
    return QSizeF(imageSize.width() * m_scaleFactor, imageSize.height() * m_scaleFactor);
}
