#ifndef COORDINATEMAPPER_H
#define COORDINATEMAPPER_H

#include <QPoint>
#include <QPointF>
#include <QRect>
#include <QRectF>
#include <QSize>
#include <QSizeF>

/**
 * @brief Maps between viewport (canvas) pixels and source-image pixels.
 *
 * The canvas is the scrollable surface the scaled image is drawn on. The
 * scaled image sits at imageOffset() inside it, so
 *     image = (viewport - offset) / scale
 *     viewport = image * scale + offset
 * The floating point transforms are exact inverses; the integer variants
 * round half away from zero so both directions agree within one pixel.
 */
class CoordinateMapper {
public:
    CoordinateMapper();
    CoordinateMapper(double scaleFactor, const QPointF& imageOffset);

    // Mapper for an image of imageSize drawn at scaleFactor, centered in a canvas of canvasSize
    static CoordinateMapper centeredInCanvas(double scaleFactor, const QSize& imageSize, const QSizeF& canvasSize);

    double scaleFactor() const { return m_scaleFactor; }
    QPointF imageOffset() const { return m_imageOffset; }
    bool isValid() const { return m_scaleFactor > 0.0; }

    QPointF toImageSpace(const QPointF& viewportPoint) const;
    QPointF toViewportSpace(const QPointF& imagePoint) const;

    QPoint toImagePixel(const QPoint& viewportPoint) const;
    QPoint toViewportPixel(const QPoint& imagePoint) const;

    // Corner-wise mapping of an image-space rectangle; right/bottom are treated as exclusive edges.
    QRect toViewportRect(const QRect& imageRect) const;

    // Converts a pointer displacement in viewport pixels to image pixels.
    QPoint toImageDelta(const QPointF& viewportDelta) const;

    QSizeF scaledSize(const QSize& imageSize) const;

    static int roundHalfAwayFromZero(double value);

private:
    double m_scaleFactor;
    QPointF m_imageOffset;
};

#endif // COORDINATEMAPPER_H
