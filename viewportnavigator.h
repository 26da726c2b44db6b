#ifndef VIEWPORTNAVIGATOR_H
#define VIEWPORTNAVIGATOR_H

#include <QPointF>
#include <QSize>
#include <QSizeF>

#include "coordinatemapper.h"
#include "cropsettings.h"

/**
 * @brief Zoom and scroll state of the crop canvas.
 *
 * The scaled image is centered in a canvas canvasMultiple times its size (or
 * the viewport size, whichever is larger). The viewport shows the part of that
 * canvas starting at scroll(). Everything here is independent of crop editing.
 */
class ViewportNavigator {
public:
    explicit ViewportNavigator(const Cropping::EditorSettings& settings = Cropping::EditorSettings());

    void setSettings(const Cropping::EditorSettings& settings);
    const Cropping::EditorSettings& settings() const { return m_settings; }

    /**
     * @brief Prepares the view for a newly loaded image.
     *
     * Fits the image to the viewport unless the user zoomed manually since the
     * previous load, then centers the scroll position on the image.
     */
    void load(const QSize& imageSize, const QSize& viewportSize);
    void unload();
    bool hasImage() const { return !m_imageSize.isEmpty(); }

    void setViewportSize(const QSize& viewportSize);
    void fitToViewport();

    // Zooms by zoomStepBase^(wheelDelta / wheelNotchDelta) keeping the image point under viewportPos fixed
    bool zoomAt(const QPointF& viewportPos, int wheelDelta);
    bool setScaleFactorAt(double scaleFactor, const QPointF& viewportPos);

    // scroll = anchorScroll - (currentGlobal - anchorGlobal), clamped
    void panFrom(const QPointF& anchorScroll, const QPointF& anchorGlobal, const QPointF& currentGlobal);
    void setScroll(const QPointF& scroll);
    void centerOnImage();

    double scaleFactor() const { return m_scaleFactor; }
    QPointF scroll() const { return m_scroll; }
    QPointF maximumScroll() const;
    QSize imageSize() const { return m_imageSize; }
    QSize viewportSize() const { return m_viewportSize; }
    QSizeF canvasSize() const;
    bool zoomedSinceLoad() const { return m_zoomedSinceLoad; }

    // Maps canvas coordinates (viewport position + scroll)
    CoordinateMapper canvasMapper() const;
    // Maps coordinates relative to the visible viewport
    CoordinateMapper viewportMapper() const;

private:
    double fitScaleFactor() const;
    void clampScroll();

    Cropping::EditorSettings m_settings;
    QSize m_imageSize;
    QSize m_viewportSize;
    double m_scaleFactor;
    QPointF m_scroll;
    bool m_zoomedSinceLoad;
};

#endif // VIEWPORTNAVIGATOR_H
