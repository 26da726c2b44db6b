#include "viewportnavigator.h"
#include "debugutils.h"

#include <QtMath>

ViewportNavigator::ViewportNavigator(const Cropping::EditorSettings& settings)
    : m_settings(settings),
    m_scaleFactor(1.0),
    m_scroll(0.0, 0.0),
    m_zoomedSinceLoad(false) {
}

void ViewportNavigator::setSettings(const Cropping::EditorSettings& settings) {
    m_settings = settings;
    m_scaleFactor = qBound(m_settings.minZoom, m_scaleFactor, m_settings.maxZoom);
    clampScroll();
}

void ViewportNavigator::load(const QSize& imageSize, const QSize& viewportSize) {
    m_imageSize = imageSize;
    m_viewportSize = viewportSize;
    if (m_imageSize.isEmpty()) {
        qWarning() << "ViewportNavigator::load: empty image size" << imageSize;
        m_scroll = QPointF(0.0, 0.0);
        return;
    }

    if (!m_zoomedSinceLoad) {
        m_scaleFactor = fitScaleFactor();
    } else {
        qDebug() << "ViewportNavigator::load: keeping manual zoom" << m_scaleFactor;
    }
    m_zoomedSinceLoad = false;
    centerOnImage();
    GEOMETRY_DEBUG() << "load" << imageSize << "viewport" << viewportSize << "scale" << m_scaleFactor;
}

void ViewportNavigator::unload() {
    m_imageSize = QSize();
    m_scroll = QPointF(0.0, 0.0);
}

void ViewportNavigator::setViewportSize(const QSize& viewportSize) {
    if (viewportSize == m_viewportSize) return;
    m_viewportSize = viewportSize;
    clampScroll();
}

void ViewportNavigator::fitToViewport() {
    if (!hasImage()) return;
    m_scaleFactor = fitScaleFactor();
    centerOnImage();
}

double ViewportNavigator::fitScaleFactor() const {
    if (m_imageSize.isEmpty() || m_viewportSize.isEmpty()) return 1.0;
    double scaleW = static_cast<double>(m_viewportSize.width()) / m_imageSize.width();
    double scaleH = static_cast<double>(m_viewportSize.height()) / m_imageSize.height();
    double fit = qMin(qMin(scaleW, scaleH), 1.0) * m_settings.fitMargin;
    return qBound(m_settings.minZoom, fit, m_settings.maxZoom);
}

bool ViewportNavigator::zoomAt(const QPointF& viewportPos, int wheelDelta) {
    if (!hasImage() || wheelDelta == 0) return false;
    double step = qPow(m_settings.zoomStepBase, static_cast<double>(wheelDelta) / m_settings.wheelNotchDelta);
    bool changed = setScaleFactorAt(m_scaleFactor * step, viewportPos);
    if (changed) m_zoomedSinceLoad = true;
    return changed;
}

bool ViewportNavigator::setScaleFactorAt(double scaleFactor, const QPointF& viewportPos) {
    if (!hasImage()) return false;
    double newScale = qBound(m_settings.minZoom, scaleFactor, m_settings.maxZoom);
    if (qFuzzyCompare(newScale, m_scaleFactor)) return false;

    QPointF imagePoint = canvasMapper().toImageSpace(viewportPos + m_scroll);
    m_scaleFactor = newScale;

    // Solve for the scroll that puts the same image point back under the cursor
    QPointF canvasPointAfter = canvasMapper().toViewportSpace(imagePoint);
    m_scroll = canvasPointAfter - viewportPos;
    clampScroll();

    GEOMETRY_DEBUG() << "zoom to" << m_scaleFactor << "anchored at image" << imagePoint << "scroll" << m_scroll;
    return true;
}

void ViewportNavigator::panFrom(const QPointF& anchorScroll, const QPointF& anchorGlobal, const QPointF& currentGlobal) {
    m_scroll = anchorScroll - (currentGlobal - anchorGlobal);
    clampScroll();
}

void ViewportNavigator::setScroll(const QPointF& scroll) {
    m_scroll = scroll;
    clampScroll();
}

void ViewportNavigator::centerOnImage() {
    QSizeF canvas = canvasSize();
    m_scroll = QPointF((canvas.width() - m_viewportSize.width()) / 2.0,
                       (canvas.height() - m_viewportSize.height()) / 2.0);
    clampScroll();
}

QSizeF ViewportNavigator::canvasSize() const {
    QSizeF scaled(m_imageSize.width() * m_scaleFactor, m_imageSize.height() * m_scaleFactor);
    return QSizeF(qMax(scaled.width() * m_settings.canvasMultiple, static_cast<double>(m_viewportSize.width())),
                  qMax(scaled.height() * m_settings.canvasMultiple, static_cast<double>(m_viewportSize.height())));
}

QPointF ViewportNavigator::maximumScroll() const {
    QSizeF canvas = canvasSize();
    return QPointF(qMax(0.0, canvas.width() - m_viewportSize.width()),
                   qMax(0.0, canvas.height() - m_viewportSize.height()));
}

void ViewportNavigator::clampScroll() {
    QPointF maxScroll = maximumScroll();
    m_scroll.setX(qBound(0.0, m_scroll.x(), maxScroll.x()));
    m_scroll.setY(qBound(0.0, m_scroll.y(), maxScroll.y()));
}

CoordinateMapper ViewportNavigator::canvasMapper() const {
    return CoordinateMapper::centeredInCanvas(m_scaleFactor, m_imageSize, canvasSize());
}

CoordinateMapper ViewportNavigator::viewportMapper() const {
    CoordinateMapper canvas = canvasMapper();
    return CoordinateMapper(canvas.scaleFactor(), canvas.imageOffset() - m_scroll);
}
