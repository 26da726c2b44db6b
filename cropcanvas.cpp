#include "cropcanvas.h"
#include "interactioncontroller.h"

#include <QDebug>
#include <QMouseEvent>
#include <QPainter>
#include <QPainterPath>
#include <QResizeEvent>
#include <QWheelEvent>

CropCanvas::CropCanvas(QWidget* parent)
    : QWidget(parent),
    m_controller(new InteractionController(&m_navigator, this)) {
    setMouseTracking(true);
    setFocusPolicy(Qt::StrongFocus);
    setContextMenuPolicy(Qt::PreventContextMenu);
    setMinimumSize(200, 150);

    connect(m_controller, &InteractionController::regionChanging, this, [this]() { update(); });
    connect(m_controller, &InteractionController::regionChanged, this, [this]() { update(); });
    connect(m_controller, &InteractionController::viewChanged, this, [this]() {
        update();
        emit zoomFactorChanged(m_navigator.scaleFactor());
    });
    connect(m_controller, &InteractionController::cursorShapeChanged, this, [this](Qt::CursorShape shape) {
        setCursor(shape);
    });
}

void CropCanvas::setSettings(const Cropping::EditorSettings& settings) {
    m_settings = settings;
    m_navigator.setSettings(settings);
    m_controller->setSettings(settings);
    update();
}

void CropCanvas::setImage(const QImage& image) {
    m_image = image;
    if (m_image.isNull()) {
        m_navigator.unload();
        m_controller->setImageSize(QSize());
    } else {
        m_navigator.load(m_image.size(), size());
        m_controller->setImageSize(m_image.size());
        qDebug() << "CropCanvas::setImage:" << m_image.size() << "at zoom" << m_navigator.scaleFactor();
    }
    emit zoomFactorChanged(m_navigator.scaleFactor());
    update();
}

void CropCanvas::fitToWindow() {
    if (!hasImage()) return;
    m_navigator.fitToViewport();
    emit zoomFactorChanged(m_navigator.scaleFactor());
    update();
}

void CropCanvas::paintEvent(QPaintEvent* event) {
    Q_UNUSED(event);
    QPainter painter(this);
    painter.fillRect(rect(), QColor(0xf0, 0xf0, 0xf0));
    if (!hasImage()) {
        painter.setPen(Qt::darkGray);
        painter.drawText(rect(), Qt::AlignCenter, "Add files and select one to define the crop region.");
        return;
    }

    CoordinateMapper mapper = m_navigator.viewportMapper();
    QRectF imageRect(mapper.imageOffset(), mapper.scaledSize(m_image.size()));
    painter.setRenderHint(QPainter::SmoothPixmapTransform, mapper.scaleFactor() < 1.0);
    painter.drawImage(imageRect, m_image);

    QRectF region = m_controller->regionInViewport();
    if (region.isEmpty()) return;

    // Dim everything outside the crop region
    QPainterPath outside;
    outside.addRect(imageRect);
    QPainterPath inside;
    inside.addRect(region);
    painter.fillPath(outside.subtracted(inside), QColor(0, 0, 0, 100));

    painter.setRenderHint(QPainter::Antialiasing, false);
    painter.setPen(QPen(QColor(255, 0, 0), 2));
    painter.setBrush(Qt::NoBrush);
    painter.drawRect(region);
    drawHandles(painter, region);
}

void CropCanvas::drawHandles(QPainter& painter, const QRectF& region) {
    const double hs = m_settings.handleSize;
    QList<QPointF> points = {
        region.topLeft(), region.topRight(), region.bottomLeft(), region.bottomRight()
    };
    // Edge handles are inactive under an aspect lock, so they are not drawn
    if (!m_controller->aspectConstraint().isActive()) {
        points << QPointF(region.center().x(), region.top())
               << QPointF(region.center().x(), region.bottom())
               << QPointF(region.left(), region.center().y())
               << QPointF(region.right(), region.center().y());
    }
    for (const QPointF& p : points) {
        painter.fillRect(QRectF(p.x() - hs / 2.0, p.y() - hs / 2.0, hs, hs), QColor(255, 0, 0));
    }
}

void CropCanvas::mousePressEvent(QMouseEvent* event) {
    if (!hasImage()) { QWidget::mousePressEvent(event); return; }
    if (event->button() == Qt::LeftButton) {
        m_controller->primaryPressed(event->position());
        event->accept();
    } else if (event->button() == Qt::RightButton) {
        m_controller->secondaryPressed(event->globalPosition());
        event->accept();
    } else {
        QWidget::mousePressEvent(event);
    }
}

void CropCanvas::mouseMoveEvent(QMouseEvent* event) {
    if (!hasImage()) { QWidget::mouseMoveEvent(event); return; }
    m_controller->pointerMoved(event->position(), event->globalPosition());
    event->accept();
}

void CropCanvas::mouseReleaseEvent(QMouseEvent* event) {
    if (!hasImage()) { QWidget::mouseReleaseEvent(event); return; }
    if (event->button() == Qt::LeftButton) {
        m_controller->primaryReleased(event->position());
        event->accept();
    } else if (event->button() == Qt::RightButton) {
        m_controller->secondaryReleased(event->position());
        event->accept();
    } else {
        QWidget::mouseReleaseEvent(event);
    }
}

void CropCanvas::wheelEvent(QWheelEvent* event) {
    if (!hasImage()) { event->ignore(); return; }
    int delta = event->angleDelta().y();
    if (delta == 0) { event->ignore(); return; }
    m_controller->wheelScrolled(event->position(), delta);
    event->accept();
}

void CropCanvas::resizeEvent(QResizeEvent* event) {
    QWidget::resizeEvent(event);
    m_navigator.setViewportSize(size());
    // Until the user zooms, the image keeps fitting the window
    if (hasImage() && !m_navigator.zoomedSinceLoad()) {
        m_navigator.fitToViewport();
        emit zoomFactorChanged(m_navigator.scaleFactor());
    }
    update();
}
