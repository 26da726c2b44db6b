#include "interactioncontroller.h"
#include "viewportnavigator.h"
#include "coordinatemapper.h"
#include "debugutils.h"

#include <QDebug>

using Cropping::DragMode;

InteractionController::InteractionController(ViewportNavigator* navigator, QObject* parent)
    : QObject(parent),
    m_navigator(navigator),
    m_state(State::Idle),
    m_cursorShape(Qt::ArrowCursor) {
    if (m_navigator) m_settings = m_navigator->settings();
}

void InteractionController::setSettings(const Cropping::EditorSettings& settings) {
    m_settings = settings;
}

void InteractionController::setImageSize(const QSize& imageSize) {
    m_imageSize = imageSize;
    m_session = DragSession();
    setState(State::Idle);
    m_region = CropRegion();
    emit regionChanged(m_region);
}

void InteractionController::setAspectConstraint(const Cropping::AspectConstraint& aspect) {
    m_aspect = aspect;
    qDebug() << "InteractionController: aspect lock" << (aspect.isActive() ? "on" : "off") << "ratio" << aspect.ratio;
}

bool InteractionController::imageLoaded() const {
    return m_navigator && !m_imageSize.isEmpty();
}

bool InteractionController::isInsideImage(const QPointF& imagePoint) const {
    return imagePoint.x() >= 0.0 && imagePoint.y() >= 0.0 &&
           imagePoint.x() <= m_imageSize.width() && imagePoint.y() <= m_imageSize.height();
}

QRectF InteractionController::regionInViewport() const {
    if (!imageLoaded() || m_region.isEmpty()) return QRectF();
    CoordinateMapper mapper = m_navigator->viewportMapper();
    QPointF topLeft = mapper.toViewportSpace(QPointF(m_region.x(), m_region.y()));
    QPointF bottomRight = mapper.toViewportSpace(QPointF(m_region.right(), m_region.bottom()));
    return QRectF(topLeft, bottomRight);
}

bool InteractionController::hitTest(const QPointF& viewportPos, DragMode& mode) const {
    QRectF r = regionInViewport();
    if (r.isEmpty()) return false;

    const double tolerance = m_settings.handleSize + 2;
    auto near = [&](double px, double py) {
        return qAbs(viewportPos.x() - px) < tolerance && qAbs(viewportPos.y() - py) < tolerance;
    };

    const double cx = r.center().x();
    const double cy = r.center().y();

    if (near(r.left(), r.top())) { mode = DragMode::ResizeTL; return true; }
    if (near(r.right(), r.top())) { mode = DragMode::ResizeTR; return true; }
    if (near(r.left(), r.bottom())) { mode = DragMode::ResizeBL; return true; }
    if (near(r.right(), r.bottom())) { mode = DragMode::ResizeBR; return true; }

    if (!m_aspect.isActive()) {
        if (near(cx, r.top())) { mode = DragMode::ResizeT; return true; }
        if (near(cx, r.bottom())) { mode = DragMode::ResizeB; return true; }
        if (near(r.left(), cy)) { mode = DragMode::ResizeL; return true; }
        if (near(r.right(), cy)) { mode = DragMode::ResizeR; return true; }
    }

    if (r.contains(viewportPos)) {
        mode = DragMode::Move;
        return true;
    }
    return false;
}

void InteractionController::primaryPressed(const QPointF& viewportPos) {
    if (!imageLoaded() || m_state != State::Idle) return;

    CoordinateMapper mapper = m_navigator->viewportMapper();
    QPointF imagePoint = mapper.toImageSpace(viewportPos);

    DragMode mode;
    if (hitTest(viewportPos, mode)) {
        m_session = DragSession();
        m_session.mode = mode;
        m_session.anchorRegion = m_region;
        m_session.anchorImagePoint = imagePoint;
        setState(State::Dragging);
        setCursorShape(cursorForDragMode(mode));
        GEOMETRY_DEBUG() << "drag start" << Cropping::dragModeToString(mode) << "anchor" << m_region << "at" << imagePoint;
        return;
    }

    if (!isInsideImage(imagePoint)) return;

    m_session = DragSession();
    m_session.anchorImagePoint = imagePoint;
    m_session.anchorPixel = QPoint(CoordinateMapper::roundHalfAwayFromZero(imagePoint.x()),
                                   CoordinateMapper::roundHalfAwayFromZero(imagePoint.y()));
    m_session.anchorRegion = m_region;
    m_region = CropRegion();
    setState(State::Creating);
    GEOMETRY_DEBUG() << "create start at" << m_session.anchorPixel;
    emit regionChanging(m_region);
}

void InteractionController::pointerMoved(const QPointF& viewportPos, const QPointF& globalPos) {
    if (!imageLoaded()) return;

    switch (m_state) {
    case State::Idle:
        updateHoverCursor(viewportPos);
        break;

    case State::Creating: {
        QPointF imagePoint = m_navigator->viewportMapper().toImageSpace(viewportPos);
        QPoint pointer(CoordinateMapper::roundHalfAwayFromZero(imagePoint.x()),
                       CoordinateMapper::roundHalfAwayFromZero(imagePoint.y()));
        m_region = CropRegion::create(m_session.anchorPixel, pointer, m_imageSize, m_aspect);
        GEOMETRY_DEBUG() << "create" << m_region;
        emit regionChanging(m_region);
        break;
    }

    case State::Dragging: {
        QPointF imagePoint = m_navigator->viewportMapper().toImageSpace(viewportPos);
        QPointF d = imagePoint - m_session.anchorImagePoint;
        QPoint delta(CoordinateMapper::roundHalfAwayFromZero(d.x()),
                     CoordinateMapper::roundHalfAwayFromZero(d.y()));

        CropRegion result;
        bool accepted = false;
        if (m_session.mode == DragMode::Move) {
            accepted = m_session.anchorRegion.moveBy(delta, m_imageSize, m_settings.minimumCropSize, result);
        } else {
            accepted = m_session.anchorRegion.resizeBy(m_session.mode, delta, m_imageSize, m_aspect,
                                                       m_settings.minimumCropSize, result);
        }

        if (!accepted) {
            GEOMETRY_DEBUG() << "rejected" << Cropping::dragModeToString(m_session.mode) << "delta" << delta;
            break;
        }
        if (result != m_region) {
            m_region = result;
            GEOMETRY_DEBUG() << Cropping::dragModeToString(m_session.mode) << m_region;
            emit regionChanging(m_region);
        }
        break;
    }

    case State::Panning:
        m_navigator->panFrom(m_session.anchorScroll, m_session.anchorGlobal, globalPos);
        emit viewChanged();
        break;
    }
}

void InteractionController::primaryReleased(const QPointF& viewportPos) {
    if (m_state != State::Creating && m_state != State::Dragging) return;

    const CropRegion anchorRegion = m_session.anchorRegion;
    if (m_state == State::Creating && !m_region.isEmpty() &&
        !m_region.isValidWithin(m_imageSize, m_settings.minimumCropSize)) {
        GEOMETRY_DEBUG() << "selection" << m_region << "below minimum, discarded";
        m_region = CropRegion();
    }

    m_session = DragSession();
    setState(State::Idle);
    // Clearing the previous region is a commit too
    if (!m_region.isEmpty() || m_region != anchorRegion) {
        qDebug() << "InteractionController: region committed" << m_region;
        emit regionChanged(m_region);
    }
    updateHoverCursor(viewportPos);
}

void InteractionController::secondaryPressed(const QPointF& globalPos) {
    if (!imageLoaded() || m_state != State::Idle) return;

    m_session = DragSession();
    m_session.anchorScroll = m_navigator->scroll();
    m_session.anchorGlobal = globalPos;
    setState(State::Panning);
    setCursorShape(Qt::ClosedHandCursor);
}

void InteractionController::secondaryReleased(const QPointF& viewportPos) {
    if (m_state != State::Panning) return;
    m_session = DragSession();
    setState(State::Idle);
    updateHoverCursor(viewportPos);
}

bool InteractionController::wheelScrolled(const QPointF& viewportPos, int angleDelta) {
    if (!imageLoaded() || m_state == State::Panning) return false;
    if (!m_navigator->zoomAt(viewportPos, angleDelta)) return false;
    emit viewChanged();
    return true;
}

void InteractionController::setRegion(const CropRegion& region) {
    CropRegion clamped = region.clampedTo(m_imageSize);
    if (clamped == m_region) return;
    m_region = clamped;
    emit regionChanged(m_region);
}

void InteractionController::setRegionX(int value) {
    applyNumericEdit(m_region.withX(value, m_imageSize, m_settings.minimumCropSize));
}

void InteractionController::setRegionY(int value) {
    applyNumericEdit(m_region.withY(value, m_imageSize, m_settings.minimumCropSize));
}

void InteractionController::setRegionWidth(int value) {
    applyNumericEdit(m_region.withWidth(value, m_imageSize, m_settings.minimumCropSize));
}

void InteractionController::setRegionHeight(int value) {
    applyNumericEdit(m_region.withHeight(value, m_imageSize, m_settings.minimumCropSize));
}

void InteractionController::applyNumericEdit(const CropRegion& edited) {
    if (m_imageSize.isEmpty() || m_state != State::Idle) return;
    // Always notify so the other fields can re-clamp their ranges
    m_region = edited;
    emit regionChanged(m_region);
}

Qt::CursorShape InteractionController::cursorForDragMode(DragMode mode) {
    switch (mode) {
    case DragMode::Move: return Qt::SizeAllCursor;
    case DragMode::ResizeTL:
    case DragMode::ResizeBR: return Qt::SizeFDiagCursor;
    case DragMode::ResizeTR:
    case DragMode::ResizeBL: return Qt::SizeBDiagCursor;
    case DragMode::ResizeT:
    case DragMode::ResizeB: return Qt::SizeVerCursor;
    case DragMode::ResizeL:
    case DragMode::ResizeR: return Qt::SizeHorCursor;
    default: return Qt::ArrowCursor;
    }
}

void InteractionController::updateHoverCursor(const QPointF& viewportPos) {
    DragMode mode;
    if (hitTest(viewportPos, mode)) {
        setCursorShape(cursorForDragMode(mode));
        return;
    }
    QPointF imagePoint = m_navigator->viewportMapper().toImageSpace(viewportPos);
    setCursorShape(isInsideImage(imagePoint) ? Qt::CrossCursor : Qt::ArrowCursor);
}

void InteractionController::setCursorShape(Qt::CursorShape shape) {
    if (shape == m_cursorShape) return;
    m_cursorShape = shape;
    emit cursorShapeChanged(shape);
}

void InteractionController::setState(State state) {
    if (state == m_state) return;
    m_state = state;
    emit stateChanged(state);
}
