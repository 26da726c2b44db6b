#ifndef INTERACTIONCONTROLLER_H
#define INTERACTIONCONTROLLER_H

#include <QObject>
#include <QPointF>
#include <QRectF>
#include <QSize>

#include "cropcommon.h"
#include "cropregion.h"
#include "cropsettings.h"

class ViewportNavigator;

/**
 * @brief Pointer state machine for editing the crop region.
 *
 * Consumes already-translated pointer events in viewport (widget) coordinates:
 *
 *   Idle --primary press on handle/interior--> Dragging(mode)
 *   Idle --primary press on image----------->  Creating
 *   Idle --secondary press-------------------> Panning
 *   Creating/Dragging --primary release-----> Idle   (emits regionChanged if non-empty)
 *   Panning --secondary release-------------> Idle
 *
 * While a drag is in progress every result is computed from the snapshot
 * taken at press time, never from the previous move.
 */
class InteractionController : public QObject {
    Q_OBJECT

public:
    enum class State {
        Idle,
        Creating,
        Dragging,
        Panning
    };
    Q_ENUM(State)

    explicit InteractionController(ViewportNavigator* navigator, QObject* parent = nullptr);

    void setSettings(const Cropping::EditorSettings& settings);

    // Resets the region to empty and returns to Idle for a newly loaded image
    void setImageSize(const QSize& imageSize);
    QSize imageSize() const { return m_imageSize; }

    void setAspectConstraint(const Cropping::AspectConstraint& aspect);
    Cropping::AspectConstraint aspectConstraint() const { return m_aspect; }

    CropRegion region() const { return m_region; }
    State state() const { return m_state; }
    Cropping::DragMode dragMode() const { return m_session.mode; }

    /**
     * @brief Finds what a press at viewportPos would grab.
     *
     * Corner handles are tested first, then edge midpoints (not offered under
     * an aspect lock), then the interior which maps to Move. Each handle zone
     * is a square extending handleSize + 2 pixels from the boundary point.
     * @return false if the position hits nothing
     */
    bool hitTest(const QPointF& viewportPos, Cropping::DragMode& mode) const;

    // Viewport-space rectangle of the current region, for painting
    QRectF regionInViewport() const;

    // Pointer input, in viewport coordinates; globalPos is only used for panning
    void primaryPressed(const QPointF& viewportPos);
    void pointerMoved(const QPointF& viewportPos, const QPointF& globalPos);
    void primaryReleased(const QPointF& viewportPos);
    void secondaryPressed(const QPointF& globalPos);
    void secondaryReleased(const QPointF& viewportPos);
    bool wheelScrolled(const QPointF& viewportPos, int angleDelta);

    // Numeric field edits, applied outside the pointer state machine
    void setRegion(const CropRegion& region);
    void setRegionX(int value);
    void setRegionY(int value);
    void setRegionWidth(int value);
    void setRegionHeight(int value);

    static Qt::CursorShape cursorForDragMode(Cropping::DragMode mode);

signals:
    void regionChanging(const CropRegion& region);
    void regionChanged(const CropRegion& region);
    void viewChanged();
    void stateChanged(InteractionController::State state);
    void cursorShapeChanged(Qt::CursorShape shape);

private:
    // Snapshot taken at press time and discarded on release
    struct DragSession {
        Cropping::DragMode mode = Cropping::DragMode::Move;
        CropRegion anchorRegion;
        QPointF anchorImagePoint;   // exact image-space press position
        QPoint anchorPixel;         // rounded, used when creating
        QPointF anchorScroll;       // panning only
        QPointF anchorGlobal;       // panning only
    };

    bool imageLoaded() const;
    bool isInsideImage(const QPointF& imagePoint) const;
    void setState(State state);
    void updateHoverCursor(const QPointF& viewportPos);
    void setCursorShape(Qt::CursorShape shape);
    void applyNumericEdit(const CropRegion& edited);

    ViewportNavigator* m_navigator;
    Cropping::EditorSettings m_settings;
    Cropping::AspectConstraint m_aspect;
    QSize m_imageSize;
    CropRegion m_region;
    State m_state;
    DragSession m_session;
    Qt::CursorShape m_cursorShape;
};

#endif // INTERACTIONCONTROLLER_H
