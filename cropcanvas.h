#ifndef CROPCANVAS_H
#define CROPCANVAS_H

#include <QWidget>
#include <QImage>

#include "viewportnavigator.h"
#include "cropregion.h"

class InteractionController;
class QPaintEvent;
class QMouseEvent;
class QWheelEvent;
class QResizeEvent;

/**
 * @brief Displays the reference image and forwards pointer input to the crop editor.
 *
 * Left button creates, moves and resizes the crop region; right button drags
 * the view; the wheel zooms around the cursor. All geometry decisions are made
 * by InteractionController and ViewportNavigator, this widget only translates
 * Qt events and paints.
 */
class CropCanvas : public QWidget {
    Q_OBJECT

public:
    explicit CropCanvas(QWidget* parent = nullptr);

    void setSettings(const Cropping::EditorSettings& settings);

    // Shows image and resets the crop region; a null image clears the canvas
    void setImage(const QImage& image);
    bool hasImage() const { return !m_image.isNull(); }

    InteractionController* controller() const { return m_controller; }
    const ViewportNavigator& navigator() const { return m_navigator; }

public slots:
    void fitToWindow();

signals:
    void zoomFactorChanged(double zoomFactor);

protected:
    void paintEvent(QPaintEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void wheelEvent(QWheelEvent* event) override;
    void resizeEvent(QResizeEvent* event) override;

private:
    void drawHandles(QPainter& painter, const QRectF& region);

    QImage m_image;
    ViewportNavigator m_navigator;
    InteractionController* m_controller;
    Cropping::EditorSettings m_settings;
};

#endif // CROPCANVAS_H
