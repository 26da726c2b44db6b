#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>
#include <QImage>

#include "cropsettings.h"
#include "cropregion.h"
#include "cropcommon.h"

// Forward declarations
namespace Ui { class MainWindow; }
class MediaCatalog;
class CropMessageQueue;
class CropWorker;
class QListWidgetItem;

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    explicit MainWindow(const Cropping::AppSettings& settings, QWidget *parent = nullptr);
    ~MainWindow();

public slots:
    // File list
    void addFiles();
    void removeSelectedFile();
    void clearFileList();

    // Crop region
    void onRegionChanging(const CropRegion& region);
    void onRegionChanged(const CropRegion& region);
    void onAspectLockToggled(bool checked);
    void onAspectRatioChanged(double ratio);

    // Batch
    void executeCrop();

private slots:
    void onCurrentRowChanged(int row);
    void onCatalogChanged();
    void onZoomFactorChanged(double zoomFactor);
    void onBatchSummary(const Cropping::BatchSummary& summary);
    void onBatchFinished();

private:
    void setupConnections();
    void rebuildFileList();
    void updateRegionFields(const CropRegion& region);
    void updateSpinBoxRanges();
    void updateApplyCount();
    void updateActionStates();
    void applyAspectConstraint();

    Ui::MainWindow *ui;
    Cropping::AppSettings m_settings;
    MediaCatalog* m_catalog;
    int m_currentIndex;
    QSize m_referenceSize;

    CropMessageQueue* m_messageQueue;
    CropWorker* m_worker;
};

#endif // MAINWINDOW_H
