#include "mainwindow.h"
#include "ui_mainwindow.h"

#include "batchprogressdialog.h"
#include "cropcanvas.h"
#include "cropexecutor.h"
#include "cropmessagequeue.h"
#include "cropworker.h"
#include "interactioncontroller.h"
#include "mediacatalog.h"
#include "mediaprobe.h"

#include <QCheckBox>
#include <QDebug>
#include <QDoubleSpinBox>
#include <QFileDialog>
#include <QFileInfo>
#include <QListWidget>
#include <QMessageBox>
#include <QPushButton>
#include <QSpinBox>
#include <QStatusBar>

MainWindow::MainWindow(const Cropping::AppSettings& settings, QWidget *parent)
    : QMainWindow(parent)
    , ui(new Ui::MainWindow)
    , m_settings(settings)
    , m_catalog(new MediaCatalog(this))
    , m_currentIndex(-1)
    , m_messageQueue(new CropMessageQueue())
    , m_worker(nullptr)
{
    ui->setupUi(this);
    ui->mainSplitter->setSizes({350, 850});
    ui->mainSplitter->setStretchFactor(1, 1);

    m_catalog->setVideoExtensions(m_settings.pipeline.videoExtensions);
    ui->cropCanvas->setSettings(m_settings.editor);

    setupConnections();
    updateSpinBoxRanges();
    updateRegionFields(CropRegion());
    updateActionStates();
}

MainWindow::~MainWindow()
{
    // The worker posts into the queue, so it has to stop before the queue goes away
    if (m_worker) {
        m_worker->stopProcessing();
        m_worker->wait();
        delete m_worker;
        m_worker = nullptr;
    }
    delete m_messageQueue;
    delete ui;
}

void MainWindow::setupConnections() {
    connect(ui->addFilesButton, &QPushButton::clicked, this, &MainWindow::addFiles);
    connect(ui->removeFileButton, &QPushButton::clicked, this, &MainWindow::removeSelectedFile);
    connect(ui->clearListButton, &QPushButton::clicked, this, &MainWindow::clearFileList);
    connect(ui->fileListWidget, &QListWidget::currentRowChanged, this, &MainWindow::onCurrentRowChanged);
    connect(m_catalog, &MediaCatalog::itemsChanged, this, &MainWindow::onCatalogChanged);

    InteractionController* controller = ui->cropCanvas->controller();
    connect(controller, &InteractionController::regionChanging, this, &MainWindow::onRegionChanging);
    connect(controller, &InteractionController::regionChanged, this, &MainWindow::onRegionChanged);
    connect(ui->cropCanvas, &CropCanvas::zoomFactorChanged, this, &MainWindow::onZoomFactorChanged);

    connect(ui->xSpinBox, QOverload<int>::of(&QSpinBox::valueChanged), controller, &InteractionController::setRegionX);
    connect(ui->ySpinBox, QOverload<int>::of(&QSpinBox::valueChanged), controller, &InteractionController::setRegionY);
    connect(ui->widthSpinBox, QOverload<int>::of(&QSpinBox::valueChanged), controller, &InteractionController::setRegionWidth);
    connect(ui->heightSpinBox, QOverload<int>::of(&QSpinBox::valueChanged), controller, &InteractionController::setRegionHeight);

    connect(ui->aspectLockCheckBox, &QCheckBox::toggled, this, &MainWindow::onAspectLockToggled);
    connect(ui->aspectRatioSpinBox, QOverload<double>::of(&QDoubleSpinBox::valueChanged), this, &MainWindow::onAspectRatioChanged);

    connect(ui->fitButton, &QPushButton::clicked, ui->cropCanvas, &CropCanvas::fitToWindow);
    connect(ui->executeButton, &QPushButton::clicked, this, &MainWindow::executeCrop);
}

// --- File list ---

void MainWindow::addFiles() {
    QStringList patterns;
    patterns << "*.png" << "*.jpg" << "*.jpeg" << "*.bmp" << "*.gif" << "*.tif" << "*.tiff" << "*.webp";
    for (const QString& ext : m_settings.pipeline.videoExtensions) patterns << "*." + ext;
    QString filter = QString("Media Files (%1);;All Files (*)").arg(patterns.join(' '));

    QStringList files = QFileDialog::getOpenFileNames(this, "Select Images or Videos", QString(), filter);
    if (files.isEmpty()) return;

    MediaCatalog::AddResult result = m_catalog->addFiles(files);
    statusBar()->showMessage(QString("Added %1 file(s).").arg(result.added), 5000);

    if (!result.unreadable.isEmpty()) {
        QStringList names;
        for (const QString& path : result.unreadable) names << QFileInfo(path).fileName();
        QMessageBox::warning(this, "Unreadable Files",
                             QString("The following files could not be read and were not added:\n%1").arg(names.join('\n')));
    }

    if (result.added > 0 && m_catalog->hasMixedSizes()) {
        QStringList lines;
        const QMap<QString, int> groups = m_catalog->sizeGroups();
        for (auto it = groups.constBegin(); it != groups.constEnd(); ++it) {
            lines << QString("- %1: %2 file(s)").arg(it.key()).arg(it.value());
        }
        QMessageBox::information(this, "Different Sizes Detected",
                                 QString("Several sizes were detected:\n%1\n\n"
                                         "The crop region is only applied to files with the same size as the selected one.")
                                     .arg(lines.join('\n')));
    }

    if (m_currentIndex == -1 && !m_catalog->isEmpty()) {
        ui->fileListWidget->setCurrentRow(0);
    }
}

void MainWindow::removeSelectedFile() {
    int row = ui->fileListWidget->currentRow();
    if (row < 0) return;
    // Forces the row that moves into this position to load as a new image
    m_currentIndex = -1;
    m_catalog->removeItem(row);
    if (m_catalog->isEmpty()) {
        clearFileList();
        return;
    }
    ui->fileListWidget->setCurrentRow(qMin(row, m_catalog->count() - 1));
}

void MainWindow::clearFileList() {
    m_catalog->clear();
    m_currentIndex = -1;
    m_referenceSize = QSize();
    ui->cropCanvas->setImage(QImage());
    ui->sizeInfoLabel->setText("Size: -");
    updateSpinBoxRanges();
    updateApplyCount();
    updateActionStates();
}

void MainWindow::onCatalogChanged() {
    rebuildFileList();
    updateApplyCount();
    updateActionStates();
}

void MainWindow::rebuildFileList() {
    ui->fileListWidget->blockSignals(true);
    ui->fileListWidget->clear();
    const QList<Cropping::MediaItem>& items = m_catalog->items();
    for (const Cropping::MediaItem& item : items) {
        QString text = QString("%1 [%2]").arg(QFileInfo(item.path).fileName(), MediaCatalog::sizeKey(item.size()));
        if (item.kind == Cropping::MediaKind::Video) text += " (video)";
        QListWidgetItem* listItem = new QListWidgetItem(text, ui->fileListWidget);
        listItem->setData(Qt::UserRole, item.path);
        listItem->setToolTip(QString("Size: %1").arg(MediaCatalog::sizeKey(item.size())));
        // Files that will be skipped for the current reference stand out
        if (!m_referenceSize.isEmpty() && item.size() != m_referenceSize) {
            listItem->setForeground(QColor(200, 100, 0));
        }
    }
    int row = m_currentIndex < m_catalog->count() ? m_currentIndex : -1;
    ui->fileListWidget->setCurrentRow(row);
    ui->fileListWidget->blockSignals(false);
}

void MainWindow::onCurrentRowChanged(int row) {
    if (row < 0 || row >= m_catalog->count()) return;
    if (row == m_currentIndex && ui->cropCanvas->hasImage()) return;

    Cropping::MediaItem item = m_catalog->item(row);
    QImage preview;
    QString errorMessage;
    if (!MediaProbe::loadPreview(item, preview, errorMessage)) {
        qWarning() << "MainWindow: Failed to load preview for" << item.path << ":" << errorMessage;
        statusBar()->showMessage(QString("Cannot display %1: %2").arg(QFileInfo(item.path).fileName(), errorMessage), 5000);
        return;
    }

    m_currentIndex = row;
    m_referenceSize = item.size();
    ui->cropCanvas->setImage(preview);
    ui->sizeInfoLabel->setText(QString("Size: %1").arg(MediaCatalog::sizeKey(m_referenceSize)));

    updateSpinBoxRanges();
    rebuildFileList();
    updateApplyCount();
    updateActionStates();
}

// --- Crop region ---

void MainWindow::onRegionChanging(const CropRegion& region) {
    updateRegionFields(region);
}

void MainWindow::onRegionChanged(const CropRegion& region) {
    updateRegionFields(region);
    updateActionStates();
}

void MainWindow::updateRegionFields(const CropRegion& region) {
    if (region.isEmpty()) {
        ui->cropInfoLabel->setText("Region: not set");
    } else {
        ui->cropInfoLabel->setText(QString("Region: (%1, %2) - %3x%4")
                                       .arg(region.x()).arg(region.y())
                                       .arg(region.width()).arg(region.height()));
    }

    const QList<QSpinBox*> boxes = {ui->xSpinBox, ui->ySpinBox, ui->widthSpinBox, ui->heightSpinBox};
    for (QSpinBox* box : boxes) box->blockSignals(true);
    ui->xSpinBox->setValue(region.x());
    ui->ySpinBox->setValue(region.y());
    ui->widthSpinBox->setValue(region.width());
    ui->heightSpinBox->setValue(region.height());
    for (QSpinBox* box : boxes) box->blockSignals(false);
}

void MainWindow::updateSpinBoxRanges() {
    const QList<QSpinBox*> boxes = {ui->xSpinBox, ui->ySpinBox, ui->widthSpinBox, ui->heightSpinBox};
    for (QSpinBox* box : boxes) box->blockSignals(true);

    if (m_referenceSize.isEmpty()) {
        for (QSpinBox* box : boxes) {
            box->setRange(0, 0);
            box->setEnabled(false);
        }
    } else {
        const int W = m_referenceSize.width();
        const int H = m_referenceSize.height();
        const int minW = qMin(m_settings.editor.minimumCropSize, W);
        const int minH = qMin(m_settings.editor.minimumCropSize, H);
        ui->xSpinBox->setRange(0, W - minW);
        ui->ySpinBox->setRange(0, H - minH);
        // Width and height may exceed what fits at the current position; the
        // controller then slides x/y back so the region stays inside the image
        ui->widthSpinBox->setRange(minW, W);
        ui->heightSpinBox->setRange(minH, H);
        for (QSpinBox* box : boxes) box->setEnabled(true);
    }

    for (QSpinBox* box : boxes) box->blockSignals(false);
}

void MainWindow::onAspectLockToggled(bool checked) {
    CropRegion region = ui->cropCanvas->controller()->region();
    if (checked && !region.isEmpty()) {
        // Lock to the ratio currently on screen
        ui->aspectRatioSpinBox->blockSignals(true);
        ui->aspectRatioSpinBox->setValue(static_cast<double>(region.width()) / region.height());
        ui->aspectRatioSpinBox->blockSignals(false);
    }
    applyAspectConstraint();
}

void MainWindow::onAspectRatioChanged(double ratio) {
    Q_UNUSED(ratio);
    applyAspectConstraint();
}

void MainWindow::applyAspectConstraint() {
    Cropping::AspectConstraint aspect;
    aspect.locked = ui->aspectLockCheckBox->isChecked();
    aspect.ratio = ui->aspectRatioSpinBox->value();
    ui->cropCanvas->controller()->setAspectConstraint(aspect);
    ui->cropCanvas->update();
}

void MainWindow::onZoomFactorChanged(double zoomFactor) {
    ui->zoomLabel->setText(QString("Zoom: %1%").arg(qRound(zoomFactor * 100.0)));
}

void MainWindow::updateApplyCount() {
    if (m_referenceSize.isEmpty()) {
        ui->applyToAllCheckBox->setText("Apply to files of the same size");
        return;
    }
    int sameSize = m_catalog->itemsMatching(m_referenceSize).size();
    if (sameSize > 1) {
        ui->applyToAllCheckBox->setText(QString("Apply to files of the same size (%1)").arg(sameSize));
    } else {
        ui->applyToAllCheckBox->setText("Apply to files of the same size (this file only)");
    }
}

void MainWindow::updateActionStates() {
    bool batchRunning = m_worker != nullptr;
    bool hasRegion = !ui->cropCanvas->controller()->region().isEmpty();
    ui->executeButton->setEnabled(!batchRunning && hasRegion && m_currentIndex >= 0);
    ui->addFilesButton->setEnabled(!batchRunning);
    ui->removeFileButton->setEnabled(!batchRunning && m_currentIndex >= 0);
    ui->clearListButton->setEnabled(!batchRunning && !m_catalog->isEmpty());
}

// --- Batch ---

void MainWindow::executeCrop() {
    if (m_worker) return;

    CropRegion region = ui->cropCanvas->controller()->region();
    if (!region.isValidWithin(m_referenceSize)) {
        QMessageBox::warning(this, "Warning", "No crop region has been set.");
        return;
    }
    if (m_catalog->isEmpty() || m_currentIndex < 0) {
        QMessageBox::warning(this, "Warning", "No files have been loaded.");
        return;
    }

    QString folder = QFileDialog::getExistingDirectory(this, "Select Output Folder");
    if (folder.isEmpty()) return;

    CropRequest request;
    request.region = region;
    request.referenceSize = m_referenceSize;
    request.outputDirectory = folder;
    if (ui->applyToAllCheckBox->isChecked()) {
        request.candidates = m_catalog->items();
    } else {
        request.candidates.append(m_catalog->item(m_currentIndex));
    }

    // Leftovers from an earlier batch must not reach the new dialog
    m_messageQueue->drain();

    m_worker = new CropWorker(request, m_settings.pipeline, m_messageQueue);
    BatchProgressDialog* progressDialog = new BatchProgressDialog(m_messageQueue, request.candidates.size(), this);
    progressDialog->setAttribute(Qt::WA_DeleteOnClose);

    connect(progressDialog, &BatchProgressDialog::cancelBatchRequested, m_worker, &CropWorker::stopProcessing,
            Qt::DirectConnection);
    connect(m_worker, &CropWorker::batchFinished, this, &MainWindow::onBatchSummary);
    connect(m_worker, &QThread::finished, this, &MainWindow::onBatchFinished);

    qDebug() << "MainWindow: starting batch of" << request.candidates.size() << "file(s), region" << region;
    updateActionStates();
    progressDialog->show();
    m_worker->start();
}

void MainWindow::onBatchSummary(const Cropping::BatchSummary& summary) {
    statusBar()->showMessage(QString("Batch finished: %1 succeeded, %2 skipped, %3 failed, %4 cancelled.")
                                 .arg(summary.succeeded).arg(summary.skippedForSize)
                                 .arg(summary.failed).arg(summary.cancelled));
}

void MainWindow::onBatchFinished() {
    if (!m_worker) return;
    m_worker->wait();
    m_worker->deleteLater();
    m_worker = nullptr;
    updateActionStates();
}
