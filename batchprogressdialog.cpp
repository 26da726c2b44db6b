#include "batchprogressdialog.h"
#include "ui_batchprogressdialog.h"
#include "cropmessagequeue.h"

#include <QDebug>
#include <QFileInfo>
#include <QPushButton>
#include <QTimer>

BatchProgressDialog::BatchProgressDialog(CropMessageQueue* queue, int jobCount, QWidget* parent) :
    QDialog(parent),
    ui(new Ui::BatchProgressDialog),
    m_queue(queue),
    m_pollTimer(new QTimer(this)),
    m_jobCount(jobCount),
    m_completedJobs(0),
    m_isBatchRunning(true),
    m_cancelRequested(false)
{
    ui->setupUi(this);
    setModal(true);

    ui->overallProgressBar->setRange(0, qMax(1, m_jobCount));
    ui->overallProgressBar->setValue(0);
    ui->jobProgressBar->setRange(0, 100);
    ui->jobProgressBar->setValue(0);
    ui->statusLabel->setText(QString("Cropping %1 file(s)...").arg(m_jobCount));

    QPushButton* cancelButton = ui->buttonBox->button(QDialogButtonBox::Cancel);
    if (cancelButton) {
        connect(cancelButton, &QPushButton::clicked, this, &BatchProgressDialog::onCancelButtonClicked);
    } else {
        qWarning() << "BatchProgressDialog: Cancel button not found.";
    }

    connect(m_pollTimer, &QTimer::timeout, this, &BatchProgressDialog::pollMessages);
    m_pollTimer->start(50);
}

BatchProgressDialog::~BatchProgressDialog() {
    delete ui;
}

void BatchProgressDialog::pollMessages() {
    if (!m_queue) return;
    const QList<CropMessage> messages = m_queue->drain();
    for (const CropMessage& message : messages) {
        handleMessage(message);
    }
}

void BatchProgressDialog::handleMessage(const CropMessage& message) {
    switch (message.type) {
    case CropMessage::Type::ProgressUpdate:
        ui->jobLabel->setText(QString("%1 (%2 of %3)")
                                  .arg(QFileInfo(message.sourcePath).fileName())
                                  .arg(message.jobIndex + 1)
                                  .arg(message.jobCount));
        if (message.percent < 0) {
            // Unknown duration: busy indicator
            ui->jobProgressBar->setRange(0, 0);
        } else {
            ui->jobProgressBar->setRange(0, 100);
            ui->jobProgressBar->setValue(message.percent);
        }
        break;

    case CropMessage::Type::JobCompleted: {
        m_completedJobs++;
        ui->overallProgressBar->setValue(m_completedJobs);
        ui->jobProgressBar->setRange(0, 100);
        ui->jobProgressBar->setValue(message.status == Cropping::JobStatus::Succeeded ? 100 : 0);

        QString name = QFileInfo(message.sourcePath).fileName();
        if (message.status == Cropping::JobStatus::Succeeded) {
            ui->logTextEdit->appendPlainText(QString("OK      %1 -> %2").arg(name, QFileInfo(message.outputPath).fileName()));
        } else {
            ui->logTextEdit->appendPlainText(QString("%1  %2: %3")
                                                 .arg(Cropping::jobStatusToString(message.status), name, message.reason));
        }
        break;
    }

    case CropMessage::Type::BatchCompleted:
        onBatchCompleted(message.summary);
        break;
    }
}

void BatchProgressDialog::onBatchCompleted(const Cropping::BatchSummary& summary) {
    m_summary = summary;
    m_isBatchRunning = false;
    m_pollTimer->stop();

    ui->overallProgressBar->setValue(ui->overallProgressBar->maximum());
    ui->jobProgressBar->setRange(0, 100);
    ui->statusLabel->setText((m_cancelRequested ? "Batch cancelled. " : "Batch finished. ") + formatSummary(summary));
    if (summary.failed > 0) {
        ui->overallProgressBar->setStyleSheet("QProgressBar::chunk { background-color: #c86400; }");
    }

    QPushButton* cancelButton = ui->buttonBox->button(QDialogButtonBox::Cancel);
    if (cancelButton) {
        cancelButton->setText("Close");
        cancelButton->setEnabled(true);
    }
}

QString BatchProgressDialog::formatSummary(const Cropping::BatchSummary& summary) {
    return QString("%1 succeeded, %2 skipped (different size), %3 failed, %4 cancelled.")
        .arg(summary.succeeded)
        .arg(summary.skippedForSize)
        .arg(summary.failed)
        .arg(summary.cancelled);
}

void BatchProgressDialog::onCancelButtonClicked() {
    qDebug() << "BatchProgressDialog: Cancel clicked. Batch running:" << m_isBatchRunning;
    if (!m_isBatchRunning) {
        accept();
        return;
    }
    if (m_cancelRequested) return;
    m_cancelRequested = true;
    ui->statusLabel->setText("Cancellation requested...");
    QPushButton* cancelButton = ui->buttonBox->button(QDialogButtonBox::Cancel);
    if (cancelButton) cancelButton->setEnabled(false);
    emit cancelBatchRequested();
}

void BatchProgressDialog::reject() {
    // Escape and the close button cancel first; the dialog closes once the batch has stopped
    if (m_isBatchRunning) {
        onCancelButtonClicked();
        return;
    }
    QDialog::reject();
}
