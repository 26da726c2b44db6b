#ifndef BATCHPROGRESSDIALOG_H
#define BATCHPROGRESSDIALOG_H

#include <QDialog>
#include <QString>

#include "cropcommon.h"

namespace Ui {
class BatchProgressDialog;
}
class CropMessageQueue;
struct CropMessage;
class QTimer;

// Shows per-file and overall progress of a running batch, read from the message queue.
class BatchProgressDialog : public QDialog {
    Q_OBJECT

public:
    explicit BatchProgressDialog(CropMessageQueue* queue, int jobCount, QWidget* parent = nullptr);
    ~BatchProgressDialog();

    bool isBatchRunning() const { return m_isBatchRunning; }
    Cropping::BatchSummary summary() const { return m_summary; }

signals:
    void cancelBatchRequested();

private slots:
    void pollMessages();
    void onCancelButtonClicked();

protected:
    void reject() override;

private:
    void handleMessage(const CropMessage& message);
    void onBatchCompleted(const Cropping::BatchSummary& summary);
    static QString formatSummary(const Cropping::BatchSummary& summary);

    Ui::BatchProgressDialog* ui;
    CropMessageQueue* m_queue;
    QTimer* m_pollTimer;
    int m_jobCount;
    int m_completedJobs;
    bool m_isBatchRunning;
    bool m_cancelRequested;
    Cropping::BatchSummary m_summary;
};

#endif // BATCHPROGRESSDIALOG_H
