#include "cropmessagequeue.h"

#include <QDeadlineTimer>
#include <QMutexLocker>

void CropMessageQueue::post(const CropMessage& message) {
    {
        QMutexLocker locker(&m_mutex);
        m_messages.enqueue(message);
    }
    m_waitCondition.wakeAll();
}

bool CropMessageQueue::tryTake(CropMessage& message) {
    QMutexLocker locker(&m_mutex);
    if (m_messages.isEmpty()) return false;
    message = m_messages.dequeue();
    return true;
}

bool CropMessageQueue::waitTake(CropMessage& message, int timeoutMs) {
    QMutexLocker locker(&m_mutex);
    // Another consumer may win the message a wakeup was for, so wait until the deadline
    QDeadlineTimer deadline(qMax(0, timeoutMs));
    while (m_messages.isEmpty()) {
        if (!m_waitCondition.wait(&m_mutex, deadline)) break;
    }
    if (m_messages.isEmpty()) return false;
    message = m_messages.dequeue();
    return true;
}

QList<CropMessage> CropMessageQueue::drain() {
    QMutexLocker locker(&m_mutex);
    QList<CropMessage> all;
    while (!m_messages.isEmpty()) {
        all.append(m_messages.dequeue());
    }
    return all;
}

int CropMessageQueue::size() const {
    QMutexLocker locker(&m_mutex);
    return m_messages.size();
}
