#include "mediacatalog.h"
#include "mediaprobe.h"
#include "cropsettings.h"

#include <QDebug>
#include <QFileInfo>

MediaCatalog::MediaCatalog(QObject* parent)
    : QObject(parent),
    m_videoExtensions(Cropping::PipelineSettings().videoExtensions) {
}

MediaCatalog::AddResult MediaCatalog::addFiles(const QStringList& paths) {
    AddResult result;
    for (const QString& path : paths) {
        QString absolute = QFileInfo(path).absoluteFilePath();
        if (indexOf(absolute) >= 0) {
            result.duplicates.append(absolute);
            continue;
        }

        MediaProbe::ProbeResult probed = MediaProbe::probe(absolute, m_videoExtensions);
        if (!probed.ok) {
            result.unreadable.append(absolute);
            continue;
        }

        m_items.append(probed.item);
        result.added++;
        qDebug() << "MediaCatalog: added" << probed.item.path
                 << Cropping::mediaKindToString(probed.item.kind) << sizeKey(probed.item.size());
    }

    if (result.added > 0) emit itemsChanged();
    return result;
}

bool MediaCatalog::removeItem(int index) {
    if (index < 0 || index >= m_items.size()) return false;
    m_items.removeAt(index);
    emit itemsChanged();
    return true;
}

void MediaCatalog::clear() {
    if (m_items.isEmpty()) return;
    m_items.clear();
    emit itemsChanged();
}

Cropping::MediaItem MediaCatalog::item(int index) const {
    if (index < 0 || index >= m_items.size()) return Cropping::MediaItem();
    return m_items.at(index);
}

int MediaCatalog::indexOf(const QString& path) const {
    QString absolute = QFileInfo(path).absoluteFilePath();
    for (int i = 0; i < m_items.size(); ++i) {
        if (m_items.at(i).path == absolute) return i;
    }
    return -1;
}

QMap<QString, int> MediaCatalog::sizeGroups() const {
    QMap<QString, int> groups;
    for (const Cropping::MediaItem& item : m_items) {
        groups[sizeKey(item.size())]++;
    }
    return groups;
}

QList<Cropping::MediaItem> MediaCatalog::itemsMatching(const QSize& referenceSize) const {
    QList<Cropping::MediaItem> matching;
    for (const Cropping::MediaItem& item : m_items) {
        if (item.size() == referenceSize) matching.append(item);
    }
    return matching;
}

QString MediaCatalog::sizeKey(const QSize& size) {
    return QString("%1x%2").arg(size.width()).arg(size.height());
}
