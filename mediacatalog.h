#ifndef MEDIACATALOG_H
#define MEDIACATALOG_H

#include <QObject>
#include <QList>
#include <QMap>
#include <QSize>
#include <QStringList>

#include "cropcommon.h"

/**
 * @brief Registry of the files the operator has added, with probed dimensions.
 *
 * Items keep their insertion order. Files that cannot be probed are never
 * registered; they are reported back to the caller instead.
 */
class MediaCatalog : public QObject {
    Q_OBJECT

public:
    struct AddResult {
        int added = 0;
        QStringList duplicates;
        QStringList unreadable;
    };

    explicit MediaCatalog(QObject* parent = nullptr);

    void setVideoExtensions(const QStringList& extensions) { m_videoExtensions = extensions; }
    QStringList videoExtensions() const { return m_videoExtensions; }

    AddResult addFiles(const QStringList& paths);
    bool removeItem(int index);
    void clear();

    int count() const { return m_items.size(); }
    bool isEmpty() const { return m_items.isEmpty(); }
    const QList<Cropping::MediaItem>& items() const { return m_items; }
    Cropping::MediaItem item(int index) const;
    int indexOf(const QString& path) const;

    // Number of items per exact pixel size, keyed "WxH"
    QMap<QString, int> sizeGroups() const;
    bool hasMixedSizes() const { return sizeGroups().size() > 1; }

    // Items whose dimensions equal the reference size exactly
    QList<Cropping::MediaItem> itemsMatching(const QSize& referenceSize) const;

    static QString sizeKey(const QSize& size);

signals:
    void itemsChanged();

private:
    QList<Cropping::MediaItem> m_items;
    QStringList m_videoExtensions;
};

#endif // MEDIACATALOG_H
