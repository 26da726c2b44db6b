#include "outputnaming.h"

#include <QDir>
#include <QFileInfo>

namespace OutputNaming {

void splitFileName(const QString& fileName, QString& stem, QString& extension) {
    int dot = fileName.lastIndexOf('.');
    if (dot <= 0) {
        // No dot, or a dotfile such as ".hidden"
        stem = fileName;
        extension.clear();
        return;
    }
    stem = fileName.left(dot);
    extension = fileName.mid(dot);
}

QString uniqueOutputPath(const QString& outputDirectory, const QString& sourcePath, const QString& suffix) {
    QString stem;
    QString extension;
    splitFileName(QFileInfo(sourcePath).fileName(), stem, extension);

    QDir dir(outputDirectory);
    QString candidate = dir.filePath(stem + suffix + extension);
    int counter = 1;
    while (QFileInfo::exists(candidate)) {
        candidate = dir.filePath(stem + suffix + "_" + QString::number(counter) + extension);
        counter++;
    }
    return candidate;
}

} // namespace OutputNaming
