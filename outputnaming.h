#ifndef OUTPUTNAMING_H
#define OUTPUTNAMING_H

#include <QString>

namespace OutputNaming {

// Splits at the final '.', so "a.tar.gz" -> ("a.tar", ".gz") and "README" -> ("README", "")
void splitFileName(const QString& fileName, QString& stem, QString& extension);

/**
 * @brief First unused output path for a source file.
 *
 * Tries <stem><suffix><ext>, then <stem><suffix>_1<ext>, <stem><suffix>_2<ext>, ...
 * inside outputDirectory.
 */
QString uniqueOutputPath(const QString& outputDirectory, const QString& sourcePath,
                         const QString& suffix = QStringLiteral("_cropped"));

} // namespace OutputNaming

#endif // OUTPUTNAMING_H
