#include "mainwindow.h"
#include "cropsettings.h"
#include "debugutils.h"

#include <QApplication>
#include <QDir>
#include <QStandardPaths>
#include <QDebug>

int main(int argc, char *argv[])
{
    QApplication a(argc, argv);
    QApplication::setApplicationName("batchcropper");
    QApplication::setStyle("Fusion");

    QString configDir = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    Cropping::AppSettings settings = Cropping::loadSettingsFile(QDir(configDir).filePath("batchcropper.json"));

    DebugUtils::setGeometryDebugEnabled(settings.editor.geometryDebug);
    DebugUtils::applyEnvironmentOverride();
    if (DebugUtils::isGeometryDebugEnabled()) {
        qDebug() << "Geometry debug output enabled";
    }

    MainWindow w(settings);
    w.show();
    return a.exec();
}
