#include "debugutils.h"

#include <QtGlobal>

// Static member definition
bool DebugUtils::s_geometryDebugEnabled = false;

bool DebugUtils::isGeometryDebugEnabled() {
    return s_geometryDebugEnabled;
}

void DebugUtils::setGeometryDebugEnabled(bool enabled) {
    s_geometryDebugEnabled = enabled;
}

void DebugUtils::applyEnvironmentOverride() {
    bool ok = false;
    int value = qEnvironmentVariableIntValue("BATCHCROPPER_GEOMETRY_DEBUG", &ok);
    if (ok && value != 0) {
        s_geometryDebugEnabled = true;
    }
}

QDebug DebugUtils::geometryDebug() {
    QDebug dbg = qDebug();
    dbg << "[geometry]";
    return dbg;
}
