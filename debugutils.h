#ifndef DEBUGUTILS_H
#define DEBUGUTILS_H

#include <QDebug>

/**
 * @brief Global switch for verbose geometry tracing
 *
 * Pointer events arrive at mouse-move rate, so the interaction controller and
 * viewport navigator only log through GEOMETRY_DEBUG(), which is a no-op
 * unless tracing has been enabled from settings or the environment.
 */
class DebugUtils {
public:
    /**
     * @brief Check if geometry debug messages should be displayed
     * @return True if geometry debug is enabled
     */
    static bool isGeometryDebugEnabled();

    /**
     * @brief Set the geometry debug state
     * @param enabled True to enable geometry debug messages
     */
    static void setGeometryDebugEnabled(bool enabled);

    /**
     * @brief Enables geometry tracing when BATCHCROPPER_GEOMETRY_DEBUG is set to a non-zero value
     */
    static void applyEnvironmentOverride();

    static QDebug geometryDebug();

private:
    static bool s_geometryDebugEnabled;
};

// Convenience macro for geometry debug messages
#define GEOMETRY_DEBUG() \
    if (!DebugUtils::isGeometryDebugEnabled()) {} else DebugUtils::geometryDebug()

#endif // DEBUGUTILS_H
