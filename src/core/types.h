// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "geokeeper_export.h"
#include <QMetaType>
#include <QRect>
#include <QString>

namespace GeoKeeper {

// ═══════════════════════════════════════════════════════════════════════════════
// Shared Types
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Tri-state window mode as seen by the engine
 *
 * Mirrors the host toolkit's normal/minimized/maximized state. Fullscreen
 * and other toolkit-specific modes are reported as Normal.
 */
enum class WindowMode {
    Normal = 0,
    Minimized = 1,
    Maximized = 2
};

/**
 * @brief String form used in persisted records ("Normal", "Minimized", "Maximized")
 */
GEOKEEPER_EXPORT QString windowModeToString(WindowMode mode);

/**
 * @brief Parse a persisted window mode; unknown strings read as Normal
 */
GEOKEEPER_EXPORT WindowMode windowModeFromString(const QString& value);

/**
 * @brief Description of one monitor at the time of the query
 *
 * Derived from live OS state and never persisted. Do not keep a descriptor
 * beyond a single adjustment pass: monitors can be unplugged or change
 * resolution between calls.
 */
struct GEOKEEPER_EXPORT MonitorDescriptor
{
    QString handle;             ///< Volatile runtime handle (connector name in the Qt provider)
    QString deviceId;           ///< Stable identity of the physical output
    QRect workArea;             ///< Usable area in device pixels (excludes panels/taskbars)
    qreal dpiScale = 1.0;       ///< Scale relative to 96 DPI
    QRect bounds;               ///< Full monitor rectangle in device pixels (origin of DIP positions)

    bool isValid() const
    {
        return !deviceId.isEmpty() && workArea.isValid();
    }
};

/**
 * @brief Raw notification from the OS windowing layer
 *
 * Delivered in temporal order through IWindowHost::nativeEventReceived.
 * Moving and Sizing carry the proposed window rectangle in device pixels;
 * a handler may rewrite it before returning and the OS uses it verbatim.
 * Handlers set handled when they take over the OS default behavior.
 */
struct GEOKEEPER_EXPORT NativeEvent
{
    enum class Type {
        MoveResizeStarted,   ///< Entering an interactive move-or-resize loop
        MoveResizeFinished,  ///< Exiting the interactive loop
        Moving,              ///< Live move step, rect is editable
        Sizing,              ///< Live resize step, rect is editable (not edited by the engine)
        DpiChanged           ///< Effective DPI of the window's monitor changed
    };

    Type type;
    QRect* rect = nullptr;
    bool handled = false;
};

} // namespace GeoKeeper

Q_DECLARE_METATYPE(GeoKeeper::NativeEvent*)
