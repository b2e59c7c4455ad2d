// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QLatin1String>
#include <QtGlobal>

namespace GeoKeeper {

/**
 * @brief Default values for the geometry engine
 *
 * These are used when geokeeperrc has no override. See EngineConfig for
 * the configurable copies and their valid ranges.
 */
namespace Defaults {
// Pixels kept free on each axis when fitting a window into a work area
constexpr int SafetyMarginPx = 30;

// Drag-time snapping only rewrites an axis that is off by more than this (pixels)
constexpr int DragTolerancePx = 2;

// A full adjustment only force-resizes when off by more than this (DIP)
constexpr qreal AdjustToleranceDip = 2.0;

// Toolkit resync only overwrites cached size when off by more than this (DIP)
constexpr qreal SyncToleranceDip = 1.0;

// DPI baseline: scale 1.0 == 96 DPI
constexpr qreal BaselineDpi = 96.0;
constexpr qreal FallbackDpiScale = 1.0;
}

/**
 * @brief Valid ranges for geokeeperrc values
 */
namespace Limits {
constexpr int MinSafetyMarginPx = 0;
constexpr int MaxSafetyMarginPx = 500;
constexpr int MinDragTolerancePx = 0;
constexpr int MaxDragTolerancePx = 50;
constexpr qreal MinToleranceDip = 0.0;
constexpr qreal MaxToleranceDip = 50.0;
}

/**
 * @brief JSON keys for WindowGeometrySettings serialization
 */
namespace JsonKeys {
inline constexpr QLatin1String Top{"top"};
inline constexpr QLatin1String Left{"left"};
inline constexpr QLatin1String Width{"width"};
inline constexpr QLatin1String Height{"height"};
inline constexpr QLatin1String WindowState{"windowState"};
inline constexpr QLatin1String MonitorSizeCache{"monitorSizeCache"};
}

/**
 * @brief KConfig group and entry names (geokeeperrc)
 */
namespace ConfigKeys {
inline constexpr QLatin1String ConfigFile{"geokeeperrc"};

inline constexpr QLatin1String GeometryGroup{"Geometry"};
inline constexpr QLatin1String SafetyMargin{"SafetyMargin"};
inline constexpr QLatin1String DragTolerance{"DragTolerance"};
inline constexpr QLatin1String AdjustTolerance{"AdjustTolerance"};
inline constexpr QLatin1String SyncTolerance{"SyncTolerance"};

inline constexpr QLatin1String StorageGroup{"Storage"};
inline constexpr QLatin1String Backend{"Backend"};
inline constexpr QLatin1String Directory{"Directory"};
inline constexpr QLatin1String BackendJson{"json"};
inline constexpr QLatin1String BackendKConfig{"kconfig"};

// Per-window record groups in the KConfig settings store
inline constexpr QLatin1String WindowGroupPrefix{"Window-"};
inline constexpr QLatin1String Top{"Top"};
inline constexpr QLatin1String Left{"Left"};
inline constexpr QLatin1String Width{"Width"};
inline constexpr QLatin1String Height{"Height"};
inline constexpr QLatin1String WindowState{"WindowState"};
inline constexpr QLatin1String MonitorSizeCache{"MonitorSizeCache"};
}

} // namespace GeoKeeper
