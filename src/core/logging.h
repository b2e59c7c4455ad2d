// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "geokeeper_export.h"
#include <QLoggingCategory>

/**
 * @file logging.h
 * @brief Centralized logging categories for GeoKeeper
 *
 * Usage:
 *   #include "logging.h"
 *   qCDebug(lcEngine) << "Debug message";
 *   qCWarning(lcConfig) << "Warning message";
 *
 * Runtime filtering via environment variable:
 *   QT_LOGGING_RULES="geokeeper.*=true"                 # Enable all
 *   QT_LOGGING_RULES="geokeeper.*.debug=false"          # Disable debug only
 *   QT_LOGGING_RULES="geokeeper.core.engine.debug=true" # Trace the adjustment engine
 *
 * Severity Guidelines:
 *   qCDebug    - Development tracing (every adjustment pass, cache writes)
 *   qCInfo     - Significant operational events (settings restored/saved)
 *   qCWarning  - Recoverable errors, invalid input, unreadable settings
 *   qCCritical - System failures preventing normal operation
 */

namespace GeoKeeper {

// Core module - cache, geometry math, adjustment engine, screen identity
GEOKEEPER_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcCore)
GEOKEEPER_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcEngine)
GEOKEEPER_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcScreen)

// Configuration module - settings stores, engine configuration
GEOKEEPER_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcConfig)

// Platform module - Qt window host and monitor provider
GEOKEEPER_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcPlatform)

// Demo application
GEOKEEPER_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcDemo)

} // namespace GeoKeeper
