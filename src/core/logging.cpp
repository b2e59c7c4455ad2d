// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging.h"

namespace GeoKeeper {

// Core module categories
Q_LOGGING_CATEGORY(lcCore, "geokeeper.core", QtInfoMsg)
Q_LOGGING_CATEGORY(lcEngine, "geokeeper.core.engine", QtInfoMsg)
Q_LOGGING_CATEGORY(lcScreen, "geokeeper.core.screen", QtInfoMsg)

// Configuration module categories
Q_LOGGING_CATEGORY(lcConfig, "geokeeper.config", QtInfoMsg)

// Platform module categories
Q_LOGGING_CATEGORY(lcPlatform, "geokeeper.platform", QtInfoMsg)

// Demo application categories
Q_LOGGING_CATEGORY(lcDemo, "geokeeper.demo", QtInfoMsg)

} // namespace GeoKeeper
