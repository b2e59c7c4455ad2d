// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "geokeeper_export.h"
#include <QString>

class QScreen;

namespace GeoKeeper {

/**
 * @brief Stable identity of physical monitors
 *
 * QScreen pointers and connector names ("DP-2") are reassigned across
 * reboots and hot-plug. The identity built here follows the monitor itself:
 * "manufacturer:model:serial" from EDID, "manufacturer:model" when no serial
 * is known, or the connector name for virtual displays and embedded panels
 * without EDID data.
 *
 * Two physically identical monitors with identical EDID data (including the
 * header serial) get the same identity and therefore share remembered sizes.
 *
 * Must only be used from the GUI thread.
 */
namespace ScreenIdentity {

/**
 * @brief Stable identifier for a screen
 * @return Identifier, or empty for a null screen
 */
GEOKEEPER_EXPORT QString identify(const QScreen* screen);

/**
 * @brief Build an identifier from its parts
 *
 * Pure function behind identify(); exposed for testing.
 */
GEOKEEPER_EXPORT QString compose(const QString& manufacturer, const QString& model, const QString& serial,
                                 const QString& connectorName);

/**
 * @brief Parse the header serial of a raw EDID blob
 * @param edid At least the first 16 bytes of the EDID
 * @return Serial (little-endian uint32 at bytes 12-15) as decimal string,
 *         or empty if the magic header is wrong or the serial is zero
 */
GEOKEEPER_EXPORT QString parseEdidHeaderSerial(const QByteArray& edid);

/**
 * @brief EDID header serial of a connector, read from sysfs and cached
 *
 * Looks up /sys/class/drm/card*-<connector>/edid. A connector whose EDID
 * cannot be read is retried a few times (boot-time races) and then cached
 * as empty.
 */
GEOKEEPER_EXPORT QString edidHeaderSerial(const QString& connectorName);

/**
 * @brief Forget cached serials (call when a screen is removed)
 * @param connectorName Connector to forget, or empty for all
 */
GEOKEEPER_EXPORT void invalidateCache(const QString& connectorName = QString());

/**
 * @brief Log a warning for connected screens sharing one identifier
 */
GEOKEEPER_EXPORT void warnDuplicateIdentities();

} // namespace ScreenIdentity

} // namespace GeoKeeper
