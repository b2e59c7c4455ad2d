// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "geokeeper_export.h"
#include "../core/interfaces.h"
#include <KSharedConfig>

namespace GeoKeeper {

/**
 * @brief ISettingsStore keeping one [Window-<id>] group per window in a KConfig file
 */
class GEOKEEPER_EXPORT KConfigSettingsStore : public ISettingsStore
{
public:
    /**
     * @param config Config to use; null opens geokeeperrc
     */
    explicit KConfigSettingsStore(KSharedConfigPtr config = KSharedConfigPtr());
    ~KConfigSettingsStore() override;

    bool save(const QString& windowId, const WindowGeometrySettings& settings) override;
    std::optional<WindowGeometrySettings> load(const QString& windowId) override;

    static QString groupName(const QString& windowId);

private:
    KSharedConfigPtr m_config;
};

} // namespace GeoKeeper
