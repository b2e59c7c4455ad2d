// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "geokeeper_export.h"
#include "../core/interfaces.h"
#include <QString>

namespace GeoKeeper {

/**
 * @brief ISettingsStore writing one JSON file per window identity
 *
 * Files are named window_settings_<id>.json inside the store directory.
 * Writes go through QSaveFile so a crash mid-write leaves the previous
 * record intact.
 */
class GEOKEEPER_EXPORT JsonSettingsStore : public ISettingsStore
{
public:
    /**
     * @param directory Store directory; empty selects the application data location
     */
    explicit JsonSettingsStore(const QString& directory = QString());
    ~JsonSettingsStore() override;

    bool save(const QString& windowId, const WindowGeometrySettings& settings) override;
    std::optional<WindowGeometrySettings> load(const QString& windowId) override;

    QString directory() const
    {
        return m_directory;
    }

    QString filePath(const QString& windowId) const;

    /// Window id with every character outside [A-Za-z0-9._-] replaced by '_'
    static QString sanitizedFileId(const QString& windowId);

    static QString defaultDirectory();

private:
    bool ensureDirectory() const;

    QString m_directory;
};

} // namespace GeoKeeper
