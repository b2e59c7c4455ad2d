// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "jsonsettingsstore.h"
#include "../core/logging.h"
#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QSaveFile>
#include <QStandardPaths>

namespace GeoKeeper {

JsonSettingsStore::JsonSettingsStore(const QString& directory)
    : m_directory(directory.isEmpty() ? defaultDirectory() : directory)
{
}

JsonSettingsStore::~JsonSettingsStore() = default;

QString JsonSettingsStore::defaultDirectory()
{
    return QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
}

QString JsonSettingsStore::sanitizedFileId(const QString& windowId)
{
    QString result = windowId;
    for (QChar& ch : result) {
        const bool allowed = (ch >= QLatin1Char('a') && ch <= QLatin1Char('z'))
            || (ch >= QLatin1Char('A') && ch <= QLatin1Char('Z')) || (ch >= QLatin1Char('0') && ch <= QLatin1Char('9'))
            || ch == QLatin1Char('.') || ch == QLatin1Char('_') || ch == QLatin1Char('-');
        if (!allowed) {
            ch = QLatin1Char('_');
        }
    }
    return result;
}

QString JsonSettingsStore::filePath(const QString& windowId) const
{
    return QDir(m_directory).absoluteFilePath(QStringLiteral("window_settings_%1.json").arg(sanitizedFileId(windowId)));
}

bool JsonSettingsStore::ensureDirectory() const
{
    QDir dir(m_directory);
    if (dir.exists()) {
        return true;
    }
    if (!dir.mkpath(QStringLiteral("."))) {
        qCWarning(lcConfig) << "Failed to create settings directory:" << m_directory;
        return false;
    }
    return true;
}

bool JsonSettingsStore::save(const QString& windowId, const WindowGeometrySettings& settings)
{
    if (windowId.isEmpty()) {
        qCWarning(lcConfig) << "Refusing to save geometry without a window id";
        return false;
    }
    if (!ensureDirectory()) {
        return false;
    }

    const QString path = filePath(windowId);
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        qCWarning(lcConfig) << "Failed to open settings file for writing:" << path << "Error:" << file.errorString();
        return false;
    }

    const QByteArray data = QJsonDocument(settings.toJson()).toJson(QJsonDocument::Indented);
    if (file.write(data) != data.size()) {
        qCWarning(lcConfig) << "Failed to write settings file:" << path << "Error:" << file.errorString();
        file.cancelWriting();
        return false;
    }

    if (!file.commit()) {
        qCWarning(lcConfig) << "Failed to commit settings file:" << path << "Error:" << file.errorString();
        return false;
    }

    qCDebug(lcConfig) << "Saved window settings to" << path;
    return true;
}

std::optional<WindowGeometrySettings> JsonSettingsStore::load(const QString& windowId)
{
    const QString path = filePath(windowId);
    QFile file(path);

    if (!file.exists()) {
        qCDebug(lcConfig) << "No settings file for" << windowId << "at" << path;
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        qCWarning(lcConfig) << "Failed to open settings file:" << path << "Error:" << file.errorString();
        return std::nullopt;
    }

    const QByteArray data = file.readAll();
    if (data.isEmpty()) {
        qCWarning(lcConfig) << "Settings file is empty:" << path;
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        qCWarning(lcConfig) << "Failed to parse settings file:" << path << "Error:" << parseError.errorString()
                            << "at offset" << parseError.offset;
        return std::nullopt;
    }

    if (!doc.isObject()) {
        qCWarning(lcConfig) << "Settings file does not contain an object:" << path;
        return std::nullopt;
    }

    return WindowGeometrySettings::fromJson(doc.object());
}

} // namespace GeoKeeper
