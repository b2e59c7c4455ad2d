// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "demowindow.h"
#include "../config/engineconfig.h"
#include "../config/jsonsettingsstore.h"
#include "../config/kconfigsettingsstore.h"
#include "../core/geometryengine.h"
#include "../core/logging.h"
#include "../platform/qtmonitorinfoprovider.h"
#include "../platform/qtwindowhost.h"
#include "../platform/screenidentity.h"
#include <KAboutData>
#include <KLocalizedString>
#include <QCommandLineParser>
#include <QGuiApplication>
#include <memory>

using namespace GeoKeeper;

int main(int argc, char* argv[])
{
    QGuiApplication app(argc, argv);

    // Set translation domain BEFORE any i18n() calls
    KLocalizedString::setApplicationDomain("geokeeper");

    KAboutData aboutData(QStringLiteral("geokeeper-demo"), i18n("GeoKeeper Demo"), QStringLiteral("1.0.0"),
                         i18n("Keeps a window's size right across monitors with different DPI"),
                         KAboutLicense::GPL_V3, i18n("© 2026 fuddlesworth"));
    aboutData.addAuthor(i18n("fuddlesworth"));
    KAboutData::setApplicationData(aboutData);

    QCommandLineParser parser;
    aboutData.setupCommandLine(&parser);

    QCommandLineOption windowIdOption(QStringLiteral("window-id"), i18n("Identity the geometry is saved under"),
                                      i18n("id"), QStringLiteral("demo"));
    QCommandLineOption backendOption(QStringLiteral("backend"), i18n("Settings backend: json or kconfig"),
                                     i18n("backend"));
    QCommandLineOption storageDirOption(QStringLiteral("storage-dir"), i18n("Directory of the JSON settings files"),
                                        i18n("directory"));
    QCommandLineOption configOption(QStringLiteral("config"), i18n("Configuration file to use instead of geokeeperrc"),
                                    i18n("file"));
    parser.addOption(windowIdOption);
    parser.addOption(backendOption);
    parser.addOption(storageDirOption);
    parser.addOption(configOption);

    parser.process(app);
    aboutData.processCommandLine(&parser);

    KSharedConfigPtr config;
    if (parser.isSet(configOption)) {
        config = KSharedConfig::openConfig(parser.value(configOption), KConfig::SimpleConfig);
    }

    const EngineConfig engineConfig = EngineConfig::load(config);
    StorageConfig storageConfig = StorageConfig::load(config);

    if (parser.isSet(backendOption)) {
        bool ok = false;
        storageConfig.backend = StorageConfig::backendFromString(parser.value(backendOption), &ok);
        if (!ok) {
            qCCritical(lcDemo) << "Unknown backend" << parser.value(backendOption);
            return 1;
        }
    }
    if (parser.isSet(storageDirOption)) {
        storageConfig.directory = parser.value(storageDirOption);
    }

    std::unique_ptr<ISettingsStore> store;
    if (storageConfig.backend == StorageConfig::Backend::KConfig) {
        store = std::make_unique<KConfigSettingsStore>(config);
    } else {
        store = std::make_unique<JsonSettingsStore>(storageConfig.directory);
    }

    ScreenIdentity::warnDuplicateIdentities();

    DemoWindow window;
    window.resize(800, 600);

    QtMonitorInfoProvider monitors;
    QtWindowHost host(&window);
    GeometryEngine engine(&host, &monitors, store.get(), parser.value(windowIdOption), engineConfig);
    window.setEngine(&engine);

    window.show();
    qCInfo(lcDemo) << "Started with window id" << engine.windowId();

    return app.exec();
}
