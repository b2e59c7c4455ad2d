// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>
#include <QSizeF>

#include "core/geometrycache.h"

using namespace GeoKeeper;

/**
 * @brief Unit tests for the per-monitor preferred size cache
 */
class TestGeometryCache : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void test_unknownMonitor_returnsFallback()
    {
        GeometryCache cache;
        cache.setFallbackSize(QSizeF(800, 600));
        QCOMPARE(cache.get(QStringLiteral("DEL:U2722D:1")), QSizeF(800, 600));
        QVERIFY(!cache.contains(QStringLiteral("DEL:U2722D:1")));
    }

    void test_unknownMonitor_noFallback_isEmpty()
    {
        GeometryCache cache;
        QVERIFY(cache.get(QStringLiteral("any")).isEmpty());
    }

    void test_setThenGet_lastWriteWins()
    {
        GeometryCache cache;
        cache.set(QStringLiteral("A"), QSizeF(1000, 700));
        cache.set(QStringLiteral("A"), QSizeF(1100, 750));
        QCOMPARE(cache.get(QStringLiteral("A")), QSizeF(1100, 750));
        QCOMPARE(cache.count(), 1);
    }

    void test_emptyIdentity_ignored()
    {
        GeometryCache cache;
        cache.set(QString(), QSizeF(1000, 700));
        QCOMPARE(cache.count(), 0);
    }

    void test_replace_dropsOldEntries()
    {
        GeometryCache cache;
        cache.set(QStringLiteral("A"), QSizeF(1000, 700));

        QHash<QString, QSizeF> restored;
        restored.insert(QStringLiteral("B"), QSizeF(1200, 900));
        cache.replace(restored);

        QVERIFY(!cache.contains(QStringLiteral("A")));
        QCOMPARE(cache.get(QStringLiteral("B")), QSizeF(1200, 900));
        QCOMPARE(cache.entries(), restored);
    }
};

QTEST_GUILESS_MAIN(TestGeometryCache)
#include "test_geometry_cache.moc"
