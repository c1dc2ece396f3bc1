// SPDX-License-Identifier: GPL-3.0-or-later

/* * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
*
* Copyright (C) 2013 - 2024, nymea GmbH
* Copyright (C) 2024 - 2025, chargebyte austria GmbH
*
* This file is part of powermonitor.
*
* powermonitor is free software: you can redistribute it and/or modify
* it under the terms of the GNU General Public License as published by
* the Free Software Foundation, either version 3 of the License, or
* (at your option) any later version.
*
* powermonitor is distributed in the hope that it will be useful,
* but WITHOUT ANY WARRANTY; without even the implied warranty of
* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
* GNU General Public License for more details.
*
* You should have received a copy of the GNU General Public License
* along with powermonitor. If not, see <https://www.gnu.org/licenses/>.
*
* * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * */

#include <QtTest>
#include <QTemporaryDir>
#include <QSqlDatabase>
#include <QSqlQuery>
#include <QThread>

#include "powerlogstore.h"
#include "retentionmanager.h"
#include "diskspaceinfo.h"

// Pretends every stored row takes a fixed amount of space on a small volume
class RowCountingDiskSpaceInfo : public DiskSpaceInfo
{
public:
    RowCountingDiskSpaceInfo(PowerLogStore *store, qint64 capacity, qint64 bytesPerRow):
        m_store(store), m_capacity(capacity), m_bytesPerRow(bytesPerRow) {}

    qint64 bytesTotal(const QString &path) const override {
        Q_UNUSED(path)
        return m_capacity;
    }
    qint64 bytesFree(const QString &path) const override {
        Q_UNUSED(path)
        qint64 rows = m_store->totalReadingCount() + m_store->totalEnergyReadingCount();
        return m_capacity - rows * m_bytesPerRow;
    }

private:
    PowerLogStore *m_store = nullptr;
    qint64 m_capacity = 0;
    qint64 m_bytesPerRow = 0;
};

class TestRetention : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void notInitialized();
    void compactionFreesEnoughSpace();
    void deletesOldestBatchesWhenCompactionIsNotEnough();
    void stopsWhenNothingIsLeft();
    void enforcesRetentionDays();
    void compactOldDataOnRequest();
    void vacuumOnRequest();
    void independentManagersOnOneDatabase();
    void readersNeverSeeHalfCompactedData();

private:
    // One reading per minute for the given number of hours starting at start
    void insertMinutely(const QString &meterId, const QDateTime &start, int hours);
    void insertDaily(const QString &meterId, const QList<int> &daysAgo, int rowsPerDay);

    QTemporaryDir *m_dir = nullptr;
    PowerLogStore *m_store = nullptr;
    QDateTime m_now;
};

void TestRetention::init()
{
    m_dir = new QTemporaryDir();
    QVERIFY(m_dir->isValid());
    m_store = new PowerLogStore(m_dir->filePath("powermonitor.sqlite"), "retentiontest");
    QVERIFY(m_store->open());
    QVERIFY(m_store->upsertMeter(Meter("M1", "10.0.0.1")));

    m_now = QDateTime::currentDateTimeUtc();
}

void TestRetention::cleanup()
{
    delete m_store;
    m_store = nullptr;
    delete m_dir;
    m_dir = nullptr;
}

void TestRetention::insertMinutely(const QString &meterId, const QDateTime &start, int hours)
{
    {
        QSqlDatabase db = QSqlDatabase::addDatabase("QSQLITE", "bulkinsert");
        db.setDatabaseName(m_store->databaseFile());
        QVERIFY(db.open());
        QVERIFY(db.transaction());
        QSqlQuery query(db);
        QVERIFY(query.prepare("INSERT INTO readings (timestamp, meterId, voltage, current, activePower, reactivePower, apparentPower, powerFactor, frequency) "
                              "VALUES (?, ?, 230, 1, ?, 0, ?, 1, 50);"));
        for (int minute = 0; minute < hours * 60; minute++) {
            double power = 100 + minute % 60;
            query.addBindValue(start.addSecs(minute * 60).toMSecsSinceEpoch());
            query.addBindValue(meterId);
            query.addBindValue(power);
            query.addBindValue(power);
            QVERIFY(query.exec());
        }
        query.finish();
        QVERIFY(db.commit());
        db.close();
    }
    QSqlDatabase::removeDatabase("bulkinsert");
}

void TestRetention::insertDaily(const QString &meterId, const QList<int> &daysAgo, int rowsPerDay)
{
    foreach (int days, daysAgo) {
        QDateTime day = m_now.addDays(-days);
        for (int i = 0; i < rowsPerDay; i++) {
            // Spread over separate hours so compaction has nothing to merge
            QVERIFY(m_store->appendReading(PowerReading(day.addSecs(-i * 3600), meterId, 230, 1, 230, 0, 230, 1, 50)));
        }
    }
}

void TestRetention::notInitialized()
{
    RowCountingDiskSpaceInfo disk(m_store, 1000, 1);
    RetentionManager manager(m_store->databaseFile(), RetentionConfig(), &disk);

    QSignalSpy maintenanceSpy(&manager, &RetentionManager::maintenanceFinished);
    QSignalSpy compactionSpy(&manager, &RetentionManager::compactionFinished);
    QSignalSpy vacuumSpy(&manager, &RetentionManager::vacuumFinished);

    manager.runMaintenance();
    manager.compactOldData(90);
    manager.vacuum();

    QCOMPARE(maintenanceSpy.count(), 0);
    QCOMPARE(compactionSpy.count(), 1);
    QCOMPARE(compactionSpy.first().first().toInt(), -1);
    QCOMPARE(vacuumSpy.count(), 1);
    QCOMPARE(vacuumSpy.first().first().toBool(), false);
}

void TestRetention::compactionFreesEnoughSpace()
{
    QDateTime old = m_now.addDays(-130);
    old.setTime(QTime(old.time().hour(), 0));
    insertMinutely("M1", old, 3);
    insertDaily("M1", QList<int>() << 1, 10);
    QCOMPARE(m_store->totalReadingCount(), qint64(190));

    // 190 rows leave 50 bytes, 13 rows after compaction leave 935
    RowCountingDiskSpaceInfo disk(m_store, 1000, 5);
    RetentionConfig config;
    config.minFreeSpace = 500;
    config.safetyMargin = 100;
    RetentionManager manager(m_store->databaseFile(), config, &disk);
    manager.init();

    QSignalSpy maintenanceSpy(&manager, &RetentionManager::maintenanceFinished);
    QSignalSpy deletedSpy(&manager, &RetentionManager::rowsDeleted);
    manager.runMaintenance();

    QCOMPARE(maintenanceSpy.count(), 1);
    QCOMPARE(deletedSpy.count(), 0);
    QCOMPARE(m_store->totalReadingCount(), qint64(13));
    QCOMPARE(m_store->readingCount("M1", old, old.addSecs(3 * 3600)), qint64(3));
    QCOMPARE(m_store->readingCount("M1", m_now.addDays(-2), m_now), qint64(10));

    // The hourly averages carry the mean of the hour
    PowerReadings hourly = m_store->readings("M1", old, old.addSecs(3599));
    QCOMPARE(hourly.count(), 1);
    QCOMPARE(hourly.first().timestamp(), old);
    QVERIFY(qAbs(hourly.first().activePower() - 129.5) < 1e-9);

    manager.shutdown();
}

void TestRetention::deletesOldestBatchesWhenCompactionIsNotEnough()
{
    // Nothing is old enough to be compacted
    insertDaily("M1", QList<int>() << 60 << 50 << 40 << 30 << 20, 20);
    QCOMPARE(m_store->totalReadingCount(), qint64(100));

    // 100 rows leave 500 bytes. The target is 600 + 100, reached at 60 rows.
    RowCountingDiskSpaceInfo disk(m_store, 1000, 5);
    RetentionConfig config;
    config.minFreeSpace = 600;
    config.safetyMargin = 100;
    config.deleteBatchDays = 15;
    RetentionManager manager(m_store->databaseFile(), config, &disk);
    manager.init();

    QSignalSpy deletedSpy(&manager, &RetentionManager::rowsDeleted);
    manager.runMaintenance();

    QCOMPARE(deletedSpy.count(), 1);
    QCOMPARE(deletedSpy.first().first().toInt(), 40);
    QCOMPARE(m_store->totalReadingCount(), qint64(60));
    QVERIFY(m_store->oldestTimestamp() > m_now.addDays(-42));
    QVERIFY(disk.bytesFree(m_store->databaseFile()) >= config.minFreeSpace + config.safetyMargin);

    manager.shutdown();
}

void TestRetention::stopsWhenNothingIsLeft()
{
    insertDaily("M1", QList<int>() << 10, 5);

    // Can never be satisfied
    RowCountingDiskSpaceInfo disk(m_store, 30, 5);
    RetentionConfig config;
    config.minFreeSpace = 100;
    config.safetyMargin = 100;
    RetentionManager manager(m_store->databaseFile(), config, &disk);
    manager.init();

    QSignalSpy maintenanceSpy(&manager, &RetentionManager::maintenanceFinished);
    manager.runMaintenance();

    QCOMPARE(maintenanceSpy.count(), 1);
    QCOMPARE(m_store->totalReadingCount(), qint64(0));
    QVERIFY(!m_store->oldestTimestamp().isValid());

    manager.shutdown();
}

void TestRetention::enforcesRetentionDays()
{
    insertDaily("M1", QList<int>() << 60 << 20, 10);
    QVERIFY(m_store->appendEnergyReading(EnergyReading(m_now.addDays(-60), "M1", "A", 1)));
    QVERIFY(m_store->appendEnergyReading(EnergyReading(m_now.addDays(-20), "M1", "A", 2)));

    // Plenty of space
    RowCountingDiskSpaceInfo disk(m_store, 1000000, 1);
    RetentionConfig config;
    config.minFreeSpace = 1000;
    config.retentionDays = 30;
    RetentionManager manager(m_store->databaseFile(), config, &disk);
    manager.init();

    QSignalSpy deletedSpy(&manager, &RetentionManager::rowsDeleted);
    manager.runMaintenance();

    QCOMPARE(deletedSpy.count(), 1);
    QCOMPARE(deletedSpy.first().first().toInt(), 11);
    QCOMPARE(m_store->totalReadingCount(), qint64(10));
    QCOMPARE(m_store->totalEnergyReadingCount(), qint64(1));

    manager.shutdown();
}

void TestRetention::compactOldDataOnRequest()
{
    QDateTime old = m_now.addDays(-40);
    old.setTime(QTime(old.time().hour(), 0));
    insertMinutely("M1", old, 2);
    for (int i = 0; i < 6; i++) {
        QVERIFY(m_store->appendEnergyReading(EnergyReading(old.addSecs(i * 600), "M1", "A", i)));
    }

    RowCountingDiskSpaceInfo disk(m_store, 1000000, 1);
    RetentionManager manager(m_store->databaseFile(), RetentionConfig(), &disk);
    manager.init();

    QSignalSpy compactionSpy(&manager, &RetentionManager::compactionFinished);

    // Too young for a 90 day cutoff
    manager.compactOldData(90);
    QCOMPARE(compactionSpy.count(), 1);
    QCOMPARE(compactionSpy.at(0).first().toInt(), 0);

    // 120 readings replaced by 2 averages, 6 energy samples thinned to first and last
    manager.compactOldData(30);
    QCOMPARE(compactionSpy.count(), 2);
    QCOMPARE(compactionSpy.at(1).first().toInt(), 124);
    QCOMPARE(m_store->totalReadingCount(), qint64(2));
    EnergyReadings energy = m_store->energyReadings("M1", old, old.addSecs(3600), "A");
    QCOMPARE(energy.count(), 2);
    QCOMPARE(energy.first().totalKwh(), 0.0);
    QCOMPARE(energy.last().totalKwh(), 5.0);

    manager.shutdown();
}

void TestRetention::vacuumOnRequest()
{
    insertDaily("M1", QList<int>() << 1, 5);

    RowCountingDiskSpaceInfo disk(m_store, 1000000, 1);
    RetentionManager manager(m_store->databaseFile(), RetentionConfig(), &disk);
    manager.init();

    QSignalSpy vacuumSpy(&manager, &RetentionManager::vacuumFinished);
    manager.vacuum();
    QCOMPARE(vacuumSpy.count(), 1);
    QCOMPARE(vacuumSpy.first().first().toBool(), true);
    QCOMPARE(m_store->totalReadingCount(), qint64(5));

    manager.shutdown();
}

void TestRetention::independentManagersOnOneDatabase()
{
    insertDaily("M1", QList<int>() << 1, 5);

    RowCountingDiskSpaceInfo disk(m_store, 1000000, 1);
    RetentionManager *first = new RetentionManager(m_store->databaseFile(), RetentionConfig(), &disk);
    first->init();
    RetentionManager second(m_store->databaseFile(), RetentionConfig(), &disk);
    second.init();

    QSignalSpy firstSpy(first, &RetentionManager::vacuumFinished);
    QSignalSpy secondSpy(&second, &RetentionManager::vacuumFinished);
    first->vacuum();
    second.vacuum();
    QCOMPARE(firstSpy.count(), 1);
    QCOMPARE(firstSpy.first().first().toBool(), true);
    QCOMPARE(secondSpy.count(), 1);
    QCOMPARE(secondSpy.first().first().toBool(), true);

    // Dropping one manager leaves the other one's connection alone
    first->shutdown();
    delete first;
    QSignalSpy compactionSpy(&second, &RetentionManager::compactionFinished);
    second.compactOldData(90);
    QCOMPARE(compactionSpy.count(), 1);
    QCOMPARE(compactionSpy.first().first().toInt(), 0);

    second.shutdown();
}

void TestRetention::readersNeverSeeHalfCompactedData()
{
    QDateTime old = m_now.addDays(-100);
    old.setTime(QTime(old.time().hour(), 0));
    insertMinutely("M1", old, 48);
    QDateTime windowEnd = old.addSecs(48 * 3600 - 1);
    QCOMPARE(m_store->readingCount("M1", old, windowEnd), qint64(48 * 60));

    // Without a disk space source the worker thread must not touch this thread's connection
    QThread thread;
    RetentionManager *manager = new RetentionManager(m_store->databaseFile(), RetentionConfig(), nullptr);
    manager->moveToThread(&thread);
    connect(&thread, &QThread::started, manager, &RetentionManager::init);

    bool finished = false;
    int removed = 0;
    connect(manager, &RetentionManager::compactionFinished, this, [&finished, &removed](int removedRows) {
        removed = removedRows;
        finished = true;
    });

    thread.start();
    QMetaObject::invokeMethod(manager, "compactOldData", Qt::QueuedConnection, Q_ARG(int, 90));

    QElapsedTimer timer;
    timer.start();
    int reads = 0;
    while (!finished && timer.elapsed() < 30000) {
        bool ok = false;
        qint64 count = m_store->readingCount("M1", old, windowEnd, &ok);
        if (ok) {
            QVERIFY2(count == 48 * 60 || count == 48, qPrintable(QString("Saw %1 rows").arg(count)));
            reads++;
        }
        QCoreApplication::processEvents();
    }

    QVERIFY(finished);
    QCOMPARE(removed, 48 * 60);
    QVERIFY(reads > 0);
    QCOMPARE(m_store->readingCount("M1", old, windowEnd), qint64(48));

    QMetaObject::invokeMethod(manager, "shutdown", Qt::BlockingQueuedConnection);
    thread.quit();
    thread.wait();
    delete manager;
}

QTEST_GUILESS_MAIN(TestRetention)
#include "testretention.moc"
