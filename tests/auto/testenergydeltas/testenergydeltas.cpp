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
#include <QtMath>

#include "powerlogstore.h"
#include "powerlogger.h"
#include "energydeltacalculator.h"

class TestEnergyDeltas : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void valueAtClampsAndInterpolates();
    void fourMinuteSeries();
    void resetDropsOneBucket_data();
    void resetDropsOneBucket();
    void strategiesAgreeOnDenseSeries();
    void strategyFollowsResolution();
    void allPhasesAreSummed();
    void resetInOnePhaseDropsTheSum();
    void noneReturnsTotalsOnly();
    void autoUsesEnergyCount();

private:
    EnergyReadings series(const QString &phase, const QList<double> &values, int intervalSecs) const;

    QTemporaryDir *m_dir = nullptr;
    PowerLogStore *m_store = nullptr;
    PowerLogger *m_logger = nullptr;
    QDateTime m_base = QDateTime(QDate(2024, 2, 1), QTime(0, 0), QTimeZone::utc());
};

void TestEnergyDeltas::init()
{
    m_dir = new QTemporaryDir();
    QVERIFY(m_dir->isValid());
    m_store = new PowerLogStore(m_dir->filePath("powermonitor.sqlite"), "energystore");
    QVERIFY(m_store->open());
    QVERIFY(m_store->upsertMeter(Meter("M1", "10.0.0.1")));

    QueryConfig config;
    config.targetPoints = 50;
    m_logger = new PowerLogger(m_store, config);
    m_logger->setTimeZone(QTimeZone::utc());
}

void TestEnergyDeltas::cleanup()
{
    delete m_logger;
    m_logger = nullptr;
    delete m_store;
    m_store = nullptr;
    delete m_dir;
    m_dir = nullptr;
}

EnergyReadings TestEnergyDeltas::series(const QString &phase, const QList<double> &values, int intervalSecs) const
{
    EnergyReadings readings;
    for (int i = 0; i < values.count(); i++) {
        readings.append(EnergyReading(m_base.addSecs(static_cast<qint64>(i) * intervalSecs), "M1", phase, values.at(i)));
    }
    return readings;
}

void TestEnergyDeltas::valueAtClampsAndInterpolates()
{
    // Unsorted on purpose
    EnergyReadings readings;
    readings.append(EnergyReading(m_base.addSecs(20), "M1", "A", 4));
    readings.append(EnergyReading(m_base.addSecs(10), "M1", "A", 2));

    EnergyDeltaCalculator calculator(readings);
    qint64 base = m_base.toMSecsSinceEpoch();
    QCOMPARE(calculator.sampleCount(), 2);
    QCOMPARE(calculator.valueAt(base), 2.0);
    QCOMPARE(calculator.valueAt(base + 10000), 2.0);
    QCOMPARE(calculator.valueAt(base + 15000), 3.0);
    QCOMPARE(calculator.valueAt(base + 20000), 4.0);
    QCOMPARE(calculator.valueAt(base + 99000), 4.0);
    QCOMPARE(calculator.rawTotal(), 2.0);
}

void TestEnergyDeltas::fourMinuteSeries()
{
    QList<double> values = QList<double>() << 0 << 1 << 2 << 3;
    foreach (const EnergyReading &reading, series("A", values, 60)) {
        QVERIFY(m_store->appendEnergyReading(reading));
    }

    EnergyResult result = m_logger->historicalEnergy("M1", m_base, m_base.addSecs(180), "A", Resolution::fromString("5min"));
    QCOMPARE(result.error, PowerLogs::QueryErrorNoError);
    QCOMPARE(result.resolution.toString(), QString("5min"));
    QCOMPARE(result.rawCount, qint64(4));
    QCOMPARE(result.rawTotal, 3.0);
    QCOMPARE(result.buckets.count(), 1);
    QCOMPARE(result.buckets.first().timestamp(), m_base);
    QVERIFY(qAbs(result.buckets.first().energyKwh() - 3.0) < 1e-9);

    // First/last on the same series gives the same delta
    EnergyDeltaCalculator calculator(series("A", values, 60));
    QMap<qint64, double> deltas = calculator.deltas(Resolution::fromString("5min"), EnergyDeltaCalculator::StrategyFirstLast, m_base, m_base.addSecs(180), QTimeZone::utc());
    QCOMPARE(deltas.count(), 1);
    QVERIFY(qAbs(deltas.first() - 3.0) < 1e-9);
}

void TestEnergyDeltas::resetDropsOneBucket_data()
{
    QTest::addColumn<int>("strategy");
    QTest::newRow("interpolated") << static_cast<int>(EnergyDeltaCalculator::StrategyInterpolated);
    QTest::newRow("first/last") << static_cast<int>(EnergyDeltaCalculator::StrategyFirstLast);
}

void TestEnergyDeltas::resetDropsOneBucket()
{
    QFETCH(int, strategy);

    // One sample per minute for 30 minutes, the counter restarts from 0 at minute 12
    QList<double> steady;
    QList<double> withReset;
    for (int minute = 0; minute < 30; minute++) {
        steady.append(100 + minute);
        withReset.append(minute < 12 ? 100 + minute : minute - 12);
    }

    Resolution resolution = Resolution::fromString("5min");
    QDateTime to = m_base.addSecs(29 * 60);

    EnergyDeltaCalculator steadyCalculator(series("A", steady, 60));
    QMap<qint64, double> steadyDeltas = steadyCalculator.deltas(resolution, static_cast<EnergyDeltaCalculator::Strategy>(strategy), m_base, to, QTimeZone::utc());

    EnergyDeltaCalculator resetCalculator(series("A", withReset, 60));
    QSet<qint64> resets;
    QMap<qint64, double> resetDeltas = resetCalculator.deltas(resolution, static_cast<EnergyDeltaCalculator::Strategy>(strategy), m_base, to, QTimeZone::utc(), &resets);

    QCOMPARE(resetDeltas.count(), steadyDeltas.count() - 1);
    qint64 resetBucket = m_base.addSecs(10 * 60).toMSecsSinceEpoch();
    QVERIFY(!resetDeltas.contains(resetBucket));
    QVERIFY(steadyDeltas.contains(resetBucket));
    QCOMPARE(resets, QSet<qint64>() << resetBucket);
    foreach (double delta, resetDeltas) {
        QVERIFY(delta >= 0);
    }

    // The raw total is not filtered and shows the reset
    QVERIFY(resetCalculator.rawTotal() < 0);
}

void TestEnergyDeltas::strategiesAgreeOnDenseSeries()
{
    // One sample per second for three hours, the rate varies slowly
    EnergyReadings readings;
    for (int second = 0; second <= 3 * 3600; second++) {
        double kwh = 0.001 * second + 0.5 * qSin(second / 600.0);
        readings.append(EnergyReading(m_base.addSecs(second), "M1", "A", kwh));
    }
    EnergyDeltaCalculator calculator(readings);

    QDateTime to = m_base.addSecs(3 * 3600);
    Resolution resolution = Resolution::fromString("1hour");
    QMap<qint64, double> interpolated = calculator.deltas(resolution, EnergyDeltaCalculator::StrategyInterpolated, m_base, to, QTimeZone::utc());
    QMap<qint64, double> firstLast = calculator.deltas(resolution, EnergyDeltaCalculator::StrategyFirstLast, m_base, to, QTimeZone::utc());

    QCOMPARE(interpolated.keys(), firstLast.keys());
    QCOMPARE(interpolated.count(), 3);
    foreach (qint64 bucket, interpolated.keys()) {
        double a = interpolated.value(bucket);
        double b = firstLast.value(bucket);
        QVERIFY2(qAbs(a - b) <= 1e-3 * qMax(qAbs(a), qAbs(b)), qPrintable(QString("%1 vs %2").arg(a).arg(b)));
    }
}

void TestEnergyDeltas::strategyFollowsResolution()
{
    QCOMPARE(EnergyDeltaCalculator::strategyFor(Resolution::fromString("1min")), EnergyDeltaCalculator::StrategyInterpolated);
    QCOMPARE(EnergyDeltaCalculator::strategyFor(Resolution::fromString("30min")), EnergyDeltaCalculator::StrategyInterpolated);
    QCOMPARE(EnergyDeltaCalculator::strategyFor(Resolution::fromString("60min")), EnergyDeltaCalculator::StrategyFirstLast);
    QCOMPARE(EnergyDeltaCalculator::strategyFor(Resolution::fromString("1hour")), EnergyDeltaCalculator::StrategyFirstLast);
    QCOMPARE(EnergyDeltaCalculator::strategyFor(Resolution::fromString("1month")), EnergyDeltaCalculator::StrategyFirstLast);
}

void TestEnergyDeltas::allPhasesAreSummed()
{
    // Every 15 minutes for two hours. Phase A counts 1 kWh per hour, phase B 2 kWh per hour
    for (int quarter = 0; quarter <= 8; quarter++) {
        QDateTime timestamp = m_base.addSecs(quarter * 900);
        QVERIFY(m_store->appendEnergyReading(EnergyReading(timestamp, "M1", "A", quarter * 0.25)));
        QVERIFY(m_store->appendEnergyReading(EnergyReading(timestamp, "M1", "B", quarter * 0.5)));
    }

    EnergyResult result = m_logger->historicalEnergy("M1", m_base, m_base.addSecs(7200), "ALL", Resolution::fromString("1hour"));
    QCOMPARE(result.error, PowerLogs::QueryErrorNoError);
    QCOMPARE(result.rawCount, qint64(18));
    QVERIFY(qAbs(result.rawTotal - 6.0) < 1e-9);
    QCOMPARE(result.buckets.count(), 2);

    // Newest first. The sample at the range end is part of the last bucket.
    QCOMPARE(result.buckets.at(0).timestamp(), m_base.addSecs(3600));
    QVERIFY(qAbs(result.buckets.at(0).energyKwh() - 3.0) < 1e-9);
    QCOMPARE(result.buckets.at(1).timestamp(), m_base);
    QVERIFY(qAbs(result.buckets.at(1).energyKwh() - 2.25) < 1e-9);

    EnergyResult phaseB = m_logger->historicalEnergy("M1", m_base, m_base.addSecs(7200), "B", Resolution::fromString("1hour"));
    QCOMPARE(phaseB.rawCount, qint64(9));
    QVERIFY(qAbs(phaseB.buckets.at(0).energyKwh() - 2.0) < 1e-9);
}

void TestEnergyDeltas::resetInOnePhaseDropsTheSum()
{
    for (int quarter = 0; quarter <= 8; quarter++) {
        QDateTime timestamp = m_base.addSecs(quarter * 900);
        QVERIFY(m_store->appendEnergyReading(EnergyReading(timestamp, "M1", "A", quarter * 0.25)));
        // Phase B restarts in the second hour
        double b = quarter < 6 ? 10 + quarter * 0.5 : (quarter - 6) * 0.5;
        QVERIFY(m_store->appendEnergyReading(EnergyReading(timestamp, "M1", "B", b)));
    }

    EnergyResult result = m_logger->historicalEnergy("M1", m_base, m_base.addSecs(7200), "ALL", Resolution::fromString("1hour"));
    QCOMPARE(result.buckets.count(), 1);
    QCOMPARE(result.buckets.first().timestamp(), m_base);
    QVERIFY(result.rawTotal < 0);
}

void TestEnergyDeltas::noneReturnsTotalsOnly()
{
    QList<double> values = QList<double>() << 5 << 6 << 8;
    foreach (const EnergyReading &reading, series("A", values, 60)) {
        QVERIFY(m_store->appendEnergyReading(reading));
    }

    EnergyResult result = m_logger->historicalEnergy("M1", m_base, m_base.addSecs(600), "A", Resolution::fromString("none"));
    QCOMPARE(result.error, PowerLogs::QueryErrorNoError);
    QVERIFY(result.buckets.isEmpty());
    QCOMPARE(result.rawCount, qint64(3));
    QCOMPARE(result.rawTotal, 3.0);

    EnergyReadings raw = m_logger->energyReadings("M1", m_base, m_base.addSecs(600), "A");
    QCOMPARE(raw.count(), 3);
    QCOMPARE(raw.first().totalKwh(), 5.0);
}

void TestEnergyDeltas::autoUsesEnergyCount()
{
    // 600 samples, one per minute. No instantaneous readings at all.
    for (int minute = 0; minute < 600; minute++) {
        QVERIFY(m_store->appendEnergyReading(EnergyReading(m_base.addSecs(minute * 60), "M1", "A", minute * 0.01)));
    }

    QDateTime to = m_base.addSecs(599 * 60);
    EnergyResult result = m_logger->historicalEnergy("M1", m_base, to, "A", Resolution::fromString("auto"));
    QCOMPARE(result.error, PowerLogs::QueryErrorNoError);
    QCOMPARE(result.rawCount, qint64(600));
    QCOMPARE(result.resolution.toString(), QString("15min"));
    QVERIFY(!result.buckets.isEmpty());
    QVERIFY(result.buckets.count() <= 50);
    for (int i = 0; i < result.buckets.count(); i++) {
        QVERIFY(result.buckets.at(i).energyKwh() >= 0);
        QVERIFY(result.buckets.at(i).timestamp() >= m_base && result.buckets.at(i).timestamp() < to);
        if (i > 0) {
            QVERIFY(result.buckets.at(i).timestamp() < result.buckets.at(i - 1).timestamp());
        }
    }
}

QTEST_GUILESS_MAIN(TestEnergyDeltas)
#include "testenergydeltas.moc"
