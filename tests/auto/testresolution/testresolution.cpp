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

#include "resolution.h"

class TestResolution : public QObject
{
    Q_OBJECT

private slots:
    void parse_data();
    void parse();

    void select_data();
    void select();

    void ladderIsSorted();

    void bucketStart_data();
    void bucketStart();

    void calendarBuckets();
};

void TestResolution::parse_data()
{
    QTest::addColumn<QString>("name");
    QTest::addColumn<bool>("valid");
    QTest::addColumn<int>("unit");
    QTest::addColumn<int>("count");

    QTest::newRow("none") << "none" << true << static_cast<int>(Resolution::UnitNone) << 1;
    QTest::newRow("auto") << "auto" << true << static_cast<int>(Resolution::UnitAuto) << 1;
    QTest::newRow("5min") << "5min" << true << static_cast<int>(Resolution::UnitMinute) << 5;
    QTest::newRow("12hour") << "12hour" << true << static_cast<int>(Resolution::UnitHour) << 12;
    QTest::newRow("2day") << "2day" << true << static_cast<int>(Resolution::UnitDay) << 2;
    QTest::newRow("1week") << "1week" << true << static_cast<int>(Resolution::UnitWeek) << 1;
    QTest::newRow("1month") << "1month" << true << static_cast<int>(Resolution::UnitMonth) << 1;
    QTest::newRow("upper case") << "15MIN" << true << static_cast<int>(Resolution::UnitMinute) << 15;
    QTest::newRow("zero") << "0min" << false << 0 << 0;
    QTest::newRow("2week") << "2week" << false << 0 << 0;
    QTest::newRow("garbage") << "fast" << false << 0 << 0;
    QTest::newRow("empty") << "" << false << 0 << 0;
}

void TestResolution::parse()
{
    QFETCH(QString, name);
    QFETCH(bool, valid);
    QFETCH(int, unit);
    QFETCH(int, count);

    Resolution resolution = Resolution::fromString(name);
    QCOMPARE(resolution.isValid(), valid);
    if (valid) {
        QCOMPARE(static_cast<int>(resolution.unit()), unit);
        QCOMPARE(resolution.count(), count);
        QCOMPARE(Resolution::fromString(resolution.toString()), resolution);
    }
}

void TestResolution::select_data()
{
    QTest::addColumn<qint64>("count");
    QTest::addColumn<qint64>("spanSeconds");
    QTest::addColumn<QString>("expected");

    QTest::newRow("fits") << qint64(10000) << qint64(365 * 86400) << "none";
    QTest::newRow("one day at 1s") << qint64(86400) << qint64(86400) << "1min";
    QTest::newRow("one week at 1s") << qint64(604800) << qint64(604800) << "2min";
    QTest::newRow("one month at 1s") << qint64(2592000) << qint64(2592000) << "5min";
    QTest::newRow("one year at 1s") << qint64(31536000) << qint64(31536000) << "1hour";
    QTest::newRow("ten years") << qint64(315360000) << qint64(315360000) << "12hour";
    QTest::newRow("beyond the ladder") << qint64(1000000000) << qint64(1000000000000ll) << "1month";
}

void TestResolution::select()
{
    QFETCH(qint64, count);
    QFETCH(qint64, spanSeconds);
    QFETCH(QString, expected);

    QCOMPARE(Resolution::select(count, spanSeconds, 10000).toString(), expected);
}

void TestResolution::ladderIsSorted()
{
    QList<Resolution> ladder = Resolution::ladder();
    QCOMPARE(ladder.count(), 16);
    for (int i = 1; i < ladder.count(); i++) {
        QVERIFY(ladder.at(i).widthMinutes() > ladder.at(i - 1).widthMinutes());
        QVERIFY(ladder.at(i).isBucketed());
    }
    QCOMPARE(ladder.first().toString(), QString("1min"));
    QCOMPARE(ladder.last().toString(), QString("1month"));
}

void TestResolution::bucketStart_data()
{
    QTest::addColumn<QString>("resolution");
    QTest::addColumn<QDateTime>("time");
    QTest::addColumn<QDateTime>("start");
    QTest::addColumn<QDateTime>("next");

    QTimeZone utc = QTimeZone::utc();
    QTest::newRow("5min") << "5min" << QDateTime(QDate(2024, 3, 10), QTime(10, 7, 30), utc)
                          << QDateTime(QDate(2024, 3, 10), QTime(10, 5), utc) << QDateTime(QDate(2024, 3, 10), QTime(10, 10), utc);
    QTest::newRow("on boundary") << "15min" << QDateTime(QDate(2024, 3, 10), QTime(10, 15), utc)
                                 << QDateTime(QDate(2024, 3, 10), QTime(10, 15), utc) << QDateTime(QDate(2024, 3, 10), QTime(10, 30), utc);
    QTest::newRow("3hour") << "3hour" << QDateTime(QDate(2024, 3, 10), QTime(10, 59), utc)
                           << QDateTime(QDate(2024, 3, 10), QTime(9, 0), utc) << QDateTime(QDate(2024, 3, 10), QTime(12, 0), utc);
    QTest::newRow("1day") << "1day" << QDateTime(QDate(2024, 3, 10), QTime(23, 59), utc)
                          << QDateTime(QDate(2024, 3, 10), QTime(0, 0), utc) << QDateTime(QDate(2024, 3, 11), QTime(0, 0), utc);
    // 2024-03-10 is a Sunday
    QTest::newRow("1week from sunday") << "1week" << QDateTime(QDate(2024, 3, 10), QTime(12, 0), utc)
                                       << QDateTime(QDate(2024, 3, 10), QTime(0, 0), utc) << QDateTime(QDate(2024, 3, 17), QTime(0, 0), utc);
    QTest::newRow("1week from saturday") << "1week" << QDateTime(QDate(2024, 3, 16), QTime(12, 0), utc)
                                         << QDateTime(QDate(2024, 3, 10), QTime(0, 0), utc) << QDateTime(QDate(2024, 3, 17), QTime(0, 0), utc);
    QTest::newRow("1month february") << "1month" << QDateTime(QDate(2024, 2, 29), QTime(18, 0), utc)
                                     << QDateTime(QDate(2024, 2, 1), QTime(0, 0), utc) << QDateTime(QDate(2024, 3, 1), QTime(0, 0), utc);
    QTest::newRow("1month december") << "1month" << QDateTime(QDate(2023, 12, 31), QTime(23, 0), utc)
                                     << QDateTime(QDate(2023, 12, 1), QTime(0, 0), utc) << QDateTime(QDate(2024, 1, 1), QTime(0, 0), utc);
}

void TestResolution::bucketStart()
{
    QFETCH(QString, resolution);
    QFETCH(QDateTime, time);
    QFETCH(QDateTime, start);
    QFETCH(QDateTime, next);

    Resolution res = Resolution::fromString(resolution);
    QDateTime bucket = res.bucketStart(time, QTimeZone::utc());
    QCOMPARE(bucket.toMSecsSinceEpoch(), start.toMSecsSinceEpoch());
    QCOMPARE(res.nextBucketStart(bucket, QTimeZone::utc()).toMSecsSinceEpoch(), next.toMSecsSinceEpoch());
}

void TestResolution::calendarBuckets()
{
    // Day buckets follow local midnight, also across a DST switch (Europe/Vienna, 2024-03-31)
    QTimeZone vienna("Europe/Vienna");
    if (!vienna.isValid()) {
        QSKIP("Time zone data not available");
    }
    Resolution day = Resolution::fromString("1day");
    QDateTime start = day.bucketStart(QDateTime(QDate(2024, 3, 31), QTime(15, 0), vienna), vienna);
    QCOMPARE(start, QDateTime(QDate(2024, 3, 31), QTime(0, 0), vienna));
    QDateTime next = day.nextBucketStart(start, vienna);
    QCOMPARE(next, QDateTime(QDate(2024, 4, 1), QTime(0, 0), vienna));
    QCOMPARE(start.secsTo(next), qint64(23 * 3600));

    Resolution month = Resolution::fromString("1month");
    QDateTime monthStart = month.bucketStart(QDateTime(QDate(2024, 3, 31), QTime(23, 30), vienna), vienna);
    QCOMPARE(monthStart, QDateTime(QDate(2024, 3, 1), QTime(0, 0), vienna));
}

QTEST_GUILESS_MAIN(TestResolution)
#include "testresolution.moc"
