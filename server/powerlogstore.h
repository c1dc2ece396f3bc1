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

#ifndef POWERLOGSTORE_H
#define POWERLOGSTORE_H

#include "powerlogs.h"
#include "meter.h"

#include <QObject>
#include <QDateTime>
#include <QSqlDatabase>
#include <QSqlRecord>

#include <functional>

/*! Durable storage for meters, readings and energy counter samples on top of SQLite (WAL mode).
 *  Each instance owns one connection and must only be used from the thread that created it.
 *  Several instances may be opened on the same file, e.g. one for the write path and one for maintenance.
 */
class PowerLogStore : public QObject
{
    Q_OBJECT
public:
    explicit PowerLogStore(const QString &databaseFile, const QString &connectionName, QObject *parent = nullptr);
    ~PowerLogStore() override;

    bool open();
    void close();
    bool isOpen() const;

    QString databaseFile() const;

    // Meters
    bool upsertMeter(const Meter &meter);
    bool removeMeter(const QString &meterId);
    bool meterExists(const QString &meterId) const;
    Meters meters() const;
    Meter meter(const QString &meterId) const;

    // Write path
    bool appendReading(const PowerReading &reading);
    bool appendEnergyReading(const EnergyReading &reading);

    // Read path. Ranges are inclusive on both ends.
    PowerReading latestReading(const QString &meterId) const;
    EnergyReading latestEnergyReading(const QString &meterId, const QString &phase) const;
    qint64 readingCount(const QString &meterId, const QDateTime &from, const QDateTime &to, bool *ok = nullptr) const;
    qint64 energyReadingCount(const QString &meterId, const QDateTime &from, const QDateTime &to, const QString &phase, bool *ok = nullptr) const;

    // Streams the matching rows into visitor without materializing them. A limit <= 0 means no limit.
    bool scanReadings(const QString &meterId, const QDateTime &from, const QDateTime &to, Qt::SortOrder order, int limit, const std::function<void(const PowerReading &reading)> &visitor) const;
    PowerReadings readings(const QString &meterId, const QDateTime &from, const QDateTime &to, Qt::SortOrder order = Qt::DescendingOrder, int limit = 0, bool *ok = nullptr) const;
    EnergyReadings energyReadings(const QString &meterId, const QDateTime &from, const QDateTime &to, const QString &phase, bool *ok = nullptr) const;
    QStringList energyPhases(const QString &meterId, const QDateTime &from, const QDateTime &to) const;
    MeterStatistics statistics(const QString &meterId, const QDateTime &from, const QDateTime &to) const;

    // Deletion
    int deleteReadings(const QString &meterId);
    int deleteOlderThan(const QDateTime &beforeTime);

    // Maintenance
    qint64 totalReadingCount() const;
    qint64 totalEnergyReadingCount() const;
    QDateTime oldestTimestamp() const;
    QDateTime newestTimestamp() const;
    qint64 databaseSize() const;
    qint64 logSize() const;
    bool checkpoint();
    bool vacuum();

    /*! Replaces every (meter, hour) group of readings older than beforeTime that holds more than one row
     *  with a single row carrying the hourly averages, and thins energy samples in the same range down to
     *  the first and last sample per (meter, phase, hour). Runs in one transaction.
     *  Returns the number of removed rows, or -1 on error.
     */
    int compactOlderThan(const QDateTime &beforeTime);

private:
    bool initDB();
    bool exec(const QString &statement);

    PowerReading queryResultToReading(const QSqlRecord &record) const;
    EnergyReading queryResultToEnergyReading(const QSqlRecord &record) const;
    Meter queryResultToMeter(const QSqlRecord &record) const;

private:
    QString m_databaseFile;
    QString m_connectionName;
    QSqlDatabase m_db;
};

#endif // POWERLOGSTORE_H
