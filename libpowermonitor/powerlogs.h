// SPDX-License-Identifier: LGPL-3.0-or-later

/* * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
*
* Copyright (C) 2013 - 2024, nymea GmbH
* Copyright (C) 2024 - 2025, chargebyte austria GmbH
*
* This file is part of libpowermonitor.
*
* libpowermonitor is free software: you can redistribute it and/or
* modify it under the terms of the GNU Lesser General Public License
* as published by the Free Software Foundation, either version 3
* of the License, or (at your option) any later version.
*
* libpowermonitor is distributed in the hope that it will be useful,
* but WITHOUT ANY WARRANTY; without even the implied warranty of
* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
* GNU Lesser General Public License for more details.
*
* You should have received a copy of the GNU Lesser General Public License
* along with libpowermonitor. If not, see <https://www.gnu.org/licenses/>.
*
* * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * */

#ifndef POWERLOGS_H
#define POWERLOGS_H

#include <QObject>
#include <QDateTime>
#include <QVariant>

#include "resolution.h"

class PowerReading;
class PowerReadings;
class EnergyReading;
class EnergyReadings;
struct ReadingsResult;
struct EnergyResult;
struct MeterStatistics;
struct StoreStatistics;

class PowerLogs: public QObject
{
    Q_OBJECT
public:
    enum QueryError {
        QueryErrorNoError,
        QueryErrorUnknownMeter,
        QueryErrorInvalidTimeRange,
        QueryErrorInvalidResolution,
        QueryErrorStorage
    };
    Q_ENUM(QueryError)

    explicit PowerLogs(QObject *parent = nullptr);
    virtual ~PowerLogs() = default;

    /*! Returns the most recent reading for the given meter, or an invalid reading if there is none. */
    virtual PowerReading latestReading(const QString &meterId) const = 0;

    /*! Returns the most recent energy counter sample for the given meter and phase.
     *  If phase is "ALL" or empty, the most recent sample of any phase is returned.
     */
    virtual EnergyReading latestEnergyReading(const QString &meterId, const QString &phase = "ALL") const = 0;

    /*! Returns readings between from and to (both inclusive), newest first.
     *  With resolution "none" the raw rows are returned, capped at limit. With a bucketed resolution
     *  each row is the average of all readings in its bucket. "auto" picks the resolution from the
     *  row count in the range so that at most the configured target number of points is returned.
     *  A limit <= 0 applies the configured default limit.
     */
    virtual ReadingsResult historicalReadings(const QString &meterId, const QDateTime &from, const QDateTime &to, int limit, const Resolution &resolution) const = 0;

    /*! Returns the consumption per bucket calculated from the cumulative energy counters.
     *  Buckets where a counter reset was detected are left out. The rawTotal in the result is the
     *  difference between the last and the first sample in the range and can be negative if the
     *  counter has been reset in between.
     */
    virtual EnergyResult historicalEnergy(const QString &meterId, const QDateTime &from, const QDateTime &to, const QString &phase, const Resolution &resolution) const = 0;

    /*! Returns the raw energy counter samples in the given range, oldest first. */
    virtual EnergyReadings energyReadings(const QString &meterId, const QDateTime &from, const QDateTime &to, const QString &phase = "ALL") const = 0;

    virtual qint64 readingCount(const QString &meterId, const QDateTime &from, const QDateTime &to, QueryError *error = nullptr) const = 0;

    virtual MeterStatistics statistics(const QString &meterId, const QDateTime &from, const QDateTime &to) const = 0;

    virtual StoreStatistics storeStatistics() const = 0;

signals:
    void readingAdded(const PowerReading &reading);
    void energyReadingAdded(const EnergyReading &reading);
};


class PowerReading
{
    Q_GADGET
    Q_PROPERTY(QDateTime timestamp READ timestamp)
    Q_PROPERTY(QString meterId READ meterId)
    Q_PROPERTY(double voltage READ voltage)
    Q_PROPERTY(double current READ current)
    Q_PROPERTY(double activePower READ activePower)
    Q_PROPERTY(double reactivePower READ reactivePower)
    Q_PROPERTY(double apparentPower READ apparentPower)
    Q_PROPERTY(double powerFactor READ powerFactor)
    Q_PROPERTY(double frequency READ frequency)
public:
    PowerReading();
    PowerReading(const QDateTime &timestamp, const QString &meterId, double voltage, double current, double activePower, double reactivePower, double apparentPower, double powerFactor, double frequency);
    QDateTime timestamp() const;
    QString meterId() const;
    double voltage() const;
    double current() const;
    double activePower() const;
    double reactivePower() const;
    double apparentPower() const;
    double powerFactor() const;
    double frequency() const;

    bool isValid() const;

private:
    QDateTime m_timestamp;
    QString m_meterId;
    double m_voltage = 0;
    double m_current = 0;
    double m_activePower = 0;
    double m_reactivePower = 0;
    double m_apparentPower = 0;
    double m_powerFactor = 0;
    double m_frequency = 0;
};
Q_DECLARE_METATYPE(PowerReading)

class PowerReadings: public QList<PowerReading>
{
public:
    PowerReadings() = default;
    PowerReadings(const QList<PowerReading> &other): QList<PowerReading>(other) {}
};
Q_DECLARE_METATYPE(PowerReadings)

class EnergyReading
{
    Q_GADGET
    Q_PROPERTY(QDateTime timestamp READ timestamp)
    Q_PROPERTY(QString meterId READ meterId)
    Q_PROPERTY(QString phase READ phase)
    Q_PROPERTY(double totalKwh READ totalKwh)
public:
    EnergyReading();
    EnergyReading(const QDateTime &timestamp, const QString &meterId, const QString &phase, double totalKwh);
    QDateTime timestamp() const;
    QString meterId() const;
    QString phase() const;
    double totalKwh() const;

    bool isValid() const;

private:
    QDateTime m_timestamp;
    QString m_meterId;
    QString m_phase;
    double m_totalKwh = 0;
};
Q_DECLARE_METATYPE(EnergyReading)

class EnergyReadings: public QList<EnergyReading>
{
public:
    EnergyReadings() = default;
    EnergyReadings(const QList<EnergyReading> &other): QList<EnergyReading>(other) {}
};
Q_DECLARE_METATYPE(EnergyReadings)

class EnergyBucket
{
    Q_GADGET
    Q_PROPERTY(QDateTime timestamp READ timestamp)
    Q_PROPERTY(double energyKwh READ energyKwh)
public:
    EnergyBucket();
    EnergyBucket(const QDateTime &timestamp, double energyKwh);
    QDateTime timestamp() const;
    double energyKwh() const;

private:
    QDateTime m_timestamp;
    double m_energyKwh = 0;
};
Q_DECLARE_METATYPE(EnergyBucket)

class EnergyBuckets: public QList<EnergyBucket>
{
public:
    EnergyBuckets() = default;
    EnergyBuckets(const QList<EnergyBucket> &other): QList<EnergyBucket>(other) {}
};
Q_DECLARE_METATYPE(EnergyBuckets)

struct ReadingsResult
{
    PowerLogs::QueryError error = PowerLogs::QueryErrorNoError;
    PowerReadings readings;
    Resolution resolution;
    // Row count in range before aggregating. Only set (>= 0) when "auto" was requested.
    qint64 preAggregationCount = -1;
    qint64 elapsedMs = 0;
};

struct EnergyResult
{
    PowerLogs::QueryError error = PowerLogs::QueryErrorNoError;
    EnergyBuckets buckets;
    double rawTotal = 0;
    qint64 rawCount = 0;
    Resolution resolution;
    qint64 elapsedMs = 0;
};

struct MeterStatistics
{
    PowerLogs::QueryError error = PowerLogs::QueryErrorNoError;
    QString meterId;
    QDateTime from;
    QDateTime to;
    qint64 sampleCount = 0;
    double averageVoltage = 0;
    double minVoltage = 0;
    double maxVoltage = 0;
    double averageCurrent = 0;
    double maxCurrent = 0;
    double averagePower = 0;
    double maxPower = 0;
    // Assumes one sample per second
    double totalEnergyKwh = 0;
};

struct StoreStatistics
{
    bool valid = false;
    qint64 sizeBytes = 0;
    qint64 logSizeBytes = 0;
    qint64 rowCount = 0;
    qint64 energyRowCount = 0;
    QDateTime oldest;
    QDateTime newest;
    qint64 diskTotal = 0;
    qint64 diskFree = 0;
    double diskUsedPercent = 0;
};

#endif // POWERLOGS_H
