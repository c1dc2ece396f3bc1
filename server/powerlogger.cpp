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

#include "powerlogger.h"
#include "powerlogstore.h"
#include "diskspaceinfo.h"
#include "readingaggregator.h"
#include "energydeltacalculator.h"
#include "loggingcategories.h"

#include <QElapsedTimer>

PowerLogger::PowerLogger(PowerLogStore *store, const QueryConfig &config, DiskSpaceInfo *diskSpaceInfo, QObject *parent):
    PowerLogs(parent),
    m_store(store),
    m_config(config),
    m_diskSpaceInfo(diskSpaceInfo),
    m_timeZone(QTimeZone::systemTimeZone())
{

}

QTimeZone PowerLogger::timeZone() const
{
    return m_timeZone;
}

void PowerLogger::setTimeZone(const QTimeZone &timeZone)
{
    m_timeZone = timeZone;
}

bool PowerLogger::logReading(const PowerReading &reading)
{
    if (!m_store->appendReading(reading)) {
        return false;
    }
    emit readingAdded(reading);
    return true;
}

bool PowerLogger::logEnergyReading(const EnergyReading &reading)
{
    if (!m_store->appendEnergyReading(reading)) {
        return false;
    }
    emit energyReadingAdded(reading);
    return true;
}

PowerReading PowerLogger::latestReading(const QString &meterId) const
{
    return m_store->latestReading(meterId);
}

EnergyReading PowerLogger::latestEnergyReading(const QString &meterId, const QString &phase) const
{
    return m_store->latestEnergyReading(meterId, phase);
}

ReadingsResult PowerLogger::historicalReadings(const QString &meterId, const QDateTime &from, const QDateTime &to, int limit, const Resolution &resolution) const
{
    QElapsedTimer timer;
    timer.start();

    ReadingsResult result;
    result.resolution = resolution;
    if (!resolution.isValid()) {
        qCWarning(dcPowerLogs()) << "Invalid resolution requested for readings of" << meterId;
        result.error = QueryErrorInvalidResolution;
        return result;
    }
    result.error = validate(meterId, from, to);
    if (result.error != QueryErrorNoError) {
        return result;
    }

    if (limit <= 0) {
        limit = m_config.defaultLimit;
    }

    Resolution effective = resolution;
    if (resolution.unit() == Resolution::UnitAuto) {
        bool ok = false;
        result.preAggregationCount = m_store->readingCount(meterId, from, to, &ok);
        if (!ok) {
            result.error = QueryErrorStorage;
            return result;
        }
        effective = Resolution::select(result.preAggregationCount, from.secsTo(to), m_config.targetPoints);
        // Bucket alignment can add one bucket more than span / width
        limit = qMin(limit, m_config.targetPoints);
        qCDebug(dcPowerLogs()) << "Auto resolution for" << meterId << ":" << result.preAggregationCount << "readings ->" << effective;
    }
    result.resolution = effective;

    if (effective.unit() == Resolution::UnitNone) {
        bool ok = false;
        result.readings = m_store->readings(meterId, from, to, Qt::DescendingOrder, limit, &ok);
        if (!ok) {
            result.error = QueryErrorStorage;
        }
    } else {
        ReadingAggregator aggregator(meterId, effective, from, to, m_timeZone);
        bool ok = m_store->scanReadings(meterId, from, to, Qt::AscendingOrder, 0, [&aggregator](const PowerReading &reading) {
            aggregator.addReading(reading);
        });
        if (!ok) {
            result.error = QueryErrorStorage;
        } else {
            result.readings = aggregator.result(limit);
        }
    }

    result.elapsedMs = timer.elapsed();
    qCDebug(dcPowerLogs()) << "Fetched" << result.readings.count() << "readings for" << meterId << "at" << effective << "in" << result.elapsedMs << "ms";
    return result;
}

EnergyResult PowerLogger::historicalEnergy(const QString &meterId, const QDateTime &from, const QDateTime &to, const QString &phase, const Resolution &resolution) const
{
    QElapsedTimer timer;
    timer.start();

    EnergyResult result;
    result.resolution = resolution;
    if (!resolution.isValid()) {
        qCWarning(dcPowerLogs()) << "Invalid resolution requested for energy of" << meterId;
        result.error = QueryErrorInvalidResolution;
        return result;
    }
    result.error = validate(meterId, from, to);
    if (result.error != QueryErrorNoError) {
        return result;
    }

    bool ok = false;
    EnergyReadings samples = m_store->energyReadings(meterId, from, to, phase, &ok);
    if (!ok) {
        result.error = QueryErrorStorage;
        return result;
    }
    result.rawCount = samples.count();

    // Each phase is a counter of its own
    QMap<QString, EnergyReadings> phases;
    foreach (const EnergyReading &sample, samples) {
        phases[sample.phase()].append(sample);
    }
    QList<EnergyDeltaCalculator> calculators;
    foreach (const EnergyReadings &phaseSamples, phases) {
        calculators.append(EnergyDeltaCalculator(phaseSamples));
        result.rawTotal += calculators.last().rawTotal();
    }

    Resolution effective = resolution;
    if (resolution.unit() == Resolution::UnitAuto) {
        effective = Resolution::select(result.rawCount, from.secsTo(to), m_config.targetPoints);
        qCDebug(dcPowerLogs()) << "Auto resolution for energy of" << meterId << ":" << result.rawCount << "samples ->" << effective;
    }
    result.resolution = effective;

    if (effective.isBucketed()) {
        EnergyDeltaCalculator::Strategy strategy = EnergyDeltaCalculator::strategyFor(effective);
        QMap<qint64, double> totals;
        QSet<qint64> resets;
        foreach (const EnergyDeltaCalculator &calculator, calculators) {
            QMap<qint64, double> deltas = calculator.deltas(effective, strategy, from, to, m_timeZone, &resets);
            for (QMap<qint64, double>::const_iterator it = deltas.constBegin(); it != deltas.constEnd(); ++it) {
                totals[it.key()] += it.value();
            }
        }
        // A reset in any phase invalidates the bucket's sum
        foreach (qint64 bucket, resets) {
            totals.remove(bucket);
        }
        result.buckets = EnergyDeltaCalculator::toBuckets(totals);
        if (resolution.unit() == Resolution::UnitAuto) {
            while (result.buckets.count() > m_config.targetPoints) {
                result.buckets.removeLast();
            }
        }
    }

    result.elapsedMs = timer.elapsed();
    qCDebug(dcPowerLogs()) << "Calculated" << result.buckets.count() << "energy buckets for" << meterId << phase << "at" << effective
                           << "from" << result.rawCount << "samples in" << result.elapsedMs << "ms";
    return result;
}

EnergyReadings PowerLogger::energyReadings(const QString &meterId, const QDateTime &from, const QDateTime &to, const QString &phase) const
{
    if (validate(meterId, from, to) != QueryErrorNoError) {
        return EnergyReadings();
    }
    return m_store->energyReadings(meterId, from, to, phase);
}

qint64 PowerLogger::readingCount(const QString &meterId, const QDateTime &from, const QDateTime &to, QueryError *error) const
{
    QueryError status = validate(meterId, from, to);
    qint64 count = 0;
    if (status == QueryErrorNoError) {
        bool ok = false;
        count = m_store->readingCount(meterId, from, to, &ok);
        if (!ok) {
            status = QueryErrorStorage;
        }
    }
    if (error) {
        *error = status;
    }
    return count;
}

MeterStatistics PowerLogger::statistics(const QString &meterId, const QDateTime &from, const QDateTime &to) const
{
    QueryError status = validate(meterId, from, to);
    if (status != QueryErrorNoError) {
        MeterStatistics stats;
        stats.error = status;
        stats.meterId = meterId;
        stats.from = from;
        stats.to = to;
        return stats;
    }
    return m_store->statistics(meterId, from, to);
}

StoreStatistics PowerLogger::storeStatistics() const
{
    StoreStatistics stats;
    stats.sizeBytes = m_store->databaseSize();
    stats.logSizeBytes = m_store->logSize();
    stats.rowCount = m_store->totalReadingCount();
    stats.energyRowCount = m_store->totalEnergyReadingCount();
    stats.oldest = m_store->oldestTimestamp();
    stats.newest = m_store->newestTimestamp();
    stats.valid = stats.rowCount >= 0 && stats.energyRowCount >= 0;

    if (m_diskSpaceInfo) {
        stats.diskTotal = m_diskSpaceInfo->bytesTotal(m_store->databaseFile());
        stats.diskFree = m_diskSpaceInfo->bytesFree(m_store->databaseFile());
        if (stats.diskTotal > 0 && stats.diskFree >= 0) {
            stats.diskUsedPercent = 100.0 * (stats.diskTotal - stats.diskFree) / stats.diskTotal;
        }
    }
    return stats;
}

PowerLogs::QueryError PowerLogger::validate(const QString &meterId, const QDateTime &from, const QDateTime &to) const
{
    if (!from.isValid() || !to.isValid() || from > to) {
        qCWarning(dcPowerLogs()) << "Invalid time range" << from << "-" << to << "for" << meterId;
        return QueryErrorInvalidTimeRange;
    }
    if (!m_store->meterExists(meterId)) {
        qCWarning(dcPowerLogs()) << "Query for unknown meter" << meterId;
        return QueryErrorUnknownMeter;
    }
    return QueryErrorNoError;
}
