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

#include "readingaggregator.h"
#include "loggingcategories.h"

ReadingAggregator::ReadingAggregator(const QString &meterId, const Resolution &resolution, const QDateTime &from, const QDateTime &to, const QTimeZone &timeZone):
    m_meterId(meterId),
    m_resolution(resolution),
    m_from(from.toMSecsSinceEpoch()),
    m_to(to.toMSecsSinceEpoch()),
    m_timeZone(timeZone)
{

}

void ReadingAggregator::addReading(const PowerReading &reading)
{
    qint64 timestamp = reading.timestamp().toMSecsSinceEpoch();
    if (timestamp < m_from || timestamp > m_to) {
        return;
    }
    if (timestamp == m_to && m_to > m_from) {
        timestamp--;
    }

    QDateTime start = m_resolution.bucketStart(QDateTime::fromMSecsSinceEpoch(timestamp, m_timeZone), m_timeZone);
    if (!start.isValid()) {
        qCWarning(dcPowerLogs()) << "Cannot bucket reading at" << reading.timestamp() << "with" << m_resolution;
        return;
    }

    Bucket &bucket = m_buckets[start.toMSecsSinceEpoch()];
    bucket.count++;
    bucket.voltage += reading.voltage();
    bucket.current += reading.current();
    bucket.activePower += reading.activePower();
    bucket.reactivePower += reading.reactivePower();
    bucket.apparentPower += reading.apparentPower();
    bucket.powerFactor += reading.powerFactor();
    bucket.frequency += reading.frequency();
}

int ReadingAggregator::bucketCount() const
{
    return m_buckets.count();
}

PowerReadings ReadingAggregator::result(int limit) const
{
    PowerReadings ret;
    QMapIterator<qint64, Bucket> it(m_buckets);
    it.toBack();
    while (it.hasPrevious()) {
        if (limit > 0 && ret.count() >= limit) {
            break;
        }
        it.previous();
        const Bucket &bucket = it.value();
        // A bucket starting before the range is reported at the range start
        qint64 timestamp = qMax(it.key(), m_from);
        double count = bucket.count;
        ret.append(PowerReading(QDateTime::fromMSecsSinceEpoch(timestamp),
                                m_meterId,
                                bucket.voltage / count,
                                bucket.current / count,
                                bucket.activePower / count,
                                bucket.reactivePower / count,
                                bucket.apparentPower / count,
                                bucket.powerFactor / count,
                                bucket.frequency / count));
    }
    return ret;
}
