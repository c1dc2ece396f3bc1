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

#ifndef READINGAGGREGATOR_H
#define READINGAGGREGATOR_H

#include "powerlogs.h"
#include "resolution.h"

#include <QMap>
#include <QTimeZone>

/*! Averages a stream of readings into buckets of the given resolution.
 *  Readings may arrive in any order. The range is closed, so a reading exactly at "to" is counted
 *  into the bucket that ends at "to" and every bucket timestamp lies in [from, to).
 */
class ReadingAggregator
{
public:
    ReadingAggregator(const QString &meterId, const Resolution &resolution, const QDateTime &from, const QDateTime &to, const QTimeZone &timeZone = QTimeZone::systemTimeZone());

    void addReading(const PowerReading &reading);

    int bucketCount() const;

    // Newest bucket first. A limit <= 0 returns all of them.
    PowerReadings result(int limit = 0) const;

private:
    struct Bucket {
        qint64 count = 0;
        double voltage = 0;
        double current = 0;
        double activePower = 0;
        double reactivePower = 0;
        double apparentPower = 0;
        double powerFactor = 0;
        double frequency = 0;
    };

    QString m_meterId;
    Resolution m_resolution;
    qint64 m_from = 0;
    qint64 m_to = 0;
    QTimeZone m_timeZone;

    // Keyed by bucket start in ms since epoch
    QMap<qint64, Bucket> m_buckets;
};

#endif // READINGAGGREGATOR_H
