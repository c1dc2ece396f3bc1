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

#include "energydeltacalculator.h"
#include "loggingcategories.h"

#include <algorithm>

EnergyDeltaCalculator::EnergyDeltaCalculator(const EnergyReadings &samples)
{
    QVector<int> order(samples.count());
    for (int i = 0; i < order.count(); i++) {
        order[i] = i;
    }
    std::stable_sort(order.begin(), order.end(), [&samples](int a, int b) {
        return samples.at(a).timestamp() < samples.at(b).timestamp();
    });

    m_timestamps.reserve(samples.count());
    m_values.reserve(samples.count());
    foreach (int index, order) {
        m_timestamps.append(samples.at(index).timestamp().toMSecsSinceEpoch());
        m_values.append(samples.at(index).totalKwh());
    }
}

EnergyDeltaCalculator::Strategy EnergyDeltaCalculator::strategyFor(const Resolution &resolution)
{
    return resolution.isSubHour() ? StrategyInterpolated : StrategyFirstLast;
}

int EnergyDeltaCalculator::sampleCount() const
{
    return m_timestamps.count();
}

double EnergyDeltaCalculator::rawTotal() const
{
    if (m_values.count() < 2) {
        return 0;
    }
    return m_values.last() - m_values.first();
}

double EnergyDeltaCalculator::valueAt(qint64 timestamp) const
{
    if (m_timestamps.isEmpty()) {
        return 0;
    }

    QVector<qint64>::const_iterator it = std::lower_bound(m_timestamps.constBegin(), m_timestamps.constEnd(), timestamp);
    int index = it - m_timestamps.constBegin();

    if (index < m_timestamps.count() && m_timestamps.at(index) == timestamp) {
        return m_values.at(index);
    }
    if (index == 0) {
        return m_values.first();
    }
    if (index >= m_timestamps.count()) {
        return m_values.last();
    }

    qint64 before = m_timestamps.at(index - 1);
    qint64 after = m_timestamps.at(index);
    if (after == before) {
        return m_values.at(index - 1);
    }
    double ratio = static_cast<double>(timestamp - before) / (after - before);
    return m_values.at(index - 1) + (m_values.at(index) - m_values.at(index - 1)) * ratio;
}

QMap<qint64, double> EnergyDeltaCalculator::deltas(const Resolution &resolution, Strategy strategy, const QDateTime &from, const QDateTime &to, const QTimeZone &timeZone, QSet<qint64> *resets) const
{
    if (!resolution.isBucketed() || m_timestamps.count() < 2 || from > to) {
        return QMap<qint64, double>();
    }

    if (strategy == StrategyInterpolated) {
        return interpolatedDeltas(resolution, from, to, timeZone, resets);
    }
    return firstLastDeltas(resolution, from, to, timeZone, resets);
}

EnergyBuckets EnergyDeltaCalculator::toBuckets(const QMap<qint64, double> &deltas)
{
    EnergyBuckets buckets;
    QMapIterator<qint64, double> it(deltas);
    it.toBack();
    while (it.hasPrevious()) {
        it.previous();
        buckets.append(EnergyBucket(QDateTime::fromMSecsSinceEpoch(it.key()), it.value()));
    }
    return buckets;
}

QMap<qint64, double> EnergyDeltaCalculator::interpolatedDeltas(const Resolution &resolution, const QDateTime &from, const QDateTime &to, const QTimeZone &timeZone, QSet<qint64> *resets) const
{
    QMap<qint64, double> result;

    qint64 rangeStart = from.toMSecsSinceEpoch();
    qint64 rangeEnd = to.toMSecsSinceEpoch();

    QDateTime start = resolution.bucketStart(from, timeZone);
    bool firstBucket = true;
    while (start.isValid() && (start.toMSecsSinceEpoch() < rangeEnd || firstBucket)) {
        firstBucket = false;
        QDateTime end = resolution.nextBucketStart(start, timeZone);
        qint64 key = qMax(start.toMSecsSinceEpoch(), rangeStart);

        double delta = valueAt(end.toMSecsSinceEpoch()) - valueAt(start.toMSecsSinceEpoch());
        if (delta < 0) {
            qCWarning(dcPowerLogs()) << "Negative energy delta" << delta << "kWh in bucket" << QDateTime::fromMSecsSinceEpoch(key).toString(Qt::ISODate) << "(counter reset). Ignoring it.";
            if (resets) {
                resets->insert(key);
            }
        } else {
            result.insert(key, delta);
        }

        start = end;
    }
    return result;
}

QMap<qint64, double> EnergyDeltaCalculator::firstLastDeltas(const Resolution &resolution, const QDateTime &from, const QDateTime &to, const QTimeZone &timeZone, QSet<qint64> *resets) const
{
    QMap<qint64, double> result;

    qint64 rangeStart = from.toMSecsSinceEpoch();
    qint64 rangeEnd = to.toMSecsSinceEpoch();

    // Samples are sorted, so each bucket's samples are contiguous
    qint64 currentBucket = 0;
    int first = -1;
    int last = -1;

    auto finishBucket = [&]() {
        if (first < 0 || last == first) {
            return;
        }
        qint64 key = qMax(currentBucket, rangeStart);
        double delta = m_values.at(last) - m_values.at(first);
        if (delta < 0) {
            qCWarning(dcPowerLogs()) << "Negative energy delta" << delta << "kWh in bucket" << QDateTime::fromMSecsSinceEpoch(key).toString(Qt::ISODate) << "(counter reset). Ignoring it.";
            if (resets) {
                resets->insert(key);
            }
            return;
        }
        result.insert(key, delta);
    };

    for (int i = 0; i < m_timestamps.count(); i++) {
        qint64 timestamp = m_timestamps.at(i);
        if (timestamp < rangeStart || timestamp > rangeEnd) {
            continue;
        }
        // The range end is inclusive and belongs to the bucket that ends there
        if (timestamp == rangeEnd && rangeEnd > rangeStart) {
            timestamp--;
        }
        qint64 bucket = resolution.bucketStart(QDateTime::fromMSecsSinceEpoch(timestamp, timeZone), timeZone).toMSecsSinceEpoch();
        if (first < 0 || bucket != currentBucket) {
            finishBucket();
            currentBucket = bucket;
            first = i;
        }
        last = i;
    }
    finishBucket();

    return result;
}
