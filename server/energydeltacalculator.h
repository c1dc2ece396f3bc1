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

#ifndef ENERGYDELTACALCULATOR_H
#define ENERGYDELTACALCULATOR_H

#include "powerlogs.h"
#include "resolution.h"

#include <QMap>
#include <QSet>
#include <QVector>
#include <QTimeZone>

/*! Turns the samples of one cumulative energy counter (a single phase) into consumption per bucket.
 *
 *  Sub-hour resolutions interpolate the counter at the bucket boundaries, clamping to the first and last
 *  sample outside the sampled range. Coarser resolutions take the difference between the last and the
 *  first sample inside each bucket and skip buckets with less than two samples.
 *
 *  A negative delta means the counter has been reset in that bucket. Such buckets are never returned.
 */
class EnergyDeltaCalculator
{
public:
    enum Strategy {
        StrategyInterpolated,
        StrategyFirstLast
    };

    explicit EnergyDeltaCalculator(const EnergyReadings &samples);

    static Strategy strategyFor(const Resolution &resolution);

    int sampleCount() const;

    // Last minus first sample. Not filtered for resets, so this may be negative.
    double rawTotal() const;

    // Counter value at the given time in ms since epoch, linearly interpolated between the bracketing samples
    double valueAt(qint64 timestamp) const;

    /*! Returns the consumption per bucket keyed by the bucket timestamp in ms since epoch. The range is closed
     *  and a leading bucket starting before "from" is keyed by "from". Buckets dropped because of a counter
     *  reset are added to resets if given.
     */
    QMap<qint64, double> deltas(const Resolution &resolution, Strategy strategy, const QDateTime &from, const QDateTime &to,
                                const QTimeZone &timeZone, QSet<qint64> *resets = nullptr) const;

    // Newest bucket first
    static EnergyBuckets toBuckets(const QMap<qint64, double> &deltas);

private:
    QMap<qint64, double> interpolatedDeltas(const Resolution &resolution, const QDateTime &from, const QDateTime &to, const QTimeZone &timeZone, QSet<qint64> *resets) const;
    QMap<qint64, double> firstLastDeltas(const Resolution &resolution, const QDateTime &from, const QDateTime &to, const QTimeZone &timeZone, QSet<qint64> *resets) const;

    QVector<qint64> m_timestamps;
    QVector<double> m_values;
};

#endif // ENERGYDELTACALCULATOR_H
