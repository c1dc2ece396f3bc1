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

#ifndef RESOLUTION_H
#define RESOLUTION_H

#include <QObject>
#include <QDateTime>
#include <QTimeZone>
#include <QList>

/*! A bucket width for historical queries, or one of the special values "none" (raw rows) and "auto".
 *  Minute and hour buckets are anchored to the epoch, day buckets to local midnight, week buckets
 *  to the most recent Sunday at local midnight and month buckets to the first day of the calendar month.
 */
class Resolution
{
    Q_GADGET
public:
    enum Unit {
        UnitNone,
        UnitAuto,
        UnitMinute,
        UnitHour,
        UnitDay,
        UnitWeek,
        UnitMonth
    };
    Q_ENUM(Unit)

    Resolution();
    Resolution(Unit unit, int count = 1);

    static Resolution fromString(const QString &name);

    /*! Picks the smallest ladder entry whose width covers spanSeconds / targetPoints minutes.
     *  Returns UnitNone if count already fits into targetPoints.
     */
    static Resolution select(qint64 count, qint64 spanSeconds, int targetPoints);
    static QList<Resolution> ladder();

    Unit unit() const;
    int count() const;

    bool isValid() const;
    bool isBucketed() const;
    bool isSubHour() const;

    // Months count as 30 days here. Only used for selection, never for bucket boundaries.
    qint64 widthMinutes() const;

    QString toString() const;

    QDateTime bucketStart(const QDateTime &dateTime, const QTimeZone &timeZone) const;
    QDateTime nextBucketStart(const QDateTime &bucketStart, const QTimeZone &timeZone) const;

    bool operator==(const Resolution &other) const;
    bool operator!=(const Resolution &other) const;

private:
    Unit m_unit = UnitNone;
    int m_count = 0;
};
Q_DECLARE_METATYPE(Resolution)

QDebug operator<<(QDebug debug, const Resolution &resolution);

#endif // RESOLUTION_H
