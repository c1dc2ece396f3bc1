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

#include "resolution.h"

#include <QDebug>
#include <QRegularExpression>

static qint64 floorDiv(qint64 value, qint64 divisor)
{
    qint64 result = value / divisor;
    if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
        result--;
    }
    return result;
}

Resolution::Resolution()
{

}

Resolution::Resolution(Unit unit, int count):
    m_unit(unit),
    m_count(count)
{

}

Resolution Resolution::fromString(const QString &name)
{
    QString normalized = name.trimmed().toLower();
    if (normalized == "none") {
        return Resolution(UnitNone);
    }
    if (normalized == "auto") {
        return Resolution(UnitAuto);
    }
    if (normalized == "1week") {
        return Resolution(UnitWeek);
    }
    if (normalized == "1month") {
        return Resolution(UnitMonth);
    }

    static const QRegularExpression expression("^(\\d{1,5})(min|hour|day)$");
    QRegularExpressionMatch match = expression.match(normalized);
    if (!match.hasMatch()) {
        return Resolution();
    }
    int count = match.captured(1).toInt();
    if (count <= 0) {
        return Resolution();
    }
    QString unit = match.captured(2);
    if (unit == "min") {
        return Resolution(UnitMinute, count);
    } else if (unit == "hour") {
        return Resolution(UnitHour, count);
    }
    return Resolution(UnitDay, count);
}

Resolution Resolution::select(qint64 count, qint64 spanSeconds, int targetPoints)
{
    if (targetPoints <= 0 || count <= targetPoints) {
        return Resolution(UnitNone);
    }

    double idealMinutes = spanSeconds / 60.0 / targetPoints;
    foreach (const Resolution &resolution, ladder()) {
        if (resolution.widthMinutes() >= idealMinutes) {
            return resolution;
        }
    }
    return Resolution(UnitMonth);
}

QList<Resolution> Resolution::ladder()
{
    static const QList<Resolution> steps = QList<Resolution>()
            << Resolution(UnitMinute, 1)
            << Resolution(UnitMinute, 2)
            << Resolution(UnitMinute, 3)
            << Resolution(UnitMinute, 5)
            << Resolution(UnitMinute, 10)
            << Resolution(UnitMinute, 15)
            << Resolution(UnitMinute, 20)
            << Resolution(UnitMinute, 30)
            << Resolution(UnitHour, 1)
            << Resolution(UnitHour, 2)
            << Resolution(UnitHour, 3)
            << Resolution(UnitHour, 6)
            << Resolution(UnitHour, 12)
            << Resolution(UnitDay, 1)
            << Resolution(UnitWeek, 1)
            << Resolution(UnitMonth, 1);
    return steps;
}

Resolution::Unit Resolution::unit() const
{
    return m_unit;
}

int Resolution::count() const
{
    return m_count;
}

bool Resolution::isValid() const
{
    if (m_count <= 0) {
        return false;
    }
    if (m_unit == UnitNone || m_unit == UnitAuto || m_unit == UnitWeek || m_unit == UnitMonth) {
        return m_count == 1;
    }
    return true;
}

bool Resolution::isBucketed() const
{
    return isValid() && m_unit != UnitNone && m_unit != UnitAuto;
}

bool Resolution::isSubHour() const
{
    return isBucketed() && widthMinutes() < 60;
}

qint64 Resolution::widthMinutes() const
{
    switch (m_unit) {
    case UnitNone:
    case UnitAuto:
        return 0;
    case UnitMinute:
        return m_count;
    case UnitHour:
        return m_count * 60;
    case UnitDay:
        return m_count * 1440;
    case UnitWeek:
        return 10080;
    case UnitMonth:
        return 43200;
    }
    return 0;
}

QString Resolution::toString() const
{
    if (!isValid()) {
        return QString();
    }
    switch (m_unit) {
    case UnitNone:
        return "none";
    case UnitAuto:
        return "auto";
    case UnitMinute:
        return QString("%1min").arg(m_count);
    case UnitHour:
        return QString("%1hour").arg(m_count);
    case UnitDay:
        return QString("%1day").arg(m_count);
    case UnitWeek:
        return "1week";
    case UnitMonth:
        return "1month";
    }
    return QString();
}

QDateTime Resolution::bucketStart(const QDateTime &dateTime, const QTimeZone &timeZone) const
{
    if (!isBucketed() || !dateTime.isValid()) {
        return QDateTime();
    }

    if (m_unit == UnitMinute || m_unit == UnitHour) {
        qint64 width = widthMinutes() * 60 * 1000;
        qint64 start = floorDiv(dateTime.toMSecsSinceEpoch(), width) * width;
        return QDateTime::fromMSecsSinceEpoch(start, timeZone);
    }

    QDate date = dateTime.toTimeZone(timeZone).date();
    switch (m_unit) {
    case UnitDay: {
        static const QDate epoch(1970, 1, 1);
        qint64 epochDay = epoch.daysTo(date);
        qint64 startDay = floorDiv(epochDay, m_count) * m_count;
        return epoch.addDays(startDay).startOfDay(timeZone);
    }
    case UnitWeek:
        // dayOfWeek() is 7 for Sunday
        return date.addDays(-(date.dayOfWeek() % 7)).startOfDay(timeZone);
    case UnitMonth:
        return QDate(date.year(), date.month(), 1).startOfDay(timeZone);
    default:
        break;
    }
    return QDateTime();
}

QDateTime Resolution::nextBucketStart(const QDateTime &bucketStart, const QTimeZone &timeZone) const
{
    if (!isBucketed() || !bucketStart.isValid()) {
        return QDateTime();
    }

    if (m_unit == UnitMinute || m_unit == UnitHour) {
        return bucketStart.addMSecs(widthMinutes() * 60 * 1000);
    }

    QDate date = bucketStart.toTimeZone(timeZone).date();
    switch (m_unit) {
    case UnitDay:
        return date.addDays(m_count).startOfDay(timeZone);
    case UnitWeek:
        return date.addDays(7).startOfDay(timeZone);
    case UnitMonth:
        return QDate(date.year(), date.month(), 1).addMonths(1).startOfDay(timeZone);
    default:
        break;
    }
    return QDateTime();
}

bool Resolution::operator==(const Resolution &other) const
{
    return m_unit == other.m_unit && m_count == other.m_count;
}

bool Resolution::operator!=(const Resolution &other) const
{
    return !operator==(other);
}

QDebug operator<<(QDebug debug, const Resolution &resolution)
{
    QDebugStateSaver saver(debug);
    debug.nospace() << "Resolution(" << (resolution.isValid() ? resolution.toString() : QString("invalid")) << ")";
    return debug;
}
