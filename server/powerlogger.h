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

#ifndef POWERLOGGER_H
#define POWERLOGGER_H

#include "powerlogs.h"

#include <QObject>
#include <QTimeZone>

class PowerLogStore;
class DiskSpaceInfo;

struct QueryConfig
{
    // Upper bound for the number of points an "auto" query returns
    int targetPoints = 10000;
    // Applied when a query asks for no limit
    int defaultLimit = 10000;
};

class PowerLogger : public PowerLogs
{
    Q_OBJECT
public:
    explicit PowerLogger(PowerLogStore *store, const QueryConfig &config, DiskSpaceInfo *diskSpaceInfo = nullptr, QObject *parent = nullptr);

    // Clock used for day, week and month buckets. Defaults to the system time zone.
    QTimeZone timeZone() const;
    void setTimeZone(const QTimeZone &timeZone);

    bool logReading(const PowerReading &reading);
    bool logEnergyReading(const EnergyReading &reading);

    PowerReading latestReading(const QString &meterId) const override;
    EnergyReading latestEnergyReading(const QString &meterId, const QString &phase = "ALL") const override;
    ReadingsResult historicalReadings(const QString &meterId, const QDateTime &from, const QDateTime &to, int limit, const Resolution &resolution) const override;
    EnergyResult historicalEnergy(const QString &meterId, const QDateTime &from, const QDateTime &to, const QString &phase, const Resolution &resolution) const override;
    EnergyReadings energyReadings(const QString &meterId, const QDateTime &from, const QDateTime &to, const QString &phase = "ALL") const override;
    qint64 readingCount(const QString &meterId, const QDateTime &from, const QDateTime &to, QueryError *error = nullptr) const override;
    MeterStatistics statistics(const QString &meterId, const QDateTime &from, const QDateTime &to) const override;
    StoreStatistics storeStatistics() const override;

private:
    QueryError validate(const QString &meterId, const QDateTime &from, const QDateTime &to) const;

    PowerLogStore *m_store = nullptr;
    QueryConfig m_config;
    DiskSpaceInfo *m_diskSpaceInfo = nullptr;
    QTimeZone m_timeZone;
};

#endif // POWERLOGGER_H
