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

#ifndef POWERMANAGERIMPL_H
#define POWERMANAGERIMPL_H

#include <QObject>
#include <QThread>
#include <QNetworkAccessManager>

#include "powermanager.h"
#include "powerlogger.h"
#include "pollersupervisor.h"
#include "retentionmanager.h"
#include "diskspaceinfo.h"

class PowerLogStore;
class MeterPoller;
class EnergyPoller;

class PowerManagerImpl : public PowerManager
{
    Q_OBJECT
public:
    struct Configuration
    {
        QueryConfig query;
        PollerConfig readingPoller;
        PollerConfig energyPoller;
        RetentionConfig retention;
        // Defaults to the real volume of the DB file if not set. Not owned.
        DiskSpaceInfo *diskSpaceInfo = nullptr;
        // Each poll kind gets its own client. Created internally if not set.
        QNetworkAccessManager *readingNetworkManager = nullptr;
        QNetworkAccessManager *energyNetworkManager = nullptr;
    };

    // Takes ownership of an opened store
    explicit PowerManagerImpl(PowerLogStore *store, const Configuration &configuration, QObject *parent = nullptr);
    ~PowerManagerImpl() override;

    MeterError registerMeter(const Meter &meter) override;
    MeterError updateMeter(const Meter &meter) override;
    MeterError removeMeter(const QString &meterId) override;

    Meters meters() const override;
    Meter meter(const QString &meterId) const override;

    void submitReading(const PowerReading &reading) override;
    void submitEnergyReading(const EnergyReading &reading) override;

    PowerLogs *logs() const override;

    void runMaintenance() override;
    void compactOldData(int olderThanDays) override;
    void vacuum() override;

    MeterPoller *meterPoller() const;
    EnergyPoller *energyPoller() const;

private:
    void startPolling(const Meter &meter);
    void stopPolling(const QString &meterId);

    PowerLogStore *m_store = nullptr;
    PowerLogger *m_logger = nullptr;
    MeterPoller *m_meterPoller = nullptr;
    EnergyPoller *m_energyPoller = nullptr;

    VolumeDiskSpaceInfo m_volumeDiskSpaceInfo;
    QThread *m_retentionThread = nullptr;
    RetentionManager *m_retentionManager = nullptr;
};

#endif // POWERMANAGERIMPL_H
