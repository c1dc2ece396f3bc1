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

#ifndef POWERMANAGER_H
#define POWERMANAGER_H

#include "powerlogs.h"
#include "meter.h"

#include <QObject>

class PowerManager : public QObject
{
    Q_OBJECT
public:
    enum MeterError {
        MeterErrorNoError,
        MeterErrorInvalidParameter,
        MeterErrorStorage
    };
    Q_ENUM(MeterError)

    explicit PowerManager(QObject *parent = nullptr);
    virtual ~PowerManager() = default;

    // Control path. Registering an existing meter updates it, removing an unknown meter is a no-op.
    virtual MeterError registerMeter(const Meter &meter) = 0;
    virtual MeterError updateMeter(const Meter &meter) = 0;
    virtual MeterError removeMeter(const QString &meterId) = 0;

    virtual Meters meters() const = 0;
    virtual Meter meter(const QString &meterId) const = 0;

    // Write path. Errors are logged, never returned.
    virtual void submitReading(const PowerReading &reading) = 0;
    virtual void submitEnergyReading(const EnergyReading &reading) = 0;

    virtual PowerLogs *logs() const = 0;

    // Maintenance on demand. All of these run asynchronously.
    virtual void runMaintenance() = 0;
    virtual void compactOldData(int olderThanDays) = 0;
    virtual void vacuum() = 0;

signals:
    void meterAdded(const Meter &meter);
    void meterChanged(const Meter &meter);
    void meterRemoved(const QString &meterId);

    void maintenanceFinished();
    // -1 if the compaction failed
    void compactionFinished(int removedRows);
    void vacuumFinished(bool success);
};

#endif // POWERMANAGER_H
