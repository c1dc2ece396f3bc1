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

#include "powerlogs.h"

PowerLogs::PowerLogs(QObject *parent): QObject(parent)
{
    qRegisterMetaType<PowerReading>();
    qRegisterMetaType<PowerReadings>();
    qRegisterMetaType<EnergyReading>();
    qRegisterMetaType<EnergyReadings>();
}

PowerReading::PowerReading()
{

}

PowerReading::PowerReading(const QDateTime &timestamp, const QString &meterId, double voltage, double current, double activePower, double reactivePower, double apparentPower, double powerFactor, double frequency):
    m_timestamp(timestamp),
    m_meterId(meterId),
    m_voltage(voltage),
    m_current(current),
    m_activePower(activePower),
    m_reactivePower(reactivePower),
    m_apparentPower(apparentPower),
    m_powerFactor(powerFactor),
    m_frequency(frequency)
{

}

QDateTime PowerReading::timestamp() const
{
    return m_timestamp;
}

QString PowerReading::meterId() const
{
    return m_meterId;
}

double PowerReading::voltage() const
{
    return m_voltage;
}

double PowerReading::current() const
{
    return m_current;
}

double PowerReading::activePower() const
{
    return m_activePower;
}

double PowerReading::reactivePower() const
{
    return m_reactivePower;
}

double PowerReading::apparentPower() const
{
    return m_apparentPower;
}

double PowerReading::powerFactor() const
{
    return m_powerFactor;
}

double PowerReading::frequency() const
{
    return m_frequency;
}

bool PowerReading::isValid() const
{
    return m_timestamp.isValid() && !m_meterId.isEmpty();
}

EnergyReading::EnergyReading()
{

}

EnergyReading::EnergyReading(const QDateTime &timestamp, const QString &meterId, const QString &phase, double totalKwh):
    m_timestamp(timestamp),
    m_meterId(meterId),
    m_phase(phase),
    m_totalKwh(totalKwh)
{

}

QDateTime EnergyReading::timestamp() const
{
    return m_timestamp;
}

QString EnergyReading::meterId() const
{
    return m_meterId;
}

QString EnergyReading::phase() const
{
    return m_phase;
}

double EnergyReading::totalKwh() const
{
    return m_totalKwh;
}

bool EnergyReading::isValid() const
{
    return m_timestamp.isValid() && !m_meterId.isEmpty() && !m_phase.isEmpty();
}

EnergyBucket::EnergyBucket()
{

}

EnergyBucket::EnergyBucket(const QDateTime &timestamp, double energyKwh):
    m_timestamp(timestamp),
    m_energyKwh(energyKwh)
{

}

QDateTime EnergyBucket::timestamp() const
{
    return m_timestamp;
}

double EnergyBucket::energyKwh() const
{
    return m_energyKwh;
}
