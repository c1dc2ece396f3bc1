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

#include "meter.h"

#include <QDebug>

Meter::Meter()
{

}

Meter::Meter(const QString &meterId, const QString &address):
    m_meterId(meterId),
    m_address(address)
{

}

QString Meter::meterId() const
{
    return m_meterId;
}

QString Meter::address() const
{
    return m_address;
}

void Meter::setAddress(const QString &address)
{
    m_address = address;
}

QString Meter::name() const
{
    return m_name;
}

void Meter::setName(const QString &name)
{
    m_name = name;
}

QString Meter::location() const
{
    return m_location;
}

void Meter::setLocation(const QString &location)
{
    m_location = location;
}

bool Meter::enabled() const
{
    return m_enabled;
}

void Meter::setEnabled(bool enabled)
{
    m_enabled = enabled;
}

int Meter::pollInterval() const
{
    return m_pollInterval;
}

void Meter::setPollInterval(int pollInterval)
{
    m_pollInterval = pollInterval;
}

int Meter::energyPollInterval() const
{
    return m_energyPollInterval;
}

void Meter::setEnergyPollInterval(int energyPollInterval)
{
    m_energyPollInterval = energyPollInterval;
}

QDateTime Meter::lastSeen() const
{
    return m_lastSeen;
}

void Meter::setLastSeen(const QDateTime &lastSeen)
{
    m_lastSeen = lastSeen;
}

bool Meter::isValid() const
{
    return !m_meterId.isEmpty() && !m_address.isEmpty() && m_pollInterval > 0 && m_energyPollInterval > 0;
}

Meter Meters::findById(const QString &meterId) const
{
    foreach (const Meter &meter, *this) {
        if (meter.meterId() == meterId) {
            return meter;
        }
    }
    return Meter();
}

QDebug operator<<(QDebug debug, const Meter &meter)
{
    QDebugStateSaver saver(debug);
    debug.nospace() << "Meter(" << meter.meterId() << ", " << meter.address() << ", enabled: " << meter.enabled() << ", intervals: " << meter.pollInterval() << "/" << meter.energyPollInterval() << " ms)";
    return debug;
}
