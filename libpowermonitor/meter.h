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

#ifndef METER_H
#define METER_H

#include <QObject>
#include <QDateTime>
#include <QList>
#include <QString>

class Meter
{
    Q_GADGET
    Q_PROPERTY(QString meterId READ meterId)
    Q_PROPERTY(QString address READ address)
    Q_PROPERTY(QString name READ name)
    Q_PROPERTY(QString location READ location)
    Q_PROPERTY(bool enabled READ enabled)
    Q_PROPERTY(int pollInterval READ pollInterval)
    Q_PROPERTY(int energyPollInterval READ energyPollInterval)
    Q_PROPERTY(QDateTime lastSeen READ lastSeen)
public:
    Meter();
    Meter(const QString &meterId, const QString &address);

    QString meterId() const;

    // host or host:port of the meter's HTTP endpoint
    QString address() const;
    void setAddress(const QString &address);

    QString name() const;
    void setName(const QString &name);

    QString location() const;
    void setLocation(const QString &location);

    bool enabled() const;
    void setEnabled(bool enabled);

    // Instantaneous readings poll interval in ms
    int pollInterval() const;
    void setPollInterval(int pollInterval);

    // Energy counter poll interval in ms
    int energyPollInterval() const;
    void setEnergyPollInterval(int energyPollInterval);

    QDateTime lastSeen() const;
    void setLastSeen(const QDateTime &lastSeen);

    bool isValid() const;

private:
    QString m_meterId;
    QString m_address;
    QString m_name;
    QString m_location;
    bool m_enabled = true;
    int m_pollInterval = 1000;
    int m_energyPollInterval = 30000;
    QDateTime m_lastSeen;
};
Q_DECLARE_METATYPE(Meter)

class Meters: public QList<Meter>
{
public:
    Meters() = default;
    Meters(const QList<Meter> &other): QList<Meter>(other) {}
    Meter findById(const QString &meterId) const;
};
Q_DECLARE_METATYPE(Meters)

QDebug operator<<(QDebug debug, const Meter &meter);

#endif // METER_H
