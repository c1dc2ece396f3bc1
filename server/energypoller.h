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

#ifndef ENERGYPOLLER_H
#define ENERGYPOLLER_H

#include "pollersupervisor.h"
#include "powerlogs.h"

class EnergyPoller : public PollerSupervisor
{
    Q_OBJECT
public:
    explicit EnergyPoller(const PollerConfig &config, QNetworkAccessManager *networkManager = nullptr, QObject *parent = nullptr);

    /*! Parses a response of the meter's /api/energy endpoint, which reports either a single phase
     *  or a "phases" list. Returns false unless it is a successful read with at least one phase.
     */
    static bool parseEnergyReadings(const QString &meterId, const QByteArray &data, const QDateTime &timestamp, EnergyReadings *readings);

signals:
    void energyReadingsFetched(const EnergyReadings &readings);

protected:
    const QLoggingCategory &loggingCategory() const override;
    int pollInterval(const Meter &meter) const override;
    QNetworkReply *sendRequest(QNetworkAccessManager *networkManager, const Meter &meter) override;
    bool handleResponse(const Meter &meter, const QByteArray &data) override;
};

#endif // ENERGYPOLLER_H
