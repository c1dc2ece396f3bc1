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

#ifndef METERPOLLER_H
#define METERPOLLER_H

#include "pollersupervisor.h"
#include "powerlogs.h"

class MeterPoller : public PollerSupervisor
{
    Q_OBJECT
public:
    explicit MeterPoller(const PollerConfig &config, QNetworkAccessManager *networkManager = nullptr, QObject *parent = nullptr);

    static QByteArray requestBody();

    // Parses a response of the meter's /api/read endpoint. Returns false if it is not a successful read.
    static bool parseReading(const QString &meterId, const QByteArray &data, const QDateTime &timestamp, PowerReading *reading);

signals:
    void readingFetched(const PowerReading &reading);

protected:
    const QLoggingCategory &loggingCategory() const override;
    int pollInterval(const Meter &meter) const override;
    QNetworkReply *sendRequest(QNetworkAccessManager *networkManager, const Meter &meter) override;
    bool handleResponse(const Meter &meter, const QByteArray &data) override;
};

#endif // METERPOLLER_H
