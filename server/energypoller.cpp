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

#include "energypoller.h"
#include "loggingcategories.h"

#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonArray>

EnergyPoller::EnergyPoller(const PollerConfig &config, QNetworkAccessManager *networkManager, QObject *parent):
    PollerSupervisor(config, networkManager, parent)
{

}

bool EnergyPoller::parseEnergyReadings(const QString &meterId, const QByteArray &data, const QDateTime &timestamp, EnergyReadings *readings)
{
    QJsonParseError error;
    QJsonDocument jsonDoc = QJsonDocument::fromJson(data, &error);
    if (error.error != QJsonParseError::NoError || !jsonDoc.isObject()) {
        qCWarning(dcEnergyPoller()) << "Cannot parse energy response from" << meterId << ":" << error.errorString();
        return false;
    }

    QJsonObject response = jsonDoc.object();
    if (!response.value("success").toBool(false)) {
        qCWarning(dcEnergyPoller()) << "Meter" << meterId << "did not report success for energy";
        return false;
    }

    EnergyReadings result;
    if (response.contains("phase")) {
        result.append(EnergyReading(timestamp, meterId, response.value("phase").toString(), response.value("accumulatedKWh").toDouble()));
    } else if (response.value("phases").isArray()) {
        foreach (const QJsonValue &entry, response.value("phases").toArray()) {
            QJsonObject phase = entry.toObject();
            result.append(EnergyReading(timestamp, meterId, phase.value("phase").toString(), phase.value("accumulatedKWh").toDouble()));
        }
    } else {
        qCWarning(dcEnergyPoller()) << "Unexpected energy response format from" << meterId;
        return false;
    }

    foreach (const EnergyReading &reading, result) {
        if (reading.phase().isEmpty()) {
            qCWarning(dcEnergyPoller()) << "Energy response from" << meterId << "contains a sample without phase";
            return false;
        }
    }
    if (result.isEmpty()) {
        qCWarning(dcEnergyPoller()) << "Energy response from" << meterId << "contains no phases";
        return false;
    }

    *readings = result;
    return true;
}

const QLoggingCategory &EnergyPoller::loggingCategory() const
{
    return dcEnergyPoller();
}

int EnergyPoller::pollInterval(const Meter &meter) const
{
    return meter.energyPollInterval();
}

QNetworkReply *EnergyPoller::sendRequest(QNetworkAccessManager *networkManager, const Meter &meter)
{
    QNetworkRequest request(QUrl(QString("http://%1/api/energy?phase=ALL").arg(meter.address())));
    return networkManager->get(request);
}

bool EnergyPoller::handleResponse(const Meter &meter, const QByteArray &data)
{
    EnergyReadings readings;
    if (!parseEnergyReadings(meter.meterId(), data, QDateTime::currentDateTime(), &readings)) {
        return false;
    }
    qCDebug(dcEnergyPoller()) << "Fetched" << readings.count() << "energy samples from" << meter.meterId();
    emit energyReadingsFetched(readings);
    return true;
}
