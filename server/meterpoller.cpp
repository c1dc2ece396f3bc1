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

#include "meterpoller.h"
#include "loggingcategories.h"

#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonArray>
#include <QVariantMap>

MeterPoller::MeterPoller(const PollerConfig &config, QNetworkAccessManager *networkManager, QObject *parent):
    PollerSupervisor(config, networkManager, parent)
{

}

QByteArray MeterPoller::requestBody()
{
    QVariantMap body;
    body.insert("registers", QStringList() << "UrmsA" << "IrmsA" << "PmeanA" << "QmeanA" << "SmeanA" << "PFmeanA" << "Freq");
    return QJsonDocument::fromVariant(body).toJson(QJsonDocument::Compact);
}

bool MeterPoller::parseReading(const QString &meterId, const QByteArray &data, const QDateTime &timestamp, PowerReading *reading)
{
    QJsonParseError error;
    QJsonDocument jsonDoc = QJsonDocument::fromJson(data, &error);
    if (error.error != QJsonParseError::NoError || !jsonDoc.isObject()) {
        qCWarning(dcMeterPoller()) << "Cannot parse response from" << meterId << ":" << error.errorString();
        return false;
    }

    QJsonObject response = jsonDoc.object();
    if (!response.value("success").toBool(false)) {
        qCWarning(dcMeterPoller()) << "Meter" << meterId << "did not report success";
        return false;
    }
    if (!response.value("data").isArray()) {
        qCWarning(dcMeterPoller()) << "Response from" << meterId << "has no data";
        return false;
    }

    QHash<QString, double> values;
    foreach (const QJsonValue &entry, response.value("data").toArray()) {
        QJsonObject item = entry.toObject();
        if (item.contains("error")) {
            qCDebug(dcMeterPoller()) << "Meter" << meterId << "could not read register" << item.value("name").toString() << item.value("error").toVariant();
            continue;
        }
        values.insert(item.value("name").toString(), item.value("value").toDouble());
    }

    double activePower = values.value("PmeanA", 0);
    double apparentPower = values.value("SmeanA", 0);
    double powerFactor = values.value("PFmeanA", 0);
    if (qFuzzyIsNull(powerFactor) && apparentPower > 0) {
        powerFactor = activePower / apparentPower;
    }

    *reading = PowerReading(timestamp, meterId,
                            values.value("UrmsA", 0),
                            values.value("IrmsA", 0),
                            activePower,
                            values.value("QmeanA", 0),
                            apparentPower,
                            powerFactor,
                            values.value("Freq", 0));
    return true;
}

const QLoggingCategory &MeterPoller::loggingCategory() const
{
    return dcMeterPoller();
}

int MeterPoller::pollInterval(const Meter &meter) const
{
    return meter.pollInterval();
}

QNetworkReply *MeterPoller::sendRequest(QNetworkAccessManager *networkManager, const Meter &meter)
{
    QNetworkRequest request(QUrl(QString("http://%1/api/read").arg(meter.address())));
    request.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");
    return networkManager->post(request, requestBody());
}

bool MeterPoller::handleResponse(const Meter &meter, const QByteArray &data)
{
    PowerReading reading;
    if (!parseReading(meter.meterId(), data, QDateTime::currentDateTime(), &reading)) {
        return false;
    }
    qCDebug(dcMeterPoller()) << "Reading from" << meter.meterId() << reading.activePower() << "W, PF" << reading.powerFactor();
    emit readingFetched(reading);
    return true;
}
