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

#include "pollersupervisor.h"

PollTask::PollTask(PollerSupervisor *supervisor, const Meter &meter, int interval, const PollerConfig &config):
    QObject(supervisor),
    m_supervisor(supervisor),
    m_meter(meter),
    m_interval(interval),
    m_config(config)
{
    m_sleepTimer.setSingleShot(true);
    connect(&m_sleepTimer, &QTimer::timeout, this, &PollTask::poll);

    m_timeoutTimer.setSingleShot(true);
    m_timeoutTimer.setInterval(m_config.requestTimeout);
    connect(&m_timeoutTimer, &QTimer::timeout, this, &PollTask::onRequestTimeout);
}

Meter PollTask::meter() const
{
    return m_meter;
}

PollTask::State PollTask::state() const
{
    return m_state;
}

int PollTask::consecutiveFailures() const
{
    return m_consecutiveFailures;
}

void PollTask::start()
{
    if (m_state != StateIdle) {
        return;
    }
    setState(StateWaiting);
    m_sleepTimer.start(0);
}

void PollTask::stop()
{
    m_sleepTimer.stop();
    m_timeoutTimer.stop();
    if (m_reply) {
        QNetworkReply *reply = m_reply;
        m_reply.clear();
        disconnect(reply, nullptr, this, nullptr);
        reply->abort();
        reply->deleteLater();
    }
    setState(StateStopped);
}

void PollTask::poll()
{
    if (m_state == StateStopped) {
        return;
    }
    if (m_state == StateBackoff) {
        qCInfo(m_supervisor->loggingCategory()) << "Backoff for" << m_meter.meterId() << "is over. Polling again.";
        m_consecutiveFailures = 0;
    }

    setState(StatePolling);
    m_reply = m_supervisor->sendRequest(m_supervisor->m_networkManager, m_meter);
    if (!m_reply) {
        failed("Unable to send request");
        return;
    }
    connect(m_reply.data(), &QNetworkReply::finished, this, &PollTask::onReplyFinished);
    m_timeoutTimer.start();
}

void PollTask::onReplyFinished()
{
    m_timeoutTimer.stop();
    QNetworkReply *reply = m_reply;
    m_reply.clear();
    if (!reply) {
        return;
    }
    reply->deleteLater();

    if (reply->error() != QNetworkReply::NoError) {
        failed(reply->errorString());
        return;
    }
    int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (status < 200 || status >= 300) {
        failed(QString("HTTP status %1").arg(status));
        return;
    }

    if (!m_supervisor->handleResponse(m_meter, reply->readAll())) {
        failed("Invalid response");
        return;
    }
    succeeded();
}

void PollTask::onRequestTimeout()
{
    if (!m_reply) {
        return;
    }
    QNetworkReply *reply = m_reply;
    m_reply.clear();
    disconnect(reply, nullptr, this, nullptr);
    reply->abort();
    reply->deleteLater();
    failed(QString("No response within %1 ms").arg(m_config.requestTimeout));
}

void PollTask::setState(State state)
{
    if (m_state == state) {
        return;
    }
    m_state = state;
    emit stateChanged(state);
}

void PollTask::succeeded()
{
    m_consecutiveFailures = 0;
    setState(StateWaiting);
    m_sleepTimer.start(m_interval);
}

void PollTask::failed(const QString &reason)
{
    m_consecutiveFailures++;
    qCWarning(m_supervisor->loggingCategory()).nospace() << "Polling " << m_meter.meterId() << " at " << m_meter.address() << " failed ("
                                                          << m_consecutiveFailures << "/" << m_config.maxConsecutiveFailures << "): " << reason;

    if (m_consecutiveFailures >= m_config.maxConsecutiveFailures) {
        qCWarning(m_supervisor->loggingCategory()) << "Meter" << m_meter.meterId() << "failed" << m_consecutiveFailures << "times in a row. Backing off for" << m_config.backoffInterval << "ms";
        setState(StateBackoff);
        m_sleepTimer.start(m_config.backoffInterval);
        return;
    }

    setState(StateWaiting);
    m_sleepTimer.start(m_interval);
}

PollerSupervisor::PollerSupervisor(const PollerConfig &config, QNetworkAccessManager *networkManager, QObject *parent):
    QObject(parent),
    m_config(config),
    m_networkManager(networkManager)
{
    if (!m_networkManager) {
        m_networkManager = new QNetworkAccessManager(this);
    }
}

PollerSupervisor::~PollerSupervisor()
{
    // No virtual calls in here, the subclass is gone already
    foreach (PollTask *task, m_tasks) {
        task->stop();
    }
    m_tasks.clear();
}

PollerConfig PollerSupervisor::config() const
{
    return m_config;
}

void PollerSupervisor::startPolling(const Meter &meter)
{
    stopPolling(meter.meterId());

    if (!meter.enabled()) {
        qCDebug(loggingCategory()) << "Meter" << meter.meterId() << "is disabled. Not polling it.";
        return;
    }

    PollTask *task = new PollTask(this, meter, pollInterval(meter), m_config);
    m_tasks.insert(meter.meterId(), task);
    task->start();
    qCInfo(loggingCategory()) << "Started polling" << meter.meterId() << "at" << meter.address() << "every" << pollInterval(meter) << "ms";
}

void PollerSupervisor::stopPolling(const QString &meterId)
{
    PollTask *task = m_tasks.take(meterId);
    if (!task) {
        return;
    }
    task->stop();
    task->deleteLater();
    qCInfo(loggingCategory()) << "Stopped polling" << meterId;
}

void PollerSupervisor::stopAll()
{
    foreach (const QString &meterId, m_tasks.keys()) {
        stopPolling(meterId);
    }
}

int PollerSupervisor::taskCount() const
{
    return m_tasks.count();
}

bool PollerSupervisor::hasTask(const QString &meterId) const
{
    return m_tasks.contains(meterId);
}

PollTask::State PollerSupervisor::state(const QString &meterId) const
{
    PollTask *task = m_tasks.value(meterId);
    if (!task) {
        return PollTask::StateStopped;
    }
    return task->state();
}
