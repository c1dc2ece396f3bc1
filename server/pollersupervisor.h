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

#ifndef POLLERSUPERVISOR_H
#define POLLERSUPERVISOR_H

#include <QObject>
#include <QHash>
#include <QTimer>
#include <QPointer>
#include <QLoggingCategory>
#include <QNetworkAccessManager>
#include <QNetworkReply>

#include "meter.h"

struct PollerConfig
{
    // ms until a request is aborted and counted as failure
    int requestTimeout = 5000;
    int maxConsecutiveFailures = 5;
    // ms to wait after maxConsecutiveFailures before polling again
    int backoffInterval = 30000;
};

class PollerSupervisor;

/*! The poll loop of one meter: fetch, hand off the sample, sleep, repeat.
 *  After too many consecutive failures the loop sleeps for the backoff interval instead and starts
 *  counting from zero again afterwards.
 */
class PollTask : public QObject
{
    Q_OBJECT
public:
    enum State {
        StateIdle,
        StatePolling,
        StateWaiting,
        StateBackoff,
        StateStopped
    };
    Q_ENUM(State)

    PollTask(PollerSupervisor *supervisor, const Meter &meter, int interval, const PollerConfig &config);

    Meter meter() const;
    State state() const;
    int consecutiveFailures() const;

    void start();
    // Cancels the pending sleep or the request in flight. The task never calls back into the supervisor afterwards.
    void stop();

signals:
    void stateChanged(PollTask::State state);

private slots:
    void poll();
    void onReplyFinished();
    void onRequestTimeout();

private:
    void setState(State state);
    void succeeded();
    void failed(const QString &reason);

    PollerSupervisor *m_supervisor = nullptr;
    Meter m_meter;
    int m_interval = 1000;
    PollerConfig m_config;

    State m_state = StateIdle;
    int m_consecutiveFailures = 0;

    QTimer m_sleepTimer;
    QTimer m_timeoutTimer;
    QPointer<QNetworkReply> m_reply;
};

/*! Owns one PollTask per meter. Tasks are only created and destroyed from startPolling() and stopPolling(),
 *  so at most one loop per meter exists at any time.
 */
class PollerSupervisor : public QObject
{
    Q_OBJECT
public:
    // networkManager is used for all requests if given, otherwise the supervisor creates its own
    explicit PollerSupervisor(const PollerConfig &config, QNetworkAccessManager *networkManager = nullptr, QObject *parent = nullptr);
    ~PollerSupervisor() override;

    PollerConfig config() const;

    // Stops a running loop for the meter and starts a new one if the meter is enabled
    void startPolling(const Meter &meter);
    // No-op for meters without a loop
    void stopPolling(const QString &meterId);
    void stopAll();

    int taskCount() const;
    bool hasTask(const QString &meterId) const;
    PollTask::State state(const QString &meterId) const;

protected:
    virtual const QLoggingCategory &loggingCategory() const = 0;
    virtual int pollInterval(const Meter &meter) const = 0;
    virtual QNetworkReply *sendRequest(QNetworkAccessManager *networkManager, const Meter &meter) = 0;
    // Returns false if data is not a valid sample
    virtual bool handleResponse(const Meter &meter, const QByteArray &data) = 0;

private:
    friend class PollTask;

    PollerConfig m_config;
    QNetworkAccessManager *m_networkManager = nullptr;
    QHash<QString, PollTask*> m_tasks;
};

#endif // POLLERSUPERVISOR_H
