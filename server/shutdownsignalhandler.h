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

#ifndef SHUTDOWNSIGNALHANDLER_H
#define SHUTDOWNSIGNALHANDLER_H

#include <QObject>
#include <QList>

#include <signal.h>

class QSocketNotifier;

// Turns SIGINT/SIGTERM into a queued shutdownRequested() signal. The POSIX handler only writes
// the signal number to a socket pair, everything else happens in the event loop.
class ShutdownSignalHandler : public QObject
{
    Q_OBJECT
public:
    explicit ShutdownSignalHandler(QObject *parent = nullptr);
    ~ShutdownSignalHandler() override;

    bool install(const QList<int> &signalNumbers = QList<int>() << SIGINT << SIGTERM);

signals:
    void shutdownRequested(int signalNumber);

private slots:
    void onSocketActivated();

private:
    static void handleSignal(int signalNumber);

    static int s_socketPair[2];

    QSocketNotifier *m_notifier = nullptr;
    QList<int> m_installedSignals;
};

#endif // SHUTDOWNSIGNALHANDLER_H
