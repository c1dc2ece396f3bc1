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

#include "shutdownsignalhandler.h"
#include "loggingcategories.h"

#include <QSocketNotifier>

#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

int ShutdownSignalHandler::s_socketPair[2] = { -1, -1 };

ShutdownSignalHandler::ShutdownSignalHandler(QObject *parent):
    QObject(parent)
{

}

ShutdownSignalHandler::~ShutdownSignalHandler()
{
    foreach (int signalNumber, m_installedSignals) {
        ::signal(signalNumber, SIG_DFL);
    }
    if (m_notifier) {
        delete m_notifier;
        ::close(s_socketPair[0]);
        ::close(s_socketPair[1]);
        s_socketPair[0] = -1;
        s_socketPair[1] = -1;
    }
}

bool ShutdownSignalHandler::install(const QList<int> &signalNumbers)
{
    if (m_notifier) {
        qCWarning(dcPowerMonitor()) << "Shutdown signal handler already installed";
        return false;
    }
    if (s_socketPair[0] >= 0) {
        qCWarning(dcPowerMonitor()) << "Another shutdown signal handler is installed already";
        return false;
    }

    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, s_socketPair) != 0) {
        qCWarning(dcPowerMonitor()) << "Cannot create shutdown signal socket pair:" << strerror(errno);
        s_socketPair[0] = -1;
        s_socketPair[1] = -1;
        return false;
    }

    m_notifier = new QSocketNotifier(s_socketPair[1], QSocketNotifier::Read, this);
#if QT_VERSION < QT_VERSION_CHECK(5, 15, 0)
    connect(m_notifier, &QSocketNotifier::activated, this, &ShutdownSignalHandler::onSocketActivated);
#else
    connect(m_notifier, QOverload<QSocketDescriptor, QSocketNotifier::Type>::of(&QSocketNotifier::activated), this, &ShutdownSignalHandler::onSocketActivated);
#endif

    foreach (int signalNumber, signalNumbers) {
        struct sigaction action;
        memset(&action, 0, sizeof(action));
        action.sa_handler = &ShutdownSignalHandler::handleSignal;
        sigemptyset(&action.sa_mask);
        action.sa_flags = SA_RESTART;
        if (::sigaction(signalNumber, &action, nullptr) != 0) {
            qCWarning(dcPowerMonitor()) << "Cannot install handler for signal" << signalNumber << strerror(errno);
            continue;
        }
        m_installedSignals.append(signalNumber);
    }
    return !m_installedSignals.isEmpty();
}

void ShutdownSignalHandler::handleSignal(int signalNumber)
{
    // Async-signal-safe calls only
    char number = static_cast<char>(signalNumber);
    ssize_t written = ::write(s_socketPair[0], &number, sizeof(number));
    Q_UNUSED(written)
}

void ShutdownSignalHandler::onSocketActivated()
{
    m_notifier->setEnabled(false);
    char number = 0;
    if (::read(s_socketPair[1], &number, sizeof(number)) != sizeof(number)) {
        qCWarning(dcPowerMonitor()) << "Cannot read from shutdown signal socket:" << strerror(errno);
        m_notifier->setEnabled(true);
        return;
    }
    m_notifier->setEnabled(true);

    qCInfo(dcPowerMonitor()) << "Received signal" << static_cast<int>(number) << "- shutting down";
    emit shutdownRequested(static_cast<int>(number));
}
