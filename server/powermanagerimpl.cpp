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

#include "powermanagerimpl.h"
#include "powerlogstore.h"
#include "meterpoller.h"
#include "energypoller.h"
#include "loggingcategories.h"

PowerManagerImpl::PowerManagerImpl(PowerLogStore *store, const Configuration &configuration, QObject *parent):
    PowerManager(parent),
    m_store(store)
{
    m_store->setParent(this);

    DiskSpaceInfo *diskSpaceInfo = configuration.diskSpaceInfo;
    if (!diskSpaceInfo) {
        diskSpaceInfo = &m_volumeDiskSpaceInfo;
    }

    m_logger = new PowerLogger(m_store, configuration.query, diskSpaceInfo, this);

    m_meterPoller = new MeterPoller(configuration.readingPoller, configuration.readingNetworkManager, this);
    connect(m_meterPoller, &MeterPoller::readingFetched, this, &PowerManagerImpl::submitReading);

    m_energyPoller = new EnergyPoller(configuration.energyPoller, configuration.energyNetworkManager, this);
    connect(m_energyPoller, &EnergyPoller::energyReadingsFetched, this, [this](const EnergyReadings &readings) {
        foreach (const EnergyReading &reading, readings) {
            submitEnergyReading(reading);
        }
    });

    // Maintenance gets its own thread and DB connection
    m_retentionThread = new QThread(this);
    m_retentionThread->setObjectName("PowerMonitorRetention");
    m_retentionManager = new RetentionManager(m_store->databaseFile(), configuration.retention, diskSpaceInfo);
    m_retentionManager->moveToThread(m_retentionThread);
    connect(m_retentionThread, &QThread::started, m_retentionManager, &RetentionManager::init);
    connect(m_retentionThread, &QThread::finished, m_retentionManager, &QObject::deleteLater);
    connect(m_retentionManager, &RetentionManager::maintenanceFinished, this, &PowerManager::maintenanceFinished);
    connect(m_retentionManager, &RetentionManager::compactionFinished, this, &PowerManager::compactionFinished);
    connect(m_retentionManager, &RetentionManager::vacuumFinished, this, &PowerManager::vacuumFinished);
    m_retentionThread->start();

    foreach (const Meter &meter, m_store->meters()) {
        qCDebug(dcPowerMonitor()) << "Loaded" << meter;
        startPolling(meter);
    }
    qCInfo(dcPowerMonitor()) << "Power manager started with" << m_meterPoller->taskCount() << "polled meters";
}

PowerManagerImpl::~PowerManagerImpl()
{
    m_meterPoller->stopAll();
    m_energyPoller->stopAll();

    if (m_retentionThread->isRunning()) {
        QMetaObject::invokeMethod(m_retentionManager, "shutdown", Qt::BlockingQueuedConnection);
        m_retentionThread->quit();
        m_retentionThread->wait();
    } else {
        delete m_retentionManager;
    }
    m_retentionManager = nullptr;
}

PowerManager::MeterError PowerManagerImpl::registerMeter(const Meter &meter)
{
    if (!meter.isValid()) {
        qCWarning(dcPowerMonitor()) << "Refusing to register invalid" << meter;
        return MeterErrorInvalidParameter;
    }

    bool existing = m_store->meterExists(meter.meterId());
    if (!m_store->upsertMeter(meter)) {
        return MeterErrorStorage;
    }

    startPolling(meter);

    if (existing) {
        qCInfo(dcPowerMonitor()) << "Updated" << meter;
        emit meterChanged(meter);
    } else {
        qCInfo(dcPowerMonitor()) << "Registered" << meter;
        emit meterAdded(meter);
    }
    return MeterErrorNoError;
}

PowerManager::MeterError PowerManagerImpl::updateMeter(const Meter &meter)
{
    if (!meter.isValid() || !m_store->meterExists(meter.meterId())) {
        qCWarning(dcPowerMonitor()) << "Cannot update unknown or invalid" << meter;
        return MeterErrorInvalidParameter;
    }
    if (!m_store->upsertMeter(meter)) {
        return MeterErrorStorage;
    }

    startPolling(meter);

    qCInfo(dcPowerMonitor()) << "Updated" << meter;
    emit meterChanged(meter);
    return MeterErrorNoError;
}

PowerManager::MeterError PowerManagerImpl::removeMeter(const QString &meterId)
{
    if (!m_store->meterExists(meterId)) {
        stopPolling(meterId);
        return MeterErrorNoError;
    }

    Meter removed = m_store->meter(meterId);
    stopPolling(meterId);
    if (!m_store->removeMeter(meterId)) {
        qCWarning(dcPowerMonitor()) << "Could not remove" << removed << "from the store. Resuming its polling.";
        startPolling(removed);
        return MeterErrorStorage;
    }

    qCInfo(dcPowerMonitor()) << "Removed meter" << meterId;
    emit meterRemoved(meterId);
    return MeterErrorNoError;
}

Meters PowerManagerImpl::meters() const
{
    return m_store->meters();
}

Meter PowerManagerImpl::meter(const QString &meterId) const
{
    return m_store->meter(meterId);
}

void PowerManagerImpl::submitReading(const PowerReading &reading)
{
    if (!reading.isValid()) {
        qCWarning(dcPowerMonitor()) << "Discarding invalid reading";
        return;
    }
    if (!m_logger->logReading(reading)) {
        qCWarning(dcPowerMonitor()) << "Failed to store reading of" << reading.meterId();
    }
}

void PowerManagerImpl::submitEnergyReading(const EnergyReading &reading)
{
    if (!reading.isValid()) {
        qCWarning(dcPowerMonitor()) << "Discarding invalid energy reading";
        return;
    }
    if (!m_logger->logEnergyReading(reading)) {
        qCWarning(dcPowerMonitor()) << "Failed to store energy reading of" << reading.meterId() << reading.phase();
    }
}

PowerLogs *PowerManagerImpl::logs() const
{
    return m_logger;
}

void PowerManagerImpl::runMaintenance()
{
    QMetaObject::invokeMethod(m_retentionManager, "runMaintenance", Qt::QueuedConnection);
}

void PowerManagerImpl::compactOldData(int olderThanDays)
{
    QMetaObject::invokeMethod(m_retentionManager, "compactOldData", Qt::QueuedConnection, Q_ARG(int, olderThanDays));
}

void PowerManagerImpl::vacuum()
{
    QMetaObject::invokeMethod(m_retentionManager, "vacuum", Qt::QueuedConnection);
}

MeterPoller *PowerManagerImpl::meterPoller() const
{
    return m_meterPoller;
}

EnergyPoller *PowerManagerImpl::energyPoller() const
{
    return m_energyPoller;
}

void PowerManagerImpl::startPolling(const Meter &meter)
{
    m_meterPoller->startPolling(meter);
    m_energyPoller->startPolling(meter);
}

void PowerManagerImpl::stopPolling(const QString &meterId)
{
    m_meterPoller->stopPolling(meterId);
    m_energyPoller->stopPolling(meterId);
}
