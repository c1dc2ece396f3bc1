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

#include "retentionmanager.h"
#include "powerlogstore.h"
#include "diskspaceinfo.h"
#include "loggingcategories.h"

#include <QUuid>

RetentionManager::RetentionManager(const QString &databaseFile, const RetentionConfig &config, DiskSpaceInfo *diskSpaceInfo, QObject *parent):
    QObject(parent),
    m_databaseFile(databaseFile),
    m_config(config),
    m_diskSpaceInfo(diskSpaceInfo)
{

}

RetentionManager::~RetentionManager()
{
    shutdown();
}

RetentionConfig RetentionManager::config() const
{
    return m_config;
}

void RetentionManager::init()
{
    if (m_store) {
        return;
    }

    m_store = new PowerLogStore(m_databaseFile, "powermonitor-retention-" + QUuid::createUuid().toString(), this);
    if (!m_store->open()) {
        qCCritical(dcRetention()) << "Unable to open the power log DB for maintenance. Retention is disabled.";
        delete m_store;
        m_store = nullptr;
        return;
    }

    m_maintenanceTimer = new QTimer(this);
    m_maintenanceTimer->setInterval(m_config.maintenanceInterval * 1000);
    connect(m_maintenanceTimer, &QTimer::timeout, this, &RetentionManager::runMaintenance);
    m_maintenanceTimer->start();

    qCInfo(dcRetention()) << "Retention manager started. Maintenance every" << m_config.maintenanceInterval << "s, minimum free space"
                          << m_config.minFreeSpace / 1024 / 1024 << "MB";
}

void RetentionManager::shutdown()
{
    if (m_maintenanceTimer) {
        m_maintenanceTimer->stop();
        delete m_maintenanceTimer;
        m_maintenanceTimer = nullptr;
    }
    if (m_store) {
        delete m_store;
        m_store = nullptr;
    }
}

void RetentionManager::runMaintenance()
{
    if (!m_store) {
        qCWarning(dcRetention()) << "Power log DB not available. Skipping maintenance.";
        return;
    }

    QDateTime startTime = QDateTime::currentDateTime();
    qCDebug(dcRetention()) << "Starting maintenance cycle";

    // Every step runs regardless of the previous one failing
    if (!checkpointLog()) {
        qCWarning(dcRetention()) << "WAL checkpoint failed. Continuing maintenance.";
    }

    logStatistics();

    if (!enforceRetentionDays()) {
        qCWarning(dcRetention()) << "Deleting data beyond the retention period failed. Continuing maintenance.";
    }

    qint64 free = freeSpace();
    if (free < 0) {
        qCWarning(dcRetention()) << "Free disk space unknown. Skipping space management.";
    } else if (free < m_config.minFreeSpace) {
        qCWarning(dcRetention()) << "Low disk space:" << free / 1024 / 1024 << "MB free, minimum is" << m_config.minFreeSpace / 1024 / 1024 << "MB. Compacting old data.";

        int compacted = compactOlderThan(QDateTime::currentDateTime().addDays(-m_config.compactAfterDays));
        if (compacted < 0) {
            qCWarning(dcRetention()) << "Compaction failed. Continuing maintenance.";
        }

        free = freeSpace();
        if (free >= 0 && free < m_config.minFreeSpace) {
            qCWarning(dcRetention()) << "Still low on disk space after compaction:" << free / 1024 / 1024 << "MB free. Deleting oldest data.";
            int deleted = deleteOldestBatches(m_config.minFreeSpace + m_config.safetyMargin);
            if (deleted < 0) {
                qCWarning(dcRetention()) << "Deleting oldest data failed. Continuing maintenance.";
            }
        }
    }

    qCDebug(dcRetention()) << "Maintenance cycle finished in" << startTime.msecsTo(QDateTime::currentDateTime()) << "ms";
    emit maintenanceFinished();
}

void RetentionManager::compactOldData(int olderThanDays)
{
    if (!m_store) {
        qCWarning(dcRetention()) << "Power log DB not available. Cannot compact.";
        emit compactionFinished(-1);
        return;
    }
    int removed = compactOlderThan(QDateTime::currentDateTime().addDays(-olderThanDays));
    emit compactionFinished(removed);
}

void RetentionManager::vacuum()
{
    if (!m_store) {
        qCWarning(dcRetention()) << "Power log DB not available. Cannot vacuum.";
        emit vacuumFinished(false);
        return;
    }
    bool success = m_store->checkpoint();
    success &= m_store->vacuum();
    emit vacuumFinished(success);
}

bool RetentionManager::checkpointLog()
{
    bool success = m_store->checkpoint();
    qint64 logSize = m_store->logSize();
    if (logSize > m_config.walLimit) {
        qCWarning(dcRetention()) << "WAL is still" << logSize / 1024 / 1024 << "MB after checkpointing. Forcing a full vacuum.";
        success = m_store->vacuum() && m_store->checkpoint();
    }
    return success;
}

void RetentionManager::logStatistics()
{
    qint64 readings = m_store->totalReadingCount();
    qint64 energyReadings = m_store->totalEnergyReadingCount();
    QDateTime oldest = m_store->oldestTimestamp();
    QDateTime newest = m_store->newestTimestamp();

    qCInfo(dcRetention()).nospace() << "Power log DB: " << m_store->databaseSize() / 1024 / 1024 << "MB (WAL " << m_store->logSize() / 1024 << "kB), "
                                    << readings << " readings, " << energyReadings << " energy samples, free disk space: " << freeSpace() / 1024 / 1024 << "MB";
    if (oldest.isValid() && newest.isValid()) {
        qCInfo(dcRetention()).nospace() << "Data covers " << oldest.daysTo(newest) << " days (" << oldest.toString(Qt::ISODate) << " - " << newest.toString(Qt::ISODate) << ")";
    }
}

bool RetentionManager::enforceRetentionDays()
{
    if (m_config.retentionDays <= 0) {
        return true;
    }
    QDateTime cutoff = QDateTime::currentDateTime().addDays(-m_config.retentionDays);
    int deleted = m_store->deleteOlderThan(cutoff);
    if (deleted < 0) {
        return false;
    }
    if (deleted > 0) {
        qCInfo(dcRetention()) << "Deleted" << deleted << "rows older than" << m_config.retentionDays << "days";
        emit rowsDeleted(deleted);
    }
    return true;
}

qint64 RetentionManager::freeSpace() const
{
    if (!m_diskSpaceInfo) {
        return -1;
    }
    return m_diskSpaceInfo->bytesFree(m_databaseFile);
}

int RetentionManager::compactOlderThan(const QDateTime &beforeTime)
{
    qCInfo(dcRetention()) << "Compacting data older than" << beforeTime.toString(Qt::ISODate) << "into hourly averages";
    int removed = m_store->compactOlderThan(beforeTime);
    if (removed < 0) {
        return -1;
    }
    qCInfo(dcRetention()) << "Compaction removed" << removed << "rows";

    // Freed pages only show up on disk after a vacuum
    if (removed > 0 && (!m_store->checkpoint() || !m_store->vacuum())) {
        qCWarning(dcRetention()) << "Unable to release the space freed by compaction";
    }
    return removed;
}

int RetentionManager::deleteOldestBatches(qint64 targetFreeSpace)
{
    int total = 0;
    forever {
        qint64 free = freeSpace();
        if (free < 0) {
            return total > 0 ? total : -1;
        }
        if (free >= targetFreeSpace) {
            qCInfo(dcRetention()) << "Target free space reached:" << free / 1024 / 1024 << "MB";
            break;
        }

        QDateTime oldest = m_store->oldestTimestamp();
        if (!oldest.isValid()) {
            qCWarning(dcRetention()) << "No more data to delete, still only" << free / 1024 / 1024 << "MB free";
            break;
        }

        QDateTime cutoff = oldest.addDays(m_config.deleteBatchDays);
        int deleted = m_store->deleteOlderThan(cutoff);
        if (deleted < 0) {
            return total > 0 ? total : -1;
        }
        total += deleted;
        qCInfo(dcRetention()) << "Deleted" << deleted << "rows older than" << cutoff.toString(Qt::ISODate) << "Total:" << total;

        if (!m_store->checkpoint() || !m_store->vacuum()) {
            qCWarning(dcRetention()) << "Unable to release the space freed by deletion";
        }

        if (deleted == 0) {
            break;
        }
    }

    if (total > 0) {
        emit rowsDeleted(total);
    }
    return total;
}
