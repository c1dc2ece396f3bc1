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

#ifndef RETENTIONMANAGER_H
#define RETENTIONMANAGER_H

#include <QObject>
#include <QDateTime>
#include <QTimer>

class PowerLogStore;
class DiskSpaceInfo;

struct RetentionConfig
{
    // Seconds between two maintenance cycles
    int maintenanceInterval = 3600;
    // Bytes
    qint64 minFreeSpace = 1024ll * 1024 * 1024;
    qint64 safetyMargin = 512ll * 1024 * 1024;
    int compactAfterDays = 90;
    int deleteBatchDays = 30;
    qint64 walLimit = 100ll * 1024 * 1024;
    // 0 keeps data until disk pressure removes it
    int retentionDays = 0;
};

/*! Keeps the power log DB bounded. Every cycle checkpoints the WAL and, when the volume runs low on space,
 *  first compacts old readings into hourly averages and only then deletes the oldest data in batches.
 *
 *  The manager opens its own connection to the DB in init(), so it can live on a worker thread
 *  and a long VACUUM never blocks the write path.
 */
class RetentionManager : public QObject
{
    Q_OBJECT
public:
    explicit RetentionManager(const QString &databaseFile, const RetentionConfig &config, DiskSpaceInfo *diskSpaceInfo, QObject *parent = nullptr);
    ~RetentionManager() override;

    RetentionConfig config() const;

public slots:
    // Opens the DB connection and starts the periodic cycle in the calling thread
    void init();
    // Stops the cycle and closes the connection, to be called in the thread that ran init()
    void shutdown();

    void runMaintenance();
    void compactOldData(int olderThanDays);
    void vacuum();

signals:
    void maintenanceFinished();
    void compactionFinished(int removedRows);
    void rowsDeleted(int deletedRows);
    void vacuumFinished(bool success);

private:
    bool checkpointLog();
    void logStatistics();
    bool enforceRetentionDays();
    qint64 freeSpace() const;
    int compactOlderThan(const QDateTime &beforeTime);
    int deleteOldestBatches(qint64 targetFreeSpace);

private:
    QString m_databaseFile;
    RetentionConfig m_config;
    DiskSpaceInfo *m_diskSpaceInfo = nullptr;

    PowerLogStore *m_store = nullptr;
    QTimer *m_maintenanceTimer = nullptr;
};

#endif // RETENTIONMANAGER_H
