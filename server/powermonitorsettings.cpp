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

#include "powermonitorsettings.h"
#include "loggingcategories.h"

#include <QCoreApplication>
#include <QStandardPaths>
#include <QDir>

PowerMonitorSettings::PowerMonitorSettings(const QString &fileName, QObject *parent):
    QSettings(fileName.isEmpty() ? settingsPath() + "/powermonitor.conf" : fileName, QSettings::IniFormat, parent)
{
    qCDebug(dcPowerMonitor()) << "Using configuration from" << QSettings::fileName();
}

QString PowerMonitorSettings::settingsPath()
{
    QString path = QString::fromLocal8Bit(qgetenv("POWERMONITOR_SETTINGS_PATH"));
    if (!path.isEmpty()) {
        return QDir(path).absolutePath();
    }
    return QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
}

QString PowerMonitorSettings::storagePath()
{
    QString path = QString::fromLocal8Bit(qgetenv("POWERMONITOR_STORAGE_PATH"));
    if (!path.isEmpty()) {
        return QDir(path).absolutePath();
    }
    return QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
}

QString PowerMonitorSettings::databaseFile(const QString &storageDirectory) const
{
    QString file = value("Storage/databaseFile", "powermonitor.sqlite").toString();
    if (QDir::isAbsolutePath(file)) {
        return file;
    }
    return QDir(storageDirectory).absoluteFilePath(file);
}

PollerConfig PowerMonitorSettings::readingPollerConfig() const
{
    PollerConfig config;
    config.requestTimeout = value("Polling/readTimeout", 5000).toInt();
    config.maxConsecutiveFailures = value("Polling/maxConsecutiveFailures", 5).toInt();
    config.backoffInterval = value("Polling/readBackoff", 30000).toInt();
    return config;
}

PollerConfig PowerMonitorSettings::energyPollerConfig() const
{
    PollerConfig config;
    config.requestTimeout = value("Polling/energyTimeout", 10000).toInt();
    config.maxConsecutiveFailures = value("Polling/maxConsecutiveFailures", 5).toInt();
    config.backoffInterval = value("Polling/energyBackoff", 60000).toInt();
    return config;
}

QueryConfig PowerMonitorSettings::queryConfig() const
{
    QueryConfig config;
    config.targetPoints = value("Query/targetPoints", 10000).toInt();
    config.defaultLimit = value("Query/defaultLimit", 10000).toInt();
    return config;
}

RetentionConfig PowerMonitorSettings::retentionConfig() const
{
    RetentionConfig config;
    config.maintenanceInterval = value("Retention/maintenanceInterval", 3600).toInt();
    config.minFreeSpace = value("Retention/minFreeSpaceMB", 1024).toLongLong() * 1024 * 1024;
    config.safetyMargin = value("Retention/safetyMarginMB", 512).toLongLong() * 1024 * 1024;
    config.compactAfterDays = value("Retention/compactAfterDays", 90).toInt();
    config.deleteBatchDays = value("Retention/deleteBatchDays", 30).toInt();
    config.walLimit = value("Retention/walLimitMB", 100).toLongLong() * 1024 * 1024;
    config.retentionDays = value("Retention/retentionDays", 0).toInt();
    return config;
}
