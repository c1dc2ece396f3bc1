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

#ifndef POWERMONITORSETTINGS_H
#define POWERMONITORSETTINGS_H

#include <QSettings>

#include "powerlogger.h"
#include "pollersupervisor.h"
#include "retentionmanager.h"

class PowerMonitorSettings : public QSettings
{
    Q_OBJECT
public:
    // An empty fileName means powermonitor.conf in settingsPath()
    explicit PowerMonitorSettings(const QString &fileName = QString(), QObject *parent = nullptr);

    static QString settingsPath();
    static QString storagePath();

    // Storage/databaseFile, resolved against storageDirectory if it is relative
    QString databaseFile(const QString &storageDirectory = storagePath()) const;

    PollerConfig readingPollerConfig() const;
    PollerConfig energyPollerConfig() const;
    QueryConfig queryConfig() const;
    RetentionConfig retentionConfig() const;
};

#endif // POWERMONITORSETTINGS_H
