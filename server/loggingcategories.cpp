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

#include "loggingcategories.h"

Q_LOGGING_CATEGORY(dcPowerMonitor, "PowerMonitor", QtInfoMsg)
Q_LOGGING_CATEGORY(dcPowerStore, "PowerStore", QtInfoMsg)
Q_LOGGING_CATEGORY(dcPowerLogs, "PowerLogs", QtInfoMsg)
Q_LOGGING_CATEGORY(dcRetention, "Retention", QtInfoMsg)
Q_LOGGING_CATEGORY(dcMeterPoller, "MeterPoller", QtInfoMsg)
Q_LOGGING_CATEGORY(dcEnergyPoller, "EnergyPoller", QtInfoMsg)
