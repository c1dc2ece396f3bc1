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
#include "powermanagerimpl.h"
#include "powerlogstore.h"
#include "shutdownsignalhandler.h"
#include "loggingcategories.h"

#include <QCoreApplication>
#include <QCommandLineParser>
#include <QLoggingCategory>
#include <QDir>

int main(int argc, char *argv[])
{
    QCoreApplication application(argc, argv);
    application.setApplicationName("powermonitor");
    application.setOrganizationName("powermonitor");
    application.setApplicationVersion(POWERMONITOR_VERSION);

    QCommandLineParser parser;
    parser.setApplicationDescription("Polls networked power meters and keeps their readings in a bounded time series store.");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOption(QStringList() << "c" << "config", "Configuration file to use instead of powermonitor.conf in the settings directory.", "file");
    parser.addOption(configOption);
    QCommandLineOption storageOption(QStringList() << "s" << "storage", "Directory for the power log database.", "directory");
    parser.addOption(storageOption);
    QCommandLineOption debugOption(QStringList() << "d" << "debug", "Enable debug output for the given logging categories, comma separated (e.g. \"PowerStore,Retention\"). \"all\" enables everything.", "categories");
    parser.addOption(debugOption);
    parser.process(application);

    if (parser.isSet(debugOption)) {
        QStringList rules;
        foreach (const QString &category, parser.value(debugOption).split(',', Qt::SkipEmptyParts)) {
            if (category.trimmed() == "all") {
                rules << "*.debug=true";
            } else {
                rules << category.trimmed() + ".debug=true";
            }
        }
        QLoggingCategory::setFilterRules(rules.join('\n'));
    }

    PowerMonitorSettings settings(parser.value(configOption));
    QString storagePath = parser.isSet(storageOption) ? QDir(parser.value(storageOption)).absolutePath() : PowerMonitorSettings::storagePath();

    PowerLogStore *store = new PowerLogStore(settings.databaseFile(storagePath), "powermonitor");
    if (!store->open()) {
        qCCritical(dcPowerMonitor()) << "Unable to initialize the power log DB at" << store->databaseFile() << "- exiting.";
        delete store;
        return 1;
    }

    PowerManagerImpl::Configuration configuration;
    configuration.query = settings.queryConfig();
    configuration.readingPoller = settings.readingPollerConfig();
    configuration.energyPoller = settings.energyPollerConfig();
    configuration.retention = settings.retentionConfig();

    PowerManagerImpl powerManager(store, configuration);

    ShutdownSignalHandler shutdownSignalHandler;
    QObject::connect(&shutdownSignalHandler, &ShutdownSignalHandler::shutdownRequested, &application, &QCoreApplication::quit);
    if (!shutdownSignalHandler.install()) {
        qCWarning(dcPowerMonitor()) << "Running without SIGINT/SIGTERM handling";
    }

    qCInfo(dcPowerMonitor()) << "powermonitor" << application.applicationVersion() << "running. DB:" << store->databaseFile();
    return application.exec();
}
