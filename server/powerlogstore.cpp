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

#include "powerlogstore.h"
#include "loggingcategories.h"

#include <QDir>
#include <QFileInfo>
#include <QSqlQuery>
#include <QSqlError>
#include <QSqlRecord>

PowerLogStore::PowerLogStore(const QString &databaseFile, const QString &connectionName, QObject *parent):
    QObject(parent),
    m_databaseFile(databaseFile),
    m_connectionName(connectionName)
{

}

PowerLogStore::~PowerLogStore()
{
    close();
}

bool PowerLogStore::open()
{
    close();

    QFileInfo fileInfo(m_databaseFile);
    QDir path = fileInfo.absoluteDir();
    if (!path.exists()) {
        path.mkpath(path.path());
    }

    m_db = QSqlDatabase::addDatabase("QSQLITE", m_connectionName);
    m_db.setDatabaseName(m_databaseFile);
    m_db.setConnectOptions("QSQLITE_BUSY_TIMEOUT=5000");

    if (!m_db.open()) {
        qCWarning(dcPowerStore()) << "Cannot open power log DB at" << m_databaseFile << m_db.lastError();
        return false;
    }

    if (!initDB()) {
        close();
        return false;
    }
    return true;
}

void PowerLogStore::close()
{
    if (!m_db.isValid()) {
        return;
    }
    m_db.close();
    m_db = QSqlDatabase();
    QSqlDatabase::removeDatabase(m_connectionName);
}

bool PowerLogStore::isOpen() const
{
    return m_db.isValid() && m_db.isOpen();
}

QString PowerLogStore::databaseFile() const
{
    return m_databaseFile;
}

bool PowerLogStore::initDB()
{
    // Writers contending with a checkpoint or a compaction wait up to busy_timeout instead of failing right away
    if (!exec("PRAGMA journal_mode=WAL;")
            || !exec("PRAGMA synchronous=FULL;")
            || !exec("PRAGMA busy_timeout=5000;")
            || !exec("PRAGMA foreign_keys=ON;")) {
        return false;
    }

    if (!m_db.tables().contains("metadata")) {
        qCDebug(dcPowerStore()) << "No \"metadata\" table in database. Creating it.";
        if (!exec("CREATE TABLE metadata (version INT);") || !exec("INSERT INTO metadata (version) VALUES (1);")) {
            return false;
        }
    }

    if (!m_db.tables().contains("meters")) {
        qCDebug(dcPowerStore()) << "No \"meters\" table in database. Creating it.";
        if (!exec("CREATE TABLE meters "
                  "("
                  "meterId TEXT PRIMARY KEY,"
                  "address TEXT NOT NULL,"
                  "name TEXT,"
                  "location TEXT,"
                  "enabled INT DEFAULT 1,"
                  "pollInterval INT DEFAULT 1000,"
                  "energyPollInterval INT DEFAULT 30000,"
                  "lastSeen BIGINT"
                  ");")) {
            return false;
        }
    }

    if (!m_db.tables().contains("readings")) {
        qCDebug(dcPowerStore()) << "No \"readings\" table in database. Creating it.";
        if (!exec("CREATE TABLE readings "
                  "("
                  "id INTEGER PRIMARY KEY AUTOINCREMENT,"
                  "timestamp BIGINT NOT NULL,"
                  "meterId TEXT NOT NULL REFERENCES meters(meterId) ON DELETE CASCADE,"
                  "voltage FLOAT,"
                  "current FLOAT,"
                  "activePower FLOAT,"
                  "reactivePower FLOAT,"
                  "apparentPower FLOAT,"
                  "powerFactor FLOAT,"
                  "frequency FLOAT"
                  ");")) {
            return false;
        }
    }
    if (!exec("CREATE INDEX IF NOT EXISTS idx_readings_meter_time ON readings(meterId, timestamp DESC);")
            || !exec("CREATE INDEX IF NOT EXISTS idx_readings_time ON readings(timestamp DESC);")) {
        return false;
    }

    if (!m_db.tables().contains("energyReadings")) {
        qCDebug(dcPowerStore()) << "No \"energyReadings\" table in database. Creating it.";
        if (!exec("CREATE TABLE energyReadings "
                  "("
                  "id INTEGER PRIMARY KEY AUTOINCREMENT,"
                  "timestamp BIGINT NOT NULL,"
                  "meterId TEXT NOT NULL REFERENCES meters(meterId) ON DELETE CASCADE,"
                  "phase TEXT NOT NULL,"
                  "totalKwh FLOAT NOT NULL"
                  ");")) {
            return false;
        }
    }
    if (!exec("CREATE INDEX IF NOT EXISTS idx_energyReadings_meter_phase_time ON energyReadings(meterId, phase, timestamp DESC);")
            || !exec("CREATE INDEX IF NOT EXISTS idx_energyReadings_meter_time ON energyReadings(meterId, timestamp DESC);")
            || !exec("CREATE INDEX IF NOT EXISTS idx_energyReadings_time ON energyReadings(timestamp DESC);")) {
        return false;
    }

    qCDebug(dcPowerStore()) << "Initialized power log DB successfully." << m_db.databaseName();
    return true;
}

bool PowerLogStore::exec(const QString &statement)
{
    QSqlQuery query(m_db);
    if (!query.exec(statement)) {
        qCWarning(dcPowerStore()) << "Error executing statement on power log DB:" << query.lastError() << statement;
        return false;
    }
    return true;
}

bool PowerLogStore::upsertMeter(const Meter &meter)
{
    QSqlQuery query(m_db);
    query.prepare("INSERT INTO meters (meterId, address, name, location, enabled, pollInterval, energyPollInterval, lastSeen) "
                  "VALUES (?, ?, ?, ?, ?, ?, ?, ?) "
                  "ON CONFLICT(meterId) DO UPDATE SET "
                  "address = excluded.address, name = excluded.name, location = excluded.location, enabled = excluded.enabled, "
                  "pollInterval = excluded.pollInterval, energyPollInterval = excluded.energyPollInterval, lastSeen = excluded.lastSeen;");
    query.addBindValue(meter.meterId());
    query.addBindValue(meter.address());
    query.addBindValue(meter.name());
    query.addBindValue(meter.location());
    query.addBindValue(meter.enabled() ? 1 : 0);
    query.addBindValue(meter.pollInterval());
    query.addBindValue(meter.energyPollInterval());
    query.addBindValue(meter.lastSeen().isValid() ? meter.lastSeen().toMSecsSinceEpoch() : QDateTime::currentMSecsSinceEpoch());
    if (!query.exec()) {
        qCWarning(dcPowerStore()) << "Error storing meter" << meter.meterId() << query.lastError() << query.executedQuery();
        return false;
    }
    return true;
}

bool PowerLogStore::removeMeter(const QString &meterId)
{
    // readings and energyReadings follow through ON DELETE CASCADE
    QSqlQuery query(m_db);
    query.prepare("DELETE FROM meters WHERE meterId = ?;");
    query.addBindValue(meterId);
    if (!query.exec()) {
        qCWarning(dcPowerStore()) << "Error removing meter" << meterId << query.lastError() << query.executedQuery();
        return false;
    }
    return true;
}

bool PowerLogStore::meterExists(const QString &meterId) const
{
    QSqlQuery query(m_db);
    query.prepare("SELECT 1 FROM meters WHERE meterId = ?;");
    query.addBindValue(meterId);
    if (!query.exec()) {
        qCWarning(dcPowerStore()) << "Error looking up meter" << meterId << query.lastError();
        return false;
    }
    return query.next();
}

Meters PowerLogStore::meters() const
{
    Meters ret;
    QSqlQuery query(m_db);
    if (!query.exec("SELECT * FROM meters ORDER BY name, meterId;")) {
        qCWarning(dcPowerStore()) << "Failed to load meters:" << query.lastError();
        return ret;
    }
    while (query.next()) {
        ret.append(queryResultToMeter(query.record()));
    }
    return ret;
}

Meter PowerLogStore::meter(const QString &meterId) const
{
    QSqlQuery query(m_db);
    query.prepare("SELECT * FROM meters WHERE meterId = ?;");
    query.addBindValue(meterId);
    if (!query.exec()) {
        qCWarning(dcPowerStore()) << "Failed to load meter" << meterId << query.lastError();
        return Meter();
    }
    if (!query.next()) {
        return Meter();
    }
    return queryResultToMeter(query.record());
}

bool PowerLogStore::appendReading(const PowerReading &reading)
{
    QSqlQuery query(m_db);
    query.prepare("INSERT INTO readings (timestamp, meterId, voltage, current, activePower, reactivePower, apparentPower, powerFactor, frequency) "
                  "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);");
    query.addBindValue(reading.timestamp().toMSecsSinceEpoch());
    query.addBindValue(reading.meterId());
    query.addBindValue(reading.voltage());
    query.addBindValue(reading.current());
    query.addBindValue(reading.activePower());
    query.addBindValue(reading.reactivePower());
    query.addBindValue(reading.apparentPower());
    query.addBindValue(reading.powerFactor());
    query.addBindValue(reading.frequency());
    if (!query.exec()) {
        qCWarning(dcPowerStore()) << "Error logging reading for" << reading.meterId() << query.lastError() << query.executedQuery();
        return false;
    }
    return true;
}

bool PowerLogStore::appendEnergyReading(const EnergyReading &reading)
{
    QSqlQuery query(m_db);
    query.prepare("INSERT INTO energyReadings (timestamp, meterId, phase, totalKwh) VALUES (?, ?, ?, ?);");
    query.addBindValue(reading.timestamp().toMSecsSinceEpoch());
    query.addBindValue(reading.meterId());
    query.addBindValue(reading.phase());
    query.addBindValue(reading.totalKwh());
    if (!query.exec()) {
        qCWarning(dcPowerStore()) << "Error logging energy reading for" << reading.meterId() << reading.phase() << query.lastError() << query.executedQuery();
        return false;
    }
    return true;
}

PowerReading PowerLogStore::latestReading(const QString &meterId) const
{
    QSqlQuery query(m_db);
    query.prepare("SELECT * FROM readings WHERE meterId = ? ORDER BY timestamp DESC LIMIT 1;");
    query.addBindValue(meterId);
    if (!query.exec()) {
        qCWarning(dcPowerStore()) << "Error fetching latest reading from DB:" << query.lastError() << query.executedQuery();
        return PowerReading();
    }
    if (!query.next()) {
        qCDebug(dcPowerStore()) << "No reading in DB for meter" << meterId;
        return PowerReading();
    }
    return queryResultToReading(query.record());
}

EnergyReading PowerLogStore::latestEnergyReading(const QString &meterId, const QString &phase) const
{
    QSqlQuery query(m_db);
    if (phase.isEmpty() || phase == "ALL") {
        query.prepare("SELECT * FROM energyReadings WHERE meterId = ? ORDER BY timestamp DESC LIMIT 1;");
        query.addBindValue(meterId);
    } else {
        query.prepare("SELECT * FROM energyReadings WHERE meterId = ? AND phase = ? ORDER BY timestamp DESC LIMIT 1;");
        query.addBindValue(meterId);
        query.addBindValue(phase);
    }
    if (!query.exec()) {
        qCWarning(dcPowerStore()) << "Error fetching latest energy reading from DB:" << query.lastError() << query.executedQuery();
        return EnergyReading();
    }
    if (!query.next()) {
        qCDebug(dcPowerStore()) << "No energy reading in DB for meter" << meterId << "phase" << phase;
        return EnergyReading();
    }
    return queryResultToEnergyReading(query.record());
}

qint64 PowerLogStore::readingCount(const QString &meterId, const QDateTime &from, const QDateTime &to, bool *ok) const
{
    QSqlQuery query(m_db);
    query.prepare("SELECT COUNT(*) AS count FROM readings WHERE meterId = ? AND timestamp BETWEEN ? AND ?;");
    query.addBindValue(meterId);
    query.addBindValue(from.toMSecsSinceEpoch());
    query.addBindValue(to.toMSecsSinceEpoch());
    if (!query.exec() || !query.next()) {
        qCWarning(dcPowerStore()) << "Error counting readings:" << query.lastError() << query.executedQuery();
        if (ok) *ok = false;
        return 0;
    }
    if (ok) *ok = true;
    return query.value("count").toLongLong();
}

qint64 PowerLogStore::energyReadingCount(const QString &meterId, const QDateTime &from, const QDateTime &to, const QString &phase, bool *ok) const
{
    QSqlQuery query(m_db);
    QString queryString = "SELECT COUNT(*) AS count FROM energyReadings WHERE meterId = ? AND timestamp BETWEEN ? AND ?";
    QVariantList bindValues;
    bindValues << meterId << from.toMSecsSinceEpoch() << to.toMSecsSinceEpoch();
    if (!phase.isEmpty() && phase != "ALL") {
        queryString += " AND phase = ?";
        bindValues << phase;
    }
    query.prepare(queryString);
    foreach (const QVariant &bindValue, bindValues) {
        query.addBindValue(bindValue);
    }
    if (!query.exec() || !query.next()) {
        qCWarning(dcPowerStore()) << "Error counting energy readings:" << query.lastError() << query.executedQuery();
        if (ok) *ok = false;
        return 0;
    }
    if (ok) *ok = true;
    return query.value("count").toLongLong();
}

bool PowerLogStore::scanReadings(const QString &meterId, const QDateTime &from, const QDateTime &to, Qt::SortOrder order, int limit, const std::function<void (const PowerReading &)> &visitor) const
{
    QSqlQuery query(m_db);
    query.setForwardOnly(true);
    QString queryString = "SELECT * FROM readings WHERE meterId = ? AND timestamp BETWEEN ? AND ?";
    queryString += order == Qt::AscendingOrder ? " ORDER BY timestamp ASC" : " ORDER BY timestamp DESC";
    if (limit > 0) {
        queryString += " LIMIT ?";
    }
    query.prepare(queryString);
    query.addBindValue(meterId);
    query.addBindValue(from.toMSecsSinceEpoch());
    query.addBindValue(to.toMSecsSinceEpoch());
    if (limit > 0) {
        query.addBindValue(limit);
    }

    qCDebug(dcPowerStore()) << "Executing" << queryString << meterId << from << to;
    if (!query.exec()) {
        qCWarning(dcPowerStore()) << "Error fetching readings:" << query.lastError() << query.executedQuery();
        return false;
    }
    while (query.next()) {
        visitor(queryResultToReading(query.record()));
    }
    return true;
}

PowerReadings PowerLogStore::readings(const QString &meterId, const QDateTime &from, const QDateTime &to, Qt::SortOrder order, int limit, bool *ok) const
{
    PowerReadings result;
    bool success = scanReadings(meterId, from, to, order, limit, [&result](const PowerReading &reading) {
        result.append(reading);
    });
    if (ok) *ok = success;
    return result;
}

EnergyReadings PowerLogStore::energyReadings(const QString &meterId, const QDateTime &from, const QDateTime &to, const QString &phase, bool *ok) const
{
    EnergyReadings result;

    QSqlQuery query(m_db);
    query.setForwardOnly(true);
    QString queryString = "SELECT * FROM energyReadings WHERE meterId = ? AND timestamp BETWEEN ? AND ?";
    QVariantList bindValues;
    bindValues << meterId << from.toMSecsSinceEpoch() << to.toMSecsSinceEpoch();
    if (!phase.isEmpty() && phase != "ALL") {
        queryString += " AND phase = ?";
        bindValues << phase;
    }
    queryString += " ORDER BY timestamp ASC;";
    query.prepare(queryString);
    foreach (const QVariant &bindValue, bindValues) {
        query.addBindValue(bindValue);
    }
    if (!query.exec()) {
        qCWarning(dcPowerStore()) << "Error fetching energy readings:" << query.lastError() << query.executedQuery();
        if (ok) *ok = false;
        return result;
    }
    while (query.next()) {
        result.append(queryResultToEnergyReading(query.record()));
    }
    if (ok) *ok = true;
    return result;
}

QStringList PowerLogStore::energyPhases(const QString &meterId, const QDateTime &from, const QDateTime &to) const
{
    QStringList ret;
    QSqlQuery query(m_db);
    query.prepare("SELECT DISTINCT phase FROM energyReadings WHERE meterId = ? AND timestamp BETWEEN ? AND ? ORDER BY phase;");
    query.addBindValue(meterId);
    query.addBindValue(from.toMSecsSinceEpoch());
    query.addBindValue(to.toMSecsSinceEpoch());
    if (!query.exec()) {
        qCWarning(dcPowerStore()) << "Error fetching energy phases:" << query.lastError() << query.executedQuery();
        return ret;
    }
    while (query.next()) {
        ret.append(query.value("phase").toString());
    }
    return ret;
}

MeterStatistics PowerLogStore::statistics(const QString &meterId, const QDateTime &from, const QDateTime &to) const
{
    MeterStatistics stats;
    stats.meterId = meterId;
    stats.from = from;
    stats.to = to;

    QSqlQuery query(m_db);
    query.prepare("SELECT COUNT(*) AS sampleCount, "
                  "AVG(voltage) AS averageVoltage, MIN(voltage) AS minVoltage, MAX(voltage) AS maxVoltage, "
                  "AVG(current) AS averageCurrent, MAX(current) AS maxCurrent, "
                  "AVG(activePower) AS averagePower, MAX(activePower) AS maxPower, "
                  "SUM(activePower) / 3600000.0 AS totalEnergyKwh "
                  "FROM readings WHERE meterId = ? AND timestamp BETWEEN ? AND ?;");
    query.addBindValue(meterId);
    query.addBindValue(from.toMSecsSinceEpoch());
    query.addBindValue(to.toMSecsSinceEpoch());
    if (!query.exec() || !query.next()) {
        qCWarning(dcPowerStore()) << "Error calculating statistics for" << meterId << query.lastError() << query.executedQuery();
        stats.error = PowerLogs::QueryErrorStorage;
        return stats;
    }
    stats.sampleCount = query.value("sampleCount").toLongLong();
    stats.averageVoltage = query.value("averageVoltage").toDouble();
    stats.minVoltage = query.value("minVoltage").toDouble();
    stats.maxVoltage = query.value("maxVoltage").toDouble();
    stats.averageCurrent = query.value("averageCurrent").toDouble();
    stats.maxCurrent = query.value("maxCurrent").toDouble();
    stats.averagePower = query.value("averagePower").toDouble();
    stats.maxPower = query.value("maxPower").toDouble();
    stats.totalEnergyKwh = query.value("totalEnergyKwh").toDouble();
    return stats;
}

int PowerLogStore::deleteReadings(const QString &meterId)
{
    if (!m_db.transaction()) {
        qCWarning(dcPowerStore()) << "Cannot start transaction to delete readings for" << meterId << m_db.lastError();
        return -1;
    }

    int count = 0;
    foreach (const QString &table, QStringList() << "readings" << "energyReadings") {
        QSqlQuery query(m_db);
        query.prepare(QString("DELETE FROM %1 WHERE meterId = ?;").arg(table));
        query.addBindValue(meterId);
        if (!query.exec()) {
            qCWarning(dcPowerStore()) << "Error removing" << table << "for meter" << meterId << query.lastError() << query.executedQuery();
            m_db.rollback();
            return -1;
        }
        count += query.numRowsAffected();
    }

    if (!m_db.commit()) {
        qCWarning(dcPowerStore()) << "Cannot commit deletion of readings for" << meterId << m_db.lastError();
        m_db.rollback();
        return -1;
    }
    return count;
}

int PowerLogStore::deleteOlderThan(const QDateTime &beforeTime)
{
    if (!m_db.transaction()) {
        qCWarning(dcPowerStore()) << "Cannot start transaction to trim power logs:" << m_db.lastError();
        return -1;
    }

    int count = 0;
    foreach (const QString &table, QStringList() << "readings" << "energyReadings") {
        QSqlQuery query(m_db);
        query.prepare(QString("DELETE FROM %1 WHERE timestamp < ?;").arg(table));
        query.addBindValue(beforeTime.toMSecsSinceEpoch());
        if (!query.exec()) {
            qCWarning(dcPowerStore()) << "Error trimming" << table << query.lastError() << query.executedQuery();
            m_db.rollback();
            return -1;
        }
        count += query.numRowsAffected();
    }

    if (!m_db.commit()) {
        qCWarning(dcPowerStore()) << "Cannot commit trimming power logs:" << m_db.lastError();
        m_db.rollback();
        return -1;
    }
    if (count > 0) {
        qCDebug(dcPowerStore()).nospace() << "Trimmed " << count << " rows from power logs (Older than: " << beforeTime.toString() << ")";
    }
    return count;
}

qint64 PowerLogStore::totalReadingCount() const
{
    QSqlQuery query(m_db);
    if (!query.exec("SELECT COUNT(*) AS count FROM readings;") || !query.next()) {
        qCWarning(dcPowerStore()) << "Error counting readings:" << query.lastError();
        return -1;
    }
    return query.value("count").toLongLong();
}

qint64 PowerLogStore::totalEnergyReadingCount() const
{
    QSqlQuery query(m_db);
    if (!query.exec("SELECT COUNT(*) AS count FROM energyReadings;") || !query.next()) {
        qCWarning(dcPowerStore()) << "Error counting energy readings:" << query.lastError();
        return -1;
    }
    return query.value("count").toLongLong();
}

QDateTime PowerLogStore::oldestTimestamp() const
{
    QSqlQuery query(m_db);
    query.exec("SELECT MIN(timestamp) AS oldestTimestamp FROM "
               "(SELECT MIN(timestamp) AS timestamp FROM readings UNION ALL SELECT MIN(timestamp) FROM energyReadings);");
    if (query.next() && !query.value("oldestTimestamp").isNull()) {
        return QDateTime::fromMSecsSinceEpoch(query.value("oldestTimestamp").toLongLong());
    }
    return QDateTime();
}

QDateTime PowerLogStore::newestTimestamp() const
{
    QSqlQuery query(m_db);
    query.exec("SELECT MAX(timestamp) AS newestTimestamp FROM "
               "(SELECT MAX(timestamp) AS timestamp FROM readings UNION ALL SELECT MAX(timestamp) FROM energyReadings);");
    if (query.next() && !query.value("newestTimestamp").isNull()) {
        return QDateTime::fromMSecsSinceEpoch(query.value("newestTimestamp").toLongLong());
    }
    return QDateTime();
}

qint64 PowerLogStore::databaseSize() const
{
    return QFileInfo(m_databaseFile).size();
}

qint64 PowerLogStore::logSize() const
{
    QFileInfo walFile(m_databaseFile + "-wal");
    return walFile.exists() ? walFile.size() : 0;
}

bool PowerLogStore::checkpoint()
{
    QSqlQuery query(m_db);
    if (!query.exec("PRAGMA wal_checkpoint(TRUNCATE);")) {
        qCWarning(dcPowerStore()) << "Error checkpointing WAL:" << query.lastError();
        return false;
    }
    // First column is 1 if a reader or writer kept the checkpoint from completing
    if (query.next() && query.value(0).toInt() != 0) {
        qCWarning(dcPowerStore()) << "WAL checkpoint could not complete, the database is busy.";
        return false;
    }
    qCDebug(dcPowerStore()) << "WAL checkpoint completed";
    return true;
}

bool PowerLogStore::vacuum()
{
    QDateTime startTime = QDateTime::currentDateTime();
    if (!exec("VACUUM;")) {
        return false;
    }
    qCDebug(dcPowerStore()) << "Vacuumed power log DB in" << startTime.msecsTo(QDateTime::currentDateTime()) << "ms";
    return true;
}

int PowerLogStore::compactOlderThan(const QDateTime &beforeTime)
{
    // Only full hours, otherwise the hour holding the cutoff would end up with an average next to raw rows
    qint64 cutoff = beforeTime.toMSecsSinceEpoch() / 3600000 * 3600000;

    QDateTime startTime = QDateTime::currentDateTime();
    // Take the write lock up front. A deferred transaction would read MAX(id) on a snapshot that a
    // concurrent append can invalidate, and the later upgrade to a writer fails without honoring busy_timeout.
    if (!exec("BEGIN IMMEDIATE;")) {
        qCWarning(dcPowerStore()) << "Cannot start compaction transaction";
        return -1;
    }

    QSqlQuery query(m_db);
    if (!query.exec("SELECT MAX(id) AS maxId FROM readings;") || !query.next()) {
        qCWarning(dcPowerStore()) << "Error preparing compaction:" << query.lastError();
        m_db.rollback();
        return -1;
    }
    qint64 maxId = query.value("maxId").toLongLong();

    query = QSqlQuery(m_db);
    query.prepare("INSERT INTO readings (timestamp, meterId, voltage, current, activePower, reactivePower, apparentPower, powerFactor, frequency) "
                  "SELECT (timestamp / 3600000) * 3600000, meterId, AVG(voltage), AVG(current), AVG(activePower), AVG(reactivePower), "
                  "AVG(apparentPower), AVG(powerFactor), AVG(frequency) "
                  "FROM readings WHERE timestamp < ? "
                  "GROUP BY meterId, timestamp / 3600000 "
                  "HAVING COUNT(*) > 1;");
    query.addBindValue(cutoff);
    if (!query.exec()) {
        qCWarning(dcPowerStore()) << "Error inserting hourly averages:" << query.lastError() << query.executedQuery();
        m_db.rollback();
        return -1;
    }
    int aggregated = query.numRowsAffected();

    // The aggregated rows are the only ones with an id above maxId
    query = QSqlQuery(m_db);
    query.prepare("DELETE FROM readings WHERE id <= ? AND timestamp < ? AND EXISTS "
                  "(SELECT 1 FROM readings AS hourly WHERE hourly.id > ? AND hourly.meterId = readings.meterId "
                  "AND hourly.timestamp = (readings.timestamp / 3600000) * 3600000);");
    query.addBindValue(maxId);
    query.addBindValue(cutoff);
    query.addBindValue(maxId);
    if (!query.exec()) {
        qCWarning(dcPowerStore()) << "Error removing compacted readings:" << query.lastError() << query.executedQuery();
        m_db.rollback();
        return -1;
    }
    int removed = query.numRowsAffected();

    query = QSqlQuery(m_db);
    query.prepare("DELETE FROM energyReadings WHERE timestamp < ? AND id NOT IN ("
                  "SELECT id FROM (SELECT id, MIN(timestamp) FROM energyReadings WHERE timestamp < ? GROUP BY meterId, phase, timestamp / 3600000) "
                  "UNION "
                  "SELECT id FROM (SELECT id, MAX(timestamp) FROM energyReadings WHERE timestamp < ? GROUP BY meterId, phase, timestamp / 3600000));");
    query.addBindValue(cutoff);
    query.addBindValue(cutoff);
    query.addBindValue(cutoff);
    if (!query.exec()) {
        qCWarning(dcPowerStore()) << "Error thinning energy readings:" << query.lastError() << query.executedQuery();
        m_db.rollback();
        return -1;
    }
    int thinned = query.numRowsAffected();

    if (!m_db.commit()) {
        qCWarning(dcPowerStore()) << "Cannot commit compaction:" << m_db.lastError();
        m_db.rollback();
        return -1;
    }

    qCDebug(dcPowerStore()) << "Compacted readings older than" << QDateTime::fromMSecsSinceEpoch(cutoff).toString() << "into" << aggregated
                            << "hourly averages, removed" << removed << "readings and" << thinned << "energy samples in"
                            << startTime.msecsTo(QDateTime::currentDateTime()) << "ms";
    return removed + thinned;
}

PowerReading PowerLogStore::queryResultToReading(const QSqlRecord &record) const
{
    return PowerReading(QDateTime::fromMSecsSinceEpoch(record.value("timestamp").toLongLong()),
                        record.value("meterId").toString(),
                        record.value("voltage").toDouble(),
                        record.value("current").toDouble(),
                        record.value("activePower").toDouble(),
                        record.value("reactivePower").toDouble(),
                        record.value("apparentPower").toDouble(),
                        record.value("powerFactor").toDouble(),
                        record.value("frequency").toDouble());
}

EnergyReading PowerLogStore::queryResultToEnergyReading(const QSqlRecord &record) const
{
    return EnergyReading(QDateTime::fromMSecsSinceEpoch(record.value("timestamp").toLongLong()),
                         record.value("meterId").toString(),
                         record.value("phase").toString(),
                         record.value("totalKwh").toDouble());
}

Meter PowerLogStore::queryResultToMeter(const QSqlRecord &record) const
{
    Meter meter(record.value("meterId").toString(), record.value("address").toString());
    meter.setName(record.value("name").toString());
    meter.setLocation(record.value("location").toString());
    meter.setEnabled(record.value("enabled").toInt() != 0);
    meter.setPollInterval(record.value("pollInterval").toInt());
    meter.setEnergyPollInterval(record.value("energyPollInterval").toInt());
    if (!record.value("lastSeen").isNull()) {
        meter.setLastSeen(QDateTime::fromMSecsSinceEpoch(record.value("lastSeen").toLongLong()));
    }
    return meter;
}
