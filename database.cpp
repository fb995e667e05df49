/*
 * Copyright (c) 2016-2024 dresden elektronik ingenieurtechnik gmbh.
 * All rights reserved.
 *
 * The software in this package is published under the terms of the BSD
 * style license a copy of which has been included with this distribution in
 * the LICENSE.txt file.
 *
 */

#include <QByteArray>
#include <QString>
#include "database.h"
#include "registry_config.h"
#include "deconz/dbg_trace.h"

static const char *pragmaUserVersion = "PRAGMA user_version";
static const char *pragmaPageCount = "PRAGMA page_count";
static const char *pragmaPageSize = "PRAGMA page_size";

static const char *timestampFormat = "yyyy-MM-dd HH:mm:ss.zzz";

static const char *deviceColumns = "ieee_address, friendly_name, network_address, firmware_build_date,"
                                   " firmware_version, device_type, zigbee_model, zigbee_manufacturer,"
                                   " created_at, retired_at";

static const char * const deviceSchema[] = {
    "CREATE TABLE IF NOT EXISTS device ("
    " ieee_address VARCHAR(24) NOT NULL,"
    " friendly_name VARCHAR(120) NOT NULL,"
    " network_address INTEGER,"
    " firmware_build_date DATE,"
    " firmware_version VARCHAR(60),"
    " device_type VARCHAR(60),"
    " zigbee_model VARCHAR(120),"
    " zigbee_manufacturer VARCHAR(120),"
    " created_at DATETIME DEFAULT (strftime('%Y-%m-%d %H:%M:%f','now')) NOT NULL,"
    " retired_at DATETIME,"
    " PRIMARY KEY (ieee_address),"
    " CONSTRAINT ck_device_network_address_range CHECK ((network_address IS NULL) OR (network_address >= 0 AND network_address <= 65535)),"
    " UNIQUE (friendly_name)"
    ")",

    "CREATE INDEX IF NOT EXISTS device_created_at_idx ON device (created_at)",

    // rows are kept for history, retirement is a soft delete
    "CREATE TRIGGER IF NOT EXISTS device_no_delete BEFORE DELETE ON device"
    " BEGIN SELECT RAISE(ABORT, 'device rows are never deleted'); END",

    "CREATE TRIGGER IF NOT EXISTS device_immutable_columns BEFORE UPDATE OF ieee_address, created_at ON device"
    " WHEN NEW.ieee_address IS NOT OLD.ieee_address OR NEW.created_at IS NOT OLD.created_at"
    " BEGIN SELECT RAISE(ABORT, 'device ieee_address and created_at are immutable'); END",

    "CREATE TRIGGER IF NOT EXISTS device_retired_terminal BEFORE UPDATE ON device"
    " WHEN OLD.retired_at IS NOT NULL"
    " BEGIN SELECT RAISE(ABORT, 'device is retired'); END",

    nullptr
};

/******************************************************************************
                    Local prototypes
******************************************************************************/
static bool setDbUserVersion(sqlite3 *db, int userVersion);
static bool upgradeDbToUserVersion1(sqlite3 *db);
static int execSql(sqlite3 *db, const char *sql);

/******************************************************************************
                    Implementation
******************************************************************************/

/*! Returns the SQL statements which create the device table and its triggers.
    The array is terminated by a nullptr entry.
 */
const char * const *DB_DeviceSchema()
{
    return deviceSchema;
}

/*! Executes a statement which doesn't return rows and logs errors. */
static int execSql(sqlite3 *db, const char *sql)
{
    char *errmsg = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errmsg);

    if (rc != SQLITE_OK)
    {
        if (errmsg)
        {
            DBG_Printf(DBG_ERROR_L2, "DB SQL exec failed: %s, error: %s (%d)\n", sql, errmsg, rc);
            sqlite3_free(errmsg);
        }
    }

    return rc;
}

/*! Opens the database file \p path.

    Write connections enable WAL journaling so that readers get a stable
    snapshot while a write transaction is in progress.

    \param flags - DB_OpenReadWrite or DB_OpenReadOnly
    \returns The connection or nullptr on failure.
 */
sqlite3 *DB_Open(const QString &path, const DR_Config &config, int flags)
{
    if (path.isEmpty() || path == QLatin1String(":memory:"))
    {
        DBG_Printf(DBG_ERROR, "DB can't open '%s', a database file is required\n", qPrintable(path));
        return nullptr;
    }

    sqlite3 *db = nullptr;
    const QByteArray fileName = path.toUtf8();
    int openFlags = SQLITE_OPEN_FULLMUTEX;

    if (flags & DB_OpenReadOnly)
    {
        openFlags |= SQLITE_OPEN_READONLY;
    }
    else
    {
        openFlags |= SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    }

    int rc = sqlite3_open_v2(fileName.constData(), &db, openFlags, nullptr);

    if (rc != SQLITE_OK)
    {
        DBG_Printf(DBG_ERROR, "DB can't open database %s: %s\n", fileName.constData(), db ? sqlite3_errmsg(db) : "out of memory");
        if (db)
        {
            sqlite3_close(db);
        }
        return nullptr;
    }

    sqlite3_extended_result_codes(db, 1);
    sqlite3_busy_timeout(db, config.busyTimeoutMs);

    if (flags & DB_OpenReadOnly)
    {
        return db;
    }

    rc = execSql(db, "PRAGMA journal_mode = WAL");
    DBG_Assert(rc == SQLITE_OK);

    const char *sync = "PRAGMA synchronous = FULL";
    if (config.synchronous.compare(QLatin1String("NORMAL"), Qt::CaseInsensitive) == 0)
    {
        sync = "PRAGMA synchronous = NORMAL";
    }
    else if (config.synchronous.compare(QLatin1String("FULL"), Qt::CaseInsensitive) != 0)
    {
        DBG_Printf(DBG_INFO, "DB synchronous mode '%s' not supported, using FULL\n", qPrintable(config.synchronous));
    }

    rc = execSql(db, sync);
    DBG_Assert(rc == SQLITE_OK);

    if (rc != SQLITE_OK)
    {
        DB_Close(db);
        return nullptr;
    }

    DBG_Printf(DBG_INFO, "DB sqlite version %s, opened %s\n", sqlite3_libversion(), fileName.constData());

    const int pageCount = DB_GetPragmaInteger(db, pragmaPageCount);
    const int pageSize = DB_GetPragmaInteger(db, pragmaPageSize);
    DBG_Printf(DBG_INFO_L2, "DB file size %d bytes\n", pageCount * pageSize);

    return db;
}

/*! Closes the database connection \p db. */
void DB_Close(sqlite3 *db)
{
    if (!db)
    {
        return;
    }

    int rc = sqlite3_close(db);
    if (rc != SQLITE_OK)
    {
        DBG_Printf(DBG_ERROR, "DB sqlite3_close() failed: %s (%d)\n", sqlite3_errmsg(db), rc);
    }
}

/*! Returns SQLite pragma parameters specified by \p sql or -1 on error.
 */
int DB_GetPragmaInteger(sqlite3 *db, const char *sql)
{
    int rc;
    int val = -1;
    sqlite3_stmt *res = nullptr;

    rc = sqlite3_prepare_v2(db, sql, -1, &res, nullptr);
    DBG_Assert(rc == SQLITE_OK);
    if (rc == SQLITE_OK) { rc = sqlite3_step(res); }

    DBG_Assert(rc == SQLITE_ROW);
    if (rc == SQLITE_ROW)
    {
        val = sqlite3_column_int(res, 0);
        DBG_Printf(DBG_INFO_L2, "DB %s: %d\n", sql, val);
    }

    if (res)
    {
        rc = sqlite3_finalize(res);
        DBG_Assert(rc == SQLITE_OK);
    }
    return val;
}

/*! Writes database user_version to \p userVersion. */
static bool setDbUserVersion(sqlite3 *db, int userVersion)
{
    DBG_Printf(DBG_INFO, "DB write sqlite user_version %d\n", userVersion);

    const QByteArray sql = QString("PRAGMA user_version = %1").arg(userVersion).toLatin1();
    return execSql(db, sql.constData()) == SQLITE_OK;
}

/*! Upgrades database to user_version 1.
    Creates the device table, the created_at index and the lifecycle triggers.
 */
static bool upgradeDbToUserVersion1(sqlite3 *db)
{
    DBG_Printf(DBG_INFO, "DB upgrade to user_version 1\n");

    if (DB_BeginImmediate(db) != SQLITE_OK)
    {
        return false;
    }

    for (int i = 0; deviceSchema[i] != nullptr; i++)
    {
        if (execSql(db, deviceSchema[i]) != SQLITE_OK)
        {
            DBG_Printf(DBG_ERROR, "DB upgrade to user_version 1 failed, line: %d\n", __LINE__);
            DB_Rollback(db);
            return false;
        }
    }

    if (!setDbUserVersion(db, 1))
    {
        DB_Rollback(db);
        return false;
    }

    return DB_Commit(db) == SQLITE_OK;
}

/*! Checks the sqlite 'user_version' in order to apply database schema updates.
    Updates are applied in recursive manner to have sane upgrade paths.
    \returns true if the database has the latest or a newer schema.
 */
bool DB_CheckUserVersion(sqlite3 *db)
{
    bool updated = false;
    const int userVersion = DB_GetPragmaInteger(db, pragmaUserVersion); // sqlite default is 0

    if (userVersion < 0)
    {
        return false;
    }
    else if (userVersion == 0) // new database
    {
        updated = upgradeDbToUserVersion1(db);
        if (!updated)
        {
            return false;
        }
    }
    else if (userVersion == DB_LATEST_USER_VERSION)
    {
        // latest version
    }
    else
    {
        DBG_Printf(DBG_INFO, "DB database file written by a newer version (user_version %d)\n", userVersion);
    }

    if (updated)
    {
        return DB_CheckUserVersion(db); // tail recursion
    }

    return true;
}

int DB_Begin(sqlite3 *db)
{
    return execSql(db, "BEGIN");
}

/*! Starts a write transaction, the database write lock is taken immediately
    so that checks made within the transaction stay valid until COMMIT.
 */
int DB_BeginImmediate(sqlite3 *db)
{
    return execSql(db, "BEGIN IMMEDIATE");
}

int DB_Commit(sqlite3 *db)
{
    int rc = execSql(db, "COMMIT");
    if (rc != SQLITE_OK)
    {
        DBG_Printf(DBG_ERROR, "DB COMMIT failed: %s (%d)\n", sqlite3_errmsg(db), rc);
        DB_Rollback(db);
    }
    return rc;
}

void DB_Rollback(sqlite3 *db)
{
    if (sqlite3_get_autocommit(db))
    {
        return; // no transaction active, sqlite already rolled back
    }

    int rc = execSql(db, "ROLLBACK");
    DBG_Assert(rc == SQLITE_OK);
}

QString DB_TimestampToString(const QDateTime &dt)
{
    return dt.toUTC().toString(QLatin1String(timestampFormat));
}

/*! Parses timestamps written by strftime('%Y-%m-%d %H:%M:%f') or CURRENT_TIMESTAMP.
    The result is constructed in UTC, never via local time which has gaps
    at daylight saving changes.
    \returns A UTC timestamp, invalid if \p str is null or unparsable.
 */
QDateTime DB_TimestampFromString(const char *str)
{
    if (!str || str[0] == '\0')
    {
        return {};
    }

    const QString s = QString::fromLatin1(str);
    if (s.size() < 19 || s.at(10) != QLatin1Char(' '))
    {
        return {};
    }

    const QDate date = QDate::fromString(s.left(10), Qt::ISODate);
    const QString timeStr = s.mid(11);
    QTime time = QTime::fromString(timeStr, QLatin1String("HH:mm:ss.zzz"));

    if (!time.isValid())
    {
        time = QTime::fromString(timeStr, QLatin1String("HH:mm:ss"));
    }

    if (!date.isValid() || !time.isValid())
    {
        return {};
    }

    return QDateTime(date, time, Qt::UTC);
}

static QString columnString(sqlite3_stmt *res, int col)
{
    const auto *text = reinterpret_cast<const char*>(sqlite3_column_text(res, col));
    if (!text)
    {
        return {};
    }

    return QString::fromUtf8(text, sqlite3_column_bytes(res, col));
}

/*! Fills \p device from the current row of \p res.
    The statement must select the columns in the order of deviceColumns.
 */
void DB_DeviceFromRow(sqlite3_stmt *res, DR_Device *device)
{
    device->ieeeAddress = columnString(res, 0);
    device->friendlyName = columnString(res, 1);

    if (sqlite3_column_type(res, 2) == SQLITE_NULL)
    {
        device->networkAddress = DR_NoNetworkAddress;
    }
    else
    {
        device->networkAddress = sqlite3_column_int(res, 2);
    }

    const QString buildDate = columnString(res, 3);
    device->firmwareBuildDate = buildDate.isEmpty() ? QDate() : QDate::fromString(buildDate, Qt::ISODate);
    device->firmwareVersion = columnString(res, 4);
    device->deviceType = columnString(res, 5);
    device->zigbeeModel = columnString(res, 6);
    device->zigbeeManufacturer = columnString(res, 7);
    device->createdAt = DB_TimestampFromString(reinterpret_cast<const char*>(sqlite3_column_text(res, 8)));
    device->retiredAt = DB_TimestampFromString(reinterpret_cast<const char*>(sqlite3_column_text(res, 9)));
}

/*! Binds \p str as text or NULL if the string is null. */
static int bindString(sqlite3_stmt *res, int index, const QString &str)
{
    if (str.isNull())
    {
        return sqlite3_bind_null(res, index);
    }

    const QByteArray utf8 = str.toUtf8();
    return sqlite3_bind_text(res, index, utf8.constData(), utf8.size(), SQLITE_TRANSIENT);
}

static int bindDate(sqlite3_stmt *res, int index, const QDate &date)
{
    if (!date.isValid())
    {
        return sqlite3_bind_null(res, index);
    }

    return bindString(res, index, date.toString(Qt::ISODate));
}

static int bindNetworkAddress(sqlite3_stmt *res, int index, int nwk)
{
    if (nwk == DR_NoNetworkAddress)
    {
        return sqlite3_bind_null(res, index);
    }

    return sqlite3_bind_int(res, index, nwk);
}

/*! Binds the mutable columns of \p device to parameters ?1 .. ?8 (?1 = ieee_address). */
static int bindDevice(sqlite3_stmt *res, const DR_Device &device)
{
    int rc = bindString(res, 1, device.ieeeAddress);
    if (rc == SQLITE_OK) { rc = bindString(res, 2, device.friendlyName); }
    if (rc == SQLITE_OK) { rc = bindNetworkAddress(res, 3, device.networkAddress); }
    if (rc == SQLITE_OK) { rc = bindDate(res, 4, device.firmwareBuildDate); }
    if (rc == SQLITE_OK) { rc = bindString(res, 5, device.firmwareVersion); }
    if (rc == SQLITE_OK) { rc = bindString(res, 6, device.deviceType); }
    if (rc == SQLITE_OK) { rc = bindString(res, 7, device.zigbeeModel); }
    if (rc == SQLITE_OK) { rc = bindString(res, 8, device.zigbeeManufacturer); }
    DBG_Assert(rc == SQLITE_OK);
    return rc;
}

/*! Steps a prepared write statement once and finalizes it.
    \returns SQLITE_DONE on success or the (extended) sqlite error code.
 */
static int stepAndFinalize(sqlite3 *db, sqlite3_stmt *res)
{
    int rc = sqlite3_step(res);

    if (rc != SQLITE_DONE)
    {
        rc = sqlite3_extended_errcode(db);
        DBG_Printf(DBG_INFO_L2, "DB statement failed: %s (%d)\n", sqlite3_errmsg(db), rc);
    }
    else if (DBG_IsEnabled(DBG_INFO_L2))
    {
        char *exp = sqlite3_expanded_sql(res);
        if (exp)
        {
            DBG_Printf(DBG_INFO_L2, "DB %s\n", exp);
            sqlite3_free(exp);
        }
    }

    sqlite3_finalize(res);
    return rc;
}

/*! Loads a single device where the column given by \p key equals \p value.

    \returns SQLITE_ROW if found, SQLITE_DONE if not found or an sqlite error code.
 */
int DB_LoadDevice(sqlite3 *db, DB_DeviceKey key, const QString &value, DR_Device *device)
{
    const char *column = key == DB_KeyIeeeAddress ? "ieee_address" : "friendly_name";
    const QByteArray sql = QString("SELECT %1 FROM device WHERE %2 = ?1").arg(QLatin1String(deviceColumns), QLatin1String(column)).toLatin1();

    sqlite3_stmt *res = nullptr;
    int rc = sqlite3_prepare_v2(db, sql.constData(), -1, &res, nullptr);

    if (rc == SQLITE_OK)
    {
        rc = bindString(res, 1, value);
        DBG_Assert(rc == SQLITE_OK);
    }

    if (rc == SQLITE_OK)
    {
        rc = sqlite3_step(res);
        if (rc == SQLITE_ROW)
        {
            if (device)
            {
                DB_DeviceFromRow(res, device);
            }
        }
        else if (rc != SQLITE_DONE)
        {
            rc = sqlite3_extended_errcode(db);
        }
    }

    if (rc != SQLITE_ROW && rc != SQLITE_DONE)
    {
        DBG_Printf(DBG_ERROR, "DB failed to load device %s: %s (%d)\n", qPrintable(value), sqlite3_errmsg(db), rc);
    }

    if (res)
    {
        sqlite3_finalize(res);
    }

    return rc;
}

/*! Inserts a new device row, created_at is set by the column default.
    \returns SQLITE_DONE on success or the extended sqlite error code.
 */
int DB_InsertDevice(sqlite3 *db, const DR_Device &device)
{
    const char *sql = "INSERT INTO device (ieee_address, friendly_name, network_address, firmware_build_date,"
                      " firmware_version, device_type, zigbee_model, zigbee_manufacturer)"
                      " VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8)";

    sqlite3_stmt *res = nullptr;
    int rc = sqlite3_prepare_v2(db, sql, -1, &res, nullptr);
    DBG_Assert(rc == SQLITE_OK);

    if (rc == SQLITE_OK)
    {
        rc = bindDevice(res, device);
    }

    if (rc != SQLITE_OK)
    {
        DBG_Printf(DBG_ERROR, "DB failed %s\n", sqlite3_errmsg(db));
        if (res)
        {
            sqlite3_finalize(res);
        }
        return rc;
    }

    return stepAndFinalize(db, res);
}

/*! Writes all mutable columns of \p device.
    \returns SQLITE_DONE on success or the extended sqlite error code.
 */
int DB_UpdateDevice(sqlite3 *db, const DR_Device &device)
{
    const char *sql = "UPDATE device SET friendly_name = ?2, network_address = ?3, firmware_build_date = ?4,"
                      " firmware_version = ?5, device_type = ?6, zigbee_model = ?7, zigbee_manufacturer = ?8"
                      " WHERE ieee_address = ?1";

    sqlite3_stmt *res = nullptr;
    int rc = sqlite3_prepare_v2(db, sql, -1, &res, nullptr);
    DBG_Assert(rc == SQLITE_OK);

    if (rc == SQLITE_OK)
    {
        rc = bindDevice(res, device);
    }

    if (rc != SQLITE_OK)
    {
        DBG_Printf(DBG_ERROR, "DB failed %s\n", sqlite3_errmsg(db));
        if (res)
        {
            sqlite3_finalize(res);
        }
        return rc;
    }

    return stepAndFinalize(db, res);
}

/*! Sets retired_at of an active device to the current time.
    \returns SQLITE_DONE on success or the extended sqlite error code.
 */
int DB_RetireDevice(sqlite3 *db, const QString &ieeeAddress)
{
    const char *sql = "UPDATE device SET retired_at = strftime('%Y-%m-%d %H:%M:%f','now')"
                      " WHERE ieee_address = ?1 AND retired_at IS NULL";

    sqlite3_stmt *res = nullptr;
    int rc = sqlite3_prepare_v2(db, sql, -1, &res, nullptr);
    DBG_Assert(rc == SQLITE_OK);

    if (rc == SQLITE_OK)
    {
        rc = bindString(res, 1, ieeeAddress);
        DBG_Assert(rc == SQLITE_OK);
    }

    if (rc != SQLITE_OK)
    {
        DBG_Printf(DBG_ERROR, "DB failed %s\n", sqlite3_errmsg(db));
        if (res)
        {
            sqlite3_finalize(res);
        }
        return rc;
    }

    return stepAndFinalize(db, res);
}

/*! Counts all devices or only the active ones if \p activeOnly is true.
    \returns SQLITE_OK on success.
 */
int DB_CountDevices(sqlite3 *db, bool activeOnly, int *count)
{
    const char *sql = activeOnly ? "SELECT COUNT(*) FROM device WHERE retired_at IS NULL"
                                 : "SELECT COUNT(*) FROM device";

    sqlite3_stmt *res = nullptr;
    int rc = sqlite3_prepare_v2(db, sql, -1, &res, nullptr);

    if (rc == SQLITE_OK)
    {
        rc = sqlite3_step(res);
        if (rc == SQLITE_ROW)
        {
            *count = sqlite3_column_int(res, 0);
            rc = SQLITE_OK;
        }
        else
        {
            rc = sqlite3_extended_errcode(db);
        }
    }

    if (rc != SQLITE_OK)
    {
        DBG_Printf(DBG_ERROR, "DB failed to count devices: %s (%d)\n", sqlite3_errmsg(db), rc);
    }

    if (res)
    {
        sqlite3_finalize(res);
    }

    return rc;
}

/*! Prepares the statement which iterates devices ordered by creation.
    The caller owns the statement and must sqlite3_finalize() it.
 */
sqlite3_stmt *DB_PrepareDeviceList(sqlite3 *db, bool activeOnly)
{
    const QByteArray sql = QString("SELECT %1 FROM device%2 ORDER BY created_at ASC, rowid ASC")
            .arg(QLatin1String(deviceColumns), activeOnly ? QLatin1String(" WHERE retired_at IS NULL") : QLatin1String(""))
            .toLatin1();

    sqlite3_stmt *res = nullptr;
    int rc = sqlite3_prepare_v2(db, sql.constData(), -1, &res, nullptr);

    if (rc != SQLITE_OK)
    {
        DBG_Printf(DBG_ERROR, "DB failed to prepare device list: %s (%d)\n", sqlite3_errmsg(db), rc);
        if (res)
        {
            sqlite3_finalize(res);
        }
        return nullptr;
    }

    return res;
}
