/*
 * Copyright (c) 2024 dresden elektronik ingenieurtechnik gmbh.
 * All rights reserved.
 *
 * The software in this package is published under the terms of the BSD
 * style license a copy of which has been included with this distribution in
 * the LICENSE.txt file.
 *
 */

#include <QMutex>
#include <QMutexLocker>
#include "database.h"
#include "deconz/dbg_trace.h"
#include "device_registry.h"

class DeviceRegistryPrivate
{
public:
    DR_Config config;
    sqlite3 *db = nullptr;
    mutable QMutex mutex;
};

/*! Maps sqlite result codes of a failed write to the registry error codes.
    Requires extended result codes to be enabled on the connection.
 */
static DR_Status statusFromSqlite(int rc)
{
    switch (rc)
    {
    case SQLITE_CONSTRAINT_PRIMARYKEY: return DR_ErrorDuplicateIdentity;
    case SQLITE_CONSTRAINT_UNIQUE:     return DR_ErrorDuplicateName;
    case SQLITE_CONSTRAINT_CHECK:      return DR_ErrorInvalidNetworkAddress;
    case SQLITE_CONSTRAINT_TRIGGER:    return DR_ErrorRetired;
    case SQLITE_CONSTRAINT_NOTNULL:    return DR_ErrorInvalidValue;
    default:
        break;
    }

    return DR_ErrorStorageUnavailable;
}

/*! Rolls back the current transaction and logs the failed operation. */
static DR_Status abortTransaction(sqlite3 *db, const char *op, const QString &ieeeAddress, DR_Status status)
{
    DB_Rollback(db);

    if (status == DR_ErrorStorageUnavailable)
    {
        DBG_Printf(DBG_ERROR, "DR %s %s failed: %s, %s\n", op, qPrintable(ieeeAddress), DR_StatusToString(status), sqlite3_errmsg(db));
    }
    else
    {
        DBG_Printf(DBG_INFO, "DR %s %s rejected: %s\n", op, qPrintable(ieeeAddress), DR_StatusToString(status));
    }

    return status;
}

DeviceRegistry::DeviceRegistry(const DR_Config &config) :
    d(new DeviceRegistryPrivate)
{
    d->config = config;
}

DeviceRegistry::~DeviceRegistry()
{
    close();
    delete d;
    d = nullptr;
}

/*! Opens the database and creates or upgrades the schema if needed.
    \returns DR_Success or DR_ErrorStorageUnavailable.
 */
DR_Status DeviceRegistry::open()
{
    QMutexLocker lock(&d->mutex);

    if (d->db)
    {
        return DR_Success;
    }

    d->db = DB_Open(d->config.databasePath, d->config, DB_OpenReadWrite);

    if (!d->db)
    {
        return DR_ErrorStorageUnavailable;
    }

    if (!DB_CheckUserVersion(d->db))
    {
        DBG_Printf(DBG_ERROR, "DR failed to init schema of %s\n", qPrintable(d->config.databasePath));
        DB_Close(d->db);
        d->db = nullptr;
        return DR_ErrorStorageUnavailable;
    }

    return DR_Success;
}

void DeviceRegistry::close()
{
    QMutexLocker lock(&d->mutex);

    if (d->db)
    {
        DB_Close(d->db);
        d->db = nullptr;
    }
}

bool DeviceRegistry::isOpen() const
{
    QMutexLocker lock(&d->mutex);
    return d->db != nullptr;
}

const DR_Config &DeviceRegistry::config() const
{
    return d->config;
}

/*! Creates a new active device.

    \param ieeeAddress - permanent hardware address, the primary key
    \param friendlyName - unique name, retired devices included
    \param optional - optional fields, a friendly name in here is ignored
    \param device - receives the stored record incl. createdAt, may be nullptr
 */
DR_Status DeviceRegistry::create(const QString &ieeeAddress, const QString &friendlyName, const DR_DeviceChanges &optional, DR_Device *device)
{
    if (!DR_IsValidIeeeAddress(ieeeAddress) || !DR_IsValidFriendlyName(friendlyName))
    {
        DBG_Printf(DBG_INFO, "DR create %s rejected: invalid address or name\n", qPrintable(ieeeAddress));
        return DR_ErrorInvalidValue;
    }

    DR_DeviceChanges changes = optional;
    changes.fields &= ~quint32(DR_FieldFriendlyName);

    QMutexLocker lock(&d->mutex);

    if (!d->db)
    {
        return DR_ErrorStorageUnavailable;
    }

    if (DB_BeginImmediate(d->db) != SQLITE_OK)
    {
        return abortTransaction(d->db, "create", ieeeAddress, DR_ErrorStorageUnavailable);
    }

    int rc = DB_LoadDevice(d->db, DB_KeyIeeeAddress, ieeeAddress, nullptr);
    if (rc == SQLITE_ROW)
    {
        return abortTransaction(d->db, "create", ieeeAddress, DR_ErrorDuplicateIdentity);
    }
    else if (rc != SQLITE_DONE)
    {
        return abortTransaction(d->db, "create", ieeeAddress, DR_ErrorStorageUnavailable);
    }

    rc = DB_LoadDevice(d->db, DB_KeyFriendlyName, friendlyName, nullptr);
    if (rc == SQLITE_ROW)
    {
        return abortTransaction(d->db, "create", ieeeAddress, DR_ErrorDuplicateName);
    }
    else if (rc != SQLITE_DONE)
    {
        return abortTransaction(d->db, "create", ieeeAddress, DR_ErrorStorageUnavailable);
    }

    const DR_Status check = DR_CheckChanges(changes);
    if (check != DR_Success)
    {
        return abortTransaction(d->db, "create", ieeeAddress, check);
    }

    DR_Device dev;
    dev.ieeeAddress = ieeeAddress;
    dev.friendlyName = friendlyName;
    DR_ApplyChanges(&dev, changes);

    rc = DB_InsertDevice(d->db, dev);
    if (rc != SQLITE_DONE)
    {
        return abortTransaction(d->db, "create", ieeeAddress, statusFromSqlite(rc));
    }

    // read back created_at
    rc = DB_LoadDevice(d->db, DB_KeyIeeeAddress, ieeeAddress, &dev);
    if (rc != SQLITE_ROW)
    {
        return abortTransaction(d->db, "create", ieeeAddress, DR_ErrorStorageUnavailable);
    }

    if (DB_Commit(d->db) != SQLITE_OK)
    {
        return abortTransaction(d->db, "create", ieeeAddress, DR_ErrorStorageUnavailable);
    }

    DBG_Printf(DBG_INFO, "DR created device %s, name: %s\n", qPrintable(ieeeAddress), qPrintable(friendlyName));

    if (device)
    {
        *device = dev;
    }

    return DR_Success;
}

/*! Applies \p changes to an active device.

    Only the fields set in \p changes are written, all other fields keep
    their values. Applying the same changes twice has the same result as
    applying them once.
 */
DR_Status DeviceRegistry::update(const QString &ieeeAddress, const DR_DeviceChanges &changes, DR_Device *device)
{
    QMutexLocker lock(&d->mutex);

    if (!d->db)
    {
        return DR_ErrorStorageUnavailable;
    }

    if (DB_BeginImmediate(d->db) != SQLITE_OK)
    {
        return abortTransaction(d->db, "update", ieeeAddress, DR_ErrorStorageUnavailable);
    }

    DR_Device dev;
    int rc = DB_LoadDevice(d->db, DB_KeyIeeeAddress, ieeeAddress, &dev);
    if (rc == SQLITE_DONE)
    {
        return abortTransaction(d->db, "update", ieeeAddress, DR_ErrorNotFound);
    }
    else if (rc != SQLITE_ROW)
    {
        return abortTransaction(d->db, "update", ieeeAddress, DR_ErrorStorageUnavailable);
    }

    if (dev.isRetired())
    {
        return abortTransaction(d->db, "update", ieeeAddress, DR_ErrorRetired);
    }

    const DR_Status check = DR_CheckChanges(changes);
    if (check != DR_Success)
    {
        return abortTransaction(d->db, "update", ieeeAddress, check);
    }

    if (changes.has(DR_FieldFriendlyName) && changes.friendlyName != dev.friendlyName)
    {
        rc = DB_LoadDevice(d->db, DB_KeyFriendlyName, changes.friendlyName, nullptr);
        if (rc == SQLITE_ROW)
        {
            return abortTransaction(d->db, "update", ieeeAddress, DR_ErrorDuplicateName);
        }
        else if (rc != SQLITE_DONE)
        {
            return abortTransaction(d->db, "update", ieeeAddress, DR_ErrorStorageUnavailable);
        }
    }

    if (!changes.isEmpty())
    {
        DR_ApplyChanges(&dev, changes);

        rc = DB_UpdateDevice(d->db, dev);
        if (rc != SQLITE_DONE)
        {
            return abortTransaction(d->db, "update", ieeeAddress, statusFromSqlite(rc));
        }
    }

    if (DB_Commit(d->db) != SQLITE_OK)
    {
        return abortTransaction(d->db, "update", ieeeAddress, DR_ErrorStorageUnavailable);
    }

    DBG_Printf(DBG_INFO_L2, "DR updated device %s, fields: 0x%04X\n", qPrintable(ieeeAddress), changes.fields);

    if (device)
    {
        *device = dev;
    }

    return DR_Success;
}

/*! Retires an active device, the record is frozen thereafter.
    A second call fails with DR_ErrorAlreadyRetired.
 */
DR_Status DeviceRegistry::retire(const QString &ieeeAddress, DR_Device *device)
{
    QMutexLocker lock(&d->mutex);

    if (!d->db)
    {
        return DR_ErrorStorageUnavailable;
    }

    if (DB_BeginImmediate(d->db) != SQLITE_OK)
    {
        return abortTransaction(d->db, "retire", ieeeAddress, DR_ErrorStorageUnavailable);
    }

    DR_Device dev;
    int rc = DB_LoadDevice(d->db, DB_KeyIeeeAddress, ieeeAddress, &dev);
    if (rc == SQLITE_DONE)
    {
        return abortTransaction(d->db, "retire", ieeeAddress, DR_ErrorNotFound);
    }
    else if (rc != SQLITE_ROW)
    {
        return abortTransaction(d->db, "retire", ieeeAddress, DR_ErrorStorageUnavailable);
    }

    if (dev.isRetired())
    {
        return abortTransaction(d->db, "retire", ieeeAddress, DR_ErrorAlreadyRetired);
    }

    rc = DB_RetireDevice(d->db, ieeeAddress);
    if (rc != SQLITE_DONE)
    {
        return abortTransaction(d->db, "retire", ieeeAddress, statusFromSqlite(rc));
    }

    rc = DB_LoadDevice(d->db, DB_KeyIeeeAddress, ieeeAddress, &dev);
    if (rc != SQLITE_ROW || !dev.isRetired())
    {
        return abortTransaction(d->db, "retire", ieeeAddress, DR_ErrorStorageUnavailable);
    }

    if (DB_Commit(d->db) != SQLITE_OK)
    {
        return abortTransaction(d->db, "retire", ieeeAddress, DR_ErrorStorageUnavailable);
    }

    DBG_Printf(DBG_INFO, "DR retired device %s (%s)\n", qPrintable(ieeeAddress), qPrintable(dev.friendlyName));

    if (device)
    {
        *device = dev;
    }

    return DR_Success;
}

static DR_Status loadDevice(sqlite3 *db, DB_DeviceKey key, const QString &value, DR_Device *device)
{
    if (!db)
    {
        return DR_ErrorStorageUnavailable;
    }

    const int rc = DB_LoadDevice(db, key, value, device);

    if (rc == SQLITE_ROW)
    {
        return DR_Success;
    }
    else if (rc == SQLITE_DONE)
    {
        return DR_ErrorNotFound;
    }

    return DR_ErrorStorageUnavailable;
}

DR_Status DeviceRegistry::getByAddress(const QString &ieeeAddress, DR_Device *device) const
{
    QMutexLocker lock(&d->mutex);
    return loadDevice(d->db, DB_KeyIeeeAddress, ieeeAddress, device);
}

DR_Status DeviceRegistry::getByFriendlyName(const QString &friendlyName, DR_Device *device) const
{
    QMutexLocker lock(&d->mutex);
    return loadDevice(d->db, DB_KeyFriendlyName, friendlyName, device);
}

/*! Returns a cursor over a snapshot of the devices ordered by createdAt.
    On failure the cursor yields no devices and status() reports the error.
 */
std::unique_ptr<DR_DeviceCursor> DeviceRegistry::list(const DR_ListFilter &filter) const
{
    if (!isOpen())
    {
        return std::unique_ptr<DR_DeviceCursor>(new DR_DeviceCursor(DR_ErrorStorageUnavailable));
    }

    return std::unique_ptr<DR_DeviceCursor>(new DR_DeviceCursor(d->config, filter));
}

DR_Status DeviceRegistry::count(const DR_ListFilter &filter, int *count) const
{
    QMutexLocker lock(&d->mutex);

    if (!d->db)
    {
        return DR_ErrorStorageUnavailable;
    }

    return DB_CountDevices(d->db, filter.activeOnly, count) == SQLITE_OK ? DR_Success : DR_ErrorStorageUnavailable;
}

/*! Opens a read-only connection and starts the read transaction.
    The first row is fetched here, which pins the snapshot to this point in time.
 */
DR_DeviceCursor::DR_DeviceCursor(const DR_Config &config, const DR_ListFilter &filter)
{
    m_db = DB_Open(config.databasePath, config, DB_OpenReadOnly);

    if (!m_db)
    {
        m_status = DR_ErrorStorageUnavailable;
        return;
    }

    if (DB_Begin(m_db) != SQLITE_OK)
    {
        m_status = DR_ErrorStorageUnavailable;
        finish();
        return;
    }

    m_res = DB_PrepareDeviceList(m_db, filter.activeOnly);
    if (!m_res)
    {
        m_status = DR_ErrorStorageUnavailable;
        finish();
        return;
    }

    m_rc = sqlite3_step(m_res);

    if (m_rc != SQLITE_ROW && m_rc != SQLITE_DONE)
    {
        DBG_Printf(DBG_ERROR, "DR device list failed: %s (%d)\n", sqlite3_errmsg(m_db), m_rc);
        m_status = DR_ErrorStorageUnavailable;
        finish();
    }
}

DR_DeviceCursor::~DR_DeviceCursor()
{
    finish();
}

/*! Fetches the next device.
    \returns false at the end of the sequence or on error, see status().
 */
bool DR_DeviceCursor::next(DR_Device *device)
{
    if (!m_res || m_rc != SQLITE_ROW)
    {
        finish();
        return false;
    }

    DB_DeviceFromRow(m_res, device);

    m_rc = sqlite3_step(m_res);
    if (m_rc != SQLITE_ROW && m_rc != SQLITE_DONE)
    {
        DBG_Printf(DBG_ERROR, "DR device list failed: %s (%d)\n", sqlite3_errmsg(m_db), m_rc);
        m_status = DR_ErrorStorageUnavailable;
        finish();
    }

    return true;
}

/*! Ends the read transaction and releases the connection. */
void DR_DeviceCursor::finish()
{
    if (m_res)
    {
        sqlite3_finalize(m_res);
        m_res = nullptr;
    }

    if (m_db)
    {
        DB_Rollback(m_db); // read only, nothing to commit
        DB_Close(m_db);
        m_db = nullptr;
    }
}
