/*
 * Copyright (c) 2024 dresden elektronik ingenieurtechnik gmbh.
 * All rights reserved.
 *
 * The software in this package is published under the terms of the BSD
 * style license a copy of which has been included with this distribution in
 * the LICENSE.txt file.
 *
 */

#ifndef DEVICE_REGISTRY_H
#define DEVICE_REGISTRY_H

#include <memory>
#include <QString>
#include "device_record.h"
#include "registry_config.h"

struct sqlite3;
struct sqlite3_stmt;

struct DR_ListFilter
{
    bool activeOnly = false;
};

/*! \class DR_DeviceCursor

    A lazy sequence of devices ordered by creation time.

    The cursor reads from its own read-only connection within a read
    transaction, it sees the registry as it was when the cursor was created.
    Writes made later are not visible, call DeviceRegistry::list() again
    for a fresh snapshot.

    \code
    auto cursor = registry.list(filter);
    DR_Device device;
    while (cursor->next(&device)) { ... }
    if (cursor->status() != DR_Success) { ... }
    \endcode
 */
class DR_DeviceCursor
{
public:
    DR_DeviceCursor() = delete;
    DR_DeviceCursor(const DR_DeviceCursor &) = delete;
    DR_DeviceCursor &operator=(const DR_DeviceCursor &) = delete;
    DR_DeviceCursor(const DR_Config &config, const DR_ListFilter &filter);
    explicit DR_DeviceCursor(DR_Status error) : m_status(error) { }
    ~DR_DeviceCursor();
    bool next(DR_Device *device);
    DR_Status status() const { return m_status; }

private:
    void finish();

    sqlite3 *m_db = nullptr;
    sqlite3_stmt *m_res = nullptr;
    int m_rc = 0; // result of the last sqlite3_step()
    DR_Status m_status = DR_Success;
};

class DeviceRegistryPrivate;

/*! \class DeviceRegistry

    The durable registry of all devices ever seen by the coordinator.

    A device is identified by its IEEE address and carries a unique friendly
    name. Devices are created, updated and finally retired, retirement is
    terminal and the record is kept. All checks and the related write of an
    operation run in one immediate transaction, so concurrent callers (also
    from other processes sharing the database file) can't invalidate a check
    before the write is committed.

    All methods are thread safe.
 */
class DeviceRegistry
{
public:
    DeviceRegistry() = delete;
    DeviceRegistry(const DeviceRegistry &) = delete;
    DeviceRegistry &operator=(const DeviceRegistry &) = delete;
    explicit DeviceRegistry(const DR_Config &config);
    ~DeviceRegistry();

    DR_Status open();
    void close();
    bool isOpen() const;
    const DR_Config &config() const;

    DR_Status create(const QString &ieeeAddress, const QString &friendlyName, const DR_DeviceChanges &optional, DR_Device *device = nullptr);
    DR_Status update(const QString &ieeeAddress, const DR_DeviceChanges &changes, DR_Device *device = nullptr);
    DR_Status retire(const QString &ieeeAddress, DR_Device *device = nullptr);

    DR_Status getByAddress(const QString &ieeeAddress, DR_Device *device) const;
    DR_Status getByFriendlyName(const QString &friendlyName, DR_Device *device) const;
    std::unique_ptr<DR_DeviceCursor> list(const DR_ListFilter &filter) const;
    DR_Status count(const DR_ListFilter &filter, int *count) const;

private:
    DeviceRegistryPrivate *d = nullptr;
};

#endif // DEVICE_REGISTRY_H
