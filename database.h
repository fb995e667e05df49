/*
 * Copyright (c) 2016-2024 dresden elektronik ingenieurtechnik gmbh.
 * All rights reserved.
 *
 * The software in this package is published under the terms of the BSD
 * style license a copy of which has been included with this distribution in
 * the LICENSE.txt file.
 *
 */

#ifndef DATABASE_H
#define DATABASE_H

#include <QString>
#include <sqlite3.h>
#include "device_record.h"

#define DB_LATEST_USER_VERSION 1

struct DR_Config;

/*! Flags for DB_Open(). */
enum DB_OpenFlags
{
    DB_OpenReadWrite = 0x01,
    DB_OpenReadOnly  = 0x02
};

sqlite3 *DB_Open(const QString &path, const DR_Config &config, int flags);
void DB_Close(sqlite3 *db);
bool DB_CheckUserVersion(sqlite3 *db);
int DB_GetPragmaInteger(sqlite3 *db, const char *sql);
const char * const *DB_DeviceSchema();

int DB_Begin(sqlite3 *db);
int DB_BeginImmediate(sqlite3 *db);
int DB_Commit(sqlite3 *db);
void DB_Rollback(sqlite3 *db);

/*! Columns by which a single device can be looked up. */
enum DB_DeviceKey
{
    DB_KeyIeeeAddress,
    DB_KeyFriendlyName
};

int DB_LoadDevice(sqlite3 *db, DB_DeviceKey key, const QString &value, DR_Device *device);
int DB_InsertDevice(sqlite3 *db, const DR_Device &device);
int DB_UpdateDevice(sqlite3 *db, const DR_Device &device);
int DB_RetireDevice(sqlite3 *db, const QString &ieeeAddress);
int DB_CountDevices(sqlite3 *db, bool activeOnly, int *count);

sqlite3_stmt *DB_PrepareDeviceList(sqlite3 *db, bool activeOnly);
void DB_DeviceFromRow(sqlite3_stmt *res, DR_Device *device);

QString DB_TimestampToString(const QDateTime &dt);
QDateTime DB_TimestampFromString(const char *str);

#endif // DATABASE_H
