/*
 * Copyright (c) 2024 dresden elektronik ingenieurtechnik gmbh.
 * All rights reserved.
 *
 * The software in this package is published under the terms of the BSD
 * style license a copy of which has been included with this distribution in
 * the LICENSE.txt file.
 *
 */

#ifndef REGISTRY_CONFIG_H
#define REGISTRY_CONFIG_H

#include <QString>

#define DR_DEFAULT_DATABASE_PATH  "devices.db"
#define DR_DEFAULT_BUSY_TIMEOUT   5000
#define DR_DEFAULT_SYNCHRONOUS    "FULL"
#define DR_DEFAULT_DEBUG_LEVEL    1

/*! \struct DR_Config

    Runtime configuration of the device registry.

    [database]
    path = devices.db
    busytimeout = 5000
    synchronous = FULL

    [debug]
    level = 1
 */
struct DR_Config
{
    QString databasePath = QLatin1String(DR_DEFAULT_DATABASE_PATH);
    int busyTimeoutMs = DR_DEFAULT_BUSY_TIMEOUT;
    QString synchronous = QLatin1String(DR_DEFAULT_SYNCHRONOUS);
    int debugLevel = DR_DEFAULT_DEBUG_LEVEL; // 0 errors, 1 info, 2 verbose
};

bool DR_LoadConfig(const QString &path, DR_Config *config);
void DR_ApplyDebugLevel(int level);

#endif // REGISTRY_CONFIG_H
