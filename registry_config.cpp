/*
 * Copyright (c) 2024 dresden elektronik ingenieurtechnik gmbh.
 * All rights reserved.
 *
 * The software in this package is published under the terms of the BSD
 * style license a copy of which has been included with this distribution in
 * the LICENSE.txt file.
 *
 */

#include <QFileInfo>
#include <QSettings>
#include "deconz/dbg_trace.h"
#include "registry_config.h"

/*! Loads the configuration from the INI file \p path.

    Missing keys keep the defaults of DR_Config, invalid values are reported
    and replaced by the defaults.

    \returns false if the file doesn't exist or can't be parsed.
 */
bool DR_LoadConfig(const QString &path, DR_Config *config)
{
    if (!QFileInfo::exists(path))
    {
        DBG_Printf(DBG_ERROR, "DR config file %s not found\n", qPrintable(path));
        return false;
    }

    QSettings settings(path, QSettings::IniFormat);

    if (settings.status() != QSettings::NoError)
    {
        DBG_Printf(DBG_ERROR, "DR failed to read config file %s\n", qPrintable(path));
        return false;
    }

    const QString dbPath = settings.value("database/path", config->databasePath).toString();
    if (!dbPath.isEmpty())
    {
        config->databasePath = dbPath;
    }

    bool ok = false;
    const int busyTimeout = settings.value("database/busytimeout", config->busyTimeoutMs).toInt(&ok);
    if (ok && busyTimeout >= 0)
    {
        config->busyTimeoutMs = busyTimeout;
    }
    else
    {
        DBG_Printf(DBG_INFO, "DR config database/busytimeout invalid, using %d ms\n", DR_DEFAULT_BUSY_TIMEOUT);
        config->busyTimeoutMs = DR_DEFAULT_BUSY_TIMEOUT;
    }

    const QString sync = settings.value("database/synchronous", config->synchronous).toString().toUpper();
    if (sync == QLatin1String("FULL") || sync == QLatin1String("NORMAL"))
    {
        config->synchronous = sync;
    }
    else
    {
        DBG_Printf(DBG_INFO, "DR config database/synchronous '%s' not supported, using %s\n", qPrintable(sync), DR_DEFAULT_SYNCHRONOUS);
        config->synchronous = QLatin1String(DR_DEFAULT_SYNCHRONOUS);
    }

    const int level = settings.value("debug/level", config->debugLevel).toInt(&ok);
    if (ok && level >= 0 && level <= 2)
    {
        config->debugLevel = level;
    }
    else
    {
        DBG_Printf(DBG_INFO, "DR config debug/level invalid, using %d\n", DR_DEFAULT_DEBUG_LEVEL);
        config->debugLevel = DR_DEFAULT_DEBUG_LEVEL;
    }

    return true;
}

/*! Enables the trace levels for \p level: 0 errors only, 1 info, 2 verbose. */
void DR_ApplyDebugLevel(int level)
{
    DBG_Enable(DBG_ERROR);

    if (level >= 1)
    {
        DBG_Enable(DBG_INFO);
    }
    else
    {
        DBG_Disable(DBG_INFO);
    }

    if (level >= 2)
    {
        DBG_Enable(DBG_INFO_L2);
        DBG_Enable(DBG_ERROR_L2);
    }
    else
    {
        DBG_Disable(DBG_INFO_L2);
        DBG_Disable(DBG_ERROR_L2);
    }
}
