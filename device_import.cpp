/*
 * Copyright (c) 2024 dresden elektronik ingenieurtechnik gmbh.
 * All rights reserved.
 *
 * The software in this package is published under the terms of the BSD
 * style license a copy of which has been included with this distribution in
 * the LICENSE.txt file.
 *
 */

#include <array>
#include <cmath>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QSet>
#include "deconz/dbg_trace.h"
#include "device_import.h"
#include "device_registry.h"

// alternative keys used by different Zigbee2MQTT versions, first match wins
static const std::array<QLatin1String, 3> keysIeeeAddress = { QLatin1String("ieee_address"), QLatin1String("ieeeAddress"), QLatin1String("ieee") };
static const std::array<QLatin1String, 3> keysFriendlyName = { QLatin1String("friendly_name"), QLatin1String("friendlyName"), QLatin1String("name") };
static const std::array<QLatin1String, 2> keysNetworkAddress = { QLatin1String("network_address"), QLatin1String("networkAddress") };
static const std::array<QLatin1String, 2> keysDeviceType = { QLatin1String("type"), QLatin1String("device_type") };
static const std::array<QLatin1String, 3> keysModel = { QLatin1String("model_id"), QLatin1String("model"), QLatin1String("zigbee_model") };
static const std::array<QLatin1String, 2> keysManufacturer = { QLatin1String("manufacturer"), QLatin1String("zigbee_manufacturer") };
static const std::array<QLatin1String, 3> keysFirmwareVersion = { QLatin1String("software_build_id"), QLatin1String("software_version"), QLatin1String("firmware_version") };
static const std::array<QLatin1String, 2> keysBuildDate = { QLatin1String("date_code"), QLatin1String("firmware_build_date") };

template <typename Keys>
static QJsonValue firstValue(const QJsonObject &obj, const Keys &keys)
{
    for (const auto &key : keys)
    {
        const QJsonValue val = obj.value(key);
        if (!val.isUndefined() && !val.isNull())
        {
            return val;
        }
    }

    return QJsonValue(QJsonValue::Undefined);
}

template <typename Keys>
static QString firstString(const QJsonObject &obj, const Keys &keys)
{
    const QJsonValue val = firstValue(obj, keys);
    if (val.isString() && !val.toString().isEmpty())
    {
        return val.toString();
    }
    return QString();
}

/*! Parses a firmware date code.

    Supported: 20210708, "20210708 12:00", 2021-07-08, 2021-07-08T12:00:00Z
    \returns An invalid QDate if \p str isn't recognized.
 */
QDate DR_ParseBuildDate(const QString &str)
{
    const QString s = str.trimmed();

    if (s.size() >= 8)
    {
        bool digits = true;
        for (int i = 0; i < 8 && digits; i++)
        {
            digits = s.at(i).isDigit();
        }

        if (digits)
        {
            return QDate::fromString(s.left(8), QLatin1String("yyyyMMdd"));
        }
    }

    if (s.size() >= 10)
    {
        return QDate::fromString(s.left(10), Qt::ISODate);
    }

    return QDate();
}

static bool parseEntry(const QJsonObject &obj, DR_ImportEntry *entry)
{
    entry->ieeeAddress = firstString(obj, keysIeeeAddress);
    const QString name = firstString(obj, keysFriendlyName);

    if (entry->ieeeAddress.isEmpty() || name.isEmpty())
    {
        return false;
    }

    entry->changes.setFriendlyName(name);

    const QJsonValue nwk = firstValue(obj, keysNetworkAddress);
    if (nwk.isDouble())
    {
        const double val = nwk.toDouble();
        if (val == std::floor(val) && val >= DR_MIN_NETWORK_ADDRESS && val <= DR_MAX_NETWORK_ADDRESS)
        {
            entry->changes.setNetworkAddress(qint64(val));
        }
        else
        {
            // keep it invalid so the entry fails with DR_ErrorInvalidNetworkAddress
            DBG_Printf(DBG_INFO, "DR device list entry %s has invalid network_address %g\n", qPrintable(entry->ieeeAddress), val);
            entry->changes.setNetworkAddress(qint64(DR_MAX_NETWORK_ADDRESS) + 1);
        }
    }

    QString str = firstString(obj, keysDeviceType);
    if (!str.isEmpty()) { entry->changes.setDeviceType(str); }

    str = firstString(obj, keysModel);
    if (!str.isEmpty()) { entry->changes.setZigbeeModel(str); }

    str = firstString(obj, keysManufacturer);
    if (!str.isEmpty()) { entry->changes.setZigbeeManufacturer(str); }

    str = firstString(obj, keysFirmwareVersion);
    if (!str.isEmpty()) { entry->changes.setFirmwareVersion(str); }

    str = firstString(obj, keysBuildDate);
    if (!str.isEmpty())
    {
        const QDate date = DR_ParseBuildDate(str);
        if (date.isValid())
        {
            entry->changes.setFirmwareBuildDate(date);
        }
    }

    return true;
}

/*! Parses a Zigbee2MQTT 'bridge/devices' JSON array.
    Descriptors without IEEE address or friendly name are skipped.
    \returns DR_Success or DR_ErrorInvalidValue if \p json isn't a JSON array.
 */
DR_Status DR_ParseDeviceList(const QByteArray &json, std::vector<DR_ImportEntry> *entries)
{
    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &error);

    if (error.error != QJsonParseError::NoError)
    {
        DBG_Printf(DBG_INFO, "DR failed to parse device list, err: %s, offset: %d\n", qPrintable(error.errorString()), error.offset);
        return DR_ErrorInvalidValue;
    }

    if (!doc.isArray())
    {
        DBG_Printf(DBG_INFO, "DR device list is not a JSON array\n");
        return DR_ErrorInvalidValue;
    }

    const QJsonArray arr = doc.array();
    entries->reserve(entries->size() + size_t(arr.size()));

    for (const auto &val : arr)
    {
        if (!val.isObject())
        {
            continue;
        }

        DR_ImportEntry entry;
        if (parseEntry(val.toObject(), &entry))
        {
            entries->push_back(entry);
        }
        else
        {
            DBG_Printf(DBG_INFO_L2, "DR skip device list entry without ieee_address or friendly_name\n");
        }
    }

    return DR_Success;
}

DR_Status DR_ReadDeviceListFile(const QString &path, std::vector<DR_ImportEntry> *entries)
{
    QFile file(path);

    if (!file.open(QIODevice::ReadOnly))
    {
        DBG_Printf(DBG_ERROR, "DR failed to open device list %s: %s\n", qPrintable(path), qPrintable(file.errorString()));
        return DR_ErrorInvalidValue;
    }

    return DR_ParseDeviceList(file.readAll(), entries);
}

/*! Reconciles the registry with a device list snapshot.

    - unknown devices are created
    - known active devices are updated with the fields present in the entry
    - known retired devices are skipped, retirement is terminal
    - active devices missing in the snapshot are retired

    An empty snapshot retires nothing, the coordinator itself is always listed
    so an empty list hints to a broken export.

    Caller errors of single entries are counted in DR_ImportResult::failed.
    \returns DR_Success or DR_ErrorStorageUnavailable which aborts the import.
 */
DR_Status DR_ImportDevices(DeviceRegistry *registry, const std::vector<DR_ImportEntry> &entries, DR_ImportResult *result)
{
    QSet<QString> listed;
    DR_Device device;

    for (const DR_ImportEntry &entry : entries)
    {
        listed.insert(entry.ieeeAddress);

        DR_Status status = registry->getByAddress(entry.ieeeAddress, &device);

        if (status == DR_ErrorNotFound)
        {
            status = registry->create(entry.ieeeAddress, entry.changes.friendlyName, entry.changes);
            if (status == DR_Success)
            {
                result->created++;
                continue;
            }
        }
        else if (status == DR_Success && device.isRetired())
        {
            DBG_Printf(DBG_INFO, "DR import skip retired device %s\n", qPrintable(entry.ieeeAddress));
            result->skipped++;
            continue;
        }
        else if (status == DR_Success)
        {
            status = registry->update(entry.ieeeAddress, entry.changes);
            if (status == DR_Success)
            {
                result->updated++;
                continue;
            }
        }

        if (status == DR_ErrorStorageUnavailable)
        {
            return status;
        }

        DBG_Printf(DBG_INFO, "DR import of %s failed: %s\n", qPrintable(entry.ieeeAddress), DR_StatusToString(status));
        result->failed++;
    }

    if (entries.empty())
    {
        DBG_Printf(DBG_INFO, "DR import got empty device list, no devices retired\n");
        return DR_Success;
    }

    std::vector<QString> missing;
    {
        DR_ListFilter filter;
        filter.activeOnly = true;
        auto cursor = registry->list(filter);

        while (cursor->next(&device))
        {
            if (!listed.contains(device.ieeeAddress))
            {
                missing.push_back(device.ieeeAddress);
            }
        }

        if (cursor->status() != DR_Success)
        {
            return cursor->status();
        }
    }

    for (const QString &ieeeAddress : missing)
    {
        const DR_Status status = registry->retire(ieeeAddress);

        if (status == DR_Success)
        {
            result->retired++;
        }
        else if (status == DR_ErrorStorageUnavailable)
        {
            return status;
        }
        else if (status != DR_ErrorAlreadyRetired) // retired concurrently
        {
            result->failed++;
        }
    }

    DBG_Printf(DBG_INFO, "DR import done, created: %d, updated: %d, retired: %d, skipped: %d, failed: %d\n",
               result->created, result->updated, result->retired, result->skipped, result->failed);

    return DR_Success;
}
