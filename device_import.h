/*
 * Copyright (c) 2024 dresden elektronik ingenieurtechnik gmbh.
 * All rights reserved.
 *
 * The software in this package is published under the terms of the BSD
 * style license a copy of which has been included with this distribution in
 * the LICENSE.txt file.
 *
 */

#ifndef DEVICE_IMPORT_H
#define DEVICE_IMPORT_H

#include <vector>
#include <QByteArray>
#include <QString>
#include "device_record.h"

class DeviceRegistry;

/*! \struct DR_ImportEntry

    One device descriptor of a Zigbee2MQTT 'bridge/devices' list.
    \c changes carries the friendly name and all optional fields found in the descriptor.
 */
struct DR_ImportEntry
{
    QString ieeeAddress;
    DR_DeviceChanges changes;
};

struct DR_ImportResult
{
    int created = 0;
    int updated = 0;
    int retired = 0;
    int skipped = 0; // retired devices still listed
    int failed = 0;
};

QDate DR_ParseBuildDate(const QString &str);
DR_Status DR_ParseDeviceList(const QByteArray &json, std::vector<DR_ImportEntry> *entries);
DR_Status DR_ReadDeviceListFile(const QString &path, std::vector<DR_ImportEntry> *entries);
DR_Status DR_ImportDevices(DeviceRegistry *registry, const std::vector<DR_ImportEntry> &entries, DR_ImportResult *result);

#endif // DEVICE_IMPORT_H
