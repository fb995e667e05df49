/*
 * Copyright (c) 2024 dresden elektronik ingenieurtechnik gmbh.
 * All rights reserved.
 *
 * The software in this package is published under the terms of the BSD
 * style license a copy of which has been included with this distribution in
 * the LICENSE.txt file.
 *
 */

#ifndef DEVICE_RECORD_H
#define DEVICE_RECORD_H

#include <QDate>
#include <QDateTime>
#include <QString>

// 00:11:22:33:44:55:66:77 or 0x00124B0012345678
#define DR_MAX_IEEE_ADDRESS_LENGTH      24
#define DR_MAX_FRIENDLY_NAME_LENGTH     120
#define DR_MAX_FIRMWARE_VERSION_LENGTH  60
#define DR_MAX_DEVICE_TYPE_LENGTH       60
#define DR_MAX_ZIGBEE_MODEL_LENGTH      120
#define DR_MAX_ZIGBEE_MANUF_LENGTH      120

#define DR_MIN_NETWORK_ADDRESS 0
#define DR_MAX_NETWORK_ADDRESS 65535

/*! Result codes of the device registry operations. */
enum DR_Status
{
    DR_Success = 0,
    DR_ErrorDuplicateIdentity,
    DR_ErrorDuplicateName,
    DR_ErrorInvalidNetworkAddress,
    DR_ErrorInvalidValue,
    DR_ErrorNotFound,
    DR_ErrorRetired,
    DR_ErrorAlreadyRetired,
    DR_ErrorStorageUnavailable
};

const char *DR_StatusToString(DR_Status status);

constexpr int DR_NoNetworkAddress = -1;

/*! \struct DR_Device

    A persistent device record.

    Optional attributes use the Qt null semantics: a null QString, an invalid
    QDate/QDateTime. An unassigned network address is DR_NoNetworkAddress.
 */
struct DR_Device
{
    QString ieeeAddress;
    QString friendlyName;
    int networkAddress = DR_NoNetworkAddress;
    QDate firmwareBuildDate;
    QString firmwareVersion;
    QString deviceType;
    QString zigbeeModel;
    QString zigbeeManufacturer;
    QDateTime createdAt; // UTC
    QDateTime retiredAt; // UTC, invalid while active

    bool hasNetworkAddress() const { return networkAddress != DR_NoNetworkAddress; }
    bool isRetired() const { return retiredAt.isValid(); }
};

/*! Bits of DR_DeviceChanges::fields. */
enum DR_DeviceField
{
    DR_FieldFriendlyName       = 0x0001,
    DR_FieldNetworkAddress     = 0x0002,
    DR_FieldFirmwareBuildDate  = 0x0004,
    DR_FieldFirmwareVersion    = 0x0008,
    DR_FieldDeviceType         = 0x0010,
    DR_FieldZigbeeModel        = 0x0020,
    DR_FieldZigbeeManufacturer = 0x0040
};

/*! \struct DR_DeviceChanges

    A set of field changes for DeviceRegistry::create() and DeviceRegistry::update().

    Only fields whose bit is set in \c fields are applied, all others keep
    their current value. A field which is set to a null value is cleared.
    The IEEE address and the creation timestamp aren't part of this struct
    since they can't be changed.
 */
struct DR_DeviceChanges
{
    quint32 fields = 0;
    QString friendlyName;
    qint64 networkAddress = DR_NoNetworkAddress;
    bool networkAddressCleared = false;
    QDate firmwareBuildDate;
    QString firmwareVersion;
    QString deviceType;
    QString zigbeeModel;
    QString zigbeeManufacturer;

    bool has(DR_DeviceField field) const { return (fields & field) != 0; }
    bool isEmpty() const { return fields == 0; }

    void setFriendlyName(const QString &name) { friendlyName = name; fields |= DR_FieldFriendlyName; }
    void setNetworkAddress(qint64 nwk) { networkAddress = nwk; networkAddressCleared = false; fields |= DR_FieldNetworkAddress; }
    void clearNetworkAddress() { networkAddress = DR_NoNetworkAddress; networkAddressCleared = true; fields |= DR_FieldNetworkAddress; }
    void setFirmwareBuildDate(const QDate &date) { firmwareBuildDate = date; fields |= DR_FieldFirmwareBuildDate; }
    void setFirmwareVersion(const QString &version) { firmwareVersion = version; fields |= DR_FieldFirmwareVersion; }
    void setDeviceType(const QString &type) { deviceType = type; fields |= DR_FieldDeviceType; }
    void setZigbeeModel(const QString &model) { zigbeeModel = model; fields |= DR_FieldZigbeeModel; }
    void setZigbeeManufacturer(const QString &manufacturer) { zigbeeManufacturer = manufacturer; fields |= DR_FieldZigbeeManufacturer; }
};

DR_Status DR_CheckChanges(const DR_DeviceChanges &changes);
void DR_ApplyChanges(DR_Device *device, const DR_DeviceChanges &changes);
bool DR_IsValidIeeeAddress(const QString &ieeeAddress);
bool DR_IsValidFriendlyName(const QString &name);

#endif // DEVICE_RECORD_H
