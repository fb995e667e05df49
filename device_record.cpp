/*
 * Copyright (c) 2024 dresden elektronik ingenieurtechnik gmbh.
 * All rights reserved.
 *
 * The software in this package is published under the terms of the BSD
 * style license a copy of which has been included with this distribution in
 * the LICENSE.txt file.
 *
 */

#include "device_record.h"

const char *DR_StatusToString(DR_Status status)
{
    switch (status)
    {
    case DR_Success:                    return "Success";
    case DR_ErrorDuplicateIdentity:     return "DuplicateIdentity";
    case DR_ErrorDuplicateName:         return "DuplicateName";
    case DR_ErrorInvalidNetworkAddress: return "InvalidNetworkAddress";
    case DR_ErrorInvalidValue:          return "InvalidValue";
    case DR_ErrorNotFound:              return "NotFound";
    case DR_ErrorRetired:               return "Retired";
    case DR_ErrorAlreadyRetired:        return "AlreadyRetired";
    case DR_ErrorStorageUnavailable:    return "StorageUnavailable";
    }

    return "Unknown";
}

bool DR_IsValidIeeeAddress(const QString &ieeeAddress)
{
    return !ieeeAddress.isEmpty() && ieeeAddress.size() <= DR_MAX_IEEE_ADDRESS_LENGTH;
}

bool DR_IsValidFriendlyName(const QString &name)
{
    return !name.isEmpty() && name.size() <= DR_MAX_FRIENDLY_NAME_LENGTH;
}

static bool isValidOptionalString(const QString &str, int maxLength)
{
    return str.isNull() || str.size() <= maxLength;
}

/*! Verifies the values of all fields which are set in \p changes.
    \returns DR_Success or the error of the first invalid field.
 */
DR_Status DR_CheckChanges(const DR_DeviceChanges &changes)
{
    if (changes.has(DR_FieldFriendlyName) && !DR_IsValidFriendlyName(changes.friendlyName))
    {
        return DR_ErrorInvalidValue;
    }

    if (changes.has(DR_FieldNetworkAddress) && !changes.networkAddressCleared)
    {
        if (changes.networkAddress < DR_MIN_NETWORK_ADDRESS || changes.networkAddress > DR_MAX_NETWORK_ADDRESS)
        {
            return DR_ErrorInvalidNetworkAddress;
        }
    }

    if ((changes.has(DR_FieldFirmwareVersion) && !isValidOptionalString(changes.firmwareVersion, DR_MAX_FIRMWARE_VERSION_LENGTH)) ||
        (changes.has(DR_FieldDeviceType) && !isValidOptionalString(changes.deviceType, DR_MAX_DEVICE_TYPE_LENGTH)) ||
        (changes.has(DR_FieldZigbeeModel) && !isValidOptionalString(changes.zigbeeModel, DR_MAX_ZIGBEE_MODEL_LENGTH)) ||
        (changes.has(DR_FieldZigbeeManufacturer) && !isValidOptionalString(changes.zigbeeManufacturer, DR_MAX_ZIGBEE_MANUF_LENGTH)))
    {
        return DR_ErrorInvalidValue;
    }

    return DR_Success;
}

/*! Applies the fields set in \p changes to \p device.
    The changes must have been verified with DR_CheckChanges().
 */
void DR_ApplyChanges(DR_Device *device, const DR_DeviceChanges &changes)
{
    if (changes.has(DR_FieldFriendlyName))
    {
        device->friendlyName = changes.friendlyName;
    }

    if (changes.has(DR_FieldNetworkAddress))
    {
        device->networkAddress = changes.networkAddressCleared ? DR_NoNetworkAddress : int(changes.networkAddress);
    }

    if (changes.has(DR_FieldFirmwareBuildDate))
    {
        device->firmwareBuildDate = changes.firmwareBuildDate;
    }

    if (changes.has(DR_FieldFirmwareVersion))
    {
        device->firmwareVersion = changes.firmwareVersion;
    }

    if (changes.has(DR_FieldDeviceType))
    {
        device->deviceType = changes.deviceType;
    }

    if (changes.has(DR_FieldZigbeeModel))
    {
        device->zigbeeModel = changes.zigbeeModel;
    }

    if (changes.has(DR_FieldZigbeeManufacturer))
    {
        device->zigbeeManufacturer = changes.zigbeeManufacturer;
    }
}
