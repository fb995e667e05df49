#include <QFile>
#include "test_utils.h"
#include "catch2/catch.hpp"
#include "device_import.h"
#include "device_registry.h"

static const char *bridgeDevices = R"json([
  {
    "ieee_address": "0x00124b0012345678",
    "type": "Coordinator",
    "network_address": 0,
    "friendly_name": "Coordinator"
  },
  {
    "ieee_address": "0x0017880104e45517",
    "type": "Router",
    "network_address": 29159,
    "friendly_name": "living-room-bulb",
    "model_id": "LCT015",
    "manufacturer": "Philips",
    "software_build_id": "1.50.2_r30933",
    "date_code": "20191218"
  },
  {
    "ieeeAddress": "0x00158d0001e4a8b2",
    "friendlyName": "door-sensor",
    "type": "EndDevice",
    "networkAddress": 4321,
    "model": "MCCGQ11LM",
    "date_code": "2019-03-05"
  },
  {
    "ieee_address": "0x00158d000aaaaaaa",
    "type": "EndDevice"
  },
  "not an object"
])json";

TEST_CASE("001: Parse device list", "[Import]")
{
    std::vector<DR_ImportEntry> entries;
    REQUIRE(DR_ParseDeviceList(bridgeDevices, &entries) == DR_Success);
    REQUIRE(entries.size() == 3);

    const DR_ImportEntry &coord = entries[0];
    REQUIRE(coord.ieeeAddress == "0x00124b0012345678");
    REQUIRE(coord.changes.friendlyName == "Coordinator");
    REQUIRE(coord.changes.has(DR_FieldNetworkAddress));
    REQUIRE(coord.changes.networkAddress == 0);
    REQUIRE(coord.changes.deviceType == "Coordinator");
    REQUIRE(coord.changes.has(DR_FieldZigbeeModel) == false);

    const DR_ImportEntry &bulb = entries[1];
    REQUIRE(bulb.changes.friendlyName == "living-room-bulb");
    REQUIRE(bulb.changes.networkAddress == 29159);
    REQUIRE(bulb.changes.zigbeeModel == "LCT015");
    REQUIRE(bulb.changes.zigbeeManufacturer == "Philips");
    REQUIRE(bulb.changes.firmwareVersion == "1.50.2_r30933");
    REQUIRE(bulb.changes.firmwareBuildDate == QDate(2019, 12, 18));

    // alternative keys of older exports
    const DR_ImportEntry &door = entries[2];
    REQUIRE(door.ieeeAddress == "0x00158d0001e4a8b2");
    REQUIRE(door.changes.friendlyName == "door-sensor");
    REQUIRE(door.changes.networkAddress == 4321);
    REQUIRE(door.changes.zigbeeModel == "MCCGQ11LM");
    REQUIRE(door.changes.firmwareBuildDate == QDate(2019, 3, 5));
    REQUIRE(door.changes.has(DR_FieldZigbeeManufacturer) == false);
}

TEST_CASE("002: Parse invalid device lists", "[Import]")
{
    std::vector<DR_ImportEntry> entries;
    REQUIRE(DR_ParseDeviceList("{\"devices\": []}", &entries) == DR_ErrorInvalidValue);
    REQUIRE(DR_ParseDeviceList("[{\"ieee_address\": ", &entries) == DR_ErrorInvalidValue);
    REQUIRE(DR_ParseDeviceList("[]", &entries) == DR_Success);
    REQUIRE(entries.empty());

    REQUIRE(DR_ReadDeviceListFile("/nonexistent/devices.json", &entries) == DR_ErrorInvalidValue);
}

TEST_CASE("003: Parse firmware build dates", "[Import]")
{
    REQUIRE(DR_ParseBuildDate("20210708") == QDate(2021, 7, 8));
    REQUIRE(DR_ParseBuildDate("20210708 12:00") == QDate(2021, 7, 8));
    REQUIRE(DR_ParseBuildDate("2021-07-08") == QDate(2021, 7, 8));
    REQUIRE(DR_ParseBuildDate("2021-07-08T12:00:00Z") == QDate(2021, 7, 8));
    REQUIRE(DR_ParseBuildDate(" 20191218 ") == QDate(2019, 12, 18));
    REQUIRE(DR_ParseBuildDate("").isValid() == false);
    REQUIRE(DR_ParseBuildDate("v1.2").isValid() == false);
    REQUIRE(DR_ParseBuildDate("20211399").isValid() == false);
}

TEST_CASE("004: Import device list", "[Import]")
{
    TestDatabase tdb;
    DeviceRegistry registry(tdb.config);
    REQUIRE(registry.open() == DR_Success);

    std::vector<DR_ImportEntry> entries;
    REQUIRE(DR_ParseDeviceList(bridgeDevices, &entries) == DR_Success);

    SECTION("Import into empty registry")
    {
        DR_ImportResult result;
        REQUIRE(DR_ImportDevices(&registry, entries, &result) == DR_Success);
        REQUIRE(result.created == 3);
        REQUIRE(result.updated == 0);
        REQUIRE(result.retired == 0);
        REQUIRE(result.failed == 0);

        DR_Device dev;
        REQUIRE(registry.getByFriendlyName("living-room-bulb", &dev) == DR_Success);
        REQUIRE(dev.networkAddress == 29159);
        REQUIRE(dev.firmwareBuildDate == QDate(2019, 12, 18));

        SECTION("Import again updates")
        {
            DR_ImportResult again;
            REQUIRE(DR_ImportDevices(&registry, entries, &again) == DR_Success);
            REQUIRE(again.created == 0);
            REQUIRE(again.updated == 3);
            REQUIRE(again.retired == 0);
        }
    }

    SECTION("Reconcile with an existing registry")
    {
        REQUIRE(registry.create("0x0000000000000001", "gone-device", DR_DeviceChanges()) == DR_Success);
        REQUIRE(registry.create("0x00158d0001e4a8b2", "old-door-name", DR_DeviceChanges()) == DR_Success);
        REQUIRE(registry.create("0x0017880104e45517", "retired-bulb", DR_DeviceChanges()) == DR_Success);
        REQUIRE(registry.retire("0x0017880104e45517") == DR_Success);

        DR_ImportResult result;
        REQUIRE(DR_ImportDevices(&registry, entries, &result) == DR_Success);
        REQUIRE(result.created == 1);
        REQUIRE(result.updated == 1);
        REQUIRE(result.skipped == 1);
        REQUIRE(result.retired == 1);
        REQUIRE(result.failed == 0);

        DR_Device dev;
        REQUIRE(registry.getByAddress("0x0000000000000001", &dev) == DR_Success);
        REQUIRE(dev.isRetired());

        REQUIRE(registry.getByAddress("0x00158d0001e4a8b2", &dev) == DR_Success);
        REQUIRE(dev.friendlyName == "door-sensor");
        REQUIRE(dev.networkAddress == 4321);

        // retirement is terminal, the listed bulb stays retired
        REQUIRE(registry.getByAddress("0x0017880104e45517", &dev) == DR_Success);
        REQUIRE(dev.isRetired());
        REQUIRE(dev.friendlyName == "retired-bulb");
    }

    SECTION("Entries with caller errors are counted")
    {
        REQUIRE(registry.create("0x0000000000000002", "living-room-bulb", DR_DeviceChanges()) == DR_Success);

        DR_ImportResult result;
        REQUIRE(DR_ImportDevices(&registry, entries, &result) == DR_Success);
        REQUIRE(result.created == 2);
        REQUIRE(result.failed == 1);
        REQUIRE(result.retired == 1);
        REQUIRE(registry.getByAddress("0x0017880104e45517", nullptr) == DR_ErrorNotFound);
    }

    SECTION("Empty list retires nothing")
    {
        REQUIRE(registry.create("0x0000000000000001", "kept", DR_DeviceChanges()) == DR_Success);

        DR_ImportResult result;
        REQUIRE(DR_ImportDevices(&registry, std::vector<DR_ImportEntry>(), &result) == DR_Success);
        REQUIRE(result.retired == 0);

        DR_Device dev;
        REQUIRE(registry.getByAddress("0x0000000000000001", &dev) == DR_Success);
        REQUIRE(dev.isRetired() == false);
    }

    SECTION("Import from file")
    {
        QFile file(tdb.dir.filePath("devices.json"));
        REQUIRE(file.open(QIODevice::WriteOnly));
        REQUIRE(file.write(bridgeDevices) > 0);
        file.close();

        std::vector<DR_ImportEntry> fromFile;
        REQUIRE(DR_ReadDeviceListFile(file.fileName(), &fromFile) == DR_Success);
        REQUIRE(fromFile.size() == entries.size());
    }
}

TEST_CASE("005: Network addresses outside the integer range", "[Import]")
{
    const char *json = R"json([
      { "ieee_address": "0x0000000000000011", "friendly_name": "huge", "network_address": 1e30 },
      { "ieee_address": "0x0000000000000012", "friendly_name": "fraction", "network_address": 12.9 },
      { "ieee_address": "0x0000000000000013", "friendly_name": "negative", "network_address": -5 },
      { "ieee_address": "0x0000000000000014", "friendly_name": "valid", "network_address": 65535 }
    ])json";

    std::vector<DR_ImportEntry> entries;
    REQUIRE(DR_ParseDeviceList(json, &entries) == DR_Success);
    REQUIRE(entries.size() == 4);

    for (size_t i = 0; i < 3; i++)
    {
        REQUIRE(entries[i].changes.has(DR_FieldNetworkAddress));
        REQUIRE(DR_CheckChanges(entries[i].changes) == DR_ErrorInvalidNetworkAddress);
    }

    REQUIRE(entries[3].changes.networkAddress == 65535);
    REQUIRE(DR_CheckChanges(entries[3].changes) == DR_Success);

    TestDatabase tdb;
    DeviceRegistry registry(tdb.config);
    REQUIRE(registry.open() == DR_Success);

    DR_ImportResult result;
    REQUIRE(DR_ImportDevices(&registry, entries, &result) == DR_Success);
    REQUIRE(result.created == 1);
    REQUIRE(result.failed == 3);
    REQUIRE(registry.getByFriendlyName("fraction", nullptr) == DR_ErrorNotFound);
}
