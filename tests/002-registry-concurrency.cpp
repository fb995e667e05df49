#include <atomic>
#include <thread>
#include <vector>
#include "test_utils.h"
#include "catch2/catch.hpp"
#include "database.h"
#include "device_registry.h"

TEST_CASE("001: Concurrent creates with the same friendly name", "[Concurrency]")
{
    TestDatabase tdb;
    DeviceRegistry registry(tdb.config);
    REQUIRE(registry.open() == DR_Success);

    const int threadCount = 8;
    std::atomic<int> successes(0);
    std::atomic<int> duplicates(0);
    std::atomic<int> others(0);
    std::vector<std::thread> threads;

    for (int i = 0; i < threadCount; i++)
    {
        threads.emplace_back([&registry, &successes, &duplicates, &others, i]()
        {
            const QString ieee = QString("00:00:00:00:00:00:10:%1").arg(i, 2, 10, QLatin1Char('0'));
            const DR_Status status = registry.create(ieee, "shared-name", DR_DeviceChanges());

            if (status == DR_Success) { successes++; }
            else if (status == DR_ErrorDuplicateName) { duplicates++; }
            else { others++; }
        });
    }

    for (auto &t : threads)
    {
        t.join();
    }

    REQUIRE(successes == 1);
    REQUIRE(duplicates == threadCount - 1);
    REQUIRE(others == 0);

    int count = 0;
    REQUIRE(registry.count(DR_ListFilter(), &count) == DR_Success);
    REQUIRE(count == 1);
}

TEST_CASE("002: Two registries on one database file", "[Concurrency]")
{
    TestDatabase tdb;
    DeviceRegistry first(tdb.config);
    DeviceRegistry second(tdb.config);
    REQUIRE(first.open() == DR_Success);
    REQUIRE(second.open() == DR_Success);

    SECTION("Same IEEE address from both")
    {
        DR_Status s1 = DR_Success;
        DR_Status s2 = DR_Success;

        std::thread t1([&]() { s1 = first.create("00:00:00:00:00:00:20:01", "first", DR_DeviceChanges()); });
        std::thread t2([&]() { s2 = second.create("00:00:00:00:00:00:20:01", "second", DR_DeviceChanges()); });
        t1.join();
        t2.join();

        REQUIRE(((s1 == DR_Success && s2 == DR_ErrorDuplicateIdentity) ||
                 (s2 == DR_Success && s1 == DR_ErrorDuplicateIdentity)));
    }

    SECTION("Writes of one are visible to the other")
    {
        REQUIRE(first.create("00:00:00:00:00:00:20:02", "visible", DR_DeviceChanges()) == DR_Success);

        DR_Device dev;
        REQUIRE(second.getByFriendlyName("visible", &dev) == DR_Success);
        REQUIRE(second.retire(dev.ieeeAddress) == DR_Success);
        REQUIRE(first.retire(dev.ieeeAddress) == DR_ErrorAlreadyRetired);
    }
}

TEST_CASE("003: Retire racing updates", "[Concurrency]")
{
    TestDatabase tdb;
    DeviceRegistry registry(tdb.config);
    REQUIRE(registry.open() == DR_Success);

    const QString ieee = QLatin1String("00:00:00:00:00:00:30:01");
    REQUIRE(registry.create(ieee, "racer", DR_DeviceChanges()) == DR_Success);

    std::atomic<int> unexpected(0);
    std::atomic<bool> retired(false);

    std::thread updater([&]()
    {
        for (int i = 0; i < 200; i++)
        {
            DR_DeviceChanges changes;
            changes.setNetworkAddress(i);
            const DR_Status status = registry.update(ieee, changes);

            if (status == DR_ErrorRetired)
            {
                retired = true;
            }
            else if (status != DR_Success || retired)
            {
                // once retired no update may succeed again
                unexpected++;
            }
        }
    });

    std::thread retirer([&]()
    {
        if (registry.retire(ieee) != DR_Success)
        {
            unexpected++;
        }
    });

    updater.join();
    retirer.join();

    REQUIRE(unexpected == 0);

    DR_Device dev;
    REQUIRE(registry.getByAddress(ieee, &dev) == DR_Success);
    REQUIRE(dev.isRetired());

    DR_DeviceChanges changes;
    changes.setNetworkAddress(1);
    REQUIRE(registry.update(ieee, changes) == DR_ErrorRetired);
}

TEST_CASE("004: Busy database", "[Concurrency]")
{
    TestDatabase tdb;
    tdb.config.busyTimeoutMs = 0;

    DeviceRegistry registry(tdb.config);
    REQUIRE(registry.open() == DR_Success);
    REQUIRE(registry.config().busyTimeoutMs == 0);

    const QString ieee = QLatin1String("00:00:00:00:00:00:40:01");
    DR_DeviceChanges optional;
    optional.setNetworkAddress(7);
    REQUIRE(registry.create(ieee, "busy-device", optional) == DR_Success);

    // another writer holds the write lock
    sqlite3 *other = DB_Open(tdb.config.databasePath, tdb.config, DB_OpenReadWrite);
    REQUIRE(other != nullptr);
    REQUIRE(DB_BeginImmediate(other) == SQLITE_OK);
    REQUIRE(sqlite3_exec(other, "INSERT INTO device (ieee_address, friendly_name) VALUES ('00:00:00:00:00:00:40:02', 'uncommitted')", nullptr, nullptr, nullptr) == SQLITE_OK);

    DR_DeviceChanges changes;
    changes.setNetworkAddress(8);
    changes.setFriendlyName("renamed");

    REQUIRE(registry.create("00:00:00:00:00:00:40:03", "new-device", DR_DeviceChanges()) == DR_ErrorStorageUnavailable);
    REQUIRE(registry.update(ieee, changes) == DR_ErrorStorageUnavailable);
    REQUIRE(registry.retire(ieee) == DR_ErrorStorageUnavailable);

    // reads aren't blocked by the writer
    DR_Device dev;
    REQUIRE(registry.getByAddress(ieee, &dev) == DR_Success);
    REQUIRE(registry.getByFriendlyName("uncommitted", nullptr) == DR_ErrorNotFound);

    DB_Rollback(other);
    DB_Close(other);

    // failed operations left no trace
    REQUIRE(registry.getByAddress(ieee, &dev) == DR_Success);
    REQUIRE(dev.friendlyName == "busy-device");
    REQUIRE(dev.networkAddress == 7);
    REQUIRE(dev.isRetired() == false);
    REQUIRE(registry.getByAddress("00:00:00:00:00:00:40:03", nullptr) == DR_ErrorNotFound);
    REQUIRE(registry.getByAddress("00:00:00:00:00:00:40:02", nullptr) == DR_ErrorNotFound);

    int count = 0;
    REQUIRE(registry.count(DR_ListFilter(), &count) == DR_Success);
    REQUIRE(count == 1);

    // the registry recovers once the lock is released
    REQUIRE(registry.update(ieee, changes) == DR_Success);
    REQUIRE(registry.retire(ieee) == DR_Success);
}
