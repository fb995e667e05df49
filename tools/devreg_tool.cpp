/*
 * Copyright (c) 2024 dresden elektronik ingenieurtechnik gmbh.
 * All rights reserved.
 *
 * The software in this package is published under the terms of the BSD
 * style license a copy of which has been included with this distribution in
 * the LICENSE.txt file.
 *
 */

#include <stdio.h>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QStringList>
#include "database.h"
#include "deconz/dbg_trace.h"
#include "device_import.h"
#include "device_registry.h"
#include "registry_config.h"

#define EXIT_USAGE 1
#define EXIT_REGISTRY_ERROR 2

static void printDevice(const DR_Device &dev)
{
    printf("%-24s  %-32s  nwk: %-6s  type: %-10s  model: %s (%s)  fw: %s %s  created: %s%s%s\n",
           qPrintable(dev.ieeeAddress),
           qPrintable(dev.friendlyName),
           dev.hasNetworkAddress() ? qPrintable(QString("0x%1").arg(dev.networkAddress, 4, 16, QLatin1Char('0'))) : "-",
           dev.deviceType.isNull() ? "-" : qPrintable(dev.deviceType),
           dev.zigbeeModel.isNull() ? "-" : qPrintable(dev.zigbeeModel),
           dev.zigbeeManufacturer.isNull() ? "-" : qPrintable(dev.zigbeeManufacturer),
           dev.firmwareVersion.isNull() ? "-" : qPrintable(dev.firmwareVersion),
           dev.firmwareBuildDate.isValid() ? qPrintable(dev.firmwareBuildDate.toString(Qt::ISODate)) : "",
           qPrintable(DB_TimestampToString(dev.createdAt)),
           dev.isRetired() ? "  retired: " : "",
           dev.isRetired() ? qPrintable(DB_TimestampToString(dev.retiredAt)) : "");
}

static int reportStatus(const char *command, DR_Status status)
{
    if (status == DR_Success)
    {
        return 0;
    }

    fprintf(stderr, "%s failed: %s\n", command, DR_StatusToString(status));
    return EXIT_REGISTRY_ERROR;
}

static int cmdSchema()
{
    const char * const *sql = DB_DeviceSchema();

    for (int i = 0; sql[i] != nullptr; i++)
    {
        printf("%s;\n", sql[i]);
    }

    return 0;
}

static int cmdList(DeviceRegistry &registry, bool activeOnly)
{
    DR_ListFilter filter;
    filter.activeOnly = activeOnly;

    DR_Device dev;
    auto cursor = registry.list(filter);

    while (cursor->next(&dev))
    {
        printDevice(dev);
    }

    return reportStatus("list", cursor->status());
}

static int cmdShow(DeviceRegistry &registry, const QString &ieeeAddress)
{
    DR_Device dev;
    const DR_Status status = registry.getByAddress(ieeeAddress, &dev);

    if (status == DR_Success)
    {
        printDevice(dev);
    }

    return reportStatus("show", status);
}

static int cmdImport(DeviceRegistry &registry, const QString &path)
{
    std::vector<DR_ImportEntry> entries;

    DR_Status status = DR_ReadDeviceListFile(path, &entries);
    if (status != DR_Success)
    {
        return reportStatus("import", status);
    }

    DR_ImportResult result;
    status = DR_ImportDevices(&registry, entries, &result);

    printf("created: %d, updated: %d, retired: %d, skipped: %d, failed: %d\n",
           result.created, result.updated, result.retired, result.skipped, result.failed);

    return reportStatus("import", status);
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("devreg-tool");

    QCommandLineParser parser;
    parser.setApplicationDescription("Device registry maintenance tool.\n\n"
                                     "Commands:\n"
                                     "  schema                     print the CREATE statements\n"
                                     "  list [--active]            print devices ordered by creation\n"
                                     "  show <ieee>                print one device\n"
                                     "  create <ieee> <name>       create a device, see --nwk\n"
                                     "  rename <ieee> <name>       change the friendly name\n"
                                     "  retire <ieee>              retire a device\n"
                                     "  import <file.json>         reconcile a Zigbee2MQTT bridge/devices list");
    parser.addHelpOption();

    const QCommandLineOption configOption("config", "INI configuration file.", "ini");
    const QCommandLineOption databaseOption("database", "SQLite database file, overrides database/path.", "file");
    const QCommandLineOption activeOption("active", "list: only active devices.");
    const QCommandLineOption nwkOption("nwk", "create: network address.", "address");
    const QCommandLineOption verboseOption("verbose", "Verbose debug output.");
    parser.addOption(configOption);
    parser.addOption(databaseOption);
    parser.addOption(activeOption);
    parser.addOption(nwkOption);
    parser.addOption(verboseOption);
    parser.addPositionalArgument("command", "Command to run.");

    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty())
    {
        parser.showHelp(EXIT_USAGE);
    }

    const QString command = args.at(0);

    if (command == QLatin1String("schema"))
    {
        return cmdSchema();
    }

    DR_Config config;
    if (parser.isSet(configOption) && !DR_LoadConfig(parser.value(configOption), &config))
    {
        fprintf(stderr, "failed to load config %s\n", qPrintable(parser.value(configOption)));
        return EXIT_USAGE;
    }

    if (parser.isSet(databaseOption))
    {
        config.databasePath = parser.value(databaseOption);
    }

    if (parser.isSet(verboseOption))
    {
        config.debugLevel = 2;
    }

    DR_ApplyDebugLevel(config.debugLevel);

    DeviceRegistry registry(config);
    DR_Status status = registry.open();
    if (status != DR_Success)
    {
        fprintf(stderr, "can't open database %s\n", qPrintable(registry.config().databasePath));
        return reportStatus("open", status);
    }

    if (command == QLatin1String("list"))
    {
        return cmdList(registry, parser.isSet(activeOption));
    }
    else if (command == QLatin1String("show") && args.size() == 2)
    {
        return cmdShow(registry, args.at(1));
    }
    else if (command == QLatin1String("create") && args.size() == 3)
    {
        DR_DeviceChanges optional;
        if (parser.isSet(nwkOption))
        {
            bool ok = false;
            const qint64 nwk = parser.value(nwkOption).toLongLong(&ok, 0);
            if (!ok)
            {
                fprintf(stderr, "invalid network address %s\n", qPrintable(parser.value(nwkOption)));
                return EXIT_USAGE;
            }
            optional.setNetworkAddress(nwk);
        }

        DR_Device dev;
        status = registry.create(args.at(1), args.at(2), optional, &dev);
        if (status == DR_Success)
        {
            printDevice(dev);
        }
        return reportStatus("create", status);
    }
    else if (command == QLatin1String("rename") && args.size() == 3)
    {
        DR_DeviceChanges changes;
        changes.setFriendlyName(args.at(2));

        DR_Device dev;
        status = registry.update(args.at(1), changes, &dev);
        if (status == DR_Success)
        {
            printDevice(dev);
        }
        return reportStatus("rename", status);
    }
    else if (command == QLatin1String("retire") && args.size() == 2)
    {
        DR_Device dev;
        status = registry.retire(args.at(1), &dev);
        if (status == DR_Success)
        {
            printDevice(dev);
        }
        return reportStatus("retire", status);
    }
    else if (command == QLatin1String("import") && args.size() == 2)
    {
        return cmdImport(registry, args.at(1));
    }

    fprintf(stderr, "unknown command or wrong arguments: %s\n", qPrintable(args.join(' ')));
    return EXIT_USAGE;
}
