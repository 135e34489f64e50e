/* Copyright (C) 2017-2024 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include <fmt/core.h>

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QStandardPaths>
#include <QString>
#include <QStringList>
#include <csignal>
#include <memory>
#include <optional>

#include "config.h"
#include "devicemanager.h"
#include "logger.hpp"
#include "qtlogger.hpp"
#include "settings.h"
#include "utils.h"

static void signalHandler(int sig) {
    qDebug() << "received signal:" << sig;

    QCoreApplication::quit();
}

enum class Command { List, Play, Daemon };

struct CmdOptions {
    bool valid = true;
    bool verbose = false;
    bool loop = false;
    Command command = Command::Daemon;
    QString log_file;
    QString config_file;
    QString autoplay_file;
    QString device;
    QString media;
    std::optional<int> start;
};

static CmdOptions checkOptions(const QCoreApplication& app) {
    QCommandLineParser parser;

    parser.setApplicationDescription(
        QStringLiteral("Streams local media to UPnP/DLNA renderers."));

    QCommandLineOption verbose_opt{QStringLiteral("verbose"),
                                   QStringLiteral("Enables debug output.")};
    parser.addOption(verbose_opt);

    QCommandLineOption log_file_opt{
        QStringLiteral("log-file"),
        QStringLiteral("Write logs to <log-file> instead of stderr."),
        QStringLiteral("log-file")};
    parser.addOption(log_file_opt);

    QCommandLineOption config_opt{
        QStringLiteral("config"),
        QStringLiteral("Read settings from <config> INI file."),
        QStringLiteral("config")};
    parser.addOption(config_opt);

    QCommandLineOption autoplay_opt{
        QStringLiteral("autoplay"),
        QStringLiteral("Auto-play mapping JSON file (daemon)."),
        QStringLiteral("autoplay")};
    parser.addOption(autoplay_opt);

    QCommandLineOption device_opt{
        QStringLiteral("device"),
        QStringLiteral("Name or id of the renderer (play)."),
        QStringLiteral("device")};
    parser.addOption(device_opt);

    QCommandLineOption loop_opt{QStringLiteral("loop"),
                                QStringLiteral("Restart media when it ends.")};
    parser.addOption(loop_opt);

    QCommandLineOption start_opt{
        QStringLiteral("start"),
        QStringLiteral("Seek to <time> (HH:MM:SS or seconds) after start "
                       "(play)."),
        QStringLiteral("time")};
    parser.addOption(start_opt);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("list, play or daemon."));
    parser.addPositionalArgument(QStringLiteral("media"),
                                 QStringLiteral("Media file (play)."),
                                 QStringLiteral("[media]"));

    parser.addHelpOption();
    parser.addVersionOption();

    parser.process(app);

    CmdOptions options;
    options.log_file = parser.value(log_file_opt);
    options.config_file = parser.value(config_opt);
    options.autoplay_file = parser.value(autoplay_opt);
    options.device = parser.value(device_opt);
    options.verbose = parser.isSet(verbose_opt);
    options.loop = parser.isSet(loop_opt);

    if (parser.isSet(start_opt)) {
        options.start = Utils::strToSec(parser.value(start_opt));
        if (!options.start) {
            fmt::print(stderr, "invalid start time: {}\n",
                       parser.value(start_opt).toStdString());
            options.valid = false;
            return options;
        }
    }

    auto args = parser.positionalArguments();
    if (args.isEmpty()) {
        fmt::print(stderr, "missing command\n\n{}",
                   parser.helpText().toStdString());
        options.valid = false;
        return options;
    }

    const auto& cmd = args.first();
    if (cmd == QLatin1String("list")) {
        options.command = Command::List;
    } else if (cmd == QLatin1String("play")) {
        options.command = Command::Play;
        if (args.size() < 2 || options.device.isEmpty()) {
            fmt::print(stderr, "usage: {} play <media> --device <name-or-id>\n",
                       APP_BINARY_ID);
            options.valid = false;
            return options;
        }
        options.media = args.at(1);
    } else if (cmd == QLatin1String("daemon")) {
        options.command = Command::Daemon;
    } else {
        fmt::print(stderr, "unknown command: {}\n", cmd.toStdString());
        options.valid = false;
    }

    return options;
}

static void makeAppDirs() {
    auto root = QDir::root();
    root.mkpath(
        QStandardPaths::writableLocation(QStandardPaths::ConfigLocation));
    root.mkpath(
        QStandardPaths::writableLocation(QStandardPaths::CacheLocation));
}

static void printDevices(const std::vector<DeviceRecord>& devices) {
    if (devices.empty()) {
        fmt::print("no devices found\n");
        return;
    }

    for (const auto& dev : devices) {
        fmt::print("{:<32} {:<12} {}\n", dev.friendlyName.toStdString(),
                   deviceStatusName(dev.status).toStdString(),
                   dev.id.toStdString());
        fmt::print("    {} {}\n", dev.controlUrl.toString().toStdString(),
                   dev.modelName.toStdString());
    }
}

static int runList(DeviceManager& manager) {
    manager.runDiscoveryCycle();
    printDevices(manager.listDevices());
    return 0;
}

static int runPlay(DeviceManager& manager, const CmdOptions& options) {
    manager.runDiscoveryCycle();

    auto device = manager.findDevice(options.device);
    if (!device) {
        LOGE("device not found: " << options.device.toStdString());
        return 1;
    }

    auto result = manager.play(device->id, options.media, options.loop);
    if (!result) {
        LOGE("play failed: " << errorTypeName(result.error).toStdString()
                             << ": " << result.message.toStdString());
        return 1;
    }

    if (options.start && *options.start > 0) {
        auto seekResult = manager.seek(device->id, *options.start);
        if (!seekResult)
            LOGW("seek failed: " << seekResult.message.toStdString());
    }

    LOGI("playing on " << device->friendlyName.toStdString()
                       << ", press Ctrl+C to stop");

    QCoreApplication::exec();

    auto stopResult = manager.stop(device->id);
    if (!stopResult)
        LOGW("stop failed: " << stopResult.message.toStdString());

    return 0;
}

static int runDaemon(DeviceManager& manager, const Settings& settings,
                     const CmdOptions& options) {
    auto mapping = options.autoplay_file.isEmpty() ? settings.autoPlayConfig()
                                                   : options.autoplay_file;
    if (!mapping.isEmpty()) {
        auto result = manager.loadAutoPlayConfigFile(mapping);
        if (!result) {
            LOGE("cannot load auto-play config: "
                 << result.message.toStdString());
            return 1;
        }
    }

    manager.startDiscovery();

    LOGI("daemon started");

    QCoreApplication::exec();

    LOGI("daemon stopping");

    return 0;
}

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);

    QCoreApplication::setApplicationName(QStringLiteral(APP_ID));
    QCoreApplication::setOrganizationName(QStringLiteral(APP_ORG));
    QCoreApplication::setOrganizationDomain(QStringLiteral(APP_DOMAIN));
    QCoreApplication::setApplicationVersion(QStringLiteral(APP_VERSION));

    auto cmdOpts = checkOptions(app);

    if (!cmdOpts.valid) return 1;

    LoopcastLogger::init(cmdOpts.verbose ? LoopcastLogger::LogType::Debug
                                         : LoopcastLogger::LogType::Info,
                         cmdOpts.log_file.toStdString());
    initQtLogger();

    qDebug() << "version:" << APP_VERSION;

    makeAppDirs();

    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    Settings settings{cmdOpts.config_file};

    if (!cmdOpts.verbose) LoopcastLogger::setLevel(settings.logLevel());
    if (cmdOpts.log_file.isEmpty() && !settings.logFile().isEmpty())
        LoopcastLogger::setFile(settings.logFile().toStdString());

    qDebug() << "local address:" << Utils::localIpAddress();

    DeviceManager manager{
        settings.managerConfig(),
        std::make_shared<DiscoveryClient>(settings.discoveryConfig()),
        std::make_shared<AvTransportClient>(settings.controlOptions()),
        std::make_shared<StreamServer>(settings.streamServerConfig())};

    int ret = 0;

    switch (cmdOpts.command) {
        case Command::List:
            ret = runList(manager);
            break;
        case Command::Play:
            ret = runPlay(manager, cmdOpts);
            break;
        case Command::Daemon:
            ret = runDaemon(manager, settings, cmdOpts);
            break;
    }

    manager.shutdown();

    qDebug() << "exiting";

    return ret;
}
