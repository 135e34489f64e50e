/* Copyright (C) 2024 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "devicemanager.h"

#include <QDateTime>
#include <QElapsedTimer>
#include <QFile>
#include <QTemporaryDir>
#include <QThread>
#include <catch2/catch_test_macros.hpp>
#include <memory>

#include "fakes.h"
#include "utils.h"

namespace {
const QString dev1 = QStringLiteral("uuid:dev-1");
const QString dev2 = QStringLiteral("uuid:dev-2");

struct ManagerFixture {
    QTemporaryDir dir;
    std::shared_ptr<FakeSsdpTransport> ssdp =
        std::make_shared<FakeSsdpTransport>();
    std::shared_ptr<FakeSoapTransport> soap =
        std::make_shared<FakeSoapTransport>();
    std::shared_ptr<StreamServer> streams;
    std::unique_ptr<DeviceManager> manager;
    QString media;
    QString otherMedia;

    ManagerFixture() {
        const auto loc1 = QStringLiteral("http://192.168.1.10:49152/desc.xml");
        const auto loc2 = QStringLiteral("http://192.168.1.11:1400/desc.xml");
        ssdp->addReply(FakeSsdpTransport::reply(loc1, QStringLiteral("dev-1")));
        ssdp->addReply(FakeSsdpTransport::reply(loc2, QStringLiteral("dev-2")));
        ssdp->addDescription(
            loc1, FakeSsdpTransport::description(QStringLiteral("dev-1"),
                                                 QStringLiteral("Living Room"),
                                                 QStringLiteral("/avt")));
        ssdp->addDescription(
            loc2, FakeSsdpTransport::description(QStringLiteral("dev-2"),
                                                 QStringLiteral("Kitchen"),
                                                 QStringLiteral("/avt")));

        media = writeFile(QStringLiteral("a.mp4"));
        otherMedia = writeFile(QStringLiteral("b.mp4"));

        StreamServer::Config streamConfig;
        streamConfig.portMin = 39100;
        streamConfig.portMax = 39119;
        streamConfig.address = QStringLiteral("127.0.0.1");
        streamConfig.scratchDir = dir.filePath(QStringLiteral("scratch"));
        streams = std::make_shared<StreamServer>(streamConfig);

        DeviceManager::Config config;
        config.discoveryTimeout = 100;
        config.monitor.pollInterval = 60000;
        config.monitor.backoffCeiling = 60000;

        manager = std::make_unique<DeviceManager>(
            config,
            std::make_shared<DiscoveryClient>(DiscoveryClient::Config{}, ssdp),
            std::make_shared<AvTransportClient>(
                AvTransportClient::Options{5000, 0, 0}, soap),
            streams);
    }

    QString writeFile(const QString &name) {
        const auto path = dir.filePath(name);
        QFile file{path};
        if (file.open(QIODevice::WriteOnly)) file.write(QByteArray(1000, 'x'));
        return path;
    }

    QString autoPlayJson(const QString &device, const QString &path) const {
        return QStringLiteral(
                   "[{\"device_name\": \"%1\", \"video_file\": \"%2\", "
                   "\"loop\": true}]")
            .arg(device, path);
    }

    DeviceRecord record(const QString &id) const {
        DeviceRecord r;
        manager->getStatus(id, r);
        return r;
    }
};
}  // namespace

TEST_CASE("Device manager discovery", "[manager]") {
    ManagerFixture fx;
    REQUIRE(fx.dir.isValid());

    fx.manager->runDiscoveryCycle();

    auto devices = fx.manager->listDevices();
    REQUIRE(devices.size() == 2);
    REQUIRE(devices.at(0).friendlyName == QStringLiteral("Kitchen"));
    REQUIRE(devices.at(0).controlUrl ==
            QUrl{QStringLiteral("http://192.168.1.11:1400/avt")});
    REQUIRE(devices.at(1).friendlyName == QStringLiteral("Living Room"));
    REQUIRE(devices.at(1).controlUrl ==
            QUrl{QStringLiteral("http://192.168.1.10:49152/avt")});
    REQUIRE(devices.at(0).status == DeviceStatus::Connected);
    REQUIRE(devices.at(1).status == DeviceStatus::Connected);

    REQUIRE(fx.manager->findDevice(QStringLiteral("Kitchen"))->id == dev2);
    REQUIRE(fx.manager->findDevice(dev1)->friendlyName ==
            QStringLiteral("Living Room"));
    REQUIRE_FALSE(fx.manager->findDevice(QStringLiteral("Garage")));

    SECTION("known devices are not checked again") {
        const auto calls = fx.soap->total();
        fx.manager->runDiscoveryCycle();
        REQUIRE(fx.soap->total() == calls);
    }

    SECTION("unverified device stays discovered") {
        ManagerFixture other;
        other.soap->setMode(FakeSoapTransport::Mode::NetworkFailure);
        other.manager->runDiscoveryCycle();

        REQUIRE(other.record(dev1).status == DeviceStatus::Discovered);
    }
}

TEST_CASE("Device manager commands", "[manager]") {
    ManagerFixture fx;
    REQUIRE(fx.dir.isValid());
    fx.manager->runDiscoveryCycle();
    fx.soap->reset();

    SECTION("play is idempotent") {
        REQUIRE(fx.manager->play(dev1, fx.media, true));
        REQUIRE(fx.manager->play(dev1, fx.media, true));

        REQUIRE(fx.soap->count(QStringLiteral("Play")) == 1);
        REQUIRE(fx.soap->count(QStringLiteral("SetAVTransportURI")) == 1);
        REQUIRE(fx.manager->activeMonitorCount() == 1);
        REQUIRE(fx.streams->sessionCount() == 1);

        auto r = fx.record(dev1);
        REQUIRE(r.status == DeviceStatus::Playing);
        REQUIRE(r.currentVideo == Utils::canonicalPath(fx.media));
        REQUIRE(r.isLooping);
        REQUIRE(r.userControlled);
        REQUIRE(fx.streams->session(r.streamUrl).has_value());
    }

    SECTION("repeated play updates loop flag only") {
        REQUIRE(fx.manager->play(dev1, fx.media, true));
        REQUIRE(fx.manager->play(dev1, fx.media, false));

        REQUIRE(fx.soap->count(QStringLiteral("Play")) == 1);
        REQUIRE_FALSE(fx.record(dev1).isLooping);
    }

    SECTION("switching media releases previous stream") {
        REQUIRE(fx.manager->play(dev1, fx.media, true));
        const auto firstUrl = fx.record(dev1).streamUrl;

        REQUIRE(fx.manager->play(dev1, fx.otherMedia, true));

        REQUIRE(fx.soap->count(QStringLiteral("Play")) == 2);
        REQUIRE(fx.streams->sessionCount() == 1);
        REQUIRE_FALSE(fx.streams->session(firstUrl));
        REQUIRE(fx.manager->activeMonitorCount() == 1);
    }

    SECTION("two devices share one stream") {
        REQUIRE(fx.manager->play(dev1, fx.media, true));
        REQUIRE(fx.manager->play(dev2, fx.media, true));

        REQUIRE(fx.streams->sessionCount() == 1);
        REQUIRE(fx.record(dev1).streamUrl == fx.record(dev2).streamUrl);
        REQUIRE(fx.manager->activeMonitorCount() == 2);

        REQUIRE(fx.manager->stop(dev1));
        REQUIRE(fx.streams->sessionCount() == 1);
        REQUIRE(fx.manager->stop(dev2));
        REQUIRE(fx.streams->sessionCount() == 0);
    }

    SECTION("unknown device") {
        auto result = fx.manager->play(QStringLiteral("uuid:none"), fx.media,
                                       true);
        REQUIRE_FALSE(result);
        REQUIRE(result.error == ErrorType::E_DeviceNotFound);

        DeviceRecord r;
        REQUIRE(fx.manager->getStatus(QStringLiteral("uuid:none"), r).error ==
                ErrorType::E_DeviceNotFound);
    }

    SECTION("missing media") {
        auto result = fx.manager->play(
            dev1, fx.dir.filePath(QStringLiteral("none.mp4")), true);
        REQUIRE(result.error == ErrorType::E_MediaNotFound);
        REQUIRE(fx.soap->total() == 0);
    }

    SECTION("failed play releases stream") {
        fx.soap->setMode(FakeSoapTransport::Mode::Fault);

        auto result = fx.manager->play(dev1, fx.media, true);

        REQUIRE(result.error == ErrorType::E_Protocol);
        REQUIRE(fx.streams->sessionCount() == 0);
        REQUIRE(fx.manager->activeMonitorCount() == 0);
        REQUIRE(fx.record(dev1).status == DeviceStatus::Connected);
    }

    SECTION("pause keeps stream") {
        REQUIRE(fx.manager->play(dev1, fx.media, true));
        REQUIRE(fx.manager->pause(dev1));

        auto r = fx.record(dev1);
        REQUIRE(r.status == DeviceStatus::Paused);
        REQUIRE(fx.streams->sessionCount() == 1);
        REQUIRE(fx.manager->activeMonitorCount() == 0);
        REQUIRE(fx.soap->count(QStringLiteral("Pause")) == 1);
    }

    SECTION("resume after pause keeps one stream reference") {
        REQUIRE(fx.manager->play(dev1, fx.media, true));
        const auto url = fx.record(dev1).streamUrl;
        REQUIRE(fx.manager->pause(dev1));

        REQUIRE(fx.manager->play(dev1, fx.media, true));

        REQUIRE(fx.soap->count(QStringLiteral("Play")) == 2);
        REQUIRE(fx.record(dev1).status == DeviceStatus::Playing);
        REQUIRE(fx.record(dev1).streamUrl == url);
        REQUIRE(fx.streams->session(url)->refCount == 1);
        REQUIRE(fx.manager->activeMonitorCount() == 1);

        REQUIRE(fx.manager->stop(dev1));
        REQUIRE(fx.streams->sessionCount() == 0);
    }

    SECTION("failed pause keeps monitor") {
        REQUIRE(fx.manager->play(dev1, fx.media, true));
        fx.soap->setMode(FakeSoapTransport::Mode::Fault);

        auto result = fx.manager->pause(dev1);

        REQUIRE(result.error == ErrorType::E_Protocol);
        REQUIRE(fx.record(dev1).status == DeviceStatus::Playing);
        REQUIRE(fx.record(dev1).userControlled);
        REQUIRE(fx.manager->activeMonitorCount() == 1);
        REQUIRE(fx.streams->sessionCount() == 1);
    }

    SECTION("stop releases stream") {
        REQUIRE(fx.manager->play(dev1, fx.media, true));
        REQUIRE(fx.manager->stop(dev1));

        auto r = fx.record(dev1);
        REQUIRE(r.status == DeviceStatus::Stopped);
        REQUIRE(r.currentVideo.isEmpty());
        REQUIRE(r.streamUrl.isEmpty());
        REQUIRE(fx.streams->sessionCount() == 0);
        REQUIRE(fx.manager->activeMonitorCount() == 0);
    }

    SECTION("stop applies locally when device fails") {
        REQUIRE(fx.manager->play(dev1, fx.media, true));
        fx.soap->setMode(FakeSoapTransport::Mode::NetworkFailure);

        auto result = fx.manager->stop(dev1);

        REQUIRE(result.error == ErrorType::E_Network);
        REQUIRE(fx.record(dev1).status == DeviceStatus::Stopped);
        REQUIRE(fx.streams->sessionCount() == 0);
    }

    SECTION("seek") {
        REQUIRE(fx.manager->seek(dev1, 90));

        REQUIRE(QString::fromUtf8(fx.soap->body(QStringLiteral("Seek")))
                    .contains(QStringLiteral("<Target>00:01:30</Target>")));
        REQUIRE(fx.record(dev1).status == DeviceStatus::Connected);
    }
}

TEST_CASE("Device manager auto-play", "[manager]") {
    ManagerFixture fx;
    REQUIRE(fx.dir.isValid());

    const auto media = Utils::canonicalPath(fx.media);

    SECTION("mapped device starts playing") {
        fx.manager->loadAutoPlayConfig(AutoPlayConfig::fromJson(
            fx.autoPlayJson(QStringLiteral("Living Room"), fx.media).toUtf8()));

        fx.manager->runDiscoveryCycle();
        fx.manager->waitForDone();

        auto r = fx.record(dev1);
        REQUIRE(r.status == DeviceStatus::Playing);
        REQUIRE(r.currentVideo == media);
        REQUIRE(r.isLooping);
        REQUIRE_FALSE(r.userControlled);
        REQUIRE(fx.soap->count(QStringLiteral("Play")) == 1);
        REQUIRE(fx.record(dev2).status == DeviceStatus::Connected);

        SECTION("device already playing is left alone") {
            const auto calls = fx.soap->total();

            fx.manager->runDiscoveryCycle();
            fx.manager->waitForDone();

            REQUIRE(fx.soap->total() == calls);
        }
    }

    SECTION("user controlled device is skipped until reload") {
        fx.manager->runDiscoveryCycle();
        REQUIRE(fx.manager->stop(dev1));
        REQUIRE(fx.record(dev1).userControlled);

        const auto config = AutoPlayConfig::fromJson(
            fx.autoPlayJson(QStringLiteral("Living Room"), fx.media).toUtf8());
        fx.manager->loadAutoPlayConfig(config);
        REQUIRE_FALSE(fx.record(dev1).userControlled);

        REQUIRE(fx.manager->pause(dev1));
        fx.soap->reset();

        fx.manager->runDiscoveryCycle();
        fx.manager->waitForDone();

        REQUIRE(fx.soap->count(QStringLiteral("Play")) == 0);
        REQUIRE(fx.record(dev1).status == DeviceStatus::Paused);

        fx.manager->loadAutoPlayConfig(config);
        fx.manager->registry().transition(dev1, DeviceStatus::Stopped);
        fx.manager->runDiscoveryCycle();
        fx.manager->waitForDone();

        REQUIRE(fx.soap->count(QStringLiteral("Play")) == 1);
        REQUIRE(fx.record(dev1).status == DeviceStatus::Playing);
    }

    SECTION("failed attempt waits for retry delay") {
        fx.manager->runDiscoveryCycle();
        fx.manager->loadAutoPlayConfig(AutoPlayConfig::fromJson(
            fx.autoPlayJson(QStringLiteral("Living Room"), fx.media).toUtf8()));

        fx.soap->setMode(FakeSoapTransport::Mode::Fault);
        fx.soap->reset();

        fx.manager->runDiscoveryCycle();
        fx.manager->waitForDone();
        REQUIRE(fx.soap->count(QStringLiteral("SetAVTransportURI")) == 1);

        fx.manager->runDiscoveryCycle();
        fx.manager->waitForDone();
        REQUIRE(fx.soap->count(QStringLiteral("SetAVTransportURI")) == 1);
        REQUIRE(fx.streams->sessionCount() == 0);
    }

    SECTION("unmatched entries are ignored") {
        fx.manager->loadAutoPlayConfig(AutoPlayConfig::fromJson(
            fx.autoPlayJson(QStringLiteral("Garage"), fx.media).toUtf8()));

        fx.manager->runDiscoveryCycle();
        fx.manager->waitForDone();

        REQUIRE(fx.soap->count(QStringLiteral("Play")) == 0);
    }

    SECTION("mapping file") {
        const auto path = fx.dir.filePath(QStringLiteral("autoplay.json"));
        {
            QFile file{path};
            REQUIRE(file.open(QIODevice::WriteOnly));
            file.write(fx.autoPlayJson(QStringLiteral("Kitchen"),
                                       QStringLiteral("a.mp4"))
                           .toUtf8());
        }

        REQUIRE(fx.manager->loadAutoPlayConfigFile(path));
        REQUIRE(fx.manager->loadAutoPlayConfigFile(fx.dir.filePath(
                                                       QStringLiteral("x.json")))
                    .error == ErrorType::E_Config);

        fx.manager->runDiscoveryCycle();
        fx.manager->waitForDone();

        REQUIRE(fx.record(dev2).currentVideo == media);
    }
}

TEST_CASE("Device manager expiry", "[manager]") {
    ManagerFixture fx;
    REQUIRE(fx.dir.isValid());
    fx.manager->runDiscoveryCycle();

    REQUIRE(fx.manager->play(dev1, fx.media, true));

    fx.manager->registry().update(dev1, [](DeviceRecord &r) {
        r.lastSeen = QDateTime::currentDateTimeUtc().addSecs(-600);
        return true;
    });
    fx.manager->registry().update(dev2, [](DeviceRecord &r) {
        r.lastSeen = QDateTime::currentDateTimeUtc().addSecs(-600);
        return true;
    });

    fx.ssdp->clear();
    fx.soap->setMode(FakeSoapTransport::Mode::NetworkFailure);

    fx.manager->runDiscoveryCycle();

    REQUIRE(fx.record(dev1).status == DeviceStatus::Unreachable);
    REQUIRE(fx.record(dev2).status == DeviceStatus::Unreachable);
    REQUIRE(fx.record(dev1).streamUrl.isEmpty());
    REQUIRE(fx.streams->sessionCount() == 0);
    REQUIRE(fx.manager->activeMonitorCount() == 0);
}

TEST_CASE("Device manager discovery loop", "[manager]") {
    ManagerFixture fx;
    REQUIRE(fx.dir.isValid());

    fx.manager->startDiscovery(50);
    REQUIRE(fx.manager->discoveryActive());

    QElapsedTimer timer;
    timer.start();
    while (fx.manager->listDevices().size() < 2 && timer.elapsed() < 5000)
        QThread::msleep(10);

    REQUIRE(fx.manager->listDevices().size() == 2);

    fx.manager->stopDiscovery();
    REQUIRE_FALSE(fx.manager->discoveryActive());
}
