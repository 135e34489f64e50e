/* Copyright (C) 2024 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "playbackmonitor.h"

#include <QDateTime>
#include <QElapsedTimer>
#include <QString>
#include <QThread>
#include <QUrl>
#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <vector>

#include "fakes.h"

namespace {
struct MonitorFixture {
    const QString deviceId = QStringLiteral("uuid:dev-1");
    const QString mediaPath = QStringLiteral("/media/a.mp4");
    const QUrl streamUrl{QStringLiteral("http://10.0.0.1:9000/a.mp4")};

    std::shared_ptr<FakeSoapTransport> transport =
        std::make_shared<FakeSoapTransport>();
    AvTransportClient control{{5000, 0, 0}, transport};
    DeviceRegistry registry;
    std::vector<QUrl> released;

    explicit MonitorFixture(bool loop) {
        DeviceDescriptor desc;
        desc.udn = deviceId;
        desc.friendlyName = QStringLiteral("TV");
        desc.locationUrl = QUrl{QStringLiteral("http://10.0.0.5/d.xml")};
        desc.controlUrl = QUrl{QStringLiteral("http://10.0.0.5/avt")};
        desc.serviceType = AvTransportClient::defaultServiceType;
        registry.upsert(desc, QDateTime::currentDateTimeUtc());

        registry.update(deviceId, [&](DeviceRecord &r) {
            r.status = DeviceStatus::Playing;
            r.currentVideo = mediaPath;
            r.streamUrl = streamUrl;
            r.isLooping = loop;
            return true;
        });
    }

    std::unique_ptr<PlaybackMonitor> makeMonitor(
        PlaybackMonitor::Config config = {}) {
        AvTransportClient::MediaInfo media;
        media.url = streamUrl;
        media.title = QStringLiteral("a");
        media.mime = QStringLiteral("video/mp4");

        return std::make_unique<PlaybackMonitor>(
            deviceId, mediaPath, media, config, registry, control,
            [this](const QUrl &url) { released.push_back(url); });
    }

    DeviceRecord record() const { return *registry.get(deviceId); }
};
}  // namespace

TEST_CASE("Playback monitor backoff", "[monitor]") {
    REQUIRE(PlaybackMonitor::backoffDelay(4000, 0, 30000) == 4000);
    REQUIRE(PlaybackMonitor::backoffDelay(4000, 1, 30000) == 8000);
    REQUIRE(PlaybackMonitor::backoffDelay(4000, 2, 30000) == 16000);
    REQUIRE(PlaybackMonitor::backoffDelay(4000, 3, 30000) == 30000);
    REQUIRE(PlaybackMonitor::backoffDelay(4000, 40, 30000) == 30000);
}

TEST_CASE("Playback monitor loops stopped media", "[monitor]") {
    MonitorFixture fx{true};
    auto monitor = fx.makeMonitor();

    fx.transport->queueStates({QStringLiteral("PLAYING"),
                               QStringLiteral("STOPPED"),
                               QStringLiteral("PLAYING"),
                               QStringLiteral("NO_MEDIA_PRESENT")});

    REQUIRE(monitor->poll() == PlaybackMonitor::Outcome::Continue);
    REQUIRE(fx.transport->count(QStringLiteral("Play")) == 0);

    REQUIRE(monitor->poll() == PlaybackMonitor::Outcome::Continue);
    REQUIRE(fx.transport->count(QStringLiteral("SetAVTransportURI")) == 1);
    REQUIRE(fx.transport->count(QStringLiteral("Play")) == 1);

    REQUIRE(monitor->poll() == PlaybackMonitor::Outcome::Continue);
    REQUIRE(fx.transport->count(QStringLiteral("Play")) == 1);

    REQUIRE(monitor->poll() == PlaybackMonitor::Outcome::Continue);
    REQUIRE(fx.transport->count(QStringLiteral("SetAVTransportURI")) == 2);
    REQUIRE(fx.transport->count(QStringLiteral("Play")) == 2);

    auto record = fx.record();
    REQUIRE(record.restartCount == 2);
    REQUIRE(record.status == DeviceStatus::Playing);
    REQUIRE(fx.released.empty());
}

TEST_CASE("Playback monitor ends without loop", "[monitor]") {
    MonitorFixture fx{false};
    auto monitor = fx.makeMonitor();

    fx.transport->queueStates({QStringLiteral("STOPPED")});

    REQUIRE(monitor->poll() == PlaybackMonitor::Outcome::Ended);
    REQUIRE(fx.transport->count(QStringLiteral("Play")) == 0);

    auto record = fx.record();
    REQUIRE(record.status == DeviceStatus::Stopped);
    REQUIRE(record.streamUrl.isEmpty());
    REQUIRE(fx.released.size() == 1);
    REQUIRE(fx.released.front() == fx.streamUrl);
}

TEST_CASE("Playback monitor stops on pause", "[monitor]") {
    MonitorFixture fx{true};
    auto monitor = fx.makeMonitor();

    fx.transport->queueStates({QStringLiteral("PAUSED_PLAYBACK")});

    REQUIRE(monitor->poll() == PlaybackMonitor::Outcome::Ended);

    auto record = fx.record();
    REQUIRE(record.status == DeviceStatus::Paused);
    REQUIRE(record.streamUrl == fx.streamUrl);
    REQUIRE(fx.released.empty());
}

TEST_CASE("Playback monitor failure escalation", "[monitor]") {
    MonitorFixture fx{true};
    PlaybackMonitor::Config config;
    config.failureThreshold = 3;
    auto monitor = fx.makeMonitor(config);

    fx.transport->setMode(FakeSoapTransport::Mode::NetworkFailure);

    REQUIRE(monitor->poll() == PlaybackMonitor::Outcome::Continue);
    REQUIRE(fx.record().consecutiveFailures == 1);
    REQUIRE(monitor->nextDelay() == 8000);

    REQUIRE(monitor->poll() == PlaybackMonitor::Outcome::Continue);
    REQUIRE(fx.record().consecutiveFailures == 2);

    REQUIRE(monitor->poll() == PlaybackMonitor::Outcome::Ended);

    auto record = fx.record();
    REQUIRE(record.status == DeviceStatus::Unreachable);
    REQUIRE(record.consecutiveFailures == 3);
    REQUIRE(fx.released.size() == 1);

    // no polling once the device is gone
    const auto calls = fx.transport->total();
    REQUIRE(monitor->poll() == PlaybackMonitor::Outcome::Ended);
    REQUIRE(fx.transport->total() == calls);
}

TEST_CASE("Playback monitor failures reset on success", "[monitor]") {
    MonitorFixture fx{true};
    auto monitor = fx.makeMonitor();

    fx.transport->queueStates({QStringLiteral("BOGUS"),
                               QStringLiteral("BOGUS"),
                               QStringLiteral("TRANSITIONING")});

    REQUIRE(monitor->poll() == PlaybackMonitor::Outcome::Continue);
    REQUIRE(monitor->poll() == PlaybackMonitor::Outcome::Continue);
    REQUIRE(monitor->failures() == 2);

    REQUIRE(monitor->poll() == PlaybackMonitor::Outcome::Continue);
    REQUIRE(monitor->failures() == 0);
    REQUIRE(fx.record().consecutiveFailures == 0);
}

TEST_CASE("Playback monitor leaves other media alone", "[monitor]") {
    MonitorFixture fx{true};
    auto monitor = fx.makeMonitor();

    fx.registry.update(fx.deviceId, [](DeviceRecord &r) {
        r.currentVideo = QStringLiteral("/media/b.mp4");
        return true;
    });

    REQUIRE(monitor->poll() == PlaybackMonitor::Outcome::Ended);
    REQUIRE(fx.transport->total() == 0);
}

TEST_CASE("Playback monitor cancellation", "[monitor]") {
    MonitorFixture fx{true};
    PlaybackMonitor::Config config;
    config.pollInterval = 10;
    auto monitor = fx.makeMonitor(config);

    monitor->start();

    QElapsedTimer timer;
    timer.start();
    while (fx.transport->count(QStringLiteral("GetTransportInfo")) < 2 &&
           timer.elapsed() < 5000)
        QThread::msleep(5);

    REQUIRE(fx.transport->count(QStringLiteral("GetTransportInfo")) >= 2);

    monitor->cancel();
    REQUIRE(monitor->wait(5000));
    REQUIRE(monitor->cancelled());

    const auto calls = fx.transport->total();
    REQUIRE(monitor->poll() == PlaybackMonitor::Outcome::Ended);
    REQUIRE(fx.transport->total() == calls);
}

TEST_CASE("Playback monitor cancellation during retries", "[monitor]") {
    MonitorFixture fx{true};
    fx.transport->setMode(FakeSoapTransport::Mode::NetworkFailure);
    AvTransportClient retryingControl{{5000, 5, 2000}, fx.transport};

    PlaybackMonitor::Config config;
    config.pollInterval = 10;

    AvTransportClient::MediaInfo media;
    media.url = fx.streamUrl;

    PlaybackMonitor monitor{fx.deviceId,  fx.mediaPath,    media, config,
                            fx.registry, retryingControl, {}};
    monitor.start();

    QElapsedTimer timer;
    timer.start();
    while (fx.transport->count(QStringLiteral("GetTransportInfo")) < 1 &&
           timer.elapsed() < 5000)
        QThread::msleep(5);
    REQUIRE(fx.transport->count(QStringLiteral("GetTransportInfo")) == 1);

    // first retry waits 2s
    QThread::msleep(100);

    timer.restart();
    monitor.cancel();
    REQUIRE(monitor.wait(3000));
    REQUIRE(timer.elapsed() < 1000);

    REQUIRE(fx.transport->count(QStringLiteral("GetTransportInfo")) == 1);
    REQUIRE(fx.record().status == DeviceStatus::Playing);
    REQUIRE(fx.record().consecutiveFailures == 0);
}
