/* Copyright (C) 2024 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "deviceregistry.h"

#include <QDateTime>
#include <QString>
#include <QUrl>
#include <catch2/catch_test_macros.hpp>

static DeviceDescriptor makeDescriptor(const QString &udn, const QString &name,
                                       const QString &location) {
    DeviceDescriptor desc;
    desc.udn = udn;
    desc.friendlyName = name;
    desc.manufacturer = QStringLiteral("Acme");
    desc.modelName = QStringLiteral("Screen 3000");
    desc.locationUrl = QUrl{location};
    desc.controlUrl = QUrl{location}.resolved(QUrl{QStringLiteral("/avt")});
    desc.serviceType =
        QStringLiteral("urn:schemas-upnp-org:service:AVTransport:1");
    desc.host = desc.locationUrl.host();
    desc.port = desc.locationUrl.port(80);
    return desc;
}

TEST_CASE("Device registry upsert", "[registry]") {
    DeviceRegistry registry;
    const auto t0 = QDateTime::currentDateTimeUtc();
    const auto desc =
        makeDescriptor(QStringLiteral("uuid:dev-1"), QStringLiteral("TV"),
                       QStringLiteral("http://10.0.0.5:8080/desc.xml"));

    SECTION("new device is discovered") {
        auto record = registry.upsert(desc, t0);

        REQUIRE(record.id == QStringLiteral("uuid:dev-1"));
        REQUIRE(record.status == DeviceStatus::Discovered);
        REQUIRE(record.ip == QStringLiteral("10.0.0.5"));
        REQUIRE(record.port == 8080);
        REQUIRE(registry.size() == 1);
    }

    SECTION("replies for one udn give one record with latest time") {
        registry.upsert(desc, t0.addSecs(5));
        registry.upsert(desc, t0);
        registry.upsert(desc, t0.addSecs(3));

        REQUIRE(registry.size() == 1);
        REQUIRE(registry.get(QStringLiteral("uuid:dev-1"))->lastSeen ==
                t0.addSecs(5));
    }

    SECTION("upsert keeps runtime state") {
        registry.upsert(desc, t0);
        registry.update(QStringLiteral("uuid:dev-1"), [](DeviceRecord &r) {
            r.status = DeviceStatus::Playing;
            r.currentVideo = QStringLiteral("/media/a.mp4");
            return true;
        });

        auto renamed = desc;
        renamed.friendlyName = QStringLiteral("Big TV");
        registry.upsert(renamed, t0.addSecs(1));

        auto record = registry.get(QStringLiteral("uuid:dev-1"));
        REQUIRE(record->friendlyName == QStringLiteral("Big TV"));
        REQUIRE(record->status == DeviceStatus::Playing);
        REQUIRE(record->currentVideo == QStringLiteral("/media/a.mp4"));
    }

    SECTION("device without udn is keyed by location") {
        auto noUdn = makeDescriptor({}, QStringLiteral("Radio"),
                                    QStringLiteral("http://10.0.0.6/d.xml"));
        auto record = registry.upsert(noUdn, t0);
        registry.upsert(noUdn, t0.addSecs(1));

        REQUIRE(record.id == QStringLiteral("http://10.0.0.6/d.xml"));
        REQUIRE(registry.size() == 1);
    }

    SECTION("new udn at known location merges into existing record") {
        registry.upsert(desc, t0);
        registry.update(QStringLiteral("uuid:dev-1"), [](DeviceRecord &r) {
            r.status = DeviceStatus::Connected;
            return true;
        });

        auto replaced = desc;
        replaced.udn = QStringLiteral("uuid:dev-2");
        registry.upsert(replaced, t0.addSecs(1));

        REQUIRE(registry.size() == 1);
        auto record = registry.get(QStringLiteral("uuid:dev-1"));
        REQUIRE(record->udn == QStringLiteral("uuid:dev-2"));
        REQUIRE(record->status == DeviceStatus::Connected);
        REQUIRE_FALSE(registry.get(QStringLiteral("uuid:dev-2")));

        registry.upsert(replaced, t0.addSecs(2));
        REQUIRE(registry.size() == 1);
    }

    SECTION("location change keeps identity") {
        registry.upsert(desc, t0);
        auto moved = desc;
        moved.locationUrl = QUrl{QStringLiteral("http://10.0.0.7:8080/desc.xml")};
        moved.host = QStringLiteral("10.0.0.7");
        registry.upsert(moved, t0.addSecs(1));

        REQUIRE(registry.size() == 1);
        REQUIRE(registry.get(QStringLiteral("uuid:dev-1"))->ip ==
                QStringLiteral("10.0.0.7"));
    }
}

TEST_CASE("Device registry lookups", "[registry]") {
    DeviceRegistry registry;
    const auto now = QDateTime::currentDateTimeUtc();

    registry.upsert(makeDescriptor(QStringLiteral("uuid:b"),
                                   QStringLiteral("Kitchen"),
                                   QStringLiteral("http://10.0.0.2/d.xml")),
                    now);
    registry.upsert(makeDescriptor(QStringLiteral("uuid:a"),
                                   QStringLiteral("Bedroom"),
                                   QStringLiteral("http://10.0.0.3/d.xml")),
                    now);

    REQUIRE(registry.findByName(QStringLiteral("Kitchen"))->id ==
            QStringLiteral("uuid:b"));
    REQUIRE_FALSE(registry.findByName(QStringLiteral("Garage")));
    REQUIRE_FALSE(registry.get(QStringLiteral("uuid:none")));

    auto list = registry.list();
    REQUIRE(list.size() == 2);
    REQUIRE(list.at(0).friendlyName == QStringLiteral("Bedroom"));
    REQUIRE(list.at(1).friendlyName == QStringLiteral("Kitchen"));

    SECTION("same name prefers reachable and most recently seen") {
        registry.upsert(makeDescriptor(QStringLiteral("uuid:c"),
                                       QStringLiteral("Kitchen"),
                                       QStringLiteral("http://10.0.0.4/d.xml")),
                        now.addSecs(10));
        registry.upsert(makeDescriptor(QStringLiteral("uuid:d"),
                                       QStringLiteral("Kitchen"),
                                       QStringLiteral("http://10.0.0.9/d.xml")),
                        now.addSecs(5));

        REQUIRE(registry.findByName(QStringLiteral("Kitchen"))->id ==
                QStringLiteral("uuid:c"));

        REQUIRE(registry.markUnreachable(QStringLiteral("uuid:c")));
        REQUIRE(registry.findByName(QStringLiteral("Kitchen"))->id ==
                QStringLiteral("uuid:d"));

        REQUIRE(registry.markUnreachable(QStringLiteral("uuid:d")));
        REQUIRE(registry.markUnreachable(QStringLiteral("uuid:b")));
        REQUIRE(registry.findByName(QStringLiteral("Kitchen"))->id ==
                QStringLiteral("uuid:c"));
    }
}

TEST_CASE("Device registry guarded writes", "[registry]") {
    DeviceRegistry registry;
    const auto id = QStringLiteral("uuid:dev-1");
    registry.upsert(makeDescriptor(id, QStringLiteral("TV"),
                                   QStringLiteral("http://10.0.0.5/d.xml")),
                    QDateTime::currentDateTimeUtc());

    SECTION("transition respects guard") {
        auto onlyDiscovered = [](const DeviceRecord &r) {
            return r.status == DeviceStatus::Discovered;
        };

        REQUIRE(registry.transition(id, DeviceStatus::Connected, onlyDiscovered));
        REQUIRE_FALSE(
            registry.transition(id, DeviceStatus::Connected, onlyDiscovered));
        REQUIRE(registry.get(id)->status == DeviceStatus::Connected);
    }

    SECTION("rejected mutation leaves record untouched") {
        REQUIRE_FALSE(registry.update(id, [](DeviceRecord &r) {
            r.status = DeviceStatus::Playing;
            return false;
        }));

        REQUIRE(registry.get(id)->status == DeviceStatus::Discovered);
    }

    SECTION("unknown device") {
        REQUIRE_FALSE(registry.transition(QStringLiteral("uuid:x"),
                                          DeviceStatus::Stopped));
        REQUIRE_FALSE(registry.markUnreachable(QStringLiteral("uuid:x")));
    }
}

TEST_CASE("Device registry TTL sweep", "[registry]") {
    DeviceRegistry registry;
    const auto id = QStringLiteral("uuid:dev-1");
    const auto t0 = QDateTime::currentDateTimeUtc();
    registry.upsert(makeDescriptor(id, QStringLiteral("TV"),
                                   QStringLiteral("http://10.0.0.5/d.xml")),
                    t0);

    SECTION("fresh device is kept") {
        int checks = 0;
        auto marked = registry.sweepExpired(t0.addSecs(10), 30,
                                            [&](const DeviceRecord &) {
                                                ++checks;
                                                return false;
                                            });
        REQUIRE(marked.empty());
        REQUIRE(checks == 0);
    }

    SECTION("silent device answering reachability check is kept") {
        auto marked = registry.sweepExpired(
            t0.addSecs(60), 30, [](const DeviceRecord &) { return true; });

        REQUIRE(marked.empty());
        REQUIRE(registry.get(id)->status == DeviceStatus::Discovered);
    }

    SECTION("silent device failing reachability check becomes unreachable") {
        auto marked = registry.sweepExpired(
            t0.addSecs(60), 30, [](const DeviceRecord &) { return false; });

        REQUIRE(marked.size() == 1);
        REQUIRE(marked.front() == id);
        REQUIRE(registry.get(id)->status == DeviceStatus::Unreachable);
    }

    SECTION("device refreshed during reachability check is kept") {
        auto marked = registry.sweepExpired(
            t0.addSecs(60), 30, [&](const DeviceRecord &) {
                registry.upsert(
                    makeDescriptor(id, QStringLiteral("TV"),
                                   QStringLiteral("http://10.0.0.5/d.xml")),
                    t0.addSecs(59));
                return false;
            });

        REQUIRE(marked.empty());
        REQUIRE(registry.get(id)->status == DeviceStatus::Discovered);
    }
}
