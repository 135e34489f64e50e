/* Copyright (C) 2024 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef DEVICEREGISTRY_H
#define DEVICEREGISTRY_H

#include <QDateTime>
#include <QDebug>
#include <QHash>
#include <QMutex>
#include <QReadWriteLock>
#include <QString>
#include <QUrl>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "discoveryclient.h"

enum class DeviceStatus {
    Discovered,
    Connected,
    Playing,
    Paused,
    Stopped,
    Unreachable
};

QString deviceStatusName(DeviceStatus status);
QDebug operator<<(QDebug debug, DeviceStatus status);

struct DeviceRecord {
    // identity
    QString id;
    QString udn;
    QString friendlyName;
    QString manufacturer;
    QString modelName;

    // network
    QUrl locationUrl;
    QUrl controlUrl;
    QString serviceType;
    QString ip;
    int port = 0;

    // runtime
    DeviceStatus status = DeviceStatus::Discovered;
    QString currentVideo;
    QUrl streamUrl;
    bool isLooping = false;
    int consecutiveFailures = 0;
    int restartCount = 0;
    bool userControlled = false;
    QDateTime lastSeen;
    QDateTime lastCommandAt;

    inline bool playing(const QString &video) const {
        return status == DeviceStatus::Playing && currentVideo == video;
    }

    friend QDebug operator<<(QDebug debug, const DeviceRecord &record);
};

/*
 * Thread-safe store of known renderers.
 *
 * Each record has its own lock. The map lock is only held to look up or insert
 * entries, so work on one device never waits for another one.
 */
class DeviceRegistry {
   public:
    using Guard = std::function<bool(const DeviceRecord &)>;
    // Mutates a copy of the record. Returning false discards the change.
    using Mutator = std::function<bool(DeviceRecord &)>;
    using ReachabilityCheck = std::function<bool(const DeviceRecord &)>;

    DeviceRecord upsert(const DeviceDescriptor &desc, const QDateTime &seenAt);
    std::optional<DeviceRecord> get(const QString &id) const;
    std::optional<DeviceRecord> findByName(const QString &friendlyName) const;
    std::vector<DeviceRecord> list() const;
    bool markUnreachable(const QString &id);
    bool transition(const QString &id, DeviceStatus status,
                    const Guard &guard = {});
    bool update(const QString &id, const Mutator &mutator);
    std::vector<QString> sweepExpired(const QDateTime &now, int ttl,
                                      const ReachabilityCheck &isReachable);
    int size() const;

   private:
    struct Entry {
        mutable QMutex mutex;
        DeviceRecord record;
    };

    mutable QReadWriteLock m_mapLock;
    QHash<QString, std::shared_ptr<Entry>> m_entries;
    QHash<QString, QString> m_udnIndex;
    QHash<QString, QString> m_locationIndex;

    std::shared_ptr<Entry> entry(const QString &id) const;
    std::vector<std::shared_ptr<Entry>> entries() const;
    std::shared_ptr<Entry> findOrInsert(const DeviceDescriptor &desc,
                                        bool *created);
};

#endif  // DEVICEREGISTRY_H
