/* Copyright (C) 2024 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "deviceregistry.h"

#include <QMutexLocker>
#include <QReadLocker>
#include <QWriteLocker>
#include <algorithm>

QString deviceStatusName(DeviceStatus status) {
    switch (status) {
        case DeviceStatus::Discovered:
            return QStringLiteral("discovered");
        case DeviceStatus::Connected:
            return QStringLiteral("connected");
        case DeviceStatus::Playing:
            return QStringLiteral("playing");
        case DeviceStatus::Paused:
            return QStringLiteral("paused");
        case DeviceStatus::Stopped:
            return QStringLiteral("stopped");
        case DeviceStatus::Unreachable:
            return QStringLiteral("unreachable");
    }
    return QStringLiteral("unknown");
}

QDebug operator<<(QDebug debug, DeviceStatus status) {
    QDebugStateSaver saver{debug};
    debug.noquote() << deviceStatusName(status);
    return debug;
}

QDebug operator<<(QDebug debug, const DeviceRecord &record) {
    QDebugStateSaver saver{debug};
    debug.nospace() << "id=" << record.id << ", name=" << record.friendlyName
                    << ", status=" << record.status
                    << ", video=" << record.currentVideo
                    << ", looping=" << record.isLooping
                    << ", failures=" << record.consecutiveFailures;
    return debug;
}

std::shared_ptr<DeviceRegistry::Entry> DeviceRegistry::entry(
    const QString &id) const {
    QReadLocker locker{&m_mapLock};
    return m_entries.value(id);
}

std::vector<std::shared_ptr<DeviceRegistry::Entry>> DeviceRegistry::entries()
    const {
    QReadLocker locker{&m_mapLock};
    std::vector<std::shared_ptr<Entry>> list;
    list.reserve(m_entries.size());
    for (const auto &e : m_entries) list.push_back(e);
    return list;
}

std::shared_ptr<DeviceRegistry::Entry> DeviceRegistry::findOrInsert(
    const DeviceDescriptor &desc, bool *created) {
    QWriteLocker locker{&m_mapLock};

    const auto location = desc.locationUrl.toString();

    QString id;
    if (!desc.udn.isEmpty()) id = m_udnIndex.value(desc.udn);
    if (id.isEmpty()) id = m_locationIndex.value(location);

    if (!id.isEmpty()) {
        auto e = m_entries.value(id);

        if (!desc.udn.isEmpty()) m_udnIndex.insert(desc.udn, id);

        QString oldLocation;
        {
            QMutexLocker entryLocker{&e->mutex};
            oldLocation = e->record.locationUrl.toString();
        }

        if (oldLocation != location) {
            qDebug() << "device location changed:" << id << oldLocation
                     << "=>" << location;
            if (m_locationIndex.value(oldLocation) == id)
                m_locationIndex.remove(oldLocation);
            m_locationIndex.insert(location, id);
        }

        *created = false;
        return e;
    }

    id = desc.udn.isEmpty() ? location : desc.udn;

    auto e = std::make_shared<Entry>();
    e->record.id = id;
    e->record.status = DeviceStatus::Discovered;

    m_entries.insert(id, e);
    if (!desc.udn.isEmpty()) m_udnIndex.insert(desc.udn, id);
    m_locationIndex.insert(location, id);

    *created = true;
    return e;
}

DeviceRecord DeviceRegistry::upsert(const DeviceDescriptor &desc,
                                    const QDateTime &seenAt) {
    bool created = false;
    auto e = findOrInsert(desc, &created);

    QMutexLocker locker{&e->mutex};
    auto &record = e->record;

    // runtime fields are owned by commands and monitors
    if (!desc.udn.isEmpty()) record.udn = desc.udn;
    record.friendlyName = desc.friendlyName;
    record.manufacturer = desc.manufacturer;
    record.modelName = desc.modelName;
    record.locationUrl = desc.locationUrl;
    record.controlUrl = desc.controlUrl;
    record.serviceType = desc.serviceType;
    record.ip = desc.host;
    record.port = desc.port;
    if (!record.lastSeen.isValid() || record.lastSeen < seenAt)
        record.lastSeen = seenAt;

    if (created) qDebug() << "new device:" << record;

    return record;
}

std::optional<DeviceRecord> DeviceRegistry::get(const QString &id) const {
    auto e = entry(id);
    if (!e) return std::nullopt;

    QMutexLocker locker{&e->mutex};
    return e->record;
}

// Reachable devices first, then the most recently seen one.
static bool preferredMatch(const DeviceRecord &candidate,
                           const DeviceRecord &current) {
    const bool candidateUp = candidate.status != DeviceStatus::Unreachable;
    const bool currentUp = current.status != DeviceStatus::Unreachable;
    if (candidateUp != currentUp) return candidateUp;
    if (candidate.lastSeen != current.lastSeen)
        return candidate.lastSeen > current.lastSeen;
    return candidate.id < current.id;
}

std::optional<DeviceRecord> DeviceRegistry::findByName(
    const QString &friendlyName) const {
    std::optional<DeviceRecord> match;

    for (const auto &e : entries()) {
        QMutexLocker locker{&e->mutex};
        if (e->record.friendlyName != friendlyName) continue;
        if (!match || preferredMatch(e->record, *match)) match = e->record;
    }

    return match;
}

std::vector<DeviceRecord> DeviceRegistry::list() const {
    std::vector<DeviceRecord> records;

    for (const auto &e : entries()) {
        QMutexLocker locker{&e->mutex};
        records.push_back(e->record);
    }

    std::sort(records.begin(), records.end(), [](const auto &a, const auto &b) {
        if (a.friendlyName != b.friendlyName)
            return a.friendlyName < b.friendlyName;
        return a.id < b.id;
    });

    return records;
}

bool DeviceRegistry::markUnreachable(const QString &id) {
    return transition(id, DeviceStatus::Unreachable);
}

bool DeviceRegistry::transition(const QString &id, DeviceStatus status,
                                const Guard &guard) {
    auto e = entry(id);
    if (!e) return false;

    QMutexLocker locker{&e->mutex};

    if (guard && !guard(e->record)) {
        qDebug() << "transition rejected by guard:" << id
                 << e->record.status << "=>" << status;
        return false;
    }

    if (e->record.status != status) {
        qDebug() << "device status changed:" << id << e->record.status << "=>"
                 << status;
        e->record.status = status;
    }

    return true;
}

bool DeviceRegistry::update(const QString &id, const Mutator &mutator) {
    auto e = entry(id);
    if (!e) return false;

    QMutexLocker locker{&e->mutex};

    auto record = e->record;
    if (!mutator(record)) return false;

    if (record.status != e->record.status)
        qDebug() << "device status changed:" << id << e->record.status << "=>"
                 << record.status;

    record.id = e->record.id;
    e->record = std::move(record);

    return true;
}

std::vector<QString> DeviceRegistry::sweepExpired(const QDateTime &now, int ttl,
                                                  const ReachabilityCheck &isReachable) {
    std::vector<DeviceRecord> expired;

    for (const auto &e : entries()) {
        QMutexLocker locker{&e->mutex};
        const auto &record = e->record;
        if (record.status != DeviceStatus::Unreachable &&
            record.lastSeen.isValid() && record.lastSeen.secsTo(now) > ttl)
            expired.push_back(record);
    }

    std::vector<QString> marked;

    for (const auto &record : expired) {
        // no locks held while the device is queried
        if (isReachable && isReachable(record)) {
            qDebug() << "device silent but responding:" << record.id;
            continue;
        }

        auto ok = update(record.id, [&record](DeviceRecord &current) {
            // refreshed by discovery in the meantime
            if (current.lastSeen != record.lastSeen ||
                current.status == DeviceStatus::Unreachable)
                return false;
            current.status = DeviceStatus::Unreachable;
            return true;
        });

        if (ok) {
            qWarning() << "device expired:" << record.id
                       << record.friendlyName;
            marked.push_back(record.id);
        }
    }

    return marked;
}

int DeviceRegistry::size() const {
    QReadLocker locker{&m_mapLock};
    return m_entries.size();
}
