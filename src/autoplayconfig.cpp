/* Copyright (C) 2024 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "autoplayconfig.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <algorithm>

#include "errors.h"

AutoPlayConfig::AutoPlayConfig(std::vector<AutoPlayEntry> entries)
    : m_entries{std::move(entries)} {}

static QString resolvePath(const QString &path, const QString &baseDir) {
    if (baseDir.isEmpty() || QDir::isAbsolutePath(path)) return path;
    return QDir::cleanPath(QDir{baseDir}.filePath(path));
}

AutoPlayConfig AutoPlayConfig::fromJson(const QByteArray &data,
                                        const QString &baseDir) {
    QJsonParseError parseError;
    auto doc = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        throw ConfigError{QStringLiteral("invalid auto-play config: %1")
                              .arg(parseError.errorString())};
    }

    QJsonArray devices;
    if (doc.isArray()) {
        devices = doc.array();
    } else if (doc.isObject() && doc.object().value("devices").isArray()) {
        devices = doc.object().value("devices").toArray();
    } else {
        throw ConfigError{
            QStringLiteral("auto-play config must be a list of devices")};
    }

    std::vector<AutoPlayEntry> entries;
    entries.reserve(static_cast<size_t>(devices.size()));

    for (int i = 0; i < devices.size(); ++i) {
        auto obj = devices.at(i).toObject();

        auto name = obj.value("device_name").toString();
        auto video = obj.value("video_file").toString();
        if (video.isEmpty()) video = obj.value("video_path").toString();

        if (name.isEmpty() || video.isEmpty()) {
            qWarning() << "auto-play entry without device name or video:" << i;
            continue;
        }

        AutoPlayEntry entry;
        entry.deviceName = name;
        entry.videoPath = resolvePath(video, baseDir);
        entry.loop = obj.value("loop").toBool(true);

        auto it = std::find_if(entries.begin(), entries.end(),
                               [&](const auto &e) { return e.deviceName == name; });
        if (it != entries.end()) {
            qWarning() << "duplicate auto-play entry, last one wins:" << name;
            *it = std::move(entry);
        } else {
            entries.push_back(std::move(entry));
        }
    }

    return AutoPlayConfig{std::move(entries)};
}

AutoPlayConfig AutoPlayConfig::load(const QString &path) {
    QFile file{path};
    if (!file.open(QIODevice::ReadOnly)) {
        throw ConfigError{
            QStringLiteral("cannot open auto-play config: %1").arg(path)};
    }

    auto config = fromJson(file.readAll(), QFileInfo{path}.absolutePath());

    qDebug() << "auto-play config loaded:" << path << config.entries().size();

    return config;
}
