/* Copyright (C) 2017-2024 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef UTILS_H
#define UTILS_H

#include <QHash>
#include <QNetworkInterface>
#include <QString>
#include <QStringList>
#include <optional>

class Utils {
   public:
    static const QString videoItemClass;
    static const QString audioItemClass;
    static const QString imageItemClass;
    static const QString defaultItemClass;
    static const QStringList subtitleExts;

    Utils() = delete;

    static bool ethNetworkInf(const QNetworkInterface &interface);
    static bool wlanNetworkInf(const QNetworkInterface &interface);
    static bool localNetworkInf(const QNetworkInterface &interface);
    // First IPv4 address of an up and running non-loopback interface.
    static QString localIpAddress();
    // Local IPv4 address routed to remoteHost, empty when unknown.
    static QString localAddressFor(const QString &remoteHost);

    static QString normalizeFileName(const QString &name);
    static QString canonicalPath(const QString &path);
    // Subtitle file next to the media with the same base name.
    static std::optional<QString> subtitleForMedia(const QString &mediaPath);

    static QString mimeFromPath(const QString &path);
    static QString itemClassFromMime(const QString &mime);
    static QString dlnaContentFeatures(const QString &mime);

    static QString secToStr(int value);
    static std::optional<int> strToSec(const QString &value);

   private:
    static const QHash<QString, QString> m_videoExtMap;
    static const QHash<QString, QString> m_musicExtMap;
    static const QHash<QString, QString> m_imgExtMap;
    static const QHash<QString, QString> m_subExtMap;
    static const QString dlnaOrgOpFlagsSeekBytes;
    static const QString dlnaOrgCiFlags;
    static QString dlnaOrgFlagsForFile();
    static QString dlnaOrgPnFlags(const QString &mime);
};

#endif  // UTILS_H
