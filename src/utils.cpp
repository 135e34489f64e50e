/* Copyright (C) 2017-2024 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "utils.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QHostAddress>
#include <QRegExp>
#include <QUdpSocket>

const QString Utils::videoItemClass = QStringLiteral("object.item.videoItem");
const QString Utils::audioItemClass = QStringLiteral("object.item.audioItem");
const QString Utils::imageItemClass = QStringLiteral("object.item.imageItem");
const QString Utils::defaultItemClass = QStringLiteral("object.item");

const QStringList Utils::subtitleExts{"srt", "vtt", "sub", "ass", "ssa"};

const QHash<QString, QString> Utils::m_videoExtMap{
    {"mkv", "video/x-matroska"}, {"webm", "video/webm"},
    {"flv", "video/x-flv"},      {"ogv", "video/ogg"},
    {"avi", "video/x-msvideo"},  {"mov", "video/quicktime"},
    {"qt", "video/quicktime"},   {"wmv", "video/x-ms-wmv"},
    {"mp4", "video/mp4"},        {"m4v", "video/mp4"},
    {"mpg", "video/mpeg"},       {"mpeg", "video/mpeg"},
    {"m2v", "video/mpeg"},       {"ts", "video/MP2T"},
    {"tsv", "video/MP2T"}};

const QHash<QString, QString> Utils::m_musicExtMap{
    {"mp3", "audio/mpeg"}, {"m4a", "audio/mp4"},  {"aac", "audio/aac"},
    {"flac", "audio/flac"}, {"wav", "audio/vnd.wav"}, {"ogg", "audio/ogg"},
    {"oga", "audio/ogg"},  {"wma", "audio/x-ms-wma"}};

const QHash<QString, QString> Utils::m_imgExtMap{{"jpg", "image/jpeg"},
                                                 {"jpeg", "image/jpeg"},
                                                 {"png", "image/png"},
                                                 {"gif", "image/gif"}};

const QHash<QString, QString> Utils::m_subExtMap{{"srt", "text/srt"},
                                                 {"vtt", "text/vtt"},
                                                 {"sub", "text/sub"},
                                                 {"ass", "text/x-ssa"},
                                                 {"ssa", "text/x-ssa"}};

/* DLNA.ORG_OP flags:
 * 00 - no seeking allowed
 * 01 - seek by byte
 * 10 - seek by time
 * 11 - seek by both*/
const QString Utils::dlnaOrgOpFlagsSeekBytes = QStringLiteral("DLNA.ORG_OP=01");
const QString Utils::dlnaOrgCiFlags = QStringLiteral("DLNA.ORG_CI=0");

bool Utils::ethNetworkInf(const QNetworkInterface &interface) {
    return interface.type() == QNetworkInterface::Ethernet;
}

bool Utils::wlanNetworkInf(const QNetworkInterface &interface) {
    return interface.type() == QNetworkInterface::Wifi;
}

bool Utils::localNetworkInf(const QNetworkInterface &interface) {
    return interface.type() == QNetworkInterface::Loopback ||
           interface.flags().testFlag(QNetworkInterface::IsLoopBack);
}

static QString ipv4Address(const QNetworkInterface &interface) {
    for (const auto &entry : interface.addressEntries()) {
        if (entry.ip().protocol() == QAbstractSocket::IPv4Protocol)
            return entry.ip().toString();
    }
    return {};
}

QString Utils::localIpAddress() {
    QString ethAddress;
    QString wlanAddress;
    QString otherAddress;

    for (const auto &interface : QNetworkInterface::allInterfaces()) {
        if (!interface.flags().testFlag(QNetworkInterface::IsUp) ||
            !interface.flags().testFlag(QNetworkInterface::IsRunning) ||
            localNetworkInf(interface))
            continue;

        auto address = ipv4Address(interface);
        if (address.isEmpty()) continue;

        if (ethNetworkInf(interface)) {
            if (ethAddress.isEmpty()) ethAddress = address;
        } else if (wlanNetworkInf(interface)) {
            if (wlanAddress.isEmpty()) wlanAddress = address;
        } else if (otherAddress.isEmpty()) {
            otherAddress = address;
        }
    }

    // preferred Ethernet
    if (!ethAddress.isEmpty()) return ethAddress;
    if (!wlanAddress.isEmpty()) return wlanAddress;
    if (!otherAddress.isEmpty()) return otherAddress;

    qWarning() << "no connected network interface found, using loopback";
    return QHostAddress{QHostAddress::LocalHost}.toString();
}

QString Utils::localAddressFor(const QString &remoteHost) {
    QHostAddress remote;
    if (!remote.setAddress(remoteHost) ||
        remote.protocol() != QAbstractSocket::IPv4Protocol)
        return {};

    // connecting udp socket only selects route, nothing is sent
    QUdpSocket socket;
    socket.connectToHost(remote, 1900);
    if (!socket.waitForConnected(1000)) {
        qDebug() << "no route to host:" << remoteHost << socket.errorString();
        return {};
    }

    const auto local = socket.localAddress();
    socket.close();

    if (local.isNull() || local.protocol() != QAbstractSocket::IPv4Protocol ||
        local == QHostAddress{QHostAddress::AnyIPv4})
        return {};

    return local.toString();
}

QString Utils::normalizeFileName(const QString &name) {
    const auto decomposed = name.normalized(QString::NormalizationForm_KD);

    QString value;
    value.reserve(decomposed.size());
    for (const auto c : decomposed) {
        if (c.unicode() < 128) value.append(c);
    }

    value = value.toLower();
    value.remove(QRegExp{QStringLiteral("[^\\.\\w\\s-]")});
    value.replace(QRegExp{QStringLiteral("[-\\s]+")}, QStringLiteral("-"));

    int start = 0;
    int end = value.size();
    while (start < end && (value.at(start) == '-' || value.at(start) == '_'))
        ++start;
    while (end > start && (value.at(end - 1) == '-' || value.at(end - 1) == '_'))
        --end;

    return value.mid(start, end - start);
}

QString Utils::canonicalPath(const QString &path) {
    QFileInfo info{path};
    if (!info.exists() || !info.isFile() || !info.isReadable()) return {};
    return info.canonicalFilePath();
}

std::optional<QString> Utils::subtitleForMedia(const QString &mediaPath) {
    QFileInfo media{mediaPath};
    const auto dir = media.dir();
    const auto baseName = media.completeBaseName();

    for (const auto &ext : subtitleExts) {
        QFileInfo sub{dir.filePath(baseName + '.' + ext)};
        if (sub.exists() && sub.isFile() && sub.isReadable())
            return sub.canonicalFilePath();
    }

    return std::nullopt;
}

QString Utils::mimeFromPath(const QString &path) {
    const auto ext = QFileInfo{path}.suffix().toLower();

    if (auto it = m_videoExtMap.find(ext); it != m_videoExtMap.end())
        return it.value();
    if (auto it = m_musicExtMap.find(ext); it != m_musicExtMap.end())
        return it.value();
    if (auto it = m_imgExtMap.find(ext); it != m_imgExtMap.end())
        return it.value();
    if (auto it = m_subExtMap.find(ext); it != m_subExtMap.end())
        return it.value();

    return QStringLiteral("application/octet-stream");
}

QString Utils::itemClassFromMime(const QString &mime) {
    if (mime.startsWith(QStringLiteral("video/"))) return videoItemClass;
    if (mime.startsWith(QStringLiteral("audio/"))) return audioItemClass;
    if (mime.startsWith(QStringLiteral("image/"))) return imageItemClass;
    return defaultItemClass;
}

QString Utils::dlnaOrgFlagsForFile() {
    // byte based seek, streaming and background transfer modes,
    // connection stall, DLNA v1.5
    const quint32 flags = (1U << 29) | (1U << 24) | (1U << 22) | (1U << 21) |
                          (1U << 20);
    return QStringLiteral("DLNA.ORG_FLAGS=%1%2")
        .arg(flags, 8, 16, QLatin1Char('0'))
        .arg(QString(24, '0'));
}

QString Utils::dlnaOrgPnFlags(const QString &mime) {
    if (mime.contains(QStringLiteral("video/x-msvideo"), Qt::CaseInsensitive))
        return QStringLiteral("DLNA.ORG_PN=AVI");
    if (mime.contains(QStringLiteral("audio/mpeg"), Qt::CaseInsensitive))
        return QStringLiteral("DLNA.ORG_PN=MP3");
    if (mime.contains(QStringLiteral("video/x-matroska"), Qt::CaseInsensitive))
        return QStringLiteral("DLNA.ORG_PN=MKV");
    return {};
}

QString Utils::dlnaContentFeatures(const QString &mime) {
    auto pnFlags = dlnaOrgPnFlags(mime);
    if (pnFlags.isEmpty())
        return QStringLiteral("%1;%2;%3")
            .arg(dlnaOrgOpFlagsSeekBytes, dlnaOrgCiFlags, dlnaOrgFlagsForFile());
    return QStringLiteral("%1;%2;%3;%4")
        .arg(pnFlags, dlnaOrgOpFlagsSeekBytes, dlnaOrgCiFlags,
             dlnaOrgFlagsForFile());
}

QString Utils::secToStr(int value) {
    if (value < 0) value = 0;

    int s = value % 60;
    int m = (value / 60) % 60;
    int h = value / 3600;

    return QStringLiteral("%1:%2:%3")
        .arg(h, 2, 10, QLatin1Char('0'))
        .arg(m, 2, 10, QLatin1Char('0'))
        .arg(s, 2, 10, QLatin1Char('0'));
}

std::optional<int> Utils::strToSec(const QString &value) {
    const QRegExp rx{
        QStringLiteral("^(?:(\\d+):)?(?:(\\d{1,2}):)?(\\d+)(?:\\.\\d+)?$")};

    auto str = value.trimmed();
    if (!rx.exactMatch(str)) {
        qWarning() << "invalid time value:" << value;
        return std::nullopt;
    }

    const auto parts = str.section('.', 0, 0).split(':');
    int total = 0;
    for (int i = 0; i < parts.size(); ++i) {
        const auto n = parts.at(i).toInt();
        // minutes and seconds after a larger unit stay below 60
        if (i > 0 && n >= 60) {
            qWarning() << "invalid time value:" << value;
            return std::nullopt;
        }
        total = total * 60 + n;
    }

    return total;
}
