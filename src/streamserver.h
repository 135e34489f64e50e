/* Copyright (C) 2021-2024 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef STREAMSERVER_H
#define STREAMSERVER_H

#include <qhttprequest.h>
#include <qhttpresponse.h>
#include <qhttpserver.h>

#include <QDateTime>
#include <QDebug>
#include <QFile>
#include <QHash>
#include <QHostAddress>
#include <QMutex>
#include <QObject>
#include <QSet>
#include <QString>
#include <QThread>
#include <QUrl>
#include <cstdint>
#include <memory>
#include <optional>

/*
 * HTTP listener of one streaming session. Lives in its own thread.
 */
class StreamWorker : public QObject {
    Q_OBJECT

   public:
    struct Range {
        int64_t start = 0;
        int64_t end = -1;
        int64_t length = -1;
        inline auto rangeLength() const { return end - start + 1; }
        inline bool operator==(const Range &rv) const {
            return start == rv.start && end == rv.end;
        }
        static std::optional<Range> fromRange(const QString &rangeHeader,
                                              int64_t length);
        friend QDebug operator<<(QDebug debug, const Range &range);
    };

    struct Route {
        QString path;
        QString mime;
    };

    explicit StreamWorker(QHash<QString, Route> routes,
                          QObject *parent = nullptr);
    ~StreamWorker() override;

    // Binds the first free port in [portMin, portMax] not listed in skip.
    std::optional<quint16> listen(const QHostAddress &address, quint16 portMin,
                                  quint16 portMax, const QSet<quint16> &skip);
    void close();

    static void sendEmptyResponse(QHttpResponse *resp, int code);

   private:
    static constexpr int64_t chunkSize = 1000000;
    QHttpServer *m_server = nullptr;
    QHash<QString, Route> m_routes;

    void requestHandler(QHttpRequest *req, QHttpResponse *resp);
    void streamFile(const Route &route, QHttpRequest *req, QHttpResponse *resp);
    void streamFileRange(std::shared_ptr<QFile> file, QHttpRequest *req,
                         QHttpResponse *resp);
    void streamFileNoRange(std::shared_ptr<QFile> file, QHttpRequest *req,
                           QHttpResponse *resp);
    void seqWriteData(std::shared_ptr<QFile> file, int64_t size,
                      QHttpResponse *resp);
};

/*
 * Serves local media files to renderers.
 *
 * One session per canonical file path, shared by reference counting. Each
 * session has its own port from a bounded range and is torn down when the
 * last reference is released.
 *
 * A session is identified by port and path, so URLs that differ only in the
 * advertised host refer to the same session.
 */
class StreamServer {
   public:
    struct Config {
        quint16 portMin = 9000;
        quint16 portMax = 9099;
        QString address;  // advertised host, overrides per-device host
        QString scratchDir;
        QHostAddress bindAddress = QHostAddress{QHostAddress::AnyIPv4};
    };

    struct Session {
        QString mediaPath;
        QString subtitlePath;
        QUrl url;
        QUrl subtitleUrl;
        QString exposurePath;
        QString subtitleExposurePath;
        quint16 port = 0;
        int refCount = 0;
        QDateTime createdAt;
    };

    explicit StreamServer(Config config = {});
    ~StreamServer();

    // host is the local address the renderer can reach
    QUrl serve(const QString &mediaPath, const QString &host = {});
    bool release(const QUrl &url);
    void releaseAll();
    std::optional<Session> session(const QUrl &url) const;
    int sessionCount() const;
    inline const Config &config() const { return m_config; }

   private:
    struct SessionData : Session {
        std::unique_ptr<QThread> thread;
        StreamWorker *worker = nullptr;
    };

    Config m_config;
    mutable QMutex m_mutex;
    QHash<QString, std::shared_ptr<SessionData>> m_sessions;

    QString advertisedHost(const QString &host) const;
    std::shared_ptr<SessionData> findSession(const QUrl &url) const;
    QString makeExposure(const QString &path) const;
    bool startSession(SessionData &session, const QString &host);
    void shutdownSession(SessionData &session);
};

#endif  // STREAMSERVER_H
