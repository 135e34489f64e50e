/* Copyright (C) 2021-2024 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "streamserver.h"

#include <QCryptographicHash>
#include <QDir>
#include <QFileInfo>
#include <QMetaObject>
#include <QMutexLocker>
#include <QPointer>
#include <QRegExp>
#include <QStandardPaths>
#include <algorithm>

#include "errors.h"
#include "utils.h"

QDebug operator<<(QDebug debug, const StreamWorker::Range &range) {
    QDebugStateSaver saver{debug};
    debug.nospace() << "start=" << range.start << ", end=" << range.end
                    << ", length=" << range.length;
    return debug;
}

std::optional<StreamWorker::Range> StreamWorker::Range::fromRange(
    const QString &rangeHeader, int64_t length) {
    QRegExp rx{
        QStringLiteral("bytes[\\s]*=[\\s]*([\\d]*)[\\s]*-[\\s]*([\\d]*)")};

    if (length > 0 && rx.indexIn(rangeHeader) >= 0) {
        const auto startStr = rx.cap(1);
        const auto endStr = rx.cap(2);

        Range range{0, length - 1, length};

        if (startStr.isEmpty()) {
            // suffix range: last N bytes
            const auto suffix = endStr.toLongLong();
            if (!endStr.isEmpty() && suffix > 0) {
                range.start = std::max<int64_t>(0, length - suffix);
                return range;
            }
        } else {
            range.start = startStr.toLongLong();
            if (!endStr.isEmpty())
                range.end = std::min<int64_t>(endStr.toLongLong(), length - 1);
            if (range.start < length && range.start <= range.end)
                return range;
        }
    }

    qWarning() << "invalid range:" << rangeHeader << length;
    return std::nullopt;
}

StreamWorker::StreamWorker(QHash<QString, Route> routes, QObject *parent)
    : QObject{parent}, m_routes{std::move(routes)} {}

StreamWorker::~StreamWorker() { close(); }

std::optional<quint16> StreamWorker::listen(const QHostAddress &address,
                                            quint16 portMin, quint16 portMax,
                                            const QSet<quint16> &skip) {
    close();

    m_server = new QHttpServer{this};
    connect(m_server, &QHttpServer::newRequest, this,
            &StreamWorker::requestHandler);

    for (int port = portMin; port <= portMax; ++port) {
        if (skip.contains(static_cast<quint16>(port))) continue;
        if (m_server->listen(address, static_cast<quint16>(port))) {
            qDebug() << "stream server listening on port:" << port;
            return static_cast<quint16>(port);
        }
        qDebug() << "port busy:" << port;
    }

    delete m_server;
    m_server = nullptr;

    return std::nullopt;
}

void StreamWorker::close() {
    if (m_server) {
        // open connections are children of the server
        m_server->close();
        delete m_server;
        m_server = nullptr;
    }
}

void StreamWorker::requestHandler(QHttpRequest *req, QHttpResponse *resp) {
    qDebug() << "stream request:" << req->methodString() << req->path()
             << req->headers().value(QStringLiteral("range"));

    auto it = m_routes.find(req->path());
    if (it == m_routes.end()) {
        qWarning() << "unknown path requested:" << req->path();
        sendEmptyResponse(resp, 404);
        return;
    }

    if (req->method() != QHttpRequest::HTTP_GET &&
        req->method() != QHttpRequest::HTTP_HEAD) {
        qWarning() << "request method is unsupported:" << req->methodString();
        resp->setHeader(QStringLiteral("Allow"), QStringLiteral("HEAD, GET"));
        sendEmptyResponse(resp, 405);
        return;
    }

    streamFile(it.value(), req, resp);
}

void StreamWorker::sendEmptyResponse(QHttpResponse *resp, int code) {
    resp->setHeader(QStringLiteral("Content-Length"), QStringLiteral("0"));
    resp->setHeader(QStringLiteral("Connection"), QStringLiteral("close"));
    resp->writeHead(code);
    resp->end();
}

void StreamWorker::streamFile(const Route &route, QHttpRequest *req,
                              QHttpResponse *resp) {
    auto file = std::make_shared<QFile>(route.path);

    if (!file->open(QFile::ReadOnly)) {
        qWarning() << "unable to open file:" << file->fileName();
        sendEmptyResponse(resp, 404);
        return;
    }

    resp->setHeader(QStringLiteral("Content-Type"), route.mime);
    resp->setHeader(QStringLiteral("Accept-Ranges"), QStringLiteral("bytes"));
    resp->setHeader(QStringLiteral("Connection"), QStringLiteral("close"));
    resp->setHeader(QStringLiteral("Cache-Control"),
                    QStringLiteral("no-cache"));
    resp->setHeader(QStringLiteral("transferMode.dlna.org"),
                    QStringLiteral("Streaming"));
    resp->setHeader(QStringLiteral("contentFeatures.dlna.org"),
                    Utils::dlnaContentFeatures(route.mime));

    if (req->headers().contains(QStringLiteral("range"))) {
        streamFileRange(file, req, resp);
    } else {
        streamFileNoRange(file, req, resp);
    }
}

void StreamWorker::streamFileRange(std::shared_ptr<QFile> file,
                                   QHttpRequest *req, QHttpResponse *resp) {
    const auto length = file->size();
    const auto range =
        Range::fromRange(req->headers().value(QStringLiteral("range")), length);
    if (!range) {
        resp->setHeader(QStringLiteral("Content-Range"),
                        QStringLiteral("bytes */") + QString::number(length));
        sendEmptyResponse(resp, 416);
        return;
    }

    resp->setHeader(QStringLiteral("Content-Length"),
                    QString::number(range->rangeLength()));
    resp->setHeader(QStringLiteral("Content-Range"),
                    QStringLiteral("bytes ") + QString::number(range->start) +
                        '-' + QString::number(range->end) + '/' +
                        QString::number(length));

    resp->writeHead(206);

    if (req->method() == QHttpRequest::HTTP_HEAD) {
        resp->end();
        return;
    }

    if (!file->seek(range->start)) {
        qWarning() << "unable to seek file:" << file->fileName() << *range;
        resp->end();
        return;
    }

    seqWriteData(file, range->rangeLength(), resp);
}

void StreamWorker::streamFileNoRange(std::shared_ptr<QFile> file,
                                     QHttpRequest *req, QHttpResponse *resp) {
    const auto length = file->size();

    resp->setHeader(QStringLiteral("Content-Length"), QString::number(length));

    resp->writeHead(200);

    if (req->method() == QHttpRequest::HTTP_HEAD) {
        resp->end();
        return;
    }

    seqWriteData(file, length, resp);
}

void StreamWorker::seqWriteData(std::shared_ptr<QFile> file, int64_t size,
                                QHttpResponse *resp) {
    auto left = std::make_shared<int64_t>(size);
    QPointer<QHttpResponse> respPtr{resp};

    auto writeChunk = [file, left, respPtr] {
        if (*left <= 0 || !respPtr) return;

        auto data = file->read(std::min<int64_t>(*left, chunkSize));
        if (data.isEmpty()) {
            qWarning() << "no more data in file:" << file->fileName();
            *left = 0;
            respPtr->end();
            return;
        }

        *left -= data.size();

        if (*left > 0) {
            respPtr->write(data);
        } else {
            qDebug() << "all data sent, so ending connection";
            respPtr->end(data);
        }
    };

    connect(resp, &QHttpResponse::allBytesWritten, this, writeChunk,
            Qt::QueuedConnection);

    writeChunk();
}

StreamServer::StreamServer(Config config) : m_config{std::move(config)} {
    if (m_config.scratchDir.isEmpty()) {
        m_config.scratchDir =
            QStandardPaths::writableLocation(QStandardPaths::CacheLocation) +
            QStringLiteral("/streams");
    }
    if (m_config.portMin > m_config.portMax)
        std::swap(m_config.portMin, m_config.portMax);
}

StreamServer::~StreamServer() { releaseAll(); }

QString StreamServer::advertisedHost(const QString &host) const {
    if (!m_config.address.isEmpty()) return m_config.address;
    if (!host.isEmpty()) return host;
    return Utils::localIpAddress();
}

static QUrl withHost(QUrl url, const QString &host) {
    if (!url.isEmpty()) url.setHost(host);
    return url;
}

std::shared_ptr<StreamServer::SessionData> StreamServer::findSession(
    const QUrl &url) const {
    for (const auto &session : m_sessions) {
        if (session->url.port() == url.port() &&
            session->url.path() == url.path())
            return session;
    }
    return {};
}

QString StreamServer::makeExposure(const QString &path) const {
    if (!QDir::root().mkpath(m_config.scratchDir)) {
        throw ResourceExhaustion{QStringLiteral("cannot create scratch dir: %1")
                                     .arg(m_config.scratchDir)};
    }

    const auto hash =
        QCryptographicHash::hash(path.toUtf8(), QCryptographicHash::Md5)
            .toHex()
            .left(12);
    const auto link =
        QDir{m_config.scratchDir}.filePath(QString::fromLatin1(hash) + '-' +
                                           Utils::normalizeFileName(
                                               QFileInfo{path}.fileName()));

    if (QFileInfo{link}.isSymLink() || QFileInfo::exists(link))
        QFile::remove(link);

    if (!QFile::link(path, link)) {
        throw ResourceExhaustion{
            QStringLiteral("cannot expose file: %1").arg(path)};
    }

    return link;
}

bool StreamServer::startSession(SessionData &session, const QString &host) {
    const auto mediaName =
        Utils::normalizeFileName(QFileInfo{session.mediaPath}.fileName());

    QHash<QString, StreamWorker::Route> routes;
    routes.insert('/' + mediaName,
                  {session.exposurePath, Utils::mimeFromPath(session.mediaPath)});

    QString subName;
    if (!session.subtitlePath.isEmpty()) {
        subName =
            Utils::normalizeFileName(QFileInfo{session.subtitlePath}.fileName());
        routes.insert('/' + subName,
                      {session.subtitleExposurePath,
                       Utils::mimeFromPath(session.subtitlePath)});
    }

    QSet<quint16> usedPorts;
    for (const auto &s : m_sessions) usedPorts.insert(s->port);

    session.thread = std::make_unique<QThread>();
    session.worker = new StreamWorker{routes};
    session.worker->moveToThread(session.thread.get());
    session.thread->start();

    std::optional<quint16> port;
    QMetaObject::invokeMethod(
        session.worker,
        [&] {
            port = session.worker->listen(m_config.bindAddress,
                                          m_config.portMin, m_config.portMax,
                                          usedPorts);
        },
        Qt::BlockingQueuedConnection);

    if (!port) {
        shutdownSession(session);
        return false;
    }

    session.port = *port;

    QUrl url;
    url.setScheme(QStringLiteral("http"));
    url.setHost(host);
    url.setPort(session.port);
    url.setPath('/' + mediaName);
    session.url = url;

    if (!subName.isEmpty()) {
        url.setPath('/' + subName);
        session.subtitleUrl = url;
    }

    return true;
}

void StreamServer::shutdownSession(SessionData &session) {
    if (session.worker) {
        QMetaObject::invokeMethod(
            session.worker, [worker = session.worker] { worker->close(); },
            Qt::BlockingQueuedConnection);
    }

    if (session.thread) {
        session.thread->quit();
        session.thread->wait();
        session.thread.reset();
    }

    // thread is finished, so worker can be deleted from here
    delete session.worker;
    session.worker = nullptr;

    if (!session.exposurePath.isEmpty()) QFile::remove(session.exposurePath);
    if (!session.subtitleExposurePath.isEmpty())
        QFile::remove(session.subtitleExposurePath);
}

QUrl StreamServer::serve(const QString &mediaPath, const QString &host) {
    const auto path = Utils::canonicalPath(mediaPath);
    if (path.isEmpty()) throw MediaNotFound{mediaPath};

    QMutexLocker locker{&m_mutex};

    if (auto it = m_sessions.find(path); it != m_sessions.end()) {
        auto &session = it.value();
        ++session->refCount;
        qDebug() << "reusing stream session:" << session->url
                 << session->refCount;
        return withHost(session->url, advertisedHost(host));
    }

    auto session = std::make_shared<SessionData>();
    session->mediaPath = path;
    session->refCount = 1;
    session->createdAt = QDateTime::currentDateTimeUtc();
    session->exposurePath = makeExposure(path);

    if (auto sub = Utils::subtitleForMedia(path)) {
        session->subtitlePath = *sub;
        try {
            session->subtitleExposurePath = makeExposure(*sub);
        } catch (const ResourceExhaustion &err) {
            qWarning() << "subtitle not exposed:" << err.what();
            session->subtitlePath.clear();
        }
    }

    if (!startSession(*session, advertisedHost(host))) {
        throw ResourceExhaustion{
            QStringLiteral("no free port in range %1-%2")
                .arg(m_config.portMin)
                .arg(m_config.portMax)};
    }

    qDebug() << "new stream session:" << session->url << path;

    m_sessions.insert(path, session);

    return session->url;
}

bool StreamServer::release(const QUrl &url) {
    QMutexLocker locker{&m_mutex};

    auto session = findSession(url);
    if (!session) {
        qWarning() << "release of unknown stream:" << url;
        return false;
    }

    if (--session->refCount > 0) {
        qDebug() << "stream session still in use:" << url << session->refCount;
        return true;
    }

    qDebug() << "closing stream session:" << url;
    shutdownSession(*session);
    m_sessions.remove(session->mediaPath);
    return true;
}

void StreamServer::releaseAll() {
    QMutexLocker locker{&m_mutex};

    for (auto &session : m_sessions) shutdownSession(*session);
    m_sessions.clear();
}

std::optional<StreamServer::Session> StreamServer::session(
    const QUrl &url) const {
    QMutexLocker locker{&m_mutex};

    auto session = findSession(url);
    if (!session) return std::nullopt;

    Session snapshot = *session;
    snapshot.url = withHost(snapshot.url, url.host());
    snapshot.subtitleUrl = withHost(snapshot.subtitleUrl, url.host());
    return snapshot;
}

int StreamServer::sessionCount() const {
    QMutexLocker locker{&m_mutex};
    return m_sessions.size();
}
