/* Copyright (C) 2023 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "qtlogger.hpp"

#include <QMessageLogContext>
#include <QString>
#include <QtGlobal>

#include "logger.hpp"

static LoopcastLogger::LogType logTypeFromQt(QtMsgType qtType) {
    switch (qtType) {
        case QtDebugMsg:
            return LoopcastLogger::LogType::Debug;
        case QtInfoMsg:
            return LoopcastLogger::LogType::Info;
        case QtWarningMsg:
            return LoopcastLogger::LogType::Warning;
        case QtCriticalMsg:
        case QtFatalMsg:
            return LoopcastLogger::LogType::Error;
    }
    return LoopcastLogger::LogType::Debug;
}

static void qtLog(QtMsgType qtType, const QMessageLogContext &qtContext,
                  const QString &qtMsg) {
    const auto type = logTypeFromQt(qtType);
    if (!LoopcastLogger::match(type)) return;

    LoopcastLogger::Message msg{type, qtContext.file ? qtContext.file : "",
                                qtContext.function ? qtContext.function : "",
                                qtContext.line};
    msg << qtMsg.toStdString();
}

void initQtLogger() { qInstallMessageHandler(qtLog); }
