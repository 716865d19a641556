/* Copyright (C) 2023-2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "qtlogger.hpp"

#include <QByteArray>
#include <QMessageLogContext>
#include <QString>

namespace ecp {

Logger::Level levelForQtMessage(QtMsgType type) {
    switch (type) {
        case QtDebugMsg:
            return Logger::Level::Debug;
        case QtInfoMsg:
            return Logger::Level::Info;
        case QtWarningMsg:
            return Logger::Level::Warning;
        case QtCriticalMsg:
        case QtFatalMsg:
            return Logger::Level::Error;
    }
    return Logger::Level::Debug;
}

static void handleQtMessage(QtMsgType type, const QMessageLogContext &context,
                            const QString &msg) {
    Logger::Message message{levelForQtMessage(type),
                            context.function ? context.function : "",
                            context.line};

    if (context.category && qstrcmp(context.category, "default") != 0)
        message << context.category << ": ";
    message << msg;
}

void initQtLogger() { qInstallMessageHandler(handleQtMessage); }

}  // namespace ecp
