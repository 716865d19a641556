/* Copyright (C) 2023-2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef ECP_QTLOGGER_H
#define ECP_QTLOGGER_H

#include <QtGlobal>

#include "logger.hpp"

namespace ecp {

Logger::Level levelForQtMessage(QtMsgType type);

// Sends messages of Qt itself (socket, network and settings warnings) to
// ecp::Logger
void initQtLogger();

}  // namespace ecp

#endif  // ECP_QTLOGGER_H
