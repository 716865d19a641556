/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "error.hpp"

#include <utility>

namespace ecp {

Error::Error(Kind kind, QString message)
    : m_kind{kind}, m_message{std::move(message)} {}

static const char* kindName(Error::Kind kind) {
    switch (kind) {
        case Error::Kind::Transport:
            return "transport";
        case Error::Kind::AddressParse:
            return "address-parse";
        case Error::Kind::Decode:
            return "decode";
        case Error::Kind::Argument:
            return "argument";
    }
    return "unknown";
}

QString Error::toString() const {
    return QStringLiteral("%1 error: %2")
        .arg(QString::fromLatin1(kindName(m_kind)), m_message);
}

std::ostream& operator<<(std::ostream& os, Error::Kind kind) {
    os << kindName(kind);
    return os;
}

std::ostream& operator<<(std::ostream& os, const Error& error) {
    os << error.toString().toStdString();
    return os;
}

}  // namespace ecp
