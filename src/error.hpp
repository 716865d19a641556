/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef ECP_ERROR_H
#define ECP_ERROR_H

#include <QString>
#include <optional>
#include <ostream>
#include <variant>

namespace ecp {

class Error {
   public:
    enum class Kind {
        Transport,     // HTTP or SSDP transport failed
        AddressParse,  // location or address is not a valid URL
        Decode,        // response body does not match the expected shape
        Argument       // caller supplied data failed a precondition
    };

    Error(Kind kind, QString message);

    inline auto kind() const { return m_kind; }
    inline const auto& message() const { return m_message; }
    QString toString() const;

    friend std::ostream& operator<<(std::ostream& os, Kind kind);
    friend std::ostream& operator<<(std::ostream& os, const Error& error);

   private:
    Kind m_kind;
    QString m_message;
};

template <typename T>
using Result = std::variant<T, Error>;

// Outcome of a command: empty on success
using Status = std::optional<Error>;

}  // namespace ecp

#endif  // ECP_ERROR_H
