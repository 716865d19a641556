/* Copyright (C) 2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef ECP_KEY_H
#define ECP_KEY_H

#include <QString>
#include <ostream>
#include <variant>

namespace ecp {

/**
 * Remote control key.
 *
 * Either one of the named keys or a literal character that is typed as
 * "Lit_<c>". A literal is a Unicode code point, so characters outside the
 * BMP can be typed too. The wire token of a named key is its own name.
 */
class Key {
   public:
    enum Name {
        Back,
        Backspace,
        ChannelDown,
        ChannelUp,
        Down,
        Enter,
        FindRemote,
        Fwd,
        Home,
        Info,
        InputAV1,
        InputHDMI1,
        InputHDMI2,
        InputHDMI3,
        InputHDMI4,
        InputTuner,
        InstantReplay,
        Left,
        Play,
        PowerOff,
        Rev,
        Right,
        Search,
        Select,
        Up,
        VolumeDown,
        VolumeMute,
        VolumeUp
    };

    Key(Name name) : m_value{name} {}
    static Key Lit(char32_t character);

    inline bool literal() const {
        return std::holds_alternative<char32_t>(m_value);
    }
    QString toString() const;

    friend bool operator==(const Key& lhs, const Key& rhs) {
        return lhs.m_value == rhs.m_value;
    }
    friend bool operator!=(const Key& lhs, const Key& rhs) {
        return !(lhs == rhs);
    }
    friend std::ostream& operator<<(std::ostream& os, const Key& key);

   private:
    explicit Key(char32_t character) : m_value{character} {}

    std::variant<Name, char32_t> m_value;
};

}  // namespace ecp

#endif  // ECP_KEY_H
