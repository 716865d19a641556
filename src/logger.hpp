/* Copyright (C) 2022-2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef ECP_LOGGER_H
#define ECP_LOGGER_H

#include <QByteArray>
#include <QString>
#include <QUrl>
#include <fstream>
#include <functional>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

#define ECP_LOG(level, msg)                                               \
    ::ecp::Logger::Message(::ecp::Logger::Level::level, __func__, __LINE__) \
        << msg

#ifdef USE_TRACE_LOGS
#define LOGT(msg) ECP_LOG(Trace, msg)
#else
#define LOGT(msg)
#endif
#define LOGD(msg) ECP_LOG(Debug, msg)
#define LOGI(msg) ECP_LOG(Info, msg)
#define LOGW(msg) ECP_LOG(Warning, msg)
#define LOGE(msg) ECP_LOG(Error, msg)

std::ostream &operator<<(std::ostream &os, const QString &str);
std::ostream &operator<<(std::ostream &os, const QByteArray &data);
std::ostream &operator<<(std::ostream &os, const QUrl &url);

namespace ecp {

/**
 * Process wide logger of the library.
 *
 * Lines go to stderr, to a log file or to a sink installed by the host
 * application. A sink takes precedence over the other outputs.
 */
class Logger {
   public:
    enum class Level { Trace, Debug, Info, Warning, Error, Quiet };

    using Sink = std::function<void(Level level, std::string_view line)>;

    class Message {
        std::ostringstream m_os;
        Level m_level;
        const char *m_fun;
        int m_line;

       public:
        Message(Level level, const char *function, int line);
        ~Message();

        template <typename T>
        Message &operator<<(const T &t) {
            m_os << std::boolalpha << t;
            return *this;
        }
    };

    static const char *levelName(Level level);
    // Case sensitive, accepts names returned by levelName()
    static std::optional<Level> levelFromName(std::string_view name);

    static void init(Level level, const std::string &file = {});
    static void setLevel(Level level);
    static void setFile(const std::string &file);
    static void setSink(Sink sink);
    static bool enabled(Level level);
    Logger() = delete;

   private:
    inline static Level m_level = Level::Error;
    inline static std::optional<std::ofstream> m_file;
    inline static Sink m_sink;

    static void write(Level level, const std::string &line);
};

std::ostream &operator<<(std::ostream &os, Logger::Level level);

}  // namespace ecp

#endif  // ECP_LOGGER_H
