/* Copyright (C) 2022-2026 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "logger.hpp"

#include <fmt/chrono.h>
#include <fmt/core.h>

#include <QThread>
#include <chrono>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <utility>

std::ostream &operator<<(std::ostream &os, const QString &str) {
    os << str.toStdString();
    return os;
}

std::ostream &operator<<(std::ostream &os, const QByteArray &data) {
    os << data.toStdString();
    return os;
}

std::ostream &operator<<(std::ostream &os, const QUrl &url) {
    os << url.toDisplayString().toStdString();
    return os;
}

namespace ecp {

static const Logger::Level allLevels[] = {
    Logger::Level::Trace,   Logger::Level::Debug, Logger::Level::Info,
    Logger::Level::Warning, Logger::Level::Error, Logger::Level::Quiet};

const char *Logger::levelName(Level level) {
    switch (level) {
        case Level::Trace:
            return "trace";
        case Level::Debug:
            return "debug";
        case Level::Info:
            return "info";
        case Level::Warning:
            return "warning";
        case Level::Error:
            return "error";
        case Level::Quiet:
            return "quiet";
    }
    return "unknown";
}

std::ostream &operator<<(std::ostream &os, Logger::Level level) {
    os << Logger::levelName(level);
    return os;
}

std::optional<Logger::Level> Logger::levelFromName(std::string_view name) {
    for (auto level : allLevels)
        if (name == levelName(level)) return level;
    return std::nullopt;
}

void Logger::init(Level level, const std::string &file) {
    m_level = level;

    setFile(file);
}

void Logger::setLevel(Level level) {
    if (m_level == level) return;

    auto old = std::exchange(m_level, level);
    LOGD("logging level changed: " << old << " => " << m_level);
}

void Logger::setFile(const std::string &file) {
    if (file.empty()) {
        m_file.reset();
        LOGI("logging to stderr enabled");
        return;
    }

    m_file.emplace(file, std::ios::app);
    if (!m_file->good()) {
        m_file.reset();
        LOGW("failed to open log file: " << file);
    } else {
        LOGI("logging to file enabled: " << file);
    }
}

void Logger::setSink(Sink sink) { m_sink = std::move(sink); }

bool Logger::enabled(Level level) {
    return level != Level::Quiet &&
           static_cast<int>(level) >= static_cast<int>(m_level);
}

void Logger::write(Level level, const std::string &line) {
    if (m_sink) {
        m_sink(level, line);
    } else if (m_file) {
        *m_file << line;
        m_file->flush();
    } else {
        fmt::print(stderr, "{}", line);
        fflush(stderr);
    }
}

Logger::Message::Message(Level level, const char *function, int line)
    : m_level{level}, m_fun{function}, m_line{line} {}

Logger::Message::~Message() {
    if (!enabled(m_level)) return;

    const auto str = m_os.str();
    if (str.empty()) return;

    auto now = std::chrono::system_clock::now();
    auto msecs = std::chrono::duration_cast<std::chrono::milliseconds>(
                     now.time_since_epoch())
                     .count() %
                 1000;
    auto thread =
        reinterpret_cast<std::uintptr_t>(QThread::currentThreadId());

    try {
        auto line = fmt::format(
            "[{}] {:%H:%M:%S}.{:03} {:#x} {}:{} - {}{}",
            static_cast<char>(std::toupper(levelName(m_level)[0])),
            fmt::localtime(std::chrono::system_clock::to_time_t(now)), msecs,
            thread, m_fun && m_fun[0] != '\0' ? m_fun : "()", m_line, str,
            str.back() == '\n' ? "" : "\n");
        write(m_level, line);
    } catch (const fmt::format_error &e) {
        fmt::print(stderr, "logger error: {}\n{}\n", e.what(), str);
    }
}

}  // namespace ecp
