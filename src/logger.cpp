/* Copyright (C) 2022-2024 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "logger.hpp"

#include <fmt/chrono.h>
#include <fmt/core.h>
#include <threads.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>

LoopcastLogger::LogType LoopcastLogger::m_level =
    LoopcastLogger::LogType::Info;
std::optional<std::ofstream> LoopcastLogger::m_file = std::nullopt;
std::mutex LoopcastLogger::m_mutex;

std::ostream &operator<<(std::ostream &os, LoopcastLogger::LogType type) {
    switch (type) {
        case LoopcastLogger::LogType::Trace:
            os << "trace";
            break;
        case LoopcastLogger::LogType::Debug:
            os << "debug";
            break;
        case LoopcastLogger::LogType::Info:
            os << "info";
            break;
        case LoopcastLogger::LogType::Warning:
            os << "warning";
            break;
        case LoopcastLogger::LogType::Error:
            os << "error";
            break;
        case LoopcastLogger::LogType::Quiet:
            os << "quiet";
            break;
    }
    return os;
}

void LoopcastLogger::init(LogType level, const std::string &file) {
    m_level = level;

    setFile(file);
}

void LoopcastLogger::setLevel(LogType level) {
    if (m_level != level) {
        auto old = m_level;
        m_level = level;
        LOGD("logging level changed: " << old << " => " << m_level);
    }
}

std::optional<LoopcastLogger::LogType> LoopcastLogger::levelFromStr(
    const std::string &str) {
    std::string name{str};
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (name == "trace") return LogType::Trace;
    if (name == "debug") return LogType::Debug;
    if (name == "info") return LogType::Info;
    if (name == "warning") return LogType::Warning;
    if (name == "error") return LogType::Error;
    if (name == "quiet") return LogType::Quiet;

    return std::nullopt;
}

void LoopcastLogger::setFile(const std::string &file) {
    if (file.empty()) {
        {
            std::lock_guard lock{m_mutex};
            m_file.reset();
        }
        LOGI("logging to stderr enabled");
    } else {
        bool ok = false;
        {
            std::lock_guard lock{m_mutex};
            m_file.emplace(file, std::ios::app);
            ok = m_file->good();
            if (!ok) m_file.reset();
        }
        if (!ok) {
            LOGW("failed to create log file: " << file);
        } else {
            LOGI("logging to file enabled: " << file);
        }
    }
}

LoopcastLogger::LogType LoopcastLogger::level() { return m_level; }

bool LoopcastLogger::match(LogType type) {
    return static_cast<int>(type) >= static_cast<int>(m_level);
}

LoopcastLogger::Message::Message(LogType type, const char *file,
                                 const char *function, int line)
    : m_type{type}, m_file{file}, m_fun{function}, m_line{line} {}

inline static auto typeToChar(LoopcastLogger::LogType type) {
    switch (type) {
        case LoopcastLogger::LogType::Trace:
            return 'T';
        case LoopcastLogger::LogType::Debug:
            return 'D';
        case LoopcastLogger::LogType::Info:
            return 'I';
        case LoopcastLogger::LogType::Warning:
            return 'W';
        case LoopcastLogger::LogType::Error:
            return 'E';
        case LoopcastLogger::LogType::Quiet:
            return 'Q';
    }
    return '-';
}

LoopcastLogger::Message::~Message() {
    if (!match(m_type)) return;

    auto now = std::chrono::system_clock::now();
    auto msecs = std::chrono::duration_cast<std::chrono::milliseconds>(
                     now.time_since_epoch())
                     .count() %
                 1000;

    const auto str = m_os.str();
    if (str.empty()) return;

    if (m_fun == nullptr || m_fun[0] == '\0') m_fun = m_emptyStr;

    auto fmt = fmt::format(
        "[{{0}}] {{1:%H:%M:%S}}.{{2:03}} {{3:#10x}} {{4}}{}- {{5}}{}",
        m_line > 0 ? ":{6} " : " ", str.back() == '\n' ? "" : "\n");
    try {
        auto line = fmt::format(
            fmt::runtime(fmt), typeToChar(m_type),
            std::chrono::time_point_cast<std::chrono::seconds>(now), msecs,
            thrd_current(), m_fun, str, m_line);

        std::lock_guard lock{LoopcastLogger::m_mutex};
        if (LoopcastLogger::m_file) {
            *LoopcastLogger::m_file << line;
            LoopcastLogger::m_file->flush();
        } else {
            fmt::print(stderr, "{}", line);
            fflush(stderr);
        }
    } catch (const std::runtime_error &e) {
        fmt::print(stderr, "logger error: {}\n", e.what());
        fmt::print(stderr, "{}\n", str);
    }
}
