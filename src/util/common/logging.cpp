// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "logging.hpp"

#include <array>
#include <chrono>
#include <ctime>
#include <iomanip>

namespace mintnet::logging {
    null_stream::null_stream() : std::ostream(nullptr) {}

    log::log(log_level level,
             bool use_stdout,
             std::unique_ptr<std::ostream> logfile)
        : m_stdout(use_stdout),
          m_loglevel(level),
          m_logfile(std::move(logfile)) {}

    void log::set_stdout_enabled(bool stdout_enabled) {
        m_stdout = stdout_enabled;
    }

    void log::set_logfile(std::unique_ptr<std::ostream> logfile) {
        const std::lock_guard<std::mutex> lock(m_stream_mut);
        m_logfile = std::move(logfile);
    }

    void log::set_loglevel(log_level level) {
        m_loglevel = level;
    }

    void log::set_name(std::string name) {
        m_name = std::move(name);
    }

    auto log::get_log_level() const -> log_level {
        return m_loglevel;
    }

    auto log::to_string(log_level level) -> std::string {
        switch(level) {
            case log_level::trace:
                return "TRACE";
            case log_level::debug:
                return "DEBUG";
            case log_level::info:
                return "INFO ";
            case log_level::warn:
                return "WARN ";
            case log_level::error:
                return "ERROR";
            case log_level::fatal:
                return "FATAL";
        }
        return "NONE ";
    }

    void log::write_log_prefix(std::stringstream& ss, log_level level) const {
        auto now = std::chrono::system_clock::now();
        auto now_t = std::chrono::system_clock::to_time_t(now);
        auto now_ms
            = std::chrono::time_point_cast<std::chrono::milliseconds>(now);

        static constexpr int msec_per_sec = 1000;
        auto const now_ms_f = now_ms.time_since_epoch().count() % msec_per_sec;
        std::tm now_tm{};
        localtime_r(&now_t, &now_tm);
        ss << std::put_time(&now_tm, "[%Y-%m-%d %H:%M:%S.")
           << std::setfill('0') << std::setw(3) << now_ms_f << "] ["
           << to_string(level) << "]";
        if(!m_name.empty()) {
            ss << " [" << m_name << "]";
        }
    }

    void log::flush() {
        std::cout << std::flush;
    }

    auto parse_loglevel(const std::string& level) -> std::optional<log_level> {
        static const auto levels
            = std::array<std::pair<const char*, log_level>, 6>{
                {{"TRACE", log_level::trace},
                 {"DEBUG", log_level::debug},
                 {"INFO", log_level::info},
                 {"WARN", log_level::warn},
                 {"ERROR", log_level::error},
                 {"FATAL", log_level::fatal}}};
        for(const auto& [name, lvl] : levels) {
            if(level == name) {
                return lvl;
            }
        }
        return std::nullopt;
    }
}
