#pragma once

#include "common.hpp"

#include <cstdarg>
#include <cstdio>
#include <memory>
#include <mutex>

namespace nodesync
{
    enum class LogLevel : std::uint8_t
    {
        Error = 0,
        Warn = 1,
        Info = 2,
        Debug = 3,
        Trace = 4,
        Off = 255,
    };

    inline const char *log_level_name(LogLevel lvl) noexcept
    {
        switch (lvl)
        {
        case LogLevel::Error:
            return "ERROR";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Trace:
            return "TRACE";
        case LogLevel::Off:
            return "OFF";
        }
        return "UNKNOWN";
    }

    inline bool log_enabled(LogLevel configured, LogLevel msg) noexcept
    {
        if (configured == LogLevel::Off)
        {
            return false;
        }
        return static_cast<std::uint8_t>(msg) <= static_cast<std::uint8_t>(configured);
    }

    // Leveled logger handed to each component at construction.
    //
    // Every record is tagged with the owning node's address so that several
    // node instances can share one sink (e.g. in tests or a multi-node host).
    // Subclasses can override write_() to redirect formatted records.
    class Logger
    {
    public:
        explicit Logger(NodeAddress node = {}, LogLevel lvl = LogLevel::Warn)
            : m_node(std::move(node)), m_level(lvl)
        {
        }

        virtual ~Logger() = default;

        void set_level(LogLevel lvl)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_level = lvl;
        }

        LogLevel level() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_level;
        }

        void set_sink(FILE *f)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_sink = f;
        }

        const NodeAddress &node() const noexcept { return m_node; }

        void logf(LogLevel lvl, const char *component, const char *fmt, ...)
        {
            if (!log_enabled(level(), lvl))
            {
                return;
            }

            char buf[1024];
            va_list args;
            va_start(args, fmt);
            std::vsnprintf(buf, sizeof(buf), fmt, args);
            va_end(args);

            write_(lvl, component, buf);
        }

    protected:
        virtual void write_(LogLevel lvl, const char *component, const char *text)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            if (!m_sink)
            {
                return;
            }
            std::fprintf(m_sink, "[%s][node=%s][%s] %s\n",
                         log_level_name(lvl),
                         m_node.c_str(),
                         component,
                         text);
            std::fflush(m_sink);
        }

    private:
        const NodeAddress m_node;
        mutable std::mutex m_mu;
        LogLevel m_level = LogLevel::Warn;
        FILE *m_sink = stderr;
    };

    inline std::shared_ptr<Logger> make_default_logger(const NodeAddress &node, LogLevel lvl = LogLevel::Warn)
    {
        return std::make_shared<Logger>(node, lvl);
    }
}
