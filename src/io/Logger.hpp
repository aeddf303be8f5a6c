#pragma once
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

// thin wrapper around an spdlog logger: verbosity levels, optional log file, repeated message suppression
class Logger {
public:
    using level = spdlog::level::level_enum;

    // temporarily change console level, restored on scope exit
    class ConsoleLevelGuard {
        Logger& logger;
        level prev;

        public:
        ConsoleLevelGuard(Logger& logger, level new_level)
            : logger(logger), prev(logger.console_level()) {
                logger.set_console_level(new_level);
            }

        ~ConsoleLevelGuard() {
            logger.set_console_level(prev);
        }
    };

    explicit Logger(std::shared_ptr<spdlog::logger> logger)
        : m_logger(std::move(logger)) {}

    void set_verbosity(int verbosity);
    void set_banner(const std::string& banner){ m_banner = banner; }
    void set_arguments(int argc, char* argv[]);
    void set_arguments(const std::vector<std::string>&);
    void set_dedup_limit(int limit){ m_dedup_limit = limit; }

    template <typename... Args>
    inline void trace(fmt::format_string<Args...> format, Args&&... args) {
        m_logger->trace(format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void debug(fmt::format_string<Args...> format, Args&&... args) {
        m_logger->debug(format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void info(fmt::format_string<Args...> format, Args&&... args) {
        m_logger->info(format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void warn(fmt::format_string<Args...> format, Args&&... args) {
        log_deduped(spdlog::level::warn, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void error(fmt::format_string<Args...> format, Args&&... args) {
        log_deduped(spdlog::level::err, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void critical(fmt::format_string<Args...> format, Args&&... args) {
        m_logger->critical(format, std::forward<Args>(args)...);
    }

    // add a file sink next to the console one
    bool add_file(const std::filesystem::path& fname);

    // log banner, command line and log destination
    void start();

    level console_level() const;
    void set_console_level(level lvl);
    void with_console_level(level lvl, const std::function<void()>& func){
        ConsoleLevelGuard guard(*this, lvl);
        func();
    }

    // how many times a message with this format string was logged through warn()/error()
    int seen_count(std::string_view format) const;

private:
    template <typename... Args>
    void log_deduped(level lvl, fmt::format_string<Args...> format, Args&&... args) {
        if (m_dedup_limit > 0) {
            std::lock_guard<std::mutex> lock(m_mtx);

            // counted by format string, arguments don't matter
            const auto fmt_sv = format.get();
            int n = m_logged_messages[std::string_view(fmt_sv.data(), fmt_sv.size())]++;
            if (n >= m_dedup_limit) {
                if (n == m_dedup_limit) {
                    std::string message = fmt::format(format, std::forward<Args>(args)...);
                    m_logger->log(lvl, "{} [repeated {} times, suppressing]", message, m_dedup_limit);
                }
                return;
            }
        }
        m_logger->log(lvl, format, std::forward<Args>(args)...);
    }

    std::shared_ptr<spdlog::logger> m_logger;
    std::unordered_map<std::string_view, int> m_logged_messages; // keys point to static format strings
    mutable std::mutex m_mtx;
    std::string m_banner;
    std::filesystem::path m_fname;
    std::vector<std::string> m_arguments;
    int m_dedup_limit = 0;
};

template <>
struct fmt::formatter<std::filesystem::path> : fmt::formatter<std::string> {
    template <typename FormatContext>
    auto format(const std::filesystem::path& path, FormatContext& ctx) const {
        return fmt::formatter<std::string>::format(path.string(), ctx);
    }
};
