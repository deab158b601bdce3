#pragma once
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

// hash function for fmt::string_view<char> to use in unordered_map
namespace std {
template <>
    struct hash<fmt::basic_string_view<char>> {
        size_t operator()(const fmt::basic_string_view<char>& s) const noexcept {
            return std::hash<std::string_view>{}(std::string_view(s.data(), s.size()));
        }
    };
}

class Logger {
public:
    using level = spdlog::level::level_enum;

    explicit Logger(std::shared_ptr<spdlog::logger> logger)
        : m_logger(std::move(logger)) {}

    void set_verbosity(int verbosity);
    void set_banner(const std::string banner){ m_banner = banner; }
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
        if (should_suppress(format)) {
            return;
        }
        m_logger->warn(format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void error(fmt::format_string<Args...> format, Args&&... args) {
        if (should_suppress(format)) {
            return;
        }
        m_logger->error(format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void critical(fmt::format_string<Args...> format, Args&&... args) {
        m_logger->critical(format, std::forward<Args>(args)...);
    }

    // add a second output stream to the logger
    bool add_file(const std::filesystem::path& fname);

    // show the banner and arguments
    void start();

    spdlog::level::level_enum console_level() const;
    void set_console_level(spdlog::level::level_enum level);

private:
    // counts by format string only, arguments are ignored
    template <typename FormatString>
    bool should_suppress(const FormatString& format) {
        if (m_dedup_limit <= 0) {
            return false;
        }
        std::lock_guard<std::mutex> lock(m_mtx);
        int n = m_logged_messages[format]++;
        if (n == m_dedup_limit) {
            m_logger->warn("previous message repeated {} times, suppressing", m_dedup_limit);
        }
        return n >= m_dedup_limit;
    }

    std::shared_ptr<spdlog::logger> m_logger;                  // Wrapped spdlog logger
    std::unordered_map<fmt::string_view, int> m_logged_messages;
    mutable std::mutex m_mtx;
    std::string m_banner;
    std::filesystem::path m_fname;
    std::vector<std::string> m_arguments;
    int m_dedup_limit = 0;
};

// Custom formatter for std::filesystem::path, which is not supported by spdlog by default
template <>
struct fmt::formatter<std::filesystem::path> : fmt::formatter<std::string> {
    template <typename FormatContext>
    auto format(const std::filesystem::path& path, FormatContext& ctx) const {
        return fmt::formatter<std::string>::format(path.string(), ctx);
    }
};
