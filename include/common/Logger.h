#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

namespace papertrade {

class Logger {
public:
    static Logger& getInstance();
    void initialize(const std::string& log_dir = "logs", const std::string& level = "info");

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        target()->debug(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        target()->info(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        target()->warn(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        target()->error(fmt, std::forward<Args>(args)...);
    }

    // One CSV row per settled trade: user,pair,side,price,quantity,executed_by
    void logTrade(const std::string& user_id, const std::string& pair, const std::string& side,
                  double price, double quantity, const std::string& executed_by);

private:
    Logger() = default;

    // Before initialize() everything goes to spdlog's default console logger.
    spdlog::logger* target() const {
        return main_logger_ ? main_logger_.get() : spdlog::default_logger_raw();
    }

    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> trade_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) papertrade::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) papertrade::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) papertrade::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) papertrade::Logger::getInstance().error(__VA_ARGS__)

} // namespace papertrade
