#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/fmt/fmt.h>
#include <memory>
#include <string>

namespace crosstrade {

class Logger {
public:
    static Logger& getInstance();

    // Until this runs every call below is a no-op.
    void initialize(const std::string& log_dir = "logs", const std::string& level = "info");
    bool isInitialized() const { return initialized_; }

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->debug(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->info(fmt, std::forward<Args>(args)...);
        }
    }
    
    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->warn(fmt, std::forward<Args>(args)...);
        }
    }
    
    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->error(fmt, std::forward<Args>(args)...);
        }
    }
    
    // CSV line in trades.log: symbol,exit_reason,entry_price,exit_price,quantity,pnl
    void logTrade(const std::string& symbol, const std::string& exit_reason,
                  double entry_price, double exit_price, double quantity, double pnl);

    void flush();
    // Flushes and drops both loggers; initialize() may be called again afterwards.
    void shutdown();

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> trade_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) crosstrade::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) crosstrade::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) crosstrade::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) crosstrade::Logger::getInstance().error(__VA_ARGS__)

} // namespace crosstrade
