#pragma once

#include <filesystem>
#include <memory>
#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/details/thread_pool.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>

namespace castscout {

/**
 * @brief Scoped default logger: asynchronous, writing a daily rotated file under
 * @p log_dir and a console copy on stderr.
 *
 * @details stdout belongs to the command output (device lines, the JSON report), so no
 * log line is ever written there. Release builds only echo warnings and errors to the
 * console, the file keeps everything at the logger level. Destroying the Logger drains
 * the queue and reinstalls whatever default logger was active before.
 */
class Logger {
public:
    using Level = spdlog::level::level_enum;

    Logger(Level level,
           const std::filesystem::path& log_dir,
           std::size_t queue_size = 8192,
           std::size_t max_files = 7)
        : previous_(spdlog::default_logger()) {
        std::filesystem::create_directories(log_dir);

        file_sink_ = std::make_shared<spdlog::sinks::daily_file_sink_mt>(
            (log_dir / "castscout.log").string(), 0, 0, false, static_cast<uint16_t>(max_files));
        file_sink_->set_pattern("%Y-%m-%d %H:%M:%S.%e %L [%t] %v");

        console_sink_ = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink_->set_pattern("[%H:%M:%S.%e] %^%-5l%$ %v");
#ifdef CASTSCOUT_RELEASE
        console_sink_->set_level(Level::warn);
#endif

        thread_pool_ = std::make_shared<spdlog::details::thread_pool>(queue_size, 1);
        logger_ = std::make_shared<spdlog::async_logger>("castscout",
                                                         spdlog::sinks_init_list{file_sink_,
                                                                                 console_sink_},
                                                         thread_pool_,
                                                         spdlog::async_overflow_policy::overrun_oldest);
        logger_->set_level(level);
        logger_->flush_on(Level::warn);
        spdlog::set_default_logger(logger_);
    }
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    ~Logger() {
        logger_->flush();
        spdlog::set_default_logger(previous_);
        // the pool joins its worker after the queued messages are written
        thread_pool_.reset();
    }

    [[nodiscard]] Level logLevel() const { return logger_->level(); }
    void set_log_level(Level level) { logger_->set_level(level); }
    void set_console_level(Level level) { console_sink_->set_level(level); }

    // "debug", "info", "warn", ... ; unknown names map to off, so fall back to info
    static Level ParseLevel(const std::string& name) {
        auto level = spdlog::level::from_str(name);
        return level == Level::off && name != "off" ? Level::info : level;
    }

private:
    std::shared_ptr<spdlog::logger> previous_;
    std::shared_ptr<spdlog::sinks::daily_file_sink_mt> file_sink_;
    std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink_;
    std::shared_ptr<spdlog::details::thread_pool> thread_pool_;
    std::shared_ptr<spdlog::async_logger> logger_;
};

} // namespace castscout
