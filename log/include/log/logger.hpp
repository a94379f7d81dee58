#pragma once

#include <log/level.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Log
{
    struct LoggerOptions
    {
        Level level{Level::Info};
        std::optional<std::filesystem::path> logFile{std::nullopt};
        std::string pattern{"[%H:%M:%S.%e] [%^%l%$] %v"};
    };

    class Logger
    {
      public:
        Logger()
            : guard_{}
            , logger_{std::make_shared<spdlog::logger>(
                  "tree-ftp",
                  std::make_shared<spdlog::sinks::stderr_color_sink_mt>())}
        {}

        /**
         * @brief Replaces the sinks. stderr is always attached, so stdout stays free for the tree output.
         *
         * @param options
         */
        void setup(LoggerOptions const& options)
        {
            std::vector<spdlog::sink_ptr> sinks{std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
            if (options.logFile)
            {
                try
                {
                    sinks.push_back(
                        std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.logFile->string(), false));
                }
                catch (spdlog::spdlog_ex const& e)
                {
                    // the stderr sink still works, report there
                    logImpl(Level::Warning, std::string{"Cannot open log file: "} + e.what());
                }
            }

            auto logger = std::make_shared<spdlog::logger>("tree-ftp", begin(sinks), end(sinks));
            logger->set_pattern(options.pattern);
            logger->set_level(toSpdlogLevel(options.level));

            std::scoped_lock lock{guard_};
            logger_ = std::move(logger);
        }

        void setLevel(Log::Level level)
        {
            std::scoped_lock lock{guard_};
            logger_->set_level(toSpdlogLevel(level));
        }

        Log::Level level() const
        {
            std::scoped_lock lock{guard_};
            return fromSpdlogLevel(logger_->level());
        }

        template <typename... Args>
        void log(Log::Level level, std::string_view fmt, Args&&... args)
        {
            if (level < this->level())
                return;

            const std::string buf = spdlog::fmt_lib::format(spdlog::fmt_lib::runtime(fmt), std::forward<Args>(args)...);
            logImpl(level, buf);
        }

        void logImpl(Log::Level level, std::string const& msg)
        {
            std::scoped_lock lock{guard_};
            logger_->log(toSpdlogLevel(level), msg);
        }

      private:
        mutable std::recursive_mutex guard_;
        std::shared_ptr<spdlog::logger> logger_;
    };
}
