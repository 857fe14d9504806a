/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <raggedform/log/log.hpp>
#include <raggedform/util/preprocess.hpp>
#include <raggedform/util/pb_util.hpp>

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/details/periodic_worker.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

#include <array>
#include <filesystem>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace raggedform::log {

namespace {

namespace fs = std::filesystem;

using SinkConf = raggedform::proto::logger::SinkConfig;
using LoggerConf = raggedform::proto::logger::LoggerConfig;

constexpr const char* default_log_pattern = "%Y%m%d %H:%M:%S.%f %t %L %n | %v";
constexpr auto default_log_level = spdlog::level::info;
constexpr size_t default_queue_size = 8192;
constexpr uint64_t default_rotation_bytes = 64ULL << 20;

enum class LoggerId : size_t {
    ROOT,
    SCHEMA,
    SERDE,
    COLUMNS,
    COUNT
};

// Beware, the order must match LoggerId
constexpr std::array<std::string_view, static_cast<size_t>(LoggerId::COUNT)> logger_names{
    "root",
    "schema",
    "serde",
    "columns"
};

std::shared_ptr<Loggers> loggers_instance_;
std::once_flag loggers_init_flag_;

// Creates the parent directory of a log file, falling back to `default_path` when none is configured
std::string prepare_log_path(const std::string& configured, std::string_view default_path) {
    const fs::path path = configured.empty() ? fs::path(default_path) : fs::path(configured);
    if (path.has_parent_path() && !fs::exists(path.parent_path()))
        fs::create_directories(path.parent_path());

    return path.generic_string();
}

spdlog::sink_ptr make_console_sink(const SinkConf::Console& console) {
    if (console.has_color()) {
        if (console.std_err())
            return std::make_shared<spdlog::sinks::stderr_color_sink_mt>();

        return std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    }
    if (console.std_err())
        return std::make_shared<spdlog::sinks::stderr_sink_mt>();

    return std::make_shared<spdlog::sinks::stdout_sink_mt>();
}

spdlog::sink_ptr make_sink(const SinkConf& conf) {
    switch (conf.sink_case()) {
        case SinkConf::kConsole:
            return make_console_sink(conf.console());
        case SinkConf::kFile:
            return std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                prepare_log_path(conf.file().path(), "./raggedform.log"));
        case SinkConf::kRotFile: {
            const auto& rot_file = conf.rot_file();
            return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                prepare_log_path(rot_file.path(), "./raggedform.rot.log"),
                util::as_opt(rot_file.max_size_bytes()).value_or(default_rotation_bytes),
                util::as_opt(rot_file.max_file_count()).value_or(8));
        }
        case SinkConf::kDailyFile: {
            const auto& daily_file = conf.daily_file();
            return std::make_shared<spdlog::sinks::daily_file_sink_mt>(
                prepare_log_path(daily_file.path(), "./raggedform.daily.log"),
                util::as_opt(daily_file.utc_rotation_hour()).value_or(0),
                util::as_opt(daily_file.utc_rotation_minute()).value_or(0));
        }
        default:
            throw std::invalid_argument(fmt::format("Unsupported sink configuration {}", util::format(conf)));
    }
}

spdlog::level::level_enum to_spdlog_level(LoggerConf::Level level) {
    if (level == LoggerConf::UNKNOWN)
        return default_log_level;

    return static_cast<spdlog::level::level_enum>(static_cast<int>(level) - 1);
}

} // namespace

struct Loggers::Impl {
    std::mutex config_mutex_;
    std::unordered_map<std::string, spdlog::sink_ptr> sink_by_id_;
    std::unique_ptr<spdlog::logger> unconfigured_;
    std::array<std::unique_ptr<spdlog::logger>, static_cast<size_t>(LoggerId::COUNT)> loggers_;
    std::shared_ptr<spdlog::details::thread_pool> thread_pool_;
    std::optional<spdlog::details::periodic_worker> periodic_worker_;

    Impl() :
        unconfigured_(std::make_unique<spdlog::logger>("raggedform", std::make_shared<spdlog::sinks::stderr_sink_mt>())) {
        unconfigured_->set_level(default_log_level);
        unconfigured_->set_pattern(default_log_pattern);
    }

    spdlog::logger& get(LoggerId id) {
        auto& logger = loggers_[static_cast<size_t>(id)];
        if (RAGGEDFORM_LIKELY(static_cast<bool>(logger)))
            return *logger;

        return *unconfigured_;
    }

    std::unique_ptr<spdlog::logger> make_logger(const LoggerConf& conf, std::string_view name) const {
        std::vector<spdlog::sink_ptr> sinks;
        for (const auto& sink_id : conf.sink_ids()) {
            auto it = sink_by_id_.find(sink_id);
            if (it == sink_by_id_.end())
                throw std::invalid_argument(fmt::format("invalid sink_id {} for logger {}", sink_id, name));

            sinks.push_back(it->second);
        }

        auto fq_name = fmt::format("raggedform.{}", name);
        std::unique_ptr<spdlog::logger> logger;
        if (thread_pool_) {
            logger = std::make_unique<spdlog::async_logger>(
                fq_name, sinks.begin(), sinks.end(), thread_pool_, spdlog::async_overflow_policy::block);
        } else {
            logger = std::make_unique<spdlog::logger>(fq_name, sinks.begin(), sinks.end());
        }
        logger->set_pattern(conf.pattern().empty() ? std::string{default_log_pattern} : conf.pattern());
        logger->set_level(to_spdlog_level(conf.level()));
        return logger;
    }
};

spdlog::logger& root() {
    return Loggers::instance().root();
}

spdlog::logger& schema() {
    return Loggers::instance().schema();
}

spdlog::logger& serde() {
    return Loggers::instance().serde();
}

spdlog::logger& columns() {
    return Loggers::instance().columns();
}

Loggers::Loggers() :
    impl_(std::make_unique<Impl>()) {
}

Loggers::~Loggers() = default;

Loggers& Loggers::instance() {
    std::call_once(loggers_init_flag_, &Loggers::init);
    return *loggers_instance_;
}

void Loggers::init() {
    loggers_instance_ = std::make_shared<Loggers>();
}

void Loggers::destroy_instance() {
    loggers_instance_.reset();
}

spdlog::logger& Loggers::root() {
    return impl_->get(LoggerId::ROOT);
}

spdlog::logger& Loggers::schema() {
    return impl_->get(LoggerId::SCHEMA);
}

spdlog::logger& Loggers::serde() {
    return impl_->get(LoggerId::SERDE);
}

spdlog::logger& Loggers::columns() {
    return impl_->get(LoggerId::COLUMNS);
}

void Loggers::flush_all() {
    for (size_t i = 0; i < logger_names.size(); ++i)
        impl_->get(static_cast<LoggerId>(i)).flush();
}

bool Loggers::configure(const raggedform::proto::logger::LoggersConfig& conf, bool force) {
    std::scoped_lock lock(impl_->config_mutex_);
    if (!force && impl_->loggers_[static_cast<size_t>(LoggerId::ROOT)])
        return false;

    if (conf.has_async()) {
        impl_->thread_pool_ = std::make_shared<spdlog::details::thread_pool>(
            util::as_opt(static_cast<size_t>(conf.async().queue_size())).value_or(default_queue_size),
            util::as_opt(static_cast<size_t>(conf.async().thread_pool_size())).value_or(1));
    }

    for (const auto& [sink_id, sink_conf] : conf.sink_by_id())
        impl_->sink_by_id_.try_emplace(sink_id, make_sink(sink_conf));

    // Every logger without its own entry shares the root configuration
    const auto& logger_by_id = conf.logger_by_id();
    auto root_it = logger_by_id.find("root");
    if (root_it == logger_by_id.end())
        throw std::invalid_argument("missing conf for the root logger");

    for (size_t i = 0; i < logger_names.size(); ++i) {
        const std::string name{logger_names[i]};
        auto it = logger_by_id.find(name);
        impl_->loggers_[i] = impl_->make_logger(it != logger_by_id.end() ? it->second : root_it->second, name);
    }

    // Zero means the default interval of one second
    const auto flush_seconds = util::as_opt(conf.flush_interval_seconds()).value_or(1);
    impl_->periodic_worker_.reset();
    impl_->periodic_worker_.emplace(
        [loggers = std::weak_ptr(loggers_instance_)]() {
            if (auto l = loggers.lock())
                l->flush_all();
        },
        std::chrono::seconds(flush_seconds));
    return true;
}

} // namespace raggedform::log
