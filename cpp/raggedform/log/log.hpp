/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <logger.pb.h>

#include <raggedform/util/constructors.hpp>

#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <unordered_map>

#ifdef DEBUG_BUILD
#define RAGGEDFORM_DEBUG(logger, ...) logger.debug(__VA_ARGS__)
#else
#define RAGGEDFORM_DEBUG(logger, ...) (void)0
#endif

namespace raggedform::proto {
    namespace logger = raggedform::pb2::logger_pb2;
}

namespace raggedform::log {

class Loggers {
  public:
    Loggers();
    ~Loggers();
    RAGGEDFORM_NO_MOVE_OR_COPY(Loggers)

    static Loggers& instance();
    static void destroy_instance();

    /**
     * Configure the loggers instance.
     * If called multiple times will ignore subsequent calls and return false
     * @param conf
     * @return true if configuration occurred
     */
    bool configure(const raggedform::proto::logger::LoggersConfig &conf, bool force=false);

    spdlog::logger &root();
    spdlog::logger &schema();
    spdlog::logger &serde();
    spdlog::logger &columns();

    void flush_all();

  private:
    static void init();

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

spdlog::logger &root();
spdlog::logger &schema();
spdlog::logger &serde();
spdlog::logger &columns();

inline std::unordered_map<std::string, spdlog::logger*> get_loggers_by_name() {
    return {
        {"root", &root()},
        {"schema", &schema()},
        {"serde", &serde()},
        {"columns", &columns()}
    };
}

} //namespace raggedform::log
