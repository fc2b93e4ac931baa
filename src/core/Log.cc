#include "oddity/core/Log.hh"

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

#include <filesystem>
#include <string>
#include <vector>

namespace oddity::log {

namespace {
// Root logger (gameplay, config, demo)
quill::Logger* g_logger = nullptr;

// Time manager and history buffer
quill::Logger* g_logger_temporal = nullptr;

const std::string kLogsDir = "logs";

std::shared_ptr<quill::Sink> makeFileSink(const std::string& filename) {
    return quill::Frontend::create_or_get_sink<quill::FileSink>(filename, []() {
        quill::FileSinkConfig cfg;
        cfg.set_open_mode('w');
        cfg.set_filename_append_option(quill::FilenameAppendOption::StartDateTime);
        return cfg;
    }());
}

quill::PatternFormatterOptions makePattern() {
    quill::PatternFormatterOptions pattern;
    pattern.format_pattern = "%(time) [%(thread_id)] %(short_source_location:<28) "
                             "%(log_level:<9) %(message)";
    pattern.timestamp_pattern = "%H:%M:%S.%Qms";
    return pattern;
}

void startBackend() {
    quill::BackendOptions backend_opts;
    backend_opts.thread_name = "OddityLog";
    backend_opts.wait_for_queues_to_empty_before_exit = true;

    quill::Backend::start(backend_opts);

    std::filesystem::create_directories(kLogsDir);
}

void createLoggers(std::vector<std::shared_ptr<quill::Sink>> extraSinks) {
    auto console_sink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console");
    auto pattern = makePattern();

    std::vector<std::shared_ptr<quill::Sink>> rootSinks{console_sink, makeFileSink(kLogsDir + "/oddity.log")};
    std::vector<std::shared_ptr<quill::Sink>> temporalSinks{console_sink, makeFileSink(kLogsDir + "/temporal.log")};
    for (auto& sink : extraSinks) {
        rootSinks.push_back(sink);
        temporalSinks.push_back(sink);
    }

    g_logger = quill::Frontend::create_or_get_logger("oddity", std::move(rootSinks), pattern);
    g_logger->set_log_level(quill::LogLevel::Info);

    g_logger_temporal = quill::Frontend::create_or_get_logger("temporal", std::move(temporalSinks), pattern);
    g_logger_temporal->set_log_level(quill::LogLevel::Info);
}

} // namespace

void init() {
    startBackend();
    createLoggers({});
}

void init(const char* log_file_path) {
    startBackend();
    createLoggers({makeFileSink(log_file_path)});
}

void shutdown() {
    for (auto* lg : {g_logger, g_logger_temporal}) {
        if (lg)
            lg->flush_log();
    }
    quill::Backend::stop();
}

quill::Logger* logger() {
    return g_logger;
}

quill::Logger* temporalLogger() {
    return g_logger_temporal;
}

void setLevel(quill::LogLevel level) {
    if (g_logger) {
        g_logger->set_log_level(level);
    }
}

void setTemporalLevel(quill::LogLevel level) {
    if (g_logger_temporal) {
        g_logger_temporal->set_log_level(level);
    }
}

} // namespace oddity::log
