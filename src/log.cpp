#include "vaultsplit/log.hpp"

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_channel_logger.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>
#include <utility>

namespace vaultsplit::log {

namespace logging = boost::log;
namespace expr = boost::log::expressions;
namespace keywords = boost::log::keywords;
namespace trivial = boost::log::trivial;

using SourceLogger = logging::sources::severity_channel_logger_mt<trivial::severity_level, std::string>;

struct Logger::Source {
    explicit Source(const std::string& channel) : logger(keywords::channel = channel) {}

    SourceLogger logger;
};

namespace {

std::mutex g_init_mutex;
bool g_console_installed = false;
bool g_attributes_installed = false;

trivial::severity_level ToSeverity(Level level) {
    switch (level) {
        case Level::Trace:
            return trivial::trace;
        case Level::Debug:
            return trivial::debug;
        case Level::Info:
            return trivial::info;
        case Level::Warning:
            return trivial::warning;
        case Level::Error:
        case Level::Off:
            return trivial::error;
    }
    return trivial::info;
}

auto RecordFormat() {
    return expr::stream << "[" << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S")
                        << "] [" << trivial::severity << "] ["
                        << expr::attr<std::string>("Channel") << "] " << expr::smessage;
}

void EnsureAttributes() {
    if (!g_attributes_installed) {
        logging::add_common_attributes();
        g_attributes_installed = true;
    }
}

}  // namespace

Logger::Logger() : channel_("vaultsplit"), min_level_(Level::Off) {}

Logger::Logger(std::string channel, Level min_level)
    : channel_(std::move(channel)), min_level_(min_level) {
    if (min_level_ != Level::Off) {
        source_ = std::make_shared<Source>(channel_);
    }
}

Logger Logger::WithChannel(std::string channel) const {
    return Logger(std::move(channel), min_level_);
}

bool Logger::Enabled(Level level) const noexcept {
    return source_ != nullptr && level != Level::Off && level >= min_level_;
}

void Logger::Write(Level level, const std::string& message) const {
    if (!Enabled(level)) {
        return;
    }
    BOOST_LOG_SEV(source_->logger, ToSeverity(level)) << message;
}

void InitConsole(Level level) {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    if (g_console_installed || level == Level::Off) {
        return;
    }
    EnsureAttributes();
    auto sink = logging::add_console_log(std::clog, keywords::format = RecordFormat());
    sink->set_filter(trivial::severity >= ToSeverity(level));
    g_console_installed = true;
}

void InitFile(const std::string& path, Level level) {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    if (level == Level::Off) {
        return;
    }
    EnsureAttributes();
    auto sink = logging::add_file_log(keywords::file_name = path,
                                      keywords::open_mode = std::ios_base::app,
                                      keywords::auto_flush = true,
                                      keywords::format = RecordFormat());
    sink->set_filter(trivial::severity >= ToSeverity(level));
}

Level ParseLevel(std::string_view text, Level fallback) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (lower == "trace") return Level::Trace;
    if (lower == "debug") return Level::Debug;
    if (lower == "info") return Level::Info;
    if (lower == "warning" || lower == "warn") return Level::Warning;
    if (lower == "error") return Level::Error;
    if (lower == "off" || lower == "none") return Level::Off;
    return fallback;
}

std::string_view LevelName(Level level) {
    switch (level) {
        case Level::Trace:
            return "trace";
        case Level::Debug:
            return "debug";
        case Level::Info:
            return "info";
        case Level::Warning:
            return "warning";
        case Level::Error:
            return "error";
        case Level::Off:
            return "off";
    }
    return "info";
}

}  // namespace vaultsplit::log
