/*
 * This file is open source software, licensed to you under the terms
 * of the Apache License, Version 2.0 (the "License").  See the NOTICE file
 * distributed with this work for additional information regarding copyright
 * ownership.  You may not use this file except in compliance with the License.
 *
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing,
 * software distributed under the License is distributed on an
 * "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
 * KIND, either express or implied.  See the License for the
 * specific language governing permissions and limitations
 * under the License.
 */
/*
 * Copyright (C) 2026 The reqbind Authors
 */

#include <reqbind/util/log.hh>
#include <reqbind/util/log-cli.hh>

#include <iostream>
#include <map>
#include <regex>
#include <string>
#include <string_view>
#include <chrono>
#include <algorithm>

#include <fmt/chrono.h>
#include <fmt/ostream.h>
#include <boost/lexical_cast.hpp>

namespace reqbind {

thread_local uint64_t logging_failures = 0;

}

namespace {

struct wrapped_log_level {
    reqbind::log_level level;
};

const std::map<reqbind::log_level, std::string_view> log_level_names = {
        { reqbind::log_level::trace, "trace" },
        { reqbind::log_level::debug, "debug" },
        { reqbind::log_level::info, "info" },
        { reqbind::log_level::warn, "warn" },
        { reqbind::log_level::error, "error" },
};

}

namespace fmt {

template <> struct formatter<wrapped_log_level> {
    using log_level = reqbind::log_level;

    // format specifier not supported
    template <typename ParseContext>
    constexpr auto parse(ParseContext &ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(wrapped_log_level wll, FormatContext& ctx) const {
        static const std::map<log_level, std::string_view> text = {
            { log_level::debug, "DEBUG" },
            { log_level::info,  "INFO " },
            { log_level::trace, "TRACE" },
            { log_level::warn,  "WARN " },
            { log_level::error, "ERROR" },
        };
        return fmt::format_to(ctx.out(), "{}", text.at(wll.level));
    }
};

auto formatter<reqbind::log_level>::format(reqbind::log_level level, format_context& ctx) const
    -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "{}", log_level_names.at(level));
}

}

namespace reqbind {

std::ostream& operator<<(std::ostream& out, log_level level) {
    return out << log_level_names.at(level);
}

std::istream& operator>>(std::istream& in, log_level& level) {
    sstring s;
    in >> s;
    if (!in) {
        return in;
    }
    for (auto&& x : log_level_names) {
        if (s == x.second) {
            level = x.first;
            return in;
        }
    }
    in.setstate(std::ios::failbit);
    return in;
}

std::ostream* logger::_out = &std::cerr;
std::atomic<bool> logger::_ostream = { true };
std::mutex logger::_out_mutex;

logger::logger(sstring name) : _name(std::move(name)) {
    global_logger_registry().register_logger(this);
}

logger::logger(logger&& x) : _name(std::move(x._name)), _level(x._level.load(std::memory_order_relaxed)) {
    global_logger_registry().moved(&x, this);
}

logger::~logger() {
    global_logger_registry().unregister_logger(this);
}

void
logger::do_log(log_level level, fmt::string_view msg) {
    if (!_ostream.load(std::memory_order_relaxed)) {
        return;
    }
    auto now = std::chrono::system_clock::now();
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    auto line = fmt::format("{} {:%Y-%m-%d %T},{:03d} {} - {}\n",
            wrapped_log_level{level},
            fmt::localtime(std::chrono::system_clock::to_time_t(now)),
            millis, _name, msg);
    // binders log from many threads; keep lines whole
    std::lock_guard<std::mutex> g(_out_mutex);
    *_out << line;
    _out->flush();
}

void logger::failed_to_log(std::exception_ptr ex, fmt::string_view fmt) noexcept
{
    try {
        sstring what = "unknown exception";
        try {
            std::rethrow_exception(ex);
        } catch (const std::exception& e) {
            what = e.what();
        }
        do_log(log_level::error, fmt::format("failed to log message: fmt='{}': {}", fmt, what));
    } catch (...) {
        ++logging_failures;
    }
}

void
logger::set_ostream(std::ostream& out) noexcept {
    std::lock_guard<std::mutex> g(_out_mutex);
    _out = &out;
}

void
logger::set_ostream_enabled(bool enabled) noexcept {
    _ostream.store(enabled, std::memory_order_relaxed);
}

void
logger_registry::set_all_loggers_level(log_level level) {
    std::lock_guard<std::mutex> g(_mutex);
    for (auto&& [name, l] : _loggers) {
        l->set_level(level);
    }
}

log_level
logger_registry::get_logger_level(sstring name) const {
    std::lock_guard<std::mutex> g(_mutex);
    return _loggers.at(name)->level();
}

void
logger_registry::set_logger_level(sstring name, log_level level) {
    std::lock_guard<std::mutex> g(_mutex);
    _loggers.at(name)->set_level(level);
}

std::vector<sstring>
logger_registry::get_all_logger_names() {
    std::lock_guard<std::mutex> g(_mutex);
    std::vector<sstring> ret;
    ret.reserve(_loggers.size());
    for (auto&& [name, l] : _loggers) {
        ret.push_back(name);
    }
    return ret;
}

void
logger_registry::register_logger(logger* l) {
    std::lock_guard<std::mutex> g(_mutex);
    if (_loggers.find(l->name()) != _loggers.end()) {
        throw std::runtime_error(fmt::format("Logger '{}' registered twice", l->name()));
    }
    _loggers[l->name()] = l;
}

void
logger_registry::unregister_logger(logger* l) {
    std::lock_guard<std::mutex> g(_mutex);
    _loggers.erase(l->name());
}

void
logger_registry::moved(logger* from, logger* to) {
    std::lock_guard<std::mutex> g(_mutex);
    _loggers[from->name()] = to;
}

logger_registry& global_logger_registry() {
    static logger_registry g_registry;
    return g_registry;
}

void apply_logging_settings(const logging_settings& s) {
    global_logger_registry().set_all_loggers_level(s.default_level);

    for (const auto& pair : s.logger_levels) {
        try {
            global_logger_registry().set_logger_level(pair.first, pair.second);
        } catch (const std::out_of_range&) {
            throw std::runtime_error(
                        fmt::format("Unknown logger '{}'. Use --help-loggers to list available loggers.",
                                    pair.first));
        }
    }

    logger::set_ostream_enabled(s.stdout_enabled);
}

namespace log_cli {

namespace bpo = boost::program_options;

log_level parse_log_level(const sstring& s) {
    try {
        return boost::lexical_cast<log_level>(s.c_str());
    } catch (const boost::bad_lexical_cast&) {
        throw std::runtime_error(fmt::format("Unknown log level '{}'", s));
    }
}

void parse_map_associations(const std::string& v, std::function<void(std::string, std::string)> consume_key_value) {
    static const std::regex colon(":");

    std::sregex_token_iterator s(v.begin(), v.end(), colon, -1);
    const std::sregex_token_iterator e;
    while (s != e) {
        const sstring p = std::string(*s++);

        const auto i = p.find('=');
        if (i == sstring::npos) {
            throw bpo::invalid_option_value(p);
        }

        auto k = p.substr(0, i);
        auto v = p.substr(i + 1, p.size());
        consume_key_value(std::move(k), std::move(v));
    };
}

bpo::options_description get_options_description() {
    bpo::options_description opts("Logging options");
    opts.add_options()
        ("default-log-level", bpo::value<sstring>()->default_value("info"),
             "Default log level for log messages. Valid values are trace, debug, info, warn, error.")
        ("logger-log-level", bpo::value<std::vector<sstring>>(),
             "Map of logger name to log level. The format is \"NAME0=LEVEL0[:NAME1=LEVEL1:...]\". "
             "Valid logger names can be queried with --help-loggers. "
             "Valid values for levels are trace, debug, info, warn, error. "
             "This option can be specified multiple times.")
        ("log-to-stdout", bpo::value<bool>()->default_value(true), "Send log output to the output stream")
        ("help-loggers", bpo::bool_switch(), "Print a list of logger names and exit.");
    return opts;
}

void print_available_loggers(std::ostream& os) {
    auto names = global_logger_registry().get_all_logger_names();
    // For quick searching by humans.
    std::sort(names.begin(), names.end());

    os << "Available loggers:\n";

    for (auto&& name : names) {
        os << "    " << name << '\n';
    }
}

logging_settings extract_settings(const bpo::variables_map& vars) {
    logging_settings settings{
        {},
        parse_log_level(vars["default-log-level"].as<sstring>()),
        vars["log-to-stdout"].as<bool>(),
    };
    if (vars.count("logger-log-level")) {
        for (auto&& arg : vars["logger-log-level"].as<std::vector<sstring>>()) {
            parse_map_associations(arg, [&settings] (std::string k, std::string v) {
                settings.logger_levels[std::move(k)] = parse_log_level(v);
            });
        }
    }
    return settings;
}

}

}
