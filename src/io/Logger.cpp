/**
 * @file Logger.cpp
 * @brief Logger wrapper around spdlog.
 *
 * Verbosity mapping, an optional file sink which keeps debug messages while the
 * console stays at the user-selected level, and the session banner.
 */

#include "Logger.hpp"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/fmt/ranges.h> // fmt::join()
#include <algorithm>
#include <fstream>

/**
 * @brief Maps -q/-v counts to spdlog levels.
 *
 * -4 or less: off, -3: critical, -2: error, -1: warn, 0: info, 1: debug, 2+: trace
 */
void Logger::set_verbosity(int verbosity){
    static const level levels[] = {
        spdlog::level::off, spdlog::level::critical, spdlog::level::err, spdlog::level::warn,
        spdlog::level::info, spdlog::level::debug, spdlog::level::trace
    };

    int idx = std::clamp(verbosity + 4, 0, 6);
    m_logger->set_level(levels[idx]);
}

void Logger::set_arguments(int argc, char* argv[]){
    m_arguments.assign(argv, argv + argc);
}

void Logger::set_arguments(const std::vector<std::string>& args){
    m_arguments = args;
}

// not a complete shell quoting, just enough to make the logged command line readable
static std::string quote_if_needed(const std::string& arg) {
    if (arg.empty() || arg.find_first_of(" \t\"") != std::string::npos) {
        return "\"" + arg + "\"";
    }
    return arg;
}

/**
 * @brief Adds a file sink, appending to an existing file.
 *
 * The file sink records DEBUG and above (or TRACE if already enabled), the console
 * keeps the level it had before.
 *
 * @return false if a file is already attached or the file can't be opened.
 */
bool Logger::add_file(const std::filesystem::path& fname) {
    if( !m_fname.empty() ){
        return false;
    }

    std::ofstream file(fname, std::ios::app);
    if( !file.is_open() ){
        m_logger->error("Failed to open log file {}, no log will be saved!", fname);
        return false;
    }
    if( file.tellp() != 0 ){
        file.write("\n\n", 2); // separate sessions
    }
    file.close();

    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(fname.string());
    if( m_logger->level() > spdlog::level::debug ){
        file_sink->set_level(spdlog::level::debug);
        set_console_level(m_logger->level());
        m_logger->set_level(spdlog::level::debug);
    }

    m_logger->sinks().push_back(file_sink);
    m_fname = fname;
    return true;
}

void Logger::start(){
    if( !m_banner.empty() ){
        m_logger->info("{}", m_banner);
    }

    std::vector<std::string> quoted;
    quoted.reserve(m_arguments.size());
    for (const auto& arg : m_arguments) {
        quoted.push_back(quote_if_needed(arg));
    }
    m_logger->info("started as {}", fmt::join(quoted, " "));
    m_logger->info("logging to {}", m_fname.empty() ? "console only" : m_fname.string());
}

// first sink is always the console one
void Logger::set_console_level(level lvl) {
    m_logger->sinks().front()->set_level(lvl);
}

Logger::level Logger::console_level() const {
    return m_logger->sinks().front()->level();
}

int Logger::seen_count(std::string_view format) const {
    std::lock_guard<std::mutex> lock(m_mtx);
    auto it = m_logged_messages.find(format);
    return it == m_logged_messages.end() ? 0 : it->second;
}
