#pragma once
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

#include <spdlog/fmt/fmt.h>

enum class TraceOpType { Set, Get, Del };

// one line of a trace file
struct TraceOp {
    TraceOpType type;
    std::string key;
    std::string value; // Set only
    size_t line = 0;

    std::string to_string() const;
};

class TraceError : public std::runtime_error {
    public:
    TraceError(size_t line, const std::string& msg)
        : std::runtime_error(fmt::format("line {}: {}", line, msg)), m_line(line) {}

    size_t line() const { return m_line; }

    private:
    size_t m_line;
};

// parse a single line, std::nullopt for blank lines and comments, throws TraceError if malformed
std::optional<TraceOp> parse_trace_line(const std::string& line, size_t lineno);

// reads trace ops line by line:
//   set <key> <value...>
//   get <key>
//   del <key>
//   # comment
class TraceReader {
    public:
    explicit TraceReader(const std::filesystem::path& fname);

    // next op or std::nullopt at EOF; with skip_errors malformed lines are logged and skipped
    std::optional<TraceOp> next(bool skip_errors = false);

    // call func for every op, returns number of ops
    size_t for_each(const std::function<void(const TraceOp&)>& func, bool skip_errors = false);

    size_t lines_read() const { return m_lineno; }
    size_t lines_skipped() const { return m_skipped; }

    private:
    std::filesystem::path m_fname;
    std::ifstream m_file;
    size_t m_lineno = 0;
    size_t m_skipped = 0;
};
