/**
 * @file Trace.cpp
 * @brief Parsing of cache access trace files.
 */

#include "Trace.hpp"
#include "utils/common.hpp"

static const char* WHITESPACE = " \t\r";

std::string TraceOp::to_string() const {
    switch (type) {
        case TraceOpType::Set: return fmt::format("set {} {}", key, value);
        case TraceOpType::Get: return fmt::format("get {}", key);
        case TraceOpType::Del: return fmt::format("del {}", key);
    }
    return "?";
}

// split off the next whitespace-delimited token starting at pos
static std::string next_token(const std::string& line, size_t& pos) {
    size_t start = line.find_first_not_of(WHITESPACE, pos);
    if (start == std::string::npos) {
        pos = line.size();
        return "";
    }
    size_t end = line.find_first_of(WHITESPACE, start);
    if (end == std::string::npos) {
        end = line.size();
    }
    pos = end;
    return line.substr(start, end - start);
}

std::optional<TraceOp> parse_trace_line(const std::string& line, size_t lineno) {
    size_t pos = 0;
    std::string op = next_token(line, pos);
    if (op.empty() || op[0] == '#') {
        return std::nullopt;
    }

    TraceOp result;
    result.line = lineno;
    if (op == "set") {
        result.type = TraceOpType::Set;
    } else if (op == "get") {
        result.type = TraceOpType::Get;
    } else if (op == "del") {
        result.type = TraceOpType::Del;
    } else {
        throw TraceError(lineno, fmt::format("unknown operation \"{}\"", op));
    }

    result.key = next_token(line, pos);
    if (result.key.empty()) {
        throw TraceError(lineno, fmt::format("\"{}\" without a key", op));
    }

    if (result.type == TraceOpType::Set) {
        // value is the rest of the line, inner whitespace preserved
        size_t start = line.find_first_not_of(WHITESPACE, pos);
        if (start == std::string::npos) {
            throw TraceError(lineno, fmt::format("\"set {}\" without a value", result.key));
        }
        size_t end = line.find_last_not_of(WHITESPACE);
        result.value = line.substr(start, end - start + 1);
    } else if (!next_token(line, pos).empty()) {
        throw TraceError(lineno, fmt::format("trailing garbage after \"{} {}\"", op, result.key));
    }

    return result;
}

TraceReader::TraceReader(const std::filesystem::path& fname) : m_fname(fname), m_file(fname) {
    if (!m_file.is_open()) {
        throw std::runtime_error(fmt::format("Cannot open trace file {}", fname));
    }
}

std::optional<TraceOp> TraceReader::next(bool skip_errors) {
    std::string line;
    while (std::getline(m_file, line)) {
        m_lineno++;
        try {
            auto op = parse_trace_line(line, m_lineno);
            if (op) {
                return op;
            }
        } catch (const TraceError& e) {
            if (!skip_errors) {
                throw;
            }
            m_skipped++;
            logger->warn("{}: {}, skipped", m_fname, e.what());
        }
    }
    if (m_file.bad()) {
        throw std::runtime_error(fmt::format("Error reading trace file {}", m_fname));
    }
    return std::nullopt;
}

size_t TraceReader::for_each(const std::function<void(const TraceOp&)>& func, bool skip_errors) {
    size_t n = 0;
    while (auto op = next(skip_errors)) {
        func(*op);
        n++;
    }
    return n;
}
