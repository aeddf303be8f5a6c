#pragma once
#include <stdexcept>
#include <string>

namespace Cache {

// indexed read of a key which is not in the cache
class KeyNotFoundError : public std::out_of_range {
    public:
    explicit KeyNotFoundError(const std::string& msg = "key not found in cache") : std::out_of_range(msg) {}
};

// node/map/list coupling is broken, never expected with correct use of the public API
class InvalidStateError : public std::logic_error {
    public:
    explicit InvalidStateError(const std::string& msg) : std::logic_error(msg) {}
};

} // namespace Cache
