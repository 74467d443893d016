#include "env_config.hpp"

#include <cstdlib>
#include <stdexcept>

std::string getenv_valid(const char* name) {
    const char* v = std::getenv(name);
    if (!v || !*v) {
        throw std::runtime_error(std::string("Missing required env var: ") + name);
    }
    return std::string(v);
}

std::string getenv_or(const char* name, const std::string& fallback) {
    const char* v = std::getenv(name);
    if (!v || !*v) return fallback;
    return std::string(v);
}
