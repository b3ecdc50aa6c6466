#include "secret_scope.hpp"
#include <cstdlib>
#include <cstring>
#include <cerrno>
#include <stdexcept>
#include <utility>

SecretScope::SecretScope(const std::map<std::string, std::string>& secrets) {
    for (const auto& [name, value] : secrets) {
        std::optional<std::string> previous;
        if (const char* current = std::getenv(name.c_str())) {
            previous = current;
        }
        if (setenv(name.c_str(), value.c_str(), 1) != 0) {
            int err = errno;
            restore();
            throw std::runtime_error("Failed to set environment variable " + name + ": " + std::strerror(err));
        }
        saved_.emplace_back(name, std::move(previous));
    }
}

SecretScope::~SecretScope() {
    restore();
}

void SecretScope::restore() noexcept {
    for (auto it = saved_.rbegin(); it != saved_.rend(); ++it) {
        if (it->second) {
            setenv(it->first.c_str(), it->second->c_str(), 1);
        } else {
            unsetenv(it->first.c_str());
        }
    }
    saved_.clear();
}
