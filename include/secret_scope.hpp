/**
 * @file secret_scope.hpp
 * @brief Scoped export of credentials to the child-process environment.
 *
 * restic reads its repository password and object-storage keys from the environment.
 * SecretScope exports them for exactly as long as the scope lives and restores the
 * previous environment when it is destroyed, including during stack unwinding.
 */

#ifndef SECRET_SCOPE_HPP
#define SECRET_SCOPE_HPP

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <utility>

/**
 * @brief RAII guard for secret environment variables.
 *
 * Not copyable or movable: each scope owns the environment entries it set.
 */
class SecretScope {
public:
    /**
     * @brief Exports every entry into the process environment.
     *
     * @param secrets Variable name to value.
     * @throws std::runtime_error If an entry cannot be set. Entries already set are restored.
     */
    explicit SecretScope(const std::map<std::string, std::string>& secrets);

    ~SecretScope();

    SecretScope(const SecretScope&) = delete;
    SecretScope& operator=(const SecretScope&) = delete;

private:
    void restore() noexcept;

    /// Variable name and its value before the scope was opened, if it had one.
    std::vector<std::pair<std::string, std::optional<std::string>>> saved_;
};

/**
 * @brief Runs a callable with the given secrets exported.
 *
 * @param secrets Variable name to value.
 * @param body Callable to run while the secrets are visible.
 * @return Whatever body returns.
 */
template <typename Body>
auto withSecrets(const std::map<std::string, std::string>& secrets, Body&& body) {
    SecretScope scope(secrets);
    return std::forward<Body>(body)();
}

#endif // SECRET_SCOPE_HPP
