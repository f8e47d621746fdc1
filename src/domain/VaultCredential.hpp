/**
 * @file VaultCredential.hpp
 * @brief Salted one-way credential for the vault password.
 */

#pragma once

#include <string>

namespace quietledger::domain {

struct VaultCredential {
    std::string hashHex;
    std::string saltHex;
    int iterations = 0;
};

/**
 * @class PasswordHasher
 * @brief Derives and verifies vault credentials.
 */
class PasswordHasher {
public:
    virtual ~PasswordHasher() = default;

    /** @brief Derives a credential with a fresh random salt. */
    virtual VaultCredential derive(const std::string& password) = 0;

    /** @brief Returns true if the password matches the credential. */
    virtual bool verify(const std::string& password, const VaultCredential& credential) = 0;
};

} // namespace quietledger::domain
