/**
 * @file Pbkdf2PasswordHasher.hpp
 * @brief PBKDF2-HMAC-SHA256 vault credentials backed by OpenSSL.
 */

#pragma once

#include "domain/VaultCredential.hpp"

namespace quietledger::infrastructure {

class Pbkdf2PasswordHasher : public domain::PasswordHasher {
public:
    static constexpr int kSaltLength = 16;
    static constexpr int kKeyLength = 32;

    explicit Pbkdf2PasswordHasher(int iterations = 100000);

    /** @throws std::runtime_error if OpenSSL cannot produce a salt or key. */
    domain::VaultCredential derive(const std::string& password) override;

    bool verify(const std::string& password, const domain::VaultCredential& credential) override;

private:
    int m_iterations;
};

} // namespace quietledger::infrastructure
