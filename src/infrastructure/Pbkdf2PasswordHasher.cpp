#include "infrastructure/Pbkdf2PasswordHasher.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace quietledger::infrastructure {

namespace {

using byte_vec = std::vector<unsigned char>;

std::string ToHex(const byte_vec& bytes) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (unsigned char b : bytes) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

bool FromHex(const std::string& hex, byte_vec& out) {
    if (hex.size() % 2 != 0) return false;
    out.clear();
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        try {
            out.push_back(static_cast<unsigned char>(std::stoi(hex.substr(i, 2), nullptr, 16)));
        } catch (const std::exception&) {
            return false;
        }
    }
    return true;
}

byte_vec DeriveKey(const std::string& password, const byte_vec& salt, int iterations, size_t keyLength) {
    byte_vec key(keyLength);
    int ok = PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                               salt.data(), static_cast<int>(salt.size()),
                               iterations, EVP_sha256(),
                               static_cast<int>(key.size()), key.data());
    if (ok != 1) {
        throw std::runtime_error("PBKDF2 key derivation failed.");
    }
    return key;
}

} // namespace

Pbkdf2PasswordHasher::Pbkdf2PasswordHasher(int iterations) : m_iterations(iterations) {
    if (m_iterations < 1) {
        throw std::invalid_argument("Pbkdf2PasswordHasher: iterations must be positive.");
    }
}

domain::VaultCredential Pbkdf2PasswordHasher::derive(const std::string& password) {
    byte_vec salt(kSaltLength);
    if (RAND_bytes(salt.data(), static_cast<int>(salt.size())) != 1) {
        throw std::runtime_error("Could not generate a random salt.");
    }

    domain::VaultCredential credential;
    credential.saltHex = ToHex(salt);
    credential.hashHex = ToHex(DeriveKey(password, salt, m_iterations, kKeyLength));
    credential.iterations = m_iterations;
    return credential;
}

bool Pbkdf2PasswordHasher::verify(const std::string& password, const domain::VaultCredential& credential) {
    byte_vec salt;
    byte_vec expected;
    if (!FromHex(credential.saltHex, salt) || !FromHex(credential.hashHex, expected) ||
        expected.empty() || credential.iterations < 1) {
        std::cerr << "[Pbkdf2PasswordHasher] Stored credential is malformed." << std::endl;
        return false;
    }

    byte_vec actual = DeriveKey(password, salt, credential.iterations, expected.size());
    return CRYPTO_memcmp(actual.data(), expected.data(), expected.size()) == 0;
}

} // namespace quietledger::infrastructure
