// StreamProv - Dedicated stream provisioning service
// Stream credential generation implementation

#include "streamprov/provisioning/credential_generator.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <utility>

namespace streamprov {
namespace provisioning {

using core::Result;

namespace {

const char LOWERCASE[] = "abcdefghijklmnopqrstuvwxyz";
const char UPPERCASE[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ";
const char DIGITS[] = "0123456789";
const char ALPHABET[] = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";

constexpr size_t LOWERCASE_SIZE = sizeof(LOWERCASE) - 1;
constexpr size_t UPPERCASE_SIZE = sizeof(UPPERCASE) - 1;
constexpr size_t DIGITS_SIZE = sizeof(DIGITS) - 1;
constexpr size_t ALPHABET_SIZE = sizeof(ALPHABET) - 1;

constexpr size_t POOL_SIZE = 64;

std::string opensslErrorText() {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return "RAND_bytes failed";
    }
    char buffer[256];
    ERR_error_string_n(code, buffer, sizeof(buffer));
    return buffer;
}

} // anonymous namespace

CredentialGenerator::CredentialGenerator(size_t length)
    : length_(length)
{
}

Result<void, CredentialError> CredentialGenerator::refill() {
    pool_.resize(POOL_SIZE);
    if (RAND_bytes(pool_.data(), static_cast<int>(pool_.size())) != 1) {
        pool_.clear();
        poolPos_ = 0;
        return Result<void, CredentialError>::error(
            CredentialError(CredentialError::Code::RandomSourceFailed, opensslErrorText()));
    }
    poolPos_ = 0;
    return Result<void, CredentialError>::success();
}

Result<size_t, CredentialError> CredentialGenerator::uniformIndex(size_t bound) {
    // Bytes at or above the largest multiple of bound would bias the result.
    const size_t limit = 256 - (256 % bound);
    while (true) {
        if (poolPos_ >= pool_.size()) {
            auto refilled = refill();
            if (refilled.isError()) {
                return Result<size_t, CredentialError>::error(refilled.error());
            }
        }
        size_t byte = pool_[poolPos_++];
        if (byte < limit) {
            return Result<size_t, CredentialError>::success(byte % bound);
        }
    }
}

Result<std::string, CredentialError> CredentialGenerator::generateSecret() {
    if (length_ < MIN_SECRET_LENGTH) {
        return Result<std::string, CredentialError>::error(
            CredentialError(CredentialError::Code::InvalidLength,
                            "Secrets must be at least " + std::to_string(MIN_SECRET_LENGTH) +
                            " characters"));
    }

    std::string secret;
    secret.reserve(length_);

    const std::pair<const char*, size_t> required[] = {
        {LOWERCASE, LOWERCASE_SIZE},
        {UPPERCASE, UPPERCASE_SIZE},
        {DIGITS, DIGITS_SIZE},
    };
    for (const auto& charset : required) {
        auto index = uniformIndex(charset.second);
        if (index.isError()) {
            return Result<std::string, CredentialError>::error(index.error());
        }
        secret.push_back(charset.first[index.value()]);
    }

    while (secret.size() < length_) {
        auto index = uniformIndex(ALPHABET_SIZE);
        if (index.isError()) {
            return Result<std::string, CredentialError>::error(index.error());
        }
        secret.push_back(ALPHABET[index.value()]);
    }

    // Fisher-Yates, so the guaranteed characters land anywhere.
    for (size_t i = secret.size() - 1; i > 0; --i) {
        auto j = uniformIndex(i + 1);
        if (j.isError()) {
            return Result<std::string, CredentialError>::error(j.error());
        }
        std::swap(secret[i], secret[j.value()]);
    }

    return Result<std::string, CredentialError>::success(std::move(secret));
}

Result<StreamCredentials, CredentialError> CredentialGenerator::generate() {
    auto source = generateSecret();
    if (source.isError()) {
        return Result<StreamCredentials, CredentialError>::error(source.error());
    }
    auto admin = generateSecret();
    if (admin.isError()) {
        return Result<StreamCredentials, CredentialError>::error(admin.error());
    }

    StreamCredentials credentials;
    credentials.sourcePassword = std::move(source.value());
    credentials.adminPassword = std::move(admin.value());
    return Result<StreamCredentials, CredentialError>::success(std::move(credentials));
}

} // namespace provisioning
} // namespace streamprov
