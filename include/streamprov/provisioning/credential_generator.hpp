// StreamProv - Dedicated stream provisioning service
// Stream credential generation
//
// Secrets are drawn from OpenSSL's CSPRNG over [a-zA-Z0-9] and always
// contain at least one lowercase letter, one uppercase letter and one
// digit.

#ifndef STREAMPROV_PROVISIONING_CREDENTIAL_GENERATOR_HPP
#define STREAMPROV_PROVISIONING_CREDENTIAL_GENERATOR_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "streamprov/core/result.hpp"

namespace streamprov {
namespace provisioning {

constexpr size_t MIN_SECRET_LENGTH = 16;

struct CredentialError {
    enum class Code {
        None,
        InvalidLength,
        RandomSourceFailed
    };

    Code code = Code::None;
    std::string message;

    CredentialError() = default;
    CredentialError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
};

struct StreamCredentials {
    std::string sourcePassword;
    std::string adminPassword;
};

class CredentialGenerator {
public:
    explicit CredentialGenerator(size_t length = MIN_SECRET_LENGTH);

    /**
     * @brief One secret of the configured length.
     */
    core::Result<std::string, CredentialError> generateSecret();

    /**
     * @brief Two independent secrets for a new stream.
     */
    core::Result<StreamCredentials, CredentialError> generate();

    size_t length() const { return length_; }

private:
    /**
     * @brief Uniform index in [0, bound) by rejection sampling.
     */
    core::Result<size_t, CredentialError> uniformIndex(size_t bound);

    core::Result<void, CredentialError> refill();

    size_t length_;
    std::vector<uint8_t> pool_;
    size_t poolPos_ = 0;
};

} // namespace provisioning
} // namespace streamprov

#endif // STREAMPROV_PROVISIONING_CREDENTIAL_GENERATOR_HPP
