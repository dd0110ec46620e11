#include "hmac_signer.H"

#include "common/errors.H"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace kestrel::oe {

HmacSigner::HmacSigner(std::string api_key, std::string api_secret)
    : key(std::move(api_key)), secret(std::move(api_secret)) {}

std::string HmacSigner::sign(const std::string& payload) const {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    unsigned char* result = HMAC(EVP_sha256(),
        secret.data(), static_cast<int>(secret.size()),
        reinterpret_cast<const unsigned char*>(payload.data()), payload.size(),
        digest, &digest_len);
    if (result == nullptr) {
        throw ExchangeError(EXCHANGE_ERROR::AUTH, "HMAC signing failed");
    }

    std::ostringstream out;
    for (unsigned int i = 0; i < digest_len; i++) {
        out << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return out.str();
}

HmacSigner HmacSigner::from_environment(const std::string& key_variable, const std::string& secret_variable) {
    const char* api_key = std::getenv(key_variable.c_str());
    const char* api_secret = std::getenv(secret_variable.c_str());
    if (api_key == nullptr || *api_key == '\0') {
        throw ExchangeError(EXCHANGE_ERROR::AUTH, "environment variable " + key_variable + " is not set");
    }
    if (api_secret == nullptr || *api_secret == '\0') {
        throw ExchangeError(EXCHANGE_ERROR::AUTH, "environment variable " + secret_variable + " is not set");
    }
    return HmacSigner(api_key, api_secret);
}

} // namespace kestrel::oe
