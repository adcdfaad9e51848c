#include "crypto/Hash.hpp"

#include <sodium.h>
#include <sstream>
#include <iomanip>
#include <mutex>
#include <stdexcept>

using namespace cw::crypto;

void Hash::ensureInit() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (sodium_init() < 0) throw std::runtime_error("[Hash] libsodium initialization failed");
    });
}

std::string Hash::toHex(const unsigned char* bytes, const size_t len) {
    std::ostringstream result;
    for (size_t i = 0; i < len; ++i)
        result << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(bytes[i]);
    return result.str();
}

std::string Hash::blake2b(const std::string_view data) {
    ensureInit();

    constexpr size_t hash_len = crypto_generichash_BYTES;
    unsigned char hash[hash_len];

    if (crypto_generichash(hash, hash_len,
                           reinterpret_cast<const unsigned char*>(data.data()), data.size(),
                           nullptr, 0) != 0)
        throw std::runtime_error("[Hash] crypto_generichash failed");

    return toHex(hash, hash_len);
}
