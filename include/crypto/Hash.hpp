#pragma once

#include <string>
#include <string_view>

namespace cw::crypto {

class Hash {
public:
    // Hex encoded BLAKE2b digest (crypto_generichash_BYTES wide).
    static std::string blake2b(std::string_view data);

private:
    static void ensureInit();
    static std::string toHex(const unsigned char* bytes, size_t len);
};

}
