#pragma once
///@file

#include <openssl/evp.h>

#include "buildjail/libutil/error.hh"
#include "buildjail/libutil/types.hh"

#include <cassert>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <memory>

namespace buildjail {

namespace detail {

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

}

enum class HashType : char { SHA256, SHA512 };

const size_t sha256HashSize = 32;
const size_t sha512HashSize = 64;

static constexpr size_t regularHashSize(HashType type)
{
    switch (type) {
    case HashType::SHA256:
        return sha256HashSize;
    case HashType::SHA512:
        return sha512HashSize;
    }
    abort();
}

enum class HashFormat : int {
    /// Lowercase hexadecimal.
    Base16,
    /// Base-32 with the alphabet of `base32Chars`.
    Base32,
};

struct Hash
{
    constexpr static size_t maxHashSize = 64;
    size_t hashSize = 0;
    uint8_t hash[maxHashSize] = {};

    HashType type;

    /**
     * Create a zero-filled hash object.
     */
    Hash(size_t hashSize, HashType type) : hashSize(hashSize), type(type)
    {
        assert(hashSize <= maxHashSize);
        memset(hash, 0, maxHashSize);
    }

    Hash(HashType type) : Hash(regularHashSize(type), type) {}

    bool operator==(const Hash & other) const
    {
        return type == other.type && hashSize == other.hashSize
            && memcmp(hash, other.hash, hashSize) == 0;
    }

    size_t base16Len() const
    {
        return hashSize * 2;
    }

    size_t base32Len() const
    {
        return (hashSize * 8 - 1) / 5 + 1;
    }

    /**
     * Return a string representation of the hash, in base-16 or
     * base-32, optionally prefixed by the hash type (e.g.
     * "sha256:").
     */
    std::string to_string(HashFormat format, bool includeType) const;
};

/**
 * Compute the hash of the given string.
 */
Hash hashString(HashType ht, std::string_view s);

/**
 * Compress a hash to the specified number of bytes by cyclically
 * XORing bytes together.
 */
Hash compressHash(const Hash & hash, size_t newSize);

std::string_view printHashType(HashType ht);

}
