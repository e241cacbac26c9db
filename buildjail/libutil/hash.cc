#include "buildjail/libutil/hash.hh"

namespace buildjail {

const std::string base16Chars = "0123456789abcdef";


static std::string printHash16(const Hash & hash)
{
    std::string buf;
    buf.reserve(hash.base16Len());
    for (unsigned int i = 0; i < hash.hashSize; i++) {
        buf.push_back(base16Chars[hash.hash[i] >> 4]);
        buf.push_back(base16Chars[hash.hash[i] & 0x0f]);
    }
    return buf;
}


// omitted: E O U T
const std::string base32Chars = "0123456789abcdfghijklmnpqrsvwxyz";


static std::string printHash32(const Hash & hash)
{
    size_t len = hash.base32Len();

    std::string s;
    s.reserve(len);

    for (int n = (int) len - 1; n >= 0; n--) {
        unsigned int b = n * 5;
        unsigned int i = b / 8;
        unsigned int j = b % 8;
        unsigned char c =
            (hash.hash[i] >> j)
            | (i >= hash.hashSize - 1 ? 0 : hash.hash[i + 1] << (8 - j));
        s.push_back(base32Chars[c & 0x1f]);
    }

    return s;
}


std::string Hash::to_string(HashFormat format, bool includeType) const
{
    std::string s;
    if (includeType) {
        s += printHashType(type);
        s += ':';
    }
    switch (format) {
    case HashFormat::Base16:
        s += printHash16(*this);
        break;
    case HashFormat::Base32:
        s += printHash32(*this);
        break;
    }
    return s;
}


static detail::EvpMdCtxPtr start(HashType ht)
{
    detail::EvpMdCtxPtr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) {
        throw Error("failed to create message digest context");
    }

    int ok = 0;
    switch (ht) {
    case HashType::SHA256: ok = EVP_DigestInit_ex(ctx.get(), EVP_sha256(), NULL); break;
    case HashType::SHA512: ok = EVP_DigestInit_ex(ctx.get(), EVP_sha512(), NULL); break;
    }
    if (!ok) {
        throw Error("failed to initialize message digest");
    }

    return ctx;
}


Hash hashString(HashType ht, std::string_view s)
{
    Hash hash(ht);
    detail::EvpMdCtxPtr ctx = start(ht);
    if (!EVP_DigestUpdate(ctx.get(), s.data(), s.size())) {
        throw Error("failed to update message digest with %zu bytes", s.size());
    }
    if (!EVP_DigestFinal_ex(ctx.get(), hash.hash, NULL)) {
        throw Error("failed to finalize message digest");
    }
    return hash;
}


Hash compressHash(const Hash & hash, size_t newSize)
{
    Hash h(hash.type);
    h.hashSize = newSize;
    for (unsigned int i = 0; i < hash.hashSize; ++i)
        h.hash[i % newSize] ^= hash.hash[i];
    return h;
}


std::string_view printHashType(HashType ht)
{
    switch (ht) {
    case HashType::SHA256: return "sha256";
    case HashType::SHA512: return "sha512";
    }
    abort();
}

}
