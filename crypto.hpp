#ifndef CRYPTO_HPP
#define CRYPTO_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace crypto {

    static const size_t DIGEST_SIZE = 32; // SHA-256

    typedef std::array<uint8_t, DIGEST_SIZE> Digest;

    bool sha256(const uint8_t* data, size_t len, Digest& outDigest);

    // 从 stego-key 派生 seed: SHA-256(domain || key)
    bool deriveSeed(const std::string& domain, const std::string& key, Digest& outSeed);

    // Deterministic keystream: block i = SHA-256(seed || uint64_be(i)),
    // consumed as big-endian 32-bit words. Same seed -> same words on
    // every platform.
    class KeyStream
    {
      public:
        explicit KeyStream(const Digest& seed);

        bool nextWord(uint32_t& outWord);

        // Unbiased value in [0, bound), bound >= 1.
        bool uniform(uint32_t bound, uint32_t& outValue);

      private:
        bool refill();

        Digest   _seed;
        Digest   _block;
        uint64_t _counter;
        size_t   _offset;
    };

    // 真随机（OpenSSL RAND_bytes），和 KeyStream 完全独立
    bool randomBytes(uint8_t* buf, size_t len);
}

#endif
