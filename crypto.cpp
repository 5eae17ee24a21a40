#include "crypto.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <iostream>
#include <vector>

namespace crypto {

    static const size_t COUNTER_SIZE = 8;

    bool sha256(const uint8_t* data, size_t len, Digest& outDigest)
    {
        unsigned int mdLen = 0;
        if (EVP_Digest(data, len, outDigest.data(), &mdLen, EVP_sha256(), nullptr) != 1
            || mdLen != DIGEST_SIZE)
        {
            std::cerr << "[crypto] EVP_Digest sha256 failed\n";
            return false;
        }
        return true;
    }

    bool deriveSeed(const std::string& domain, const std::string& key, Digest& outSeed)
    {
        std::vector<uint8_t> material;
        material.reserve(domain.size() + key.size());
        material.insert(material.end(), domain.begin(), domain.end());
        material.insert(material.end(), key.begin(), key.end());
        return sha256(material.data(), material.size(), outSeed);
    }

    KeyStream::KeyStream(const Digest& seed)
        : _seed(seed), _block(), _counter(0), _offset(DIGEST_SIZE)
    {
    }

    bool KeyStream::refill()
    {
        uint8_t input[DIGEST_SIZE + COUNTER_SIZE];
        for (size_t i = 0; i < DIGEST_SIZE; ++i) {
            input[i] = _seed[i];
        }
        // counter, big-endian
        for (size_t i = 0; i < COUNTER_SIZE; ++i) {
            input[DIGEST_SIZE + i] = static_cast<uint8_t>(_counter >> (8 * (COUNTER_SIZE - 1 - i)));
        }

        if (!sha256(input, sizeof(input), _block)) {
            return false;
        }
        ++_counter;
        _offset = 0;
        return true;
    }

    bool KeyStream::nextWord(uint32_t& outWord)
    {
        if (_offset + 4 > DIGEST_SIZE && !refill()) {
            return false;
        }

        outWord = (static_cast<uint32_t>(_block[_offset]) << 24)
                | (static_cast<uint32_t>(_block[_offset + 1]) << 16)
                | (static_cast<uint32_t>(_block[_offset + 2]) << 8)
                |  static_cast<uint32_t>(_block[_offset + 3]);
        _offset += 4;
        return true;
    }

    bool KeyStream::uniform(uint32_t bound, uint32_t& outValue)
    {
        if (bound == 0) {
            std::cerr << "[crypto] uniform() needs a non-zero bound\n";
            return false;
        }

        // 拒绝采样，去掉取模偏差: threshold = 2^32 mod bound
        const uint32_t threshold = (0u - bound) % bound;
        uint32_t word = 0;
        do {
            if (!nextWord(word)) {
                return false;
            }
        } while (word < threshold);

        outValue = word % bound;
        return true;
    }

    bool randomBytes(uint8_t* buf, size_t len)
    {
        if (RAND_bytes(buf, static_cast<int>(len)) != 1) {
            std::cerr << "[crypto] RAND_bytes failed\n";
            return false;
        }
        return true;
    }

}
