#ifndef STEGO_ERROR_HPP
#define STEGO_ERROR_HPP

namespace svgstego {

    enum class StegoError {
        None,
        InvalidFile,       // path unreadable / missing
        InvalidDocument,   // 不是合法 XML，或 doctype 不在白名单里
        CapacityExceeded,  // embed: bitstring 比 slot 多
        CapacityMismatch,  // extract: header 声明的长度超过 slot 数
        CorruptHeader,     // extract: header 长度不是 8 的倍数
        UsageError
    };

    const char* errorName(StegoError err);

    // 给用户看的一句话说明
    const char* errorMessage(StegoError err);

    // CLI exit status for err (0 for None)
    int exitCodeFor(StegoError err);
}

#endif
