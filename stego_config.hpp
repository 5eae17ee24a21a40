#ifndef STEGO_CONFIG_HPP
#define STEGO_CONFIG_HPP

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace svgstego {

    // 长度 header：32 bit, big-endian, 记录 payload 的 bit 数
    constexpr size_t HEADER_BITS = 32;

    constexpr size_t BITS_PER_BYTE = 8;

    // tag -> 该 tag 里可以藏数据的属性（顺序固定）
    typedef std::map<std::string, std::vector<std::string>> TagAttributeMap;

    const TagAttributeMap& defaultEmbedTags();

    constexpr const char* SVG_NAMESPACE = "http://www.w3.org/2000/svg";

    // 只接受这些 SVG DTD 的 system id
    const std::vector<std::string>& validDoctypes();

    // Domain tag mixed into the key before hashing. Changing it changes
    // every permutation, so bump the suffix together with the algorithm.
    constexpr const char* PERMUTATION_DOMAIN = "svgstego-perm-v1";
}

#endif
