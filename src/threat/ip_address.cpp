/**
 * @file ip_address.cpp
 * @brief IP 주소 / CIDR 파싱 및 포함 판정
 */

#include "ip_address.h"

#include <arpa/inet.h>

#include <cctype>
#include <cstring>

namespace shortline::threat {

namespace {

constexpr uint8_t kV4MappedPrefix[12] = {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0xff, 0xff};

/// 프리픽스 이후 비트를 0으로
void maskBytes(std::array<uint8_t, 16>& bytes, size_t length, int prefix) {
    for (size_t i = 0; i < length; ++i) {
        int bit_start = static_cast<int>(i) * 8;
        if (bit_start >= prefix) {
            bytes[i] = 0;
        } else if (prefix - bit_start < 8) {
            bytes[i] &= static_cast<uint8_t>(0xff << (8 - (prefix - bit_start)));
        }
    }
}

bool parsePrefix(const std::string& text, int& out) {
    if (text.empty() || text.size() > 3) return false;
    int value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        value = value * 10 + (c - '0');
    }
    out = value;
    return true;
}

} // namespace

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

// ============================================================
// IpAddress
// ============================================================

std::optional<IpAddress> IpAddress::parse(const std::string& text) {
    std::string s = trim(text);
    if (s.empty()) return std::nullopt;

    IpAddress addr;
    if (s.find(':') == std::string::npos) {
        in_addr v4{};
        if (inet_pton(AF_INET, s.c_str(), &v4) != 1) return std::nullopt;
        addr.family = Family::V4;
        std::memcpy(addr.bytes.data(), &v4, 4);
        return addr;
    }

    in6_addr v6{};
    if (inet_pton(AF_INET6, s.c_str(), &v6) != 1) return std::nullopt;

    if (std::memcmp(&v6, kV4MappedPrefix, sizeof(kV4MappedPrefix)) == 0) {
        addr.family = Family::V4;
        std::memcpy(addr.bytes.data(), reinterpret_cast<const uint8_t*>(&v6) + 12, 4);
        return addr;
    }

    addr.family = Family::V6;
    std::memcpy(addr.bytes.data(), &v6, 16);
    return addr;
}

std::string IpAddress::toString() const {
    char buf[INET6_ADDRSTRLEN] = {0};
    if (family == Family::V4) {
        inet_ntop(AF_INET, bytes.data(), buf, sizeof(buf));
    } else {
        inet_ntop(AF_INET6, bytes.data(), buf, sizeof(buf));
    }
    return buf;
}

// ============================================================
// CidrRange
// ============================================================

std::optional<CidrRange> CidrRange::parse(const std::string& text) {
    std::string s = trim(text);
    auto slash = s.find('/');
    if (slash == std::string::npos) return std::nullopt;

    auto addr = IpAddress::parse(s.substr(0, slash));
    if (!addr) return std::nullopt;

    int prefix = 0;
    if (!parsePrefix(s.substr(slash + 1), prefix)) return std::nullopt;

    // IPv4-mapped 표기였다면 프리픽스도 IPv4 기준으로
    bool mapped_v4 = addr->family == IpAddress::Family::V4 &&
                     s.substr(0, slash).find(':') != std::string::npos;
    if (mapped_v4) {
        if (prefix < 96) return std::nullopt;
        prefix -= 96;
    }

    if (prefix < 0 || prefix > addr->bitLength()) return std::nullopt;

    CidrRange range;
    range.network = *addr;
    range.prefix_length = prefix;
    maskBytes(range.network.bytes, range.network.byteLength(), prefix);
    return range;
}

bool CidrRange::contains(const IpAddress& addr) const {
    if (addr.family != network.family) return false;

    int full_bytes = prefix_length / 8;
    if (std::memcmp(addr.bytes.data(), network.bytes.data(), static_cast<size_t>(full_bytes)) != 0) {
        return false;
    }

    int rem = prefix_length % 8;
    if (rem == 0) return true;

    auto mask = static_cast<uint8_t>(0xff << (8 - rem));
    return (addr.bytes[full_bytes] & mask) == (network.bytes[full_bytes] & mask);
}

std::string CidrRange::toString() const {
    return network.toString() + "/" + std::to_string(prefix_length);
}

} // namespace shortline::threat
