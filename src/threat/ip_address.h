#pragma once

/**
 * @file ip_address.h
 * @brief IPv4/IPv6 주소 및 CIDR 범위
 *
 * inet_pton 기반 파싱. IPv4-mapped IPv6(::ffff:a.b.c.d)는 IPv4로 접습니다.
 */

#include <array>
#include <optional>
#include <string>
#include <cstdint>
#include <cstddef>

namespace shortline::threat {

/**
 * @brief IP 주소 (네트워크 바이트 순서)
 */
struct IpAddress {
    enum class Family : uint8_t { V4, V6 };

    Family family{Family::V4};
    std::array<uint8_t, 16> bytes{};   ///< V4는 앞 4바이트만 사용

    /**
     * @brief 문자열 파싱 (앞뒤 공백 허용, 실패 시 std::nullopt)
     */
    static std::optional<IpAddress> parse(const std::string& text);

    /// 정규화된 문자열 표현 (inet_ntop)
    [[nodiscard]] std::string toString() const;

    [[nodiscard]] size_t byteLength() const { return family == Family::V4 ? 4 : 16; }
    [[nodiscard]] int bitLength() const { return family == Family::V4 ? 32 : 128; }

    bool operator==(const IpAddress& other) const {
        return family == other.family && bytes == other.bytes;
    }
};

/**
 * @brief CIDR 범위 (네트워크 주소는 프리픽스로 마스킹되어 저장)
 */
struct CidrRange {
    IpAddress network;
    int prefix_length{0};

    /**
     * @brief "a.b.c.d/n" 또는 "x::y/n" 파싱 (실패 시 std::nullopt)
     */
    static std::optional<CidrRange> parse(const std::string& text);

    /// 주소 포함 여부 (주소 체계가 다르면 false)
    [[nodiscard]] bool contains(const IpAddress& addr) const;

    [[nodiscard]] std::string toString() const;
};

/// 앞뒤 공백 제거
std::string trim(const std::string& s);

} // namespace shortline::threat
