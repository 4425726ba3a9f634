#pragma once

/**
 * @file geo_resolver.h
 * @brief IP → 지리 정보 조회 (MaxMind .mmdb, 선택 사항)
 *
 * 데이터베이스가 없거나 열 수 없으면 항상 빈 결과를 반환하는 no-op 모드로
 * 동작합니다. 조회는 예외를 던지지 않습니다.
 */

#include <memory>
#include <string>

namespace shortline::geo {

/**
 * @brief 조회 결과 (알 수 없으면 빈 문자열 / 0)
 */
struct GeoResult {
    std::string country;    ///< ISO 3166-1 alpha-2
    std::string city;
    std::string region;     ///< 첫 번째 행정 구역
    double latitude{0.0};
    double longitude{0.0};
};

class GeoResolver {
public:
    /**
     * @param db_path .mmdb 경로 (빈 문자열이면 no-op)
     */
    explicit GeoResolver(const std::string& db_path = "");
    ~GeoResolver();

    // 복사 금지
    GeoResolver(const GeoResolver&) = delete;
    GeoResolver& operator=(const GeoResolver&) = delete;

    /**
     * @brief IP 조회
     */
    [[nodiscard]] GeoResult lookup(const std::string& ip) const;

    /**
     * @brief 데이터베이스 사용 가능 여부
     */
    [[nodiscard]] bool isEnabled() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace shortline::geo
