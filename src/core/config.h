#pragma once

/**
 * @file config.h
 * @brief 서비스 설정 (환경 변수 기반)
 */

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace shortline::core {

/**
 * @brief 서비스 전체 설정
 */
struct ServiceConfig {
    std::string db_path{"./shortline.db"};          ///< SQLite 파일 경로
    std::string geoip_path;                         ///< .mmdb 경로 (빈 값이면 지리 정보 없음)
    std::chrono::milliseconds flush_interval{30000};
    size_t buffer_size{50000};
    size_t cache_size{10000};
    std::vector<std::string> domains;               ///< 허용 단축 도메인 (필수, 비어있으면 모두 거부)
    bool threat_feeds_enabled{true};
    bool filter_automated_traffic{true};

    /**
     * @brief 허용 도메인 여부 (대소문자 무시)
     */
    [[nodiscard]] bool isDomainAllowed(const std::string& domain) const;
};

/**
 * @brief 도메인 목록 기준 허용 여부 (빈 목록은 모두 거부)
 */
bool isDomainAllowed(const std::vector<std::string>& domains, const std::string& domain);

/**
 * @brief 환경 변수로 설정 덮어쓰기
 *
 * 해석할 수 없는 값은 무시하고 기존 값을 유지합니다.
 * 0 이하의 크기/간격과 빈 도메인 목록은 오류입니다.
 *
 * @param config 입력 겸 출력
 * @param error 실패 시 메시지
 * @return 성공 여부
 */
bool loadConfigFromEnvironment(ServiceConfig& config, std::string& error);

/**
 * @brief 설정 값 검증
 */
bool validateConfig(const ServiceConfig& config, std::string& error);

/**
 * @brief "500ms", "30s", "5m", "1h", "1m30s" 형식 해석
 * @return 형식 오류 시 std::nullopt
 */
std::optional<std::chrono::milliseconds> parseDuration(const std::string& text);

/**
 * @brief 쉼표 구분 목록 (공백 제거, 빈 항목 제외)
 */
std::vector<std::string> splitList(const std::string& text);

/**
 * @brief "0", "false", "off", "no" → false / "1", "true", "on", "yes" → true
 */
std::optional<bool> parseBool(const std::string& text);

} // namespace shortline::core
