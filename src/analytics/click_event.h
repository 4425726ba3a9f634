#pragma once

/**
 * @file click_event.h
 * @brief 클릭 이벤트 타입 및 영구 저장 싱크 인터페이스
 *
 * RawClickEvent는 리다이렉트 시점에 요청 경로에서 만들어지고,
 * EnrichedClickRecord는 플러시 시점에 수집기 스레드에서 만들어집니다.
 */

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>

namespace shortline::analytics {

/**
 * @brief 리다이렉트 시점의 원시 클릭
 */
struct RawClickEvent {
    int64_t link_id{0};
    std::chrono::system_clock::time_point timestamp{};
    std::string ip;             ///< 클라이언트 IP (포트 제외)
    std::string user_agent;
    std::string referer;        ///< 원본 Referer URL
};

/**
 * @brief 보강된 클릭 레코드 (저장 단위)
 *
 * 알 수 없는 필드는 빈 문자열 / 0 입니다.
 */
struct EnrichedClickRecord {
    int64_t link_id{0};
    std::chrono::system_clock::time_point timestamp{};
    std::string ip;
    std::string user_agent;
    std::string referer;

    std::string referer_domain;     ///< Referer 호스트명
    std::string country;            ///< ISO 국가 코드
    std::string city;
    std::string region;
    double latitude{0.0};
    double longitude{0.0};
    std::string browser;
    std::string browser_version;
    std::string os;
    std::string device_type;        ///< "desktop" | "mobile" | "bot"
};

/**
 * @brief 보강된 클릭의 영구 저장소
 *
 * batchInsert는 전부 저장되거나 전부 실패해야 합니다.
 * 수집기 스레드에서만 호출됩니다.
 */
class ClickSink {
public:
    virtual ~ClickSink() = default;

    virtual bool batchInsert(const std::vector<EnrichedClickRecord>& records) = 0;

    [[nodiscard]] virtual std::string lastError() const = 0;
};

} // namespace shortline::analytics
