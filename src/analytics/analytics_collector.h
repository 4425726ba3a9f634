#pragma once

/**
 * @file analytics_collector.h
 * @brief 비차단 버퍼 기반 클릭 수집기
 *
 * 요청 경로에서 push()로 원시 클릭을 넣으면 백그라운드 스레드가 주기적으로
 * 버퍼를 비워 필터링(봇/위협 IP) → 보강(UA, Referer, 지리) → 일괄 저장합니다.
 *
 * 상태: Running → Draining(shutdown 호출) → Stopped
 */

#include "click_event.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace shortline::geo {
class GeoResolver;
}

namespace shortline::threat {
class ThreatChecker;
}

namespace shortline::analytics {

/**
 * @brief 수집기 설정
 */
struct CollectorConfig {
    size_t buffer_size{50000};                              ///< 버퍼 최대 이벤트 수
    std::chrono::milliseconds flush_interval{30000};        ///< 주기 플러시 간격
    bool filter_automated_traffic{true};                    ///< 봇/위협 IP 저장 제외
};

/**
 * @brief 수집기 통계
 */
struct CollectorStats {
    uint64_t pushed{0};         ///< 버퍼에 들어간 이벤트
    uint64_t dropped{0};        ///< 버퍼 가득 참 / 종료 후 push로 버려진 이벤트
    uint64_t filtered{0};       ///< 봇/위협 IP로 제외된 이벤트
    uint64_t persisted{0};      ///< 저장 성공한 레코드
    uint64_t failed_batches{0}; ///< 저장 실패한 배치
};

class AnalyticsCollector {
public:
    /**
     * @param sink 저장소 (필수)
     * @param geo 지리 조회기 (nullptr이면 지리 정보 없음)
     * @param threat 위협 검사기 (nullptr이면 IP 필터 없음)
     * @param config 설정
     */
    AnalyticsCollector(std::shared_ptr<ClickSink> sink,
                       std::shared_ptr<const geo::GeoResolver> geo,
                       std::shared_ptr<const threat::ThreatChecker> threat,
                       CollectorConfig config = {});
    ~AnalyticsCollector();

    // 복사 금지
    AnalyticsCollector(const AnalyticsCollector&) = delete;
    AnalyticsCollector& operator=(const AnalyticsCollector&) = delete;

    /**
     * @brief 클릭 추가 (차단 없음)
     * @return 버퍼에 들어갔으면 true, 버려졌으면 false
     */
    bool push(RawClickEvent event);

    /**
     * @brief 타이머 중지 후 남은 이벤트를 한 번 플러시하고 반환 (중복 호출 안전)
     */
    void shutdown();

    [[nodiscard]] CollectorStats stats() const;

    /// 현재 버퍼에 쌓인 이벤트 수
    [[nodiscard]] size_t pending() const;

    // ============================
    // 보강 (테스트/재사용용 공개)
    // ============================

    /**
     * @brief 원시 클릭 → 보강 레코드
     * @param geo nullptr 허용
     */
    static EnrichedClickRecord enrich(const RawClickEvent& event, const geo::GeoResolver* geo);

    /**
     * @brief Referer URL의 호스트명 (포트/대괄호 제거, 실패 시 빈 문자열)
     */
    static std::string refererHostname(const std::string& referer);

private:
    std::shared_ptr<ClickSink> sink_;
    std::shared_ptr<const geo::GeoResolver> geo_;
    std::shared_ptr<const threat::ThreatChecker> threat_;
    CollectorConfig config_;

    // 버퍼
    mutable std::mutex buffer_mutex_;
    std::condition_variable buffer_cv_;
    std::deque<RawClickEvent> buffer_;
    bool accepting_{true};
    bool stop_requested_{false};

    // 워커
    std::mutex lifecycle_mutex_;
    std::thread worker_;

    // 통계
    std::atomic<uint64_t> pushed_{0};
    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> filtered_{0};
    std::atomic<uint64_t> persisted_{0};
    std::atomic<uint64_t> failed_batches_{0};

    void flushLoop();
    void flush();
    [[nodiscard]] bool shouldFilter(const RawClickEvent& event) const;
};

} // namespace shortline::analytics
