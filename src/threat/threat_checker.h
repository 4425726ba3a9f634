#pragma once

/**
 * @file threat_checker.h
 * @brief IP 평판 검사기 (데이터센터 대역 + 위협 IP 목록)
 *
 * 여러 외부 피드를 주기적으로 병렬 다운로드해 불변 스냅샷(ThreatIndex)을
 * 만들고, 요청 경로에서는 스냅샷 포인터만 복사해 조회합니다.
 *
 * 갱신 규칙:
 * - 소스별 실패(전송 오류, 2xx 아님, 형식 오류)는 로그만 남기고 해당 소스 제외
 * - 대역 목록과 IP 집합은 각각 새 집계가 비어있지 않을 때만 교체
 * - 전부 실패하면 이전 스냅샷 유지
 */

#include "ip_address.h"
#include "feed_parser.h"
#include "../network/http_client.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace shortline::threat {

// ============================================================
// 타입 정의
// ============================================================

/**
 * @brief 피드 소스
 *
 * url이 비어있으면 static_entries(CIDR 목록)만 사용합니다.
 */
struct ThreatSource {
    std::string name;
    std::string url;
    FeedFormat format{FeedFormat::CidrLines};
    std::vector<std::string> static_entries;
};

/// 피드 다운로드 콜백 (테스트에서 교체)
using FetchCallback = std::function<network::HttpResponse(const std::string& url,
                                                          std::chrono::seconds timeout)>;

/// 기본 소스 목록 (데이터센터 대역 6개 + 위협 IP 목록 3개)
std::vector<ThreatSource> defaultThreatSources();

/**
 * @brief ThreatChecker 설정
 */
struct ThreatCheckerConfig {
    std::vector<ThreatSource> sources{defaultThreatSources()};
    std::chrono::milliseconds refresh_interval{std::chrono::hours(24)};
    std::chrono::seconds fetch_timeout{30};
    FetchCallback fetch;            ///< 비어있으면 HttpClient 사용
};

/**
 * @brief 불변 위협 스냅샷
 */
struct ThreatIndex {
    std::vector<CidrRange> ranges;
    std::unordered_set<std::string> blocked_ips;   ///< 정규화된 문자열 표현
};

/**
 * @brief 갱신 결과 요약
 */
struct RefreshSummary {
    size_t fetched_ranges{0};       ///< 이번 갱신에서 수집한 대역 수
    size_t fetched_ips{0};          ///< 이번 갱신에서 수집한 IP 수
    size_t failed_sources{0};
    bool ranges_replaced{false};
    bool ips_replaced{false};
    std::vector<std::string> errors; ///< "소스명: 메시지"
};

// ============================================================
// ThreatChecker
// ============================================================

class ThreatChecker {
public:
    explicit ThreatChecker(ThreatCheckerConfig config = {});
    ~ThreatChecker();

    // 복사 금지
    ThreatChecker(const ThreatChecker&) = delete;
    ThreatChecker& operator=(const ThreatChecker&) = delete;

    // ============================
    // 조회
    // ============================

    /**
     * @brief 차단 대상 여부 (파싱 불가 IP는 false)
     */
    [[nodiscard]] bool isBlocked(const std::string& ip) const;

    [[nodiscard]] size_t rangeCount() const;
    [[nodiscard]] size_t blockedIpCount() const;

    /**
     * @brief 현재 스냅샷 (교체되어도 보유한 포인터는 그대로 유효)
     */
    [[nodiscard]] std::shared_ptr<const ThreatIndex> snapshot() const;

    // ============================
    // 수명 주기
    // ============================

    /**
     * @brief 백그라운드 갱신 시작 (즉시 1회 갱신 후 주기 반복)
     */
    void start();

    /**
     * @brief 백그라운드 갱신 중지. 진행 중인 갱신은 끝날 때까지 대기
     */
    void stop();

    [[nodiscard]] bool isRunning() const { return running_.load(); }

    /**
     * @brief 즉시 동기 갱신
     */
    RefreshSummary refreshNow();

private:
    ThreatCheckerConfig config_;

    // 스냅샷
    mutable std::shared_mutex index_mutex_;
    std::shared_ptr<const ThreatIndex> index_;

    // 갱신 직렬화 (타이머 스레드와 refreshNow 동시 호출 방지)
    std::mutex refresh_mutex_;

    // 타이머 스레드
    std::mutex lifecycle_mutex_;    ///< start/stop 직렬화
    std::thread worker_;
    std::mutex worker_mutex_;
    std::condition_variable worker_cv_;
    std::atomic<bool> running_{false};
    bool stop_requested_{false};

    void refreshLoop();
};

} // namespace shortline::threat
