#pragma once

/**
 * @file click_store.h
 * @brief SQLite 기반 클릭 저장소
 *
 * AnalyticsCollector의 ClickSink 구현 + 링크별/전체 클릭 집계.
 */

#include "../analytics/click_event.h"
#include "link_record.h"

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <cstdint>

namespace shortline::data {

class DataStore;

/// 집계 기준 열
enum class Dimension {
    RefererDomain,
    Country,
    Browser,
    DeviceType
};

/**
 * @brief 집계 항목 (값, 클릭 수)
 */
struct BreakdownCount {
    std::string value;
    int64_t count{0};
};

/**
 * @brief 링크와 누적 클릭 수
 */
struct LinkClickCount {
    LinkRecord link;
    int64_t clicks{0};
};

/**
 * @brief 클릭 저장소
 */
class ClickStore : public analytics::ClickSink {
public:
    explicit ClickStore(std::shared_ptr<DataStore> store);
    ~ClickStore() override;

    // 복사 금지
    ClickStore(const ClickStore&) = delete;
    ClickStore& operator=(const ClickStore&) = delete;

    /**
     * @brief 초기화 (스키마 마이그레이션 적용)
     */
    bool initialize();

    /**
     * @brief 클릭 일괄 저장 (단일 트랜잭션, 실패 시 전부 롤백)
     */
    bool batchInsert(const std::vector<analytics::EnrichedClickRecord>& records) override;

    [[nodiscard]] std::string lastError() const override;

    // ============================
    // 집계
    // ============================

    /// 링크별 클릭 수
    [[nodiscard]] int64_t clickCount(int64_t link_id) const;

    /// 최근 N일 링크별 클릭 수
    [[nodiscard]] int64_t clickCountSince(int64_t link_id, int days) const;

    /// 전체 클릭 수
    [[nodiscard]] int64_t totalClicks() const;

    /**
     * @brief 여러 링크의 클릭 수 (클릭이 없는 링크는 결과에 없음)
     */
    std::unordered_map<int64_t, int64_t> clickCountsForLinks(const std::vector<int64_t>& ids) const;

    /**
     * @brief 클릭 수 상위 활성 링크 (비활성 링크 제외)
     */
    std::vector<LinkClickCount> topLinks(int limit = 10) const;

    /**
     * @brief 링크별 상위 항목 (빈 값 제외, 클릭 수 내림차순)
     */
    std::vector<BreakdownCount> topForLink(int64_t link_id, Dimension dim, int limit = 10) const;

    /**
     * @brief 전체 상위 항목
     */
    std::vector<BreakdownCount> topGlobal(Dimension dim, int limit = 10) const;

private:
    std::shared_ptr<DataStore> store_;
    mutable std::mutex mutex_;
    std::string last_error_;
};

/// 클릭 시각 → SQLite datetime 문자열 (UTC)
std::string formatTimestamp(std::chrono::system_clock::time_point tp);

} // namespace shortline::data
