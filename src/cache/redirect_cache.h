#pragma once

/**
 * @file redirect_cache.h
 * @brief (domain, slug) → 링크 레코드 LRU 캐시
 *
 * 리다이렉트 경로의 읽기 캐시입니다. 저장소에는 접근하지 않으며,
 * 미스 시 호출자가 저장소를 조회한 뒤 set()으로 채웁니다.
 * 부정 결과(없음)는 캐시하지 않습니다.
 */

#include "../data/link_record.h"

#include <string>
#include <list>
#include <unordered_map>
#include <optional>
#include <mutex>
#include <cstddef>

namespace shortline::cache {

/**
 * @brief 캐시 키 (소문자 도메인 + 대소문자 구분 slug)
 */
struct CacheKey {
    std::string domain;
    std::string slug;

    bool operator==(const CacheKey& other) const {
        return domain == other.domain && slug == other.slug;
    }
};

struct CacheKeyHash {
    size_t operator()(const CacheKey& key) const noexcept;
};

/// 도메인 ASCII 소문자 변환
std::string normalizeDomain(const std::string& domain);

/**
 * @brief 용량 제한 LRU 캐시
 *
 * get()도 최근 사용 순서를 바꾸므로 읽기/쓰기 모두 단일 뮤텍스로 보호합니다.
 */
class RedirectCache {
public:
    /**
     * @param capacity 최대 항목 수 (0은 1로 보정)
     */
    explicit RedirectCache(size_t capacity);
    ~RedirectCache();

    // 복사 금지
    RedirectCache(const RedirectCache&) = delete;
    RedirectCache& operator=(const RedirectCache&) = delete;

    /**
     * @brief 조회. 적중 시 해당 항목을 가장 최근 사용으로 이동
     */
    std::optional<data::LinkRecord> get(const std::string& domain, const std::string& slug);

    /**
     * @brief 삽입 또는 교체. 용량 초과 시 가장 오래 사용되지 않은 항목 제거
     */
    void set(const std::string& domain, const std::string& slug, const data::LinkRecord& link);

    /**
     * @brief 항목 제거 (없으면 무시)
     */
    void invalidate(const std::string& domain, const std::string& slug);

    /// 전체 비우기
    void clear();

    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t capacity() const { return capacity_; }

private:
    struct Entry {
        CacheKey key;
        data::LinkRecord link;
    };

    const size_t capacity_;
    std::list<Entry> entries_;      ///< 앞쪽이 가장 최근 사용
    std::unordered_map<CacheKey, std::list<Entry>::iterator, CacheKeyHash> index_;
    mutable std::mutex mutex_;
};

} // namespace shortline::cache
