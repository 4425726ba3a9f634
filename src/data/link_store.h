#pragma once

/**
 * @file link_store.h
 * @brief SQLite 기반 링크 저장소
 *
 * LinkLookup 구현(리다이렉트 경로의 조회)과 링크 생성/수정/소프트 삭제를
 * 제공합니다. 캐시 무효화는 이 클래스의 책임이 아니며 LinkService가 담당합니다.
 */

#include "link_record.h"

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <mutex>
#include <cstdint>

namespace shortline::data {

class DataStore;

/**
 * @brief 링크 목록 한 페이지
 */
struct LinkPage {
    std::vector<LinkRecord> links;
    int64_t total{0};               ///< 검색 조건에 맞는 전체 링크 수
};

/**
 * @brief 링크 저장소
 */
class LinkStore : public LinkLookup {
public:
    explicit LinkStore(std::shared_ptr<DataStore> store);
    ~LinkStore() override;

    // 복사 금지
    LinkStore(const LinkStore&) = delete;
    LinkStore& operator=(const LinkStore&) = delete;

    /**
     * @brief 초기화 (스키마 마이그레이션 적용)
     */
    bool initialize();

    // ============================
    // 조회 (LinkLookup)
    // ============================

    LinkLookupResult findByKey(const std::string& domain, const std::string& slug) override;
    LinkLookupResult findById(int64_t id) override;

    // ============================
    // 쓰기
    // ============================

    /**
     * @brief 링크 생성
     * @param link slug/domain/destination 등 입력. 성공 시 id와 시각이 채워짐
     * @return 성공 여부 (UNIQUE 충돌 포함 실패 시 lastError())
     */
    bool createLink(LinkRecord& link);

    /**
     * @brief 링크 수정 (slug, domain, destination, title, tags, notes)
     * @param link link.id로 대상 지정. 성공 시 저장된 값으로 갱신됨
     * @return 영향받은 행 수 (0 = 없음), 실패 시 -1
     */
    int updateLink(LinkRecord& link);

    /**
     * @brief 소프트 삭제 (is_active = 0)
     * @return 영향받은 행 수 (0 = 없음), 실패 시 -1
     */
    int softDeleteLink(int64_t id);

    /**
     * @brief (slug, domain) 사용 여부
     * @return 조회 실패 시 std::nullopt
     */
    std::optional<bool> slugExists(const std::string& slug, const std::string& domain);

    /**
     * @brief 최근 생성 순 링크 목록
     * @param search slug, destination, title, tags 부분 일치 (빈 값이면 전체)
     * @return 페이지 + 전체 개수. 조회 실패 시 빈 페이지 (lastError())
     */
    LinkPage listLinks(int limit = 50, int offset = 0, const std::string& search = {});

    /**
     * @brief 활성 링크 수
     */
    [[nodiscard]] int64_t activeLinkCount() const;

    [[nodiscard]] std::string lastError() const;

private:
    std::shared_ptr<DataStore> store_;
    mutable std::mutex mutex_;
    std::string last_error_;
};

} // namespace shortline::data
