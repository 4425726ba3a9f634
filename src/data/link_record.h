#pragma once

/**
 * @file link_record.h
 * @brief 단축 링크 레코드 및 조회 인터페이스
 *
 * 리다이렉트 경로(캐시, 조회 저장소, 리다이렉트 서비스)가 공유하는
 * 링크 데이터 구조와 조회 결과 타입을 정의합니다.
 */

#include <string>
#include <cstdint>

namespace shortline::data {

// ============================================================
// LinkRecord
// ============================================================

/**
 * @brief 단축 링크 한 건
 *
 * (domain, slug) 쌍이 링크를 유일하게 식별합니다.
 * 시각은 SQLite datetime 형식(UTC, "YYYY-MM-DD HH:MM:SS") 문자열입니다.
 */
struct LinkRecord {
    int64_t id{0};
    std::string slug;
    std::string domain;
    std::string destination;    ///< 리다이렉트 대상 URL
    std::string title;
    std::string tags;           ///< 쉼표 구분 태그
    std::string notes;
    bool is_active{true};
    std::string created_at;
    std::string updated_at;

    /// https://<domain>/<slug>
    [[nodiscard]] std::string shortUrl() const {
        return "https://" + domain + "/" + slug;
    }
};

// ============================================================
// 조회 인터페이스
// ============================================================

/// 조회 결과 상태
enum class LookupStatus {
    Found,
    NotFound,
    StoreError
};

/**
 * @brief 링크 조회 결과
 */
struct LinkLookupResult {
    LookupStatus status{LookupStatus::NotFound};
    LinkRecord link;            ///< status == Found 일 때만 유효
    std::string error;          ///< status == StoreError 일 때 메시지

    [[nodiscard]] bool found() const { return status == LookupStatus::Found; }
};

/**
 * @brief 링크 조회 저장소 인터페이스
 *
 * 리다이렉트 경로는 이 인터페이스만 사용하며, 구현은 SQLite(LinkStore)
 * 또는 테스트용 모의 객체입니다.
 */
class LinkLookup {
public:
    virtual ~LinkLookup() = default;

    /// (domain, slug)로 조회. domain은 소문자로 정규화되어 전달됨
    virtual LinkLookupResult findByKey(const std::string& domain, const std::string& slug) = 0;

    /// ID로 조회
    virtual LinkLookupResult findById(int64_t id) = 0;
};

} // namespace shortline::data
