#pragma once

/**
 * @file link_service.h
 * @brief 링크 생성/수정/삭제 (쓰기 경로)
 *
 * slug나 domain이 바뀌거나 링크가 삭제되면 변경 전 키로 캐시를 무효화합니다.
 * 무효화하지 않으면 이전 키로 옛 링크가 계속 서빙됩니다.
 */

#include "../data/link_record.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace shortline::data {
class LinkStore;
}

namespace shortline::cache {
class RedirectCache;
}

namespace shortline::redirect {

/// 쓰기 작업 결과 상태
enum class LinkOpStatus {
    Ok,
    InvalidInput,       ///< 필수 값 누락
    DomainNotAllowed,
    NotFound,
    Conflict,           ///< (slug, domain) 중복
    StoreError
};

const char* linkOpStatusName(LinkOpStatus status);

/**
 * @brief 링크 생성 요청 (slug가 비어있으면 자동 생성)
 */
struct CreateLinkRequest {
    std::string slug;
    std::string domain;
    std::string destination;
    std::string title;
    std::string tags;
    std::string notes;
};

/**
 * @brief 링크 수정 요청 (값이 있는 필드만 반영)
 */
struct UpdateLinkRequest {
    std::optional<std::string> slug;
    std::optional<std::string> domain;
    std::optional<std::string> destination;
    std::optional<std::string> title;
    std::optional<std::string> tags;
    std::optional<std::string> notes;
};

/**
 * @brief 쓰기 작업 결과
 */
struct LinkOpResult {
    LinkOpStatus status{LinkOpStatus::Ok};
    data::LinkRecord link;
    std::string error;

    [[nodiscard]] bool ok() const { return status == LinkOpStatus::Ok; }
};

class LinkService {
public:
    /**
     * @param allowed_domains 허용 도메인 (비어있으면 제한 없음)
     */
    LinkService(std::shared_ptr<data::LinkStore> store,
                std::shared_ptr<cache::RedirectCache> cache,
                std::vector<std::string> allowed_domains = {});
    ~LinkService();

    LinkOpResult createLink(const CreateLinkRequest& request);
    LinkOpResult updateLink(int64_t id, const UpdateLinkRequest& request);
    LinkOpResult deleteLink(int64_t id);

private:
    std::shared_ptr<data::LinkStore> store_;
    std::shared_ptr<cache::RedirectCache> cache_;
    std::vector<std::string> allowed_domains_;

    /// 자동 slug 생성 시 충돌 재시도 횟수
    static constexpr int kSlugAttempts = 10;
};

} // namespace shortline::redirect
