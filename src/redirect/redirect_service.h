#pragma once

/**
 * @file redirect_service.h
 * @brief 리다이렉트 요청 처리 (읽기 경로)
 *
 * Host/경로 정규화 → 캐시 조회(미스 시 저장소 조회 후 캐시 채움) →
 * 404/410/500/302 결정 → 클릭 이벤트 제출.
 * 클릭 기록은 수집기에 넣기만 하며 응답을 기다리게 하지 않습니다.
 */

#include <memory>
#include <string>

namespace shortline::data {
class LinkLookup;
}

namespace shortline::cache {
class RedirectCache;
}

namespace shortline::analytics {
class AnalyticsCollector;
}

namespace shortline::redirect {

/**
 * @brief 인바운드 리다이렉트 요청
 */
struct RedirectRequest {
    std::string host;           ///< Host 헤더 (포트 포함 가능)
    std::string path;           ///< 요청 경로 (쿼리/프래그먼트 포함 가능)
    std::string remote_addr;    ///< "ip:port" 또는 "ip"
    std::string user_agent;
    std::string referer;
};

/**
 * @brief 리다이렉트 응답
 */
struct RedirectResponse {
    int status{404};
    std::string location;       ///< 302일 때만
    std::string body;

    [[nodiscard]] bool isRedirect() const { return status == 302; }
};

class RedirectService {
public:
    /**
     * @param collector nullptr이면 클릭을 기록하지 않음
     */
    RedirectService(std::shared_ptr<data::LinkLookup> lookup,
                    std::shared_ptr<cache::RedirectCache> cache,
                    std::shared_ptr<analytics::AnalyticsCollector> collector);
    ~RedirectService();

    /**
     * @brief 요청 처리
     */
    RedirectResponse handle(const RedirectRequest& request);

    // ============================
    // 정규화 헬퍼
    // ============================

    /// Host → 소문자, 포트/대괄호 제거
    static std::string normalizeHost(const std::string& host);

    /// 경로 → slug (앞 '/' 제거, 쿼리/프래그먼트 제거)
    static std::string extractSlug(const std::string& path);

    /// "ip:port" / "[v6]:port" → ip
    static std::string clientIp(const std::string& remote_addr);

private:
    std::shared_ptr<data::LinkLookup> lookup_;
    std::shared_ptr<cache::RedirectCache> cache_;
    std::shared_ptr<analytics::AnalyticsCollector> collector_;
};

} // namespace shortline::redirect
