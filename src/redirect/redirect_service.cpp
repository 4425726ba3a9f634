/**
 * @file redirect_service.cpp
 * @brief 리다이렉트 요청 처리 구현
 */

#include "redirect_service.h"
#include "../analytics/analytics_collector.h"
#include "../cache/redirect_cache.h"
#include "../data/link_record.h"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <optional>

namespace shortline::redirect {

namespace {

constexpr const char* kNotFoundBody = "404 page not found";
constexpr const char* kGoneBody = "This link is no longer active.";
constexpr const char* kInternalErrorBody = "internal error";

} // namespace

// ============================================================
// 생성자 / 소멸자
// ============================================================

RedirectService::RedirectService(std::shared_ptr<data::LinkLookup> lookup,
                                 std::shared_ptr<cache::RedirectCache> cache,
                                 std::shared_ptr<analytics::AnalyticsCollector> collector)
    : lookup_(std::move(lookup)),
      cache_(std::move(cache)),
      collector_(std::move(collector)) {}

RedirectService::~RedirectService() = default;

// ============================================================
// 요청 처리
// ============================================================

RedirectResponse RedirectService::handle(const RedirectRequest& request) {
    RedirectResponse response;

    std::string host = normalizeHost(request.host);
    std::string slug = extractSlug(request.path);
    if (slug.empty()) {
        response.status = 404;
        response.body = kNotFoundBody;
        return response;
    }

    // 캐시 → 저장소
    std::optional<data::LinkRecord> link;
    if (cache_) link = cache_->get(host, slug);
    if (!link) {
        data::LinkLookupResult result = lookup_->findByKey(host, slug);
        switch (result.status) {
            case data::LookupStatus::NotFound:
                response.status = 404;
                response.body = kNotFoundBody;
                return response;
            case data::LookupStatus::StoreError:
                std::cerr << "[RedirectService] 링크 조회 실패 (" << host << "/" << slug
                          << "): " << result.error << std::endl;
                response.status = 500;
                response.body = kInternalErrorBody;
                return response;
            case data::LookupStatus::Found:
                break;
        }
        link = std::move(result.link);
        if (cache_) cache_->set(host, slug, *link);
    }

    if (!link->is_active) {
        response.status = 410;
        response.body = kGoneBody;
        return response;
    }

    if (collector_) {
        analytics::RawClickEvent event;
        event.link_id = link->id;
        event.timestamp = std::chrono::system_clock::now();
        event.ip = clientIp(request.remote_addr);
        event.user_agent = request.user_agent;
        event.referer = request.referer;
        collector_->push(std::move(event));
    }

    response.status = 302;
    response.location = link->destination;
    return response;
}

// ============================================================
// 정규화 헬퍼
// ============================================================

std::string RedirectService::normalizeHost(const std::string& host) {
    std::string h = host;

    if (!h.empty() && h.front() == '[') {
        // [v6] 또는 [v6]:port
        auto close = h.find(']');
        h = close == std::string::npos ? h.substr(1) : h.substr(1, close - 1);
    } else if (std::count(h.begin(), h.end(), ':') == 1) {
        h = h.substr(0, h.find(':'));
    }

    return cache::normalizeDomain(h);
}

std::string RedirectService::extractSlug(const std::string& path) {
    std::string slug = path.substr(0, path.find_first_of("?#"));
    if (!slug.empty() && slug.front() == '/') slug.erase(0, 1);
    return slug;
}

std::string RedirectService::clientIp(const std::string& remote_addr) {
    if (remote_addr.empty()) return {};

    if (remote_addr.front() == '[') {
        auto close = remote_addr.find(']');
        if (close != std::string::npos) return remote_addr.substr(1, close - 1);
        return remote_addr;
    }

    // 콜론이 하나면 ip:port, 여러 개면 포트 없는 IPv6
    if (std::count(remote_addr.begin(), remote_addr.end(), ':') == 1) {
        return remote_addr.substr(0, remote_addr.find(':'));
    }
    return remote_addr;
}

} // namespace shortline::redirect
