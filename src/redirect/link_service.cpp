/**
 * @file link_service.cpp
 * @brief 링크 쓰기 경로 구현
 */

#include "link_service.h"
#include "slug_generator.h"
#include "../cache/redirect_cache.h"
#include "../core/config.h"
#include "../data/link_store.h"


namespace shortline::redirect {

namespace {

bool isConstraintError(const std::string& error) {
    return error.find("UNIQUE constraint failed") != std::string::npos;
}

LinkOpResult fail(LinkOpStatus status, std::string error) {
    LinkOpResult result;
    result.status = status;
    result.error = std::move(error);
    return result;
}

} // namespace

const char* linkOpStatusName(LinkOpStatus status) {
    switch (status) {
        case LinkOpStatus::Ok:               return "ok";
        case LinkOpStatus::InvalidInput:     return "invalid input";
        case LinkOpStatus::DomainNotAllowed: return "domain not allowed";
        case LinkOpStatus::NotFound:         return "not found";
        case LinkOpStatus::Conflict:         return "slug already exists for this domain";
        case LinkOpStatus::StoreError:       return "store error";
    }
    return "unknown";
}

// ============================================================
// 생성자 / 소멸자
// ============================================================

LinkService::LinkService(std::shared_ptr<data::LinkStore> store,
                         std::shared_ptr<cache::RedirectCache> cache,
                         std::vector<std::string> allowed_domains)
    : store_(std::move(store)),
      cache_(std::move(cache)),
      allowed_domains_(std::move(allowed_domains)) {}

LinkService::~LinkService() = default;

// ============================================================
// 생성
// ============================================================

LinkOpResult LinkService::createLink(const CreateLinkRequest& request) {
    if (request.destination.empty()) {
        return fail(LinkOpStatus::InvalidInput, "destination is required");
    }
    if (request.domain.empty()) {
        return fail(LinkOpStatus::InvalidInput, "domain is required");
    }

    data::LinkRecord link;
    link.domain = cache::normalizeDomain(request.domain);
    if (!core::isDomainAllowed(allowed_domains_, link.domain)) {
        return fail(LinkOpStatus::DomainNotAllowed, "domain not allowed");
    }

    link.slug = request.slug;
    if (link.slug.empty()) {
        // 충돌 시 재시도
        for (int attempt = 0; attempt < kSlugAttempts; ++attempt) {
            auto candidate = generateSlug();
            if (!candidate) {
                return fail(LinkOpStatus::StoreError, "slug 난수 생성 실패");
            }
            auto exists = store_->slugExists(*candidate, link.domain);
            if (!exists) {
                return fail(LinkOpStatus::StoreError, store_->lastError());
            }
            if (!*exists) {
                link.slug = *candidate;
                break;
            }
        }
        if (link.slug.empty()) {
            return fail(LinkOpStatus::StoreError, "failed to generate unique slug");
        }
    }

    link.destination = request.destination;
    link.title = request.title;
    link.tags = request.tags;
    link.notes = request.notes;

    if (!store_->createLink(link)) {
        std::string error = store_->lastError();
        if (isConstraintError(error)) {
            return fail(LinkOpStatus::Conflict, linkOpStatusName(LinkOpStatus::Conflict));
        }
        return fail(LinkOpStatus::StoreError, error);
    }

    LinkOpResult result;
    result.link = link;
    return result;
}

// ============================================================
// 수정
// ============================================================

LinkOpResult LinkService::updateLink(int64_t id, const UpdateLinkRequest& request) {
    auto existing = store_->findById(id);
    if (existing.status == data::LookupStatus::NotFound) {
        return fail(LinkOpStatus::NotFound, "not found");
    }
    if (existing.status == data::LookupStatus::StoreError) {
        return fail(LinkOpStatus::StoreError, existing.error);
    }

    data::LinkRecord link = existing.link;

    if (request.domain && !request.domain->empty()) {
        std::string domain = cache::normalizeDomain(*request.domain);
        if (!core::isDomainAllowed(allowed_domains_, domain)) {
            return fail(LinkOpStatus::DomainNotAllowed, "domain not allowed");
        }
        link.domain = domain;
    }

    // 변경 전 키
    const std::string old_domain = existing.link.domain;
    const std::string old_slug = existing.link.slug;

    if (request.slug && !request.slug->empty()) link.slug = *request.slug;
    if (request.destination && !request.destination->empty()) link.destination = *request.destination;
    if (request.title) link.title = *request.title;
    if (request.tags) link.tags = *request.tags;
    if (request.notes) link.notes = *request.notes;

    int rc = store_->updateLink(link);
    if (rc < 0) {
        std::string error = store_->lastError();
        if (isConstraintError(error)) {
            return fail(LinkOpStatus::Conflict, linkOpStatusName(LinkOpStatus::Conflict));
        }
        return fail(LinkOpStatus::StoreError, error);
    }
    if (rc == 0) {
        return fail(LinkOpStatus::NotFound, "not found");
    }

    // 쓰기가 반영된 뒤 변경 전 키로 무효화
    if (cache_) cache_->invalidate(old_domain, old_slug);

    LinkOpResult result;
    result.link = link;
    return result;
}

// ============================================================
// 삭제 (소프트)
// ============================================================

LinkOpResult LinkService::deleteLink(int64_t id) {
    auto existing = store_->findById(id);
    if (existing.status == data::LookupStatus::NotFound) {
        return fail(LinkOpStatus::NotFound, "not found");
    }
    if (existing.status == data::LookupStatus::StoreError) {
        return fail(LinkOpStatus::StoreError, existing.error);
    }

    int rc = store_->softDeleteLink(id);
    if (rc < 0) {
        return fail(LinkOpStatus::StoreError, store_->lastError());
    }
    if (rc == 0) {
        return fail(LinkOpStatus::NotFound, "not found");
    }

    if (cache_) cache_->invalidate(existing.link.domain, existing.link.slug);

    LinkOpResult result;
    result.link = existing.link;
    result.link.is_active = false;
    return result;
}

} // namespace shortline::redirect
