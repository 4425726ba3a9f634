/**
 * @file link_store.cpp
 * @brief SQLite 기반 링크 저장소 구현
 */

#include "link_store.h"
#include "data_store.h"
#include "schema.h"

#include <iostream>

namespace shortline::data {

namespace {

constexpr const char* kSelectColumns =
    "SELECT id, slug, domain, destination, title, tags, notes, is_active, "
    "created_at, updated_at FROM links ";

/// LIKE 부분 일치 패턴 (%, _, 역슬래시 이스케이프)
std::string likePattern(const std::string& text) {
    std::string pattern = "%";
    for (char c : text) {
        if (c == '%' || c == '_' || c == '\\') pattern += '\\';
        pattern += c;
    }
    pattern += '%';
    return pattern;
}

/// 단일 행 조회를 LinkLookupResult로 변환
LinkLookupResult lookupOne(DataStore& store, const std::string& sql,
                           const std::vector<DbValue>& params) {
    LinkLookupResult result;
    bool ok = false;
    auto rows = store.query(sql, params, &ok);
    if (!ok) {
        result.status = LookupStatus::StoreError;
        result.error = store.lastError();
        return result;
    }
    if (rows.empty()) {
        result.status = LookupStatus::NotFound;
        return result;
    }
    result.status = LookupStatus::Found;
    result.link = linkFromRow(rows.front());
    return result;
}

} // namespace

// ============================================================
// 생성자 / 소멸자
// ============================================================

LinkStore::LinkStore(std::shared_ptr<DataStore> store)
    : store_(std::move(store)) {}

LinkStore::~LinkStore() = default;

bool LinkStore::initialize() {
    if (!store_ || !store_->isOpen()) return false;

    registerSchemaMigrations(*store_);
    if (store_->runMigrations() < 0) {
        std::lock_guard lock(mutex_);
        last_error_ = store_->lastError();
        std::cerr << "[LinkStore] 스키마 적용 실패: " << last_error_ << std::endl;
        return false;
    }
    return true;
}

// ============================================================
// 조회
// ============================================================

LinkLookupResult LinkStore::findByKey(const std::string& domain, const std::string& slug) {
    auto result = lookupOne(*store_,
                            std::string(kSelectColumns) + "WHERE domain = ? AND slug = ?",
                            {domain, slug});
    if (result.status == LookupStatus::StoreError) {
        std::lock_guard lock(mutex_);
        last_error_ = result.error;
    }
    return result;
}

LinkLookupResult LinkStore::findById(int64_t id) {
    auto result = lookupOne(*store_, std::string(kSelectColumns) + "WHERE id = ?", {id});
    if (result.status == LookupStatus::StoreError) {
        std::lock_guard lock(mutex_);
        last_error_ = result.error;
    }
    return result;
}

// ============================================================
// 쓰기
// ============================================================

bool LinkStore::createLink(LinkRecord& link) {
    int rc = store_->execute(
        "INSERT INTO links (slug, domain, destination, title, tags, notes) "
        "VALUES (?, ?, ?, ?, ?, ?)",
        {link.slug, link.domain, link.destination, link.title, link.tags, link.notes}
    );
    if (rc < 0) {
        std::lock_guard lock(mutex_);
        last_error_ = store_->lastError();
        return false;
    }

    link.id = store_->lastInsertRowId();

    // 기본값(시각, is_active)을 다시 읽음
    auto stored = findById(link.id);
    if (stored.found()) link = stored.link;
    return true;
}

int LinkStore::updateLink(LinkRecord& link) {
    int rc = store_->execute(
        "UPDATE links SET slug = ?, domain = ?, destination = ?, title = ?, tags = ?, notes = ?, "
        "updated_at = datetime('now') WHERE id = ?",
        {link.slug, link.domain, link.destination, link.title, link.tags, link.notes, link.id}
    );
    if (rc < 0) {
        std::lock_guard lock(mutex_);
        last_error_ = store_->lastError();
        return -1;
    }
    if (rc > 0) {
        auto stored = findById(link.id);
        if (stored.found()) link = stored.link;
    }
    return rc;
}

int LinkStore::softDeleteLink(int64_t id) {
    int rc = store_->execute(
        "UPDATE links SET is_active = 0, updated_at = datetime('now') WHERE id = ?", {id});
    if (rc < 0) {
        std::lock_guard lock(mutex_);
        last_error_ = store_->lastError();
    }
    return rc;
}

std::optional<bool> LinkStore::slugExists(const std::string& slug, const std::string& domain) {
    bool ok = false;
    auto rows = store_->query(
        "SELECT COUNT(*) AS cnt FROM links WHERE slug = ? AND domain = ?", {slug, domain}, &ok);
    if (!ok || rows.empty()) {
        std::lock_guard lock(mutex_);
        last_error_ = store_->lastError();
        return std::nullopt;
    }
    return rowInt(rows.front(), "cnt") > 0;
}

LinkPage LinkStore::listLinks(int limit, int offset, const std::string& search) {
    std::string where = "1 = 1";
    std::vector<DbValue> params;
    if (!search.empty()) {
        where = "(slug LIKE ?1 ESCAPE '\\' OR destination LIKE ?1 ESCAPE '\\' "
                "OR title LIKE ?1 ESCAPE '\\' OR tags LIKE ?1 ESCAPE '\\')";
        params.push_back(likePattern(search));
    }

    LinkPage page;
    bool ok = false;
    auto count_rows = store_->query("SELECT COUNT(*) AS cnt FROM links WHERE " + where, params, &ok);
    if (!ok || count_rows.empty()) {
        std::lock_guard lock(mutex_);
        last_error_ = store_->lastError();
        return page;
    }
    page.total = rowInt(count_rows.front(), "cnt");

    params.push_back(static_cast<int64_t>(limit));
    params.push_back(static_cast<int64_t>(offset));
    auto rows = store_->query(
        std::string(kSelectColumns) + "WHERE " + where +
        " ORDER BY created_at DESC, id DESC LIMIT ? OFFSET ?",
        params, &ok);
    if (!ok) {
        std::lock_guard lock(mutex_);
        last_error_ = store_->lastError();
        page.total = 0;
        return page;
    }

    page.links.reserve(rows.size());
    for (const auto& row : rows) {
        page.links.push_back(linkFromRow(row));
    }
    return page;
}

int64_t LinkStore::activeLinkCount() const {
    auto val = store_->queryScalar("SELECT COUNT(*) FROM links WHERE is_active = 1");
    if (val && std::holds_alternative<int64_t>(*val)) return std::get<int64_t>(*val);
    return 0;
}

std::string LinkStore::lastError() const {
    std::lock_guard lock(mutex_);
    return last_error_;
}

} // namespace shortline::data
