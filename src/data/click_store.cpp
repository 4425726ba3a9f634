/**
 * @file click_store.cpp
 * @brief SQLite 기반 클릭 저장소 구현
 */

#include "click_store.h"
#include "data_store.h"
#include "schema.h"

#include <algorithm>
#include <ctime>
#include <iostream>

namespace shortline::data {

namespace {

/// 집계 기준 → 열 이름 (고정 목록이므로 SQL에 직접 삽입)
const char* dimensionColumn(Dimension dim) {
    switch (dim) {
        case Dimension::RefererDomain: return "referer_domain";
        case Dimension::Country:       return "country";
        case Dimension::Browser:       return "browser";
        case Dimension::DeviceType:    return "device_type";
    }
    return "browser";
}

std::vector<BreakdownCount> rowsToBreakdown(const DbResultSet& rows) {
    std::vector<BreakdownCount> results;
    results.reserve(rows.size());
    for (const auto& row : rows) {
        results.push_back({rowText(row, "value"), rowInt(row, "cnt")});
    }
    return results;
}

/// IN (...) 목록 한 번에 바인딩할 최대 개수
constexpr size_t kInListChunk = 500;

int64_t scalarInt(const std::optional<DbValue>& val) {
    if (val && std::holds_alternative<int64_t>(*val)) return std::get<int64_t>(*val);
    return 0;
}

} // namespace

std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

// ============================================================
// 생성자 / 소멸자
// ============================================================

ClickStore::ClickStore(std::shared_ptr<DataStore> store)
    : store_(std::move(store)) {}

ClickStore::~ClickStore() = default;

bool ClickStore::initialize() {
    if (!store_ || !store_->isOpen()) return false;

    registerSchemaMigrations(*store_);
    if (store_->runMigrations() < 0) {
        std::lock_guard lock(mutex_);
        last_error_ = store_->lastError();
        std::cerr << "[ClickStore] 스키마 적용 실패: " << last_error_ << std::endl;
        return false;
    }
    return true;
}

// ============================================================
// 일괄 저장
// ============================================================

bool ClickStore::batchInsert(const std::vector<analytics::EnrichedClickRecord>& records) {
    if (records.empty()) return true;

    bool ok = store_->transaction([&]() -> bool {
        for (const auto& c : records) {
            int rc = store_->execute(
                "INSERT INTO clicks (link_id, clicked_at, ip, user_agent, referer, referer_domain, "
                "country, city, region, latitude, longitude, browser, browser_version, os, device_type) "
                "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
                {c.link_id, formatTimestamp(c.timestamp), c.ip, c.user_agent, c.referer,
                 c.referer_domain, c.country, c.city, c.region, c.latitude, c.longitude,
                 c.browser, c.browser_version, c.os, c.device_type}
            );
            if (rc < 0) return false;
        }
        return true;
    });

    if (!ok) {
        std::lock_guard lock(mutex_);
        last_error_ = store_->lastError();
    }
    return ok;
}

std::string ClickStore::lastError() const {
    std::lock_guard lock(mutex_);
    return last_error_;
}

// ============================================================
// 집계
// ============================================================

int64_t ClickStore::clickCount(int64_t link_id) const {
    return scalarInt(store_->queryScalar(
        "SELECT COUNT(*) FROM clicks WHERE link_id = ?", {link_id}));
}

int64_t ClickStore::clickCountSince(int64_t link_id, int days) const {
    return scalarInt(store_->queryScalar(
        "SELECT COUNT(*) FROM clicks WHERE link_id = ? AND clicked_at >= datetime('now', ?)",
        {link_id, "-" + std::to_string(days) + " days"}));
}

int64_t ClickStore::totalClicks() const {
    return scalarInt(store_->queryScalar("SELECT COUNT(*) FROM clicks"));
}

std::unordered_map<int64_t, int64_t> ClickStore::clickCountsForLinks(
        const std::vector<int64_t>& ids) const {
    std::unordered_map<int64_t, int64_t> counts;

    for (size_t start = 0; start < ids.size(); start += kInListChunk) {
        size_t end = std::min(ids.size(), start + kInListChunk);

        std::string placeholders;
        std::vector<DbValue> params;
        params.reserve(end - start);
        for (size_t i = start; i < end; ++i) {
            placeholders += placeholders.empty() ? "?" : ",?";
            params.push_back(ids[i]);
        }

        auto rows = store_->query(
            "SELECT link_id, COUNT(*) AS cnt FROM clicks WHERE link_id IN (" + placeholders + ") "
            "GROUP BY link_id",
            params);
        for (const auto& row : rows) {
            counts[rowInt(row, "link_id")] = rowInt(row, "cnt");
        }
    }
    return counts;
}

std::vector<LinkClickCount> ClickStore::topLinks(int limit) const {
    auto rows = store_->query(
        "SELECT l.id AS id, l.slug AS slug, l.domain AS domain, l.destination AS destination, "
        "l.title AS title, l.tags AS tags, l.notes AS notes, l.is_active AS is_active, "
        "l.created_at AS created_at, l.updated_at AS updated_at, COUNT(c.id) AS click_count "
        "FROM links l LEFT JOIN clicks c ON c.link_id = l.id "
        "WHERE l.is_active = 1 "
        "GROUP BY l.id ORDER BY click_count DESC, l.id ASC LIMIT ?",
        {static_cast<int64_t>(limit)});

    std::vector<LinkClickCount> results;
    results.reserve(rows.size());
    for (const auto& row : rows) {
        results.push_back({linkFromRow(row), rowInt(row, "click_count")});
    }
    return results;
}

std::vector<BreakdownCount> ClickStore::topForLink(int64_t link_id, Dimension dim, int limit) const {
    std::string col = dimensionColumn(dim);
    auto rows = store_->query(
        "SELECT " + col + " AS value, COUNT(*) AS cnt FROM clicks "
        "WHERE link_id = ? AND " + col + " != '' "
        "GROUP BY " + col + " ORDER BY cnt DESC, value ASC LIMIT ?",
        {link_id, static_cast<int64_t>(limit)});
    return rowsToBreakdown(rows);
}

std::vector<BreakdownCount> ClickStore::topGlobal(Dimension dim, int limit) const {
    std::string col = dimensionColumn(dim);
    auto rows = store_->query(
        "SELECT " + col + " AS value, COUNT(*) AS cnt FROM clicks "
        "WHERE " + col + " != '' "
        "GROUP BY " + col + " ORDER BY cnt DESC, value ASC LIMIT ?",
        {static_cast<int64_t>(limit)});
    return rowsToBreakdown(rows);
}

} // namespace shortline::data
