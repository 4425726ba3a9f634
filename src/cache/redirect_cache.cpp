/**
 * @file redirect_cache.cpp
 * @brief LRU 캐시 구현
 */

#include "redirect_cache.h"

#include <algorithm>
#include <cctype>
#include <functional>

namespace shortline::cache {

size_t CacheKeyHash::operator()(const CacheKey& key) const noexcept {
    size_t h = std::hash<std::string>{}(key.domain);
    // boost::hash_combine 방식
    h ^= std::hash<std::string>{}(key.slug) + 0x9e3779b9 + (h << 6) + (h >> 2);
    return h;
}

std::string normalizeDomain(const std::string& domain) {
    std::string lower = domain;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

// ============================================================
// 생성자 / 소멸자
// ============================================================

RedirectCache::RedirectCache(size_t capacity)
    : capacity_(std::max<size_t>(capacity, 1)) {}

RedirectCache::~RedirectCache() = default;

// ============================================================
// 조회 / 갱신
// ============================================================

std::optional<data::LinkRecord> RedirectCache::get(const std::string& domain,
                                                   const std::string& slug) {
    CacheKey key{normalizeDomain(domain), slug};

    std::lock_guard lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end()) return std::nullopt;

    // 최근 사용으로 이동
    entries_.splice(entries_.begin(), entries_, it->second);
    return it->second->link;
}

void RedirectCache::set(const std::string& domain, const std::string& slug,
                        const data::LinkRecord& link) {
    CacheKey key{normalizeDomain(domain), slug};

    std::lock_guard lock(mutex_);
    auto it = index_.find(key);
    if (it != index_.end()) {
        it->second->link = link;
        entries_.splice(entries_.begin(), entries_, it->second);
        return;
    }

    if (entries_.size() >= capacity_) {
        // 가장 오래 사용되지 않은 항목 제거
        index_.erase(entries_.back().key);
        entries_.pop_back();
    }

    entries_.push_front(Entry{key, link});
    index_.emplace(std::move(key), entries_.begin());
}

void RedirectCache::invalidate(const std::string& domain, const std::string& slug) {
    CacheKey key{normalizeDomain(domain), slug};

    std::lock_guard lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end()) return;

    entries_.erase(it->second);
    index_.erase(it);
}

void RedirectCache::clear() {
    std::lock_guard lock(mutex_);
    entries_.clear();
    index_.clear();
}

size_t RedirectCache::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

} // namespace shortline::cache
