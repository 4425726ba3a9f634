/**
 * @file analytics_collector.cpp
 * @brief 비차단 버퍼 기반 클릭 수집기 구현
 */

#include "analytics_collector.h"
#include "bot_signature_matcher.h"
#include "user_agent_parser.h"
#include "../geo/geo_resolver.h"
#include "../threat/threat_checker.h"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <vector>

namespace shortline::analytics {

// ============================================================
// 생성자 / 소멸자
// ============================================================

AnalyticsCollector::AnalyticsCollector(std::shared_ptr<ClickSink> sink,
                                       std::shared_ptr<const geo::GeoResolver> geo,
                                       std::shared_ptr<const threat::ThreatChecker> threat,
                                       CollectorConfig config)
    : sink_(std::move(sink)),
      geo_(std::move(geo)),
      threat_(std::move(threat)),
      config_(config) {
    config_.buffer_size = std::max<size_t>(config_.buffer_size, 1);
    if (config_.flush_interval.count() <= 0) {
        config_.flush_interval = std::chrono::milliseconds(30000);
    }
    worker_ = std::thread(&AnalyticsCollector::flushLoop, this);
}

AnalyticsCollector::~AnalyticsCollector() {
    shutdown();
}

// ============================================================
// 요청 경로
// ============================================================

bool AnalyticsCollector::push(RawClickEvent event) {
    {
        std::lock_guard lock(buffer_mutex_);
        if (accepting_ && buffer_.size() < config_.buffer_size) {
            buffer_.push_back(std::move(event));
            pushed_++;
            return true;
        }
    }
    dropped_++;
    return false;
}

size_t AnalyticsCollector::pending() const {
    std::lock_guard lock(buffer_mutex_);
    return buffer_.size();
}

CollectorStats AnalyticsCollector::stats() const {
    CollectorStats s;
    s.pushed = pushed_.load();
    s.dropped = dropped_.load();
    s.filtered = filtered_.load();
    s.persisted = persisted_.load();
    s.failed_batches = failed_batches_.load();
    return s;
}

// ============================================================
// 수명 주기
// ============================================================

void AnalyticsCollector::shutdown() {
    std::lock_guard lifecycle(lifecycle_mutex_);
    {
        std::lock_guard lock(buffer_mutex_);
        accepting_ = false;
        stop_requested_ = true;
    }
    buffer_cv_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }
}

void AnalyticsCollector::flushLoop() {
    while (true) {
        bool stopping = false;
        {
            std::unique_lock lock(buffer_mutex_);
            stopping = buffer_cv_.wait_for(lock, config_.flush_interval,
                                           [this] { return stop_requested_; });
        }

        flush();

        if (stopping) break;
    }
}

// ============================================================
// 플러시
// ============================================================

bool AnalyticsCollector::shouldFilter(const RawClickEvent& event) const {
    if (!config_.filter_automated_traffic) return false;
    if (BotSignatureMatcher::isBot(event.user_agent)) return true;
    if (threat_ && threat_->isBlocked(event.ip)) return true;
    return false;
}

void AnalyticsCollector::flush() {
    std::deque<RawClickEvent> batch;
    {
        std::lock_guard lock(buffer_mutex_);
        batch.swap(buffer_);
    }
    if (batch.empty()) return;

    std::vector<EnrichedClickRecord> records;
    records.reserve(batch.size());
    uint64_t filtered = 0;

    for (const auto& event : batch) {
        if (shouldFilter(event)) {
            filtered++;
            continue;
        }
        records.push_back(enrich(event, geo_.get()));
    }
    filtered_ += filtered;

    if (records.empty()) {
        std::cout << "[AnalyticsCollector] 플러시: 저장할 클릭 없음 (필터링 "
                  << filtered << "건)" << std::endl;
        return;
    }

    if (!sink_ || !sink_->batchInsert(records)) {
        failed_batches_++;
        std::cerr << "[AnalyticsCollector] 플러시 실패, " << records.size()
                  << "건 버림: " << (sink_ ? sink_->lastError() : "저장소 없음") << std::endl;
        return;
    }

    persisted_ += records.size();
    std::cout << "[AnalyticsCollector] 플러시: " << records.size() << "건 저장, "
              << filtered << "건 필터링" << std::endl;
}

// ============================================================
// 보강
// ============================================================

EnrichedClickRecord AnalyticsCollector::enrich(const RawClickEvent& event,
                                               const geo::GeoResolver* geo) {
    EnrichedClickRecord record;
    record.link_id = event.link_id;
    record.timestamp = event.timestamp;
    record.ip = event.ip;
    record.user_agent = event.user_agent;
    record.referer = event.referer;

    UserAgentInfo ua = UserAgentParser::parse(event.user_agent);
    record.browser = ua.browser;
    record.browser_version = ua.browser_version;
    record.os = ua.os;

    // 봇 > 모바일 > 데스크톱
    if (ua.bot) {
        record.device_type = "bot";
    } else if (ua.mobile) {
        record.device_type = "mobile";
    } else {
        record.device_type = "desktop";
    }

    record.referer_domain = refererHostname(event.referer);

    if (geo) {
        geo::GeoResult g = geo->lookup(event.ip);
        record.country = g.country;
        record.city = g.city;
        record.region = g.region;
        record.latitude = g.latitude;
        record.longitude = g.longitude;
    }

    return record;
}

std::string AnalyticsCollector::refererHostname(const std::string& referer) {
    if (referer.empty()) return {};

    // scheme://authority 또는 //authority 형식만 호스트를 가짐
    size_t start = 0;
    auto scheme_end = referer.find("://");
    if (scheme_end != std::string::npos) {
        std::string scheme = referer.substr(0, scheme_end);
        if (scheme.empty() ||
            !std::all_of(scheme.begin(), scheme.end(), [](unsigned char c) {
                return std::isalnum(c) || c == '+' || c == '-' || c == '.';
            })) {
            return {};
        }
        start = scheme_end + 3;
    } else if (referer.rfind("//", 0) == 0) {
        start = 2;
    } else {
        return {};
    }

    auto end = referer.find_first_of("/?#", start);
    std::string authority = referer.substr(start, end == std::string::npos
                                                      ? std::string::npos : end - start);

    // userinfo 제거
    auto at = authority.rfind('@');
    if (at != std::string::npos) authority = authority.substr(at + 1);

    std::string host;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) return {};
        host = authority.substr(1, close - 1);
    } else {
        auto colon = authority.find(':');
        host = authority.substr(0, colon);
    }

    std::transform(host.begin(), host.end(), host.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return host;
}

} // namespace shortline::analytics
