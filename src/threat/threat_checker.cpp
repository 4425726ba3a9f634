/**
 * @file threat_checker.cpp
 * @brief IP 평판 검사기 구현
 */

#include "threat_checker.h"

#include <future>
#include <iostream>

namespace shortline::threat {

namespace {

/**
 * @brief 소스 하나를 가져와 파싱 (예외는 여기서 흡수하지 않음)
 */
FeedParseResult fetchSource(const ThreatSource& source, const FetchCallback& fetch,
                            std::chrono::seconds timeout) {
    FeedParseResult result;

    if (source.url.empty()) {
        result.ranges = FeedParser::parseCidrList(source.static_entries);
        return result;
    }

    network::HttpResponse response = fetch(source.url, timeout);
    if (!response.success) {
        result.success = false;
        result.error_message = response.error_message.empty()
            ? "전송 실패" : response.error_message;
        return result;
    }
    if (!response.isOk()) {
        result.success = false;
        result.error_message = "HTTP " + std::to_string(response.status_code);
        return result;
    }

    return FeedParser::parse(source.format, response.body);
}

FetchCallback defaultFetch() {
    return [](const std::string& url, std::chrono::seconds timeout) {
        network::HttpClient client;
        return client.get(url, timeout);
    };
}

} // namespace

// ============================================================
// 기본 소스
// ============================================================

std::vector<ThreatSource> defaultThreatSources() {
    return {
        // 데이터센터 대역
        {"datacenters",
         "https://raw.githubusercontent.com/jhassine/server-ip-addresses/master/data/datacenters.txt",
         FeedFormat::CidrLines, {}},
        {"oci", "https://docs.cloud.oracle.com/en-us/iaas/tools/public_ip_ranges.json",
         FeedFormat::RegionsJson, {}},
        {"digitalocean", "https://www.digitalocean.com/geo/google.csv",
         FeedFormat::CsvFirstColumn, {}},
        {"vultr", "https://geofeed.constant.com/?text",
         FeedFormat::CsvFirstColumn, {}},
        {"akamai", "", FeedFormat::CidrLines, {
            "23.32.0.0/11", "23.192.0.0/11", "2.16.0.0/13", "104.64.0.0/10",
            "184.24.0.0/13", "23.0.0.0/12", "95.100.0.0/15", "92.122.0.0/15",
            "184.50.0.0/15", "88.221.0.0/16", "23.64.0.0/14", "72.246.0.0/15",
            "96.16.0.0/15", "96.6.0.0/15", "69.192.0.0/16", "23.72.0.0/13",
            "173.222.0.0/15", "118.214.0.0/16", "184.84.0.0/14",
        }},
        {"scaleway", "", FeedFormat::CidrLines, {
            "62.210.0.0/16", "195.154.0.0/16", "212.129.0.0/18", "62.4.0.0/19",
            "212.83.128.0/19", "212.83.160.0/19", "212.47.224.0/19", "163.172.0.0/16",
            "51.15.0.0/16", "151.115.0.0/16", "51.158.0.0/15",
        }},

        // 위협 / 익명화 IP
        {"tor", "https://check.torproject.org/torbulkexitlist", FeedFormat::IpLines, {}},
        {"ipsum", "https://raw.githubusercontent.com/stamparm/ipsum/master/ipsum.txt",
         FeedFormat::IpScoreLines, {}},
        {"greensnow", "https://blocklist.greensnow.co/greensnow.txt", FeedFormat::IpLines, {}},
    };
}

// ============================================================
// 생성자 / 소멸자
// ============================================================

ThreatChecker::ThreatChecker(ThreatCheckerConfig config)
    : config_(std::move(config)),
      index_(std::make_shared<ThreatIndex>()) {
    if (!config_.fetch) {
        config_.fetch = defaultFetch();
    }
}

ThreatChecker::~ThreatChecker() {
    stop();
}

// ============================================================
// 조회
// ============================================================

std::shared_ptr<const ThreatIndex> ThreatChecker::snapshot() const {
    std::shared_lock lock(index_mutex_);
    return index_;
}

bool ThreatChecker::isBlocked(const std::string& ip) const {
    auto addr = IpAddress::parse(ip);
    if (!addr) return false;

    auto index = snapshot();

    // 개별 IP 먼저 (O(1))
    if (index->blocked_ips.count(addr->toString()) > 0) return true;

    // 대역 선형 탐색
    for (const auto& range : index->ranges) {
        if (range.contains(*addr)) return true;
    }
    return false;
}

size_t ThreatChecker::rangeCount() const {
    return snapshot()->ranges.size();
}

size_t ThreatChecker::blockedIpCount() const {
    return snapshot()->blocked_ips.size();
}

// ============================================================
// 갱신
// ============================================================

RefreshSummary ThreatChecker::refreshNow() {
    std::lock_guard refresh_lock(refresh_mutex_);
    RefreshSummary summary;

    // 소스별 병렬 다운로드
    std::vector<std::future<FeedParseResult>> futures;
    futures.reserve(config_.sources.size());
    for (const auto& source : config_.sources) {
        futures.push_back(std::async(std::launch::async, fetchSource,
                                     std::cref(source), std::cref(config_.fetch),
                                     config_.fetch_timeout));
    }

    std::vector<CidrRange> new_ranges;
    std::unordered_set<std::string> new_ips;

    for (size_t i = 0; i < futures.size(); ++i) {
        const auto& source = config_.sources[i];
        FeedParseResult result;
        try {
            result = futures[i].get();
        } catch (const std::exception& e) {
            result.success = false;
            result.error_message = std::string("예외: ") + e.what();
        }

        if (!result.success) {
            summary.failed_sources++;
            summary.errors.push_back(source.name + ": " + result.error_message);
            continue;
        }

        new_ranges.insert(new_ranges.end(), result.ranges.begin(), result.ranges.end());
        for (const auto& ip : result.ips) {
            new_ips.insert(ip.toString());
        }
    }

    summary.fetched_ranges = new_ranges.size();
    summary.fetched_ips = new_ips.size();

    if (!summary.errors.empty()) {
        std::cerr << "[ThreatChecker] 부분 갱신 (" << summary.failed_sources << "개 소스 실패):";
        for (const auto& err : summary.errors) {
            std::cerr << " [" << err << "]";
        }
        std::cerr << std::endl;
    }

    // 비어있지 않은 항목만 교체
    {
        std::unique_lock lock(index_mutex_);
        auto next = std::make_shared<ThreatIndex>();
        if (!new_ranges.empty()) {
            next->ranges = std::move(new_ranges);
            summary.ranges_replaced = true;
        } else {
            next->ranges = index_->ranges;
        }
        if (!new_ips.empty()) {
            next->blocked_ips = std::move(new_ips);
            summary.ips_replaced = true;
        } else {
            next->blocked_ips = index_->blocked_ips;
        }
        index_ = std::move(next);
    }

    std::cout << "[ThreatChecker] 로드 완료: CIDR " << summary.fetched_ranges
              << "개, 차단 IP " << summary.fetched_ips << "개" << std::endl;

    return summary;
}

// ============================================================
// 수명 주기
// ============================================================

void ThreatChecker::start() {
    std::lock_guard lifecycle(lifecycle_mutex_);
    if (running_) return;

    {
        std::lock_guard lock(worker_mutex_);
        stop_requested_ = false;
    }
    running_ = true;
    worker_ = std::thread(&ThreatChecker::refreshLoop, this);
}

void ThreatChecker::stop() {
    std::lock_guard lifecycle(lifecycle_mutex_);
    if (!running_) return;

    {
        std::lock_guard lock(worker_mutex_);
        stop_requested_ = true;
    }
    worker_cv_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }
    running_ = false;
}

void ThreatChecker::refreshLoop() {
    while (true) {
        refreshNow();

        std::unique_lock lock(worker_mutex_);
        if (worker_cv_.wait_for(lock, config_.refresh_interval,
                                [this] { return stop_requested_; })) {
            break;
        }
    }
}

} // namespace shortline::threat
