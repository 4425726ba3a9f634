/**
 * @file main.cpp
 * @brief shortline 메인 진입점
 *
 * QCoreApplication 초기화, 설정(환경 변수 + CLI) 로드, 저장소/캐시/위협 검사기/
 * 수집기 구성, 요청 로그 재생, 시그널 핸들링을 수행합니다.
 *
 * CLI 옵션:
 *   --db <경로>                SQLite DB 경로 (기본: ./shortline.db)
 *   --geoip <경로>             MaxMind .mmdb 경로
 *   --flush-interval <기간>    수집기 플러시 간격 (예: 500ms, 30s)
 *   --cache-size <개수>        리다이렉트 캐시 크기
 *   --buffer-size <개수>       클릭 버퍼 크기
 *   --no-threat-feeds          위협 피드 다운로드 비활성화
 *   --record-bots              봇/위협 IP 트래픽도 저장
 *   --link <domain/slug=url>   링크 생성 (반복 가능)
 *   --replay <파일|->          요청 로그(TSV) 재생 후 클릭 리포트 출력
 */

#include <QCoreApplication>
#include <QCommandLineParser>
#include <QCommandLineOption>
#include <QStringList>

#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "analytics/analytics_collector.h"
#include "cache/redirect_cache.h"
#include "core/config.h"
#include "data/click_store.h"
#include "data/data_store.h"
#include "data/link_store.h"
#include "geo/geo_resolver.h"
#include "network/http_client.h"
#include "redirect/link_service.h"
#include "redirect/redirect_service.h"
#include "threat/threat_checker.h"

using namespace shortline;

namespace {

// ============================================================
// 전역 상태 (시그널 핸들러에서 접근)
// ============================================================

QCoreApplication* g_app = nullptr;

/**
 * @brief UNIX 시그널 핸들러
 *
 * SIGINT(Ctrl+C), SIGTERM 수신 시 Qt 이벤트 루프를 종료합니다.
 */
void signalHandler(int signum) {
    std::cerr << "\n[Shortline] 시그널 " << signum << " 수신, 종료 중..." << std::endl;
    if (g_app) {
        g_app->quit();
    }
}

void installSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
#ifndef _WIN32
    std::signal(SIGPIPE, SIG_IGN);
#endif
}

// ============================================================
// 링크 시드
// ============================================================

/**
 * @brief "domain/slug=url" 해석 후 생성
 */
bool seedLink(redirect::LinkService& links, const std::string& link_arg) {
    auto eq = link_arg.find('=');
    auto slash = link_arg.find('/');
    if (eq == std::string::npos || slash == std::string::npos || slash > eq) {
        std::cerr << "[Shortline] --link 형식 오류 (domain/slug=url): " << link_arg << std::endl;
        return false;
    }

    redirect::CreateLinkRequest request;
    request.domain = link_arg.substr(0, slash);
    request.slug = link_arg.substr(slash + 1, eq - slash - 1);
    request.destination = link_arg.substr(eq + 1);

    auto result = links.createLink(request);
    if (result.status == redirect::LinkOpStatus::Conflict) {
        std::cout << "[Shortline] 이미 존재하는 링크: " << request.domain << "/"
                  << request.slug << std::endl;
        return true;
    }
    if (!result.ok()) {
        std::cerr << "[Shortline] 링크 생성 실패 (" << link_arg << "): "
                  << redirect::linkOpStatusName(result.status) << " " << result.error << std::endl;
        return false;
    }

    std::cout << "[Shortline] 링크 생성: " << result.link.shortUrl() << " -> "
              << result.link.destination << std::endl;
    return true;
}

// ============================================================
// 요청 로그 재생
// ============================================================

/**
 * @brief 한 줄(TSV) → 요청
 *
 * 형식: host \t path \t remote_addr \t user_agent \t referer (뒤쪽 필드 생략 가능)
 */
redirect::RedirectRequest parseReplayLine(const std::string& line) {
    std::vector<std::string> fields;
    std::istringstream stream(line);
    std::string field;
    while (std::getline(stream, field, '\t')) {
        fields.push_back(field);
    }
    fields.resize(5);

    redirect::RedirectRequest request;
    request.host = fields[0];
    request.path = fields[1];
    request.remote_addr = fields[2];
    request.user_agent = fields[3];
    request.referer = fields[4];
    return request;
}

int replay(redirect::RedirectService& service, std::istream& input) {
    int handled = 0;
    std::string line;
    while (std::getline(input, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;

        auto request = parseReplayLine(line);
        auto response = service.handle(request);

        std::cout << response.status << "\t" << request.host << request.path;
        if (response.isRedirect()) {
            std::cout << "\t-> " << response.location;
        } else {
            std::cout << "\t" << response.body;
        }
        std::cout << std::endl;
        ++handled;
    }
    return handled;
}

// ============================================================
// 리포트
// ============================================================

void printBreakdown(const char* label, const std::vector<data::BreakdownCount>& rows) {
    if (rows.empty()) return;
    std::cout << "    " << label << ":";
    for (const auto& row : rows) {
        std::cout << " " << row.value << "(" << row.count << ")";
    }
    std::cout << std::endl;
}

void printReport(data::LinkStore& links, data::ClickStore& clicks) {
    std::cout << "\n=== 클릭 리포트 ===" << std::endl;
    std::cout << "활성 링크: " << links.activeLinkCount()
              << ", 전체 클릭: " << clicks.totalClicks() << std::endl;

    auto top = clicks.topLinks(5);
    if (!top.empty()) {
        std::cout << "상위 링크:" << std::endl;
        for (const auto& entry : top) {
            std::cout << "  " << entry.link.shortUrl() << " : " << entry.clicks << " 클릭" << std::endl;
        }
    }

    auto page = links.listLinks(100);
    std::vector<int64_t> ids;
    ids.reserve(page.links.size());
    for (const auto& link : page.links) ids.push_back(link.id);
    auto counts = clicks.clickCountsForLinks(ids);

    std::cout << "링크 " << page.links.size() << "/" << page.total << "개:" << std::endl;
    for (const auto& link : page.links) {
        auto it = counts.find(link.id);
        std::cout << "  " << link.shortUrl() << (link.is_active ? "" : " (비활성)")
                  << " -> " << link.destination
                  << " : " << (it == counts.end() ? 0 : it->second) << " 클릭" << std::endl;
        printBreakdown("referer", clicks.topForLink(link.id, data::Dimension::RefererDomain, 5));
        printBreakdown("country", clicks.topForLink(link.id, data::Dimension::Country, 5));
        printBreakdown("browser", clicks.topForLink(link.id, data::Dimension::Browser, 5));
        printBreakdown("device", clicks.topForLink(link.id, data::Dimension::DeviceType, 5));
    }
}

} // anonymous namespace


// ============================================================
// 메인 함수
// ============================================================

int main(int argc, char* argv[]) {
    // ---- Qt 애플리케이션 초기화 ----
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("shortline");
    QCoreApplication::setApplicationVersion("0.1.0");

    g_app = &app;

    // ---- 설정: 기본값 → 환경 변수 ----
    core::ServiceConfig config;
    std::string config_error;
    if (!core::loadConfigFromEnvironment(config, config_error)) {
        std::cerr << "[Shortline] 설정 오류: " << config_error << std::endl;
        return 1;
    }

    // ---- CLI 인수 파싱 ----
    QCommandLineParser parser;
    parser.setApplicationDescription("shortline: 단축 링크 리다이렉트 + 클릭 분석 코어");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption dbOption("db", "SQLite DB 경로", "path");
    QCommandLineOption geoipOption("geoip", "MaxMind .mmdb 경로", "path");
    QCommandLineOption flushOption("flush-interval", "플러시 간격 (예: 500ms, 30s, 5m)", "duration");
    QCommandLineOption cacheOption("cache-size", "리다이렉트 캐시 크기", "count");
    QCommandLineOption bufferOption("buffer-size", "클릭 버퍼 크기", "count");
    QCommandLineOption noThreatOption("no-threat-feeds", "위협 피드 다운로드 비활성화");
    QCommandLineOption recordBotsOption("record-bots", "봇/위협 IP 트래픽도 저장");
    QCommandLineOption linkOption("link", "링크 생성 (domain/slug=url, 반복 가능)", "link");
    QCommandLineOption replayOption("replay", "요청 로그(TSV) 재생 (파일 또는 -)", "file");

    parser.addOption(dbOption);
    parser.addOption(geoipOption);
    parser.addOption(flushOption);
    parser.addOption(cacheOption);
    parser.addOption(bufferOption);
    parser.addOption(noThreatOption);
    parser.addOption(recordBotsOption);
    parser.addOption(linkOption);
    parser.addOption(replayOption);

    parser.process(app);

    // ---- 설정: CLI 덮어쓰기 ----
    if (parser.isSet(dbOption)) config.db_path = parser.value(dbOption).toStdString();
    if (parser.isSet(geoipOption)) config.geoip_path = parser.value(geoipOption).toStdString();
    if (parser.isSet(flushOption)) {
        auto interval = core::parseDuration(parser.value(flushOption).toStdString());
        if (!interval) {
            std::cerr << "[Shortline] --flush-interval 형식 오류" << std::endl;
            return 1;
        }
        config.flush_interval = *interval;
    }
    if (parser.isSet(cacheOption)) {
        bool ok = false;
        qlonglong value = parser.value(cacheOption).toLongLong(&ok);
        if (!ok || value <= 0) {
            std::cerr << "[Shortline] --cache-size 는 양수여야 합니다" << std::endl;
            return 1;
        }
        config.cache_size = static_cast<size_t>(value);
    }
    if (parser.isSet(bufferOption)) {
        bool ok = false;
        qlonglong value = parser.value(bufferOption).toLongLong(&ok);
        if (!ok || value <= 0) {
            std::cerr << "[Shortline] --buffer-size 는 양수여야 합니다" << std::endl;
            return 1;
        }
        config.buffer_size = static_cast<size_t>(value);
    }
    if (parser.isSet(noThreatOption)) config.threat_feeds_enabled = false;
    if (parser.isSet(recordBotsOption)) config.filter_automated_traffic = false;

    if (!core::validateConfig(config, config_error)) {
        std::cerr << "[Shortline] 설정 오류: " << config_error << std::endl;
        return 1;
    }

    installSignalHandlers();
    network::HttpClient::globalInit();

    // ---- 저장소 ----
    auto store = std::make_shared<data::DataStore>();
    if (!store->open(config.db_path)) {
        std::cerr << "[Shortline] DB 열기 실패: " << store->lastError() << std::endl;
        network::HttpClient::globalCleanup();
        return 1;
    }

    // 클릭 배치 쓰기 전용 연결 (WAL: 쓰기 중에도 조회 연결은 대기하지 않음)
    auto click_db = store;
    if (config.db_path != ":memory:") {
        click_db = std::make_shared<data::DataStore>();
        if (!click_db->open(config.db_path)) {
            std::cerr << "[Shortline] 클릭 DB 연결 실패: " << click_db->lastError() << std::endl;
            network::HttpClient::globalCleanup();
            return 1;
        }
    } else {
        std::cout << "[Shortline] 메모리 DB: 조회와 클릭 저장이 연결 하나를 공유" << std::endl;
    }

    auto link_store = std::make_shared<data::LinkStore>(store);
    auto click_store = std::make_shared<data::ClickStore>(click_db);
    if (!link_store->initialize()) {
        std::cerr << "[Shortline] 스키마 초기화 실패: " << link_store->lastError() << std::endl;
        network::HttpClient::globalCleanup();
        return 1;
    }
    if (!click_store->initialize()) {
        std::cerr << "[Shortline] 스키마 초기화 실패: " << click_store->lastError() << std::endl;
        network::HttpClient::globalCleanup();
        return 1;
    }
    std::cout << "[Shortline] DB: " << config.db_path
              << " (스키마 버전 " << store->currentSchemaVersion() << ")" << std::endl;

    // ---- 공유 서비스 ----
    auto redirect_cache = std::make_shared<cache::RedirectCache>(config.cache_size);
    auto geo_resolver = std::make_shared<geo::GeoResolver>(config.geoip_path);

    std::shared_ptr<threat::ThreatChecker> threat_checker;
    if (config.threat_feeds_enabled) {
        threat_checker = std::make_shared<threat::ThreatChecker>();
    } else {
        std::cout << "[Shortline] 위협 피드 비활성화" << std::endl;
    }

    analytics::CollectorConfig collector_config;
    collector_config.buffer_size = config.buffer_size;
    collector_config.flush_interval = config.flush_interval;
    collector_config.filter_automated_traffic = config.filter_automated_traffic;
    auto collector = std::make_shared<analytics::AnalyticsCollector>(
        click_store, geo_resolver, threat_checker, collector_config);

    redirect::LinkService link_service(link_store, redirect_cache, config.domains);
    redirect::RedirectService redirect_service(link_store, redirect_cache, collector);

    // ---- 링크 시드 ----
    int exit_code = 0;
    for (const auto& link_arg : parser.values(linkOption)) {
        if (!seedLink(link_service, link_arg.toStdString())) exit_code = 1;
    }

    // ---- 실행 ----
    if (parser.isSet(replayOption)) {
        // 재생 모드: 위협 목록을 먼저 한 번 동기 로드
        if (threat_checker) threat_checker->refreshNow();

        std::string source = parser.value(replayOption).toStdString();
        int handled = 0;
        if (source == "-") {
            handled = replay(redirect_service, std::cin);
        } else {
            std::ifstream file(source);
            if (!file.is_open()) {
                std::cerr << "[Shortline] 재생 파일 열기 실패: " << source << std::endl;
                exit_code = 1;
            } else {
                handled = replay(redirect_service, file);
            }
        }
        std::cout << "[Shortline] 요청 " << handled << "건 재생" << std::endl;

        collector->shutdown();
        printReport(*link_store, *click_store);
    } else {
        // 서비스 모드: 위협 피드 주기 갱신, 시그널까지 대기
        if (threat_checker) threat_checker->start();
        std::cout << "[Shortline] 실행 중 (캐시 " << config.cache_size
                  << ", 버퍼 " << config.buffer_size << ")" << std::endl;
        int rc = app.exec();
        if (rc != 0) exit_code = rc;
        collector->shutdown();
    }

    // ---- 정리 ----
    if (threat_checker) threat_checker->stop();

    auto stats = collector->stats();
    std::cout << "[Shortline] 수집 통계: push " << stats.pushed << ", 버림 " << stats.dropped
              << ", 필터링 " << stats.filtered << ", 저장 " << stats.persisted
              << ", 실패 배치 " << stats.failed_batches << std::endl;

    click_db->close();
    store->close();
    network::HttpClient::globalCleanup();

    std::cout << "[Shortline] 정상 종료 (코드: " << exit_code << ")" << std::endl;
    return exit_code;
}
