/**
 * @file config.cpp
 * @brief 서비스 설정 구현
 */

#include "config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <limits>

namespace shortline::core {

namespace {

constexpr long long kMaxDurationMs = std::numeric_limits<long long>::max();

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trimCopy(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::optional<std::string> env(const char* key) {
    const char* value = std::getenv(key);
    if (!value || value[0] == '\0') return std::nullopt;
    return std::string(value);
}

std::optional<long long> parseInteger(const std::string& text) {
    std::string s = trimCopy(text);
    if (s.empty()) return std::nullopt;
    try {
        size_t pos = 0;
        long long value = std::stoll(s, &pos);
        if (pos != s.size()) return std::nullopt;
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

/// 정수 환경 변수 → size_t (0 이하는 오류)
bool applySize(const char* key, size_t& target, std::string& error) {
    auto raw = env(key);
    if (!raw) return true;

    auto value = parseInteger(*raw);
    if (!value) {
        std::cerr << "[Config] " << key << " 값을 해석할 수 없어 기본값 사용: " << *raw << std::endl;
        return true;
    }
    if (*value <= 0) {
        error = std::string(key) + " 값은 양수여야 합니다";
        return false;
    }
    target = static_cast<size_t>(*value);
    return true;
}

void applyBool(const char* key, bool& target) {
    auto raw = env(key);
    if (!raw) return;
    if (auto value = parseBool(*raw)) {
        target = *value;
    } else {
        std::cerr << "[Config] " << key << " 값을 해석할 수 없어 기본값 사용: " << *raw << std::endl;
    }
}

} // namespace

// ============================================================
// 도메인
// ============================================================

bool isDomainAllowed(const std::vector<std::string>& domains, const std::string& domain) {
    if (domains.empty()) return false;
    std::string wanted = toLower(domain);
    return std::any_of(domains.begin(), domains.end(), [&](const std::string& d) {
        return toLower(d) == wanted;
    });
}

bool ServiceConfig::isDomainAllowed(const std::string& domain) const {
    return core::isDomainAllowed(domains, domain);
}

// ============================================================
// 해석 헬퍼
// ============================================================

std::optional<std::chrono::milliseconds> parseDuration(const std::string& text) {
    std::string s = trimCopy(text);
    if (s.empty()) return std::nullopt;
    if (s == "0") return std::chrono::milliseconds(0);

    bool negative = false;
    size_t pos = 0;
    if (s[0] == '-' || s[0] == '+') {
        negative = s[0] == '-';
        pos = 1;
    }

    long long total_ms = 0;
    bool any = false;
    while (pos < s.size()) {
        size_t num_start = pos;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) ++pos;
        if (pos == num_start || pos - num_start > 12) return std::nullopt;
        long long value = std::stoll(s.substr(num_start, pos - num_start));

        size_t unit_start = pos;
        while (pos < s.size() && std::isalpha(static_cast<unsigned char>(s[pos]))) ++pos;
        std::string unit = s.substr(unit_start, pos - unit_start);

        long long unit_ms = 0;
        if (unit == "ms")     unit_ms = 1;
        else if (unit == "s") unit_ms = 1000;
        else if (unit == "m") unit_ms = 60 * 1000;
        else if (unit == "h") unit_ms = 60 * 60 * 1000;
        else return std::nullopt;

        // 합계가 long long 범위를 넘으면 형식 오류
        if (value > (kMaxDurationMs - total_ms) / unit_ms) return std::nullopt;
        total_ms += value * unit_ms;
        any = true;
    }
    if (!any) return std::nullopt;

    return std::chrono::milliseconds(negative ? -total_ms : total_ms);
}

std::vector<std::string> splitList(const std::string& text) {
    std::vector<std::string> items;
    size_t start = 0;
    while (start <= text.size()) {
        size_t comma = text.find(',', start);
        if (comma == std::string::npos) comma = text.size();
        std::string item = trimCopy(text.substr(start, comma - start));
        if (!item.empty()) items.push_back(item);
        start = comma + 1;
    }
    return items;
}

std::optional<bool> parseBool(const std::string& text) {
    std::string s = toLower(trimCopy(text));
    if (s == "1" || s == "true" || s == "on" || s == "yes") return true;
    if (s == "0" || s == "false" || s == "off" || s == "no") return false;
    return std::nullopt;
}

// ============================================================
// 로드 / 검증
// ============================================================

bool validateConfig(const ServiceConfig& config, std::string& error) {
    if (config.db_path.empty()) {
        error = "DB 경로가 비어있습니다";
        return false;
    }
    if (config.flush_interval.count() <= 0) {
        error = "플러시 간격은 양수여야 합니다";
        return false;
    }
    if (config.buffer_size == 0) {
        error = "버퍼 크기는 양수여야 합니다";
        return false;
    }
    if (config.cache_size == 0) {
        error = "캐시 크기는 양수여야 합니다";
        return false;
    }
    if (config.domains.empty()) {
        error = "SHORTLINE_DOMAINS 에 단축 도메인이 하나 이상 필요합니다";
        return false;
    }
    return true;
}

bool loadConfigFromEnvironment(ServiceConfig& config, std::string& error) {
    if (auto v = env("SHORTLINE_DB_PATH")) config.db_path = *v;
    if (auto v = env("SHORTLINE_GEOIP_PATH")) config.geoip_path = *v;

    if (auto v = env("SHORTLINE_FLUSH_INTERVAL")) {
        auto interval = parseDuration(*v);
        if (!interval) {
            std::cerr << "[Config] SHORTLINE_FLUSH_INTERVAL 값을 해석할 수 없어 기본값 사용: "
                      << *v << std::endl;
        } else if (interval->count() <= 0) {
            error = "SHORTLINE_FLUSH_INTERVAL 값은 양수여야 합니다";
            return false;
        } else {
            config.flush_interval = *interval;
        }
    }

    if (!applySize("SHORTLINE_BUFFER_SIZE", config.buffer_size, error)) return false;
    if (!applySize("SHORTLINE_CACHE_SIZE", config.cache_size, error)) return false;

    if (auto v = env("SHORTLINE_DOMAINS")) {
        config.domains.clear();
        for (auto& d : splitList(*v)) {
            config.domains.push_back(toLower(d));
        }
    }

    applyBool("SHORTLINE_THREAT_FEEDS", config.threat_feeds_enabled);
    applyBool("SHORTLINE_FILTER_BOTS", config.filter_automated_traffic);

    return validateConfig(config, error);
}

} // namespace shortline::core
