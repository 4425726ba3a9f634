/**
 * @file feed_parser.cpp
 * @brief 위협 피드 파서 구현
 */

#include "feed_parser.h"

#include <nlohmann/json.hpp>

#include <sstream>

namespace shortline::threat {

using json = nlohmann::json;

const char* feedFormatName(FeedFormat format) {
    switch (format) {
        case FeedFormat::CidrLines:      return "cidr-lines";
        case FeedFormat::RegionsJson:    return "regions-json";
        case FeedFormat::CsvFirstColumn: return "csv";
        case FeedFormat::IpLines:        return "ip-lines";
        case FeedFormat::IpScoreLines:   return "ip-score";
    }
    return "unknown";
}

template <typename Fn>
void FeedParser::forEachLine(const std::string& body, Fn&& fn) {
    std::istringstream stream(body);
    std::string raw;
    while (std::getline(stream, raw)) {
        std::string line = trim(raw);
        if (line.empty() || line[0] == '#') continue;
        fn(line);
    }
}

// ============================================================
// 공개 API
// ============================================================

FeedParseResult FeedParser::parse(FeedFormat format, const std::string& body) {
    switch (format) {
        case FeedFormat::CidrLines: {
            FeedParseResult result;
            result.ranges = parseCidrLines(body);
            return result;
        }
        case FeedFormat::RegionsJson:
            return parseRegionsJson(body);
        case FeedFormat::CsvFirstColumn: {
            FeedParseResult result;
            result.ranges = parseCsvFirstColumn(body);
            return result;
        }
        case FeedFormat::IpLines: {
            FeedParseResult result;
            result.ips = parseIpLines(body);
            return result;
        }
        case FeedFormat::IpScoreLines: {
            FeedParseResult result;
            result.ips = parseIpScoreLines(body);
            return result;
        }
    }

    FeedParseResult failed;
    failed.success = false;
    failed.error_message = "알 수 없는 피드 형식";
    return failed;
}

std::vector<CidrRange> FeedParser::parseCidrLines(const std::string& body) {
    std::vector<CidrRange> ranges;
    forEachLine(body, [&](const std::string& line) {
        if (auto range = CidrRange::parse(line)) ranges.push_back(*range);
    });
    return ranges;
}

std::vector<CidrRange> FeedParser::parseCidrList(const std::vector<std::string>& entries) {
    std::vector<CidrRange> ranges;
    ranges.reserve(entries.size());
    for (const auto& entry : entries) {
        std::string line = trim(entry);
        if (line.empty() || line[0] == '#') continue;
        if (auto range = CidrRange::parse(line)) ranges.push_back(*range);
    }
    return ranges;
}

FeedParseResult FeedParser::parseRegionsJson(const std::string& body) {
    FeedParseResult result;

    // 예외 없이 파싱: 실패 시 discarded 값
    const json doc = json::parse(body, nullptr, false);
    if (doc.is_discarded()) {
        result.success = false;
        result.error_message = "JSON 파싱 실패";
        return result;
    }

    // 최상위 객체 + "regions" 배열이 있어야 유효한 문서
    if (!doc.is_object() || !doc.contains("regions") || !doc["regions"].is_array()) {
        result.success = false;
        result.error_message = "JSON 문서에 regions 배열이 없습니다";
        return result;
    }

    // regions[].cidrs[].cidr 만 수집, 형식이 다른 항목은 건너뜀
    std::vector<std::string> entries;
    for (const auto& region : doc["regions"]) {
        if (!region.is_object()) continue;
        auto cidrs = region.find("cidrs");
        if (cidrs == region.end() || !cidrs->is_array()) continue;
        for (const auto& item : *cidrs) {
            if (!item.is_object()) continue;
            auto cidr = item.find("cidr");
            if (cidr != item.end() && cidr->is_string()) {
                entries.push_back(cidr->get<std::string>());
            }
        }
    }
    result.ranges = parseCidrList(entries);
    return result;
}

std::vector<CidrRange> FeedParser::parseCsvFirstColumn(const std::string& body) {
    std::vector<CidrRange> ranges;
    forEachLine(body, [&](const std::string& line) {
        std::string first = line.substr(0, line.find(','));
        // 따옴표로 감싼 필드
        if (first.size() >= 2 && first.front() == '"' && first.back() == '"') {
            first = first.substr(1, first.size() - 2);
        }
        if (auto range = CidrRange::parse(first)) ranges.push_back(*range);
    });
    return ranges;
}

std::vector<IpAddress> FeedParser::parseIpLines(const std::string& body) {
    std::vector<IpAddress> ips;
    forEachLine(body, [&](const std::string& line) {
        if (auto ip = IpAddress::parse(line)) ips.push_back(*ip);
    });
    return ips;
}

std::vector<IpAddress> FeedParser::parseIpScoreLines(const std::string& body) {
    std::vector<IpAddress> ips;
    forEachLine(body, [&](const std::string& line) {
        std::istringstream fields(line);
        std::string first;
        fields >> first;
        if (auto ip = IpAddress::parse(first)) ips.push_back(*ip);
    });
    return ips;
}

} // namespace shortline::threat
