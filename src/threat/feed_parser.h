#pragma once

/**
 * @file feed_parser.h
 * @brief 위협 피드 형식별 파서
 *
 * 모든 파서는 빈 줄과 '#' 주석을 건너뛰고, 잘못된 줄/항목은 조용히 버립니다.
 * 문서 전체가 형식에 맞지 않는 경우(JSON 파싱 오류, regions 배열 없음)만 실패로 보고합니다.
 */

#include "ip_address.h"

#include <string>
#include <vector>

namespace shortline::threat {

/// 피드 형식
enum class FeedFormat {
    CidrLines,          ///< 한 줄에 CIDR 하나
    RegionsJson,        ///< {"regions":[{"cidrs":[{"cidr":"..."}]}]}
    CsvFirstColumn,     ///< CSV, 첫 열이 CIDR
    IpLines,            ///< 한 줄에 IP 하나
    IpScoreLines        ///< "ip<공백>score"
};

/// 형식 이름 (로그용)
const char* feedFormatName(FeedFormat format);

/**
 * @brief 파싱 결과
 */
struct FeedParseResult {
    bool success{true};
    std::string error_message;
    std::vector<CidrRange> ranges;
    std::vector<IpAddress> ips;
};

class FeedParser {
public:
    /**
     * @brief 형식에 맞춰 본문 파싱
     */
    static FeedParseResult parse(FeedFormat format, const std::string& body);

    static std::vector<CidrRange> parseCidrLines(const std::string& body);
    static std::vector<CidrRange> parseCidrList(const std::vector<std::string>& entries);
    static FeedParseResult parseRegionsJson(const std::string& body);
    static std::vector<CidrRange> parseCsvFirstColumn(const std::string& body);
    static std::vector<IpAddress> parseIpLines(const std::string& body);
    static std::vector<IpAddress> parseIpScoreLines(const std::string& body);

private:
    /// 공백/주석을 제외한 줄 단위 순회
    template <typename Fn>
    static void forEachLine(const std::string& body, Fn&& fn);
};

} // namespace shortline::threat
