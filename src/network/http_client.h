#pragma once

/**
 * @file http_client.h
 * @brief 피드 다운로드용 HTTP 클라이언트 (libcurl 래퍼)
 *
 * 위협 피드는 수 MB 단위의 평문 목록이므로 GET 한 가지만 지원하고,
 * 응답 본문 크기 상한과 압축 전송(gzip/deflate)을 기본으로 켭니다.
 */

#include <string>
#include <memory>
#include <chrono>
#include <cstddef>

namespace shortline::network {

/**
 * @brief GET 요청 옵션
 */
struct HttpRequest {
    std::string url;

    std::chrono::seconds connect_timeout{10};
    std::chrono::seconds transfer_timeout{30};

    size_t max_body_bytes{64 * 1024 * 1024};    ///< 초과 시 전송 중단

    bool follow_redirects{true};
    int max_redirects{5};
};

/**
 * @brief HTTP 응답
 *
 * success는 전송 성공 여부이고, HTTP 상태는 status_code로 따로 확인합니다.
 */
struct HttpResponse {
    int status_code{0};
    std::string body;

    bool success{false};
    std::string error_message;
    int curl_error_code{0};

    /**
     * @brief 전송 성공 + 2xx
     */
    [[nodiscard]] bool isOk() const {
        return success && status_code >= 200 && status_code < 300;
    }
};

/**
 * @brief HTTP 클라이언트
 *
 * 인스턴스마다 CURL 핸들 하나를 소유하며 send()는 내부 뮤텍스로 직렬화됩니다.
 * 피드를 병렬로 받을 때는 작업마다 인스턴스를 따로 만듭니다.
 */
class HttpClient {
public:
    HttpClient();
    ~HttpClient();

    // 복사 금지
    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /**
     * @brief libcurl 전역 초기화 (프로세스당 한 번, 스레드 생성 전에 호출)
     */
    static void globalInit();

    static void globalCleanup();

    [[nodiscard]] HttpResponse send(const HttpRequest& request);

    /**
     * @brief 기본 옵션 GET
     * @param timeout 전체 전송 타임아웃 (연결 타임아웃도 이 값을 넘지 않음)
     */
    [[nodiscard]] HttpResponse get(const std::string& url,
                                   std::chrono::seconds timeout = std::chrono::seconds{30});

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace shortline::network
