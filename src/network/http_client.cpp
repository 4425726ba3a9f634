/**
 * @file http_client.cpp
 * @brief 피드 다운로드용 HTTP 클라이언트 구현
 */

#include "http_client.h"

#include <curl/curl.h>
#include <iostream>
#include <mutex>

namespace shortline::network {

namespace {

constexpr const char* kUserAgent = "Shortline/0.1 (+threat-feed-refresh)";

/// 본문 누적 + 크기 상한
struct BodySink {
    std::string data;
    size_t limit{0};
    bool truncated{false};
};

size_t writeBody(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* sink = static_cast<BodySink*>(userdata);
    size_t chunk = size * nmemb;
    if (sink->data.size() + chunk > sink->limit) {
        sink->truncated = true;
        return 0;   // CURLE_WRITE_ERROR로 중단
    }
    sink->data.append(ptr, chunk);
    return chunk;
}

} // namespace

struct HttpClient::Impl {
    CURL* curl{nullptr};
    std::mutex mutex;
};

// ============================================================
// 전역 초기화/정리
// ============================================================

void HttpClient::globalInit() {
    curl_global_init(CURL_GLOBAL_ALL);
    std::cout << "[HttpClient] libcurl 초기화 (" << curl_version() << ")" << std::endl;
}

void HttpClient::globalCleanup() {
    curl_global_cleanup();
}

// ============================================================
// 생성자/소멸자
// ============================================================

HttpClient::HttpClient() : impl_(std::make_unique<Impl>()) {
    impl_->curl = curl_easy_init();
    if (!impl_->curl) {
        std::cerr << "[HttpClient] CURL 핸들 생성 실패" << std::endl;
    }
}

HttpClient::~HttpClient() {
    if (impl_->curl) {
        curl_easy_cleanup(impl_->curl);
    }
}

// ============================================================
// 요청 실행
// ============================================================

HttpResponse HttpClient::send(const HttpRequest& request) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    HttpResponse response;

    if (!impl_->curl) {
        response.error_message = "CURL 핸들이 없습니다";
        return response;
    }

    CURL* curl = impl_->curl;
    curl_easy_reset(curl);

    BodySink body;
    body.limit = request.max_body_bytes;

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, kUserAgent);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");   // 지원하는 압축 모두
    // 워커 스레드에서 호출되므로 SIGALRM 기반 타임아웃 비활성화
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeBody);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT,
                     static_cast<long>(request.connect_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT,
                     static_cast<long>(request.transfer_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, request.follow_redirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(request.max_redirects));

    CURLcode res = curl_easy_perform(curl);

    if (res != CURLE_OK) {
        response.curl_error_code = static_cast<int>(res);
        response.error_message = body.truncated
            ? "응답이 " + std::to_string(request.max_body_bytes) + "바이트를 넘습니다"
            : curl_easy_strerror(res);
        std::cerr << "[HttpClient] 요청 실패: " << response.error_message
                  << " (URL: " << request.url << ")" << std::endl;
        return response;
    }

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    response.success = true;
    response.status_code = static_cast<int>(http_code);
    response.body = std::move(body.data);
    return response;
}

HttpResponse HttpClient::get(const std::string& url, std::chrono::seconds timeout) {
    HttpRequest request;
    request.url = url;
    request.transfer_timeout = timeout;
    if (request.connect_timeout > timeout) {
        request.connect_timeout = timeout;
    }
    return send(request);
}

} // namespace shortline::network
