// agent/upload_client.cpp
#include "upload_client.hpp"
#include "logger.hpp"
#include <memory>
#include <mutex>
#include <stdexcept>

namespace {

std::once_flag curl_init_flag;

void ensure_curl_initialized() {
    std::call_once(curl_init_flag, []() {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("libcurl global initialization failed");
        }
    });
}

}  // namespace

std::string UploadResult::describe() const {
    switch (status) {
        case UploadStatus::Success:          return "Success";
        case UploadStatus::Timeout:          return "Timeout";
        case UploadStatus::ConnectionFailed: return "Connection failed";
        case UploadStatus::HttpError:        return "HTTP " + std::to_string(http_code);
        case UploadStatus::Error:            return "Error: " + detail;
    }
    return "Error: " + detail;
}

HttpUploadClient::HttpUploadClient(std::string u, std::chrono::milliseconds t)
    : url(std::move(u)), timeout(t) {
    if (url.empty()) {
        throw std::runtime_error("Upload endpoint URL is empty");
    }
    ensure_curl_initialized();
}

size_t HttpUploadClient::write_body(char* data, size_t size, size_t nmemb, void* userp) {
    auto* out = static_cast<std::string*>(userp);
    out->append(data, size * nmemb);
    return size * nmemb;
}

UploadResult HttpUploadClient::classify(CURLcode code, long http_code, const std::string& error_text) {
    UploadResult result{UploadStatus::Error, http_code, ""};

    switch (code) {
        case CURLE_OK:
            result.status = (http_code >= 200 && http_code < 300)
                ? UploadStatus::Success
                : UploadStatus::HttpError;
            return result;
        case CURLE_OPERATION_TIMEDOUT:
            result.status = UploadStatus::Timeout;
            return result;
        case CURLE_COULDNT_CONNECT:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            result.status = UploadStatus::ConnectionFailed;
            result.detail = error_text;
            break;
        default:
            result.detail = error_text.empty() ? curl_easy_strerror(code) : error_text;
            break;
    }

    if (result.detail.size() > MAX_DETAIL_LENGTH) {
        result.detail.resize(MAX_DETAIL_LENGTH);
    }
    return result;
}

UploadResult HttpUploadClient::post(const std::string& body) {
    last_response.clear();

    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) {
        return {UploadStatus::Error, 0, "curl_easy_init failed"};
    }

    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(
        curl_slist_append(nullptr, "Content-Type: application/json"), curl_slist_free_all);
    if (!headers) {
        return {UploadStatus::Error, 0, "curl_slist_append failed"};
    }
    curl_slist* with_expect = curl_slist_append(headers.get(), "Expect:");
    if (!with_expect) {
        return {UploadStatus::Error, 0, "curl_slist_append failed"};
    }

    char error_buffer[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &HttpUploadClient::write_body);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &last_response);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);

    CURLcode code = curl_easy_perform(curl.get());

    long http_code = 0;
    if (code == CURLE_OK) {
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);
    }

    UploadResult result = classify(code, http_code, error_buffer);
    if (result.status == UploadStatus::HttpError && !last_response.empty()) {
        Logger::debug("Collector response: " + last_response.substr(0, 200));
    }
    return result;
}
