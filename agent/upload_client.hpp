// agent/upload_client.hpp
#pragma once
#include "../common/protocol.hpp"
#include <chrono>
#include <string>
#include <curl/curl.h>

// Every outcome comes back as an UploadResult; nothing is thrown.
class Uploader {
public:
    virtual ~Uploader() = default;
    virtual UploadResult post(const std::string& body) = 0;
};

class HttpUploadClient : public Uploader {
private:
    std::string url;
    std::chrono::milliseconds timeout;
    std::string last_response;

    static size_t write_body(char* data, size_t size, size_t nmemb, void* userp);

public:
    static constexpr size_t MAX_DETAIL_LENGTH = 50;

    HttpUploadClient(std::string url, std::chrono::milliseconds timeout);

    UploadResult post(const std::string& body) override;

    const std::string& get_last_response() const { return last_response; }

    static UploadResult classify(CURLcode code, long http_code, const std::string& error_text);
};
