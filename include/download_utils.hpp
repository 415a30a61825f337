#pragma once
#include <curl/curl.h>
#include <cstdio>
#include <string>
#include <vector>

struct HttpResponse {
    long status = 0;
    std::string body;
};

size_t writeCallback(void* ptr, size_t size, size_t nmemb, FILE* stream);
size_t stringWriteCallback(void* contents, size_t size, size_t nmemb, std::string* userp);

// Transport failures throw std::runtime_error; HTTP error codes are returned in `status`.
HttpResponse httpGet(const std::string& url, const std::vector<std::string>& headers);
HttpResponse httpPost(const std::string& url, const std::string& body, const std::vector<std::string>& headers);

// Streams `url` into `output_path`. Throws std::runtime_error on any failure
// and removes the partial file.
void httpDownloadFile(const std::string& url, const std::string& output_path);

std::string urlEscape(const std::string& value);
