#include "http_client.H"

#include "common/errors.H"

namespace kestrel::oe {

size_t CurlHttpClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), total_size);
    return total_size;
}

CurlHttpClient::CurlHttpClient() : curl(curl_easy_init()) {
    if (!curl) {
        throw ExchangeError(EXCHANGE_ERROR::TRANSPORT, "failed to initialize curl");
    }
}

CurlHttpClient::~CurlHttpClient() {
    if (curl) {
        curl_easy_cleanup(curl);
    }
}

http_response CurlHttpClient::perform(const http_request& request) {
    curl_easy_reset(curl);
    response_buffer.clear();

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_buffer);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "kestrel/1.0");
    curl_easy_setopt(curl, CURLOPT_TCP_NODELAY, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());

    if (request.method == "POST" || !request.body.empty()) {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    }

    struct curl_slist* headers = nullptr;
    for (const auto& header : request.headers) {
        headers = curl_slist_append(headers, header.c_str());
    }
    if (headers) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    }

    CURLcode res = curl_easy_perform(curl);
    curl_slist_free_all(headers);

    if (res == CURLE_OPERATION_TIMEDOUT) {
        throw ExchangeError(EXCHANGE_ERROR::TIMEOUT, request.method + " " + request.url + " timed out");
    }
    if (res != CURLE_OK) {
        throw ExchangeError(EXCHANGE_ERROR::TRANSPORT, std::string("curl error: ") + curl_easy_strerror(res));
    }

    http_response response;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    response.body = response_buffer;
    return response;
}

} // namespace kestrel::oe
