#include "stt/http_client.hpp"

#include <curl/curl.h>
#include <fstream>
#include <iterator>

namespace http {

namespace {

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

// Shared tail of every request: headers, timeouts, perform, cleanup.
std::expected<Response, std::string> perform(CURL* curl, const std::string& url,
                                             curl_slist* headers, const Options& opts) {
    for (const auto& h : opts.headers) {
        headers = curl_slist_append(headers, h.c_str());
    }

    Response response;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, opts.timeout_s);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, opts.connect_timeout_s);

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }
    return response;
}

} // namespace

std::expected<Response, std::string>
post_form(const std::string& url, const std::vector<FormPart>& parts, const Options& opts) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    curl_mime* mime = curl_mime_init(curl);
    for (const auto& p : parts) {
        curl_mimepart* part = curl_mime_addpart(mime);
        curl_mime_name(part, p.name.c_str());
        curl_mime_data(part, p.data.data(), p.data.size());
        if (!p.filename.empty()) curl_mime_filename(part, p.filename.c_str());
        if (!p.content_type.empty()) curl_mime_type(part, p.content_type.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);

    auto result = perform(curl, url, nullptr, opts);
    curl_mime_free(mime);
    return result;
}

std::expected<Response, std::string>
post_body(const std::string& url, const std::string& body, const std::string& content_type,
          const Options& opts) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.data());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));

    curl_slist* headers = curl_slist_append(nullptr, ("Content-Type: " + content_type).c_str());
    return perform(curl, url, headers, opts);
}

std::expected<std::string, std::string> read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return std::unexpected("could not open " + path);
    }
    return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

} // namespace http
