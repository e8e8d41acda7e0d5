#pragma once

#include <expected>
#include <string>
#include <vector>

namespace http {

struct FormPart {
    std::string name;
    std::string data;
    std::string filename;     // set for file uploads
    std::string content_type;
};

struct Response {
    long status = 0;
    std::string body;
};

struct Options {
    std::vector<std::string> headers;
    long timeout_s = 300;
    long connect_timeout_s = 10;
};

std::expected<Response, std::string>
post_form(const std::string& url, const std::vector<FormPart>& parts, const Options& opts);

std::expected<Response, std::string>
post_body(const std::string& url, const std::string& body, const std::string& content_type,
          const Options& opts);

// Reads a whole file into memory.
std::expected<std::string, std::string> read_file(const std::string& path);

} // namespace http
