#pragma once

#include "provider.hpp"

#include <chrono>
#include <expected>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace http {

struct FormPart {
    std::string name;
    std::string_view data;  // must outlive the request
    std::string filename;   // set for file parts
    std::string mime_type;
};

struct Request {
    std::string url;
    std::string bearer_token;
    std::vector<FormPart> form;  // multipart/form-data when non-empty
    std::string json_body;       // application/json otherwise
    std::chrono::milliseconds timeout{60000};
    std::chrono::milliseconds connect_timeout{10000};
};

struct Response {
    long status = 0;
    std::string body;
};

// Blocking POST. Transport failures, deadline expiry and cancellation
// through stop come back as ProviderError; any HTTP status is a Response.
std::expected<Response, ProviderError> post(const Request& request, std::stop_token stop);

// Maps a non-2xx reply to the provider error taxonomy.
ProviderError classify(const Response& response);

// Pulls a human-readable message out of an OpenAI-style or whisper.cpp
// error body, falling back to the raw body.
std::string error_message(const std::string& body);

} // namespace http
