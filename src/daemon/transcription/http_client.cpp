#include "http_client.hpp"

#include <curl/curl.h>
#include <format>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace http {

namespace {

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

// Non-zero return aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* stop = static_cast<std::stop_token*>(userdata);
    return stop->stop_requested() ? 1 : 0;
}

} // namespace

std::expected<Response, ProviderError> post(const Request& request, std::stop_token stop) {
    if (stop.stop_requested()) {
        return std::unexpected(ProviderError{ProviderErrorKind::Aborted, 0, "cancelled"});
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected(ProviderError{ProviderErrorKind::Network, 0,
                                             "curl_easy_init failed"});
    }

    curl_mime* mime = nullptr;
    curl_slist* headers = nullptr;

    if (!request.bearer_token.empty()) {
        headers = curl_slist_append(headers,
                                    ("Authorization: Bearer " + request.bearer_token).c_str());
    }

    if (!request.form.empty()) {
        mime = curl_mime_init(curl);
        for (auto& field : request.form) {
            curl_mimepart* part = curl_mime_addpart(mime);
            curl_mime_name(part, field.name.c_str());
            curl_mime_data(part, field.data.data(), field.data.size());
            if (!field.filename.empty()) curl_mime_filename(part, field.filename.c_str());
            if (!field.mime_type.empty()) curl_mime_type(part, field.mime_type.c_str());
        }
        curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    } else {
        headers = curl_slist_append(headers, "Content-Type: application/json");
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.json_body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE,
                         static_cast<long>(request.json_body.size()));
    }

    Response response;

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(request.connect_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &stop);

    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);

    curl_mime_free(mime);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    switch (res) {
        case CURLE_OK:
            return response;
        case CURLE_ABORTED_BY_CALLBACK:
            return std::unexpected(ProviderError{ProviderErrorKind::Aborted, 0, "cancelled"});
        case CURLE_OPERATION_TIMEDOUT:
            return std::unexpected(ProviderError{
                ProviderErrorKind::Timeout, 0,
                std::format("no reply within {} ms", request.timeout.count())});
        default:
            return std::unexpected(ProviderError{
                ProviderErrorKind::Network, 0,
                std::string("curl error: ") + curl_easy_strerror(res)});
    }
}

ProviderError classify(const Response& response) {
    ProviderError err;
    err.http_status = static_cast<int>(response.status);
    err.message = std::format("HTTP {}: {}", response.status, error_message(response.body));

    if (response.status == 401 || response.status == 403) {
        err.kind = ProviderErrorKind::Auth;
    } else if (response.status == 408) {
        err.kind = ProviderErrorKind::Timeout;
    } else if (response.status == 413) {
        err.kind = ProviderErrorKind::SizeLimit;
    } else if (response.status == 429) {
        err.kind = ProviderErrorKind::RateLimited;
    } else if (response.status >= 400 && response.status < 500) {
        err.kind = ProviderErrorKind::BadRequest;
    } else {
        err.kind = ProviderErrorKind::Server;
    }
    return err;
}

std::string error_message(const std::string& body) {
    try {
        auto j = json::parse(body);
        if (j.contains("error")) {
            auto& e = j["error"];
            if (e.is_string()) return e.get<std::string>();
            if (e.is_object() && e.contains("message") && e["message"].is_string()) {
                return e["message"].get<std::string>();
            }
        }
    } catch (const json::exception&) {
        // Not JSON; report the body as-is.
    }
    constexpr size_t kMaxBody = 200;
    return body.size() > kMaxBody ? body.substr(0, kMaxBody) + "..." : body;
}

} // namespace http
