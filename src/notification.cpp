#include "notification.hpp"
#include <curl/curl.h>
#include <stdexcept>

namespace {

size_t discardResponse([[maybe_unused]] void* contents, size_t size, size_t nmemb, [[maybe_unused]] void* userp) {
    return size * nmemb;
}

} // namespace

WebhookNotificationStrategy::WebhookNotificationStrategy(std::string url, long timeoutSeconds)
    : url(std::move(url)), timeoutSeconds(timeoutSeconds) {
    if (this->url.empty()) {
        throw std::runtime_error("Webhook notification requires a URL");
    }
}

std::string WebhookNotificationStrategy::buildPayload(const std::string& event,
                                                      const std::string& message,
                                                      const Json::Value& details) {
    Json::Value body;
    body["event"] = event;
    body["message"] = message;
    body["details"] = details.isNull() ? Json::Value(Json::objectValue) : details;

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, body);
}

std::expected<void, std::string> WebhookNotificationStrategy::notify(const std::string& event,
                                                                     const std::string& message,
                                                                     const Json::Value& details) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("Failed to initialize CURL");
    }

    std::string payload = buildPayload(event, message, details);
    struct curl_slist* headers = curl_slist_append(nullptr, "Content-Type: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeoutSeconds);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, discardResponse);

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    }
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return std::unexpected(std::string("Failed to send webhook notification: ") + curl_easy_strerror(res));
    }
    if (status >= 400) {
        return std::unexpected("Webhook notification rejected with HTTP status " + std::to_string(status));
    }
    return {};
}
