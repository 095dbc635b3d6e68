#include "bastion/security/HttpSemanticClassifier.hpp"

#include <curl/curl.h>

#include <iostream>
#include <mutex>

#include <nlohmann/json.hpp>

namespace bastion {

namespace {

std::once_flag g_curl_once;

void ensureCurlGlobal() {
    // curl_global_cleanup() is left to process exit; handles may outlive any
    // single classifier instance.
    std::call_once(g_curl_once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

} // namespace

HttpSemanticClassifier::HttpSemanticClassifier(std::string endpoint)
    : endpoint_(std::move(endpoint)) {
    ensureCurlGlobal();
    std::cout << "[SEMANTIC] Classifier endpoint=" << endpoint_ << "\n";
}

size_t HttpSemanticClassifier::write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    std::string* out = reinterpret_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

Result<SemanticVerdict> HttpSemanticClassifier::classify(std::string_view text,
                                                         std::chrono::milliseconds timeout) {
    std::string body;
    try {
        body = nlohmann::json{{"text", std::string(text)}}.dump();
    } catch (const nlohmann::json::exception& e) {
        // invalid UTF-8 in the input
        return makeError(ErrorCode::TransientCollaborator,
                         std::string("request encode failed: ") + e.what());
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        return makeError(ErrorCode::TransientCollaborator, "curl_easy_init failed");
    }

    std::string response;
    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");

    long timeout_ms = static_cast<long>(timeout.count());

    curl_easy_setopt(curl, CURLOPT_URL,            endpoint_.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER,     headers);
    curl_easy_setopt(curl, CURLOPT_POST,           1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS,     body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE,  static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION,  write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA,      &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,     timeout_ms);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL,       1L);

    CURLcode res = curl_easy_perform(curl);
    long http_code = 0;
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return makeError(ErrorCode::TransientCollaborator,
                         std::string("classifier request failed: ") + curl_easy_strerror(res));
    }
    if (http_code < 200 || http_code >= 300) {
        return makeError(ErrorCode::TransientCollaborator,
                         "classifier returned HTTP " + std::to_string(http_code));
    }

    return parseResponse(response);
}

Result<SemanticVerdict> HttpSemanticClassifier::parseResponse(const std::string& body) {
    try {
        auto j = nlohmann::json::parse(body);
        if (!j.is_object() || !j.contains("label") || !j["label"].is_string()) {
            return makeError(ErrorCode::TransientCollaborator, "classifier response missing label");
        }

        const std::string label = j["label"].get<std::string>();
        if (label != "malicious" && label != "benign") {
            return makeError(ErrorCode::TransientCollaborator, "unknown classifier label: " + label);
        }

        SemanticVerdict v;
        v.malicious = (label == "malicious");
        v.score     = j.value("score", v.malicious ? 1.0 : 0.0);
        v.category  = j.value("category", std::string());
        return v;
    } catch (const nlohmann::json::exception& e) {
        return makeError(ErrorCode::TransientCollaborator,
                         std::string("classifier response unparsable: ") + e.what());
    }
}

} // namespace bastion
