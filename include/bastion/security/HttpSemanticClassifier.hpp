#pragma once

#include <string>

#include "bastion/security/SemanticClassifier.hpp"

namespace bastion {

// POSTs {"text": ...} to an external classification service and expects
// {"label": "malicious"|"benign", "score": <0..1>, "category": "..."}.
// One curl easy handle per call, so concurrent scans never share a handle.
class HttpSemanticClassifier final : public SemanticClassifier {
public:
    explicit HttpSemanticClassifier(std::string endpoint);

    Result<SemanticVerdict> classify(std::string_view text,
                                     std::chrono::milliseconds timeout) override;

    const std::string& endpoint() const noexcept { return endpoint_; }

    static Result<SemanticVerdict> parseResponse(const std::string& body);

private:
    static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata);

    std::string endpoint_;
};

} // namespace bastion
