#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include "bastion/core/Result.hpp"

namespace bastion {

struct SemanticVerdict {
    bool        malicious = false;
    double      score = 0.0;
    std::string category;    // may be empty
};

// Layer-3 collaborator. Implementations must honour the timeout and report
// any failure as ErrorCode::TransientCollaborator; they must not throw.
class SemanticClassifier {
public:
    virtual ~SemanticClassifier() = default;

    virtual Result<SemanticVerdict> classify(std::string_view text,
                                             std::chrono::milliseconds timeout) = 0;
};

} // namespace bastion
