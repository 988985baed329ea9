#include "chunkup/upload/types.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_map>
#include <vector>

namespace chunkup::upload {
namespace {

bool is_progressive(UploadState current, UploadState target) {
    static const std::unordered_map<UploadState, std::vector<UploadState>> transitions {
        {UploadState::Init, {UploadState::NegotiatingSession}},
        {UploadState::NegotiatingSession, {UploadState::Streaming}},
        {UploadState::Streaming, {UploadState::Uploading}},
        {UploadState::Uploading, {UploadState::Streaming, UploadState::Done}},
    };

    if (target == UploadState::Failed) {
        return true;
    }

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), target) != allowed_list.end();
}

} // namespace

const char* to_string(UploadState state) noexcept {
    switch (state) {
        case UploadState::Init: return "Init";
        case UploadState::NegotiatingSession: return "NegotiatingSession";
        case UploadState::Streaming: return "Streaming";
        case UploadState::Uploading: return "Uploading";
        case UploadState::Done: return "Done";
        case UploadState::Failed: return "Failed";
    }
    return "Unknown";
}

bool can_transition(UploadState current, UploadState target) noexcept {
    if (current == target) {
        return true;
    }

    if (current == UploadState::Failed || current == UploadState::Done) {
        return false;
    }

    return is_progressive(current, target);
}

std::chrono::milliseconds RetryPolicy::delay_for(int attempt) const {
    if (initial_backoff.count() <= 0 || attempt <= 0) {
        return std::chrono::milliseconds{0};
    }
    const double scaled = static_cast<double>(initial_backoff.count()) *
                          std::pow(std::max(backoff_multiplier, 1.0), attempt - 1);
    const double capped = max_backoff.count() > 0
        ? std::min(scaled, static_cast<double>(max_backoff.count()))
        : scaled;
    return std::chrono::milliseconds{static_cast<std::int64_t>(capped)};
}

} // namespace chunkup::upload
