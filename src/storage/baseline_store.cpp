#include "storage/baseline_store.h"
#include <mutex>

namespace vc {

ErrorCode InMemoryBaselineStore::get(const std::string& user_id, UserBaseline& out, ErrorInfo* err) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = baselines_.find(user_id);
    if (it == baselines_.end()) {
        return fail(err, ErrorCode::NO_BASELINE, "No baseline for user: " + user_id);
    }
    out = it->second;
    return ErrorCode::OK;
}

ErrorCode InMemoryBaselineStore::save(const UserBaseline& baseline, ErrorInfo* err) {
    if (baseline.user_id.empty()) {
        return fail(err, ErrorCode::INVALID_PARAM, "Empty user id");
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    baselines_[baseline.user_id] = baseline;
    return ErrorCode::OK;
}

ErrorCode InMemoryBaselineStore::remove(const std::string& user_id, ErrorInfo* err) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (baselines_.erase(user_id) == 0) {
        return fail(err, ErrorCode::NO_BASELINE, "No baseline for user: " + user_id);
    }
    return ErrorCode::OK;
}

int InMemoryBaselineStore::count() {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return static_cast<int>(baselines_.size());
}

} // namespace vc
