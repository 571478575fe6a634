#ifndef VC_BASELINE_STORE_H
#define VC_BASELINE_STORE_H

#include "storage/user_baseline.h"
#include "utils/error_codes.h"
#include <map>
#include <shared_mutex>
#include <string>

namespace vc {

// Persistence for user baselines. Implementations must be thread-safe.
class BaselineStore {
public:
    virtual ~BaselineStore() = default;

    // OK, NO_BASELINE when the user has none, BASELINE_OUTDATED when the stored
    // row predates the current feature schema, or DB_ERROR
    virtual ErrorCode get(const std::string& user_id, UserBaseline& out, ErrorInfo* err) = 0;

    // Insert or replace, including the sample ring
    virtual ErrorCode save(const UserBaseline& baseline, ErrorInfo* err) = 0;

    // NO_BASELINE when there was nothing to remove
    virtual ErrorCode remove(const std::string& user_id, ErrorInfo* err) = 0;

    virtual int count() = 0;
};

class InMemoryBaselineStore : public BaselineStore {
public:
    ErrorCode get(const std::string& user_id, UserBaseline& out, ErrorInfo* err) override;
    ErrorCode save(const UserBaseline& baseline, ErrorInfo* err) override;
    ErrorCode remove(const std::string& user_id, ErrorInfo* err) override;
    int count() override;

private:
    std::shared_mutex mutex_;
    std::map<std::string, UserBaseline> baselines_;
};

} // namespace vc

#endif // VC_BASELINE_STORE_H
