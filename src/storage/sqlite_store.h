#ifndef VC_SQLITE_STORE_H
#define VC_SQLITE_STORE_H

#include "storage/baseline_store.h"
#include <mutex>
#include <string>
#include <vector>

struct sqlite3;

namespace vc {

// Baselines in a SQLite database. Feature maps and ring samples are stored
// as float BLOBs in FeatureSchema order, tagged with the schema version.
class SqliteBaselineStore : public BaselineStore {
public:
    SqliteBaselineStore();
    ~SqliteBaselineStore() override;

    // Open or create database
    bool open(const std::string& db_path);

    // Close database
    void close();

    bool is_open() const { return db_ != nullptr; }

    ErrorCode get(const std::string& user_id, UserBaseline& out, ErrorInfo* err) override;
    ErrorCode save(const UserBaseline& baseline, ErrorInfo* err) override;
    ErrorCode remove(const std::string& user_id, ErrorInfo* err) override;
    int count() override;

    const std::string& last_error() const { return last_error_; }

private:
    void close_db();
    bool create_tables();
    bool exec(const char* sql);
    void rollback();
    ErrorCode db_error(ErrorInfo* err, const std::string& what);
    bool load_samples(const std::string& user_id, UserBaseline& out);

    sqlite3* db_ = nullptr;
    std::mutex mutex_;
    std::string last_error_;
};

} // namespace vc

#endif // VC_SQLITE_STORE_H
