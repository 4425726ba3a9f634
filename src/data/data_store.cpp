/**
 * @file data_store.cpp
 * @brief SQLite 데이터 저장소 구현
 *
 * SQLite3 래핑, 트랜잭션, 버전 기반 마이그레이션.
 */

#include "data_store.h"

#include <sqlite3.h>

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <system_error>
#include <type_traits>

namespace shortline::data {

// ============================================================
// 행 값 추출 헬퍼
// ============================================================

std::string rowText(const DbRow& row, const std::string& column) {
    auto it = row.find(column);
    if (it == row.end()) return {};
    if (const auto* s = std::get_if<std::string>(&it->second)) return *s;
    if (const auto* i = std::get_if<int64_t>(&it->second)) return std::to_string(*i);
    return {};
}

int64_t rowInt(const DbRow& row, const std::string& column) {
    auto it = row.find(column);
    if (it == row.end()) return 0;
    if (const auto* i = std::get_if<int64_t>(&it->second)) return *i;
    if (const auto* d = std::get_if<double>(&it->second)) return static_cast<int64_t>(*d);
    return 0;
}

double rowDouble(const DbRow& row, const std::string& column) {
    auto it = row.find(column);
    if (it == row.end()) return 0.0;
    if (const auto* d = std::get_if<double>(&it->second)) return *d;
    if (const auto* i = std::get_if<int64_t>(&it->second)) return static_cast<double>(*i);
    return 0.0;
}

// ============================================================
// 생성자 / 소멸자
// ============================================================

DataStore::DataStore() = default;

DataStore::~DataStore() {
    close();
}

// ============================================================
// 초기화 / 종료
// ============================================================

bool DataStore::open(const std::string& db_path) {
    std::lock_guard lock(mutex_);

    // 이미 열려있으면 먼저 닫기
    finalizeStatements();
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }

    db_path_ = db_path;

    // 부모 디렉터리 생성
    if (db_path != ":memory:") {
        auto parent = std::filesystem::path(db_path).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                last_error_ = "디렉터리 생성 실패: " + ec.message();
                return false;
            }
        }
    }

    int rc = sqlite3_open_v2(
        db_path.c_str(), &db_,
        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
        nullptr
    );
    if (rc != SQLITE_OK) {
        setError("sqlite3_open_v2");
        sqlite3_close_v2(db_);
        db_ = nullptr;
        return false;
    }

    // WAL 모드 (클릭 배치 쓰기 중에도 리다이렉트 조회가 막히지 않도록)
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA foreign_keys=ON;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
    sqlite3_busy_timeout(db_, 5000);

    return true;
}

void DataStore::close() {
    std::lock_guard lock(mutex_);
    finalizeStatements();
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

bool DataStore::isOpen() const {
    std::lock_guard lock(mutex_);
    return db_ != nullptr;
}

std::string DataStore::lastError() const {
    std::lock_guard lock(mutex_);
    return last_error_;
}

// ============================================================
// 구문 캐시
// ============================================================

namespace {

/// 범위를 벗어나면 캐시된 구문을 재사용 가능한 상태로 되돌림
class StatementReset {
public:
    explicit StatementReset(sqlite3_stmt* stmt) : stmt_(stmt) {}
    ~StatementReset() {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

    StatementReset(const StatementReset&) = delete;
    StatementReset& operator=(const StatementReset&) = delete;

private:
    sqlite3_stmt* stmt_;
};

} // namespace

sqlite3_stmt* DataStore::prepareCached(const std::string& sql, const char* context) {
    auto it = statements_.find(sql);
    if (it != statements_.end()) return it->second;

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v3(db_, sql.c_str(), static_cast<int>(sql.size()),
                                SQLITE_PREPARE_PERSISTENT, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        setError(std::string("prepare[") + context + "]");
        sqlite3_finalize(stmt);
        return nullptr;
    }

    statements_.emplace(sql, stmt);
    return stmt;
}

void DataStore::finalizeStatements() {
    for (auto& [sql, stmt] : statements_) {
        sqlite3_finalize(stmt);
    }
    statements_.clear();
}

size_t DataStore::cachedStatementCount() const {
    std::lock_guard lock(mutex_);
    return statements_.size();
}

// ============================================================
// 쿼리 실행
// ============================================================

int DataStore::execute(const std::string& sql, const std::vector<DbValue>& params) {
    std::lock_guard lock(mutex_);
    if (!db_) {
        last_error_ = "데이터베이스가 열려있지 않습니다";
        return -1;
    }

    sqlite3_stmt* stmt = prepareCached(sql, "execute");
    if (!stmt) return -1;
    StatementReset reset(stmt);

    if (!bindParams(stmt, params)) return -1;

    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE && rc != SQLITE_ROW) {
        setError("step[execute]");
        return -1;
    }

    return sqlite3_changes(db_);
}

DbResultSet DataStore::query(const std::string& sql, const std::vector<DbValue>& params,
                             bool* ok) {
    std::lock_guard lock(mutex_);
    DbResultSet results;
    if (ok) *ok = false;

    if (!db_) {
        last_error_ = "데이터베이스가 열려있지 않습니다";
        return results;
    }

    sqlite3_stmt* stmt = prepareCached(sql, "query");
    if (!stmt) return results;
    StatementReset reset(stmt);

    if (!bindParams(stmt, params)) return results;

    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        results.push_back(extractRow(stmt));
    }

    if (rc != SQLITE_DONE) {
        setError("step[query]");
        return results;
    }

    if (ok) *ok = true;
    return results;
}

std::optional<DbValue> DataStore::queryScalar(const std::string& sql,
                                               const std::vector<DbValue>& params) {
    auto rows = query(sql, params);
    if (rows.empty()) return std::nullopt;

    // 단일 열 조회만 의미가 있음 (DbRow는 순서 없는 맵)
    auto& row = rows.front();
    if (row.empty()) return std::nullopt;

    return row.begin()->second;
}

int64_t DataStore::lastInsertRowId() const {
    std::lock_guard lock(mutex_);
    if (!db_) return -1;
    return sqlite3_last_insert_rowid(db_);
}

// ============================================================
// 트랜잭션
// ============================================================

bool DataStore::beginTransaction() {
    return execute("BEGIN TRANSACTION") >= 0;
}

bool DataStore::commit() {
    return execute("COMMIT") >= 0;
}

bool DataStore::rollback() {
    return execute("ROLLBACK") >= 0;
}

bool DataStore::transaction(const std::function<bool()>& func) {
    std::lock_guard lock(mutex_);
    if (!beginTransaction()) return false;

    try {
        if (func()) {
            if (commit()) return true;
            // COMMIT 실패 시 트랜잭션이 남아있을 수 있음
            std::string err = last_error_;
            rollback();
            last_error_ = err;
            return false;
        }
        std::string err = last_error_;
        rollback();
        last_error_ = err;
        return false;
    } catch (const std::exception& e) {
        last_error_ = std::string("트랜잭션 예외: ") + e.what();
        rollback();
        return false;
    }
}

// ============================================================
// 마이그레이션
// ============================================================

void DataStore::registerMigration(const Migration& migration) {
    std::lock_guard lock(mutex_);
    for (const auto& existing : migrations_) {
        if (existing.version == migration.version) return;
    }
    migrations_.push_back(migration);
    std::sort(migrations_.begin(), migrations_.end(),
              [](const Migration& a, const Migration& b) {
                  return a.version < b.version;
              });
}

int DataStore::runMigrations() {
    std::lock_guard lock(mutex_);
    if (!db_) {
        last_error_ = "데이터베이스가 열려있지 않습니다";
        return -1;
    }

    ensureMigrationTable();

    int current = currentSchemaVersion();
    int applied = 0;

    for (const auto& mig : migrations_) {
        if (mig.version <= current) continue;

        bool ok = transaction([&]() -> bool {
            // 세미콜론으로 분리된 여러 구문 지원
            char* err_msg = nullptr;
            int rc = sqlite3_exec(db_, mig.up_sql.c_str(), nullptr, nullptr, &err_msg);
            if (rc != SQLITE_OK) {
                last_error_ = std::string("마이그레이션 ") + std::to_string(mig.version)
                              + " 실패: " + (err_msg ? err_msg : "알 수 없는 오류");
                if (err_msg) sqlite3_free(err_msg);
                return false;
            }

            return execute(
                "INSERT INTO _migrations (version, name, applied_at) VALUES (?, ?, datetime('now'))",
                {static_cast<int64_t>(mig.version), mig.name}
            ) >= 0;
        });

        if (!ok) {
            std::cerr << "[DataStore] " << last_error_ << std::endl;
            return -1;
        }
        ++applied;
    }

    return applied;
}

int DataStore::currentSchemaVersion() const {
    std::lock_guard lock(mutex_);
    if (!db_) return 0;

    // _migrations 테이블이 없으면 버전 0
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT MAX(version) FROM _migrations", -1, &stmt, nullptr)
        != SQLITE_OK) {
        sqlite3_finalize(stmt);
        return 0;
    }

    int version = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW && sqlite3_column_type(stmt, 0) != SQLITE_NULL) {
        version = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return version;
}

void DataStore::ensureMigrationTable() {
    const char* sql = R"SQL(
        CREATE TABLE IF NOT EXISTS _migrations (
            version     INTEGER PRIMARY KEY,
            name        TEXT NOT NULL,
            applied_at  TEXT NOT NULL
        )
    )SQL";
    sqlite3_exec(db_, sql, nullptr, nullptr, nullptr);
}

// ============================================================
// 내부 헬퍼
// ============================================================

bool DataStore::bindParams(sqlite3_stmt* stmt, const std::vector<DbValue>& params) {
    int idx = 0;    // SQLite 바인딩은 1-기반
    for (const auto& param : params) {
        ++idx;
        int rc = std::visit([&](const auto& v) -> int {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>) {
                return sqlite3_bind_null(stmt, idx);
            } else if constexpr (std::is_same_v<T, int64_t>) {
                return sqlite3_bind_int64(stmt, idx, v);
            } else if constexpr (std::is_same_v<T, double>) {
                return sqlite3_bind_double(stmt, idx, v);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return sqlite3_bind_text(stmt, idx, v.data(), static_cast<int>(v.size()),
                                         SQLITE_TRANSIENT);
            } else {
                return sqlite3_bind_blob(stmt, idx, v.data(), static_cast<int>(v.size()),
                                         SQLITE_TRANSIENT);
            }
        }, param);

        if (rc != SQLITE_OK) {
            setError("bind[" + std::to_string(idx) + "]");
            return false;
        }
    }
    return true;
}

DbRow DataStore::extractRow(sqlite3_stmt* stmt) {
    DbRow row;
    int col_count = sqlite3_column_count(stmt);

    for (int c = 0; c < col_count; ++c) {
        std::string col_name = sqlite3_column_name(stmt, c);
        int type = sqlite3_column_type(stmt, c);

        DbValue value;
        switch (type) {
            case SQLITE_INTEGER:
                value = static_cast<int64_t>(sqlite3_column_int64(stmt, c));
                break;
            case SQLITE_FLOAT:
                value = sqlite3_column_double(stmt, c);
                break;
            case SQLITE_TEXT: {
                auto text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, c));
                int text_size = sqlite3_column_bytes(stmt, c);
                value = std::string(text, static_cast<size_t>(text_size));
                break;
            }
            case SQLITE_BLOB: {
                auto blob = static_cast<const uint8_t*>(sqlite3_column_blob(stmt, c));
                int blob_size = sqlite3_column_bytes(stmt, c);
                value = std::vector<uint8_t>(blob, blob + blob_size);
                break;
            }
            default:
                value = nullptr;
                break;
        }

        row[col_name] = std::move(value);
    }

    return row;
}

void DataStore::setError(const std::string& context) {
    if (db_) {
        last_error_ = context + ": " + sqlite3_errmsg(db_);
    } else {
        last_error_ = context + ": (DB 핸들 없음)";
    }
}

} // namespace shortline::data
