#pragma once

/**
 * @file data_store.h
 * @brief SQLite 데이터 저장소 래퍼
 *
 * SQLite3 래핑 + 마이그레이션 시스템.
 * 링크 조회 저장소와 클릭 싱크가 이 클래스를 통해 DB에 접근합니다.
 */

#include <string>
#include <vector>
#include <functional>
#include <unordered_map>
#include <mutex>
#include <optional>
#include <variant>
#include <cstdint>
#include <cstddef>

// 전방 선언 (sqlite3)
struct sqlite3;
struct sqlite3_stmt;

namespace shortline::data {

// ============================================================
// 쿼리 결과 타입
// ============================================================

/// 단일 셀 값 (NULL, 정수, 실수, 문자열, BLOB)
using DbValue = std::variant<std::nullptr_t, int64_t, double, std::string, std::vector<uint8_t>>;

/// 단일 행 (열 이름 → 값)
using DbRow = std::unordered_map<std::string, DbValue>;

/// 쿼리 결과 집합
using DbResultSet = std::vector<DbRow>;

// ============================================================
// 행 값 추출 헬퍼
// ============================================================

/// 열 값을 문자열로 (NULL/누락이면 빈 문자열)
std::string rowText(const DbRow& row, const std::string& column);

/// 열 값을 정수로 (NULL/누락이면 0)
int64_t rowInt(const DbRow& row, const std::string& column);

/// 열 값을 실수로 (NULL/누락이면 0.0)
double rowDouble(const DbRow& row, const std::string& column);

// ============================================================
// 마이그레이션
// ============================================================

/**
 * @brief 스키마 마이그레이션 항목
 */
struct Migration {
    int version;            ///< 마이그레이션 버전 번호
    std::string name;       ///< 마이그레이션 이름
    std::string up_sql;     ///< 적용 SQL
};

// ============================================================
// DataStore 클래스
// ============================================================

/**
 * @brief SQLite 데이터 저장소
 *
 * 스레드 안전한 SQLite 래퍼입니다. 모든 구문은 재귀 뮤텍스로 직렬화되며,
 * transaction()은 BEGIN부터 COMMIT/ROLLBACK까지 잠금을 유지하므로
 * 다른 스레드의 구문이 트랜잭션 중간에 끼어들지 않습니다.
 *
 * 잠금은 연결(인스턴스) 단위이므로 링크 조회와 클릭 배치 쓰기는 같은 파일에
 * 대해 DataStore를 따로 엽니다. WAL 모드에서 조회 연결은 쓰기 트랜잭션을
 * 기다리지 않습니다.
 *
 * 리다이렉트 조회와 클릭 INSERT는 같은 SQL이 반복되므로 준비 구문을
 * SQL 문자열 단위로 캐시해 재사용합니다.
 */
class DataStore {
public:
    DataStore();
    ~DataStore();

    // 복사 금지
    DataStore(const DataStore&) = delete;
    DataStore& operator=(const DataStore&) = delete;

    // ============================
    // 초기화 / 종료
    // ============================

    /**
     * @brief 데이터베이스 열기
     * @param db_path 데이터베이스 파일 경로 (":memory:" 허용)
     * @return 성공 여부
     */
    bool open(const std::string& db_path);

    /**
     * @brief 데이터베이스 닫기
     */
    void close();

    /**
     * @brief 열려있는지 확인
     */
    [[nodiscard]] bool isOpen() const;

    /**
     * @brief 마지막 에러 메시지
     */
    [[nodiscard]] std::string lastError() const;

    // ============================
    // 쿼리 실행
    // ============================

    /**
     * @brief SQL 실행 (결과 없음: INSERT, UPDATE, DELETE, DDL)
     * @param sql SQL 문
     * @param params 바인딩 파라미터 (순서대로 ?에 바인딩)
     * @return 영향받은 행 수, 실패 시 -1
     */
    int execute(const std::string& sql, const std::vector<DbValue>& params = {});

    /**
     * @brief SQL 조회 (SELECT)
     * @param sql SQL 문
     * @param params 바인딩 파라미터
     * @param ok 실패 여부를 받을 포인터 (선택)
     * @return 결과 행 집합
     */
    DbResultSet query(const std::string& sql, const std::vector<DbValue>& params = {},
                      bool* ok = nullptr);

    /**
     * @brief 단일 스칼라 값 조회
     * @return 첫 번째 행의 첫 번째 열 값
     */
    std::optional<DbValue> queryScalar(const std::string& sql, const std::vector<DbValue>& params = {});

    /**
     * @brief 마지막 INSERT의 ROWID
     */
    [[nodiscard]] int64_t lastInsertRowId() const;

    // ============================
    // 트랜잭션
    // ============================

    bool beginTransaction();
    bool commit();
    bool rollback();

    /**
     * @brief RAII 트랜잭션 실행
     * @param func 트랜잭션 내에서 실행할 함수 (false 반환 시 롤백)
     * @return 커밋 성공 여부
     */
    bool transaction(const std::function<bool()>& func);

    // ============================
    // 마이그레이션
    // ============================

    /**
     * @brief 마이그레이션 등록 (같은 버전은 한 번만)
     */
    void registerMigration(const Migration& migration);

    /**
     * @brief 등록된 마이그레이션 일괄 적용
     * @return 적용된 마이그레이션 수, 실패 시 -1
     */
    int runMigrations();

    /**
     * @brief 현재 스키마 버전 조회
     */
    [[nodiscard]] int currentSchemaVersion() const;

    /// 캐시된 준비 구문 수
    [[nodiscard]] size_t cachedStatementCount() const;

private:
    sqlite3* db_{nullptr};                      ///< SQLite3 핸들
    std::string db_path_;                       ///< DB 파일 경로
    std::string last_error_;                    ///< 마지막 에러 메시지
    mutable std::recursive_mutex mutex_;        ///< 구문 직렬화
    std::vector<Migration> migrations_;         ///< 등록된 마이그레이션 목록

    /// SQL 문자열 → 준비 구문 (close 시 일괄 finalize)
    std::unordered_map<std::string, sqlite3_stmt*> statements_;

    sqlite3_stmt* prepareCached(const std::string& sql, const char* context);
    void finalizeStatements();
    void ensureMigrationTable();
    bool bindParams(sqlite3_stmt* stmt, const std::vector<DbValue>& params);
    DbRow extractRow(sqlite3_stmt* stmt);
    void setError(const std::string& context);
};

} // namespace shortline::data
