#pragma once

/**
 * @file schema.h
 * @brief 링크/클릭 테이블 스키마 마이그레이션
 */

#include "data_store.h"
#include "link_record.h"

namespace shortline::data {

/// 버전 관리용 상수
constexpr int kSchemaVersionLinks  = 1;
constexpr int kSchemaVersionClicks = 2;

/**
 * @brief links, clicks 테이블 마이그레이션을 등록합니다.
 *
 * clicks가 links를 참조하므로 두 마이그레이션은 항상 함께 등록됩니다.
 * 같은 버전은 한 번만 등록되므로 여러 저장소가 호출해도 안전합니다.
 */
void registerSchemaMigrations(DataStore& store);

/// links 테이블 행 → LinkRecord (id, slug, domain, ... updated_at 열 사용)
LinkRecord linkFromRow(const DbRow& row);

} // namespace shortline::data
