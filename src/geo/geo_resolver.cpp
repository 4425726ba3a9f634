/**
 * @file geo_resolver.cpp
 * @brief IP → 지리 정보 조회 구현 (libmaxminddb)
 */

#include "geo_resolver.h"

#include <iostream>

#ifdef SHORTLINE_HAS_MAXMINDDB
#include <maxminddb.h>
#endif

namespace shortline::geo {

// ============================================================
// Impl
// ============================================================

struct GeoResolver::Impl {
#ifdef SHORTLINE_HAS_MAXMINDDB
    MMDB_s mmdb{};
#endif
    bool open{false};

    ~Impl() {
#ifdef SHORTLINE_HAS_MAXMINDDB
        if (open) MMDB_close(&mmdb);
#endif
    }
};

#ifdef SHORTLINE_HAS_MAXMINDDB
namespace {

std::string stringValue(MMDB_entry_s* entry, const char* const* path) {
    MMDB_entry_data_s data{};
    int status = MMDB_aget_value(entry, &data, path);
    if (status == MMDB_SUCCESS && data.has_data && data.type == MMDB_DATA_TYPE_UTF8_STRING) {
        return std::string(data.utf8_string, data.data_size);
    }
    return {};
}

double doubleValue(MMDB_entry_s* entry, const char* const* path) {
    MMDB_entry_data_s data{};
    int status = MMDB_aget_value(entry, &data, path);
    if (status == MMDB_SUCCESS && data.has_data && data.type == MMDB_DATA_TYPE_DOUBLE) {
        return data.double_value;
    }
    return 0.0;
}

} // namespace
#endif

// ============================================================
// 생성자 / 소멸자
// ============================================================

GeoResolver::GeoResolver(const std::string& db_path)
    : impl_(std::make_unique<Impl>()) {
    if (db_path.empty()) return;

#ifdef SHORTLINE_HAS_MAXMINDDB
    int status = MMDB_open(db_path.c_str(), MMDB_MODE_MMAP, &impl_->mmdb);
    if (status != MMDB_SUCCESS) {
        std::cerr << "[GeoResolver] GeoIP DB 열기 실패 (" << db_path << "): "
                  << MMDB_strerror(status) << " - 지리 정보 없이 계속합니다" << std::endl;
        return;
    }
    impl_->open = true;
    std::cout << "[GeoResolver] GeoIP DB 로드: " << db_path << std::endl;
#else
    std::cerr << "[GeoResolver] libmaxminddb 없이 빌드됨 - GeoIP DB 무시: "
              << db_path << std::endl;
#endif
}

GeoResolver::~GeoResolver() = default;

bool GeoResolver::isEnabled() const {
    return impl_->open;
}

// ============================================================
// 조회
// ============================================================

GeoResult GeoResolver::lookup(const std::string& ip) const {
    GeoResult result;
    if (!impl_->open || ip.empty()) return result;

#ifdef SHORTLINE_HAS_MAXMINDDB
    int gai_error = 0;
    int mmdb_error = MMDB_SUCCESS;
    MMDB_lookup_result_s found =
        MMDB_lookup_string(&impl_->mmdb, ip.c_str(), &gai_error, &mmdb_error);

    if (gai_error != 0 || mmdb_error != MMDB_SUCCESS || !found.found_entry) {
        return result;
    }

    static const char* const kCountry[]   = {"country", "iso_code", nullptr};
    static const char* const kCity[]      = {"city", "names", "en", nullptr};
    static const char* const kRegion[]    = {"subdivisions", "0", "names", "en", nullptr};
    static const char* const kLatitude[]  = {"location", "latitude", nullptr};
    static const char* const kLongitude[] = {"location", "longitude", nullptr};

    result.country = stringValue(&found.entry, kCountry);
    result.city = stringValue(&found.entry, kCity);
    result.region = stringValue(&found.entry, kRegion);
    result.latitude = doubleValue(&found.entry, kLatitude);
    result.longitude = doubleValue(&found.entry, kLongitude);
#endif

    return result;
}

} // namespace shortline::geo
