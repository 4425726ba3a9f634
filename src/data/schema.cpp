/**
 * @file schema.cpp
 * @brief 링크/클릭 테이블 스키마
 */

#include "schema.h"
#include "data_store.h"

namespace shortline::data {

void registerSchemaMigrations(DataStore& store) {
    Migration links;
    links.version = kSchemaVersionLinks;
    links.name = "링크 테이블 생성";
    links.up_sql = R"SQL(
        CREATE TABLE IF NOT EXISTS links (
            id            INTEGER PRIMARY KEY AUTOINCREMENT,
            slug          TEXT    NOT NULL,
            domain        TEXT    NOT NULL,
            destination   TEXT    NOT NULL,
            title         TEXT    NOT NULL DEFAULT '',
            tags          TEXT    NOT NULL DEFAULT '',
            notes         TEXT    NOT NULL DEFAULT '',
            is_active     INTEGER NOT NULL DEFAULT 1,
            created_at    TEXT    NOT NULL DEFAULT (datetime('now')),
            updated_at    TEXT    NOT NULL DEFAULT (datetime('now')),
            UNIQUE(slug, domain)
        );

        CREATE INDEX IF NOT EXISTS idx_links_domain_slug ON links(domain, slug) WHERE is_active = 1;
    )SQL";
    store.registerMigration(links);

    Migration clicks;
    clicks.version = kSchemaVersionClicks;
    clicks.name = "클릭 테이블 생성";
    clicks.up_sql = R"SQL(
        CREATE TABLE IF NOT EXISTS clicks (
            id              INTEGER PRIMARY KEY AUTOINCREMENT,
            link_id         INTEGER NOT NULL,
            clicked_at      TEXT    NOT NULL,
            ip              TEXT    NOT NULL DEFAULT '',
            user_agent      TEXT    NOT NULL DEFAULT '',
            referer         TEXT    NOT NULL DEFAULT '',
            referer_domain  TEXT    NOT NULL DEFAULT '',
            country         TEXT    NOT NULL DEFAULT '',
            city            TEXT    NOT NULL DEFAULT '',
            region          TEXT    NOT NULL DEFAULT '',
            latitude        REAL    NOT NULL DEFAULT 0,
            longitude       REAL    NOT NULL DEFAULT 0,
            browser         TEXT    NOT NULL DEFAULT '',
            browser_version TEXT    NOT NULL DEFAULT '',
            os              TEXT    NOT NULL DEFAULT '',
            device_type     TEXT    NOT NULL DEFAULT '',
            FOREIGN KEY (link_id) REFERENCES links(id)
        );

        CREATE INDEX IF NOT EXISTS idx_clicks_link_id ON clicks(link_id);
        CREATE INDEX IF NOT EXISTS idx_clicks_clicked_at ON clicks(clicked_at);
    )SQL";
    store.registerMigration(clicks);
}

LinkRecord linkFromRow(const DbRow& row) {
    LinkRecord link;
    link.id = rowInt(row, "id");
    link.slug = rowText(row, "slug");
    link.domain = rowText(row, "domain");
    link.destination = rowText(row, "destination");
    link.title = rowText(row, "title");
    link.tags = rowText(row, "tags");
    link.notes = rowText(row, "notes");
    link.is_active = rowInt(row, "is_active") != 0;
    link.created_at = rowText(row, "created_at");
    link.updated_at = rowText(row, "updated_at");
    return link;
}

} // namespace shortline::data
