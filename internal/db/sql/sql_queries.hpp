#pragma once

namespace colguard::db::sql {

/*
  Canonical SQL for the artifact store (SQLite dialect).
*/

static constexpr const char* UPSERT_ARTIFACT =
    "INSERT INTO cache_artifact(key,kind,payload,updated_at_ms) VALUES(?,?,?,?)"
    " ON CONFLICT(key) DO UPDATE SET kind=excluded.kind, payload=excluded.payload,"
    " updated_at_ms=excluded.updated_at_ms;";

static constexpr const char* SELECT_ARTIFACT =
    "SELECT key,kind,payload,updated_at_ms FROM cache_artifact WHERE key=?;";

static constexpr const char* LIST_ARTIFACTS =
    "SELECT key,kind,payload,updated_at_ms FROM cache_artifact ORDER BY key;";

static constexpr const char* DELETE_ARTIFACT =
    "DELETE FROM cache_artifact WHERE key=?;";

} // namespace colguard::db::sql
