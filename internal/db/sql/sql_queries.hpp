#pragma once

namespace asyncquery::db::sql {

/*
  Canonical SQL used by the sqlite backend.

  Enum columns hold the proto enum numbers; booleans are 0/1.
*/

static constexpr const char* kSchema[] = {
    "CREATE TABLE IF NOT EXISTS sessions (session_id TEXT PRIMARY KEY, datasource TEXT NOT NULL, application_id TEXT NOT NULL, job_id TEXT NOT NULL, "
    "state INTEGER NOT NULL, created_at_ms INTEGER NOT NULL, last_heartbeat_ms INTEGER NOT NULL);",
    "CREATE TABLE IF NOT EXISTS statements (statement_id TEXT PRIMARY KEY, session_id TEXT NOT NULL REFERENCES sessions(session_id), "
    "sequence INTEGER NOT NULL, lang_type INTEGER NOT NULL, query TEXT NOT NULL, state INTEGER NOT NULL, error TEXT NOT NULL, "
    "result_index TEXT NOT NULL, submit_time_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",
    "CREATE INDEX IF NOT EXISTS statements_by_session ON statements(session_id, sequence);",
    "CREATE TABLE IF NOT EXISTS job_metadata (query_id TEXT PRIMARY KEY, application_id TEXT NOT NULL, job_id TEXT NOT NULL, "
    "is_drop_index_op INTEGER NOT NULL, result_index TEXT NOT NULL, session_id TEXT NOT NULL, datasource TEXT NOT NULL, created_at_ms INTEGER NOT NULL);",
    "CREATE TABLE IF NOT EXISTS query_results (result_index TEXT NOT NULL, job_id TEXT NOT NULL, query_id TEXT NOT NULL, document_json TEXT NOT NULL, "
    "written_at_ms INTEGER NOT NULL, PRIMARY KEY (result_index, job_id, query_id));",
    "CREATE TABLE IF NOT EXISTS index_metadata (index_name TEXT PRIMARY KEY, datasource TEXT NOT NULL, job_id TEXT NOT NULL, application_id TEXT NOT NULL, "
    "auto_refresh INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",
};

// sessions

static constexpr const char* INSERT_SESSION =
    "INSERT INTO sessions(session_id,datasource,application_id,job_id,state,created_at_ms,last_heartbeat_ms)"
    " VALUES(?,?,?,?,?,?,?);";

static constexpr const char* SELECT_SESSION =
    "SELECT session_id,datasource,application_id,job_id,state,created_at_ms,last_heartbeat_ms"
    " FROM sessions WHERE session_id=?;";

static constexpr const char* LIST_SESSIONS =
    "SELECT session_id,datasource,application_id,job_id,state,created_at_ms,last_heartbeat_ms"
    " FROM sessions ORDER BY created_at_ms, session_id;";

static constexpr const char* UPDATE_SESSION =
    "UPDATE sessions SET datasource=?,application_id=?,job_id=?,state=?,created_at_ms=?,last_heartbeat_ms=?"
    " WHERE session_id=?;";

// statements

static constexpr const char* INSERT_STATEMENT =
    "INSERT INTO statements(statement_id,session_id,sequence,lang_type,query,state,error,result_index,submit_time_ms,updated_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_STATEMENT =
    "SELECT statement_id,session_id,sequence,lang_type,query,state,error,result_index,submit_time_ms,updated_at_ms"
    " FROM statements WHERE statement_id=?;";

static constexpr const char* LIST_STATEMENTS =
    "SELECT statement_id,session_id,sequence,lang_type,query,state,error,result_index,submit_time_ms,updated_at_ms"
    " FROM statements WHERE session_id=? ORDER BY sequence;";

static constexpr const char* UPDATE_STATEMENT =
    "UPDATE statements SET session_id=?,sequence=?,lang_type=?,query=?,state=?,error=?,result_index=?,submit_time_ms=?,updated_at_ms=?"
    " WHERE statement_id=?;";

// job metadata

static constexpr const char* INSERT_JOB_METADATA =
    "INSERT INTO job_metadata(query_id,application_id,job_id,is_drop_index_op,result_index,session_id,datasource,created_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_JOB_METADATA =
    "SELECT query_id,application_id,job_id,is_drop_index_op,result_index,session_id,datasource,created_at_ms"
    " FROM job_metadata WHERE query_id=?;";

// results

static constexpr const char* UPSERT_QUERY_RESULT =
    "INSERT INTO query_results(result_index,job_id,query_id,document_json,written_at_ms) VALUES(?,?,?,?,?)"
    " ON CONFLICT(result_index,job_id,query_id) DO UPDATE SET document_json=excluded.document_json, written_at_ms=excluded.written_at_ms;";

static constexpr const char* SELECT_RESULT_BY_JOB_ID =
    "SELECT result_index,job_id,query_id,document_json,written_at_ms FROM query_results"
    " WHERE job_id=? AND result_index=? ORDER BY written_at_ms DESC LIMIT 1;";

static constexpr const char* SELECT_RESULT_BY_QUERY_ID =
    "SELECT result_index,job_id,query_id,document_json,written_at_ms FROM query_results"
    " WHERE query_id=? AND result_index=? ORDER BY written_at_ms DESC LIMIT 1;";

// index metadata

static constexpr const char* UPSERT_INDEX_METADATA =
    "INSERT INTO index_metadata(index_name,datasource,job_id,application_id,auto_refresh,updated_at_ms) VALUES(?,?,?,?,?,?)"
    " ON CONFLICT(index_name) DO UPDATE SET datasource=excluded.datasource, job_id=excluded.job_id,"
    " application_id=excluded.application_id, auto_refresh=excluded.auto_refresh, updated_at_ms=excluded.updated_at_ms;";

static constexpr const char* SELECT_INDEX_METADATA =
    "SELECT index_name,datasource,job_id,application_id,auto_refresh,updated_at_ms FROM index_metadata WHERE index_name=?;";

static constexpr const char* DELETE_INDEX_METADATA =
    "DELETE FROM index_metadata WHERE index_name=?;";

} // namespace asyncquery::db::sql
