#include "sqlite_schema.hpp"

#include <string>
#include <vector>

namespace archive::db::sqlite {

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS media_record (record_id INTEGER PRIMARY KEY, owner TEXT NOT NULL, byte_count INTEGER NOT NULL, created_at INTEGER NOT NULL, name TEXT NOT NULL, summary TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS media_label (record_id INTEGER NOT NULL, position INTEGER NOT NULL, label TEXT NOT NULL, PRIMARY KEY (record_id, position), FOREIGN KEY(record_id) REFERENCES media_record(record_id) ON DELETE CASCADE);",
      "CREATE TABLE IF NOT EXISTS media_access (record_id INTEGER NOT NULL, principal TEXT NOT NULL, can_access INTEGER NOT NULL, PRIMARY KEY (record_id, principal));",
      "CREATE TABLE IF NOT EXISTS archive_sequence (id INTEGER PRIMARY KEY CHECK (id = 0), total_items INTEGER NOT NULL);",
      "INSERT OR IGNORE INTO archive_sequence(id,total_items) VALUES(0,0);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }

  db.Exec("SELECT record_id,owner,byte_count,created_at,name,summary FROM media_record LIMIT 1;");
  db.Exec("SELECT record_id,position,label FROM media_label LIMIT 1;");
  db.Exec("SELECT record_id,principal,can_access FROM media_access LIMIT 1;");
  db.Exec("SELECT total_items FROM archive_sequence WHERE id=0;");
}

} // namespace archive::db::sqlite
