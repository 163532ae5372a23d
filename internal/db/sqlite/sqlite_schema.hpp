#pragma once

#include "sqlite_db.hpp"

namespace archive::db::sqlite {

/*
  Creates the registry tables if missing and seeds the sequence row.

    media_record      one row per record
    media_label       ordered labels, cascade-deleted with the record
    media_access      access matrix; not tied to media_record so grants
                      outlive a deleted record
    archive_sequence  single row holding total_items
*/
void BootstrapSchema(SqliteDB& db);

} // namespace archive::db::sqlite
