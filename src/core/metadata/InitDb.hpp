#pragma once
#include <cstddef>

namespace vindex {

class SqliteConnection;

// Bump whenever the on-disk layout changes. Opening a store written with a
// different tag drops every table and starts empty.
constexpr int kSchemaVersion = 2;

struct SchemaStatus {
  bool created = false;      // no tag was present
  bool reset = false;        // tag or dimension differed; all data dropped
  int  previousVersion = 0;  // 0 when no tag was present
};

// Applies pragmas, checks the stored version tag and embedding dimension and
// (re)creates the tables as needed.
SchemaStatus openOrInitialize(SqliteConnection& db, size_t dimension);

} // namespace vindex
