#pragma once

#include <cstdint>
#include <string>

namespace cms::db::model {

/*
  Task row. Only the columns the admin core touches are modelled; the
  rest of the task definition belongs to the contest editor.
*/
struct TaskRecord {
  uint64_t    id         = 0; // assigned on insert
  uint64_t    contest_id = 0;
  std::string name;

  // Digest of the PDF statement in the file storage; empty if none yet.
  std::string statement_digest;
};

}
