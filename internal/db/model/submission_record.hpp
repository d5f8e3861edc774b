#pragma once

#include <cstdint>

namespace cms::db::model {

struct SubmissionRecord {
  uint64_t id      = 0; // assigned on insert
  uint64_t task_id = 0;
  uint64_t user_id = 0;

  // Set when the submission's evaluation must be redone.
  bool invalidated = false;
};

}
