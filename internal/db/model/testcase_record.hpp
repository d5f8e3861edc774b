#pragma once

#include <cstdint>
#include <string>

namespace cms::db::model {

struct TestcaseRecord {
  uint64_t    task_id = 0;
  uint32_t    num     = 0; // position within the task, 0-based
  std::string input_digest;
  std::string output_digest;
  bool        is_public = false;
};

}
