#pragma once

#include <cstdint>
#include <string>

namespace cms::db::model {

enum class TaskFileKind : int {
  kAttachment = 1,
  kManager    = 2,
};

// Attachment or manager (grader/checker) file bound to a task.
struct TaskFileRecord {
  uint64_t     task_id = 0;
  TaskFileKind kind    = TaskFileKind::kAttachment;
  std::string  filename;
  std::string  digest;
};

}
