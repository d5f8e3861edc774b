#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace cms::db::model {

struct QuestionRecord {
  uint64_t    id         = 0; // assigned on insert
  uint64_t    contest_id = 0;
  std::string user;

  int64_t                question_timestamp = 0;
  std::optional<int64_t> reply_timestamp; // unset = unanswered

  std::string subject;
  std::string text;
};

}
