#pragma once

#include <deque>
#include <mutex>
#include <string>
#include <unordered_set>

namespace taskengine::sweeper {

/*
  Bounded FIFO of recently deleted task ids.

  Lets callers tell "deleted a while ago" apart from "never existed".
  The oldest id is forgotten once capacity is reached.
*/
class TombstoneLog {
 public:
  explicit TombstoneLog(std::size_t capacity);

  void Add(const std::string& task_id);
  bool Contains(const std::string& task_id) const;

  std::size_t Size() const;
  std::size_t Capacity() const {
    return capacity_;
  }

 private:
  const std::size_t capacity_;

  mutable std::mutex              mutex_;
  std::deque<std::string>         order_;
  std::unordered_set<std::string> ids_;
};

} // namespace taskengine::sweeper
