#pragma once

#include "types.hpp"

#include <cstddef>
#include <initializer_list>
#include <memory>
#include <vector>

namespace hero {

// Append-only attempt log. Full chunks are immutable and shared between
// copies, so copying a history costs one pointer per chunk plus the tail.
class AttemptHistory {
public:
  static constexpr std::size_t kChunkSize = 256;

  AttemptHistory() = default;
  AttemptHistory(std::initializer_list<AttemptRecord> records);

  void push_back(const AttemptRecord& record);

  std::size_t size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0; }

  const AttemptRecord& operator[](std::size_t index) const;
  const AttemptRecord& back() const;

  std::vector<AttemptRecord> to_vector() const;

  // Number of chunks held, for inspecting how copies share storage.
  std::size_t chunk_count() const noexcept { return chunks_.size(); }
  bool shares_chunk_with(const AttemptHistory& other, std::size_t chunk) const;

private:
  using Chunk = std::vector<AttemptRecord>;
  std::vector<std::shared_ptr<const Chunk>> chunks_;
  std::size_t size_ = 0;
};

} // namespace hero
