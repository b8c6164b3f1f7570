#include "hero/attempt_history.hpp"

#include <stdexcept>

namespace hero {

AttemptHistory::AttemptHistory(std::initializer_list<AttemptRecord> records) {
  for (const auto& record : records) {
    push_back(record);
  }
}

void AttemptHistory::push_back(const AttemptRecord& record) {
  if (chunks_.empty() || chunks_.back()->size() >= kChunkSize) {
    auto chunk = std::make_shared<Chunk>();
    chunk->reserve(kChunkSize);
    chunk->push_back(record);
    chunks_.push_back(std::move(chunk));
  } else {
    // The tail may be shared with an older copy; replace it instead of appending in place.
    auto tail = std::make_shared<Chunk>(*chunks_.back());
    tail->push_back(record);
    chunks_.back() = std::move(tail);
  }
  ++size_;
}

const AttemptRecord& AttemptHistory::operator[](std::size_t index) const {
  if (index >= size_) {
    throw std::out_of_range("AttemptHistory index out of range");
  }
  return (*chunks_[index / kChunkSize])[index % kChunkSize];
}

const AttemptRecord& AttemptHistory::back() const {
  if (empty()) {
    throw std::out_of_range("AttemptHistory is empty");
  }
  return chunks_.back()->back();
}

std::vector<AttemptRecord> AttemptHistory::to_vector() const {
  std::vector<AttemptRecord> out;
  out.reserve(size_);
  for (const auto& chunk : chunks_) {
    out.insert(out.end(), chunk->begin(), chunk->end());
  }
  return out;
}

bool AttemptHistory::shares_chunk_with(const AttemptHistory& other, std::size_t chunk) const {
  return chunk < chunks_.size() && chunk < other.chunks_.size() &&
         chunks_[chunk] == other.chunks_[chunk];
}

} // namespace hero
