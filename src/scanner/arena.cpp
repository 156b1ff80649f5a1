#include "typed_datasets/arena.hpp"
#include <algorithm>
#include <cstring>

namespace tds {

Arena::Arena(std::size_t block_bytes) : block_bytes_(std::max<std::size_t>(block_bytes, 64)) {}

void* Arena::alloc(std::size_t n) {
  if (blocks_.empty() || head_ + n > blocks_.back().size) {
    std::size_t sz = std::max(n, block_bytes_);
    blocks_.push_back(Block{std::unique_ptr<char[]>(new char[sz]), sz});
    head_ = 0;
  }
  void* p = blocks_.back().data.get() + head_;
  head_ += n;
  return p;
}

std::string_view Arena::copy(std::string_view s) {
  if (s.empty()) return {};
  void* p = alloc(s.size());
  std::memcpy(p, s.data(), s.size());
  return std::string_view(static_cast<const char*>(p), s.size());
}

void Arena::reset() noexcept {
  if (blocks_.size() > 1) blocks_.erase(blocks_.begin() + 1, blocks_.end());
  head_ = 0;
}

}
