#pragma once
#include <cstddef>
#include <memory>
#include <string_view>
#include <vector>

namespace tds {

// Bump allocator over a list of blocks. Growing never moves earlier
// allocations, so views handed out stay valid until reset().
class Arena {
public:
  explicit Arena(std::size_t block_bytes = 4096);
  void* alloc(std::size_t n);
  std::string_view copy(std::string_view s);

  // Drop all allocations; the first block is kept for reuse.
  void reset() noexcept;

private:
  struct Block {
    std::unique_ptr<char[]> data;
    std::size_t size;
  };
  std::vector<Block> blocks_;
  std::size_t block_bytes_;
  std::size_t head_{0};          // offset into blocks_.back()
};

}
