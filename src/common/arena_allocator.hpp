#pragma once

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <new>
#include <type_traits>
#include <vector>

namespace loft {

/// Bump allocator that hands out memory from large blocks.
/// Everything is released at once when the arena is destroyed or reset;
/// destructors of created objects are never run, so only trivially
/// destructible types may be placed in it. The parser allocates every AST
/// node and node list of one parse here.
class ArenaAllocator {
public:
    static constexpr size_t kDefaultBlockSize = 32 * 1024;

    explicit ArenaAllocator(size_t block_size = kDefaultBlockSize)
        : block_size_(block_size) {}

    ArenaAllocator(const ArenaAllocator&)            = delete;
    ArenaAllocator& operator=(const ArenaAllocator&) = delete;
    ArenaAllocator(ArenaAllocator&&)                 = default;
    ArenaAllocator& operator=(ArenaAllocator&&)      = default;

    /// Allocate `size` bytes aligned to `alignment` (a power of two).
    [[nodiscard]] void* allocate(size_t size, size_t alignment = alignof(std::max_align_t)) {
        assert(alignment > 0 && (alignment & (alignment - 1)) == 0 && "alignment must be power of 2");

        size_t aligned_offset = align_up(current_offset_, alignment);
        if (blocks_.empty() || aligned_offset + size > block_size_) {
            add_block(std::max(size + alignment, block_size_));
            aligned_offset = align_up(current_offset_, alignment);
        }

        void* ptr = blocks_.back().get() + aligned_offset;
        current_offset_ = aligned_offset + size;
        total_allocated_ += size;
        return ptr;
    }

    /// Construct a T in the arena.
    template <typename T, typename... Args>
    [[nodiscard]] T* create(Args&&... args) {
        static_assert(std::is_trivially_destructible_v<T>, "arena objects are never destroyed");
        void* mem = allocate(sizeof(T), alignof(T));
        return new (mem) T(std::forward<Args>(args)...);
    }

    /// Allocate `count` value-initialized T's.
    template <typename T>
    [[nodiscard]] T* allocate_array(size_t count) {
        static_assert(std::is_trivially_destructible_v<T>, "arena objects are never destroyed");
        T* arr = static_cast<T*>(allocate(sizeof(T) * count, alignof(T)));
        for (size_t i = 0; i < count; ++i) {
            new (&arr[i]) T();
        }
        return arr;
    }

    /// Copy the contents of a vector into the arena. Returns nullptr for an
    /// empty vector.
    template <typename T>
    [[nodiscard]] T* copy_array(const std::vector<T>& items) {
        if (items.empty()) {
            return nullptr;
        }
        T* arr = allocate_array<T>(items.size());
        std::copy(items.begin(), items.end(), arr);
        return arr;
    }

    /// Free all blocks.
    void reset() {
        blocks_.clear();
        current_offset_ = 0;
        total_allocated_ = 0;
    }

    [[nodiscard]] size_t total_allocated() const { return total_allocated_; }
    [[nodiscard]] size_t block_count() const { return blocks_.size(); }

private:
    void add_block(size_t size) {
        blocks_.push_back(std::make_unique<uint8_t[]>(size));
        block_size_ = size;
        current_offset_ = 0;
    }

    [[nodiscard]] static size_t align_up(size_t value, size_t alignment) {
        return (value + alignment - 1) & ~(alignment - 1);
    }

    std::vector<std::unique_ptr<uint8_t[]>> blocks_;
    size_t block_size_      = kDefaultBlockSize;
    size_t current_offset_  = 0;
    size_t total_allocated_ = 0;
};

} // namespace loft
