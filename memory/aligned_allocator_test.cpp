#include "container/packed_store.hpp"
#include "memory/aligned_allocator.hpp"
#include <cstdint>
#include <gtest/gtest.h>
#include <vector>

namespace tessel {
namespace {

TEST(AlignedAllocatorTest, AllocationsStartOnCacheLine) {
  memory::aligned_allocator<std::int32_t, 64> alloc;
  for (std::size_t n : {1u, 3u, 17u, 1000u}) {
    std::int32_t* p = alloc.allocate(n);
    ASSERT_NE(p, nullptr);
    EXPECT_EQ(reinterpret_cast<std::uintptr_t>(p) % 64, 0u) << "n=" << n;
    alloc.deallocate(p, n);
  }
}

TEST(AlignedAllocatorTest, ZeroLengthReturnsNull) {
  memory::aligned_allocator<double, 64> alloc;
  EXPECT_EQ(alloc.allocate(0), nullptr);
}

TEST(AlignedAllocatorTest, OversizedRequestIsRecorded) {
  core::ErrorCollector::instance().clear();
  memory::aligned_allocator<std::int64_t, 64> alloc;

  EXPECT_THROW((void)alloc.allocate(std::size_t(-1)), std::bad_alloc);
  EXPECT_EQ(core::ErrorCollector::instance().count(
                core::ErrorCode::AllocationFailure),
            1u);
  core::ErrorCollector::instance().clear();
}

TEST(AlignedAllocatorTest, StoreBufferIsAligned) {
  packed_store<Float64DefaultPolicy> store(37, 1.5);
  EXPECT_EQ(reinterpret_cast<std::uintptr_t>(store.cells().data()) % 64, 0u);
}

TEST(AlignedAllocatorTest, PoliciesAlignToCacheLine) {
  static_assert(Int32DefaultPolicy::allocator_type::alignment ==
                TESSEL_CACHE_LINE_SIZE);
  static_assert(Float64DefaultPolicy::allocator_type::alignment ==
                TESSEL_CACHE_LINE_SIZE);

  packed_store<Int64DefaultPolicy> store(5, 3);
  EXPECT_EQ(reinterpret_cast<std::uintptr_t>(store.cells().data()) %
                TESSEL_CACHE_LINE_SIZE,
            0u);
}

TEST(AlignedAllocatorTest, RebindKeepsAlignment) {
  using rebound =
      memory::aligned_allocator<std::int32_t, 64>::rebind<double>::other;
  static_assert(rebound::alignment == 64);
  std::vector<double, rebound> values(5, 2.0);
  EXPECT_EQ(reinterpret_cast<std::uintptr_t>(values.data()) % 64, 0u);
}

} // namespace
} // namespace tessel
