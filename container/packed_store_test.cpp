#include "container/packed_store.hpp"
#include "core/error_collector.hpp"
#include <cstdint>
#include <gtest/gtest.h>
#include <vector>

namespace tessel {
namespace {

using Int32Store = packed_store<Int32DefaultPolicy>;

// RAII helper for error management
class ErrorGuard {
public:
  ErrorGuard() {
    core::ErrorCollector::instance().clear();
    core::ErrorCollector::instance().set_enabled(true);
  }
  ~ErrorGuard() { core::ErrorCollector::instance().clear(); }
};

// ============================================================================
// Construction
// ============================================================================

TEST(PackedStoreTest, NewStoreReadsDefaultEverywhere) {
  Int32Store store(10, 3);
  EXPECT_EQ(store.size(), 10u);
  EXPECT_EQ(store.default_value(), 3);
  EXPECT_EQ(store.sparse_extent(), 0u);
  for (std::size_t i = 0; i < store.size(); ++i) {
    EXPECT_EQ(store.get(i), 3) << "index " << i;
  }
}

TEST(PackedStoreTest, ResizeFromShortInputDefaultFills) {
  std::vector<std::int32_t> const values{1, 2, 3};
  auto const store = Int32Store::resize_from(values, 5, -1);

  EXPECT_EQ(store.sparse_extent(), 3u);
  EXPECT_EQ(store.get(2), 3);
  EXPECT_EQ(store.get(3), -1);
  EXPECT_EQ(store.get(4), -1);
}

TEST(PackedStoreTest, ResizeFromLongInputTruncates) {
  std::vector<std::int32_t> const values{1, 2, 3, 4, 5, 6};
  auto const store = Int32Store::resize_from(values, 4);

  EXPECT_EQ(store.size(), 4u);
  EXPECT_EQ(store.sparse_extent(), 4u);
  EXPECT_EQ(store.get(3), 4);
}

TEST(PackedStoreTest, ResizeFromCountsCopiedDefaults) {
  // Copied values equal to the default still raise the mark
  std::vector<std::int32_t> const values{0, 0, 0};
  auto const store = Int32Store::resize_from(values, 6, 0);
  EXPECT_EQ(store.sparse_extent(), 3u);
}

// ============================================================================
// High-water mark
// ============================================================================

TEST(PackedStoreTest, SetRaisesMarkToHighestWrite) {
  Int32Store store(10);

  store.set(4, 9);
  EXPECT_EQ(store.sparse_extent(), 5u);

  store.set(2, 1);
  EXPECT_EQ(store.sparse_extent(), 5u) << "a lower write must not shrink it";

  store.set(9, 1);
  EXPECT_EQ(store.sparse_extent(), 10u);
}

TEST(PackedStoreTest, ResetRestoresDefaultButKeepsMark) {
  Int32Store store(10, 7);
  store.set(7, 5);
  store.reset(7);

  EXPECT_EQ(store.get(7), 7);
  EXPECT_EQ(store.sparse_extent(), 8u);
}

TEST(PackedStoreTest, CellsPastMarkHoldDefault) {
  Int32Store store(32, 4);
  store.set(3, 1).set(11, 2).set(6, 3);
  store.reset(11);

  for (std::size_t i = store.sparse_extent(); i < store.size(); ++i) {
    EXPECT_EQ(store.get(i), store.default_value()) << "index " << i;
  }
}

TEST(PackedStoreTest, MarkDenseCoversWholeStore) {
  Int32Store store(6);
  store.mark_dense();
  EXPECT_EQ(store.sparse_extent(), 6u);
}

TEST(PackedStoreTest, TransformPrefixLeavesTailAlone) {
  Int32Store store(6, 1);
  store.set(2, 5);
  store.transform_prefix(store.sparse_extent(),
                         [](std::size_t i, std::int32_t v) {
                           return v + static_cast<std::int32_t>(i);
                         });

  EXPECT_EQ(store.get(0), 1);
  EXPECT_EQ(store.get(1), 2);
  EXPECT_EQ(store.get(2), 7);
  EXPECT_EQ(store.get(3), 1);
  EXPECT_EQ(store.sparse_extent(), 3u);
}

// ============================================================================
// Value semantics
// ============================================================================

TEST(PackedStoreTest, CopiesAreIndependent) {
  Int32Store a(4, 0);
  a.set(1, 8);

  Int32Store b = a;
  b.set(3, 9);
  b.reset(1);

  EXPECT_EQ(a.get(1), 8);
  EXPECT_EQ(a.get(3), 0);
  EXPECT_EQ(a.sparse_extent(), 2u);
  EXPECT_EQ(b.sparse_extent(), 4u);
}

// ============================================================================
// Errors
// ============================================================================

TEST(PackedStoreTest, GetBeyondLengthRaisesIndexOutOfRange) {
  ErrorGuard guard;
  Int32Store store(4);

  try {
    (void)store.get(4);
    FAIL() << "expected IndexOutOfRange";
  } catch (const core::matrix_error& e) {
    EXPECT_EQ(e.code(), core::ErrorCode::IndexOutOfRange);
    EXPECT_EQ(e.info().component, "packed_store");
    EXPECT_EQ(e.info().context_data[0], 4u);
    EXPECT_EQ(e.info().context_data[1], 4u);
  }

  EXPECT_EQ(core::ErrorCollector::instance().count(
                core::ErrorCode::IndexOutOfRange),
            1u);
}

TEST(PackedStoreTest, FailedSetLeavesStoreUntouched) {
  ErrorGuard guard;
  Int32Store store(4, 2);

  EXPECT_THROW(store.set(100, 1), core::matrix_error);
  EXPECT_THROW(store.reset(4), core::matrix_error);
  EXPECT_EQ(store.sparse_extent(), 0u);
  EXPECT_EQ(core::ErrorCollector::instance().error_count(), 2u);
}

} // namespace
} // namespace tessel
