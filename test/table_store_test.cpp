/**
 * @file table_store_test.cpp
 * @brief Tests for the per-version interval table store.
 */

#include "termwidth/table_store.h"

#include "termwidth/error.h"
#include "test_helpers.h"

#include <gtest/gtest.h>

using namespace termwidth;

// =============================================================================
// Synthetic store
// =============================================================================

class TableStoreTest : public ::testing::Test {
protected:
  TableStore store = test_tables::make_store();
};

TEST_F(TableStoreTest, VersionsSortedAscending) {
  std::vector<std::string> expected = {"4.1.0", "5.0.0", "8.0.0", "10.0.0"};
  EXPECT_EQ(store.supported_versions(), expected);
  EXPECT_EQ(store.earliest(), "4.1.0");
  EXPECT_EQ(store.latest(), "10.0.0");
  EXPECT_EQ(store.size(), 4u);
}

TEST_F(TableStoreTest, TablesForKnownVersion) {
  const IntervalTable& wide = store.tables_for("5.0.0", TableCategory::WIDE_EASTASIAN);
  EXPECT_EQ(wide.size(), 3u);
  EXPECT_TRUE(wide.contains(0x2500));

  const IntervalTable& zero = store.tables_for("5.0.0", TableCategory::ZERO_WIDTH);
  EXPECT_TRUE(zero.contains(0x0301));
  EXPECT_FALSE(zero.contains(0x2500));
}

TEST_F(TableStoreTest, TablesForUnknownVersionThrows) {
  try {
    store.tables_for("6.0.0", TableCategory::ZERO_WIDTH);
    FAIL() << "Expected TermwidthException";
  } catch (const TermwidthException& e) {
    EXPECT_EQ(e.code(), ErrorCode::UNKNOWN_TABLE_VERSION);
    EXPECT_EQ(e.error().context, "6.0.0");
  }
}

TEST_F(TableStoreTest, LookupIsExactNotPartial) {
  // "8.0" is a resolver concern; the store only knows its own keys.
  EXPECT_FALSE(store.contains("8.0"));
  EXPECT_THROW(store.version_tables("8.0"), TermwidthException);
}

TEST_F(TableStoreTest, IndexOf) {
  EXPECT_EQ(store.index_of("4.1.0"), 0u);
  EXPECT_EQ(store.index_of("10.0.0"), 3u);
  EXPECT_EQ(store.index_of("latest"), store.size());
}

TEST_F(TableStoreTest, VersionTablesCarryParsedValue) {
  EXPECT_EQ(store.version_tables("10.0.0").value, (VersionValue{10, 0, 0}));
  EXPECT_EQ(store.version_tables(size_t{1}).version, "5.0.0");
}

TEST_F(TableStoreTest, AsciiStopsFromOverrides) {
  const VersionTables& tables = store.version_tables("4.1.0");
  EXPECT_TRUE(tables.ascii_fast_path);
  EXPECT_EQ(tables.ascii_stops.count, 1u);
  EXPECT_TRUE(tables.ascii_stops.contains('#'));
  EXPECT_FALSE(tables.ascii_stops.contains('A'));
}

TEST_F(TableStoreTest, AsciiStopsFromTables) {
  std::vector<VersionTables> versions;
  versions.emplace_back("1.0.0", test_tables::kZeroDigits, test_tables::kWide);
  TableStore digits(std::move(versions));
  const VersionTables& tables = digits.version_tables("1.0.0");
  EXPECT_TRUE(tables.ascii_fast_path);
  ASSERT_EQ(tables.ascii_stops.count, 1u);
  EXPECT_EQ(tables.ascii_stops.ranges[0].start, 0x30u);
  EXPECT_EQ(tables.ascii_stops.ranges[0].end, 0x39u);
}

TEST_F(TableStoreTest, EmojiOverridesExposed) {
  EXPECT_TRUE(store.emoji_overrides().contains(0x23));
  EXPECT_FALSE(store.emoji_overrides().contains(0x41));
}

// =============================================================================
// Construction errors
// =============================================================================

TEST(TableStoreConstruction, EmptyStoreIsFatal) {
  try {
    TableStore store(std::vector<VersionTables>{});
    FAIL() << "Expected TermwidthException";
  } catch (const TermwidthException& e) {
    EXPECT_EQ(e.code(), ErrorCode::EMPTY_TABLE_STORE);
    EXPECT_EQ(e.error().severity, ErrorSeverity::FATAL);
  }
}

TEST(TableStoreConstruction, DuplicateVersionRejected) {
  std::vector<VersionTables> versions;
  versions.emplace_back("9.0.0", test_tables::kZero, test_tables::kWide);
  versions.emplace_back("9.0.0", test_tables::kZero, test_tables::kWide);
  try {
    TableStore store(std::move(versions));
    FAIL() << "Expected TermwidthException";
  } catch (const TermwidthException& e) {
    EXPECT_EQ(e.code(), ErrorCode::DUPLICATE_VERSION);
  }
}

TEST(TableStoreConstruction, MalformedVersionRejected) {
  std::vector<VersionTables> versions;
  versions.emplace_back("nine", test_tables::kZero, test_tables::kWide);
  try {
    TableStore store(std::move(versions));
    FAIL() << "Expected TermwidthException";
  } catch (const TermwidthException& e) {
    EXPECT_EQ(e.code(), ErrorCode::MALFORMED_VERSION);
  }
}

TEST(TableStoreConstruction, OverlappingTableRejected) {
  static constexpr Interval overlap[] = {{0x300, 0x36F}, {0x360, 0x370}};
  std::vector<VersionTables> versions;
  versions.emplace_back("9.0.0", overlap, test_tables::kWide);
  try {
    TableStore store(std::move(versions));
    FAIL() << "Expected TermwidthException";
  } catch (const TermwidthException& e) {
    EXPECT_EQ(e.code(), ErrorCode::INVALID_TABLE);
    EXPECT_EQ(e.error().context, "9.0.0");
  }
}

TEST(TableStoreConstruction, UnsortedOverridesRejected) {
  static constexpr Interval unsorted[] = {{0x2764, 0x2764}, {0x23, 0x23}};
  std::vector<VersionTables> versions;
  versions.emplace_back("9.0.0", test_tables::kZero, test_tables::kWide);
  EXPECT_THROW({ TableStore store(std::move(versions), unsorted); }, TermwidthException);
}

// =============================================================================
// Built-in Unicode data
// =============================================================================

TEST(BuiltinTableStore, CoversPublishedVersions) {
  const TableStore& store = TableStore::builtin();
  EXPECT_EQ(store.earliest(), "4.1.0");
  EXPECT_TRUE(store.contains("9.0.0"));
  EXPECT_TRUE(store.contains("15.1.0"));
  EXPECT_GE(store.size(), 20u);
}

TEST(BuiltinTableStore, AscendingOrder) {
  const auto& versions = TableStore::builtin().supported_versions();
  for (size_t i = 1; i < versions.size(); ++i) {
    EXPECT_LT(compare_versions(parse_version(versions[i - 1]), parse_version(versions[i])), 0)
        << versions[i - 1] << " vs " << versions[i];
  }
}

TEST(BuiltinTableStore, EveryTableValidWithAsciiFastPath) {
  const TableStore& store = TableStore::builtin();
  for (size_t i = 0; i < store.size(); ++i) {
    const VersionTables& tables = store.version_tables(i);
    EXPECT_TRUE(tables.zero_width.is_valid()) << tables.version;
    EXPECT_TRUE(tables.wide_eastasian.is_valid()) << tables.version;
    EXPECT_FALSE(tables.zero_width.empty()) << tables.version;
    EXPECT_FALSE(tables.wide_eastasian.empty()) << tables.version;
    EXPECT_TRUE(tables.ascii_fast_path) << tables.version;
    EXPECT_TRUE(tables.ascii_stops.contains('#')) << tables.version;
    EXPECT_TRUE(tables.ascii_stops.contains('*')) << tables.version;
    EXPECT_TRUE(tables.ascii_stops.contains('5')) << tables.version;
    EXPECT_FALSE(tables.ascii_stops.contains('A')) << tables.version;
  }
}

TEST(BuiltinTableStore, SameInstance) {
  EXPECT_EQ(&TableStore::builtin(), &TableStore::builtin());
}

TEST(BuiltinTableStore, VersionDependentEmoji) {
  const TableStore& store = TableStore::builtin();
  EXPECT_FALSE(store.tables_for("8.0.0", TableCategory::WIDE_EASTASIAN).contains(0x1F600));
  EXPECT_TRUE(store.tables_for("9.0.0", TableCategory::WIDE_EASTASIAN).contains(0x1F600));
}

TEST(TableCategoryTest, Names) {
  EXPECT_STREQ(table_category_to_string(TableCategory::ZERO_WIDTH), "zero_width");
  EXPECT_STREQ(table_category_to_string(TableCategory::WIDE_EASTASIAN), "wide_eastasian");
}
