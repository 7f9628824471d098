// =============================================================================
// Word Information Tests (built-in table and SQLite frequency store)
// =============================================================================

#include <gtest/gtest.h>
#include "freq_store.hpp"
#include "word_info.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

TEST(BuiltinWordInformationTest, CommonWordsAreCheap) {
  const auto& info = BuiltinWordInformation::instance();
  EXPECT_DOUBLE_EQ(info.information("the"), INFO_LOW); // log2(10) clamps up
  EXPECT_DOUBLE_EQ(info.information("The"), INFO_LOW);
  EXPECT_NEAR(info.information("of"), std::log2(20.0), 1e-12);
  EXPECT_LT(info.information("and"), info.information("world"));
}

TEST(BuiltinWordInformationTest, UnknownWordsAreRare) {
  const auto& info = BuiltinWordInformation::instance();
  EXPECT_DOUBLE_EQ(info.information("zyzzyva"), INFO_HIGH);
  EXPECT_DOUBLE_EQ(info.information(""), INFO_HIGH);
}

TEST(BuiltinWordInformationTest, ClampStaysInBounds) {
  EXPECT_DOUBLE_EQ(clamp_information(0.5), INFO_LOW);
  EXPECT_DOUBLE_EQ(clamp_information(40), INFO_HIGH);
  EXPECT_DOUBLE_EQ(clamp_information(9), 9);
}

class FrequencyStoreTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir = fs::temp_directory_path() /
          ("rsvp_freq_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
    fs::remove_all(dir);
    fs::create_directories(dir);
    db_path = (dir / "freq.sqlite").string();
  }
  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir, ec);
  }

  fs::path dir;
  std::string db_path;
};

TEST_F(FrequencyStoreTest, InformationIsNegativeLogProbability) {
  FrequencyStore store(db_path);
  store.add_count("the", 65536);      // 2^-4
  store.add_count("cat", 1024);       // 2^-10
  store.add_count("filler", 1048576 - 65536 - 1024);

  EXPECT_EQ(store.total(), 1048576);
  EXPECT_NEAR(store.information("the"), 4.0, 1e-9);
  EXPECT_NEAR(store.information("cat"), 10.0, 1e-9);
  EXPECT_NEAR(store.information("CAT"), 10.0, 1e-9);
  EXPECT_DOUBLE_EQ(store.information("missing"), INFO_HIGH);
}

TEST_F(FrequencyStoreTest, CountsAccumulateAndPersist) {
  {
    FrequencyStore store(db_path);
    store.add_count("Word", 3);
    store.add_count("word", 4);
    EXPECT_EQ(store.count("word"), 7);
  }
  FrequencyStore reopened(db_path);
  EXPECT_EQ(reopened.count("WORD"), 7);
  EXPECT_EQ(reopened.total(), 7);
}

TEST_F(FrequencyStoreTest, ImportsWordCountLists) {
  std::string list = (dir / "list.txt").string();
  {
    std::ofstream out(list);
    out << "the 100\ncat 50\nnot-a-count line\n\nzero 0\n";
  }
  FrequencyStore store(db_path);
  EXPECT_EQ(store.import_list(list), 2u);
  EXPECT_EQ(store.count("cat"), 50);
  EXPECT_EQ(store.count("zero"), 0);
  EXPECT_EQ(store.total(), 150);
}

TEST_F(FrequencyStoreTest, EmptyStoreTreatsEverythingAsRare) {
  FrequencyStore store(db_path);
  EXPECT_DOUBLE_EQ(store.information("the"), INFO_HIGH);
}

TEST_F(FrequencyStoreTest, BadPathsThrow) {
  EXPECT_THROW({ FrequencyStore bad((dir / "no" / "such" / "dir.sqlite").string()); }, std::runtime_error);

  FrequencyStore store(db_path);
  EXPECT_THROW(store.import_list((dir / "missing.txt").string()), std::runtime_error);
}
