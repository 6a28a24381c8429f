#include <gtest/gtest.h>
#include "QTable.hpp"
#include <stdexcept>

class QTableTest : public ::testing::Test {
protected:
    QTable table_;
    const std::string key_ = "2,0,0,0,0,0,0,0,0,0,0,0,0,0,0,2";
};

TEST_F(QTableTest, UnseenStatesReadAsZero) {
    QTable::Values values = table_.values(key_);
    for (double v : values) {
        EXPECT_EQ(v, 0.0);
    }
    EXPECT_EQ(table_.maxValue(key_), 0.0);
    EXPECT_EQ(table_.size(), 0u);
    EXPECT_FALSE(table_.contains(key_));
}

TEST_F(QTableTest, UpdateStoresOneAction) {
    table_.update(key_, 2, 1.5);
    EXPECT_EQ(table_.size(), 1u);
    EXPECT_EQ(table_.value(key_, 2), 1.5);
    EXPECT_EQ(table_.value(key_, 0), 0.0);
    EXPECT_EQ(table_.maxValue(key_), 1.5);

    table_.update(key_, 0, -3.0);
    EXPECT_EQ(table_.size(), 1u);
    EXPECT_EQ(table_.maxValue(key_), 1.5);

    EXPECT_THROW(table_.update(key_, 4, 1.0), std::out_of_range);
}

TEST_F(QTableTest, MaxValueOfNegativeRow) {
    table_.update(key_, 0, -1.0);
    table_.update(key_, 1, -2.0);
    // Untouched actions stay at zero
    EXPECT_EQ(table_.maxValue(key_), 0.0);
}

TEST_F(QTableTest, JsonDocumentRestoresTable) {
    table_.update(key_, 1, 0.25);
    table_.update("other", 3, -7.0);

    QTable restored;
    restored.fromJson(table_.toJson());
    EXPECT_EQ(restored.size(), 2u);
    EXPECT_EQ(restored.values(key_), table_.values(key_));
    EXPECT_EQ(restored.value("other", 3), -7.0);
}

TEST_F(QTableTest, MalformedDocumentLeavesTableUnchanged) {
    table_.update(key_, 0, 1.0);

    EXPECT_THROW(table_.fromJson(nlohmann::json::array()), std::invalid_argument);
    EXPECT_THROW(table_.fromJson({{"state", {1.0, 2.0}}}), std::invalid_argument);
    EXPECT_THROW(table_.fromJson({{"state", {1.0, 2.0, "x", 4.0}}}), std::invalid_argument);

    EXPECT_EQ(table_.size(), 1u);
    EXPECT_EQ(table_.value(key_, 0), 1.0);

    table_.clear();
    EXPECT_EQ(table_.size(), 0u);
}
