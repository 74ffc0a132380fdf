#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "market/outcome_pair.hpp"
#include "fakes/test_pairs.hpp"

using namespace crossarb;

TEST(OutcomePairTest, ParsesValidRecord) {
    auto result = parse_outcome_pair(testing_pairs::record(45, 55, 47, 52));
    ASSERT_TRUE(result.ok()) << result.error;

    const auto& pair = *result.pair;
    EXPECT_EQ(pair.pair_id(), "LAL@GSW");
    EXPECT_EQ(pair.display_name(), "Los Angeles Lakers vs Golden State Warriors");
    EXPECT_EQ(pair.sport, "nba");
    EXPECT_EQ(pair.first.venue, Venue::POLYMARKET);
    EXPECT_EQ(pair.second.venue, Venue::KALSHI);
    EXPECT_DOUBLE_EQ(pair.second.away_price, 47.0);
    EXPECT_EQ(pair.second.home_market_id, "KXNBAGAME-26JAN15LALGSW-GSW");
}

TEST(OutcomePairTest, NormalizesTwoWayQuotes) {
    auto result = parse_outcome_pair(testing_pairs::record(48, 56, 50, 50));
    ASSERT_TRUE(result.ok());
    ASSERT_TRUE(result.pair->first.normalized.has_value());
    EXPECT_EQ(result.pair->first.normalized->away, 47);
    EXPECT_EQ(result.pair->first.normalized->home, 53);
    // Raw prices are kept for cost calculations
    EXPECT_DOUBLE_EQ(result.pair->first.away_price, 48.0);
}

TEST(OutcomePairTest, ThreeWayKeepsRawValues) {
    auto j = testing_pairs::record(40, 35, 42, 33);
    j["three_way"] = true;
    auto result = parse_outcome_pair(j);
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result.pair->three_way);
    EXPECT_FALSE(result.pair->first.normalized.has_value());
    EXPECT_FALSE(result.pair->second.normalized.has_value());
}

TEST(OutcomePairTest, DisplayNameFallsBackToCodes) {
    auto j = testing_pairs::record(45, 55, 47, 52);
    j["away"].erase("name");
    auto result = parse_outcome_pair(j);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.pair->display_name(), "LAL vs Golden State Warriors");
}

TEST(OutcomePairTest, RejectsMissingCode) {
    auto j = testing_pairs::record(45, 55, 47, 52);
    j["home"]["code"] = "";
    auto result = parse_outcome_pair(j);
    EXPECT_FALSE(result.ok());
    EXPECT_FALSE(result.error.empty());
}

TEST(OutcomePairTest, RejectsSameVenueQuotes) {
    auto j = testing_pairs::record(45, 55, 47, 52);
    j["quotes"][1]["venue"] = "Polymarket";
    EXPECT_FALSE(parse_outcome_pair(j).ok());
}

TEST(OutcomePairTest, RejectsUnknownVenue) {
    auto j = testing_pairs::record(45, 55, 47, 52);
    j["quotes"][0]["venue"] = "PredictIt";
    EXPECT_FALSE(parse_outcome_pair(j).ok());
}

TEST(OutcomePairTest, RejectsOutOfRangePrices) {
    auto high = testing_pairs::record(45, 101, 47, 52);
    EXPECT_FALSE(parse_outcome_pair(high).ok());

    auto negative = testing_pairs::record(-1, 55, 47, 52);
    EXPECT_FALSE(parse_outcome_pair(negative).ok());

    auto text = testing_pairs::record(45, 55, 47, 52);
    text["quotes"][0]["away_price"] = "45";
    EXPECT_FALSE(parse_outcome_pair(text).ok());
}

TEST(OutcomePairTest, RejectsMissingMarketId) {
    auto j = testing_pairs::record(45, 55, 47, 52);
    j["quotes"][1].erase("home_market_id");
    EXPECT_FALSE(parse_outcome_pair(j).ok());
}

TEST(OutcomePairTest, RejectsWrongQuoteCount) {
    auto j = testing_pairs::record(45, 55, 47, 52);
    j["quotes"].erase(1);
    EXPECT_FALSE(parse_outcome_pair(j).ok());
}

class OutcomePairFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = (std::filesystem::temp_directory_path() / "crossarb_test_feed.json").string();
    }

    void TearDown() override {
        std::filesystem::remove(path_);
    }

    void write(const std::string& content) {
        std::ofstream f(path_);
        f << content;
    }

    std::string path_;
};

TEST_F(OutcomePairFileTest, SkipsInvalidRecords) {
    auto good = testing_pairs::record(45, 55, 47, 52);
    auto bad = testing_pairs::record(45, 55, 47, 52);
    bad["quotes"][0]["away_price"] = 150;

    write(nlohmann::json::array({good, bad, good}).dump());

    auto pairs = load_outcome_pairs(path_);
    EXPECT_EQ(pairs.size(), 2u);
}

TEST_F(OutcomePairFileTest, ThrowsOnMalformedFile) {
    write("{ not json");
    EXPECT_THROW(load_outcome_pairs(path_), std::runtime_error);

    write(R"({"away": {}})");
    EXPECT_THROW(load_outcome_pairs(path_), std::runtime_error);
}

TEST_F(OutcomePairFileTest, ThrowsOnMissingFile) {
    EXPECT_THROW(load_outcome_pairs(path_ + ".missing"), std::runtime_error);
}
