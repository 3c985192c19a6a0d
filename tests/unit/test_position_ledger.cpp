#include <gtest/gtest.h>
#include "risk/position_ledger.hpp"

using namespace qbot;

class PositionLedgerTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::vector<InstrumentConfig> instruments(2);
        instruments[0].ticker = "UEC";
        instruments[0].position_limit = 100;
        instruments[1].ticker = "SOBER";
        ledger = std::make_unique<PositionLedger>(instruments);
    }

    static RestingOrder order(OrderId id, const Ticker& ticker, OrderSide side) {
        return RestingOrder{.id = id, .ticker = ticker, .side = side, .size = 5, .price = 100.0};
    }

    std::unique_ptr<PositionLedger> ledger;
};

TEST_F(PositionLedgerTest, InitialPositionsFlat) {
    EXPECT_EQ(ledger->position("UEC"), 0);
    EXPECT_EQ(ledger->position("SOBER"), 0);
    EXPECT_EQ(ledger->positions().size(), 2u);
    EXPECT_EQ(ledger->open_order_count(), 0u);
}

TEST_F(PositionLedgerTest, UnknownTickerReadsFlat) {
    EXPECT_EQ(ledger->position("NOPE"), 0);
}

TEST_F(PositionLedgerTest, FillsAccumulate) {
    ledger->on_fill("UEC", 3);
    ledger->on_fill("UEC", 4);
    ledger->on_fill("UEC", -10);
    EXPECT_EQ(ledger->position("UEC"), -3);
    EXPECT_EQ(ledger->position("SOBER"), 0);
}

TEST_F(PositionLedgerTest, FillOnUntrackedTickerCreatesPosition) {
    ledger->on_fill("NEW", -2);
    EXPECT_EQ(ledger->position("NEW"), -2);
}

TEST_F(PositionLedgerTest, RecordAndRemoveOrder) {
    ledger->record_order(order(10, "UEC", OrderSide::Buy));
    ledger->record_order(order(11, "UEC", OrderSide::Sell));
    EXPECT_EQ(ledger->open_order_count(), 2u);
    EXPECT_TRUE(ledger->has_open_order(10));

    const auto& stored = ledger->open_orders().at(11);
    EXPECT_EQ(stored.ticker, "UEC");
    EXPECT_EQ(stored.side, OrderSide::Sell);
    EXPECT_EQ(stored.size, 5);

    EXPECT_TRUE(ledger->remove_order(10));
    EXPECT_FALSE(ledger->has_open_order(10));
    EXPECT_EQ(ledger->open_order_count(), 1u);
}

TEST_F(PositionLedgerTest, RemovingUnknownOrderIsNoop) {
    ledger->record_order(order(1, "UEC", OrderSide::Buy));
    EXPECT_FALSE(ledger->remove_order(42));
    EXPECT_EQ(ledger->open_order_count(), 1u);
}

TEST_F(PositionLedgerTest, ReleaseReturnsIdsAscending) {
    ledger->record_order(order(7, "SOBER", OrderSide::Sell));
    ledger->record_order(order(3, "UEC", OrderSide::Buy));
    ledger->record_order(order(5, "UEC", OrderSide::Sell));

    auto ids = ledger->release_open_orders();
    EXPECT_EQ(ids, (std::vector<OrderId>{3, 5, 7}));
    EXPECT_EQ(ledger->open_order_count(), 0u);

    EXPECT_TRUE(ledger->release_open_orders().empty());
}

TEST_F(PositionLedgerTest, ReleaseLeavesPositionsAlone) {
    ledger->on_fill("UEC", 8);
    ledger->record_order(order(1, "UEC", OrderSide::Buy));
    ledger->release_open_orders();
    EXPECT_EQ(ledger->position("UEC"), 8);
}
