#include <gtest/gtest.h>
#include "exec/protective_stop.hpp"
#include "fake_exchange.hpp"

using exec::ProtectiveStopManager;
using exec::ProtectiveStopState;
using exec::StopPhase;
using testing_support::FakeExchange;
using testing_support::snapshot;

namespace {

class ProtectiveStopTest : public ::testing::Test {
protected:
    void SetUp() override {
        p.symbol = "ETHUSDT";
        p.sl_amount = 25.0;
        p.tsl_step = 10.0;
        p.filters.tick_size = 0.01;
        p.filters.price_buffer = 0.5;
    }

    void open_long(double entry, double qty = 1.0){ ex.position = Position{PositionSide::Long, entry, qty}; }
    void open_short(double entry, double qty = 1.0){ ex.position = Position{PositionSide::Short, entry, qty}; }

    ProtectiveStopState cycle(double mark){
        ex.mark = mark;
        state = mgr.step(p, state, ex.position, snapshot(ex));
        return state;
    }

    FakeExchange ex;
    ProtectiveStopManager mgr{ex};
    exec::StopParams p;
    ProtectiveStopState state;
};

} // namespace

TEST_F(ProtectiveStopTest, PlacesInitialStopBelowLongEntry) {
    open_long(100.0, 2.0);
    cycle(100.0);

    ASSERT_EQ(ex.placed.size(), 1u);
    const auto& r = ex.placed[0];
    EXPECT_EQ(r.side, Side::Sell);
    EXPECT_DOUBLE_EQ(r.trigger_price, 75.0);
    EXPECT_DOUBLE_EQ(r.limit_price, 74.5);
    EXPECT_DOUBLE_EQ(r.quantity, 2.0);
    EXPECT_TRUE(r.reduce_only);
    EXPECT_EQ(state.phase, StopPhase::InitialStopSet);
    ASSERT_TRUE(state.order_id.has_value());
    EXPECT_DOUBLE_EQ(state.stop_price, 75.0);
}

TEST_F(ProtectiveStopTest, PlacesInitialStopAboveShortEntry) {
    open_short(100.0);
    cycle(100.0);
    ASSERT_EQ(ex.placed.size(), 1u);
    EXPECT_EQ(ex.placed[0].side, Side::Buy);
    EXPECT_DOUBLE_EQ(ex.placed[0].trigger_price, 125.0);
    EXPECT_DOUBLE_EQ(ex.placed[0].limit_price, 125.5);
}

TEST_F(ProtectiveStopTest, BreakEvenThenOneTrailingStep) {
    open_long(100.0);
    cycle(100.0);                      // kezdő stop 75

    cycle(136.0);                      // profit 36 >= 25+10
    EXPECT_EQ(state.phase, StopPhase::BreakEvenSet);
    EXPECT_DOUBLE_EQ(state.stop_price, 100.0);
    ASSERT_EQ(ex.placed.size(), 2u);
    EXPECT_DOUBLE_EQ(ex.placed[1].trigger_price, 100.0);
    EXPECT_DOUBLE_EQ(ex.placed[1].limit_price, 99.5);

    cycle(147.0);                      // a stoptól lép, nem a markból számol
    EXPECT_EQ(state.phase, StopPhase::Trailing);
    EXPECT_DOUBLE_EQ(state.stop_price, 110.0);
    EXPECT_DOUBLE_EQ(ex.placed.back().trigger_price, 110.0);
    EXPECT_DOUBLE_EQ(ex.placed.back().limit_price, 109.5);

    // mindig csak egy élő védőstop
    EXPECT_EQ(ex.open_orders.size(), 1u);
    EXPECT_EQ(ex.open_orders[0].id, *state.order_id);
}

TEST_F(ProtectiveStopTest, ShortPositionTrailsDownward) {
    open_short(100.0);
    cycle(100.0);
    cycle(64.0);
    EXPECT_EQ(state.phase, StopPhase::BreakEvenSet);
    EXPECT_DOUBLE_EQ(ex.placed.back().limit_price, 100.5);
    cycle(53.0);
    EXPECT_EQ(state.phase, StopPhase::Trailing);
    EXPECT_DOUBLE_EQ(state.stop_price, 90.0);
}

TEST_F(ProtectiveStopTest, BelowThresholdNothingMoves) {
    open_long(100.0);
    cycle(100.0);
    cycle(134.99);
    EXPECT_EQ(state.phase, StopPhase::InitialStopSet);
    EXPECT_EQ(ex.place_calls, 1);
    EXPECT_EQ(ex.cancel_calls, 0);
}

TEST_F(ProtectiveStopTest, BreakEvenFiresOncePerPosition) {
    open_long(100.0);
    cycle(100.0);
    for (double m : {136.0, 120.0, 135.5, 101.0, 136.0, 90.0, 135.0})
        cycle(m);

    int at_entry = 0;
    for (const auto& r : ex.placed) if (r.trigger_price == 100.0) ++at_entry;
    EXPECT_EQ(at_entry, 1);
    EXPECT_TRUE(state.break_even_applied());
}

TEST_F(ProtectiveStopTest, StopNeverRetreatsForLong) {
    open_long(100.0);
    cycle(100.0);
    double last = state.stop_price;
    for (double m : {140.0, 150.0, 150.0, 130.0, 170.0, 170.0, 170.0, 120.0, 200.0, 200.0}){
        cycle(m);
        EXPECT_GE(state.stop_price, last) << "mark " << m;
        last = state.stop_price;
    }
    // minden lépés pontosan egy tsl_step
    for (std::size_t i=2;i<ex.placed.size();++i)
        EXPECT_DOUBLE_EQ(ex.placed[i].trigger_price - ex.placed[i-1].trigger_price, 10.0);
    // a stop a marktól legalább sl_amount távolságra marad
    EXPECT_LE(state.stop_price, 200.0 - p.sl_amount);
}

TEST_F(ProtectiveStopTest, PositionCloseResetsState) {
    open_long(100.0);
    cycle(100.0);
    cycle(136.0);
    ex.position.reset();               // a break-even stop teljesült
    ex.open_orders.clear();
    cycle(136.0);
    EXPECT_EQ(state.phase, StopPhase::NoPosition);
    EXPECT_FALSE(state.order_id.has_value());

    // új pozíció: újra kezdő stop, a break-even újra elérhető
    open_long(200.0);
    cycle(200.0);
    EXPECT_EQ(state.phase, StopPhase::InitialStopSet);
    EXPECT_DOUBLE_EQ(state.stop_price, 175.0);
}

TEST_F(ProtectiveStopTest, NewPositionWithoutFlatCycleIsDetected) {
    open_long(100.0);
    cycle(100.0);
    ex.open_orders.clear();            // a stop teljesült
    open_short(90.0);                  // és közben új short nyílt
    cycle(90.0);
    EXPECT_EQ(state.position_side, PositionSide::Short);
    EXPECT_EQ(state.phase, StopPhase::InitialStopSet);
    EXPECT_DOUBLE_EQ(state.stop_price, 115.0);
}

TEST_F(ProtectiveStopTest, FailedCancelKeepsPreviousState) {
    open_long(100.0);
    cycle(100.0);
    const auto before = state;
    ex.fail_next_cancel = 1;
    cycle(136.0);
    EXPECT_EQ(state.phase, StopPhase::InitialStopSet);
    EXPECT_EQ(state.order_id, before.order_id);
    EXPECT_DOUBLE_EQ(state.stop_price, 75.0);

    cycle(136.0);                      // a következő ciklus újrapróbálja
    EXPECT_EQ(state.phase, StopPhase::BreakEvenSet);
}

TEST_F(ProtectiveStopTest, CancelOkPlaceFailedIsRepairedNextCycle) {
    open_long(100.0);
    cycle(100.0);
    ex.fail_next_place = 1;
    cycle(136.0);
    EXPECT_FALSE(state.order_id.has_value());   // nincs élő védőstop
    EXPECT_EQ(state.phase, StopPhase::InitialStopSet);
    EXPECT_TRUE(ex.open_orders.empty());

    cycle(136.0);                                // javítás a megtartott stop áron
    ASSERT_TRUE(state.order_id.has_value());
    EXPECT_DOUBLE_EQ(ex.placed.back().trigger_price, 75.0);
    EXPECT_EQ(ex.open_orders.size(), 1u);

    cycle(136.0);
    EXPECT_EQ(state.phase, StopPhase::BreakEvenSet);
    EXPECT_EQ(ex.open_orders.size(), 1u);
}

TEST_F(ProtectiveStopTest, VanishedStopIsReplacedAtRetainedPrice) {
    open_long(100.0);
    cycle(100.0);
    cycle(136.0);
    cycle(147.0);                      // stop 110
    ex.open_orders.clear();            // kívülről törölték
    cycle(140.0);
    ASSERT_TRUE(state.order_id.has_value());
    EXPECT_EQ(state.phase, StopPhase::Trailing);
    EXPECT_DOUBLE_EQ(ex.placed.back().trigger_price, 110.0);
}

TEST_F(ProtectiveStopTest, MarkPriceFailureSkipsTransition) {
    open_long(100.0);
    cycle(100.0);
    ex.fail_mark = true;
    cycle(150.0);
    EXPECT_EQ(state.phase, StopPhase::InitialStopSet);
    EXPECT_EQ(ex.cancel_calls, 0);
}

TEST_F(ProtectiveStopTest, RestartAdoptsBreakEvenStopWithoutReapplying) {
    open_long(100.0);
    ex.open_orders = {Order{55, Side::Sell, OrderType::StopLimit, 100.0, 99.5, 1.0}};
    cycle(130.0);
    EXPECT_EQ(state.phase, StopPhase::BreakEvenSet);
    EXPECT_EQ(state.order_id, std::optional<std::uint64_t>{55});
    EXPECT_EQ(ex.mutating_calls(), 0);

    cycle(136.0);                      // nem új break-even, hanem egy trailing lépés
    EXPECT_EQ(state.phase, StopPhase::Trailing);
    EXPECT_DOUBLE_EQ(state.stop_price, 110.0);
}

TEST_F(ProtectiveStopTest, RestartDerivesPhaseFromLiveStopPrice) {
    open_long(100.0);
    ex.open_orders = {Order{55, Side::Sell, OrderType::StopLimit, 75.0, 74.5, 1.0}};
    cycle(100.0);
    EXPECT_EQ(state.phase, StopPhase::InitialStopSet);

    ProtectiveStopState fresh;
    state = fresh;
    ex.open_orders = {Order{56, Side::Sell, OrderType::StopLimit, 120.0, 119.5, 1.0}};
    cycle(150.0);
    EXPECT_EQ(state.phase, StopPhase::Trailing);
    EXPECT_DOUBLE_EQ(state.stop_price, 120.0);
    EXPECT_EQ(ex.place_calls, 0);
}

TEST_F(ProtectiveStopTest, RestartKeepsMostProtectiveStopAndCancelsExtras) {
    open_short(100.0);
    ex.open_orders = {
        Order{60, Side::Buy, OrderType::StopLimit, 125.0, 125.5, 1.0},
        Order{61, Side::Buy, OrderType::StopLimit, 90.0, 90.5, 1.0},
    };
    cycle(95.0);
    EXPECT_EQ(state.order_id, std::optional<std::uint64_t>{61});
    EXPECT_EQ(state.phase, StopPhase::Trailing);
    EXPECT_EQ(ex.cancelled, std::vector<std::uint64_t>{60});
}

TEST_F(ProtectiveStopTest, DerivePhase) {
    EXPECT_EQ(ProtectiveStopManager::derive_phase(PositionSide::Long, 100.0, 75.0, 0.01), StopPhase::InitialStopSet);
    EXPECT_EQ(ProtectiveStopManager::derive_phase(PositionSide::Long, 100.0, 100.0, 0.01), StopPhase::BreakEvenSet);
    EXPECT_EQ(ProtectiveStopManager::derive_phase(PositionSide::Short, 100.0, 90.0, 0.01), StopPhase::Trailing);
    EXPECT_EQ(ProtectiveStopManager::derive_phase(PositionSide::Short, 100.0, 125.0, 0.01), StopPhase::InitialStopSet);
}

TEST_F(ProtectiveStopTest, GrownPositionWithShiftedEntryGetsFullSizeStop) {
    open_long(100.0, 0.5);
    cycle(100.0);
    ASSERT_EQ(ex.open_orders.size(), 1u);
    EXPECT_DOUBLE_EQ(ex.open_orders[0].quantity, 0.5);

    open_long(100.2, 1.0);             // a belépő stop-limit tovább teljesült
    cycle(100.2);

    ASSERT_EQ(ex.open_orders.size(), 1u);
    EXPECT_DOUBLE_EQ(ex.open_orders[0].quantity, 1.0);
    EXPECT_DOUBLE_EQ(ex.open_orders[0].trigger_price, 75.0);   // a megtartott stop ár
    EXPECT_EQ(ex.open_orders[0].id, *state.order_id);
    EXPECT_EQ(ex.place_calls, 2);
    EXPECT_EQ(state.phase, StopPhase::InitialStopSet);
}

TEST_F(ProtectiveStopTest, GrownPositionAtSameEntryResizesTrackedStop) {
    open_long(100.0, 1.0);
    cycle(100.0);
    cycle(136.0);                      // break-even 100
    open_long(100.0, 2.0);
    cycle(120.0);

    ASSERT_EQ(ex.open_orders.size(), 1u);
    EXPECT_DOUBLE_EQ(ex.open_orders[0].quantity, 2.0);
    EXPECT_DOUBLE_EQ(ex.open_orders[0].trigger_price, 100.0);
    EXPECT_EQ(state.phase, StopPhase::BreakEvenSet);

    const int places = ex.place_calls;
    cycle(120.0);                      // már lefedi, nincs újabb csere
    EXPECT_EQ(ex.place_calls, places);
}

TEST_F(ProtectiveStopTest, FailedCancelOfExtraStopIsRetried) {
    open_long(100.0);
    ex.open_orders = {
        Order{70, Side::Sell, OrderType::StopLimit, 75.0, 74.5, 1.0},
        Order{71, Side::Sell, OrderType::StopLimit, 70.0, 69.5, 1.0},
    };
    ex.fail_next_cancel = 1;
    for (int i=0;i<5;++i) cycle(100.0);

    ASSERT_EQ(ex.open_orders.size(), 1u);
    EXPECT_EQ(ex.open_orders[0].id, 70u);
    EXPECT_EQ(state.order_id, std::optional<std::uint64_t>{70});
    EXPECT_EQ(ex.cancelled, std::vector<std::uint64_t>{71});
    EXPECT_EQ(ex.cancel_calls, 2);
}

TEST_F(ProtectiveStopTest, StrayClosingStopNextToTrackedOneIsCancelled) {
    open_long(100.0);
    cycle(100.0);
    ex.open_orders.push_back(Order{90, Side::Sell, OrderType::StopLimit, 60.0, 59.5, 1.0});
    cycle(100.0);
    ASSERT_EQ(ex.open_orders.size(), 1u);
    EXPECT_EQ(ex.open_orders[0].id, *state.order_id);
    EXPECT_EQ(ex.cancelled, std::vector<std::uint64_t>{90});
}
