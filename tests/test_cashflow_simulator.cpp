#include "common/date.hpp"
#include "common/money.hpp"
#include "observability/logger.hpp"
#include "simulation/ledger_projector.hpp"
#include "simulation/simulation_error.hpp"
#include "simulation/simulation_orchestrator.hpp"
#include "simulation/transfer_advisor.hpp"

#include <gtest/gtest.h>

#include <iostream>
#include <limits>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <vector>

using namespace cashflow;

namespace {

Date d(const char* text) { return *Date::parse(text); }

Cents c(double units) { return *money::fromDouble(units); }

void expectSameDays(const std::vector<DayRecord>& a, const std::vector<DayRecord>& b) {
  ASSERT_EQ(a.size(), b.size());
  for (size_t i = 0; i < a.size(); ++i) {
    EXPECT_EQ(a[i].date, b[i].date);
    EXPECT_EQ(a[i].start_balance, b[i].start_balance);
    EXPECT_EQ(a[i].transactions_summary, b[i].transactions_summary);
    EXPECT_EQ(a[i].net_change, b[i].net_change);
    EXPECT_EQ(a[i].end_balance, b[i].end_balance);
    EXPECT_EQ(a[i].alert_type, b[i].alert_type);
  }
}

void expectContinuous(const std::vector<DayRecord>& days) {
  for (size_t i = 1; i < days.size(); ++i) {
    EXPECT_EQ(days[i].start_balance, days[i - 1].end_balance) << "at " << days[i].date;
    EXPECT_EQ(days[i].date, days[i - 1].date.addDays(1));
  }
}

const DayRecord& dayOn(const std::vector<DayRecord>& days, const Date& date) {
  for (const DayRecord& day : days) {
    if (day.date == date) return day;
  }
  throw std::out_of_range("no record for " + date.toString());
}

}  // namespace

// Date tests
TEST(DateTest, ParseAndFormat) {
  auto date = Date::parse("2024-02-29");
  ASSERT_TRUE(date.has_value());
  EXPECT_EQ(date->year(), 2024);
  EXPECT_EQ(date->month(), 2u);
  EXPECT_EQ(date->day(), 29u);
  EXPECT_EQ(date->toString(), "2024-02-29");
  EXPECT_EQ(date->toCompactString(), "20240229");

  EXPECT_FALSE(Date::parse("2023-02-29").has_value());
  EXPECT_FALSE(Date::parse("2023-02-30").has_value());
  EXPECT_FALSE(Date::parse("2023-13-01").has_value());
  EXPECT_FALSE(Date::parse("2023/01/01").has_value());
  EXPECT_FALSE(Date::parse("").has_value());
}

TEST(DateTest, MonthEnds) {
  EXPECT_TRUE(d("2024-01-31").isLastDayOfMonth());
  EXPECT_TRUE(d("2024-02-29").isLastDayOfMonth());
  EXPECT_FALSE(d("2024-02-28").isLastDayOfMonth());
  EXPECT_TRUE(d("2023-02-28").isLastDayOfMonth());
  EXPECT_TRUE(d("2023-04-30").isLastDayOfMonth());
  EXPECT_TRUE(d("2023-12-31").isLastDayOfMonth());

  EXPECT_EQ(d("2024-01-31").firstOfNextMonth(), d("2024-02-01"));
  EXPECT_EQ(d("2023-12-31").firstOfNextMonth(), d("2024-01-01"));
}

TEST(DateTest, DayArithmetic) {
  EXPECT_EQ(d("2023-12-30").addDays(3), d("2024-01-02"));
  EXPECT_EQ(d("2024-03-01").addDays(-1), d("2024-02-29"));
  EXPECT_EQ(Date(1970, 1, 1).dayNumber(), 0);
  EXPECT_LT(d("2024-01-01"), d("2024-01-02"));
  EXPECT_THROW(Date(2023, 2, 29), std::invalid_argument);
}

// Money tests
TEST(MoneyTest, ParseDecimalText) {
  EXPECT_EQ(money::parse("-1500.00"), std::optional<Cents>(-150000));
  EXPECT_EQ(money::parse("2500"), std::optional<Cents>(250000));
  EXPECT_EQ(money::parse("+3.5"), std::optional<Cents>(350));
  EXPECT_EQ(money::parse(" 75.50 "), std::optional<Cents>(7550));
  EXPECT_EQ(money::parse("1,200.00"), std::optional<Cents>(120000));

  EXPECT_FALSE(money::parse("").has_value());
  EXPECT_FALSE(money::parse("-").has_value());
  EXPECT_FALSE(money::parse("1.234").has_value());
  EXPECT_FALSE(money::parse("12a").has_value());
  EXPECT_FALSE(money::parse("1.2.3").has_value());
}

TEST(MoneyTest, FormatAndConvert) {
  EXPECT_EQ(money::format(-5), "-0.05");
  EXPECT_EQ(money::format(0), "0.00");
  EXPECT_EQ(money::format(250000), "2500.00");
  EXPECT_EQ(money::format(-150000), "-1500.00");

  EXPECT_EQ(money::fromDouble(0.1 + 0.2), std::optional<Cents>(30));
  EXPECT_EQ(money::fromDouble(-75.5), std::optional<Cents>(-7550));
  EXPECT_FALSE(money::fromDouble(std::numeric_limits<double>::quiet_NaN()).has_value());
  EXPECT_FALSE(money::fromDouble(std::numeric_limits<double>::infinity()).has_value());
  EXPECT_FALSE(money::fromDouble(1e20).has_value());
}

TEST(MoneyTest, CheckedArithmetic) {
  constexpr Cents kMax = std::numeric_limits<Cents>::max();
  constexpr Cents kMin = std::numeric_limits<Cents>::min();
  EXPECT_EQ(money::add(c(10), c(-2.5)), std::optional<Cents>(750));
  EXPECT_EQ(money::subtract(c(2500), c(3000)), std::optional<Cents>(-50000));
  EXPECT_FALSE(money::add(kMax, 1).has_value());
  EXPECT_FALSE(money::add(kMin, -1).has_value());
  EXPECT_FALSE(money::subtract(0, kMin).has_value());
  EXPECT_EQ(money::subtract(-1, kMin), std::optional<Cents>(kMax));
}

// Daily ledger projector tests
class LedgerProjectorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    transactions_ = {
        Transaction(d("2024-01-02"), c(-1500), "Rent", "Fixed", true),
        Transaction(d("2024-01-05"), c(2500), "Paycheck", "Revenue", true),
        Transaction(d("2024-01-05"), c(-50), "Spotify", "Variable", true),
        Transaction(d("2024-01-08"), c(-800), "Car Payment", "Fixed", true),
    };
  }

  DailyLedgerProjector projector_;
  std::vector<Transaction> transactions_;
};

TEST_F(LedgerProjectorTest, ProjectsEachDay) {
  auto days = projector_.project(2000.00, 1000.00, transactions_, d("2024-01-01"), 10);
  ASSERT_EQ(days.size(), 10u);

  EXPECT_EQ(days[0].date, d("2024-01-01"));
  EXPECT_EQ(days[0].start_balance, c(2000));
  EXPECT_EQ(days[0].net_change, 0);
  EXPECT_EQ(days[0].end_balance, c(2000));
  EXPECT_EQ(days[0].alert_type, AlertType::OK);
  EXPECT_EQ(days[0].transactions_summary, "");

  // Rent drops the balance below target
  EXPECT_EQ(days[1].date, d("2024-01-02"));
  EXPECT_EQ(days[1].net_change, c(-1500));
  EXPECT_EQ(days[1].end_balance, c(500));
  EXPECT_EQ(days[1].alert_type, AlertType::BELOW_TARGET);
  EXPECT_EQ(days[1].shortfall, c(500));

  EXPECT_EQ(days[4].date, d("2024-01-05"));
  EXPECT_EQ(days[4].start_balance, c(500));
  EXPECT_EQ(days[4].net_change, c(2450));
  EXPECT_EQ(days[4].end_balance, c(2950));
  EXPECT_EQ(days[4].alert_type, AlertType::OK);

  expectContinuous(days);
}

TEST_F(LedgerProjectorTest, SameDayTransactionsAreSummedInLedgerOrder) {
  auto days = projector_.project(1000.00, 500.00, transactions_, d("2024-01-05"), 1);
  ASSERT_EQ(days.size(), 1u);
  EXPECT_EQ(days[0].net_change, c(2450));
  EXPECT_EQ(days[0].end_balance, c(3450));
  EXPECT_EQ(days[0].transactions_summary, "Paycheck: 2500.00, Spotify: -50.00");
}

TEST_F(LedgerProjectorTest, NoTransactions) {
  auto days = projector_.project(1000.00, 500.00, {}, d("2024-01-01"), 5);
  ASSERT_EQ(days.size(), 5u);
  for (const DayRecord& day : days) {
    EXPECT_EQ(day.start_balance, c(1000));
    EXPECT_EQ(day.net_change, 0);
    EXPECT_EQ(day.end_balance, c(1000));
    EXPECT_EQ(day.alert_type, AlertType::OK);
    EXPECT_TRUE(day.transactions_summary.empty());
  }
}

TEST_F(LedgerProjectorTest, SingleOutflowBelowTarget) {
  std::vector<Transaction> txs = {Transaction(d("2024-03-02"), c(-1500), "Tuition")};
  auto days = projector_.project(2000.00, 1000.00, txs, d("2024-03-01"), 3);
  EXPECT_EQ(days[1].end_balance, c(500));
  EXPECT_EQ(days[1].alert_type, AlertType::BELOW_TARGET);
  EXPECT_EQ(days[2].alert_type, AlertType::BELOW_TARGET);
}

TEST_F(LedgerProjectorTest, BalanceEqualToTargetIsOk) {
  std::vector<Transaction> txs = {Transaction(d("2024-01-01"), c(-500), "Insurance")};
  auto days = projector_.project(1500.00, 1000.00, txs, d("2024-01-01"), 1);
  EXPECT_EQ(days[0].end_balance, c(1000));
  EXPECT_EQ(days[0].alert_type, AlertType::OK);
  EXPECT_EQ(days[0].shortfall, 0);
}

TEST_F(LedgerProjectorTest, IgnoresTransactionsOutsideWindow) {
  std::vector<Transaction> txs = {
      Transaction(d("2023-12-31"), c(-900), "Before"),
      Transaction(d("2024-01-04"), c(-900), "After"),
  };
  auto days = projector_.project(1000.00, 0.00, txs, d("2024-01-01"), 3);
  for (const DayRecord& day : days) {
    EXPECT_EQ(day.end_balance, c(1000));
  }
}

TEST_F(LedgerProjectorTest, IsIdempotent) {
  auto first = projector_.project(2000.00, 1000.00, transactions_, d("2024-01-01"), 30);
  auto second = projector_.project(2000.00, 1000.00, transactions_, d("2024-01-01"), 30);
  expectSameDays(first, second);
}

TEST_F(LedgerProjectorTest, RejectsInvalidInput) {
  EXPECT_THROW(projector_.project(1000.00, 500.00, transactions_, d("2024-01-01"), 0),
               InvalidWindowError);
  EXPECT_THROW(projector_.project(1000.00, 500.00, transactions_, d("2024-01-01"), -3),
               InvalidWindowError);
  EXPECT_THROW(projector_.project(std::numeric_limits<double>::quiet_NaN(), 500.00,
                                  transactions_, d("2024-01-01"), 5),
               InvalidBalanceError);
  EXPECT_THROW(projector_.project(1000.00, std::numeric_limits<double>::infinity(),
                                  transactions_, d("2024-01-01"), 5),
               InvalidBalanceError);
}

TEST_F(LedgerProjectorTest, OverflowingDayIsRejected) {
  // Each row is the largest amount a ledger accepts; enough of them on one
  // day exceed what a balance can hold.
  const Cents row_amount = *money::parse("9999999999999.99");
  std::vector<Transaction> flood(10300, Transaction(d("2024-01-02"), row_amount, "Wire"));
  EXPECT_THROW(projector_.projectCents(0, 0, flood, d("2024-01-01"), 5), BalanceOverflowError);

  const std::vector<Transaction> single = {
      Transaction(d("2024-01-01"), std::numeric_limits<Cents>::max(), "Wire")};
  EXPECT_THROW(projector_.projectCents(c(1), 0, single, d("2024-01-01"), 1),
               BalanceOverflowError);

  // Shortfall against the target must fit too.
  const std::vector<Transaction> drain = {
      Transaction(d("2024-01-01"), std::numeric_limits<Cents>::min() + 1, "Chargeback")};
  EXPECT_THROW(projector_.projectCents(0, c(1), drain, d("2024-01-01"), 1),
               BalanceOverflowError);
}

// Surplus transfer advisor tests
TEST(SurplusTransferAdvisorTest, FullSurplusWhenFutureStaysAboveTarget) {
  SurplusTransferAdvisor advisor;
  EXPECT_EQ(advisor.recommend(c(5000), c(2500), {c(4000), c(3500), c(3000), c(4500)}), c(2500));
}

TEST(SurplusTransferAdvisorTest, HoldsBackPredictedShortfall) {
  SurplusTransferAdvisor advisor;
  EXPECT_EQ(advisor.recommend(c(5000), c(2500), {c(4000), c(1500), c(2000), c(3500)}), c(1500));
}

TEST(SurplusTransferAdvisorTest, HoldbackExceedingSurplusGivesZero) {
  SurplusTransferAdvisor advisor;
  EXPECT_EQ(advisor.recommend(c(3000), c(2500), {c(2000), c(1500), c(2500)}), 0);
}

TEST(SurplusTransferAdvisorTest, NoSurplus) {
  SurplusTransferAdvisor advisor;
  EXPECT_EQ(advisor.recommend(c(2000), c(2500), {c(1500), c(1000), c(500)}), 0);
  EXPECT_EQ(advisor.recommend(c(2500), c(2500), {}), 0);
}

TEST(SurplusTransferAdvisorTest, EmptyLookAheadTransfersFullSurplus) {
  SurplusTransferAdvisor advisor;
  EXPECT_EQ(advisor.recommend(c(4000), c(2500), {}), c(1500));
}

TEST(SurplusTransferAdvisorTest, RejectsUnrepresentableSurplus) {
  SurplusTransferAdvisor advisor;
  EXPECT_THROW(advisor.recommend(std::numeric_limits<Cents>::max(), c(-1), {}),
               BalanceOverflowError);
  EXPECT_THROW(advisor.recommend(c(5000), c(2500), {std::numeric_limits<Cents>::min()}),
               BalanceOverflowError);
}

TEST(SurplusTransferAdvisorTest, NeverNegative) {
  SurplusTransferAdvisor advisor;
  const std::vector<Cents> balances = {c(-10000), c(0), c(2500), c(100000)};
  for (Cents month_end : balances) {
    for (Cents target : balances) {
      for (Cents low : balances) {
        EXPECT_GE(advisor.recommend(month_end, target, {low, c(50000)}), 0);
      }
    }
  }
}

// Simulation orchestrator tests
class SimulationOrchestratorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    observability::Logger::getInstance().setOutputStream(log_sink_);
  }

  void TearDown() override {
    observability::Logger::getInstance().setOutputStream(std::cerr);
  }

  std::ostringstream log_sink_;
  SimulationOrchestrator orchestrator_;
};

TEST_F(SimulationOrchestratorTest, InjectsSurplusTransferAtMonthEnd) {
  const std::vector<Transaction> txs = {
      Transaction(d("2024-01-30"), c(4000), "Big Project", "Revenue", true),
      Transaction(d("2024-02-02"), c(-3000), "Rent", "Fixed", true),
  };

  SimulationResult result = orchestrator_.simulate(3000.00, 2500.00, txs, d("2024-01-01"), 60);
  ASSERT_EQ(result.days.size(), 60u);

  ASSERT_EQ(result.transfers.size(), 1u);
  EXPECT_EQ(result.transfers[0].date, d("2024-02-01"));
  EXPECT_EQ(result.transfers[0].amount, c(-1500));
  EXPECT_EQ(result.transfers[0].description, kSurplusTransferMarker);
  EXPECT_TRUE(result.transfers[0].isVirtualTransfer());

  const DayRecord& jan31 = dayOn(result.days, d("2024-01-31"));
  EXPECT_EQ(jan31.end_balance, c(7000));

  const DayRecord& feb1 = dayOn(result.days, d("2024-02-01"));
  EXPECT_EQ(feb1.net_change, c(-1500));
  EXPECT_EQ(feb1.end_balance, c(5500));
  EXPECT_EQ(feb1.transactions_summary, "Surplus Transfer: -1500.00");

  const DayRecord& feb2 = dayOn(result.days, d("2024-02-02"));
  EXPECT_EQ(feb2.end_balance, c(2500));
  EXPECT_EQ(feb2.alert_type, AlertType::OK);

  expectContinuous(result.days);
}

TEST_F(SimulationOrchestratorTest, DoesNotModifyCallerTransactions) {
  const std::vector<Transaction> txs = {
      Transaction(d("2024-01-15"), c(1000), "Bonus", "Revenue", true),
  };
  orchestrator_.simulate(3000.00, 2500.00, txs, d("2024-01-01"), 45);
  ASSERT_EQ(txs.size(), 1u);
  EXPECT_EQ(txs[0].description, "Bonus");
}

TEST_F(SimulationOrchestratorTest, HandlesSuccessiveMonthEnds) {
  const std::vector<Transaction> txs = {
      Transaction(d("2024-02-15"), c(1000), "Invoice", "Revenue", true),
  };

  // 2024-01-01 .. 2024-03-02
  SimulationResult result = orchestrator_.simulate(3000.00, 2500.00, txs, d("2024-01-01"), 62);
  ASSERT_EQ(result.days.size(), 62u);
  ASSERT_EQ(result.transfers.size(), 2u);

  EXPECT_EQ(result.transfers[0].date, d("2024-02-01"));
  EXPECT_EQ(result.transfers[0].amount, c(-500));
  EXPECT_EQ(result.transfers[1].date, d("2024-03-01"));
  EXPECT_EQ(result.transfers[1].amount, c(-1000));

  // The February month end already reflects the first sweep.
  EXPECT_EQ(dayOn(result.days, d("2024-02-29")).end_balance, c(3500));
  EXPECT_EQ(dayOn(result.days, d("2024-03-01")).end_balance, c(2500));
  expectContinuous(result.days);
}

TEST_F(SimulationOrchestratorTest, NoTransferWithoutSurplus) {
  SimulationResult result = orchestrator_.simulate(1000.00, 2500.00, {}, d("2024-01-01"), 40);
  EXPECT_TRUE(result.transfers.empty());
  for (const DayRecord& day : result.days) {
    EXPECT_EQ(day.end_balance, c(1000));
    EXPECT_EQ(day.alert_type, AlertType::BELOW_TARGET);
  }
}

TEST_F(SimulationOrchestratorTest, LookAheadShortfallCancelsTransfer) {
  const std::vector<Transaction> txs = {
      Transaction(d("2024-02-10"), c(-2000), "Tax Bill", "Fixed", true),
  };
  SimulationResult result = orchestrator_.simulate(3000.00, 2500.00, txs, d("2024-01-01"), 45);
  EXPECT_TRUE(result.transfers.empty());
  EXPECT_EQ(dayOn(result.days, d("2024-02-10")).end_balance, c(1000));
}

TEST_F(SimulationOrchestratorTest, MonthEndOutsideWindowIsNotEvaluated) {
  SimulationResult result = orchestrator_.simulate(9000.00, 2500.00, {}, d("2024-01-01"), 30);
  EXPECT_TRUE(result.transfers.empty());
  EXPECT_EQ(result.days.back().date, d("2024-01-30"));
}

TEST_F(SimulationOrchestratorTest, LastWindowDayMonthEndReportsTransferOnly) {
  SimulationResult result = orchestrator_.simulate(9000.00, 2500.00, {}, d("2024-01-01"), 31);
  ASSERT_EQ(result.days.size(), 31u);
  ASSERT_EQ(result.transfers.size(), 1u);
  EXPECT_EQ(result.transfers[0].date, d("2024-02-01"));
  EXPECT_EQ(result.transfers[0].amount, c(-6500));
  EXPECT_EQ(result.days.back().end_balance, c(9000));
}

TEST_F(SimulationOrchestratorTest, RejectsInvalidInputBeforeSimulating) {
  EXPECT_THROW(orchestrator_.simulate(1000.00, 500.00, {}, d("2024-01-01"), 0),
               InvalidWindowError);
  EXPECT_THROW(orchestrator_.simulate(std::numeric_limits<double>::quiet_NaN(), 500.00, {},
                                      d("2024-01-01"), 10),
               InvalidBalanceError);
  EXPECT_THROW(orchestrator_.simulate(1000.00, -std::numeric_limits<double>::infinity(), {},
                                      d("2024-01-01"), 10),
               SimulationError);
}

namespace {

// Records every decision context it is asked about.
class RecordingAdvisor : public TransferAdvisor {
 public:
  struct Call {
    Cents month_end_balance;
    Cents target_balance;
    std::vector<Cents> future_balances;
  };

  RecordingAdvisor(std::shared_ptr<std::vector<Call>> calls, Cents answer)
      : calls_(std::move(calls)), answer_(answer) {}

  Cents recommend(Cents month_end_balance, Cents target_balance,
                  const std::vector<Cents>& future_balances) const override {
    calls_->push_back(Call{month_end_balance, target_balance, future_balances});
    return answer_;
  }

 private:
  std::shared_ptr<std::vector<Call>> calls_;
  Cents answer_;
};

}  // namespace

TEST(SimulationOrchestratorAdvisorTest, LookAheadStartsFromTargetForThirtyDays) {
  auto calls = std::make_shared<std::vector<RecordingAdvisor::Call>>();
  SimulationOrchestrator orchestrator(std::make_unique<RecordingAdvisor>(calls, c(100)));

  const std::vector<Transaction> txs = {
      Transaction(d("2024-02-03"), c(-700), "Car Repair"),
      Transaction(d("2024-03-15"), c(-50), "Beyond look-ahead"),
  };
  SimulationResult result = orchestrator.simulate(4000.00, 2500.00, txs, d("2024-01-20"), 20);

  ASSERT_EQ(calls->size(), 1u);
  const auto& call = calls->front();
  EXPECT_EQ(call.month_end_balance, c(4000));
  EXPECT_EQ(call.target_balance, c(2500));
  ASSERT_EQ(call.future_balances.size(), 30u);
  EXPECT_EQ(call.future_balances[0], c(2500));   // 2024-02-01
  EXPECT_EQ(call.future_balances[1], c(2500));   // 2024-02-02
  EXPECT_EQ(call.future_balances[2], c(1800));   // 2024-02-03
  EXPECT_EQ(call.future_balances[29], c(1800));  // 2024-03-01

  ASSERT_EQ(result.transfers.size(), 1u);
  EXPECT_EQ(result.transfers[0].amount, c(-100));
  EXPECT_EQ(dayOn(result.days, d("2024-02-01")).end_balance, c(3900));
}

TEST(SimulationOrchestratorAdvisorTest, RequiresAnAdvisor) {
  EXPECT_THROW({ SimulationOrchestrator orchestrator{std::unique_ptr<TransferAdvisor>()}; },
               std::invalid_argument);
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
