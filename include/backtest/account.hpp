#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "backtest/bar.hpp"

/**
 * @brief Remaining quantity at or below this fraction of the pre-sale quantity counts as flat.
 */
inline constexpr double kDustFraction = 1e-9;

enum class TradeSide
{
    BUY,
    SELL,
};

[[nodiscard]] std::string toString(TradeSide side);

/**
 * @brief One executed fill. Appended to the ledger and never modified.
 */
struct Trade {
    int64_t   timestamp = 0;
    TradeSide side      = TradeSide::BUY;

    double quantity       = 0.0;
    double price          = 0.0;
    double commissionPaid = 0.0;

    /**
     * @brief Cash moved by this fill, always >= 0.
     *
     * BUY: entry capital taken from cash. SELL: net proceeds credited to cash.
     */
    double cashAmount = 0.0;

    /**
     * @brief Protective stop attached to a BUY, 0 if none.
     */
    double stopPrice = 0.0;

    /**
     * @brief Signed change of cash caused by this fill.
     */
    [[nodiscard]] double cashFlow() const noexcept { return side == TradeSide::BUY ? -cashAmount : cashAmount; }
};

struct Position {
    double  quantity          = 0.0;
    double  averageEntryPrice = 0.0;
    int64_t entryTimestamp    = 0;
    double  stopPrice         = 0.0;  // 0 = no stop

    [[nodiscard]] bool flat() const noexcept { return quantity == 0.0; }
};

/**
 * @brief A position that went flat, kept for the chart overlay.
 */
struct ClosedPosition {
    int64_t entryTimestamp    = 0;
    int64_t closeTimestamp    = 0;
    double  averageEntryPrice = 0.0;
};

/**
 * @brief Simulated long-only brokerage account with paper money.
 *
 * All amounts are IEEE-754 doubles. Every fill moves cash by exactly the
 * Trade::cashAmount recorded in the ledger, so replaying the ledger reproduces
 * cash bit-for-bit.
 *
 * Not thread-safe; owned by a single StrategyRunner for the life of a run.
 */
class Account {
   public:
    /**
     * @param initialCapital Starting cash, must be >= 0.
     * @param commission     Commission rate in [0, 1), charged on both sides.
     * @param verbose        Log every fill to std::clog.
     * @throws InvalidOrder on out-of-range arguments.
     */
    explicit Account(double initialCapital, double commission = 0.0, bool verbose = false);

    /**
     * @brief Convert `entryCapital` of cash into units at `entryPrice`.
     *
     * quantity = entryCapital * (1 - commission) / entryPrice.
     *
     * @param stopPrice Optional protective stop below `entryPrice`; 0 for none.
     * @throws InvalidOrder      if entryCapital <= 0, entryPrice <= 0, the stop is invalid or the account is frozen.
     * @throws InsufficientFunds if entryCapital > cash.
     */
    void buy(double entryCapital, double entryPrice, double stopPrice = 0.0);

    /**
     * @brief Sell `percent` of the position at `currentPrice`.
     * @throws InvalidOrder if percent is outside (0, 1], currentPrice <= 0 or the account is frozen.
     * @throws NoPosition   if the account is flat.
     */
    void sell(double percent, double currentPrice);

    /**
     * @brief cash + quantity * currentPrice. No side effects.
     */
    [[nodiscard]] double markToMarket(double currentPrice) const noexcept;

    [[nodiscard]] double initialCapital() const noexcept { return initialCapital_; }
    [[nodiscard]] double commission() const noexcept { return commission_; }

    /**
     * @brief Cash available for buying. No leverage, so this equals cash.
     */
    [[nodiscard]] double buyingPower() const noexcept { return cash_; }
    [[nodiscard]] double cash() const noexcept { return cash_; }

    [[nodiscard]] const Position& position() const noexcept { return position_; }
    [[nodiscard]] bool            hasPosition() const noexcept { return !position_.flat(); }

    [[nodiscard]] const std::vector<Trade>&          ledger() const noexcept { return ledger_; }
    [[nodiscard]] const std::vector<ClosedPosition>& closedPositions() const noexcept { return closedPositions_; }

    [[nodiscard]] double totalCommission() const noexcept { return totalCommission_; }

    /**
     * @brief Sum of sold_quantity * (sell_price - average_entry_price), before commission.
     */
    [[nodiscard]] double realizedPnl() const noexcept { return realizedPnl_; }

    /**
     * @brief Timestamp stamped on the next fill (the bar being processed).
     */
    [[nodiscard]] int64_t now() const noexcept { return now_; }

    [[nodiscard]] bool frozen() const noexcept { return frozen_; }

    /**
     * @brief Fill price if `bar` touches the position's protective stop.
     *
     * The stop price, or the open when the bar gaps below the stop.
     */
    [[nodiscard]] std::optional<double> stopFillPrice(const Bar& bar) const noexcept;

   private:
    friend class StrategyRunner;

    void setClock(int64_t timestamp) noexcept { now_ = timestamp; }
    void freeze() noexcept { frozen_ = true; }

    void checkNotFrozen() const;
    void logFill(const Trade& trade) const;

    double initialCapital_;
    double commission_;
    bool   verbose_;

    double   cash_;
    Position position_;

    double  totalCommission_ = 0.0;
    double  realizedPnl_     = 0.0;
    int64_t now_             = 0;
    bool    frozen_          = false;

    std::vector<Trade>          ledger_;
    std::vector<ClosedPosition> closedPositions_;
};
