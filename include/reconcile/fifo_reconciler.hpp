#pragma once

/**
 * FifoReconciler - realized P&L from raw fills
 *
 * Fill-level statements (Tradovate, TradingView) carry no realized P&L.
 * It is rebuilt by replaying the fills in time order against per-ticker
 * FIFO queues of open lots:
 *
 *   buy  2 NQ @ 100, fee 2   -> opens long lot {2 @ 100, fee/unit 1}, P&L 0
 *   sell 2 NQ @ 105, fee 2   -> closes it: (105-100) * 2 * 20 - 1*2 - 2 = 196
 *
 * A fill first consumes lots on the opposite side, oldest first; whatever
 * is left opens a lot on its own side. The closing fill's own fee is charged
 * pro rata on the closed quantity, so the opening fee is charged once through
 * the lot and the closing fee once through the row.
 *
 * Rows that already carry P&L are skipped and never touch the queues.
 * Rows missing ticker, quantity or fill price get P&L 0.
 *
 * The lot book is local to one run and handed back in the result.
 */

#include "../types.hpp"

#include <cstddef>
#include <deque>
#include <map>
#include <string>
#include <vector>

namespace journal::reconcile {

struct Lot {
    Quantity qty = 0;
    double price = 0;
    double fee_per_unit = 0;
    double multiplier = 1;
};

struct LotBook {
    std::deque<Lot> longs;
    std::deque<Lot> shorts;

    bool empty() const { return longs.empty() && shorts.empty(); }
    Quantity long_qty() const;
    Quantity short_qty() const;
};

struct ReconcileResult {
    std::map<std::string, LotBook> open_lots; // by canonical ticker, empty books removed
    size_t rows_reconciled = 0;               // rows whose P&L was written
    size_t rows_closed = 0;                   // rows that closed at least one lot
    size_t rows_insufficient = 0;             // rows defaulted to 0 for missing data
    size_t rows_skipped = 0;                  // rows that already carried P&L

    const LotBook* book(const std::string& ticker) const {
        auto it = open_lots.find(ticker);
        return it == open_lots.end() ? nullptr : &it->second;
    }
};

class FifoReconciler {
public:
    /**
     * Fill P&L in place for every row that lacks it.
     * Row order in the vector is preserved; processing order is a stable
     * sort on the row timestamp, rows without one first.
     */
    ReconcileResult reconcile(std::vector<MappedRow>& rows) const;

private:
    struct CloseResult {
        Money realized = 0;
        Quantity remaining = 0;
    };

    // Consume lots oldest first. closing_long: the queue holds long lots.
    static CloseResult close_lots(std::deque<Lot>& queue, Quantity qty, double price, bool closing_long);
};

} // namespace journal::reconcile
