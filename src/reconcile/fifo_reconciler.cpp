#include "../../include/reconcile/fifo_reconciler.hpp"
#include "../../include/config/defaults.hpp"
#include "../../include/ingest/record_mapper.hpp"

#include <algorithm>
#include <numeric>

namespace journal::reconcile {

namespace {

Quantity total_qty(const std::deque<Lot>& lots) {
    return std::accumulate(lots.begin(), lots.end(), Quantity{0},
                           [](Quantity sum, const Lot& lot) { return sum + lot.qty; });
}

} // namespace

Quantity LotBook::long_qty() const {
    return total_qty(longs);
}

Quantity LotBook::short_qty() const {
    return total_qty(shorts);
}

FifoReconciler::CloseResult FifoReconciler::close_lots(std::deque<Lot>& queue, Quantity qty, double price,
                                                       bool closing_long) {
    CloseResult result;
    result.remaining = qty;

    while (result.remaining > 0 && !queue.empty()) {
        Lot& lot = queue.front();
        Quantity matched = std::min(lot.qty, result.remaining);
        double delta = closing_long ? price - lot.price : lot.price - price;
        result.realized += delta * matched * lot.multiplier - lot.fee_per_unit * matched;

        lot.qty -= matched;
        result.remaining -= matched;
        if (lot.qty <= config::reconcile::LOT_EPSILON)
            queue.pop_front();
    }
    return result;
}

ReconcileResult FifoReconciler::reconcile(std::vector<MappedRow>& rows) const {
    ReconcileResult result;

    std::vector<MappedRow*> ordered;
    ordered.reserve(rows.size());
    for (auto& row : rows)
        ordered.push_back(&row);
    std::stable_sort(ordered.begin(), ordered.end(), [](const MappedRow* a, const MappedRow* b) {
        return a->trade.sort_key() < b->trade.sort_key();
    });

    for (MappedRow* row : ordered) {
        PartialTrade& trade = row->trade;
        const RowMeta& meta = row->meta;

        if (trade.pnl) {
            ++result.rows_skipped;
            continue;
        }
        ++result.rows_reconciled;

        if (trade.ticker.empty() || !meta.qty || *meta.qty == 0 || !meta.fill_price) {
            trade.pnl = 0.0;
            ++result.rows_insufficient;
            continue;
        }

        Quantity qty = *meta.qty;
        double price = *meta.fill_price;
        double fee_per_unit = meta.total_fee / qty;
        TradeSide side = ingest::side_of(ingest::normalize_side(meta.side));

        CloseResult closed;
        Quantity closed_qty = 0;
        if (side == TradeSide::Long || side == TradeSide::Short) {
            LotBook& book = result.open_lots[trade.ticker];
            bool buying = side == TradeSide::Long;
            std::deque<Lot>& opposite = buying ? book.shorts : book.longs;
            std::deque<Lot>& own = buying ? book.longs : book.shorts;

            closed = close_lots(opposite, qty, price, !buying);
            closed_qty = qty - closed.remaining;
            if (closed.remaining > config::reconcile::LOT_EPSILON)
                own.push_back({closed.remaining, price, fee_per_unit, meta.multiplier});
        }

        if (closed_qty > 0) {
            trade.pnl = closed.realized - meta.total_fee * (closed_qty / qty);
            ++result.rows_closed;
        } else {
            trade.pnl = 0.0;
        }
    }

    for (auto it = result.open_lots.begin(); it != result.open_lots.end();) {
        if (it->second.empty())
            it = result.open_lots.erase(it);
        else
            ++it;
    }
    return result;
}

} // namespace journal::reconcile
