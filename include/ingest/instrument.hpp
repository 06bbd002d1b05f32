#pragma once

/**
 * InstrumentTable - canonical symbols and contract multipliers
 *
 * Raw statement tickers come in several spellings for the same contract:
 *   "CME_MINI:NQ1!"  (exchange-qualified continuous contract)
 *   "NQZ5"           (dated contract)
 *   "NQ"             (root)
 * All of them collapse to the root "NQ", whose per-point value is $20.
 *
 * Resolution order:
 *   1. text containing a qualified alias -> that instrument (longest alias wins)
 *   2. text starting with a root         -> that root (longest root wins, so
 *                                           "MNQZ5" is MNQ, not NQ)
 *   3. anything else passes through trimmed, case preserved
 *
 * Instruments are data; extra ones come from the broker config file.
 */

#include "../config/defaults.hpp"
#include "../util/string_utils.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace journal::ingest {

struct InstrumentSpec {
    std::string symbol;               // canonical root, e.g. "NQ"
    double multiplier = 1.0;          // dollars per point
    std::vector<std::string> aliases; // qualified identifiers, e.g. "CME_MINI:NQ"
    bool match_prefix = true;         // dated contracts like "NQZ5" collapse to the root
};

class InstrumentTable {
public:
    InstrumentTable() = default;

    static InstrumentTable builtin() {
        InstrumentTable table;
        table.add({"NQ", config::instruments::NQ_MULTIPLIER, {"CME_MINI:NQ"}, true});
        table.add({"MNQ", config::instruments::MNQ_MULTIPLIER, {"CME_MINI:MNQ"}, true});
        return table;
    }

    /**
     * Add or replace (by symbol, case-insensitive) an instrument
     */
    void add(InstrumentSpec spec) {
        std::string key = util::to_upper(spec.symbol);
        for (auto& existing : specs_) {
            if (util::to_upper(existing.symbol) == key) {
                existing = std::move(spec);
                return;
            }
        }
        specs_.push_back(std::move(spec));
    }

    std::string normalize(std::string_view raw) const {
        std::string trimmed = util::trim(raw);
        if (trimmed.empty())
            return trimmed;
        std::string upper = util::to_upper(trimmed);

        const InstrumentSpec* best = nullptr;
        size_t best_len = 0;
        for (const auto& spec : specs_) {
            for (const auto& alias : spec.aliases) {
                std::string alias_upper = util::to_upper(alias);
                if (!alias_upper.empty() && util::contains(upper, alias_upper) && alias_upper.size() > best_len) {
                    best = &spec;
                    best_len = alias_upper.size();
                }
            }
        }
        if (best)
            return best->symbol;

        for (const auto& spec : specs_) {
            if (!spec.match_prefix)
                continue;
            std::string root = util::to_upper(spec.symbol);
            if (!root.empty() && util::starts_with(upper, root) && root.size() > best_len) {
                best = &spec;
                best_len = root.size();
            }
        }
        if (best)
            return best->symbol;

        return trimmed;
    }

    /**
     * Dollars per point for a ticker (raw or canonical); 1 when unknown
     */
    double multiplier(std::string_view ticker) const {
        if (const auto* spec = find(normalize(ticker)))
            return spec->multiplier;
        return config::instruments::DEFAULT_MULTIPLIER;
    }

    const InstrumentSpec* find(std::string_view symbol) const {
        std::string key = util::to_upper(symbol);
        for (const auto& spec : specs_) {
            if (util::to_upper(spec.symbol) == key)
                return &spec;
        }
        return nullptr;
    }

    const std::vector<InstrumentSpec>& specs() const { return specs_; }
    size_t size() const { return specs_.size(); }

private:
    std::vector<InstrumentSpec> specs_;
};

} // namespace journal::ingest
