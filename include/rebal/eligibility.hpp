#pragma once

/// @file include/rebal/eligibility.hpp
/// @brief Point-in-time eligibility decisions.
///
/// # Module: EligibilityEngine
///
/// ## Rule
/// An asset is eligible at `check_date` iff, using only observations dated
/// ≤ `check_date`:
///   - `check_date − first_seen ≥ min_history_days`, and
///   - `observation_count ≥ min_price_rows`,
/// and it is not delisted. Both thresholds are inclusive.
///
/// ## Delisting
/// With `last_seen` the latest observation ≤ `check_date`, the asset is
/// delisted when the table holds no observation of it in `(last_seen,
/// last_seen + lookforward_days]`, including when the data ends inside that
/// window. Shorter gaps are temporary absence. An asset that printed on the
/// final date of the table is never delisted.
///
/// **Limitation:** this test reads data after `check_date`. It is valid for
/// offline backtests only and must not drive a live eligibility decision.
///
/// ## Guarantees
/// - Unknown assets yield `UnknownAsset`, never an exception
/// - Except for the delisting lookforward, appending data after
///   `check_date` never changes a decision at `check_date`

#include "rebal/constants.hpp"
#include "rebal/history.hpp"
#include "rebal/types.hpp"

#include <cstddef>
#include <string_view>
#include <vector>

namespace rebal::eligibility {

enum class EligibilityReason {
    Eligible,
    UnknownAsset,
    NoObservations,
    InsufficientHistory,
    InsufficientRows,
    Delisted,
};

[[nodiscard]] std::string_view to_string(EligibilityReason reason) noexcept;

struct EligibilityConfig {
    int min_history_days = constants::DEFAULT_MIN_HISTORY_DAYS;
    int min_price_rows   = constants::DEFAULT_MIN_PRICE_ROWS;
    int lookforward_days = constants::DEFAULT_LOOKFORWARD_DAYS;

    /// # Throws
    /// `ConfigurationError` if any field is negative or `lookforward_days < 1`.
    void validate() const;
};

struct EligibilityRecord {
    AssetId           asset_id;
    Date              check_date;
    bool              eligible;
    EligibilityReason reason;
};

class EligibilityEngine {
public:
    /// The tracker (and its table) must outlive the engine.
    EligibilityEngine(const HistoryTracker& history, EligibilityConfig config);

    /// Decision with explicit thresholds.
    [[nodiscard]] EligibilityRecord is_eligible(const AssetId& asset,
                                                Date           check_date,
                                                int            min_history_days,
                                                int            min_price_rows) const;

    /// Decision with the configured thresholds.
    [[nodiscard]] EligibilityRecord is_eligible(const AssetId& asset, Date check_date) const;

    /// Delisting test alone (see file comment).
    [[nodiscard]] bool is_delisted(const AssetId& asset, Date check_date) const;

    /// Records for every asset in the table, in asset order.
    [[nodiscard]] std::vector<EligibilityRecord>
    evaluate_all(Date check_date, std::size_t threads = 1) const;

    /// Sorted identifiers of the eligible assets.
    [[nodiscard]] std::vector<AssetId>
    eligible_assets(Date check_date, std::size_t threads = 1) const;

    [[nodiscard]] const EligibilityConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] bool delisted_after(std::size_t column, Date last_seen) const;

    const HistoryTracker& history_;
    EligibilityConfig     config_;
};

}  // namespace rebal::eligibility
