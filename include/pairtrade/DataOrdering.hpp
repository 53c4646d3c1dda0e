#pragma once
#include <vector>
#include <string>
#include <optional>

namespace pairtrade {

    // Single instrument, timestamps as ISO strings ("YYYY-MM-DD" or
    // "YYYY-MM-DD HH:MM:SS"). Missing values are NaN.
    struct PriceSeries {
        std::vector<std::string> time;
        std::vector<double> value;

        size_t size() const { return time.size(); }
    };

    // Wide table: one shared time column, one value column per ticker.
    struct PricePanel {
        std::vector<std::string> time;
        std::vector<std::string> names;
        std::vector<std::vector<double>> columns;   // columns[j][i] <-> names[j], time[i]

        size_t size() const { return time.size(); }
        bool empty() const { return time.empty() || columns.empty(); }
        bool has_column(const std::string& name) const;
        PriceSeries column(const std::string& name) const;   // throws DataError if missing
    };

    // Both legs restricted to their common timestamps, ascending.
    struct AlignedPair {
        std::vector<std::string> time;
        std::vector<double> a;
        std::vector<double> b;

        size_t size() const { return time.size(); }
    };

    // ISO strings of the same format order lexicographically
    bool iso_less(const std::string& a, const std::string& b);

    // Parses "YYYY-MM-DD" (optionally followed by a time); false on failure.
    bool is_iso_date(const std::string& s);

    // Throws DataError if either date is malformed or end < start.
    void validate_dates(const std::string& start, const std::string& end);

    /**
     * Intersection of the two indices, sorted ascending. Non-finite values
     * are dropped from each leg before intersecting; on duplicate
     * timestamps the first occurrence wins. No minimum size is enforced.
     */
    AlignedPair align_pair(const PriceSeries& a, const PriceSeries& b);

    // Keeps rows with start <= time < end (either bound optional).
    PricePanel filter_by_date(const PricePanel& data,
                              const std::optional<std::string>& start,
                              const std::optional<std::string>& end);

    PricePanel select_columns(const PricePanel& data, const std::vector<std::string>& names);

    /**
     * Sorts by time, drops duplicate timestamps (first kept), forward-fills
     * runs of missing values up to `ffill_limit` rows, then back-fills up to
     * `bfill_limit` rows, and drops columns that remain entirely missing.
     */
    PricePanel clean_price_panel(const PricePanel& data,
                                 int ffill_limit = 5,
                                 int bfill_limit = 2);

} // namespace pairtrade
