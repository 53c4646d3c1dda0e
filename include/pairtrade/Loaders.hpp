#pragma once
#include <string>
#include <vector>
#include <functional>
#include "pairtrade/DataOrdering.hpp"

namespace pairtrade {

    /**
     * Loads a wide price CSV: one time column followed by one column per
     * ticker (e.g. "Date,KO,PEP"). Handles ','/';' delimiters, decimal
     * commas, and empty/NaN/NA cells (stored as NaN). Dates in d/m/y form
     * are converted to ISO.
     *
     * If time_col == "*" the time column is auto-detected: "Date", then
     * "Timestamp", then any header containing either, else the first column.
     */
    PricePanel load_price_panel_csv(const std::string& filepath,
                                    const std::string& time_col = "*");

    // Writes the panel in the same layout; throws DataError if the file
    // cannot be opened.
    void save_price_panel_csv(const PricePanel& panel, const std::string& filepath);

    // "<dir>/adjclose_<sorted tickers, '/' -> '-', joined by '_'>_<start>_<end>.csv"
    std::string cache_path(const std::string& dir,
                           const std::vector<std::string>& tickers,
                           const std::string& start,
                           const std::string& end);

    // Source of raw prices for (tickers, start, end).
    using PriceFetcher = std::function<PricePanel(const std::vector<std::string>&,
                                                  const std::string&,
                                                  const std::string&)>;

    // Local wide CSV used as a price source, restricted to [start, end).
    class CsvPriceSource {
    public:
        explicit CsvPriceSource(std::string filepath);

        PricePanel operator()(const std::vector<std::string>& tickers,
                              const std::string& start,
                              const std::string& end) const;

    private:
        std::string filepath_;
    };

    /**
     * On-disk memoisation of cleaned price panels keyed by tickers and date
     * range. A readable cache file short-circuits the fetcher; an unreadable
     * one is reported and re-fetched. Writes are best-effort.
     */
    class PriceCache {
    public:
        explicit PriceCache(std::string dir);

        const std::string& dir() const { return dir_; }

        // Columns come back in request order; tickers absent from the
        // source are dropped with a warning, all absent throws DataError.
        PricePanel get_price_data(const std::vector<std::string>& tickers,
                                  const std::string& start,
                                  const std::string& end,
                                  const PriceFetcher& fetch) const;

    private:
        std::string dir_;
    };

} // namespace pairtrade
