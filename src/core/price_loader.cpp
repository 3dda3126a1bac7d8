/// @file src/core/price_loader.cpp
/// @brief Long-format CSV loader.

#include "rebal/price_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace rebal::core {

namespace {

/// Column positions resolved from the header line.
struct ColumnMap {
    std::size_t                date   = 0;
    std::size_t                asset  = 0;
    std::size_t                price  = 0;
    std::optional<std::size_t> volume;
    std::size_t                width  = 0;
};

[[nodiscard]] std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(" \t\r\n\"");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n\"");
    return s.substr(first, last - first + 1);
}

[[nodiscard]] std::vector<std::string_view> split(std::string_view line) {
    std::vector<std::string_view> out;
    std::size_t start = 0;
    while (true) {
        const auto comma = line.find(',', start);
        if (comma == std::string_view::npos) {
            out.push_back(trim(line.substr(start)));
            break;
        }
        out.push_back(trim(line.substr(start, comma - start)));
        start = comma + 1;
    }
    return out;
}

[[nodiscard]] std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

[[nodiscard]] std::optional<ColumnMap> parse_header(std::string_view line) {
    const auto fields = split(line);
    std::optional<std::size_t> date, asset, price, volume;
    for (std::size_t i = 0; i < fields.size(); ++i) {
        const auto name = lower(fields[i]);
        if (name == "date") {
            date = i;
        } else if (name == "asset" || name == "ticker" || name == "symbol") {
            asset = i;
        } else if (name == "price" || name == "close") {
            price = i;
        } else if (name == "volume") {
            volume = i;
        }
    }
    if (!date || !asset || !price) return std::nullopt;
    return ColumnMap{.date = *date, .asset = *asset, .price = *price,
                     .volume = volume, .width = fields.size()};
}

[[nodiscard]] std::optional<double> parse_number(std::string_view token) {
    if (token.empty()) return std::nullopt;
    const std::string s(token);
    try {
        std::size_t pos = 0;
        const double v = std::stod(s, &pos);
        if (pos != s.size() || !std::isfinite(v)) return std::nullopt;
        return v;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

[[nodiscard]] std::optional<AssetObservation>
parse_row(std::string_view line, const ColumnMap& cols) {
    const auto fields = split(line);
    if (fields.size() < cols.width) {
        // A trailing empty volume column may be dropped entirely.
        const bool only_volume_missing =
            cols.volume && *cols.volume == cols.width - 1 && fields.size() == cols.width - 1;
        if (!only_volume_missing) return std::nullopt;
    }

    const auto date = parse_date(fields[cols.date]);
    if (!date) return std::nullopt;

    const auto asset = fields[cols.asset];
    if (asset.empty()) return std::nullopt;

    const auto price = parse_number(fields[cols.price]);
    if (!price || *price <= 0.0) return std::nullopt;

    std::optional<double> volume;
    if (cols.volume && *cols.volume < fields.size() && !fields[*cols.volume].empty()) {
        volume = parse_number(fields[*cols.volume]);
        if (!volume || *volume < 0.0) return std::nullopt;
    }

    return AssetObservation{.asset_id = AssetId(asset), .date = *date,
                            .price = *price, .volume = volume};
}

}  // namespace

// ─── PriceLoader::parse_csv_string ────────────────────────────────────────────

std::optional<LoadResult>
PriceLoader::parse_csv_string(const std::string& csv_content) noexcept {
    LoadResult result;
    std::optional<ColumnMap> cols;
    std::istringstream stream(csv_content);
    std::string line;

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (trim(line).empty() || line[0] == '#') {
            continue;
        }

        if (!cols) {
            // First non-empty, non-comment line is the header.
            cols = parse_header(line);
            if (!cols) return std::nullopt;
            continue;
        }

        const auto obs = parse_row(line, *cols);
        if (obs && result.table.add(*obs)) {
            ++result.rows_accepted;
        } else {
            ++result.rows_skipped;
        }
    }

    if (!cols) return std::nullopt;

    result.table.finalize();
    return result;
}

// ─── PriceLoader::load_csv ────────────────────────────────────────────────────

std::optional<LoadResult>
PriceLoader::load_csv(const std::string& filepath) noexcept {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_csv_string(contents.str());
}

}  // namespace rebal::core
