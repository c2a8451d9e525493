#include "asset_class.hpp"
#include "io/csv_reader.hpp"
#include <cmath>
#include <fstream>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace wealthcalc {

AssetClass::AssetClass()
    : median_return(0.0), std_deviation(0.0),
      min_return(0.0), max_return(0.0), allocation(0.0) {}

AssetClass::AssetClass(std::string name_, double median, double std_dev,
                       double min, double max, double alloc)
    : name(std::move(name_)), median_return(median), std_deviation(std_dev),
      min_return(min), max_return(max), allocation(alloc) {}

bool AssetClass::operator==(const AssetClass& other) const {
    return name == other.name &&
           median_return == other.median_return &&
           std_deviation == other.std_deviation &&
           min_return == other.min_return &&
           max_return == other.max_return &&
           allocation == other.allocation;
}

double total_allocation(const std::vector<AssetClass>& assets) {
    return std::accumulate(assets.begin(), assets.end(), 0.0,
                           [](double sum, const AssetClass& a) { return sum + a.allocation; });
}

bool allocation_is_balanced(const std::vector<AssetClass>& assets) {
    return std::fabs(total_allocation(assets) - 1.0) <= ALLOCATION_TOLERANCE;
}

// ============================================================================
// AssetClassSet Implementation
// ============================================================================

void AssetClassSet::add(const AssetClass& asset) {
    assets_.push_back(asset);
}

void AssetClassSet::add(AssetClass&& asset) {
    assets_.push_back(std::move(asset));
}

const AssetClass& AssetClassSet::get(size_t index) const {
    if (index >= assets_.size()) {
        throw std::out_of_range("Asset class index out of range");
    }
    return assets_[index];
}

size_t AssetClassSet::size() const {
    return assets_.size();
}

bool AssetClassSet::empty() const {
    return assets_.empty();
}

double AssetClassSet::total_allocation() const {
    return wealthcalc::total_allocation(assets_);
}

AssetClassSet AssetClassSet::load_from_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filepath);
    }
    return load_from_csv(file);
}

AssetClassSet AssetClassSet::load_from_csv(std::istream& is) {
    AssetClassSet set;
    CsvReader reader(is);

    auto header = reader.read_row();
    if (header.empty()) {
        return set;
    }

    size_t line = 1;
    while (reader.has_more()) {
        auto row = reader.read_row();
        ++line;
        if (row.empty() || (row.size() == 1 && row[0].empty())) {
            continue;
        }
        if (row.size() < 6) {
            throw std::runtime_error("Asset class CSV line " + std::to_string(line) +
                                     ": expected 6 columns, got " + std::to_string(row.size()));
        }

        try {
            set.add(AssetClass(row[0],
                               std::stod(row[1]),
                               std::stod(row[2]),
                               std::stod(row[3]),
                               std::stod(row[4]),
                               std::stod(row[5])));
        } catch (const std::logic_error& e) {
            // std::stod reports bad input as invalid_argument / out_of_range
            throw std::runtime_error("Asset class CSV line " + std::to_string(line) +
                                     ": invalid number (" + e.what() + ")");
        }
    }

    return set;
}

} // namespace wealthcalc
