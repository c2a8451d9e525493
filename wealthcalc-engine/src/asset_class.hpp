#ifndef WEALTHCALC_ASSET_CLASS_HPP
#define WEALTHCALC_ASSET_CLASS_HPP

#include <istream>
#include <string>
#include <vector>

namespace wealthcalc {

// Tolerance applied to the allocation sum check
constexpr double ALLOCATION_TOLERANCE = 0.001;

// One asset class of the portfolio. All values are decimals (0.08 = 8%).
struct AssetClass {
    std::string name;
    double median_return;   // Mean of the annual return distribution
    double std_deviation;   // Standard deviation of the annual return
    double min_return;      // Floor applied to each draw
    double max_return;      // Ceiling applied to each draw
    double allocation;      // Share of the portfolio (weights sum to 1.0)

    AssetClass();
    AssetClass(std::string name_, double median, double std_dev,
               double min, double max, double alloc);

    bool operator==(const AssetClass& other) const;
};

// Sum of allocations across asset classes
double total_allocation(const std::vector<AssetClass>& assets);

// True when the allocations sum to 1.0 within ALLOCATION_TOLERANCE
bool allocation_is_balanced(const std::vector<AssetClass>& assets);

class AssetClassSet {
public:
    void add(const AssetClass& asset);
    void add(AssetClass&& asset);

    const AssetClass& get(size_t index) const;
    size_t size() const;
    bool empty() const;

    const std::vector<AssetClass>& assets() const { return assets_; }
    std::vector<AssetClass>& assets() { return assets_; }

    double total_allocation() const;

    // CSV columns: name,median_return,std_deviation,min_return,max_return,allocation
    // The first row is a header and is skipped.
    static AssetClassSet load_from_csv(const std::string& filepath);
    static AssetClassSet load_from_csv(std::istream& is);

private:
    std::vector<AssetClass> assets_;
};

} // namespace wealthcalc

#endif // WEALTHCALC_ASSET_CLASS_HPP
