#ifndef WEALTHCALC_IO_JSON_CODEC_HPP
#define WEALTHCALC_IO_JSON_CODEC_HPP

#include "../asset_class.hpp"
#include "../simulation_request.hpp"
#include "../statistics.hpp"
#include "../tax.hpp"
#include <nlohmann/json.hpp>

namespace wealthcalc {

// nlohmann::json conversions for the domain types (found by ADL).
//
// from_json for AssetClass requires every field. TaxSettings and
// SimulationRequest fall back to their defaults for missing fields; see
// io/request_reader.hpp for the request defaults.
// Full precision is kept; rounding happens only in io/json_writer.

void to_json(nlohmann::json& j, const AssetClass& asset);
void from_json(const nlohmann::json& j, AssetClass& asset);

void to_json(nlohmann::json& j, const TaxSettings& tax);
void from_json(const nlohmann::json& j, TaxSettings& tax);

void to_json(nlohmann::json& j, const SimulationRequest& request);

void to_json(nlohmann::json& j, const PercentileStat& stat);
void from_json(const nlohmann::json& j, PercentileStat& stat);

void to_json(nlohmann::json& j, const SimulationStatistics& stats);
void from_json(const nlohmann::json& j, SimulationStatistics& stats);

} // namespace wealthcalc

#endif // WEALTHCALC_IO_JSON_CODEC_HPP
