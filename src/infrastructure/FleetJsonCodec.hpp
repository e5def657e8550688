/**
 * @file FleetJsonCodec.hpp
 * @brief Mapping between a FleetSnapshot and its JSON document.
 */

#pragma once

#include <nlohmann/json.hpp>
#include "domain/FleetSnapshot.hpp"

namespace fleetkeeper::infrastructure {

/**
 * @class FleetJsonCodec
 * @brief Encodes/decodes the persisted fleet document.
 *
 * Document layout (version 1):
 * @code
 * { "version": 1, "saved_at": "...",
 *   "boats": [ { "id", "name", "home_port", "flag", "launch_date"?, "class",
 *                "cargo_capacity"? | "weapon_count"?, "government_authorised"?,
 *                "positions": [ {"latitude","longitude","timestamp"} ],
 *                "arrival_logs": [ {"port","timestamp","note"} ] } ],
 *   "fleet_log": [ {"timestamp","message"} ] }
 * @endcode
 * Unknown keys are ignored. Decoding never coerces: a present value of the
 * wrong type is rejected.
 */
class FleetJsonCodec {
public:
    static constexpr int kCurrentVersion = 1;

    /** @brief Builds the document. saved_at is written only if the snapshot carries one. */
    static nlohmann::json encode(const domain::FleetSnapshot& snapshot);

    /**
     * @brief Validates and converts a document.
     * @throws domain::SchemaError on any structural mismatch, duplicate id,
     * out-of-range value or unparseable timestamp.
     */
    static domain::FleetSnapshot decode(const nlohmann::json& document);

private:
    static domain::FleetSnapshot decodeVersion1(const nlohmann::json& document);
};

} // namespace fleetkeeper::infrastructure
