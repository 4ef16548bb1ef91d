// === Formation Geometry ======================================================
//
// Hexagonal slot geometry around a formation center and the strategies that
// decide which vehicle takes which slot.

#pragma once

#include <array>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "swarm_ops/types.hpp"
#include "swarm_ops/vehicle_state.hpp"

namespace swarm_ops {

/** @brief Number of slots in a hexagonal formation. */
inline constexpr std::size_t k_hexagon_slots{6};

using HexagonSlots = std::array<Vector3, k_hexagon_slots>;

/**
 * @brief Compute the six hexagon vertices around @p center.
 *
 * Slot i sits at bearing i * 60 degrees (measured from +x toward +y) at exactly
 * @p radius_m from the center, at the center's altitude.
 *
 * @throws std::invalid_argument when @p radius_m is not positive.
 */
[[nodiscard]] HexagonSlots hexagonal_formation(const Vector3& center, double radius_m);

/**
 * @brief Decides which formation slot each vehicle flies to.
 */
class SlotAssignment {
  public:
    virtual ~SlotAssignment() = default;

    /**
     * @brief Return, for each vehicle in @p vehicle_ids order, the slot index it takes.
     *
     * @param vehicle_ids Target vehicles; never more than the slot count.
     * @param slots Candidate slot positions.
     * @param observed Latest known vehicle state, possibly stale.
     */
    [[nodiscard]] virtual std::vector<std::size_t> assign(
        const std::vector<std::string>& vehicle_ids,
        const HexagonSlots& slots,
        const VehicleSnapshot& observed
    ) const = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

/** @brief Vehicle i takes slot i. */
class IndexSlotAssignment final : public SlotAssignment {
  public:
    [[nodiscard]] std::vector<std::size_t> assign(
        const std::vector<std::string>& vehicle_ids,
        const HexagonSlots& slots,
        const VehicleSnapshot& observed
    ) const override;

    [[nodiscard]] std::string_view name() const noexcept override;
};

/**
 * @brief Greedy nearest-free-slot assignment in vehicle list order.
 *
 * Vehicles without a known position take the lowest free slot.
 */
class NearestSlotAssignment final : public SlotAssignment {
  public:
    [[nodiscard]] std::vector<std::size_t> assign(
        const std::vector<std::string>& vehicle_ids,
        const HexagonSlots& slots,
        const VehicleSnapshot& observed
    ) const override;

    [[nodiscard]] std::string_view name() const noexcept override;
};

/** @throws std::invalid_argument for a name other than "index" or "nearest". */
[[nodiscard]] std::unique_ptr<SlotAssignment> make_slot_assignment(std::string_view strategy_name);

}  // namespace swarm_ops
