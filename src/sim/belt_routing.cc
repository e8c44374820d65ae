#include "sim/belt_routing.h"

#include <unordered_set>

#include "core/log.h"

namespace tinyfactory::sim {
namespace {

std::uint64_t cellKey(const core::Cell2i& cell) {
    return (static_cast<std::uint64_t>(static_cast<std::uint32_t>(cell.x)) << 32u) |
           static_cast<std::uint64_t>(static_cast<std::uint32_t>(cell.y));
}

std::optional<BeltIntent> intentForBelt(const FactoryGrid& grid, const core::Cell2i& cell, const Belt& belt) {
    const ItemKind item = *belt.item;
    const RouteCandidates candidates = routeCandidates(belt.source);
    for (std::size_t i = 0; i < candidates.count; ++i) {
        const core::Direction dir = candidates.directions[i];
        const core::Cell2i next = core::neighborCell(cell, dir);
        if (!grid.inBounds(next)) {
            continue;
        }

        if (const std::optional<core::Cell2i> anchor = grid.anchorOf(next)) {
            const Machine* machine = grid.machineAt(*anchor);
            if (machine != nullptr &&
                machineAcceptsItem(machine->kind, item) &&
                !machine->inputBuffer.full()) {
                return BeltIntent{BeltIntentKind::FeedMachine, cell, *anchor, dir};
            }
            continue;
        }

        const Belt* nextBelt = grid.beltAt(next);
        if (nextBelt != nullptr && !nextBelt->hasItem()) {
            return BeltIntent{BeltIntentKind::MoveToBelt, cell, next, dir};
        }
    }
    return std::nullopt;
}

} // namespace

RouteCandidates routeCandidates(std::optional<core::Direction> source) {
    RouteCandidates candidates{};
    if (!source) {
        for (const core::Direction dir : core::kAllDirections) {
            candidates.directions[candidates.count++] = dir;
        }
        return candidates;
    }

    candidates.directions[candidates.count++] = core::oppositeDirection(*source);
    // Perpendiculars keep the fixed Right, Down, Left, Up order.
    for (const core::Direction dir : core::kAllDirections) {
        if (core::isHorizontal(dir) != core::isHorizontal(*source)) {
            candidates.directions[candidates.count++] = dir;
        }
    }
    return candidates;
}

std::vector<BeltIntent> collectBeltIntents(const FactoryGrid& grid, std::uint32_t* stalled) {
    std::vector<BeltIntent> intents;
    std::uint32_t stalledCount = 0;
    for (std::int32_t y = 0; y < grid.height(); ++y) {
        for (std::int32_t x = 0; x < grid.width(); ++x) {
            const core::Cell2i cell{x, y};
            const Belt* belt = grid.beltAt(cell);
            if (belt == nullptr || !belt->hasItem()) {
                continue;
            }
            if (const std::optional<BeltIntent> intent = intentForBelt(grid, cell, *belt)) {
                intents.push_back(*intent);
            } else {
                ++stalledCount;
            }
        }
    }
    if (stalled != nullptr) {
        *stalled = stalledCount;
    }
    return intents;
}

BeltRoutingResult applyBeltIntents(FactoryGrid& grid, const std::vector<BeltIntent>& intents) {
    BeltRoutingResult result{};

    for (const BeltIntent& intent : intents) {
        if (intent.kind != BeltIntentKind::FeedMachine) {
            continue;
        }
        Belt* belt = grid.beltAt(intent.from);
        Machine* machine = grid.machineAt(intent.to);
        if (belt == nullptr || !belt->hasItem() || machine == nullptr) {
            continue;
        }
        // Several belts may have targeted the same machine from one snapshot.
        if (machine->inputBuffer.full() || !machineAcceptsItem(machine->kind, *belt->item)) {
            ++result.droppedConflicts;
            continue;
        }
        machine->inputBuffer.push(*belt->item);
        belt->item.reset();
        ++result.fedToMachines;
    }

    std::unordered_set<std::uint64_t> claimed;
    claimed.reserve(intents.size());
    for (const BeltIntent& intent : intents) {
        if (intent.kind != BeltIntentKind::MoveToBelt) {
            continue;
        }
        if (!claimed.insert(cellKey(intent.to)).second) {
            ++result.droppedConflicts;
            continue;
        }
        Belt* from = grid.beltAt(intent.from);
        Belt* to = grid.beltAt(intent.to);
        if (from == nullptr || to == nullptr || !from->hasItem() || to->hasItem()) {
            ++result.droppedConflicts;
            continue;
        }
        to->item = from->item;
        to->source = core::oppositeDirection(intent.direction);
        from->item.reset();
        ++result.movedOnBelts;
    }

    return result;
}

BeltRoutingResult routeBelts(FactoryGrid& grid) {
    std::uint32_t stalled = 0;
    const std::vector<BeltIntent> intents = collectBeltIntents(grid, &stalled);
    BeltRoutingResult result = applyBeltIntents(grid, intents);
    result.stalled = stalled;
    if (result.droppedConflicts > 0) {
        TF_LOGT("belts") << "dropped " << result.droppedConflicts << " conflicting belt intents";
    }
    return result;
}

} // namespace tinyfactory::sim
