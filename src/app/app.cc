#include "app/app.h"

#include <algorithm>
#include <chrono>

#include "core/log.h"
#include "sim/factory_report.h"
#include "sim/placement.h"

namespace {

constexpr std::uint64_t kDemoStartingMoney = 150;
constexpr std::int32_t kIronLineRow = 2;
constexpr std::int32_t kCopperLineRow = 6;
constexpr std::int32_t kLineStartX = 2;

tinyfactory::sim::FactoryConfig makeDemoConfig() {
    tinyfactory::sim::FactoryConfig config{};
    config.startingMoney = kDemoStartingMoney;
    return config;
}

} // namespace

namespace tinyfactory::app {

App::App(const AppOptions& options)
    : m_options(options),
      m_state(makeDemoConfig()) {}

bool App::init() {
    using Clock = std::chrono::steady_clock;
    const auto initStart = Clock::now();

    TF_LOGI("app") << "init begin (ticks=" << m_options.ticks
                   << ", reportInterval=" << m_options.reportIntervalTicks << ")";

    if (!buildProductionLine(kIronLineRow, false)) {
        TF_LOGE("app") << "failed to build iron line: " << m_state.messages().latest();
        return false;
    }
    if (!buildProductionLine(kCopperLineRow, true)) {
        TF_LOGE("app") << "failed to build copper line: " << m_state.messages().latest();
        return false;
    }

    const auto initMs = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - initStart).count();
    TF_LOGI("app") << "init complete in " << initMs << " ms, " << sim::summarizeFactory(m_state);
    return true;
}

// Miner -> 3 belts -> Smelter -> 2 belts -> Exporter, left to right along `row`.
bool App::buildProductionLine(std::int32_t row, bool copper) {
    const core::Cell2i minerAnchor{kLineStartX, row};
    const core::Cell2i smelterAnchor{kLineStartX + 5, row};
    const core::Cell2i exporterAnchor{kLineStartX + 9, row};

    m_state.setTool(sim::PlacementTool::Miner);
    m_state.setCursor(minerAnchor);
    if (!sim::place(m_state)) {
        return false;
    }
    if (copper && !sim::toggleMinerMode(m_state)) {
        return false;
    }

    if (!placeBeltRun(minerAnchor + core::Cell2i{2, 0}, 3)) {
        return false;
    }

    m_state.setTool(sim::PlacementTool::Smelter);
    m_state.setCursor(smelterAnchor);
    if (!sim::place(m_state)) {
        return false;
    }

    if (!placeBeltRun(smelterAnchor + core::Cell2i{2, 0}, 2)) {
        return false;
    }

    m_state.setTool(sim::PlacementTool::Exporter);
    m_state.setCursor(exporterAnchor);
    return sim::place(m_state);
}

bool App::placeBeltRun(const core::Cell2i& start, std::int32_t length) {
    m_state.setTool(sim::PlacementTool::Belt);
    m_state.setBeltDirection(core::Direction::Right);
    m_state.setCursor(start);
    for (std::int32_t i = 0; i < length; ++i) {
        if (!sim::place(m_state)) {
            return false;
        }
    }
    return true;
}

void App::run() {
    TF_LOGI("app") << "run begin";
    const std::uint32_t interval = std::max<std::uint32_t>(m_options.reportIntervalTicks, 1u);

    std::uint32_t remaining = m_options.ticks;
    while (remaining > 0) {
        const std::uint32_t step = std::min(remaining, interval);
        m_state.tick(step);
        remaining -= step;
        TF_LOGI("app") << sim::summarizeFactory(m_state);
    }

    logKindStats();
    TF_LOGI("app") << "run exit after " << m_state.totalTicks() << " tick(s)";
}

void App::logKindStats() const {
    const sim::FactoryKindStats stats = sim::collectKindStats(m_state.grid());
    for (const sim::MachineKind kind : sim::kAllMachineKinds) {
        const sim::KindStats& entry = stats[sim::machineIndex(kind)];
        if (entry.count == 0) {
            continue;
        }
        TF_LOGI("app") << sim::machineName(kind)
                       << ": count=" << entry.count
                       << " produced=" << entry.totalProduced
                       << " revenue=$" << entry.totalRevenue
                       << " utilization=" << static_cast<int>(entry.averageUtilization * 100.0) << "%"
                       << " working=" << entry.working
                       << " idle=" << entry.idle
                       << " blocked=" << entry.blocked;
    }

    for (const core::Cell2i& anchor : m_state.grid().machineAnchors()) {
        if (sim::isOutputBlocked(m_state.grid(), anchor)) {
            TF_LOGW("app") << "machine at (" << anchor.x << "," << anchor.y << ") has no output belt";
        }
    }
}

void App::shutdown() {
    TF_LOGI("app") << "shutdown: " << m_state.messages().size() << " message(s) in session log, last='"
                   << m_state.messages().latest() << "'";
}

const sim::FactoryState& App::state() const {
    return m_state;
}

} // namespace tinyfactory::app
