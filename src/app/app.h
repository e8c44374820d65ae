#pragma once

#include <cstdint>

#include "sim/factory_state.h"

// App subsystem
// Responsible for: driving a headless factory session through the public command and tick API.
// Should NOT do: implement simulation rules or map raw input devices.
namespace tinyfactory::app {

struct AppOptions {
    std::uint32_t ticks = 600;
    std::uint32_t reportIntervalTicks = 100;
};

class App {
public:
    explicit App(const AppOptions& options);

    bool init();
    void run();
    void shutdown();

    const sim::FactoryState& state() const;

private:
    bool buildProductionLine(std::int32_t row, bool copper);
    bool placeBeltRun(const core::Cell2i& start, std::int32_t length);
    void logKindStats() const;

    AppOptions m_options{};
    sim::FactoryState m_state;
};

} // namespace tinyfactory::app
