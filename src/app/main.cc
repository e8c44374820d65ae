#include "app/app.h"

#include <charconv>
#include <cstdint>
#include <string_view>
#include <system_error>

#include "core/log.h"

namespace {

bool parseTickCount(std::string_view text, std::uint32_t& outTicks) {
    std::uint32_t value = 0;
    const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size()) {
        return false;
    }
    outTicks = value;
    return true;
}

} // namespace

// Program entry point
// Responsible for: reading the optional tick count and handing control to the headless app.
// Should NOT do: implement simulation systems.
int main(int argc, char** argv) {
    TF_LOGI("main") << "startup";

    tinyfactory::app::AppOptions options{};
    if (argc > 1 && !parseTickCount(argv[1], options.ticks)) {
        TF_LOGE("main") << "invalid tick count '" << argv[1] << "', usage: tinyfactory_sim [ticks]";
        return 2;
    }

    tinyfactory::app::App app(options);
    if (!app.init()) {
        TF_LOGE("main") << "app init failed, exiting";
        return 1;
    }

    app.run();
    app.shutdown();
    TF_LOGI("main") << "exit success";
    return 0;
}
