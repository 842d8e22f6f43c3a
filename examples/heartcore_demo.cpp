#include <heartcore/config/RuntimeOptions.hpp>
#include <heartcore/events/EventBus.hpp>
#include <heartcore/events/PeripheralManager.hpp>
#include <heartcore/events/PeripheralStreams.hpp>
#include <heartcore/events/VirtualPeripherals.hpp>
#include <heartcore/render/EventMeterRenderer.hpp>
#include <heartcore/render/RenderPipeline.hpp>
#include <heartcore/render/SolidFillRenderer.hpp>
#include <heartcore/runtime/RenderLoop.hpp>
#include <heartcore/task/DelayScheduler.hpp>

#include "log/TaggedLogger.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace HC;
using namespace std::chrono_literals;

struct CommandLineOptions {
    int                        frames = 120;
    int                        width  = 64;
    int                        height = 32;
    std::optional<std::string> config_path;
    bool                       verbose = false;
};

static auto parse_int(std::string_view flag, char const* value, int minimum) -> std::optional<int> {
    if (value == nullptr) {
        std::cerr << "heartcore_demo: " << flag << " needs a value" << std::endl;
        return std::nullopt;
    }
    char*      end    = nullptr;
    long const parsed = std::strtol(value, &end, 10);
    if (end == value || *end != '\0' || parsed < minimum) {
        std::cerr << "heartcore_demo: " << flag << " expects an integer >= " << minimum << std::endl;
        return std::nullopt;
    }
    return static_cast<int>(parsed);
}

static auto parse_options(int argc, char** argv) -> std::optional<CommandLineOptions> {
    CommandLineOptions opts;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        char const*      next = i + 1 < argc ? argv[i + 1] : nullptr;
        if (arg == "--frames" || arg == "--width" || arg == "--height") {
            auto value = parse_int(arg, next, 1);
            if (!value)
                return std::nullopt;
            (arg == "--frames" ? opts.frames : arg == "--width" ? opts.width : opts.height) = *value;
            ++i;
        } else if (arg == "--config") {
            if (next == nullptr) {
                std::cerr << "heartcore_demo: --config needs a path" << std::endl;
                return std::nullopt;
            }
            opts.config_path = next;
            ++i;
        } else if (arg == "--verbose") {
            opts.verbose = true;
        } else {
            std::cerr << "usage: heartcore_demo [--frames N] [--width W] [--height H] [--config FILE] [--verbose]" << std::endl;
            return std::nullopt;
        }
    }
    return opts;
}

static auto load_options(CommandLineOptions const& cli) -> Expected<RuntimeOptions> {
    RuntimeOptions options;
    if (cli.config_path) {
        auto loaded = LoadRuntimeOptions(*cli.config_path);
        if (!loaded)
            return loaded;
        options = *loaded;
    }
    if (auto error = ApplyRuntimeEnvOverrides(options))
        return std::unexpected(*error);
    if (auto error = ValidateRuntimeOptions(options))
        return std::unexpected(*error);
    return options;
}

// A fader that sweeps up and down, plus a button tapped twice in a row now and then.
static auto make_scripted_peripherals() -> std::vector<PeripheralPtr> {
    std::vector<ScriptedStep> sweep;
    for (int step = 0; step <= 10; ++step)
        sweep.push_back(ScriptedStep{.delay = 15ms, .event_type = "fader", .data = {{"value", step / 10.0}}});
    for (int step = 9; step > 0; --step)
        sweep.push_back(ScriptedStep{.delay = 15ms, .event_type = "fader", .data = {{"value", step / 10.0}}});

    std::vector<ScriptedStep> taps{
            {.delay = 250ms, .event_type = "button", .data = {{"pressed", true}}},
            {.delay = 80ms, .event_type = "button", .data = {{"pressed", true}}},
    };
    return {std::make_shared<ScriptedPeripheral>("fader", 1, std::move(sweep), true),
            std::make_shared<ScriptedPeripheral>("button", 2, std::move(taps), true)};
}

int main(int argc, char** argv) {
    auto cli = parse_options(argc, argv);
    if (!cli)
        return 2;

#ifdef HC_LOG_DEBUG
    set_logging_enabled(cli->verbose);
    set_thread_name("Main");
#endif

    auto options = load_options(*cli);
    if (!options) {
        std::cerr << "heartcore_demo: " << describeError(options.error()) << std::endl;
        return 1;
    }
    hc_log("Runtime options: " + RuntimeOptionsToJson(*options).dump(), "Demo");

    try {
        EventBus          bus(options->events);
        DelayScheduler    scheduler;
        PeripheralStreams streams(bus, options->streams, scheduler);

        std::atomic<int> double_taps{0};
        auto             tap = bus.virtualPeripherals().registerDefinition(
                MakeDoubleTapDefinition({.source_event_type = "button", .output_event_type = "button.double_tap", .window = 300ms}));
        if (!tap) {
            std::cerr << "heartcore_demo: " << describeError(tap.error()) << std::endl;
            return 1;
        }
        bus.subscribe("button.double_tap", [&](InputEvent const&) { ++double_taps; });

        PeripheralManager peripherals(bus);
        peripherals.detect({make_scripted_peripherals});

        RenderPipeline pipeline(options->render,
                                RendererContext{.events  = &bus,
                                                .streams = &streams,
                                                .window  = SurfaceSize{cli->width, cli->height}});
        MemoryFrameSink sink;
        RenderLoop      loop(pipeline, sink, options->pacing, {}, SteadyClock::Instance(), &streams);
        loop.setRenderers({
                std::make_shared<SolidFillRenderer>("backdrop", Color{16, 16, 24, 255}, DisplayMode::Full),
                std::make_shared<EventMeterRenderer>("fader-meter",
                                                     EventMeterRenderer::Options{.event_type = "fader", .bar_color = Color{0, 200, 120, 255}}),
        });

        if (auto error = peripherals.start()) {
            std::cerr << "heartcore_demo: " << describeError(*error) << std::endl;
            return 1;
        }

        int rendered = 0;
        while (rendered < cli->frames) {
            auto outcome = loop.tick();
            if (!outcome) {
                std::cerr << "heartcore_demo: frame failed: " << describeError(outcome.error()) << std::endl;
                break;
            }
            if (!outcome->rendered) {
                SteadyClock::Instance().sleepFor(1ms);
                continue;
            }
            ++rendered;
            if (outcome->plan && outcome->frame_index % 30 == 0) {
                std::cout << "frame " << outcome->frame_index << " variant=" << toString(outcome->plan->variant)
                          << " frame_ms=" << outcome->frame_ms << std::endl;
            }
        }

        peripherals.close();
        loop.shutdown();
        bus.shutdown();
        streams.close();

        std::cout << "rendered " << loop.framesRendered() << " frame(s), presented " << sink.presentedCount() << ", double taps "
                  << double_taps.load() << ", peripheral failures " << peripherals.failureCount() << std::endl;
    } catch (std::exception const& error) {
        std::cerr << "heartcore_demo: " << error.what() << std::endl;
        return 1;
    }
    return 0;
}
