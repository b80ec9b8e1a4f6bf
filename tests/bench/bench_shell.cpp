#include <benchmark/benchmark.h>

#include <kestrel/collaborators.hpp>
#include <kestrel/logger.hpp>
#include <kestrel/shell.hpp>
#include <string>

#include "ui/surfaces/surface_registry.hpp"

using namespace kestrel;

// ═══════════════════════════════════════════════════════════════════════════════
// Shell core hot paths: surface lookup per frame, window teardown with many
// live surfaces, and the drag target update that runs on every pointer move.
// ═══════════════════════════════════════════════════════════════════════════════

// ─── Helpers ─────────────────────────────────────────────────────────────────

namespace
{

class NullEngine : public RenderEngine
{
   public:
    RenderSurface create_surface(TabId tab, const std::optional<RenderSurface>&) override
    {
        return {next_++, tab};
    }
    void load_content(const RenderSurface&, const std::string&) override {}
    void dispose_surface(const RenderSurface&) override {}
    void set_muted(const RenderSurface&, bool) override {}
    void reload(const RenderSurface&) override {}
    std::optional<std::string> current_locator(const RenderSurface&) const override
    {
        return std::nullopt;
    }

   private:
    uint64_t next_ = 1;
};

struct QuietLogs
{
    QuietLogs() { Logger::instance().set_level(LogLevel::Off); }
};

}   // namespace

// ─── Surface registry ────────────────────────────────────────────────────────

static void BM_SurfaceRegistry_Lookup(benchmark::State& state)
{
    const auto      tabs = static_cast<TabId>(state.range(0));
    SurfaceRegistry reg;
    for (WindowId w = 1; w <= 4; ++w)
        for (TabId t = 1; t <= tabs; ++t)
            reg.store({w * 100000 + t, t}, t, w);

    TabId t = 1;
    for (auto _ : state)
    {
        benchmark::DoNotOptimize(reg.get(t, 2));
        t = t % tabs + 1;
    }
}
BENCHMARK(BM_SurfaceRegistry_Lookup)->Arg(16)->Arg(256)->Arg(4096);

static void BM_SurfaceRegistry_AllForTab(benchmark::State& state)
{
    const auto      windows = static_cast<WindowId>(state.range(0));
    SurfaceRegistry reg;
    for (WindowId w = 1; w <= windows; ++w)
        for (TabId t = 1; t <= 64; ++t)
            reg.store({w * 1000 + t, t}, t, w);

    for (auto _ : state)
        benchmark::DoNotOptimize(reg.all_for_tab(32));
}
BENCHMARK(BM_SurfaceRegistry_AllForTab)->Arg(2)->Arg(8)->Arg(32);

// ─── Window teardown ─────────────────────────────────────────────────────────

static void BM_Shell_CloseWindowWithSurfaces(benchmark::State& state)
{
    QuietLogs  quiet;
    NullEngine engine;
    const auto tabs = static_cast<TabId>(state.range(0));

    for (auto _ : state)
    {
        state.PauseTiming();
        Shell shell;
        shell.set_render_engine(&engine);
        WindowId keep = shell.open_window();
        WindowId gone = shell.open_window();
        for (TabId t = 1; t <= tabs; ++t)
        {
            shell.show_tab(t, keep, "https://bench.test");
            shell.show_tab(t, gone, "https://bench.test");
        }
        state.ResumeTiming();

        shell.close_window(gone);
    }
}
BENCHMARK(BM_Shell_CloseWindowWithSurfaces)->Arg(16)->Arg(256)->Unit(benchmark::kMicrosecond);

// ─── Drag ────────────────────────────────────────────────────────────────────

static void BM_Shell_DragPointerMove(benchmark::State& state)
{
    QuietLogs quiet;
    Shell     shell;
    WindowId  w    = shell.open_window();
    Container zone = Container::space_regular(1);

    DropZoneLayout layout;
    layout.frame      = {0.0f, 0.0f, 250.0f, 2000.0f};
    layout.item_count = 50;
    shell.layouts().set_layout(zone, layout);
    shell.begin_tab_drag(1, zone, 0, w);

    float y = 0.0f;
    for (auto _ : state)
    {
        benchmark::DoNotOptimize(shell.update_tab_drag_at(zone, {20.0f, y}));
        y = y > 1900.0f ? 0.0f : y + 7.0f;
    }
    shell.cancel_tab_drag();
}
BENCHMARK(BM_Shell_DragPointerMove);

BENCHMARK_MAIN();
