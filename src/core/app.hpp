#pragma once

#include "core/config.hpp"
#include "core/event_loop.hpp"

namespace kindle::render { class GpuContext; }

namespace kindle {

class App final : public LoopHandler {
public:
    int run(int argc, const char* const* argv);

    void on_redraw() override;
    void on_close() override;

private:
    void render();

    AppConfig config;
    render::GpuContext* gpu{};
};

}
