#include "options.hpp"
#include "shell.hpp"
#include "startup.hpp"

#include <spdlog/spdlog.h>

int main(int argc, char **argv)
{
    // Arguments are captured before the event loop takes over
    twice::capture_startup_paths(argc, argv);

    auto app = twice::shell::create(twice::options::defaults(), argc, argv);

    if (!app.has_value())
    {
        spdlog::critical(app.error().message());
        return 1;
    }

    return app.value()->run();
}
