#include "app/App.h"
#include "core/Config.h"
#include "core/Logging.h"
#include <spdlog/spdlog.h>

int main(int argc, char** argv) {
    // Initialize logging early so config parsing and GLFW callbacks use it
    auto cfg = core::determine_log_config(argc, argv, spdlog::level::info);
    core::init_logging(cfg);
    app::App app(core::determine_client_config(argc, argv));
    int rc = app.run();
    core::shutdown_logging();
    return rc;
}
