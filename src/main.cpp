// System includes
#include <memory>
#include <string>
#include <thread>

#include <crow.h>

// local includes
#include "utils/settings.hpp"
#include "utils/log.hpp"
#include "server/routes.hpp"
#include "storage/kv_store.hpp"

using svec::KVStore;

int main(int argc, char** argv) {
    if(argc > 1) {
        settings::DATA_DIR = argv[1];
    }

    LOG_INFO(settings::getAllSettingsAsString());

    std::unique_ptr<KVStore> store;
    try {
        store = std::make_unique<KVStore>(settings::DATA_DIR);
    } catch(const std::exception& e) {
        LOG_ERROR("Failed to open store at " << settings::DATA_DIR << ": " << e.what());
        return 1;
    }
    LOG_INFO("Starting the server");

    crow::SimpleApp app;
    svec::server::register_routes(app, *store);

    unsigned int num_cores = std::thread::hardware_concurrency();
    LOG_INFO("Number of processor cores: " << num_cores);
    if(settings::NUM_SERVER_THREADS == 0) {
        // Run on max possible threads
        LOG_INFO("Using all available threads");
        app.port(settings::SERVER_PORT).multithreaded().run();
    } else {
        // Limit on the number of threads
        LOG_INFO("Using " << settings::NUM_SERVER_THREADS << " threads");
        app.port(settings::SERVER_PORT).concurrency(settings::NUM_SERVER_THREADS).run();
    }

    return 0;
}
