#include "AdminSession.hpp"
#include "ExpiryService.hpp"
#include "LedgerConfig.hpp"
#include <csignal>
#include <iostream>
#include <string>

using namespace std;

namespace {
ExpiryService *g_service = nullptr;

void handle_signal(int) {
    if (g_service) g_service->stop();
}

int usage(const char *prog) {
    cerr << "Usage: " << prog << " serve|admin\n";
    return 2;
}
} // namespace

int main(int argc, char *argv[]) {
    if (argc != 2) return usage(argv[0]);
    string mode = argv[1];
    if (mode != "serve" && mode != "admin") return usage(argv[0]);

    LedgerConfig cfg = default_config();
    string err;
    if (!load_config_from_env(cfg, err)) {
        cerr << "Bad configuration: " << err << "\n";
        return 2;
    }

    ExpiryService service(cfg);
    if (!service.init(err)) {
        cerr << "DB init failed: " << err << "\n";
        return 1;
    }

    try {
        if (mode == "serve") {
            g_service = &service;
            signal(SIGINT, handle_signal);
            signal(SIGTERM, handle_signal);
            service.run();
            g_service = nullptr;
        } else {
            AdminSession session(cin, cout, service.ledger(), service.db(), service.logger());
            session.run();
        }
    } catch (const DbIntegrityError &e) {
        service.logger().error("server", e.what());
        cerr << e.what() << "\n";
        return 1;
    } catch (const DbProgrammingError &e) {
        service.logger().error("server", e.what());
        cerr << e.what() << "\n";
        return 1;
    }
    return 0;
}
