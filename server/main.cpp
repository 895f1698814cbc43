// Contacts REST service: CRUD over a SQLite "contacts" table.

#include "rolodex/contacts/api.hpp"
#include "rolodex/contacts/config.hpp"
#include "rolodex/contacts/contact_store.hpp"
#include "rolodex/contacts/database.hpp"
#include "rolodex/core/http_server.hpp"

#include <cstdio>
#include <iostream>
#include <optional>
#include <string>

using namespace rolodex;

int main(int argc, char** argv) {
    const auto config = contacts::load_config(argc, argv);

    std::optional<storage::database> db;
    try {
        db.emplace(config.database_path);
    } catch (const storage::database_exception& e) {
        std::cerr << "[database] " << e.what() << "\n";
        return 1;
    }

    contacts::contact_store store(*db);
    if (auto schema = store.init_schema(); !schema) {
        std::cerr << "[database] Failed to create schema: " << schema.error().message << "\n";
        return 1;
    }

    contacts::contact_api api(store);

    int rc = http::server(api.api_router())
                 .listen(config.port)
                 .workers(config.workers)
                 .graceful_shutdown(config.shutdown_timeout)
                 .on_start([&config]() {
                     std::cout << "[server] Server running on http://localhost:" << config.port
                               << " with " << config.workers << " worker threads\n"
                               << "[server] Database: " << config.database_path << "\n"
                               << "[server] Endpoints:\n"
                               << "  GET    /api/contacts\n"
                               << "  GET    /api/contacts/{id}\n"
                               << "  POST   /api/contacts\n"
                               << "  PUT    /api/contacts/{id}\n"
                               << "  DELETE /api/contacts/{id}\n"
                               << "  GET    /api/health\n";
                 })
                 .on_stop([]() { std::cout << "\n[server] Shutting down gracefully...\n"; })
                 .on_request([](const http::request& req,
                                const http::response& res,
                                std::chrono::microseconds elapsed) {
                     // Workers log concurrently; emit the line with a single write.
                     char duration[32];
                     std::snprintf(duration, sizeof(duration), "%.3f", elapsed.count() / 1000.0);
                     std::string line = "[server] ";
                     line.append(http::method_to_string(req.http_method))
                         .append(" ")
                         .append(req.uri)
                         .append(" -> ")
                         .append(std::to_string(res.status))
                         .append(" (")
                         .append(duration)
                         .append(" ms)\n");
                     std::cout << line;
                 })
                 .run();

    // Workers are joined; the database handle is closed exactly once here.
    db.reset();
    return rc;
}
