#pragma once

#include "config.hpp"

#include <memory>

namespace httplib {
    class Server;
}

namespace anvil::http {

    // Routes of the LTSA and transpiler API bound to one HTTP listener.
    class service {
      public:
        explicit service(server_config cfg);
        ~service();

        service(const service&) = delete;
        service& operator=(const service&) = delete;

        // Binds the listener; port 0 picks an ephemeral port. Returns the bound port, throws
        // std::runtime_error when the address cannot be bound.
        int bind();

        // Serves until stop(); false if the listener failed.
        bool listen();

        void stop();
        void wait_until_ready() const;
        bool is_running() const;

      private:
        void register_routes();

        server_config _cfg;
        std::unique_ptr<httplib::Server> _server;
    };

    // Serves until SIGINT or SIGTERM. Returns the process exit code.
    int run_server(const server_config& cfg);

}  // namespace anvil::http
