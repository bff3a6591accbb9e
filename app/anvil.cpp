#include "anvil/anvil.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        anvil::server_config cfg{};
        if (auto cli_result = anvil::cli::parse_cli(argc, argv, cfg)) {
            return *cli_result;
        }

        anvil::log::set_level(cfg.log);
        return anvil::http::run_server(cfg);
    } catch (std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    } catch (...) {
        std::cerr << "fatal: unknown exception\n";
        return 1;
    }
}
