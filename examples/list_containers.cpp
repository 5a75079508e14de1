/**
 * @file list_containers.cpp
 * @brief Container listing example for the Portainer C++ SDK
 *
 * Reads PORTAINER_HOST, PORTAINER_PORT, PORTAINER_USERNAME and
 * PORTAINER_PASSWORD from the environment.
 */

#include <portainer/portainer.hpp>
#include <iostream>

using namespace portainer;

int main() {
    std::cout << "Portainer C++ SDK - List Containers Example\n\n";

    try {
        PortainerClient client(ClientOptions::from_env());

        Outcome version = client.version();
        if (version.is_json()) {
            std::cout << "Docker version: " << version.payload().value("Version", "unknown") << "\n\n";
        } else {
            std::cout << "Version lookup: " << version.to_string() << "\n\n";
        }

        ContainerCollectionListOptions options;
        options.all = true;
        options.ignore_removed = true;

        std::cout << "Containers:\n";
        for (const auto& container : client.containers().list(options)) {
            std::cout << "  - " << container.short_id()
                      << " " << container.name().value_or("<unnamed>")
                      << " [" << container.status() << "]\n";
        }

        client.close();
        std::cout << "Done!\n";

    } catch (const PortainerError& e) {
        std::cerr << "Portainer Error (" << e.code() << "): " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
