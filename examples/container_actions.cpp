/**
 * @file container_actions.cpp
 * @brief Container lifecycle example for the Portainer C++ SDK
 *
 * Usage: container_actions <container> <start|stop|restart|pause|unpause|kill|top|stats>
 */

#include <portainer/portainer.hpp>
#include <iostream>

using namespace portainer;

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <container> <action>\n";
        return 2;
    }

    std::string target = argv[1];
    std::string action = argv[2];

    try {
        PortainerClient client(ClientOptions::from_env());
        Container container = client.containers().get(target);

        std::cout << "Container " << container.name().value_or(container.short_id())
                  << " is " << container.status() << "\n";

        Outcome result = Outcome::empty();
        if (action == "start") {
            result = container.start();
        } else if (action == "stop") {
            result = container.stop();
        } else if (action == "restart") {
            result = container.restart();
        } else if (action == "pause") {
            result = container.pause();
        } else if (action == "unpause") {
            result = container.unpause();
        } else if (action == "kill") {
            result = container.kill(Signal{std::string("SIGTERM")});
        } else if (action == "top") {
            result = container.top(std::string("aux"));
        } else if (action == "stats") {
            result = container.stats();
        } else {
            std::cerr << "Unknown action: " << action << "\n";
            return 2;
        }

        std::cout << result.to_string() << "\n";
        if (result.is_json()) {
            std::cout << result.payload().dump(2) << "\n";
        }

        container.reload();
        std::cout << "Container is now " << container.status() << "\n";

        return result.ok() ? 0 : 1;

    } catch (const NotFoundError& e) {
        std::cerr << "No such container: " << e.resource() << "\n";
        return 1;
    } catch (const PortainerError& e) {
        std::cerr << "Portainer Error (" << e.code() << "): " << e.what() << "\n";
        return 1;
    }
}
