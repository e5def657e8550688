#include "app/FleetKeeperApp.hpp"

int main(int argc, char** argv) {
    fleetkeeper::app::FleetKeeperApp app;
    return app.Run(argc, argv);
}
