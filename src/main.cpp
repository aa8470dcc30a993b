#include <cstdlib>
#include <fstream>
#include <iostream>
#include "NetFlowMonitor.hpp"
#include "SettingsParser.hpp"

// usage: netflow_monitor [settings.json] [interface]
int main(int argc, char* argv[])
{
    try {
        MonitorSettings settings;
        if (argc > 1)
        {
            SettingsParser parser(argv[1]);
            settings = parser.loadSettings();
        }
        else if (std::ifstream(Config::SETTINGS_PATH).good())
        {
            SettingsParser parser(Config::SETTINGS_PATH);
            settings = parser.loadSettings();
        }
        if (argc > 2)
        {
            settings.interface = argv[2];
        }

        NetFlowMonitor monitor(settings);
        monitor.startingCapture();
    }
    catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
