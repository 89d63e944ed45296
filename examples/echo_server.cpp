#include <chrono>
#include <iostream>
#include <thread>

#include "picoosc/PicoOSC.h"

// Listens for /some/addr and sends every message straight back to the same
// endpoint after half a second, so one initial message keeps looping until
// Ctrl+C. An optional JSON configuration overrides endpoints and logging.
int main(int argc, char *argv[])
{
    try
    {
        picoosc::Config config;
        if (argc > 1)
        {
            config = picoosc::Config::loadFromFile(argv[1]);
        }
        else
        {
            config.setLogLevel(picoosc::LogLevel::Debug);
        }
        config.applyLogging();

        picoosc::Endpoint local("127.0.0.1", 19994);
        if (!config.getListenEndpoints().empty())
        {
            local = config.getListenEndpoints().front();
        }
        picoosc::Endpoint target = config.getTargets().empty() ? local : config.getTargets().front();

        picoosc::Registry registry(config.getServerOptions());

        auto sendSomething = registry.bindSender(target, [](const std::vector<picoosc::Value> &arguments)
                                                 { return picoosc::Message("/some/addr", arguments); });

        registry.onReceive(local, "/some/addr",
                           [sendSomething](const std::string &address, const std::vector<picoosc::Value> &arguments) mutable
                           {
                               std::string text;
                               if (!arguments.empty())
                               {
                                   text = arguments.front().isString() ? arguments.front().asString()
                                                                       : arguments.front().toString();
                               }
                               std::cout << "I got a message: '" << text << "' from '" << address << "'." << std::endl;
                               std::this_thread::sleep_for(std::chrono::milliseconds(500));
                               // Loop!
                               sendSomething(arguments);
                           });

        if (registry.startAll() == 0)
        {
            std::cerr << "No server could be started on " << local.url() << std::endl;
            return 1;
        }

        std::cout << "Listening on " << local.url() << ". Press Ctrl+C to stop." << std::endl;
        sendSomething(std::vector<picoosc::Value>{"Hey this is something"});

        registry.wait();
        registry.stopAll();
        std::cout << "Server stopped." << std::endl;
    }
    catch (const picoosc::OSCException &e)
    {
        std::cerr << "OSC Error: " << e.what() << " (Code: " << static_cast<int>(e.code()) << ")" << std::endl;
        return 1;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
