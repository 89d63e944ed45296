#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>

#include "picoosc/PicoOSC.h"

namespace
{
    // Integers become int32, other numbers float, everything else a string
    picoosc::Value parseArgument(const std::string &text)
    {
        if (text.empty())
        {
            return picoosc::Value(text);
        }

        char *end = nullptr;
        long integer = std::strtol(text.c_str(), &end, 10);
        if (*end == '\0' && integer >= INT32_MIN && integer <= INT32_MAX)
        {
            return picoosc::Value(static_cast<int32_t>(integer));
        }

        float number = std::strtof(text.c_str(), &end);
        if (*end == '\0')
        {
            return picoosc::Value(number);
        }

        return picoosc::Value(text);
    }
}

int main(int argc, char *argv[])
{
    if (argc < 4)
    {
        std::cerr << "Usage: " << argv[0] << " <host> <port> <address> [args...]" << std::endl;
        return 1;
    }

    try
    {
        int port = std::stoi(argv[2]);
        if (port < 0 || port > 65535)
        {
            std::cerr << "Port out of range: " << argv[2] << std::endl;
            return 1;
        }

        std::vector<picoosc::Value> arguments;
        for (int i = 4; i < argc; ++i)
        {
            arguments.push_back(parseArgument(argv[i]));
        }

        picoosc::Message message(argv[3], arguments);
        picoosc::Client client(picoosc::Endpoint(argv[1], static_cast<uint16_t>(port)));
        client.send(message);

        std::cout << "Sent " << message.toString() << " to " << client.target().url() << std::endl;
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
