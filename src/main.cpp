#include "app/Application.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv)
{
    try
    {
        Application app(argc, argv);
        return app.run();
    }
    catch (const std::exception& ex)
    {
        // Logging may not be up yet
        std::cerr << "notecard: " << ex.what() << '\n';
        return kExitUsage;
    }
}
