#include <iostream>
#include <string>

#include "ControlFlow.hpp"
#include "ConfigGlobal.hpp"

int main(int argc, char* argv[])
{
    ConfigGlobal::InitializeDefaults();

    if (argc >= 2 && std::string(argv[1]) == "--verify")
    {
        if (argc < 3 || argc > 4)
        {
            std::cerr << "Usage: CardOffload --verify <list.mhl> [base-dir]\n";
            return 1;
        }
        return ControlFlow::VerifyHashList(argv[2], argc == 4 ? argv[3] : "");
    }

    if (argc > 2)
    {
        std::cerr << "Usage: CardOffload [config-file]\n       CardOffload --verify <list.mhl> [base-dir]\n";
        return 1;
    }
    if (argc == 2)
    {
        ConfigGlobal::ConfigFile = argv[1];
    }

    ControlFlow Flow;
    return Flow.Run();
}
