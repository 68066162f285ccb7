//local
#include <cli/command_line.hpp>

int main(int argc, char* argv[])
{
    // Run the requested command and exit with its status
    // Progress and errors are rendered on the console, details are written to the log file
    return cli::run(argc, argv);
}
