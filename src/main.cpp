#include <string>
#include <vector>
#include "command_line.hpp"

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv, argv + argc);
    return Wav2Ulaw::run_command_line(args);
}
