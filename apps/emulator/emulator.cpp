#include <stdint.h>
#include <stdlib.h>
#include <errno.h>
#include <ctype.h>
#include <chrono>
#include <vector>
#include <string>
#include <optional>
#include <filesystem>

#include "fmt/format.h"
#include "VirtualCPU.h"
#include "RomLoader.h"
#include "KeyMap.h"
#include "Timer.h"

using namespace chip8vm;
using namespace chip8vm::core;

static VirtualCPU cpuemu;

static uint64_t maxSteps = 10000;
static uint64_t instrPerSecond = 700;
static std::string keysHeld = {};
static std::optional<uint64_t> randomSeed = {};
static bool bTrace = false;

std::optional<uint64_t> ParseNumber(const std::string_view &line);

static bool ProcessFile(const std::filesystem::path &pathToRom);
static bool ExecuteRom();

static void Usage() {
    fmt::print("Headless CHIP-8 emulator\n");
    fmt::print("Use:\n");
    fmt::print("  chip8emu [options] <rom>\n");
    fmt::print("Options:\n");
    fmt::print("  -n <num>     Max number of instructions to execute (default=10000)\n");
    fmt::print("  -c <num>     Instructions per second, 1..1000000000, timers run at 60Hz of this (default=700)\n");
    fmt::print("  -k <keys>    Host keys held down during the run (1234/qwer/asdf/zxcv)\n");
    fmt::print("  -s <num>     Seed for the random generator (default=random)\n");
    fmt::print("  -t           Trace each executed instruction\n");
    fmt::print("Example (run 500 instructions with 'w' held down):\n");
    fmt::print("  chip8emu -n 500 -k w pong.ch8\n");
}

// Fetch the value following an option, the index is moved past it
static std::optional<uint64_t> NumberArgument(int argc, char **argv, int &i) {
    if ((i + 1) >= argc) {
        fmt::print(stderr, "Missing argument for {}\n", argv[i]);
        return {};
    }
    auto tmp = ParseNumber(argv[++i]);
    if (!tmp.has_value()) {
        fmt::print(stderr, "Invalid number {} as argument for {}\n", argv[i], argv[i-1]);
        return {};
    }
    return tmp;
}

int main(int argc, char **argv)  {
    std::vector<std::string> filesToRun;
    for(int i=1;i<argc;i++) {
        if (argv[i][0] == '-') {
            switch(argv[i][1]) {
                case 'n' : {
                        auto tmp = NumberArgument(argc, argv, i);
                        if (!tmp.has_value()) {
                            return 1;
                        }
                        maxSteps = *tmp;
                    }
                    break;
                case 'c' : {
                        auto tmp = NumberArgument(argc, argv, i);
                        if (!tmp.has_value() || !Timer::PeriodOf(*tmp).has_value()) {
                            fmt::print(stderr, "Instructions per second must be between 1 and {}, use: -c <number>\n", Timer::kNanosPerSec);
                            return 1;
                        }
                        instrPerSecond = *tmp;
                    }
                    break;
                case 'k' :
                    if ((i + 1) >= argc) {
                        fmt::print(stderr, "Missing argument for -k\n");
                        return 1;
                    }
                    keysHeld = argv[++i];
                    break;
                case 's' : {
                        auto tmp = NumberArgument(argc, argv, i);
                        if (!tmp.has_value()) {
                            return 1;
                        }
                        randomSeed = *tmp;
                    }
                    break;
                case 't' :
                    bTrace = true;
                    break;
                case 'h' :
                case '?' :
                    Usage();
                    return 1;
                default:
                    fmt::print(stderr,"Unknown option {}\n", argv[i]);
                    Usage();
                    return 1;
            }
        } else {
            filesToRun.push_back(argv[i]);
        }
    }

    if (filesToRun.empty()) {
        fmt::print("no rom - bailing\n");
        return 1;
    }
    if (filesToRun.size() > 1) {
        fmt::print(stderr, "Only one rom at a time, running '{}'\n", filesToRun[0]);
    }

    std::filesystem::path pathToFile(filesToRun[0]);
    if (!exists(pathToFile)) {
        fmt::print(stderr, "No such file or directory, {}\n", filesToRun[0]);
        return 1;
    }
    if (!is_regular_file(pathToFile)) {
        fmt::print(stderr, "Not a regular file {}\n", filesToRun[0]);
        return 1;
    }

    if (!ProcessFile(pathToFile)) {
        fmt::print("{} - failed\n", filesToRun[0]);
        return 1;
    }
    fmt::print("{} - OK\n", filesToRun[0]);
    return 0;
}

static bool ProcessFile(const std::filesystem::path &pathToRom) {
    if (randomSeed.has_value()) {
        cpuemu.SetRandomSource(DefaultRandomSource::Create(static_cast<uint32_t>(*randomSeed)));
    }

    RomLoader loader;
    if (!loader.LoadFile(pathToRom, cpuemu)) {
        fmt::print(stderr, "ERR: unable to load '{}', {}\n", pathToRom.string(), FaultToString(loader.GetLastFault()));
        return false;
    }

    for(auto hostKey : keysHeld) {
        auto key = KeyMap::FromHostKey(hostKey);
        if (!key.has_value()) {
            fmt::print(stderr, "WARNING: key '{}' is not mapped - ignored\n", hostKey);
            continue;
        }
        cpuemu.SetKey(*key, true);
    }

    return ExecuteRom();
}

static void DumpFramebuffer(const Framebuffer &framebuffer) {
    std::string line;
    fmt::print("+{}+\n", std::string(Framebuffer::kWidth, '-'));
    for(int y=0;y<Framebuffer::kHeight;y++) {
        line.clear();
        for(int x=0;x<Framebuffer::kWidth;x++) {
            line += framebuffer.GetPixel(x, y)?'#':' ';
        }
        fmt::print("|{}|\n", line);
    }
    fmt::print("+{}+\n", std::string(Framebuffer::kWidth, '-'));
}

static void DumpRegs(const Registers &regs) {
    for(int i=0;i<16;i++) {
        fmt::print("v{:x}=0x{:02x}  ",i,regs.v[i]);
        if ((i & 7) == 7) {
            fmt::print("\n");
        }
    }
    fmt::print("i=0x{:03x}  pc=0x{:03x}  sp={}  dt={}  st={}\n",
               regs.index, regs.instrPointer, regs.stackPointer, regs.delayTimer, regs.soundTimer);
}

static bool ExecuteRom() {
    // Timers are driven by emulated time, each instruction is worth 1/ips seconds
    auto timer = Timer::Create();
    timer->SetTickHandler([]() {
        cpuemu.TickTimers();
    });
    // Validated when parsing '-c'
    auto nsPerInstr = Timer::PeriodOf(instrPerSecond).value_or(std::chrono::nanoseconds(1));
    Timer::clock::time_point tEmulated = {};
    timer->Reset(tEmulated);

    bool bFaulted = false;
    uint64_t nSteps = 0;

    fmt::print("------->> Begin Execution <<--------------\n");
    while(nSteps < maxSteps) {
        if (!cpuemu.Step()) {
            bFaulted = true;
            break;
        }
        nSteps++;

        if (bTrace) {
            auto lastInstr = cpuemu.GetLastDecodedInstr();
            fmt::print("0x{:03x}\t\t{}\n", lastInstr->instrAddr, lastInstr->ToString());
            DumpRegs(lastInstr->cpuRegistersAfter);
        }

        tEmulated += nsPerInstr;
        timer->Update(tEmulated);
    }
    fmt::print("------->> Execution Complete <<--------------\n");

    DumpFramebuffer(cpuemu.GetFramebuffer());
    DumpRegs(cpuemu.GetRegisters());
    fmt::print("steps={}  timer ticks={}  sound={}\n", nSteps, timer->GetTickCounter(), cpuemu.IsSoundActive()?"on":"off");

    if (bFaulted) {
        fmt::print(stderr, "ERR: execution stopped, fault '{}' at pc=0x{:03x}\n",
                   FaultToString(cpuemu.GetLastFault()), cpuemu.currentInstrAddr);
        return false;
    }
    return true;
}


///////// Helpers
std::optional<uint64_t> ParseNumber(const std::string_view &line) {
    if (line.empty() || !isdigit(static_cast<unsigned char>(line[0]))) {
        return {};
    }

    std::string num(line);
    int base = 10;
    size_t ofsDigits = 0;
    if ((num.size() > 2) && (num[0] == '0')) {
        switch(tolower(num[1])) {
            case 'x' : // hex
                base = 16;
                ofsDigits = 2;
                break;
            case 'b' : // binary
                base = 2;
                ofsDigits = 2;
                break;
            default :
                break;
        }
    }

    char *ptrEnd = nullptr;
    errno = 0;
    auto value = strtoull(num.c_str() + ofsDigits, &ptrEnd, base);
    if ((errno != 0) || (ptrEnd == num.c_str() + ofsDigits) || (*ptrEnd != '\0')) {
        return {};
    }
    return {static_cast<uint64_t>(value)};
}
