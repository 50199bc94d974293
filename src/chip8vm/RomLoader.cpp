//
// Created by the chip8vm authors on 19.10.26.
//

#include <errno.h>
#include <string.h>
#include "fmt/format.h"
#include "RomLoader.h"

using namespace chip8vm;
using namespace chip8vm::core;

FileByteSource::~FileByteSource() {
    if (f != nullptr) {
        fclose(f);
    }
}

std::unique_ptr<FileByteSource> FileByteSource::Open(const std::filesystem::path &pathToFile) {
    std::error_code errCode;
    auto szFile = std::filesystem::file_size(pathToFile, errCode);
    if (errCode) {
        fmt::print(stderr, "FileByteSource, unable to stat '{}', {}\n", pathToFile.string(), errCode.message());
        return nullptr;
    }
    auto fileHandle = fopen(pathToFile.c_str(), "rb");
    if (fileHandle == nullptr) {
        fmt::print(stderr, "FileByteSource, unable to open '{}', {}\n", pathToFile.string(), strerror(errno));
        return nullptr;
    }
    return std::make_unique<FileByteSource>(fileHandle, static_cast<size_t>(szFile));
}

int64_t FileByteSource::Read(uint8_t *ptrDest, size_t szMax) {
    auto nRead = fread(ptrDest, 1, szMax, f);
    if ((nRead == 0) && ferror(f)) {
        return -1;
    }
    return static_cast<int64_t>(nRead);
}

//
// RomLoader
//
bool RomLoader::Load(ByteSource &source, std::vector<uint8_t> &outRom) {
    lastFault = CPUFault::None;
    outRom.clear();

    auto szSource = source.Size();
    if (!szSource.has_value()) {
        return ReadUnknownSize(source, outRom);
    }
    if (szSource.value() > CHIP8_MAX_ROM_SIZE) {
        fmt::print(stderr, "RomLoader, ROM size {} exceeds maximum {}\n", szSource.value(), CHIP8_MAX_ROM_SIZE);
        return Fail(CPUFault::RomTooLarge, outRom);
    }
    return ReadKnownSize(source, szSource.value(), outRom);
}

bool RomLoader::LoadFile(const std::filesystem::path &pathToRom, std::vector<uint8_t> &outRom) {
    auto source = FileByteSource::Open(pathToRom);
    if (source == nullptr) {
        // There is no 'not found' fault, a file we can't read has nothing to give
        lastFault = CPUFault::TruncatedSource;
        outRom.clear();
        return false;
    }
    return Load(*source, outRom);
}

bool RomLoader::LoadFile(const std::filesystem::path &pathToRom, CPUBase &cpu) {
    std::vector<uint8_t> romData;
    if (!LoadFile(pathToRom, romData)) {
        return false;
    }
    if (!cpu.LoadRom(romData)) {
        lastFault = cpu.GetLastFault();
        return false;
    }
    return true;
}

bool RomLoader::ReadKnownSize(ByteSource &source, size_t szRom, std::vector<uint8_t> &outRom) {
    outRom.resize(szRom);
    size_t nStaged = 0;
    while(nStaged < szRom) {
        auto nRead = source.Read(outRom.data() + nStaged, szRom - nStaged);
        if (nRead < 0) {
            fmt::print(stderr, "RomLoader, read error after {} of {} bytes\n", nStaged, szRom);
            return Fail(CPUFault::TruncatedSource, outRom);
        }
        if (nRead == 0) {
            fmt::print(stderr, "RomLoader, source exhausted after {} of {} bytes\n", nStaged, szRom);
            return Fail(CPUFault::TruncatedSource, outRom);
        }
        nStaged += static_cast<size_t>(nRead);
    }
    return true;
}

// Without a size we read until exhausted, one byte past the max tells us the ROM is too large
bool RomLoader::ReadUnknownSize(ByteSource &source, std::vector<uint8_t> &outRom) {
    outRom.resize(CHIP8_MAX_ROM_SIZE + 1);
    size_t nStaged = 0;
    while(nStaged < outRom.size()) {
        auto nRead = source.Read(outRom.data() + nStaged, outRom.size() - nStaged);
        if (nRead < 0) {
            fmt::print(stderr, "RomLoader, read error after {} bytes\n", nStaged);
            return Fail(CPUFault::TruncatedSource, outRom);
        }
        if (nRead == 0) {
            break;
        }
        nStaged += static_cast<size_t>(nRead);
    }
    if (nStaged > CHIP8_MAX_ROM_SIZE) {
        fmt::print(stderr, "RomLoader, ROM exceeds maximum {}\n", CHIP8_MAX_ROM_SIZE);
        return Fail(CPUFault::RomTooLarge, outRom);
    }
    outRom.resize(nStaged);
    return true;
}

bool RomLoader::Fail(CPUFault fault, std::vector<uint8_t> &outRom) {
    lastFault = fault;
    outRom.clear();
    return false;
}
