//
// Created by the chip8vm authors on 19.10.26.
//

#ifndef CHIP8VM_ROMLOADER_H
#define CHIP8VM_ROMLOADER_H

#include <stdint.h>
#include <stddef.h>
#include <stdio.h>
#include <vector>
#include <memory>
#include <optional>
#include <filesystem>

#include "CPUBase.h"

namespace chip8vm {
    namespace core {

        // Anything we can read a ROM from
        class ByteSource {
        public:
            using Ref = std::shared_ptr<ByteSource>;
        public:
            ByteSource() = default;
            virtual ~ByteSource() = default;

            // Read up to 'szMax' bytes, a source is allowed to return less than asked for
            // Returns
            //   >0 - number of bytes read
            //    0 - source is exhausted
            //   -1 - read error
            virtual int64_t Read(uint8_t *ptrDest, size_t szMax) = 0;

            // Total size, if known up front
            virtual std::optional<size_t> Size() const {
                return {};
            }
        };

        class FileByteSource : public ByteSource {
        public:
            FileByteSource(FILE *fileHandle, size_t szFile) : f(fileHandle), szFile(szFile) {

            }
            FileByteSource(const FileByteSource &) = delete;
            FileByteSource &operator=(const FileByteSource &) = delete;
            virtual ~FileByteSource();

            // Returns nullptr if the file can't be opened
            static std::unique_ptr<FileByteSource> Open(const std::filesystem::path &pathToFile);

            int64_t Read(uint8_t *ptrDest, size_t szMax) override;
            std::optional<size_t> Size() const override {
                return szFile;
            }
        private:
            FILE *f = nullptr;
            size_t szFile = 0;
        };

        //
        // Stages a ROM from a byte source, partial reads are retried until everything is read.
        // The resulting buffer is complete - hand it to 'CPUBase::LoadRom'
        //
        class RomLoader {
        public:
            RomLoader() = default;
            virtual ~RomLoader() = default;

            // Returns
            //   true - 'outRom' holds the full ROM
            //   false - see 'GetLastFault', 'outRom' is left empty
            bool Load(ByteSource &source, std::vector<uint8_t> &outRom);
            bool LoadFile(const std::filesystem::path &pathToRom, std::vector<uint8_t> &outRom);

            // Load and copy to the CPU in one go
            bool LoadFile(const std::filesystem::path &pathToRom, CPUBase &cpu);

            CPUFault GetLastFault() const {
                return lastFault;
            }
        protected:
            bool ReadKnownSize(ByteSource &source, size_t szRom, std::vector<uint8_t> &outRom);
            bool ReadUnknownSize(ByteSource &source, std::vector<uint8_t> &outRom);
            bool Fail(CPUFault fault, std::vector<uint8_t> &outRom);
        private:
            CPUFault lastFault = CPUFault::None;
        };
    }
}

#endif //CHIP8VM_ROMLOADER_H
