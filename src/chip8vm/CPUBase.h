//
// Created by the chip8vm authors on 19.10.26.
//

#ifndef CHIP8VM_CPUBASE_H
#define CHIP8VM_CPUBASE_H

#include <stdint.h>
#include <stddef.h>
#include <array>
#include <vector>
#include <memory>

#include "fmt/format.h"
#include "Framebuffer.h"
#include "RandomSource.h"

namespace chip8vm {
    namespace core {

        //
        // Memory map
        //   0x000 - 0x1FF  : interpreter area
        //   0x050 - 0x09F  :   font sprites (16 glyphs, 5 bytes each) - reserved, not writable by programs
        //   0x200 - 0xFFF  : program and data
        //
        static constexpr size_t CHIP8_RAM_SIZE = 4096;
        static constexpr uint16_t CHIP8_FONT_ADDRESS = 0x050;
        static constexpr uint16_t CHIP8_FONT_GLYPH_SIZE = 5;
        static constexpr uint16_t CHIP8_FONT_END = CHIP8_FONT_ADDRESS + 16 * CHIP8_FONT_GLYPH_SIZE;
        static constexpr uint16_t CHIP8_PROGRAM_ADDRESS = 0x200;
        static constexpr size_t CHIP8_MAX_ROM_SIZE = CHIP8_RAM_SIZE - CHIP8_PROGRAM_ADDRESS;
        static constexpr size_t CHIP8_NUM_REGISTERS = 16;
        static constexpr size_t CHIP8_STACK_DEPTH = 16;
        static constexpr size_t CHIP8_NUM_KEYS = 16;
        static constexpr uint8_t CHIP8_FLAG_REGISTER = 0x0f;

        // Every failure the VM can report, all are terminal for the operation that raised them
        enum class CPUFault : uint8_t {
            None = 0,
            RomTooLarge,
            TruncatedSource,
            UnknownOpcode,
            StackOverflow,
            StackUnderflow,
            OutOfBounds,
        };

        const char *FaultToString(CPUFault fault);

        struct Registers {
            std::array<uint8_t, CHIP8_NUM_REGISTERS> v = {};    // V0..VF, VF is the flag register
            uint16_t index = 0;     // I
            uint16_t instrPointer = 0;
            uint8_t stackPointer = 0;   // next free slot in the stack
            uint8_t delayTimer = 0;
            uint8_t soundTimer = 0;
        };

        class CPUBase {
        public:
            using Ref = std::shared_ptr<CPUBase>;
        public:
            CPUBase();
            virtual ~CPUBase() = default;

            // Everything is zero after reset - except the font and the instr. ptr
            virtual void Reset();

            // Copies the ROM to the program area, all or nothing
            // Returns
            //   true - ROM was loaded
            //   false - ROM too large, no memory has been touched
            bool LoadRom(const uint8_t *ptrData, size_t szData);
            bool LoadRom(const std::vector<uint8_t> &romData) {
                return LoadRom(romData.data(), romData.size());
            }

            // Called by the 60Hz timer driver, decrements both timers if non-zero
            void TickTimers();

            bool IsSoundActive() const {
                return registers.soundTimer > 0;
            }

            // Keypad - written by the host between steps
            bool SetKey(uint8_t key, bool isPressed);
            void ReleaseAllKeys();
            bool IsKeyPressed(uint8_t key) const;
            const std::array<bool, CHIP8_NUM_KEYS> &GetKeypad() const {
                return keypad;
            }

            const Registers &GetRegisters() const {
                return registers;
            }
            Registers &GetRegisters() {
                return registers;
            }

            const std::array<uint16_t, CHIP8_STACK_DEPTH> &GetStack() const {
                return stack;
            }

            const Framebuffer &GetFramebuffer() const {
                return framebuffer;
            }
            Framebuffer &GetFramebuffer() {
                return framebuffer;
            }

            const uint8_t *GetRamPtr() const {
                return ram.data();
            }
            size_t GetRamSize() const {
                return ram.size();
            }

            uint16_t GetInstrPtr() const {
                return registers.instrPointer;
            }
            void SetInstrPtr(uint16_t newIp) {
                registers.instrPointer = newIp;
            }
            void AdvanceInstrPtr(uint16_t ipOffset) {
                registers.instrPointer += ipOffset;
            }

            void SetRandomSource(RandomSource::Ref newRandomSource);
            RandomSource &GetRandomSource() {
                return *randomSource;
            }

            // Fault handling, 'RaiseFault' records and logs, always returns false so it can be used as 'return RaiseFault(..)'
            bool RaiseFault(CPUFault fault);
            CPUFault GetLastFault() const {
                return lastFault;
            }
            void ClearFault() {
                lastFault = CPUFault::None;
            }

            // FIXME: Solve this - these are public since the instruction set implementation needs them
        public:
            // Bounds checked memory access, raises 'OutOfBounds' on failure
            bool ReadRam(uint32_t address, uint8_t &outValue);
            bool WriteRam(uint32_t address, uint8_t value);
            // Verify a full range before touching it, writable ranges must not overlap the font
            bool CheckRamRange(uint32_t address, size_t szRange, bool forWrite);

            bool FetchOpCode(uint16_t &outOpCode);

            bool PushReturnAddress(uint16_t address);
            bool PopReturnAddress(uint16_t &outAddress);

            // Used in the fault log line
            uint16_t currentInstrAddr = 0;
            uint16_t currentOpCode = 0;

        protected:
            std::array<uint8_t, CHIP8_RAM_SIZE> ram = {};
            Registers registers = {};
            std::array<uint16_t, CHIP8_STACK_DEPTH> stack = {};
            std::array<bool, CHIP8_NUM_KEYS> keypad = {};
            Framebuffer framebuffer;
            RandomSource::Ref randomSource = nullptr;
            CPUFault lastFault = CPUFault::None;
        };
    }
}

#endif //CHIP8VM_CPUBASE_H
