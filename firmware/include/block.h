#pragma once
// =====================================================
// Block
// =====================================================
// One ordered pick sequence. steps[currentIndex] is the
// pin the picker must touch next; the block is complete
// when currentIndex == length.
//
// Noise handling per detection:
//   - same pin again within perLedCooldown    -> dropped
//   - expected pin within blockCooldown of the
//     previous advance                         -> dropped
//   - neighbours (pin-1, pin+1) of a confirmed
//     pin are ignored for suppressionWindow
// =====================================================

#include <stdint.h>
#include <stddef.h>
#include "i_pin_renderer.h"

constexpr size_t BLOCK_MAX_STEPS = 64;
constexpr size_t BLOCK_MAX_TRACKED = 48;
constexpr int32_t SHELF_NONE = -1;

struct BlockStep {
    int32_t pin;       // adjusted pin
    int32_t shelfId;   // SHELF_NONE for legacy pin lists
};

struct BlockTiming {
    uint32_t blockCooldownMs;
    uint32_t perLedCooldownMs;
    uint32_t suppressionWindowMs;
};

enum class BlockDetection : uint8_t {
    PinCooldown,      // same pin seen again too soon
    BlockCooldown,    // expected pin, but too soon after last advance
    Advanced,         // next pin is now lit
    Completed,        // last pin confirmed
    Suppressed,       // neighbour of a confirmed pin
    Incorrect,        // handed to incorrect-detection handling
    AlreadyComplete,
};

class Block;

// Side effects of a block transition, implemented by the engine
class IBlockHost : public IPinRenderer {
public:
    virtual void announceActivePin(int32_t pin) = 0;

    // Stop an incorrect-detection blink for pin, if one runs
    virtual void cancelIncorrectDetection(int32_t pin) = 0;

    // Queue pin for incorrect-detection handling once the
    // current transition has finished
    virtual void deferIncorrectDetection(int32_t pin) = 0;

    virtual void onBlockComplete(const Block& block) = 0;
};

class Block {
public:
    Block();

    // Reset and take a new sequence. False if count is 0 or too long.
    bool load(const BlockStep* steps, size_t count, const BlockTiming& timing);

    // Render the initial state and announce the first pin
    void begin(IBlockHost& host);

    BlockDetection handleDetection(int32_t pin, uint32_t nowMs, IBlockHost& host);

    void clear();

    bool isComplete() const { return _index >= _count; }
    bool contains(int32_t pin) const;

    // PIN_NONE when complete
    int32_t expectedPin() const;

    // True while pin is an ignored neighbour inside the suppression window
    bool isSuppressed(int32_t pin, uint32_t nowMs) const;

    size_t currentIndex() const { return _index; }
    size_t length() const { return _count; }
    const BlockStep& step(size_t i) const { return _steps[i]; }
    const BlockTiming& timing() const { return _timing; }

    uint8_t greenCount(int32_t pin) const;
    size_t trackedCount() const { return _trackedCount; }

private:
    struct Tracked {
        int32_t pin;
        uint32_t stampMs;
        bool ignored;
    };

    int findStep(int32_t pin) const;
    int findTracked(int32_t pin) const;
    void stamp(int32_t pin, uint32_t nowMs, bool ignored);
    void sweep(uint32_t nowMs);

    BlockStep _steps[BLOCK_MAX_STEPS];
    uint8_t _greenCounts[BLOCK_MAX_STEPS];   // indexed by first step holding the pin
    size_t _count;
    size_t _index;

    Tracked _tracked[BLOCK_MAX_TRACKED];
    size_t _trackedCount;

    BlockTiming _timing;
    bool _hasAdvanced;
    uint32_t _lastCorrectMs;
};
