#ifndef NFTMART_HOST_HPP
#define NFTMART_HOST_HPP

#include <chrono>

#include "types.hpp"
#include "ledger.hpp"

namespace nftmart {

// =============================================================================
// Time & Block Metadata Sources
// =============================================================================

class IClock {
public:
    virtual ~IClock() = default;

    // Non-decreasing wall-clock time in seconds
    virtual Timestamp now() const = 0;
};

class IBlockInfo {
public:
    virtual ~IBlockInfo() = default;

    // Non-decreasing block counter
    virtual uint64_t current_height() const = 0;
};

class SystemClock : public IClock {
public:
    Timestamp now() const override {
        return static_cast<Timestamp>(
            std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::system_clock::now().time_since_epoch()
            ).count()
        );
    }
};

// Test/demo clock driven by hand; also serves block heights
class ManualClock : public IClock, public IBlockInfo {
public:
    explicit ManualClock(Timestamp start = 0, uint64_t height = 0)
        : now_(start), height_(height) {}

    Timestamp now() const override { return now_; }
    uint64_t current_height() const override { return height_; }

    void set(Timestamp t) { if (t > now_) now_ = t; }
    void advance(Timestamp seconds) { now_ += seconds; }
    void next_block(uint64_t blocks = 1) { height_ += blocks; }

private:
    Timestamp now_;
    uint64_t height_;
};

// =============================================================================
// Host - collaborator services a mechanism operates against
// =============================================================================

struct Host {
    ICoinStore& coins;
    ITokenStore& tokens;
    const IClock& clock;
    const IBlockInfo& blocks;
};

} // namespace nftmart

#endif // NFTMART_HOST_HPP
