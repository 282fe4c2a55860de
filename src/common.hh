#ifndef COMMON_HH
#define COMMON_HH

#include <cassert>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <string>

/**
 * Path MTU assumed when nothing else is configured. Frames never exceed it.
 */
#define DEFAULT_MTU 1500

/**
 * Largest UDP payload over IPv4; an MTU above this cannot be honored.
 */
#define MAX_UDP_PAYLOAD 65507

/**
 * A Part frame is one opcode byte followed by a 32-bit part id.
 */
#define PART_HEADER_SIZE 5

/**
 * Sync, Ack and Loss frames are one opcode byte followed by a 32-bit count.
 */
#define ID_LIST_HEADER_SIZE 5

typedef std::lock_guard<std::mutex> Guard;

typedef std::chrono::steady_clock Clock;

// A macro to disallow the copy constructor and operator= functions
#ifndef DISALLOW_COPY_AND_ASSIGN
#define DISALLOW_COPY_AND_ASSIGN(TypeName) \
    TypeName(const TypeName&) = delete;             \
    TypeName& operator=(const TypeName&) = delete;
#endif

/**
 * Cast one size of int down to another one.
 * Asserts that no precision is lost at runtime.
 */
template<typename Small, typename Large>
Small
downCast(const Large& large)
{
    Small small = static_cast<Small>(large);
    // The following comparison (rather than "large==small") allows
    // this method to convert between signed and unsigned values.
    assert(large-small == 0);
    return small;
}

/**
 * Tunables of one transfer. Every component takes a reference to this at
 * construction, so tests can shrink the sizes and intervals freely.
 */
struct Config {
    /// Maximum number of bytes in one frame.
    size_t mtu;

    /// Number of parts read from disk in one bulk read.
    size_t blockParts;

    /// Period of the sender's Sync poll.
    std::chrono::milliseconds syncInterval;

    /// Number of parts the receiver buffers before writing them out.
    size_t writeBatch;

    /// Unacknowledged parts allowed before the transmitter waits for Acks.
    size_t maxInFlight;

    /// Pause between two consecutive Part frames; zero disables pacing.
    std::chrono::microseconds sendGap;

    std::chrono::milliseconds handshakeTimeout;

    uint32_t handshakeRetries;

    /// Silence from the peer after which a transfer is abandoned.
    std::chrono::milliseconds idleTimeout;

    /// How long a finished receiver keeps answering Syncs.
    std::chrono::milliseconds linger;

    uint16_t receiverPort;

    uint16_t senderPort;

    /// No progress bar.
    bool quiet;

    Config()
        : mtu(DEFAULT_MTU)
        , blockParts(2048)
        , syncInterval(200)
        , writeBatch(100)
        , maxInFlight(65536)
        , sendGap(0)
        , handshakeTimeout(500)
        , handshakeRetries(20)
        , idleTimeout(10000)
        , linger(1000)
        , receiverPort(6666)
        , senderPort(6667)
        , quiet(false)
    {}

    /**
     * Maximum number of payload bytes carried by one Part frame.
     */
    size_t partSize() const
    {
        return mtu - PART_HEADER_SIZE;
    }

    /**
     * Number of bytes read from the source file at once. Always a multiple
     * of partSize() so that only the last part of a file can be short.
     */
    size_t blockSize() const
    {
        return blockParts * partSize();
    }

    /**
     * Maximum number of ids that fit in one Sync, Ack or Loss frame.
     */
    size_t maxIdsPerFrame() const
    {
        return (mtu - ID_LIST_HEADER_SIZE) / sizeof(uint32_t);
    }

    /**
     * Throws std::invalid_argument if the combination cannot work.
     */
    void validate() const
    {
        if (mtu < ID_LIST_HEADER_SIZE + 2 * sizeof(uint32_t)
                || mtu > MAX_UDP_PAYLOAD) {
            throw std::invalid_argument("mtu must be between " +
                    std::to_string(ID_LIST_HEADER_SIZE + 2 * sizeof(uint32_t)) +
                    " and " + std::to_string(MAX_UDP_PAYLOAD));
        }
        if (blockParts == 0 || writeBatch == 0 || maxInFlight == 0) {
            throw std::invalid_argument(
                    "block, batch and in-flight sizes must be > 0");
        }
        if (syncInterval.count() <= 0) {
            throw std::invalid_argument("sync interval must be > 0");
        }
    }
};

#endif /* COMMON_HH */
