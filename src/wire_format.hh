#ifndef WIREFORMAT_HH
#define WIREFORMAT_HH

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace WireFormat {

/**
 * First byte of every frame.
 */
enum Opcode : uint8_t {
    SEND                = 0,
    ACCEPT              = 1,
    PART                = 2,
    SYNC                = 3,
    ACK                 = 4,
    LOSS                = 5,
};

const char* opcodeName(Opcode opcode);

/**
 * Thrown by decode() for a frame that is truncated, has trailing garbage
 * or starts with an unknown opcode.
 */
class DecodeError : public std::runtime_error {
  public:
    explicit DecodeError(const std::string& what)
        : std::runtime_error("malformed frame: " + what)
    {}
};

/**
 * Thrown when a chunk larger than the part size is framed. The chunker
 * never produces one, so this indicates a bug rather than bad input.
 */
class DoesNotFit : public std::logic_error {
  public:
    explicit DoesNotFit(const std::string& what)
        : std::logic_error(what)
    {}
};

/**
 * One decoded frame. Only the fields of the active opcode are meaningful:
 *   SEND         fileName, parts
 *   ACCEPT       (none)
 *   PART         id, data
 *   SYNC/ACK/LOSS ids
 */
struct Message {
    Opcode opcode;
    std::string fileName;
    uint32_t parts;
    uint32_t id;
    std::string data;
    std::vector<uint32_t> ids;

    Message()
        : opcode(ACCEPT)
        , fileName()
        , parts(0)
        , id(0)
        , data()
        , ids()
    {}

    static Message send(const std::string& fileName, uint32_t parts);
    static Message accept();
    static Message part(uint32_t id, const std::string& data);
    static Message sync(const std::vector<uint32_t>& ids);
    static Message ack(const std::vector<uint32_t>& ids);
    static Message loss(const std::vector<uint32_t>& ids);

    bool operator==(const Message& other) const;
    bool operator!=(const Message& other) const { return !(*this == other); }
};

/**
 * Serializes a message. Never fails; callers keep id lists and names
 * within the MTU (see encodeIdLists).
 */
std::string encode(const Message& message);

/**
 * Parses one datagram. Never reads outside [datagram, datagram + length).
 *
 * \throw DecodeError
 *      The datagram is not a well-formed frame.
 */
Message decode(const char* datagram, size_t length);

inline Message
decode(const std::string& datagram)
{
    return decode(datagram.data(), datagram.size());
}

/**
 * Frames one file chunk directly, without building a Message first.
 *
 * \param partSize
 *      Largest chunk allowed in a single frame.
 * \throw DoesNotFit
 *      length exceeds partSize.
 */
std::string encodePart(uint32_t id, const char* data, size_t length,
                       size_t partSize);

/**
 * Frames an id list as as many SYNC, ACK or LOSS frames as needed to keep
 * each one within maxIdsPerFrame ids. An empty list yields one empty frame.
 */
std::vector<std::string> encodeIdLists(Opcode opcode,
                                       const std::vector<uint32_t>& ids,
                                       size_t maxIdsPerFrame);

}

#endif /* WIREFORMAT_HH */
