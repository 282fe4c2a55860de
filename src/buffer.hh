#ifndef BUFFER_HH
#define BUFFER_HH

#include <arpa/inet.h>
#include <cstdint>
#include <cstring>
#include <string>

/**
 * Growable byte buffer used to lay out a frame. Multi-byte integers are
 * appended in network (big-endian) order.
 */
class Buffer
{
public:
    Buffer() : bytes()
    {}

    explicit Buffer(size_t capacity)
        : bytes()
    {
        bytes.reserve(capacity);
    }

    void appendByte(uint8_t value)
    {
        bytes.push_back(static_cast<char>(value));
    }

    void appendU32(uint32_t value)
    {
        uint32_t wire = htonl(value);
        bytes.append(reinterpret_cast<const char*>(&wire), sizeof(wire));
    }

    void appendBytes(const char* data, size_t length)
    {
        bytes.append(data, length);
    }

    size_t size() const
    {
        return bytes.size();
    }

    /**
     * Hands the accumulated bytes to the caller and leaves the buffer empty.
     */
    std::string release()
    {
        std::string out;
        out.swap(bytes);
        return out;
    }

private:

    std::string bytes;

};

/**
 * Bounds-checked cursor over a received frame. Every read returns false
 * instead of touching memory past the end of the slice.
 */
class BufferReader
{
public:
    BufferReader(const char* data, size_t length)
        : data(data)
        , length(length)
        , offset(0)
    {}

    bool readByte(uint8_t& value)
    {
        if (remaining() < 1) {
            return false;
        }
        value = static_cast<uint8_t>(data[offset]);
        offset += 1;
        return true;
    }

    bool readU32(uint32_t& value)
    {
        uint32_t wire;
        if (remaining() < sizeof(wire)) {
            return false;
        }
        std::memcpy(&wire, data + offset, sizeof(wire));
        offset += sizeof(wire);
        value = ntohl(wire);
        return true;
    }

    bool readBytes(size_t count, std::string& out)
    {
        if (remaining() < count) {
            return false;
        }
        out.assign(data + offset, count);
        offset += count;
        return true;
    }

    /**
     * Copies everything not consumed yet.
     */
    std::string readRest()
    {
        std::string out(data + offset, remaining());
        offset = length;
        return out;
    }

    size_t remaining() const
    {
        return length - offset;
    }

private:

    const char* data;

    size_t length;

    size_t offset;

};

#endif /* BUFFER_HH */
