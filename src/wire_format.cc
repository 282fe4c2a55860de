#include <algorithm>

#include "buffer.hh"
#include "common.hh"
#include "wire_format.hh"

namespace WireFormat {

namespace {

Message
idList(Opcode opcode, const std::vector<uint32_t>& ids)
{
    Message message;
    message.opcode = opcode;
    message.ids = ids;
    return message;
}

void
appendIds(Buffer& buffer, std::vector<uint32_t>::const_iterator begin,
          std::vector<uint32_t>::const_iterator end)
{
    buffer.appendU32(downCast<uint32_t>(end - begin));
    for (auto it = begin; it != end; ++it) {
        buffer.appendU32(*it);
    }
}

void
readIds(BufferReader& reader, std::vector<uint32_t>& ids)
{
    uint32_t count;
    if (!reader.readU32(count)) {
        throw DecodeError("id list without a count");
    }
    // Check the claimed count against the bytes present before allocating.
    if (reader.remaining() / sizeof(uint32_t) < count) {
        throw DecodeError("id list shorter than its count of " +
                          std::to_string(count));
    }
    ids.reserve(count);
    for (uint32_t i = 0; i < count; i++) {
        uint32_t id;
        reader.readU32(id);
        ids.push_back(id);
    }
}

/**
 * Checks for well-formed UTF-8: no overlong forms, no surrogates, nothing
 * past U+10FFFF.
 */
bool
validUtf8(const std::string& text)
{
    size_t i = 0;
    while (i < text.size()) {
        uint8_t lead = static_cast<uint8_t>(text[i]);
        size_t length;
        uint32_t minimum;
        uint32_t codePoint;
        if (lead < 0x80) {
            i++;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            length = 2;
            minimum = 0x80;
            codePoint = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            minimum = 0x800;
            codePoint = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            minimum = 0x10000;
            codePoint = lead & 0x07;
        } else {
            return false;
        }
        if (text.size() - i < length) {
            return false;
        }
        for (size_t k = 1; k < length; k++) {
            uint8_t next = static_cast<uint8_t>(text[i + k]);
            if ((next & 0xC0) != 0x80) {
                return false;
            }
            codePoint = (codePoint << 6) | (next & 0x3F);
        }
        if (codePoint < minimum || codePoint > 0x10FFFF ||
                (codePoint >= 0xD800 && codePoint <= 0xDFFF)) {
            return false;
        }
        i += length;
    }
    return true;
}

}

const char*
opcodeName(Opcode opcode)
{
    switch (opcode) {
        case SEND:
            return "SEND";
        case ACCEPT:
            return "ACCEPT";
        case PART:
            return "PART";
        case SYNC:
            return "SYNC";
        case ACK:
            return "ACK";
        case LOSS:
            return "LOSS";
    }
    return "UNKNOWN";
}

Message
Message::send(const std::string& fileName, uint32_t parts)
{
    Message message;
    message.opcode = SEND;
    message.fileName = fileName;
    message.parts = parts;
    return message;
}

Message
Message::accept()
{
    return Message();
}

Message
Message::part(uint32_t id, const std::string& data)
{
    Message message;
    message.opcode = PART;
    message.id = id;
    message.data = data;
    return message;
}

Message
Message::sync(const std::vector<uint32_t>& ids)
{
    return idList(SYNC, ids);
}

Message
Message::ack(const std::vector<uint32_t>& ids)
{
    return idList(ACK, ids);
}

Message
Message::loss(const std::vector<uint32_t>& ids)
{
    return idList(LOSS, ids);
}

bool
Message::operator==(const Message& other) const
{
    return opcode == other.opcode
        && fileName == other.fileName
        && parts == other.parts
        && id == other.id
        && data == other.data
        && ids == other.ids;
}

std::string
encode(const Message& message)
{
    Buffer buffer;
    buffer.appendByte(message.opcode);

    switch (message.opcode) {
        case SEND:
            buffer.appendU32(message.parts);
            buffer.appendU32(downCast<uint32_t>(message.fileName.size()));
            buffer.appendBytes(message.fileName.data(),
                               message.fileName.size());
            break;
        case ACCEPT:
            break;
        case PART:
            buffer.appendU32(message.id);
            buffer.appendBytes(message.data.data(), message.data.size());
            break;
        case SYNC:
        case ACK:
        case LOSS:
            appendIds(buffer, message.ids.begin(), message.ids.end());
            break;
    }

    return buffer.release();
}

Message
decode(const char* datagram, size_t length)
{
    BufferReader reader(datagram, length);
    uint8_t opcode;
    if (!reader.readByte(opcode)) {
        throw DecodeError("empty datagram");
    }

    Message message;
    switch (opcode) {
        case SEND: {
            uint32_t nameLength;
            if (!reader.readU32(message.parts) || !reader.readU32(nameLength)) {
                throw DecodeError("truncated SEND header");
            }
            if (!reader.readBytes(nameLength, message.fileName)) {
                throw DecodeError("SEND file name shorter than " +
                                  std::to_string(nameLength) + " bytes");
            }
            if (!validUtf8(message.fileName)) {
                throw DecodeError("SEND file name is not UTF-8");
            }
            break;
        }
        case ACCEPT:
            break;
        case PART:
            if (!reader.readU32(message.id)) {
                throw DecodeError("truncated PART header");
            }
            message.data = reader.readRest();
            break;
        case SYNC:
        case ACK:
        case LOSS:
            readIds(reader, message.ids);
            break;
        default:
            throw DecodeError("unknown opcode " + std::to_string(opcode));
    }

    if (reader.remaining() != 0) {
        throw DecodeError(std::to_string(reader.remaining()) +
                          " trailing bytes after " +
                          opcodeName(static_cast<Opcode>(opcode)));
    }
    message.opcode = static_cast<Opcode>(opcode);
    return message;
}

std::string
encodePart(uint32_t id, const char* data, size_t length, size_t partSize)
{
    if (length > partSize) {
        throw DoesNotFit("chunk of " + std::to_string(length) +
                         " bytes exceeds part size " +
                         std::to_string(partSize));
    }

    Buffer buffer(PART_HEADER_SIZE + length);
    buffer.appendByte(PART);
    buffer.appendU32(id);
    buffer.appendBytes(data, length);
    return buffer.release();
}

std::vector<std::string>
encodeIdLists(Opcode opcode, const std::vector<uint32_t>& ids,
              size_t maxIdsPerFrame)
{
    assert(maxIdsPerFrame > 0);
    std::vector<std::string> frames;
    auto begin = ids.begin();
    do {
        size_t left = static_cast<size_t>(ids.end() - begin);
        auto end = begin + std::min(left, maxIdsPerFrame);
        Buffer buffer(ID_LIST_HEADER_SIZE + (end - begin) * sizeof(uint32_t));
        buffer.appendByte(opcode);
        appendIds(buffer, begin, end);
        frames.push_back(buffer.release());
        begin = end;
    } while (begin != ids.end());
    return frames;
}

}
