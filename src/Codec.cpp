/*
 * PicoOSC - Open Sound Control over UDP.
 * OSC 1.0 wire format: padded strings, big-endian numbers, size-prefixed
 * bundle elements.
 */

#include "picoosc/Codec.h"

#include <arpa/inet.h>  // For htonl, ntohl

#include <cstring>
#include <string>

#include "picoosc/Exceptions.h"
#include "picoosc/Logging.h"

namespace picoosc {
    namespace codec {
        namespace {
            // Helper function to pad to 4-byte boundary
            inline size_t padSize(size_t size) { return (size + 3) & ~static_cast<size_t>(3); }

            bool isAscii(const std::string &str) {
                for (char c : str) {
                    if (static_cast<unsigned char>(c) >= 0x80) {
                        return false;
                    }
                }
                return true;
            }

            void appendUInt32(std::vector<std::byte> &buffer, uint32_t value) {
                uint32_t be = htonl(value);
                const std::byte *bytes = reinterpret_cast<const std::byte *>(&be);
                buffer.insert(buffer.end(), bytes, bytes + sizeof(be));
            }

            void appendPadding(std::vector<std::byte> &buffer) {
                buffer.resize(padSize(buffer.size()), std::byte{0});
            }

            // OSC-string: bytes, null terminator, null padding to 4
            void appendString(std::vector<std::byte> &buffer, const std::string &str,
                              const char *what) {
                if (str.find('\0') != std::string::npos) {
                    throw EncodeError(std::string(what) + " contains an embedded null character");
                }
                const std::byte *bytes = reinterpret_cast<const std::byte *>(str.data());
                buffer.insert(buffer.end(), bytes, bytes + str.size());
                buffer.push_back(std::byte{0});
                appendPadding(buffer);
            }

            void appendTypeTags(std::string &tags, const std::vector<Value> &arguments) {
                for (const auto &arg : arguments) {
                    if (arg.isArray()) {
                        tags += Value::ARRAY_BEGIN_TAG;
                        appendTypeTags(tags, arg.asArray());
                        tags += Value::ARRAY_END_TAG;
                    } else {
                        tags += arg.typeTag();
                    }
                }
            }

            void appendArguments(std::vector<std::byte> &buffer, const std::vector<Value> &arguments) {
                for (const auto &arg : arguments) {
                    switch (arg.typeTag()) {
                        case Value::INT32_TAG:
                            appendUInt32(buffer, static_cast<uint32_t>(arg.asInt32()));
                            break;
                        case Value::FLOAT_TAG: {
                            float value = arg.asFloat();
                            uint32_t bits;
                            std::memcpy(&bits, &value, sizeof(bits));
                            appendUInt32(buffer, bits);
                            break;
                        }
                        case Value::STRING_TAG:
                            appendString(buffer, arg.asString(), "String argument");
                            break;
                        case Value::BLOB_TAG: {
                            const Blob &blob = arg.asBlob();
                            if (blob.size() > kMaxPacketSize) {
                                throw EncodeError("Blob of " + std::to_string(blob.size()) +
                                                  " bytes cannot fit in a datagram");
                            }
                            appendUInt32(buffer, static_cast<uint32_t>(blob.size()));
                            buffer.insert(buffer.end(), blob.bytes(), blob.bytes() + blob.size());
                            appendPadding(buffer);
                            break;
                        }
                        case Value::ARRAY_BEGIN_TAG:
                            appendArguments(buffer, arg.asArray());
                            break;
                        default:
                            // T, F and N carry no payload
                            break;
                    }
                }
            }

            void encodeMessageInto(std::vector<std::byte> &buffer, const Message &message) {
                const std::string &address = message.getAddress();
                if (address.empty() || address[0] != '/' || !isAscii(address)) {
                    throw EncodeError("Invalid OSC address '" + address + "'");
                }

                // 1. Address pattern
                appendString(buffer, address, "Address");

                // 2. Type tag string
                std::string tags(1, ',');
                appendTypeTags(tags, message.getArguments());
                appendString(buffer, tags, "Type tag string");

                // 3. Argument data
                appendArguments(buffer, message.getArguments());
            }

            void encodeBundleInto(std::vector<std::byte> &buffer, const Bundle &bundle) {
                const std::byte *marker = reinterpret_cast<const std::byte *>(kBundleTag);
                buffer.insert(buffer.end(), marker, marker + sizeof(kBundleTag));

                TimeTag timeTag = bundle.getTimeTag();
                appendUInt32(buffer, timeTag.seconds());
                appendUInt32(buffer, timeTag.fraction());

                for (const auto &element : bundle.elements()) {
                    // Reserve the size field and fill it in once the element is written
                    size_t sizeOffset = buffer.size();
                    appendUInt32(buffer, 0);

                    if (const auto *message = std::get_if<Message>(&element)) {
                        encodeMessageInto(buffer, *message);
                    } else {
                        encodeBundleInto(buffer, std::get<Bundle>(element));
                    }

                    uint32_t elementSize = htonl(static_cast<uint32_t>(buffer.size() - sizeOffset - 4));
                    std::memcpy(buffer.data() + sizeOffset, &elementSize, sizeof(elementSize));
                }
            }

            void checkSize(const std::vector<std::byte> &buffer) {
                if (buffer.size() > kMaxPacketSize) {
                    throw EncodeError("Encoded packet of " + std::to_string(buffer.size()) +
                                      " bytes exceeds maximum of " + std::to_string(kMaxPacketSize));
                }
            }

            /**
             * Sequential reader over a received buffer. Every read checks the
             * remaining length and throws DecodeError on truncation.
             */
            class Reader {
               public:
                Reader(const std::byte *data, size_t size) : data_(data), size_(size), pos_(0) {}

                size_t position() const { return pos_; }
                size_t remaining() const { return size_ - pos_; }
                bool atEnd() const { return pos_ >= size_; }
                char peek() const { return static_cast<char>(data_[pos_]); }

                void skip(size_t count) { pos_ += count; }

                uint32_t readUInt32(const char *what) {
                    if (remaining() < 4) {
                        throw DecodeError(std::string("Packet truncated while reading ") + what);
                    }
                    uint32_t be;
                    std::memcpy(&be, data_ + pos_, sizeof(be));
                    pos_ += 4;
                    return ntohl(be);
                }

                int32_t readInt32(const char *what) {
                    return static_cast<int32_t>(readUInt32(what));
                }

                float readFloat() {
                    uint32_t bits = readUInt32("float argument");
                    float value;
                    std::memcpy(&value, &bits, sizeof(value));
                    return value;
                }

                std::string readString(const char *what) {
                    const char *start = reinterpret_cast<const char *>(data_ + pos_);
                    const void *terminator = std::memchr(start, '\0', remaining());
                    if (!terminator) {
                        throw DecodeError(std::string("Unterminated ") + what);
                    }

                    size_t length = static_cast<const char *>(terminator) - start;
                    size_t padded = padSize(length + 1);
                    if (padded > remaining()) {
                        throw DecodeError(std::string("Packet truncated in padding of ") + what);
                    }

                    std::string value(start, length);
                    checkPadding(pos_ + length + 1, pos_ + padded);
                    pos_ += padded;
                    return value;
                }

                Blob readBlob() {
                    int32_t length = readInt32("blob size");
                    if (length < 0) {
                        throw DecodeError("Negative blob size");
                    }
                    size_t padded = padSize(static_cast<size_t>(length));
                    if (padded > remaining()) {
                        throw DecodeError("Packet truncated inside blob of " + std::to_string(length) +
                                          " bytes");
                    }

                    Blob blob(data_ + pos_, static_cast<size_t>(length));
                    checkPadding(pos_ + static_cast<size_t>(length), pos_ + padded);
                    pos_ += padded;
                    return blob;
                }

               private:
                // Non-null padding is tolerated; record it for debugging
                void checkPadding(size_t begin, size_t end) const {
                    for (size_t i = begin; i < end; ++i) {
                        if (data_[i] != std::byte{0}) {
                            PICOOSC_LOG_DEBUG("Ignoring non-null padding byte at offset %zu", i);
                            return;
                        }
                    }
                }

                const std::byte *data_;
                size_t size_;
                size_t pos_;
            };

            Message decodeMessage(const std::byte *data, size_t size) {
                if (size == 0) {
                    throw DecodeError("Empty packet");
                }
                if (static_cast<char>(data[0]) != '/') {
                    throw DecodeError("Invalid OSC address pattern (must start with '/')");
                }

                Reader reader(data, size);

                // 1. Address pattern
                std::string address = reader.readString("address pattern");
                if (!isAscii(address)) {
                    throw DecodeError("OSC address pattern contains non-ASCII characters");
                }
                Message message(address);

                // Very old senders omit the type tag string entirely
                if (reader.atEnd()) {
                    return message;
                }

                // 2. Type tag string
                if (reader.peek() != ',') {
                    throw DecodeError("Type tag string must start with ','");
                }
                std::string tags = reader.readString("type tag string");

                // 3. Arguments, with a stack of open arrays
                std::vector<std::vector<Value>> stack(1);
                for (size_t i = 1; i < tags.size(); ++i) {
                    char tag = tags[i];
                    switch (tag) {
                        case Value::INT32_TAG:
                            stack.back().emplace_back(reader.readInt32("int32 argument"));
                            break;
                        case Value::FLOAT_TAG:
                            stack.back().emplace_back(reader.readFloat());
                            break;
                        case Value::STRING_TAG:
                            stack.back().emplace_back(reader.readString("string argument"));
                            break;
                        case Value::BLOB_TAG:
                            stack.back().emplace_back(reader.readBlob());
                            break;
                        case Value::TRUE_TAG:
                            stack.back().emplace_back(true);
                            break;
                        case Value::FALSE_TAG:
                            stack.back().emplace_back(false);
                            break;
                        case Value::NIL_TAG:
                            stack.back().push_back(Value::nil());
                            break;
                        case Value::ARRAY_BEGIN_TAG:
                            stack.emplace_back();
                            break;
                        case Value::ARRAY_END_TAG: {
                            if (stack.size() < 2) {
                                throw DecodeError("Unbalanced ']' in type tag string");
                            }
                            Value::Array array = std::move(stack.back());
                            stack.pop_back();
                            stack.back().emplace_back(std::move(array));
                            break;
                        }
                        default:
                            throw DecodeError(std::string("Unknown type tag '") + tag + "'");
                    }
                }

                if (stack.size() != 1) {
                    throw DecodeError("Unterminated '[' in type tag string");
                }

                if (!reader.atEnd()) {
                    PICOOSC_LOG_DEBUG("Ignoring %zu trailing bytes after message %s",
                                      reader.remaining(), message.getAddress().c_str());
                }

                for (auto &arg : stack.back()) {
                    message.addValue(arg);
                }
                return message;
            }

            Bundle decodeBundle(const std::byte *data, size_t size) {
                if (size < 16) {
                    throw DecodeError("Bundle data too small: " + std::to_string(size) +
                                      " bytes (minimum required: 16 bytes)");
                }

                Reader reader(data, size);
                reader.readString("bundle marker");

                uint32_t seconds = reader.readUInt32("time tag");
                uint32_t fraction = reader.readUInt32("time tag");
                Bundle bundle(TimeTag(seconds, fraction));

                while (!reader.atEnd()) {
                    int32_t elementSize = reader.readInt32("bundle element size");
                    if (elementSize <= 0) {
                        throw DecodeError("Invalid bundle element size " + std::to_string(elementSize));
                    }
                    if (elementSize % 4 != 0) {
                        throw DecodeError("Bundle element size " + std::to_string(elementSize) +
                                          " is not a multiple of 4");
                    }
                    if (static_cast<size_t>(elementSize) > reader.remaining()) {
                        throw DecodeError("Bundle element of " + std::to_string(elementSize) +
                                          " bytes exceeds remaining data");
                    }

                    const std::byte *element = data + reader.position();
                    size_t length = static_cast<size_t>(elementSize);
                    try {
                        if (isBundle(element, length)) {
                            bundle.addBundle(decodeBundle(element, length));
                        } else {
                            bundle.addMessage(decodeMessage(element, length));
                        }
                    } catch (const DecodeError &e) {
                        throw DecodeError("Error in bundle element at offset " +
                                          std::to_string(reader.position()) + ": " + e.what());
                    }

                    reader.skip(length);
                }

                return bundle;
            }
        }  // namespace

        std::vector<std::byte> encode(const Message &message) {
            std::vector<std::byte> buffer;
            buffer.reserve(64);
            encodeMessageInto(buffer, message);
            checkSize(buffer);
            return buffer;
        }

        std::vector<std::byte> encode(const Bundle &bundle) {
            std::vector<std::byte> buffer;
            buffer.reserve(256);
            encodeBundleInto(buffer, bundle);
            checkSize(buffer);
            return buffer;
        }

        std::vector<std::byte> encode(const Packet &packet) {
            if (const auto *message = std::get_if<Message>(&packet)) {
                return encode(*message);
            }
            return encode(std::get<Bundle>(packet));
        }

        bool isBundle(const std::byte *data, size_t size) {
            return data && size >= sizeof(kBundleTag) &&
                   std::memcmp(data, kBundleTag, sizeof(kBundleTag)) == 0;
        }

        Packet decode(const std::byte *data, size_t size) {
            if (!data || size == 0) {
                throw DecodeError("Empty packet");
            }
            if (isBundle(data, size)) {
                return decodeBundle(data, size);
            }
            return decodeMessage(data, size);
        }

        Packet decode(const std::vector<std::byte> &data) { return decode(data.data(), data.size()); }

    }  // namespace codec
}  // namespace picoosc
