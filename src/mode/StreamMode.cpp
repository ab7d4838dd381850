#include "mode/StreamMode.hpp"
#include "utils/errors.hpp"

#include <exception>
#include <ios>
#include <string>

std::vector<uint8_t> StreamMode::encrypt(const std::vector<uint8_t>& data, const Cipher& cipher) const
{
    std::vector<uint8_t> out(data.size());
    KeySchedule ks;
    cipher.encryptChars(data.data(), out.data(), out.size(), ks);
    return out;
}

std::vector<uint8_t> StreamMode::decrypt(const std::vector<uint8_t>& data, const Cipher& cipher) const
{
    std::vector<uint8_t> out(data.size());
    KeySchedule ks;
    cipher.decryptChars(data.data(), out.data(), out.size(), ks);
    return out;
}

std::size_t StreamMode::encryptStream(std::istream& reader, std::ostream& writer, const Cipher& cipher) const
{
    return run(reader, writer, cipher, Direction::Encrypt);
}

std::size_t StreamMode::decryptStream(std::istream& reader, std::ostream& writer, const Cipher& cipher) const
{
    return run(reader, writer, cipher, Direction::Decrypt);
}

std::size_t StreamMode::run(std::istream& reader, std::ostream& writer, const Cipher& cipher, Direction dir) const
{
    KeySchedule ks;

    try {
        for (;;) {
            std::istream::int_type ch = readChar(reader, ks.position);
            if (ch == std::istream::traits_type::eof())
                break;

            uint8_t c = static_cast<uint8_t>(ch);
            if (dir == Direction::Encrypt)
                cipher.encryptChars(&c, &c, 1, ks);
            else
                cipher.decryptChars(&c, &c, 1, ks);

            writer.put(static_cast<char>(c));
            if (!writer)
                throw StreamIOError("Write failed after " + std::to_string(ks.position - 1) + " characters");
        }
        writer.flush();
        if (!writer)
            throw StreamIOError("Flush failed after " + std::to_string(ks.position) + " characters");
    }
    catch (const std::ios_base::failure& e) {
        // writers configured with exceptions() report through here
        throw StreamIOError(std::string("Stream failure: ") + e.what());
    }

    return ks.position;
}

std::istream::int_type StreamMode::readChar(std::istream& reader, std::size_t position)
{
    std::istream::int_type ch;
    try {
        ch = reader.get();
    }
    catch (const std::ios_base::failure& e) {
        // a reader with failbit in exceptions() throws at a clean end of input too
        if (reader.eof() && !reader.bad())
            return std::istream::traits_type::eof();
        throw StreamIOError("Read failed after " + std::to_string(position) + " characters: " + e.what());
    }
    catch (const std::exception& e) {
        // with badbit in exceptions() the stream buffer's own error is rethrown
        throw StreamIOError("Read failed after " + std::to_string(position) + " characters: " + e.what());
    }

    if (ch == std::istream::traits_type::eof() && reader.bad())
        throw StreamIOError("Read failed after " + std::to_string(position) + " characters");
    return ch;
}
