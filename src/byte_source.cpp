/**
 * @file byte_source.cpp
 * @brief StreamSource implementation.
 */

#include <flowtuple/byte_source.hpp>

#include <exception>
#include <istream>

namespace flowtuple {

Error StreamSource::read(std::uint8_t* dst, std::size_t len, std::size_t& got) noexcept {
    got = 0;
    if (len == 0) {
        return Error::Ok;
    }

    try {
        in_.read(reinterpret_cast<char*>(dst), static_cast<std::streamsize>(len));
        got = static_cast<std::size_t>(in_.gcount());
    } catch (const std::exception&) {
        // Streams with exceptions() enabled report EOF and errors by throwing
        // std::ios_base::failure; its ABI variant differs across libstdc++ builds
        got = static_cast<std::size_t>(in_.gcount());
        return in_.bad() ? Error::Io : Error::Ok;
    }

    if (in_.bad()) {
        return Error::Io;
    }
    return Error::Ok;
}

} // namespace flowtuple
