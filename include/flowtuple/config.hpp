/**
 * @file config.hpp
 * @brief Flowtuple compile-time configuration.
 *
 * Wire constants for the corsaro flowtuple format: structural magic
 * numbers and fixed field sizes.
 *
 * @see http://www.caida.org/tools/measurement/corsaro/docs/formats.html
 */

#ifndef FLOWTUPLE_CONFIG_HPP
#define FLOWTUPLE_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace flowtuple {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup magic Structural Magic Numbers
 * @{
 */

/// Outer magic "EDGR", opens every interval header and interval trailer.
inline constexpr std::uint32_t OUTER_MAGIC = 0x45444752U;

/// Interval magic "INTR", follows the outer magic at both interval ends.
inline constexpr std::uint32_t INTERVAL_MAGIC = 0x494E5452U;

/// Flowtuple class magic "SIXT", opens and closes every class.
inline constexpr std::uint32_t CLASS_MAGIC = 0x53495854U;

/// Zero word at the top level marks the end of the file.
inline constexpr std::uint32_t END_OF_STREAM_MAGIC = 0x00000000U;

/** @} */

/**
 * @defgroup wire Wire Sizes (bytes)
 * @{
 */
inline constexpr std::size_t MAGIC_SIZE = 4U;
inline constexpr std::size_t INTERVAL_NUMBER_SIZE = 2U;
inline constexpr std::size_t TIME_SIZE = 4U;
inline constexpr std::size_t CLASS_ID_SIZE = 2U;
inline constexpr std::size_t KEY_COUNT_SIZE = 4U;

/// Destination address occupies only the low 3 octets on the wire.
inline constexpr std::size_t DST_IP_WIRE_SIZE = 3U;

/// 4 + 3 + 2 + 2 + 1 + 1 + 1 + 2 + 4
inline constexpr std::size_t RECORD_SIZE = 20U;

inline constexpr std::size_t INTERVAL_HEADER_SIZE =
    MAGIC_SIZE + MAGIC_SIZE + INTERVAL_NUMBER_SIZE + TIME_SIZE;
inline constexpr std::size_t INTERVAL_TAIL_SIZE = MAGIC_SIZE + INTERVAL_NUMBER_SIZE + TIME_SIZE;
inline constexpr std::size_t CLASS_HEADER_SIZE = MAGIC_SIZE + CLASS_ID_SIZE + KEY_COUNT_SIZE;
inline constexpr std::size_t CLASS_TAIL_SIZE = MAGIC_SIZE + CLASS_ID_SIZE;
/** @} */

/**
 * @defgroup exceptions Exception Configuration
 *
 * Define FLOWTUPLE_NO_EXCEPTIONS=1 to build without the exception types.
 * @{
 */
#ifndef FLOWTUPLE_NO_EXCEPTIONS
#define FLOWTUPLE_NO_EXCEPTIONS 0
#endif
/** @} */

} // namespace flowtuple

#endif // FLOWTUPLE_CONFIG_HPP
