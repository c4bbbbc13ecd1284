/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the PNG chunk codec
 * @author Igor
 * @date 02/09/2025
 *
 * This file defines the error kinds reported by the codec, the exceptions
 * that carry them and convenience macros for raising them.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <sstream>
#include <ostream>

namespace pngchunk {

    /**
     * @enum error_kind
     * @brief Reason a codec operation rejected its input
     */
    enum class error_kind {
        header, ///< Signature bytes do not match the PNG signature
        length, ///< Declared length does not match the available bytes
        type,   ///< A chunk type byte is not an ASCII letter
        data,   ///< Payload requested as text is not valid UTF-8
        crc     ///< Stored checksum differs from the recomputed one
    };

    /**
     * @brief Stable human readable name of an error kind
     * @param kind Error kind
     * @return "Invalid Header", "Invalid Length", ...
     */
    inline const char* to_string(error_kind kind) {
        switch (kind) {
            case error_kind::header:
                return "Invalid Header";
            case error_kind::length:
                return "Invalid Length";
            case error_kind::type:
                return "Invalid Type";
            case error_kind::data:
                return "Invalid Data";
            case error_kind::crc:
                return "Invalid Crc";
        }
        // make compiler happy
        return "Invalid";
    }

    inline std::ostream& operator<<(std::ostream& os, error_kind kind) {
        return os << to_string(kind);
    }

    /**
     * @class pngchunk_error
     * @brief Base exception class for all library errors
     *
     * Catching this type catches both codec and I/O failures.
     */
    class pngchunk_error : public std::runtime_error {
    public:
        explicit pngchunk_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @class codec_error
     * @brief Validation failure while decoding or constructing chunk data
     *
     * The reason is carried as an error_kind tag rather than as a
     * separate exception type, so callers switch on kind().
     */
    class codec_error : public pngchunk_error {
    public:
        codec_error(error_kind kind, const std::string& msg)
            : pngchunk_error(std::string(to_string(kind)) + ": " + msg),
              m_kind(kind) {}

        [[nodiscard]] error_kind kind() const noexcept { return m_kind; }

    private:
        error_kind m_kind;
    };

    /**
     * @class io_error
     * @brief Exception for file access failures
     *
     * Only raised by the file helpers in file_io.hh; the codec itself
     * works on memory buffers and never performs I/O.
     */
    class io_error : public pngchunk_error {
    public:
        explicit io_error(const std::string& msg)
            : pngchunk_error(msg) {}
    };

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    /**
     * @def THROW_CODEC
     * @brief Throw a codec_error of the given kind with formatted message
     * @param kind error_kind enumerator name (header, length, type, data, crc)
     * @param ... Variable arguments to format into error message
     */
    #define THROW_CODEC(kind, ...) \
        throw ::pngchunk::codec_error(::pngchunk::error_kind::kind, ::pngchunk::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_CODEC_IF
     * @brief Conditionally throw a codec_error
     */
    #define THROW_CODEC_IF(condition, kind, ...) \
        do { if (condition) THROW_CODEC(kind, __VA_ARGS__); } while(0)

    /**
     * @def THROW_CODEC_UNLESS
     * @brief Throw a codec_error unless condition is true
     */
    #define THROW_CODEC_UNLESS(condition, kind, ...) \
        do { if (!(condition)) THROW_CODEC(kind, __VA_ARGS__); } while(0)

    /**
     * @def THROW_IO
     * @brief Throw an io_error with formatted message
     */
    #define THROW_IO(...) \
        throw ::pngchunk::io_error(::pngchunk::build_error_msg(__VA_ARGS__))

    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    #define THROW_IO_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_IO(__VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngchunk
