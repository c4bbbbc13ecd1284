//
// Created by igor on 03/09/2025.
//

#pragma once

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <cstring>

#include <pngchunk/exceptions.hh>
#include <pngchunk/byte_order.hh>
#include <pngchunk/chunk_type.hh>

namespace pngchunk {

    // Base reader interface
    class reader_base {
        public:
            enum whence_t {
                set,
                cur,
                end
            };

        public:
            virtual ~reader_base() = default;

            // Simple interface - throws on error
            virtual std::size_t read(void* dst, std::size_t size) = 0;
            virtual void seek(std::uint64_t offset, whence_t whence) = 0;
            virtual std::uint64_t tell() const = 0;
            virtual std::uint64_t size() const = 0;

            [[nodiscard]] std::uint64_t remaining() const {
                return size() - tell();
            }

            // Convenience methods
            std::vector<std::byte> read_exact(std::size_t size) {
                std::vector<std::byte> buffer(size);
                std::size_t actual = read(buffer.data(), size);
                THROW_CODEC_IF(actual != size, length, "unexpected end of data at offset ", tell(),
                               ": requested ", size, " bytes, got ", actual);
                return buffer;
            }

            template<typename T>
            T read(byte_order bo) {
                std::array<std::byte, sizeof(T)> buff;
                std::size_t actual = read(buff.data(), sizeof(T));
                THROW_CODEC_IF(actual != sizeof(T), length, "failed to read ", sizeof(T),
                               " bytes at offset ", tell() - actual);

                T value;
                std::memcpy(&value, buff.data(), sizeof(T));
                if constexpr (sizeof(T) > 1) {
                    if (!byte_order_native(bo)) {
                        value = swap_byte_order(value);
                    }
                }
                return value;
            }

            // Read without consuming
            template<typename T>
            T peek(byte_order bo) {
                auto pos = tell();
                T value = read<T>(bo);
                seek(pos, set);
                return value;
            }

            chunk_type read_chunk_type();
    };

    // Reads from a caller-owned memory buffer; the buffer must outlive the reader
    class memory_reader : public reader_base {
        public:
            memory_reader(const std::byte* data, std::size_t size);
            explicit memory_reader(const std::vector<std::byte>& data);
            ~memory_reader() override = default;

            using reader_base::read;
            std::size_t read(void* dst, std::size_t size) override;
            void seek(std::uint64_t offset, whence_t whence) override;
            std::uint64_t tell() const override;
            std::uint64_t size() const override;

            // Pointer to the byte at the current position
            [[nodiscard]] const std::byte* current() const { return m_data + m_position; }

        private:
            const std::byte* m_data;
            std::size_t m_size;
            std::size_t m_position;
    };
}
