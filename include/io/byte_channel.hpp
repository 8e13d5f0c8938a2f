/**
 * @file byte_channel.hpp
 * @brief Abstract interface for a duplex byte stream that can fail
 * @version 0.1
 * @date 2025-11-10
 *
 * Provides abstraction for the physical serial device and for the master side
 * of each pseudo-terminal, to enable dependency injection and mock-based
 * testing. This interface only moves bytes; deciding what an error means
 * (reconnect, client gone, recreate) is left to the owner of the channel.
 */

#pragma once

#include <cstddef>
#include <string>
#include <sys/types.h>

namespace serialmux {

    /**
     * @brief Abstract interface for non-blocking byte I/O
     *
     * Implementations:
     * - RealSerialPort: termios2/ioctl over the physical device node
     * - PtyPair: master side of a pseudo-terminal
     * - MockByteChannel / MockPtyChannel: queue-based simulation for testing
     */
    class IByteChannel {
        public:
            virtual ~IByteChannel() = default;

            /**
             * @brief Write data without blocking
             * @param data Pointer to data buffer
             * @param len Number of bytes to write
             * @return ssize_t Bytes written (may be short), or -1 on error (sets errno).
             *         EAGAIN means the channel cannot accept data right now.
             */
            virtual ssize_t write(const void* data, std::size_t len) = 0;

            /**
             * @brief Read available data without blocking
             * @param data Pointer to buffer for received data
             * @param len Maximum number of bytes to read
             * @return ssize_t Bytes read, 0 on end-of-stream, or -1 on error (sets errno).
             *         EAGAIN means nothing is available yet.
             */
            virtual ssize_t read(void* data, std::size_t len) = 0;

            /**
             * @brief Check if channel is open
             * @return bool True if the underlying descriptor is open
             */
            virtual bool is_open() const = 0;

            /**
             * @brief Close the channel. Safe to call more than once.
             */
            virtual void close() = 0;

            /**
             * @brief Get the path this channel was opened from
             * @return std::string Device or pseudo-terminal path
             */
            virtual std::string get_path() const = 0;

            /**
             * @brief Get the file descriptor (for poll operations)
             * @return int File descriptor, or -1 if not open or not pollable
             */
            virtual int get_fd() const = 0;
    };

} // namespace serialmux
