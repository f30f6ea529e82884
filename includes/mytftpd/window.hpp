#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <fstream>
#include <string_view>
#include <vector>
#include "mytftp/types.hpp"

namespace WindTftp::Driver {
    enum class WindowError {
        io_failure,
        out_of_range,
        at_capacity
    };

    [[nodiscard]] std::string_view toWindowMsg(WindowError error) noexcept;

    /// @note Fixed-capacity circular queue of chunks. Slots keep their storage after eviction, so a refill reuses it.
    class ChunkRing {
    private:
        std::vector<MyTftp::Chunk> m_slots;
        std::size_t m_head;
        std::size_t m_count;

    public:
        explicit ChunkRing(std::size_t capacity);

        [[nodiscard]] std::size_t getCapacity() const noexcept;
        [[nodiscard]] std::size_t getLength() const noexcept;
        [[nodiscard]] bool isEmpty() const noexcept;
        [[nodiscard]] bool isFull() const noexcept;

        /// @note Throws `std::out_of_range` past the current length.
        [[nodiscard]] const MyTftp::Chunk& at(std::size_t index) const;

        /// @note Claims the slot after the last chunk, returned empty. Only call when not full.
        [[nodiscard]] MyTftp::Chunk& claimBack();
        [[nodiscard]] bool pushBack(MyTftp::Chunk chunk);
        void dropBack() noexcept;
        [[nodiscard]] bool dropFront(std::size_t n) noexcept;
        void clear() noexcept;
    };

    /// @note Upload side: pulls block-sized chunks from a file, at most `windowsize` at a time.
    class WindowRead {
    public:
        WindowRead(std::uint16_t windowsize, std::uint16_t chunk_size, const std::filesystem::path& source_path);

        WindowRead(const WindowRead& other) = delete;
        WindowRead& operator=(const WindowRead& other) = delete;

        [[nodiscard]] bool isOpen() const noexcept;

        /// @note true when the window is full, false once the short EOF chunk is in (and on every later call).
        [[nodiscard]] std::expected<bool, WindowError> fill();
        void prefetch();
        [[nodiscard]] std::expected<void, WindowError> drainFront(std::size_t n);

        [[nodiscard]] const MyTftp::Chunk& chunkAt(std::size_t index) const;
        [[nodiscard]] std::size_t getLength() const noexcept;
        [[nodiscard]] bool isEmpty() const noexcept;
        [[nodiscard]] bool reachedEof() const noexcept;

    private:
        ChunkRing m_chunks;
        std::vector<char> m_read_buffer;
        std::ifstream m_source;
        std::uint16_t m_chunk_size;
        bool m_eof;
    };

    /// @note Download side: holds up to `windowsize` received chunks until one in-order flush.
    class WindowWrite {
    public:
        WindowWrite(std::uint16_t windowsize, const std::filesystem::path& sink_path);

        WindowWrite(const WindowWrite& other) = delete;
        WindowWrite& operator=(const WindowWrite& other) = delete;

        [[nodiscard]] bool isOpen() const noexcept;

        [[nodiscard]] std::expected<void, WindowError> add(MyTftp::Chunk chunk);
        [[nodiscard]] std::expected<void, WindowError> flush();
        [[nodiscard]] std::expected<std::uint64_t, WindowError> sinkLength() const;

        /// @note Closes the sink early so the file can be removed.
        void release();

        [[nodiscard]] const MyTftp::Chunk& chunkAt(std::size_t index) const;
        [[nodiscard]] std::size_t getLength() const noexcept;
        [[nodiscard]] bool isEmpty() const noexcept;
        [[nodiscard]] bool isFull() const noexcept;

    private:
        ChunkRing m_chunks;
        std::ofstream m_sink;
        std::filesystem::path m_sink_path;
    };
}
