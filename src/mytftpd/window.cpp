#include <algorithm>
#include <array>
#include <stdexcept>
#include <system_error>
#include <utility>
#include "mytftpd/window.hpp"

namespace WindTftp::Driver {
    static constexpr std::array<std::string_view, 3> window_msgs = {
        "file I/O failure",
        "amount exceeds window length",
        "window is already full"
    };

    /// NOTE: keeps 2 * windowsize * blksize from reaching gigabytes for huge negotiated windows.
    static constexpr std::size_t max_read_buffer_size = 64UL * 1024UL * 1024UL;

    std::string_view toWindowMsg(WindowError error) noexcept {
        return window_msgs[static_cast<std::size_t>(error)];
    }

    ChunkRing::ChunkRing(std::size_t capacity)
    : m_slots(std::max<std::size_t>(capacity, 1UL)), m_head {0UL}, m_count {0UL} {}

    std::size_t ChunkRing::getCapacity() const noexcept {
        return m_slots.size();
    }

    std::size_t ChunkRing::getLength() const noexcept {
        return m_count;
    }

    bool ChunkRing::isEmpty() const noexcept {
        return m_count == 0UL;
    }

    bool ChunkRing::isFull() const noexcept {
        return m_count == m_slots.size();
    }

    const MyTftp::Chunk& ChunkRing::at(std::size_t index) const {
        if (index >= m_count) {
            throw std::out_of_range {"chunk index past window length"};
        }

        return m_slots[(m_head + index) % m_slots.size()];
    }

    MyTftp::Chunk& ChunkRing::claimBack() {
        auto& slot = m_slots[(m_head + m_count) % m_slots.size()];
        slot.clear();
        ++m_count;

        return slot;
    }

    bool ChunkRing::pushBack(MyTftp::Chunk chunk) {
        if (isFull()) {
            return false;
        }

        m_slots[(m_head + m_count) % m_slots.size()] = std::move(chunk);
        ++m_count;

        return true;
    }

    void ChunkRing::dropBack() noexcept {
        if (m_count > 0UL) {
            --m_count;
        }
    }

    bool ChunkRing::dropFront(std::size_t n) noexcept {
        if (n > m_count) {
            return false;
        }

        m_head = (m_head + n) % m_slots.size();
        m_count -= n;

        return true;
    }

    void ChunkRing::clear() noexcept {
        m_head = 0UL;
        m_count = 0UL;
    }

    WindowRead::WindowRead(std::uint16_t windowsize, std::uint16_t chunk_size, const std::filesystem::path& source_path)
    : m_chunks {windowsize}, m_read_buffer {}, m_source {}, m_chunk_size {chunk_size}, m_eof {false} {
        const auto wanted_size = 2UL * m_chunks.getCapacity() * chunk_size;
        m_read_buffer.resize(std::clamp<std::size_t>(wanted_size, 1UL, max_read_buffer_size));

        /// NOTE: the stream buffer must be swapped in before the file is opened.
        m_source.rdbuf()->pubsetbuf(m_read_buffer.data(), static_cast<std::streamsize>(m_read_buffer.size()));
        m_source.open(source_path, std::ios::binary | std::ios::in);
    }

    bool WindowRead::isOpen() const noexcept {
        return m_source.is_open();
    }

    std::expected<bool, WindowError> WindowRead::fill() {
        if (m_eof) {
            return false;
        }

        if (not m_source.is_open()) {
            return std::unexpected {WindowError::io_failure};
        }

        while (not m_chunks.isFull()) {
            auto& slot = m_chunks.claimBack();
            slot.resize(m_chunk_size);

            m_source.read(reinterpret_cast<char*>(slot.data()), static_cast<std::streamsize>(m_chunk_size));

            if (m_source.bad()) {
                m_chunks.dropBack();
                return std::unexpected {WindowError::io_failure};
            }

            const auto read_count = static_cast<std::size_t>(m_source.gcount());

            if (read_count < m_chunk_size) {
                slot.resize(read_count);
                m_eof = true;

                return false;
            }
        }

        return true;
    }

    void WindowRead::prefetch() {
        if (m_eof or not m_source.is_open()) {
            return;
        }

        /// NOTE: peeking underflows the file buffer when it ran dry, any failure resurfaces on the next fill.
        static_cast<void>(m_source.rdbuf()->sgetc());
    }

    std::expected<void, WindowError> WindowRead::drainFront(std::size_t n) {
        if (not m_chunks.dropFront(n)) {
            return std::unexpected {WindowError::out_of_range};
        }

        return {};
    }

    const MyTftp::Chunk& WindowRead::chunkAt(std::size_t index) const {
        return m_chunks.at(index);
    }

    std::size_t WindowRead::getLength() const noexcept {
        return m_chunks.getLength();
    }

    bool WindowRead::isEmpty() const noexcept {
        return m_chunks.isEmpty();
    }

    bool WindowRead::reachedEof() const noexcept {
        return m_eof;
    }

    WindowWrite::WindowWrite(std::uint16_t windowsize, const std::filesystem::path& sink_path)
    : m_chunks {windowsize}, m_sink {sink_path, std::ios::binary | std::ios::out | std::ios::trunc}, m_sink_path {sink_path} {}

    bool WindowWrite::isOpen() const noexcept {
        return m_sink.is_open();
    }

    std::expected<void, WindowError> WindowWrite::add(MyTftp::Chunk chunk) {
        if (not m_chunks.pushBack(std::move(chunk))) {
            return std::unexpected {WindowError::at_capacity};
        }

        return {};
    }

    std::expected<void, WindowError> WindowWrite::flush() {
        if (not m_sink.is_open()) {
            return std::unexpected {WindowError::io_failure};
        }

        for (std::size_t index = 0; index < m_chunks.getLength(); ++index) {
            const auto& chunk = m_chunks.at(index);
            m_sink.write(reinterpret_cast<const char*>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
        }

        m_sink.flush();
        m_chunks.clear();

        if (not m_sink.good()) {
            return std::unexpected {WindowError::io_failure};
        }

        return {};
    }

    std::expected<std::uint64_t, WindowError> WindowWrite::sinkLength() const {
        std::error_code fs_error;
        const auto length = std::filesystem::file_size(m_sink_path, fs_error);

        if (fs_error) {
            return std::unexpected {WindowError::io_failure};
        }

        return static_cast<std::uint64_t>(length);
    }

    void WindowWrite::release() {
        if (m_sink.is_open()) {
            m_sink.close();
        }
    }

    const MyTftp::Chunk& WindowWrite::chunkAt(std::size_t index) const {
        return m_chunks.at(index);
    }

    std::size_t WindowWrite::getLength() const noexcept {
        return m_chunks.getLength();
    }

    bool WindowWrite::isEmpty() const noexcept {
        return m_chunks.isEmpty();
    }

    bool WindowWrite::isFull() const noexcept {
        return m_chunks.isFull();
    }
}
