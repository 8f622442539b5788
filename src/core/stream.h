#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

namespace core {

// ---------------------------------------------------------------------------
// DataStream -- byte buffer with append-only writes and a read cursor
// ---------------------------------------------------------------------------
// Used for event encoding (journal hashing) and for state snapshots.
// Reads past the end throw std::runtime_error; decoders catch it at their
// public boundary and turn it into a core::Error.
// ---------------------------------------------------------------------------
class DataStream {
public:
    DataStream() = default;

    explicit DataStream(std::vector<uint8_t> data)
        : buf_(std::move(data)) {}

    explicit DataStream(std::span<const uint8_t> data)
        : buf_(data.begin(), data.end()) {}

    void write(std::span<const uint8_t> data) {
        buf_.insert(buf_.end(), data.begin(), data.end());
    }

    void read(std::span<uint8_t> buf) {
        if (buf.size() > remaining()) {
            throw std::runtime_error(
                "DataStream::read(): attempted read past end of stream");
        }
        if (!buf.empty()) {
            std::memcpy(buf.data(), buf_.data() + read_pos_, buf.size());
        }
        read_pos_ += buf.size();
    }

    [[nodiscard]] size_t size() const noexcept { return buf_.size(); }

    [[nodiscard]] size_t remaining() const noexcept {
        return buf_.size() - read_pos_;
    }

    [[nodiscard]] bool eof() const noexcept {
        return read_pos_ >= buf_.size();
    }

    [[nodiscard]] size_t tell() const noexcept { return read_pos_; }

    /// View of the whole buffer, independent of the read cursor.
    [[nodiscard]] std::span<const uint8_t> bytes() const noexcept {
        return std::span<const uint8_t>(buf_.data(), buf_.size());
    }

    /// Move the internal buffer out.  Resets the stream to empty state.
    [[nodiscard]] std::vector<uint8_t> release() {
        read_pos_ = 0;
        return std::move(buf_);
    }

    void clear() {
        buf_.clear();
        read_pos_ = 0;
    }

private:
    std::vector<uint8_t> buf_;
    size_t               read_pos_ = 0;
};

}  // namespace core
