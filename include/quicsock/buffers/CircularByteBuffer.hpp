#pragma once

#include <vector>
#include <span>
#include <stdint.h>
#include <stddef.h>

namespace qs {

// Growable ring buffer of bytes, used for stream send/receive buffering and frame reassembly.
// Reads and writes are a memcpy (or two, when wrapping around the end of the allocation).
// The buffer can be given a hard capacity limit, past which it refuses to grow.
// `peek(size_t)` may return 2 spans if the requested data wraps around the end of the buffer.

class CircularByteBuffer {
public:
    static constexpr size_t UNLIMITED = SIZE_MAX;

    CircularByteBuffer();
    explicit CircularByteBuffer(size_t capacity, size_t maxCapacity = UNLIMITED);

    CircularByteBuffer(const CircularByteBuffer&);
    CircularByteBuffer& operator=(const CircularByteBuffer&);
    CircularByteBuffer(CircularByteBuffer&&) noexcept;
    CircularByteBuffer& operator=(CircularByteBuffer&&) noexcept;

    ~CircularByteBuffer();

    // Clears the buffer, but does not deallocate memory.
    void clear();

    // Reserves extra capacity in the buffer, never growing past `maxCapacity()`.
    // Returns false if the requested capacity would exceed the limit.
    bool reserve(size_t extraCap);

    size_t capacity() const;
    size_t maxCapacity() const;
    size_t size() const;
    bool empty() const;

    // Amount of bytes that can still be written without exceeding `maxCapacity()`.
    size_t remainingSpace() const;

    // Appends more data to the end of the buffer, reallocating if needed.
    // Throws `std::length_error` if the data does not fit under the capacity limit.
    void write(const void* data, size_t len);
    void write(std::span<const uint8_t> data);

    // Like `write`, but writes only as much as fits under the capacity limit. Returns the amount written.
    size_t writeSome(std::span<const uint8_t> data);

    // Returns the contiguous free region where the next write can happen, without reallocating.
    // Call `advanceWrite(size)` after writing into it.
    std::span<uint8_t> writeWindow();

    void advanceWrite(size_t len);

    // Reads the next unread data from the buffer. Throws if `len > size()`.
    void read(void* dest, size_t len);
    // Like `read`, but does not remove data from the buffer.
    void peek(void* dest, size_t len) const;

    struct WrappedRead {
        std::span<const uint8_t> first;
        std::span<const uint8_t> second;

        inline size_t size() const {
            return first.size() + second.size();
        }

        inline void skip(size_t len) {
            if (len <= first.size()) {
                first = first.subspan(len);
                return;
            }

            len -= first.size();
            first = std::span<const uint8_t>{};

            if (len <= second.size()) {
                second = second.subspan(len);
            } else {
                second = std::span<const uint8_t>{};
            }
        }

        // Copies the data into a contiguous vector.
        std::vector<uint8_t> toVector() const;
    };

    // Returns a view of the next `len` unread bytes. Throws if `len > size()`.
    WrappedRead peek(size_t len) const;

    // Skips the next `len` bytes in the buffer. Throws if `len > size()`.
    void skip(size_t len);

private:
    uint8_t* m_data = nullptr;
    uint8_t* m_start = nullptr;
    uint8_t* m_end = nullptr;
    uint8_t* m_endAlloc = nullptr;
    size_t m_size = 0;
    size_t m_maxCapacity = UNLIMITED;

    bool growUntilAtLeast(size_t capacity);
    void growTo(size_t newCap);
};

}
