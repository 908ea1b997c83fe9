#include <quicsock/buffers/CircularByteBuffer.hpp>
#include <quicsock/util/assert.hpp>
#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <utility>

namespace qs {

std::vector<uint8_t> CircularByteBuffer::WrappedRead::toVector() const {
    std::vector<uint8_t> out;
    out.reserve(this->size());
    out.insert(out.end(), first.begin(), first.end());
    out.insert(out.end(), second.begin(), second.end());
    return out;
}

CircularByteBuffer::CircularByteBuffer() : CircularByteBuffer(0) {}

CircularByteBuffer::CircularByteBuffer(size_t cap, size_t maxCap) : m_maxCapacity(maxCap) {
    cap = std::min(cap, maxCap);

    if (cap == 0) {
        return;
    }

    m_data = new uint8_t[cap];
    m_start = m_data;
    m_end = m_data;
    m_endAlloc = m_data + cap;
}

CircularByteBuffer::CircularByteBuffer(const CircularByteBuffer& other) {
    *this = other;
}

CircularByteBuffer& CircularByteBuffer::operator=(const CircularByteBuffer& other) {
    if (this != &other) {
        delete[] m_data;
        m_data = m_start = m_end = m_endAlloc = nullptr;
        m_size = 0;
        m_maxCapacity = other.m_maxCapacity;

        size_t cap = other.capacity();
        if (cap > 0) {
            m_data = new uint8_t[cap];
            m_endAlloc = m_data + cap;
            m_start = m_data + (other.m_start - other.m_data);
            m_end = m_data + (other.m_end - other.m_data);
            m_size = other.m_size;

            std::memcpy(m_data, other.m_data, cap);
        }
    }

    return *this;
}

CircularByteBuffer::CircularByteBuffer(CircularByteBuffer&& other) noexcept {
    *this = std::move(other);
}

CircularByteBuffer& CircularByteBuffer::operator=(CircularByteBuffer&& other) noexcept {
    if (this != &other) {
        delete[] m_data;

        m_data = std::exchange(other.m_data, nullptr);
        m_start = std::exchange(other.m_start, nullptr);
        m_end = std::exchange(other.m_end, nullptr);
        m_endAlloc = std::exchange(other.m_endAlloc, nullptr);
        m_size = std::exchange(other.m_size, 0);
        m_maxCapacity = other.m_maxCapacity;
    }

    return *this;
}

CircularByteBuffer::~CircularByteBuffer() {
    delete[] m_data;
}

void CircularByteBuffer::clear() {
    m_start = m_data;
    m_end = m_data;
    m_size = 0;
}

bool CircularByteBuffer::reserve(size_t extra) {
    return this->growUntilAtLeast(this->capacity() + extra);
}

size_t CircularByteBuffer::capacity() const {
    return m_endAlloc - m_data;
}

size_t CircularByteBuffer::maxCapacity() const {
    return m_maxCapacity;
}

size_t CircularByteBuffer::size() const {
    return m_size;
}

bool CircularByteBuffer::empty() const {
    return m_size == 0;
}

size_t CircularByteBuffer::remainingSpace() const {
    return m_maxCapacity - m_size;
}

void CircularByteBuffer::write(const void* data, size_t len) {
    return this->write(std::span{(const uint8_t*)data, len});
}

void CircularByteBuffer::write(std::span<const uint8_t> data) {
    if (data.size() > this->remainingSpace()) {
        throw std::length_error("CircularByteBuffer::write would exceed the capacity limit");
    }

    size_t written = this->writeSome(data);
    QS_DEBUG_ASSERT(written == data.size());
}

size_t CircularByteBuffer::writeSome(std::span<const uint8_t> data) {
    data = data.first(std::min(data.size(), this->remainingSpace()));

    if (data.empty()) {
        return 0;
    }

    if (data.size() > this->capacity() - this->size()) {
        bool grown = this->growUntilAtLeast(this->size() + data.size());
        QS_ASSERT(grown);
    }

    // two cases:
    // 1. end < start, the free region is contiguous and sits between them
    if (m_end < m_start) {
        QS_DEBUG_ASSERT(m_end + data.size() <= m_start);

        std::memcpy(m_end, data.data(), data.size());
        m_end += data.size();
    }
    // 2. end >= start, the write may need to wrap around to the beginning of the allocation
    else {
        size_t tailSpace = m_endAlloc - m_end;
        size_t head = std::min<size_t>(data.size(), tailSpace);
        std::memcpy(m_end, data.data(), head);

        if (head == data.size()) {
            m_end += head;
        } else {
            size_t rest = data.size() - head;
            std::memcpy(m_data, data.data() + head, rest);
            m_end = m_data + rest;

            QS_DEBUG_ASSERT(m_end <= m_start && "CircularByteBuffer::write overwrote unread data");
        }
    }

    m_size += data.size();

    return data.size();
}

std::span<uint8_t> CircularByteBuffer::writeWindow() {
    if (m_data == nullptr || m_size == this->capacity()) {
        return {};
    }

    if (m_end < m_start) {
        return {m_end, (size_t)(m_start - m_end)};
    }

    // m_end >= m_start: free space is at the tail, and possibly at the head.
    // if the tail is exhausted, the window wraps to the beginning.
    if (m_end == m_endAlloc) {
        return {m_data, (size_t)(m_start - m_data)};
    }

    return {m_end, (size_t)(m_endAlloc - m_end)};
}

void CircularByteBuffer::advanceWrite(size_t len) {
    if (len == 0) return;

    auto window = this->writeWindow();
    if (len > window.size()) {
        throw std::out_of_range("CircularByteBuffer::advanceWrite called with len > writeWindow().size()");
    }

    m_end = window.data() + len;
    m_size += len;
}

void CircularByteBuffer::read(void* dest, size_t len) {
    if (dest) {
        this->peek(dest, len);
    }

    this->skip(len);
}

void CircularByteBuffer::peek(void* dest, size_t len) const {
    QS_ASSERT(dest && "CircularByteBuffer::peek called with null destination");

    auto bufs = this->peek(len);
    std::memcpy(dest, bufs.first.data(), bufs.first.size());

    if (!bufs.second.empty()) {
        std::memcpy((uint8_t*)dest + bufs.first.size(), bufs.second.data(), bufs.second.size());
    }
}

CircularByteBuffer::WrappedRead CircularByteBuffer::peek(size_t len) const {
    if (len > this->size()) {
        throw std::out_of_range("CircularByteBuffer::peek called with len > size()");
    }

    WrappedRead out{};

    if (len == 0) {
        return out;
    }

    size_t contiguous = (m_start < m_end) ? (size_t)(m_end - m_start) : (size_t)(m_endAlloc - m_start);

    out.first = std::span<const uint8_t>{m_start, std::min(len, contiguous)};

    size_t remaining = len - out.first.size();
    if (remaining > 0) {
        out.second = std::span<const uint8_t>{m_data, remaining};
    }

    QS_DEBUG_ASSERT(out.size() == len);

    return out;
}

void CircularByteBuffer::skip(size_t len) {
    if (len > this->size()) {
        throw std::out_of_range("CircularByteBuffer::skip called with len > size()");
    }

    m_start += len;
    if (m_start >= m_endAlloc) {
        m_start -= m_endAlloc - m_data;
    }

    m_size -= len;

    // rewind when drained, keeps future writes contiguous
    if (m_size == 0) {
        m_start = m_data;
        m_end = m_data;
    }
}

bool CircularByteBuffer::growUntilAtLeast(size_t newcap) {
    if (newcap > m_maxCapacity) {
        return false;
    }

    size_t curcap = this->capacity();
    if (curcap >= newcap) {
        return true;
    }

    if (curcap == 0) {
        curcap = 64;
    }

    while (curcap < newcap) {
        curcap *= 2;
    }

    this->growTo(std::min(curcap, m_maxCapacity));
    return true;
}

void CircularByteBuffer::growTo(size_t newCap) {
    auto newData = new uint8_t[newCap];

    // the new allocation is always contiguous, starting at the beginning:
    // copy [m_start, end of data) in at most two pieces
    if (m_size > 0) {
        auto bufs = this->peek(m_size);
        std::memcpy(newData, bufs.first.data(), bufs.first.size());
        if (!bufs.second.empty()) {
            std::memcpy(newData + bufs.first.size(), bufs.second.data(), bufs.second.size());
        }
    }

    delete[] m_data;

    m_data = newData;
    m_start = newData;
    m_end = newData + m_size;
    m_endAlloc = newData + newCap;
}

}
