// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Byte buffer used by the network layer

#ifndef FAULTLINE_CORE_BUFFER_HPP
#define FAULTLINE_CORE_BUFFER_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace faultline {
namespace core {

/**
 * @brief Owned, resizable byte buffer.
 *
 * The network PAL reads into and writes from Buffers. HTTP payloads are
 * carried as std::string elsewhere, so conversion helpers are provided in
 * both directions.
 */
class Buffer {
public:
    Buffer() = default;

    explicit Buffer(size_t size) : data_(size, 0) {}

    Buffer(const uint8_t* data, size_t size)
        : data_(data, data + size) {}

    explicit Buffer(const std::string& text)
        : data_(text.begin(), text.end()) {}

    Buffer(const Buffer&) = default;
    Buffer& operator=(const Buffer&) = default;
    Buffer(Buffer&&) noexcept = default;
    Buffer& operator=(Buffer&&) noexcept = default;

    [[nodiscard]] size_t size() const noexcept {
        return data_.size();
    }

    [[nodiscard]] bool empty() const noexcept {
        return data_.empty();
    }

    [[nodiscard]] uint8_t* data() noexcept {
        return data_.data();
    }

    [[nodiscard]] const uint8_t* data() const noexcept {
        return data_.data();
    }

    void append(const uint8_t* data, size_t size) {
        data_.insert(data_.end(), data, data + size);
    }

    void clear() noexcept {
        data_.clear();
    }

    void resize(size_t size) {
        data_.resize(size);
    }

    [[nodiscard]] std::string toString() const {
        return std::string(data_.begin(), data_.end());
    }

private:
    std::vector<uint8_t> data_;
};

} // namespace core
} // namespace faultline

#endif // FAULTLINE_CORE_BUFFER_HPP
