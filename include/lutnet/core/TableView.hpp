#ifndef LUTNET_CORE_TABLEVIEW_HPP
#define LUTNET_CORE_TABLEVIEW_HPP

#include <cstddef>
#include <stdexcept>

namespace lutnet {
namespace core {

/**
 * @brief A non-owning, read-only view of a precomputed table.
 *
 * TableView does not allocate or free memory. It is a window over a buffer
 * owned by someone else (typically a ScalarLUT), so it is cheap to copy
 * and hand to lookup code. The owner must outlive every view.
 */
template <typename T>
class TableView {
public:
    TableView() : data_(nullptr), size_(0) {}

    TableView(const T* data, size_t size) : data_(data), size_(size) {
        if (data == nullptr && size != 0) {
            throw std::invalid_argument("TableView: null data with non-zero size");
        }
    }

    const T* data() const { return data_; }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    const T* begin() const { return data_; }
    const T* end() const { return data_ + size_; }

    // Unchecked
    const T& operator[](size_t idx) const { return data_[idx]; }

    // Subview of [offset, offset + count)
    TableView slice(size_t offset, size_t count) const {
        if (offset > size_ || count > size_ - offset) {
            throw std::out_of_range("TableView::slice out of bounds");
        }
        return TableView(data_ + offset, count);
    }

private:
    const T* data_;
    size_t size_;
};

} // namespace core
} // namespace lutnet

#endif // LUTNET_CORE_TABLEVIEW_HPP
