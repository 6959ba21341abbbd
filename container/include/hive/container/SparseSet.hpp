/**
 * @file SparseSet.hpp
 * @brief Sparse set with O(1) lookup and swap-and-pop removal.
 *
 * Maps entity slot indices to dense storage indices.  The dense array is
 * always compact, enabling cache-friendly iteration, and the sparse array
 * grows on demand so no capacity has to be fixed up front.
 *
 * @tparam T Payload type stored in the dense array.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef HIVE_CONTAINER_SPARSE_SET_HPP
    #define HIVE_CONTAINER_SPARSE_SET_HPP

    #include <hive/core/Assert.hpp>
    #include <hive/core/Constants.hpp>
    #include <hive/core/Types.hpp>

    #include <span>
    #include <vector>

namespace hive::container {

/**
 * @brief Sparse set keyed by slot index.
 * @tparam T Dense-stored payload type.
 */
template <typename T>
class SparseSet final {
public:
    /**
     * @brief Construct a sparse set, pre-sizing the sparse array.
     * @param sparseCapacity Initial number of addressable IDs.
     */
    explicit SparseSet(core::u32 sparseCapacity = core::kInitialEntityCapacity);

    /**
     * @brief Insert an element associated with a raw ID.
     * @param id  Raw (slot) ID.
     * @param val Value to store.
     * @return False if the ID is already present (nothing is stored).
     */
    bool insert(core::u32 id, T val);

    /**
     * @brief Insert or overwrite the element associated with a raw ID.
     * @pre @p id is not the invalid sentinel.
     * @return Reference to the stored value.
     */
    T &insertOrAssign(core::u32 id, T val);

    /**
     * @brief Remove the element associated with a raw ID (swap-and-pop).
     * @param id Raw (slot) ID.
     * @return True if found and removed.
     */
    bool remove(core::u32 id);

    /**
     * @brief Lookup by raw ID.
     * @param id Raw (slot) ID.
     * @return Pointer to the dense value, or nullptr.
     */
    [[nodiscard]] T       *find(core::u32 id);
    [[nodiscard]] const T *find(core::u32 id) const;

    /**
     * @brief Check whether a raw ID is currently present.
     */
    [[nodiscard]] bool contains(core::u32 id) const;

    void clear();

    [[nodiscard]] core::u32 size()  const { return static_cast<core::u32>(_dense.size()); }
    [[nodiscard]] bool      empty() const { return _dense.empty(); }

    [[nodiscard]] std::span<T>               dense()       { return _dense; }
    [[nodiscard]] std::span<const T>         dense() const { return _dense; }

    /** @brief Raw IDs in dense order (parallel to dense()). */
    [[nodiscard]] std::span<const core::u32> ids()   const { return _denseToSparse; }

private:
    static constexpr core::u32 kInvalid = ~core::u32{0};

    void ensureSparse(core::u32 id);

    std::vector<core::u32> _sparse;
    std::vector<T>         _dense;
    std::vector<core::u32> _denseToSparse;
};

} // namespace hive::container

    #include "SparseSet.inl"

#endif // HIVE_CONTAINER_SPARSE_SET_HPP
