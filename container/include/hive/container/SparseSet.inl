/**
 * @file SparseSet.inl
 * @brief Template implementation of the sparse set.
 * @see   SparseSet.hpp
 */

#ifndef HIVE_CONTAINER_SPARSE_SET_INL
    #define HIVE_CONTAINER_SPARSE_SET_INL

    #include <utility>

namespace hive::container {

template <typename T>
SparseSet<T>::SparseSet(core::u32 sparseCapacity)
    : _sparse(sparseCapacity, kInvalid)
{
}

template <typename T>
void SparseSet<T>::ensureSparse(core::u32 id)
{
    if (id < _sparse.size())
        return;
    const core::usize wanted = static_cast<core::usize>(id) + core::kSparseGrowthStep;
    _sparse.resize(wanted, kInvalid);
}

template <typename T>
bool SparseSet<T>::insert(core::u32 id, T val)
{
    if (id == kInvalid)
        return false;
    ensureSparse(id);
    if (_sparse[id] != kInvalid)
        return false;

    _sparse[id] = static_cast<core::u32>(_dense.size());
    _dense.push_back(std::move(val));
    _denseToSparse.push_back(id);
    return true;
}

template <typename T>
T &SparseSet<T>::insertOrAssign(core::u32 id, T val)
{
    HIVE_VERIFY(id != kInvalid);
    if (T *existing = find(id)) {
        *existing = std::move(val);
        return *existing;
    }
    insert(id, std::move(val));
    return _dense.back();
}

template <typename T>
bool SparseSet<T>::remove(core::u32 id)
{
    if (id >= _sparse.size())
        return false;

    core::u32 denseIdx = _sparse[id];
    if (denseIdx == kInvalid)
        return false;

    core::u32 lastDenseIdx = static_cast<core::u32>(_dense.size()) - 1;
    if (denseIdx != lastDenseIdx) {
        core::u32 lastSparseId = _denseToSparse[lastDenseIdx];
        _dense[denseIdx]         = std::move(_dense[lastDenseIdx]);
        _denseToSparse[denseIdx] = lastSparseId;
        _sparse[lastSparseId]    = denseIdx;
    }

    _dense.pop_back();
    _denseToSparse.pop_back();
    _sparse[id] = kInvalid;
    return true;
}

template <typename T>
T *SparseSet<T>::find(core::u32 id)
{
    if (id >= _sparse.size())
        return nullptr;

    core::u32 denseIdx = _sparse[id];
    if (denseIdx == kInvalid)
        return nullptr;

    return &_dense[denseIdx];
}

template <typename T>
const T *SparseSet<T>::find(core::u32 id) const
{
    return const_cast<SparseSet *>(this)->find(id);
}

template <typename T>
bool SparseSet<T>::contains(core::u32 id) const
{
    if (id >= _sparse.size())
        return false;
    return _sparse[id] != kInvalid;
}

template <typename T>
void SparseSet<T>::clear()
{
    for (core::u32 id : _denseToSparse)
        _sparse[id] = kInvalid;
    _dense.clear();
    _denseToSparse.clear();
}

} // namespace hive::container

#endif // HIVE_CONTAINER_SPARSE_SET_INL
