//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cassert>
#include <optional>
#include <span>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

#include <Arbor/Base/Macros.h>
#include <Arbor/Base/ResourceHandle.h>

namespace arbor {

/*
Generational arena: a lookup table for items addressed by a resource handle.

The same handle data type is used in two different ways: as an externally
visible handle, which is an index into a sparse set, and as an internal index
into a dense set storing the actual items.

The sparse set is an array with holes, created when items are removed. Each
slot of the sparse set stores the index of the item in the dense set, or, when
the slot is free, the index of the next free slot. Free slots are chained in a
freelist using the free bit of the handle; insertions fill holes before growing
the sparse set, which therefore tries to remain dense.

The dense set stores the items tightly packed. Removal swaps the removed item
with the last one and pops the back; a third set, the meta set, maps each dense
position back to its sparse slot so that the moved item's slot can be fixed.

Every removal increments the generation of the released slot. Handles issued
before the removal keep the old generation and are from then on rejected by
`Contains()`, `TryItemAt()` and `Remove()`, and make `ItemAt()` throw.

References and pointers into the table are invalidated by any insertion or
removal. Handles are not.

Inspired by ID Lookup in the stingray core.
http://bitsquid.blogspot.com/2011/09/managing-decoupling-part-4-id-lookup.html
*/
template <typename T> class ResourceTable {
public:
  struct Meta {
    ResourceHandle::IndexT dense_to_sparse;
  };

  using DenseSet = std::vector<T>;
  using MetaSet = std::vector<Meta>;
  using HandleSet = std::vector<ResourceHandle>;

  ResourceTable(
    const ResourceHandle::ResourceTypeT item_type, const size_t reserve_count)
    : item_type_(item_type)
  {
    assert(reserve_count < ResourceHandle::kIndexMax);
    sparse_table_.reserve(reserve_count);
    items_.reserve(reserve_count);
    meta_.reserve(reserve_count);
  }

  ~ResourceTable() = default;

  ARBOR_MAKE_NON_COPYABLE(ResourceTable)

  //! Moves the whole table; the source is left empty but usable.
  ResourceTable(ResourceTable&& other) noexcept
    : freelist_front_(other.freelist_front_)
    , freelist_back_(other.freelist_back_)
    , item_type_(other.item_type_)
    , sparse_table_(std::move(other.sparse_table_))
    , items_(std::move(other.items_))
    , meta_(std::move(other.meta_))
  {
    other.Reset();
  }

  auto operator=(ResourceTable&& other) noexcept -> ResourceTable&
  {
    if (this != &other) {
      freelist_front_ = other.freelist_front_;
      freelist_back_ = other.freelist_back_;
      item_type_ = other.item_type_;
      sparse_table_ = std::move(other.sparse_table_);
      items_ = std::move(other.items_);
      meta_ = std::move(other.meta_);
      other.Reset();
    }
    return *this;
  }

  [[nodiscard]] auto GetItemType() const noexcept
    -> ResourceHandle::ResourceTypeT
  {
    return item_type_;
  }

  // -- Element access -------------------------------------------------------

  [[nodiscard]] auto Contains(const ResourceHandle& handle) const noexcept
    -> bool;

  //! @{
  //! Checked access. Throws std::invalid_argument or std::out_of_range when
  //! the handle does not address a live item of this table.
  [[nodiscard]] auto ItemAt(const ResourceHandle& handle) -> T&;
  [[nodiscard]] auto ItemAt(const ResourceHandle& handle) const -> const T&;
  //! @}

  //! @{
  //! Non-throwing access, returns nullptr when the handle does not address a
  //! live item of this table.
  [[nodiscard]] auto TryItemAt(const ResourceHandle& handle) noexcept -> T*;
  [[nodiscard]] auto TryItemAt(const ResourceHandle& handle) const noexcept
    -> const T*;
  //! @}

  //! Mutable access to two distinct items at once.
  /*!
   Each element of the returned pair is nullptr when the corresponding handle
   does not address a live item. Because the two handles must be different,
   the two pointers never refer to the same item.

   \throws std::invalid_argument if \p first and \p second are the same
   handle.
  */
  [[nodiscard]] auto ItemPair(
    const ResourceHandle& first, const ResourceHandle& second) -> std::pair<T*, T*>;

  /*
  Direct access to items set for iterating over them with no modification of the
  set or its items.
   */
  [[nodiscard]] auto Items() const noexcept -> std::span<const T>
  {
    return items_;
  }

  //! The external handle of the item stored at \p dense_index in Items().
  [[nodiscard]] auto HandleAt(size_t dense_index) const -> ResourceHandle;

  // -- Capacity -------------------------------------------------------------

  [[nodiscard]] auto Size() const noexcept { return items_.size(); }
  [[nodiscard]] auto IsEmpty() const noexcept { return items_.empty(); }
  [[nodiscard]] auto Capacity() const noexcept { return items_.capacity(); }

  // -- Modifiers ------------------------------------------------------------

  template <typename URef = T>
    requires std::is_same_v<std::remove_cvref_t<URef>, T>
  auto Insert(URef&& item) -> ResourceHandle;

  /**
   * Inserts an item in the table, constructing the item from the given
   * arguments. Prefer to use this instead of Insert when adding an item on the
   * fly, passing its properties as arguments.
   */
  template <typename... Params> auto Emplace(Params&&... args) -> ResourceHandle
  {
    return Insert(T(std::forward<Params>(args)...));
  }

  //! Takes the item addressed by \p handle out of the table.
  /*!
   \return the removed item, or std::nullopt if the handle is stale, invalid,
   or belongs to a different table. Never fails otherwise.
  */
  auto Remove(const ResourceHandle& handle) -> std::optional<T>;

  // Return 1 if item was found and erased; 0 otherwise.
  auto Erase(const ResourceHandle& handle) -> size_t;

  /*
  Removes all items, leaving the sparse set intact by adding each entry to the
  freelist and incrementing its generation.

  This operation is slower than `Reset()`, but safer for the detection of
  stale handles later. Complexity is linear.
  */
  void Clear() noexcept;

  /*
  Removes all items, destroying the sparse set. Leaves the container's
  capacity, but otherwise equivalent to a default-constructed container.

  This is faster than `Clear()`, but cannot safely detect lookups by stale
  handles obtained before the reset. Complexity is constant.
  */
  void Reset() noexcept;

private:
  [[nodiscard]] auto GetInnerIndex(const ResourceHandle& handle) const
    -> ResourceHandle::IndexT;

  //! Frees the slot of a live \p handle and drops its item from the dense set.
  void ReleaseSlot(const ResourceHandle& handle);

  [[nodiscard]] auto IsFreeListEmpty() const noexcept
  {
    // Having the front at the max index value, means the freelist is empty.
    // The back will implicitly be equal to the front.
    return freelist_front_ == ResourceHandle::kIndexMax;
  }

  [[nodiscard]] static auto NewIndex(const auto& set) noexcept
  {
    return static_cast<ResourceHandle::IndexT>(set.size());
  }

  // Index of the first item in the freelist
  ResourceHandle::IndexT freelist_front_ = ResourceHandle::kInvalidIndex;
  // Index of the last item in the freelist
  ResourceHandle::IndexT freelist_back_ = ResourceHandle::kInvalidIndex;

  // Resource type of handles produced when inserting items into this table.
  ResourceHandle::ResourceTypeT item_type_;

  // Stores the `inner` handles, used as internal indices into the dense set
  // and to form the freelist of available slots (holes in the array).
  HandleSet sparse_table_;

  // Stores the actual `items` inserted into the table.
  DenseSet items_;

  // Reverse index from the dense set to the sparse set, used for removal.
  MetaSet meta_;
};

// -----------------------------------------------------------------------------

template <typename T>
auto ResourceTable<T>::ItemAt(const ResourceHandle& handle) -> T&
{
  return items_[GetInnerIndex(handle)];
}

template <typename T>
auto ResourceTable<T>::ItemAt(const ResourceHandle& handle) const -> const T&
{
  return items_[GetInnerIndex(handle)];
}

template <typename T>
auto ResourceTable<T>::TryItemAt(const ResourceHandle& handle) noexcept -> T*
{
  if (!Contains(handle)) {
    return nullptr;
  }
  return &items_[sparse_table_[handle.Index()].Index()];
}

template <typename T>
auto ResourceTable<T>::TryItemAt(const ResourceHandle& handle) const noexcept
  -> const T*
{
  return const_cast<ResourceTable*>(this)->TryItemAt(handle);
}

template <typename T>
auto ResourceTable<T>::ItemPair(
  const ResourceHandle& first, const ResourceHandle& second) -> std::pair<T*, T*>
{
  if (first == second) {
    throw std::invalid_argument("item pair requires two distinct handles");
  }
  return { TryItemAt(first), TryItemAt(second) };
}

template <typename T>
auto ResourceTable<T>::HandleAt(const size_t dense_index) const
  -> ResourceHandle
{
  if (dense_index >= items_.size()) {
    throw std::out_of_range("dense index out of range");
  }
  const auto sparse_index = meta_[dense_index].dense_to_sparse;
  ResourceHandle handle = sparse_table_[sparse_index];
  handle.SetIndex(sparse_index);
  return handle;
}

template <typename T>
auto ResourceTable<T>::Contains(const ResourceHandle& handle) const noexcept
  -> bool
{
  // quick bailout before starting the lookup
  if (handle.Index() >= sparse_table_.size()
    || handle.ResourceType() != item_type_) {
    return false;
  }

  const ResourceHandle inner_id = sparse_table_[handle.Index()];

  if (inner_id.IsFree()) {
    return false;
  }

  assert(inner_id.Index() < items_.size());
  return handle.Generation() == inner_id.Generation();
}

template <typename T>
auto ResourceTable<T>::GetInnerIndex(const ResourceHandle& handle) const
  -> ResourceHandle::IndexT
{
  if (!handle.IsValid()) {
    throw std::invalid_argument("invalid handle");
  }
  if (handle.Index() >= NewIndex(sparse_table_)) {
    throw std::out_of_range("bad handle, index out of range");
  }
  if (handle.ResourceType() != item_type_) {
    throw std::invalid_argument("item type mismatch, using wrong table?");
  }

  const ResourceHandle inner_handle = sparse_table_[handle.Index()];
  if (inner_handle.IsFree()) {
    throw std::invalid_argument("bad handle, item already erased");
  }
  if (handle.Generation() != inner_handle.Generation()) {
    throw std::invalid_argument(
      "external handle is stale (obsolete generation)");
  }

  assert(inner_handle.Index() < NewIndex(items_)
    && "corrupted table, inner index is out of range");

  return inner_handle.Index();
}

template <typename T>
template <typename URef>
  requires std::is_same_v<std::remove_cvref_t<URef>, T>
auto ResourceTable<T>::Insert(URef&& item) -> ResourceHandle
{
  // We never fill the table beyond the maximum valid index value. This is very
  // unlikely, so we just assert for it and not test it in production.
  assert(Size() < ResourceHandle::kIndexMax
    && "index will be out of range, increase bit size of the index values");

  ResourceHandle handle;

  if (IsFreeListEmpty()) {
    handle = ResourceHandle(NewIndex(items_), item_type_);
    sparse_table_.push_back(handle);
    handle.SetIndex(NewIndex(sparse_table_) - 1);
  } else {
    const auto outer_index = freelist_front_;
    ResourceHandle& inner_handle = sparse_table_[outer_index];

    // the index of a free slot refers to the next free slot
    freelist_front_ = inner_handle.Index();
    if (IsFreeListEmpty()) {
      freelist_back_ = freelist_front_;
    }

    // convert the index from freelist to inner index
    inner_handle.SetFree(false);
    inner_handle.SetIndex(NewIndex(items_));

    handle = inner_handle;
    handle.SetIndex(outer_index);
  }

  items_.push_back(std::forward<URef>(item));
  meta_.push_back({ handle.Index() });

  return handle;
}

template <typename T>
auto ResourceTable<T>::Remove(const ResourceHandle& handle) -> std::optional<T>
{
  if (!Contains(handle)) {
    return std::nullopt;
  }
  std::optional<T> item { std::move(
    items_[sparse_table_[handle.Index()].Index()]) };
  ReleaseSlot(handle);
  return item;
}

template <typename T>
auto ResourceTable<T>::Erase(const ResourceHandle& handle) -> size_t
{
  if (!Contains(handle)) {
    return 0;
  }
  ReleaseSlot(handle);
  return 1;
}

template <typename T>
void ResourceTable<T>::ReleaseSlot(const ResourceHandle& handle)
{
  ResourceHandle inner_handle = sparse_table_[handle.Index()];
  const ResourceHandle::IndexT inner_index = inner_handle.Index();

  // push this slot to the back of the freelist
  inner_handle.SetFree(true);
  // increment generation so remaining outer ids go stale
  inner_handle.NewGeneration();
  // max value represents the end of the freelist
  inner_handle.SetIndex(ResourceHandle::kIndexMax);
  // write outer id changes back to the array
  sparse_table_[handle.Index()] = inner_handle;

  if (IsFreeListEmpty()) {
    // if the freelist was empty, it now starts (and ends) at this index
    freelist_front_ = handle.Index();
    freelist_back_ = freelist_front_;
  } else {
    // previous back of the freelist points to new back
    sparse_table_[freelist_back_].SetIndex(handle.Index());
    // new freelist back is stored
    freelist_back_ = handle.Index();
  }

  // remove the item by swapping with the last element, then pop_back
  if (inner_index != items_.size() - 1) {
    std::swap(items_[inner_index], items_.back());
    std::swap(meta_[inner_index], meta_.back());

    // fix the sparse slot of the swapped item
    sparse_table_[meta_[inner_index].dense_to_sparse].SetIndex(inner_index);
  }

  items_.pop_back();
  meta_.pop_back();
}

template <typename T> void ResourceTable<T>::Clear() noexcept
{
  if (const auto size = NewIndex(sparse_table_); size > 0) {
    items_.clear();
    meta_.clear();

    freelist_front_ = 0;
    freelist_back_ = size - 1;

    for (ResourceHandle::IndexT index = 0; index < size; ++index) {
      auto& handle = sparse_table_[index];
      // slots already in the freelist got their new generation when released
      if (!handle.IsFree()) {
        handle.SetFree(true);
        handle.NewGeneration();
      }
      handle.SetIndex(index + 1);
    }
    sparse_table_[size - 1].SetIndex(ResourceHandle::kInvalidIndex);
  }
}

template <typename T> void ResourceTable<T>::Reset() noexcept
{
  freelist_front_ = ResourceHandle::kIndexMax;
  freelist_back_ = ResourceHandle::kIndexMax;

  items_.clear();
  meta_.clear();
  sparse_table_.clear();
}

} // namespace arbor
