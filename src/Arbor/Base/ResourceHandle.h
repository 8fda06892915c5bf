//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cassert>
#include <cstdint>
#include <functional>
#include <string>
#include <type_traits>

#include <fmt/format.h>

namespace arbor {

/*
A POD handle addressing one slot of a `ResourceTable`.

The handle replaces pointers into the table storage. It stays valid while the
item it was issued for is alive, regardless of how the table reorganizes its
dense storage, and it goes stale (detectably) as soon as that item is removed.

The handle is a 64-bit value, laid out in the following way, with the order of
the fields being important for sorting prioritized by the reserved bits, then
free status, then item type, then generation, and finally index.

```
    reserved
          free bit
       7  1    8             16                         32
    ------X<-type--><---- gen -----><------------- index ------------->
    ........ ........ ........ ........ ........ ........ ........ ........
```

The free bit is used by the table to manage its freelist: while set, the
handle is a link in the embedded singly linked list of available slots and its
index field points to the next free slot.

The item type tags every handle produced by a table with the table's type, so
that a handle cannot silently address a table of a different kind.

The generation field detects stale handles: every time a slot is released its
generation is incremented, and lookups require the generations to match.
*/
class ResourceHandle {
public:
  using HandleT = uint64_t;

private:
  static constexpr uint8_t kHandleBits = sizeof(HandleT) * 8;
  static constexpr uint8_t kReservedBits { 7 };
  static constexpr uint8_t kFreeBits { 1 };
  static constexpr uint8_t kResourceTypeBits { 8 };
  static constexpr uint8_t kGenerationBits { 16 };
  static constexpr uint8_t kIndexBits { 32 };

  static constexpr HandleT kHandleMask = static_cast<HandleT>(-1);
  static constexpr HandleT kIndexMask = (HandleT { 1 } << kIndexBits) - 1;
  static constexpr HandleT kGenerationMask
    = (HandleT { 1 } << kGenerationBits) - 1;
  static constexpr HandleT kResourceTypeMask
    = (HandleT { 1 } << kResourceTypeBits) - 1;

  static constexpr uint8_t kGenerationShift = kIndexBits;
  static constexpr uint8_t kResourceTypeShift = kIndexBits + kGenerationBits;
  static constexpr uint8_t kFreeShift
    = kIndexBits + kGenerationBits + kResourceTypeBits;

public:
  using GenerationT = uint16_t;
  using ResourceTypeT = uint8_t;
  using IndexT = uint32_t;

  static constexpr GenerationT kGenerationMax = kGenerationMask;
  static constexpr ResourceTypeT kTypeNotInitialized = kResourceTypeMask;
  static constexpr ResourceTypeT kResourceTypeMax = kResourceTypeMask;
  static constexpr IndexT kIndexMax = kIndexMask;
  static constexpr IndexT kInvalidIndex = kIndexMax;

  //! Creates an invalid handle.
  constexpr ResourceHandle() noexcept = default;

  explicit constexpr ResourceHandle(
    IndexT index, ResourceTypeT type = kTypeNotInitialized)
  {
    SetIndex(index);
    SetResourceType(type);
  }

  constexpr auto operator==(const ResourceHandle& rhs) const noexcept -> bool
    = default;
  constexpr auto operator<(const ResourceHandle& rhs) const noexcept -> bool
  {
    return handle_ < rhs.handle_;
  }

  [[nodiscard]] constexpr auto Handle() const noexcept -> HandleT
  {
    return handle_;
  }

  [[nodiscard]] constexpr auto IsValid() const noexcept -> bool
  {
    return Index() != kInvalidIndex;
  }

  constexpr auto Invalidate() noexcept -> void { handle_ = kHandleMask; }

  [[nodiscard]] constexpr auto Index() const noexcept -> IndexT
  {
    return static_cast<IndexT>(handle_ & kIndexMask);
  }

  constexpr auto SetIndex(const IndexT index) noexcept -> void
  {
    handle_ = (handle_ & ~kIndexMask) | index;
  }

  [[nodiscard]] constexpr auto Generation() const noexcept -> GenerationT
  {
    return static_cast<GenerationT>(
      handle_ >> kGenerationShift & kGenerationMask);
  }

  //! Advances the generation, wrapping around to 0 after kGenerationMax.
  constexpr auto NewGeneration() noexcept -> void
  {
    const auto current = Generation();
    const GenerationT next = current == kGenerationMax
      ? GenerationT { 0 }
      : static_cast<GenerationT>(current + 1U);
    handle_ = (handle_ & ~(kGenerationMask << kGenerationShift))
      | static_cast<HandleT>(next) << kGenerationShift;
  }

  [[nodiscard]] constexpr auto ResourceType() const noexcept -> ResourceTypeT
  {
    return static_cast<ResourceTypeT>(
      handle_ >> kResourceTypeShift & kResourceTypeMask);
  }

  constexpr auto SetResourceType(const ResourceTypeT type) noexcept -> void
  {
    handle_ = (handle_ & ~(kResourceTypeMask << kResourceTypeShift))
      | static_cast<HandleT>(type) << kResourceTypeShift;
  }

  [[nodiscard]] constexpr auto IsFree() const noexcept -> bool
  {
    return (handle_ & HandleT { 1 } << kFreeShift) != 0;
  }

  constexpr auto SetFree(const bool flag) noexcept -> void
  {
    handle_ &= ~(HandleT { 1 } << kFreeShift);
    if (flag) {
      handle_ |= HandleT { 1 } << kFreeShift;
    }
  }

private:
  // Index, type and generation all start at their "not set" values except
  // for the generation, which starts at 0. Reserved bits stay clear.
  HandleT handle_ { (kHandleMask >> (kHandleBits - kFreeShift))
    & ~(kGenerationMask << kGenerationShift) };

  static_assert(kReservedBits + kFreeBits + kResourceTypeBits + kGenerationBits
        + kIndexBits
      == kHandleBits,
    "Bit allocation must sum to total handle bits");
};

static_assert(std::is_trivially_copyable_v<ResourceHandle>);
static_assert(sizeof(ResourceHandle) == sizeof(ResourceHandle::HandleT));

inline auto to_string(const ResourceHandle& value) -> std::string
{
  if (!value.IsValid()) {
    return "RH(Invalid)";
  }
  return fmt::format("RH(Index: {}, ResourceType: {}, Generation: {}, "
                     "IsFree: {})",
    value.Index(), value.ResourceType(), value.Generation(), value.IsFree());
}

inline auto to_string_compact(const ResourceHandle& value) -> std::string
{
  return value.IsValid() ? fmt::format("RH(i:{}, t:{}, g:{}, f:{})",
                             value.Index(), value.ResourceType(),
                             value.Generation(), value.IsFree() ? 1 : 0)
                         : "RH(Invalid)";
}

} // namespace arbor

template <> struct std::hash<arbor::ResourceHandle> {
  auto operator()(const arbor::ResourceHandle& handle) const noexcept -> size_t
  {
    return std::hash<arbor::ResourceHandle::HandleT> {}(handle.Handle());
  }
};
