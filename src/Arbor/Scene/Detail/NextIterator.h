//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <utility>

namespace arbor::scene::detail {

//! Single pass input iterator over a traversal engine, ending at
//! `std::default_sentinel`.
/*!
 Makes every traversal engine usable in range-for loops. The iterator pulls
 the first item when constructed and one item per increment; the engine is
 shared by all copies of the iterator. When constructed from an engine value,
 the iterator keeps that engine alive.

 The engine must expose an `Item` type and a `Next()` method returning
 `std::optional<Item>`.
*/
template <typename Source> class NextIterator {
public:
  using Item = typename Source::Item;
  using value_type = Item;
  using difference_type = std::ptrdiff_t;
  using iterator_concept = std::input_iterator_tag;

  NextIterator() = default;

  explicit NextIterator(Source* source)
    : source_(source)
  {
    Advance();
  }

  explicit NextIterator(Source&& source)
    : owned_(std::make_shared<Source>(std::move(source)))
    , source_(owned_.get())
  {
    Advance();
  }

  auto operator*() const -> Item& { return *current_; }
  auto operator->() const -> Item* { return &*current_; }

  auto operator++() -> NextIterator&
  {
    Advance();
    return *this;
  }
  auto operator++(int) -> void { Advance(); }

  friend auto operator==(
    const NextIterator& it, std::default_sentinel_t) noexcept -> bool
  {
    return !it.current_.has_value();
  }

private:
  auto Advance() -> void
  {
    current_.reset();
    if (auto next = source_->Next()) {
      current_.emplace(std::move(*next));
    }
  }

  std::shared_ptr<Source> owned_;
  Source* source_ { nullptr };
  // Items may hold references, so they are re-emplaced rather than assigned.
  mutable std::optional<Item> current_;
};

} // namespace arbor::scene::detail
