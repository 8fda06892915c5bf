//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <Arbor/Base/Logging.h>
#include <Arbor/Base/Macros.h>

namespace arbor::testing {

//! Records the log messages emitted while it is alive.
/*!
 Registers a loguru callback on construction and removes it on destruction.

 ```cpp
 ScopedLogCapture capture("AttachFailure", loguru::Verbosity_1);
 (void)graph.Attach(stale_index, "value");
 EXPECT_TRUE(capture.Contains("parent"));
 ```
*/
class ScopedLogCapture {
public:
  explicit ScopedLogCapture(std::string id = "ScopedLogCapture",
    loguru::Verbosity max_verbosity = loguru::Verbosity_9)
    : id_(std::move(id))
  {
    loguru::add_callback(
      id_.c_str(), &ScopedLogCapture::OnLog, this, max_verbosity);
  }

  ~ScopedLogCapture() { (void)loguru::remove_callback(id_.c_str()); }

  ARBOR_MAKE_NON_COPYABLE(ScopedLogCapture)
  ARBOR_MAKE_NON_MOVABLE(ScopedLogCapture)

  //! Whether any captured message contains \p needle.
  [[nodiscard]] auto Contains(std::string_view needle) const -> bool
  {
    return Count(needle) > 0;
  }

  [[nodiscard]] auto Count(std::string_view needle) const -> int
  {
    int count = 0;
    for (const auto& message : messages_) {
      if (message.find(needle) != std::string::npos) {
        ++count;
      }
    }
    return count;
  }

  [[nodiscard]] auto Messages() const -> const std::vector<std::string>&
  {
    return messages_;
  }

  auto Clear() -> void { messages_.clear(); }

private:
  static auto OnLog(void* user_data, const loguru::Message& message) -> void
  {
    auto* self = static_cast<ScopedLogCapture*>(user_data);
    if (self == nullptr || message.message == nullptr) {
      return;
    }
    self->messages_.emplace_back(message.message);
  }

  std::string id_;
  std::vector<std::string> messages_;
};

} // namespace arbor::testing
