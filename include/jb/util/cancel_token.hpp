#pragma once

#include <atomic>
#include <memory>

namespace jb::util {

/// Shared cancellation flag. Copies observe the same flag.
class cancel_token {
public:
    cancel_token() : m_flag(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const { m_flag->store(true); }
    bool cancelled() const { return m_flag->load(); }

private:
    std::shared_ptr<std::atomic<bool>> m_flag;
};

} // namespace jb::util
