#pragma once

#include "Platform.hpp"
#include "Types.hpp"

#include <stdexcept>

namespace imseries {

// ============================================================================
// WriteError - exception raised by the write path
// ============================================================================
// Every failure of Write() and of writer construction surfaces as a
// WriteError. Nothing in the library catches or retries it.
// ============================================================================

class IMS_API WriteError : public std::runtime_error {
public:
    WriteError(ErrorCode code, const String& message)
        : std::runtime_error(String(ErrorCodeToString(code)) + ": " + message)
        , m_code(code) {}

    ErrorCode Code() const noexcept { return m_code; }

private:
    ErrorCode m_code;
};

} // namespace imseries
