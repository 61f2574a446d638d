#pragma once
/** @file  MockErrorMonitor.hpp
 *  @brief gmock ErrorMonitor for asserting which failures get reported.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <gmock/gmock.h>

#include "core/ErrorMonitor.hpp"

namespace reveille {
  namespace test {

    class MockErrorMonitor : public reveille::core::ErrorMonitor {
    public:
      MOCK_METHOD(void, notifyFailure, (const std::string&), (override));
    };

  } // namespace test
} // namespace reveille
