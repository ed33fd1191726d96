#pragma once

#include "ports/output/ICartRepository.hpp"
#include <gmock/gmock.h>

namespace omnitrack::tests {

class MockCartRepository : public ports::output::ICartRepository {
public:
    MOCK_METHOD(std::optional<domain::Cart>, findByUserId, (const std::string& userId), (override));
    MOCK_METHOD(void, save, (const domain::Cart& cart), (override));
    MOCK_METHOD(bool, remove, (const std::string& userId), (override));
};

} // namespace omnitrack::tests
