#ifndef XFER_TEST_FALLBACKCONFIGVALUEPROVIDER_MOCK_HPP_
#define XFER_TEST_FALLBACKCONFIGVALUEPROVIDER_MOCK_HPP_

#include <gmock/gmock.h>

#include <optional>

#include "fallbackconfigvalueprovider.hpp"

using namespace ::xfer::config;

class FallbackConfigValueProviderMock : public FallbackConfigValueProvider
{
public:
    MOCK_METHOD(std::optional<ConfigValue>, get, (ConfigKey key), (const, override));
};

#endif  // XFER_TEST_FALLBACKCONFIGVALUEPROVIDER_MOCK_HPP_
