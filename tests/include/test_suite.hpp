#pragma once
#include <gtest/gtest.h>
#include <chrono>
#include <string>
#include <string_view>
#include <bridgecraft/async/async.hpp>
#include <bridgecraft/web/core.hpp>

using namespace std::chrono_literals;

#ifdef TEST_SUITE_NAME

#define TEST_CASE(name) TEST(TEST_SUITE_NAME, name)

#endif

inline std::string to_text(const bridgecraft::web::core::bytes &data)
{
    return std::string(data.begin(), data.end());
}

inline bridgecraft::web::core::bytes to_bytes(std::string_view text)
{
    return bridgecraft::web::core::bytes(text.begin(), text.end());
}
