#pragma once

#include <gtest/gtest.h>

#include <spdlog/spdlog.h>

#include "pdp_indexer.hpp"

namespace pdp::tests
{
    class UnitTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            spdlog::set_level(spdlog::level::warn);
        }

        void TearDown() override
        {
            spdlog::set_level(spdlog::level::info);
        }
    };
}
